#include "app.hpp"

#include <exception>
#include <format>

#include "feedback.hpp"
#include "guard.hpp"
#include "sieve.hpp"
#include "timing.hpp"
#include "vocab.hpp"

namespace wordsieve::app {

namespace {
    int filter(const options::Options& opts, std::ostream& out, std::ostream& err) {
        timing::Timer timer;

        // Everything that can be rejected is checked before the first line of output
        const auto records = feedback::parseAttempts(opts.attempts);
        const sieve::Sieve sieve{records, opts.request};
        const auto foldTime = timer.lap();

        out << sieve.engine().table() << std::flush;

        auto dictionary = vocab::openDictionary(opts.dictionary);
        const auto summary = sieve.write(dictionary, out);
        out << std::flush;
        const auto filterTime = timer.lap();

        if (opts.verbose) {
            err << std::format("Folded {} attempts in {:.6f} s\n", records.size(), foldTime.count())
                << std::format("Scanned {} words from {}, {} accepted, {} printed in {:.6f} s\n",
                       summary.scanned, opts.dictionary, summary.accepted, summary.emitted, filterTime.count());
        }
        return 0;
    }
}

int run(const options::Options& opts, std::ostream& out, std::ostream& err) {
    try {
        return filter(opts, out, err);
    } catch (const UsageError& e) {
        err << "Argument error: " << e.what() << "\n";
    } catch (const ValidationError& e) {
        err << "Validation error: " << e.what() << "\n";
    } catch (const ContradictionError& e) {
        err << "Contradiction: " << e.what() << "\n";
    } catch (const DictionaryError& e) {
        err << "Dictionary error: " << e.what() << "\n";
    } catch (const std::exception& e) {
        err << "Error: " << e.what() << "\n";
    }
    return 1;
}

}  // namespace wordsieve::app
