#include "sieve.hpp"

#include <format>

#include "ranker.hpp"

namespace wordsieve::sieve {

vocab::Vocab filterVocab(const engine::ConstraintEngine& engine, const vocab::Vocab& vocab, parallel::TaskQueue& queue, size_t numThreads) {
    // One flag per word; each worker only writes its own chunk
    std::vector<char> accepted(vocab.size(), 0);
    parallel::forEachChunk(queue, vocab.size(), numThreads, [&engine, &vocab, &accepted](size_t start, size_t stop) {
        for (size_t i = start; i < stop; ++i) {
            accepted[i] = static_cast<char>(engine.test(vocab[i]));
        }
    });

    vocab::Vocab out;
    for (size_t i = 0; i < vocab.size(); ++i) {
        if (accepted[i]) out.push_back(vocab[i]);
    }
    return out;
}

Sieve::Sieve(std::span<const feedback::Record> records, const Request& request)
: request_{request}, engine_{request.minLength, request.maxLength} {
    guard::runtimeGuard<UsageError>(
        1 <= request_.threads && request_.threads <= config::MAX_THREADS,
        "thread count must be between 1 and {}", config::MAX_THREADS
    );
    engine_.fold(records);
}

void Sieve::writeWord(std::ostream& out, const std::string& word) const {
    if (request_.showScores) {
        out << std::format("{} {:.2f}\n", word, ranker::score(word));
    } else {
        out << word << '\n';
    }
}

std::vector<std::string> Sieve::select(std::istream& source, Summary& summary) const {
    std::vector<std::string> words;

    if (request_.threads > 1) {
        const auto all = vocab::readVocab(source);
        summary.scanned = all.size();
        parallel::TaskQueue queue{request_.threads};
        words = filterVocab(engine_, all, queue, request_.threads);
    } else {
        const bool canStop = !request_.sort && request_.limit.has_value();
        summary.scanned = vocab::forEachWord(source, [&](std::string_view word) {
            if (engine_.test(word)) words.emplace_back(word);
            return !(canStop && words.size() >= *request_.limit);
        });
    }
    summary.accepted = words.size();

    if (request_.sort) ranker::rank(words);
    if (request_.limit && words.size() > *request_.limit) words.resize(*request_.limit);

    summary.emitted = words.size();
    return words;
}

Summary Sieve::write(std::istream& source, std::ostream& out) const {
    Summary summary{};
    if (request_.limit == size_t{0}) return summary;

    if (needsMaterialize()) {
        for (const auto& word : select(source, summary)) writeWord(out, word);
        return summary;
    }

    // Emit as soon as a word passes
    std::string buff;
    summary.scanned = vocab::forEachWord(source, [&](std::string_view word) {
        if (!engine_.test(word)) return true;
        ++summary.accepted;
        buff.assign(word);
        writeWord(out, buff);
        ++summary.emitted;
        return !(request_.limit && summary.emitted >= *request_.limit);
    });
    return summary;
}

}  // namespace wordsieve::sieve
