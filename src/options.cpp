#include "options.hpp"

#include <charconv>
#include <format>
#include <optional>

#include "guard.hpp"

namespace wordsieve::options {

namespace {
    size_t parseCount(std::string_view name, std::string_view value) {
        size_t out = 0;
        const auto* last = value.data() + value.size();
        auto [ptr, ec] = std::from_chars(value.data(), last, out);
        if (value.empty() || ec != std::errc{} || ptr != last) {
            guard::formatError<UsageError>("--{} expects a non-negative integer, got \"{}\"", name, value);
        }
        return out;
    }

    bool takesValue(std::string_view name) noexcept {
        return name == "min" || name == "max" || name == "limit" || name == "threads" || name == "dictionary";
    }
}

Options parse(std::span<const std::string_view> args) {
    Options opts{};
    bool positionalOnly = false;

    for (size_t i = 0; i < args.size(); ++i) {
        std::string_view arg = args[i];
        if (positionalOnly || !arg.starts_with("--")) {
            opts.attempts.push_back(arg);
            continue;
        }
        if (arg == "--") {
            positionalOnly = true;
            continue;
        }

        // Split "--name=value"
        std::string_view name = arg.substr(2);
        std::optional<std::string_view> value{};
        if (auto eq = name.find('='); eq != std::string_view::npos) {
            value = name.substr(eq + 1);
            name = name.substr(0, eq);
        }

        if (takesValue(name) && !value) {
            guard::runtimeGuard<UsageError>(i + 1 < args.size(), "--{} expects a value", name);
            value = args[++i];
        } else if (!takesValue(name) && value) {
            guard::formatError<UsageError>("--{} does not take a value", name);
        }

        if (name == "min") {
            opts.request.minLength = parseCount(name, *value);
        } else if (name == "max") {
            opts.request.maxLength = parseCount(name, *value);
        } else if (name == "limit") {
            opts.request.limit = parseCount(name, *value);
        } else if (name == "threads") {
            opts.request.threads = parseCount(name, *value);
        } else if (name == "dictionary") {
            guard::runtimeGuard<UsageError>(!value->empty(), "--dictionary expects a path");
            opts.dictionary = std::string{*value};
        } else if (name == "sort") {
            opts.request.sort = true;
        } else if (name == "scores") {
            opts.request.showScores = true;
        } else if (name == "verbose") {
            opts.verbose = true;
        } else if (name == "help") {
            opts.help = true;
        } else {
            guard::formatError<UsageError>("unknown option {}", arg);
        }
    }

    const auto& request = opts.request;
    guard::runtimeGuard<UsageError>(request.minLength >= 1, "--min must be at least 1");
    guard::runtimeGuard<UsageError>(
        request.minLength <= request.maxLength, "--min ({}) must not exceed --max ({})", request.minLength, request.maxLength
    );
    guard::runtimeGuard<UsageError>(
        request.maxLength <= config::MAX_WORD_LENGTH, "--max must not exceed {}", config::MAX_WORD_LENGTH
    );
    guard::runtimeGuard<UsageError>(request.threads >= 1, "--threads must be at least 1");
    guard::runtimeGuard<UsageError>(
        request.threads <= config::MAX_THREADS, "--threads must not exceed {}", config::MAX_THREADS
    );
    guard::runtimeGuard<UsageError>(
        opts.attempts.size() % 2 == 0,
        "attempts must come in (guess, feedback) pairs, got {} arguments", opts.attempts.size()
    );
    return opts;
}

std::string usage(std::string_view program) {
    return std::format(
        "Usage: {} [options] [GUESS FEEDBACK]...\n"
        "Lists dictionary words consistent with every (GUESS, FEEDBACK) pair.\n"
        "Feedback key (one marker per letter):\n"
        "  .  letter is not in the word\n"
        "  x  letter is in the word, but not here\n"
        "  o  letter is in the word at this position\n"
        "Options:\n"
        "  --min N            minimum word length (default {})\n"
        "  --max N            maximum word length (default {})\n"
        "  --limit N          print at most N words\n"
        "  --sort             order words by letter frequency score\n"
        "  --scores           print the score beside each word\n"
        "  --dictionary PATH  word list, one word per line (default {})\n"
        "  --threads N        filter on N threads (default {})\n"
        "  --verbose          print counts and timings to stderr\n"
        "  --help             show this message\n"
        "Example: {} irate xx..o\n",
        program, config::DEFAULT_MIN_LENGTH, config::DEFAULT_MAX_LENGTH, config::DEFAULT_DICTIONARY,
        config::DEFAULT_THREADS, program
    );
}

}  // namespace wordsieve::options
