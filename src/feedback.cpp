#include "feedback.hpp"

#include <boost/algorithm/string.hpp>

namespace wordsieve::feedback {

LetterPositions Record::collect(char wanted) const {
    LetterPositions out;
    for (size_t i = 0; i < markers_.size(); ++i) {
        if (markers_[i] == wanted) out.push_back({i, guess_[i]});
    }
    return out;
}

Record parseRecord(std::string_view guess, std::string_view markers, size_t recordIndex) {
    std::string word = boost::algorithm::to_lower_copy(std::string{guess});

    guard::runtimeGuard<ValidationError>(!word.empty(), "attempt {}: empty guess", recordIndex + 1);
    guard::runtimeGuard<ValidationError>(
        word.size() == markers.size(),
        "attempt {} ({} {}): guess has {} letters but feedback has {} markers",
        recordIndex + 1, guess, markers, word.size(), markers.size()
    );
    guard::runtimeGuard<ValidationError>(
        word.size() <= config::MAX_WORD_LENGTH,
        "attempt {} ({} {}): guess is longer than {} letters", recordIndex + 1, guess, markers, config::MAX_WORD_LENGTH
    );

    for (size_t i = 0; i < word.size(); ++i) {
        guard::runtimeGuard<ValidationError>(
            util::isValidLetter(word[i]),
            "attempt {} ({} {}): invalid guess character '{}' at position {}", recordIndex + 1, guess, markers, guess[i], i
        );
        guard::runtimeGuard<ValidationError>(
            isValidMarker(markers[i]),
            "attempt {} ({} {}): invalid feedback marker '{}' at position {} (expected '{}', '{}' or '{}')",
            recordIndex + 1, guess, markers, markers[i], i, marker::ELIMINATED, marker::WRONG_POSITION, marker::CORRECT
        );
    }

    return Record{std::move(word), std::string{markers}};
}

Records parseAttempts(std::span<const std::string_view> args) {
    guard::runtimeGuard<UsageError>(
        args.size() % 2 == 0,
        "attempts must come in (guess, feedback) pairs, got {} arguments", args.size()
    );

    Records records;
    records.reserve(args.size() / 2);
    for (size_t i = 0; i < args.size(); i += 2) {
        records.push_back(parseRecord(args[i], args[i + 1], i / 2));
    }
    return records;
}

}  // namespace wordsieve::feedback
