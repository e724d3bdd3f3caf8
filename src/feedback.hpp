#pragma once

#include <algorithm>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "config.hpp"
#include "guard.hpp"
#include "util.hpp"

namespace wordsieve::feedback::marker {
    constexpr inline char ELIMINATED = '.';      // Letter is not in the word
    constexpr inline char WRONG_POSITION = 'x';  // Letter is in word, but is at wrong position
    constexpr inline char CORRECT = 'o';         // Letter is in word at correct position

}  // namespace wordsieve::feedback::marker

namespace wordsieve::feedback {

    // One (index, letter) signal taken from a record
    struct LetterPosition {
        size_t index;
        char letter;

        constexpr bool operator==(const LetterPosition&) const noexcept = default;
    };

    using LetterPositions = std::vector<LetterPosition>;

    constexpr inline bool isValidMarker(char c) noexcept {
        return c == marker::ELIMINATED || c == marker::WRONG_POSITION || c == marker::CORRECT;
    }

    constexpr inline bool isValidFeedbackString(std::string_view fbString) noexcept {
        return !fbString.empty() && std::all_of(fbString.begin(), fbString.end(), isValidMarker);
    }

    class Record;

    // Validates and builds a record. recordIndex is only used in error messages.
    Record parseRecord(std::string_view guess, std::string_view markers, size_t recordIndex = 0);

    /*
    A guess and its aligned feedback markers. Only constructed through parseRecord(),
    so guess is lowercase a-z and markers has the same length.
    */
    class Record {
        std::string guess_;
        std::string markers_;

        Record(std::string guess, std::string markers) noexcept
        : guess_{std::move(guess)}, markers_{std::move(markers)} {}

        LetterPositions collect(char wanted) const;

        friend Record parseRecord(std::string_view guess, std::string_view markers, size_t recordIndex);

    public:
        const std::string& guess() const noexcept { return guess_; }
        const std::string& markers() const noexcept { return markers_; }
        size_t size() const noexcept { return guess_.size(); }

        // Positions marked eliminated
        LetterPositions excluded() const { return collect(marker::ELIMINATED); }

        // Positions marked wrong-position
        LetterPositions misplaced() const { return collect(marker::WRONG_POSITION); }

        // Positions marked correct-position
        LetterPositions confirmed() const { return collect(marker::CORRECT); }
    };

    using Records = std::vector<Record>;

    // Builds records from a flat (guess, markers, guess, markers, ...) sequence
    Records parseAttempts(std::span<const std::string_view> args);

}  // namespace wordsieve::feedback
