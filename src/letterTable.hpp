#pragma once

#include <array>
#include <format>
#include <ostream>

#include "config.hpp"
#include "util.hpp"

namespace wordsieve::letters {

namespace __impl {
    // Relative frequency (percent) of each letter in English text, 'a' through 'z'
    constexpr inline std::array<double, config::ALPHABET_SIZE> FREQUENCIES = {
        8.17, 1.29, 2.78, 4.25, 12.70, 2.23, 2.02, 6.09, 6.97, 0.15, 0.77, 4.03, 2.41,
        6.75, 7.51, 1.93, 0.10, 5.99, 6.33, 9.06, 2.76, 0.98, 2.36, 0.15, 1.97, 0.07
    };
}

// Static frequency weight of letter. Letter must be in the alphabet.
constexpr inline double frequency(char letter) noexcept {
    return __impl::FREQUENCIES[util::letterIndex(letter)];
}

struct LetterConstraint {
    char letter = '\0';
    double frequency = 0.0;
    bool excluded = false;            // Letter is not in the word
    util::PositionSet confirmed{};    // Letter is known to be at these positions
    util::PositionSet rejected{};     // Letter is in the word, but not at these positions

    // Letter is known to be somewhere in the word
    constexpr bool isPresent() const noexcept {
        return !confirmed.empty() || !rejected.empty();
    }

    constexpr bool operator==(const LetterConstraint&) const noexcept = default;
};

/*
Per-letter knowledge accumulated from feedback, one entry per letter of the alphabet.
*/
class LetterTable {
    std::array<LetterConstraint, config::ALPHABET_SIZE> entries{};

public:
    constexpr LetterTable() noexcept {
        for (size_t i = 0; i < entries.size(); ++i) {
            entries[i].letter = static_cast<char>(config::FIRST_LETTER + i);
            entries[i].frequency = __impl::FREQUENCIES[i];
        }
    }

    constexpr bool operator==(const LetterTable&) const noexcept = default;

    // Returns the entry of letter, or nullptr if letter is not in the alphabet
    constexpr LetterConstraint* find(char letter) noexcept {
        return util::isValidLetter(letter) ? &entries[util::letterIndex(letter)] : nullptr;
    }

    constexpr const LetterConstraint* find(char letter) const noexcept {
        return util::isValidLetter(letter) ? &entries[util::letterIndex(letter)] : nullptr;
    }

    constexpr LetterConstraint& at(char letter) {
        guard::hybridGuard<std::out_of_range>(util::isValidLetter(letter), "letter is not in the alphabet");
        return entries[util::letterIndex(letter)];
    }

    constexpr const LetterConstraint& at(char letter) const {
        guard::hybridGuard<std::out_of_range>(util::isValidLetter(letter), "letter is not in the alphabet");
        return entries[util::letterIndex(letter)];
    }

    constexpr auto begin() const noexcept { return entries.begin(); }
    constexpr auto end() const noexcept { return entries.end(); }
};

// One line per letter: "a excluded=no confirmed=[4] rejected=[0,2]"
inline std::ostream& operator<<(std::ostream& os, const LetterTable& table) {
    for (const auto& entry : table) {
        os << std::format("{} excluded={:<3} confirmed=[{}] rejected=[{}]\n",
            entry.letter, entry.excluded ? "yes" : "no", util::joinSet(entry.confirmed), util::joinSet(entry.rejected));
    }
    return os;
}

}  // namespace wordsieve::letters
