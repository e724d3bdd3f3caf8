#pragma once

#include <array>
#include <span>
#include <string_view>

#include "config.hpp"
#include "feedback.hpp"
#include "letterTable.hpp"
#include "util.hpp"

namespace wordsieve::engine {

/*
Folds feedback records into a LetterTable and tests candidate words against it.

Letters are only tracked for presence: a letter confirmed at two positions is
satisfied by a word holding it at either one of them, so words with repeated
letters are under-constrained.

Once folding is done the engine is read-only and test() may be called from
several threads at once.
*/
class ConstraintEngine {
    letters::LetterTable table_{};
    std::array<char, config::MAX_WORD_LENGTH> slotOwners{};  // Letter confirmed at each position, '\0' if none
    size_t minLength;
    size_t maxLength;
    size_t foldedRecords = 0;

    void exclude(char letter, size_t recordIndex);
    void confirm(const feedback::LetterPosition& lp, size_t recordIndex);
    void reject(const feedback::LetterPosition& lp, size_t recordIndex);

public:
    explicit ConstraintEngine(size_t minLength = config::DEFAULT_MIN_LENGTH, size_t maxLength = config::DEFAULT_MAX_LENGTH);

    // Folds one record. Throws ContradictionError if it conflicts with what is already known.
    void fold(const feedback::Record& record);

    // Folds records in order
    void fold(std::span<const feedback::Record> records);

    // Letters known to be somewhere in the word
    util::LetterSet mandatoryLetters() const noexcept;

    // Returns true if word is consistent with every folded record
    [[nodiscard]] bool test(std::string_view word) const noexcept;

    const letters::LetterTable& table() const noexcept { return table_; }
    size_t recordCount() const noexcept { return foldedRecords; }
};

}  // namespace wordsieve::engine
