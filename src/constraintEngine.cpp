#include "constraintEngine.hpp"

namespace wordsieve::engine {

ConstraintEngine::ConstraintEngine(size_t minLength, size_t maxLength)
: minLength{minLength}, maxLength{maxLength} {
    guard::runtimeGuard<UsageError>(minLength >= 1, "minimum word length must be at least 1");
    guard::runtimeGuard<UsageError>(minLength <= maxLength, "minimum word length {} exceeds maximum {}", minLength, maxLength);
    guard::runtimeGuard<UsageError>(
        maxLength <= config::MAX_WORD_LENGTH,
        "maximum word length {} exceeds supported {}", maxLength, config::MAX_WORD_LENGTH
    );
    slotOwners.fill('\0');
}

void ConstraintEngine::exclude(char letter, size_t recordIndex) {
    auto& entry = table_.at(letter);
    guard::runtimeGuard<ContradictionError>(
        !entry.isPresent(),
        "attempt {}: letter '{}' is eliminated but earlier feedback places it in the word", recordIndex + 1, letter
    );
    entry.excluded = true;
}

void ConstraintEngine::confirm(const feedback::LetterPosition& lp, size_t recordIndex) {
    auto& entry = table_.at(lp.letter);
    guard::runtimeGuard<ContradictionError>(
        !entry.excluded,
        "attempt {}: letter '{}' is confirmed at position {} but is also eliminated", recordIndex + 1, lp.letter, lp.index
    );
    guard::runtimeGuard<ContradictionError>(
        !entry.rejected.contains(lp.index),
        "attempt {}: letter '{}' is confirmed at position {} but was marked wrong-position there", recordIndex + 1, lp.letter, lp.index
    );

    char& owner = slotOwners[lp.index];
    guard::runtimeGuard<ContradictionError>(
        owner == '\0' || owner == lp.letter,
        "attempt {}: position {} is confirmed as both '{}' and '{}'", recordIndex + 1, lp.index, owner, lp.letter
    );
    owner = lp.letter;
    entry.confirmed.set(lp.index);
}

void ConstraintEngine::reject(const feedback::LetterPosition& lp, size_t recordIndex) {
    auto& entry = table_.at(lp.letter);
    guard::runtimeGuard<ContradictionError>(
        !entry.excluded,
        "attempt {}: letter '{}' is marked wrong-position at {} but is also eliminated", recordIndex + 1, lp.letter, lp.index
    );
    guard::runtimeGuard<ContradictionError>(
        !entry.confirmed.contains(lp.index),
        "attempt {}: letter '{}' is marked wrong-position at {} but was confirmed there", recordIndex + 1, lp.letter, lp.index
    );
    entry.rejected.set(lp.index);
}

void ConstraintEngine::fold(const feedback::Record& record) {
    const size_t recordIndex = foldedRecords;

    // Exclusions first, so the record's own confirmations are checked against them
    for (const auto& lp : record.excluded()) exclude(lp.letter, recordIndex);
    for (const auto& lp : record.confirmed()) confirm(lp, recordIndex);
    for (const auto& lp : record.misplaced()) reject(lp, recordIndex);

    ++foldedRecords;
}

void ConstraintEngine::fold(std::span<const feedback::Record> records) {
    for (const auto& record : records) fold(record);
}

util::LetterSet ConstraintEngine::mandatoryLetters() const noexcept {
    util::LetterSet mandatory{};
    for (const auto& entry : table_) {
        if (entry.isPresent()) mandatory.set(entry.letter);
    }
    return mandatory;
}

bool ConstraintEngine::test(std::string_view word) const noexcept {
    if (word.size() < minLength || word.size() > maxLength) return false;

    util::LetterSet pending = mandatoryLetters();
    for (size_t i = 0; i < word.size(); ++i) {
        const char letter = word[i];
        const auto* entry = table_.find(letter);
        if (entry == nullptr) return false;
        if (entry->excluded) return false;
        if (entry->rejected.contains(i)) return false;

        const char owner = slotOwners[i];
        if (owner != '\0' && owner != letter) return false;

        if (pending.contains(letter)) pending.unset(letter);
    }
    return pending.empty();
}

}  // namespace wordsieve::engine
