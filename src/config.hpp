#pragma once

#include <cstddef>
namespace wordsieve::config {

    constexpr inline auto DEFAULT_DICTIONARY = "/usr/share/dict/words";
    constexpr inline char FIRST_LETTER = 'a';
    constexpr inline char LAST_LETTER = 'z';
    constexpr inline size_t ALPHABET_SIZE = LAST_LETTER - FIRST_LETTER + 1;
    constexpr inline size_t DEFAULT_MIN_LENGTH = 5;
    constexpr inline size_t DEFAULT_MAX_LENGTH = 5;
    constexpr inline size_t MAX_WORD_LENGTH = 32;       // Positions are stored as bits of a 32-bit word
    constexpr inline size_t DEFAULT_THREADS = 1;
    constexpr inline size_t MAX_THREADS = 64;
    constexpr inline size_t HARDWARE_CONCURRENCY = 8ul;  // Upper bound used by benchmarks
}
