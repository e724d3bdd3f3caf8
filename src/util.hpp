#pragma once

#include <algorithm>
#include <bit>
#include <concepts>
#include <cstddef>
#include <iterator>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>

#include <boost/integer.hpp>

#include "config.hpp"
#include "guard.hpp"

namespace wordsieve::util {

/*
Given the bits needed to hold a value, returns the smallest (Least) or fastest unsigned type that holds it
*/
template <int Bits, bool Least = true>
using UintFor = std::conditional_t<Least, typename boost::uint_t<Bits>::least, typename boost::uint_t<Bits>::fast>;

/*
Set of values drawn from a bounded integral domain, stored as one bit per value.
Used for letter sets ('a'..'z') and position sets (0..MAX_WORD_LENGTH - 1).
*/
template <std::integral T, T minVal, T maxVal, bool Least = true>
requires (minVal < maxVal)
struct BitIndexMap {
private:
    static constexpr unsigned BITS = static_cast<unsigned>(maxVal - minVal) + 1u;
    static_assert(BITS <= 64u, "BitIndexMap domain does not fit in 64 bits");

public:
    using Encoding = UintFor<BITS, Least>;

private:
    // Returns true if val is within range
    static constexpr bool isValidVal(T val) noexcept {
        return (minVal <= val && val <= maxVal);
    }

    // Returns bit of val. Undefined behavior if val is not in range
    static constexpr Encoding unsafeBit(T val) noexcept {
        return static_cast<Encoding>(Encoding{1} << static_cast<unsigned>(val - minVal));
    }

    // Returns bit of val. Errors if val is not in range
    static constexpr Encoding safeBit(T val) {
        guard::hybridGuard<std::out_of_range>(isValidVal(val), "val is out of range");
        return unsafeBit(val);
    }

    Encoding bits = 0;  // Underlying bits

public:
    constexpr BitIndexMap() noexcept = default;

    constexpr bool operator==(const BitIndexMap& other) const noexcept { return bits == other.bits; }

    constexpr bool operator!=(const BitIndexMap& other) const noexcept { return bits != other.bits; }

    // Adds val
    constexpr void set(T val) {
        bits |= safeBit(val);
    }

    // Removes val
    constexpr void unset(T val) {
        bits &= static_cast<Encoding>(~safeBit(val));
    }

    // Returns true if val is contained
    constexpr bool contains(T val) const noexcept {
        return isValidVal(val) && (bits & unsafeBit(val));
    }

    constexpr bool empty() const noexcept {
        return bits == 0;
    }

    constexpr size_t size() const noexcept {
        return static_cast<size_t>(std::popcount(bits));
    }

    // Removes all values from bitset
    constexpr void reset() noexcept {
        bits = 0;
    }

    // Returns underlying bits
    constexpr Encoding raw() const noexcept {
        return bits;
    }

    // Ascending value iterator
    struct Iterator {
    private:
        Encoding bits = 0;
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = T;
        using difference_type = std::ptrdiff_t;
        using pointer = void;
        using reference = T;

        constexpr Iterator() noexcept = default;
        constexpr Iterator(Encoding bits) noexcept : bits{bits} {}

        constexpr T operator*() const {
            guard::hybridGuard(bits != 0, "Stopped attempt to dereference exhausted iterator");
            auto bit = std::countr_zero(bits);  // Find least significant bit
            return static_cast<T>(static_cast<T>(bit) + minVal);
        }

        constexpr Iterator& operator++() {
            guard::hybridGuard<std::out_of_range>(bits != 0, "Stopped attempt to increment exhausted iterator");
            bits &= static_cast<Encoding>(bits - 1);  // Clear the least significant bit
            return *this;
        }

        constexpr Iterator operator++(int) {
            Iterator retVal = *this;
            ++(*this);
            return retVal;
        }

        constexpr bool operator==(const Iterator& other) const noexcept { return bits == other.bits; }

        constexpr bool operator!=(const Iterator& other) const noexcept { return bits != other.bits; }
    };

    constexpr Iterator begin() const noexcept {
        return Iterator{bits};
    }

    constexpr Iterator end() const noexcept {
        return Iterator{0};
    }
};

using LetterSet = BitIndexMap<char, config::FIRST_LETTER, config::LAST_LETTER>;
using PositionSet = BitIndexMap<size_t, 0, config::MAX_WORD_LENGTH - 1>;

constexpr inline bool isValidLetter(char c) noexcept {
    return config::FIRST_LETTER <= c && c <= config::LAST_LETTER;
}

constexpr inline size_t letterIndex(char c) noexcept {
    return static_cast<size_t>(c - config::FIRST_LETTER);
}

// Checks that every character is in the alphabet
constexpr inline bool isValidWord(std::string_view word) noexcept {
    return !word.empty() && std::all_of(word.begin(), word.end(), isValidLetter);
}

// Renders a set as "v0,v1,..."
template <typename Set>
inline std::string joinSet(const Set& set) {
    std::string out;
    for (auto val : set) {
        if (!out.empty()) out += ',';
        out += std::format("{}", val);
    }
    return out;
}

}
