#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace wordsieve::ranker {

    // Sum of the frequency weights of the distinct letters of word. Letters outside the alphabet score 0.
    double score(std::string_view word) noexcept;

    // Sorts words by descending score. Ties keep their input order.
    void rank(std::vector<std::string>& words);

}  // namespace wordsieve::ranker
