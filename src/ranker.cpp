#include "ranker.hpp"

#include <algorithm>
#include <utility>

#include "letterTable.hpp"
#include "util.hpp"

namespace wordsieve::ranker {

double score(std::string_view word) noexcept {
    util::LetterSet seen{};
    for (char letter : word) {
        if (util::isValidLetter(letter)) seen.set(letter);
    }

    // Summed in alphabetical order so anagrams score exactly the same
    double total = 0.0;
    for (char letter : seen) total += letters::frequency(letter);
    return total;
}

void rank(std::vector<std::string>& words) {
    // Score once per word, then sort (score, word) pairs
    std::vector<std::pair<double, std::string>> scored;
    scored.reserve(words.size());
    for (auto& word : words) {
        const double s = score(word);
        scored.emplace_back(s, std::move(word));
    }

    std::stable_sort(scored.begin(), scored.end(),
        [](const auto& left, const auto& right) noexcept { return left.first > right.first; });

    for (size_t i = 0; i < scored.size(); ++i) {
        words[i] = std::move(scored[i].second);
    }
}

}  // namespace wordsieve::ranker
