#pragma once

#include <concepts>
#include <fstream>
#include <istream>
#include <string>
#include <string_view>
#include <vector>

#include <boost/algorithm/string.hpp>

#include "guard.hpp"

namespace wordsieve::vocab {

using Vocab = std::vector<std::string>;

namespace __impl {
    // Strips trailing whitespace and lowercases in-place
    inline void normalizeLine(std::string& line) {
        boost::algorithm::trim_right(line);
        boost::algorithm::to_lower(line);
    }
}

// Opens the dictionary at path. Throws DictionaryError if it cannot be read.
inline std::ifstream openDictionary(const std::string& path) {
    std::ifstream file{path};
    if (!file) guard::formatError<DictionaryError>("failed to open dictionary {}", path);
    return file;
}

/*
Streams words from source in order, calling visit(word) for each line lowercased with trailing whitespace removed.
Stops early if visit returns false. Throws DictionaryError on a read failure.
Returns the number of lines visited.
*/
template <typename Visitor>
    requires std::predicate<Visitor&, std::string_view>
size_t forEachWord(std::istream& source, Visitor&& visit) {
    size_t lines = 0;
    std::string buff;
    while (std::getline(source, buff)) {
        __impl::normalizeLine(buff);
        ++lines;
        if (!visit(std::string_view{buff})) break;
    }
    if (source.bad()) guard::formatError<DictionaryError>("read error after {} dictionary lines", lines);
    return lines;
}

// Reads every word of source into memory
inline Vocab readVocab(std::istream& source) {
    Vocab words;
    forEachWord(source, [&words](std::string_view word) {
        words.emplace_back(word);
        return true;
    });
    return words;
}

}  // namespace wordsieve::vocab
