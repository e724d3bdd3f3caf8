#pragma once

#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "config.hpp"
#include "sieve.hpp"

namespace wordsieve::options {

struct Options {
    sieve::Request request{};
    std::string dictionary = config::DEFAULT_DICTIONARY;
    std::vector<std::string_view> attempts{};  // Flat (guess, feedback, ...) positional arguments
    bool verbose = false;
    bool help = false;
};

/*
Parses command line arguments (without the program name).
Recognized: --min N, --max N, --limit N, --threads N, --dictionary PATH (also --opt=value),
--sort, --scores, --verbose, --help. Anything else not starting with "--" is an attempt argument,
as is everything after a lone "--". Throws UsageError.
*/
Options parse(std::span<const std::string_view> args);

std::string usage(std::string_view program);

}  // namespace wordsieve::options
