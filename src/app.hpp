#pragma once

#include <ostream>

#include "options.hpp"

namespace wordsieve::app {

/*
Runs one filtering pass: parses the attempts, folds them, writes the letter table and then the
selected words to out. Failures are reported to err with a category prefix.
Nothing reaches out unless every attempt parsed and folded cleanly.
Returns the process exit code.
*/
int run(const options::Options& opts, std::ostream& out, std::ostream& err);

}  // namespace wordsieve::app
