#pragma once

#include <istream>
#include <optional>
#include <ostream>
#include <span>
#include <string>
#include <vector>

#include "config.hpp"
#include "constraintEngine.hpp"
#include "feedback.hpp"
#include "parallelTaskQueue.hpp"
#include "vocab.hpp"

namespace wordsieve::sieve {

struct Request {
    size_t minLength = config::DEFAULT_MIN_LENGTH;
    size_t maxLength = config::DEFAULT_MAX_LENGTH;
    std::optional<size_t> limit{};   // Emit at most this many words
    bool sort = false;               // Rank survivors before emission
    bool showScores = false;         // Print the ranking score beside each word
    size_t threads = config::DEFAULT_THREADS;
};

struct Summary {
    size_t scanned = 0;   // Dictionary lines read
    size_t accepted = 0;  // Lines that passed the constraints
    size_t emitted = 0;   // Words written after ranking and the limit
};

// Returns the words of vocab accepted by engine, in vocab order, testing chunks on numThreads threads
vocab::Vocab filterVocab(const engine::ConstraintEngine& engine, const vocab::Vocab& vocab, parallel::TaskQueue& queue, size_t numThreads);

/*
Folds every attempt on construction, then filters word sources against the result.
Construction throws ContradictionError or UsageError before anything is read.
*/
class Sieve {
    Request request_;
    engine::ConstraintEngine engine_;

    // True when every accepted word must be seen before the first can be emitted
    bool needsMaterialize() const noexcept {
        return request_.sort || request_.threads > 1;
    }

    void writeWord(std::ostream& out, const std::string& word) const;

public:
    Sieve(std::span<const feedback::Record> records, const Request& request);

    const engine::ConstraintEngine& engine() const noexcept { return engine_; }
    const Request& request() const noexcept { return request_; }

    // Filtered, optionally ranked, limited words of source
    std::vector<std::string> select(std::istream& source, Summary& summary) const;

    std::vector<std::string> select(std::istream& source) const {
        Summary summary{};
        return select(source, summary);
    }

    // Writes selected words of source to out, one per line. Streams when no ranking or threading is requested.
    Summary write(std::istream& source, std::ostream& out) const;
};

}  // namespace wordsieve::sieve
