#include <benchmark/benchmark.h>

#include <sstream>
#include <string>

#include "../src/feedback.hpp"
#include "../src/ranker.hpp"
#include "../src/sieve.hpp"

namespace {
    // Every 5 letter word over a 10 letter alphabet
    std::string makeDictionary() {
        constexpr std::string_view letters = "aeilnorstu";
        std::string text;
        std::string word(5, 'a');
        for (size_t n = 0; n < 100000; ++n) {
            size_t code = n;
            for (size_t i = 0; i < word.size(); ++i) {
                word[word.size() - 1 - i] = letters[code % letters.size()];
                code /= letters.size();
            }
            text += word;
            text += '\n';
        }
        return text;
    }

    const std::string dictionary = makeDictionary();

    const wordsieve::feedback::Records records{
        wordsieve::feedback::parseRecord("irate", "xx..o"),
    };
}

static void BM_FoldRecord(benchmark::State& state) {
    for (auto _ : state) {
        wordsieve::engine::ConstraintEngine engine{};
        engine.fold(records);
        benchmark::DoNotOptimize(engine);
    }
}
BENCHMARK(BM_FoldRecord);

static void BM_TestWord(benchmark::State& state) {
    wordsieve::engine::ConstraintEngine engine{};
    engine.fold(records);
    for (auto _ : state) {
        benchmark::DoNotOptimize(engine.test("shire"));
        benchmark::DoNotOptimize(engine.test("crate"));
    }
}
BENCHMARK(BM_TestWord);

static void BM_SelectStreaming(benchmark::State& state) {
    const wordsieve::sieve::Sieve sieve{records, wordsieve::sieve::Request{}};
    for (auto _ : state) {
        std::istringstream source{dictionary};
        auto words = sieve.select(source);
        benchmark::DoNotOptimize(words);
    }
}
BENCHMARK(BM_SelectStreaming);

static void BM_SelectParallel(benchmark::State& state) {
    wordsieve::sieve::Request request{};
    request.threads = static_cast<size_t>(state.range(0));
    const wordsieve::sieve::Sieve sieve{records, request};
    for (auto _ : state) {
        std::istringstream source{dictionary};
        auto words = sieve.select(source);
        benchmark::DoNotOptimize(words);
    }
}
BENCHMARK(BM_SelectParallel)
    ->Arg(2ul)
    ->Arg(4ul)
    ->Arg(wordsieve::config::HARDWARE_CONCURRENCY);

static void BM_Rank(benchmark::State& state) {
    std::istringstream source{dictionary};
    const auto vocab = wordsieve::vocab::readVocab(source);
    for (auto _ : state) {
        auto words = vocab;
        wordsieve::ranker::rank(words);
        benchmark::DoNotOptimize(words);
    }
}
BENCHMARK(BM_Rank);

BENCHMARK_MAIN();
