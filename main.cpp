#include <iostream>
#include <string_view>
#include <vector>

#include "src/app.hpp"
#include "src/guard.hpp"
#include "src/options.hpp"

int main(int argc, char** argv) {
    const std::string_view program = argc > 0 ? argv[0] : "wordsieve";
    const std::vector<std::string_view> args(argv + (argc > 0 ? 1 : 0), argv + argc);

    wordsieve::options::Options opts;
    try {
        opts = wordsieve::options::parse(args);
    } catch (const wordsieve::UsageError& e) {
        std::cerr << "Argument error: " << e.what() << "\n" << wordsieve::options::usage(program);
        return 1;
    }

    if (opts.help) {
        std::cout << wordsieve::options::usage(program);
        return 0;
    }
    return wordsieve::app::run(opts, std::cout, std::cerr);
}
