#pragma once

#include <format>
#include <stdexcept>
#include <utility>
#include <string> // Required for std::string(msg) in hybridError

namespace wordsieve {

// Malformed command line (odd attempts count, bad option value)
struct UsageError : std::invalid_argument {
    using std::invalid_argument::invalid_argument;
};

// Malformed guess/feedback pair
struct ValidationError : std::invalid_argument {
    using std::invalid_argument::invalid_argument;
};

// Feedback that cannot come from a single solution
struct ContradictionError : std::logic_error {
    using std::logic_error::logic_error;
};

// Dictionary could not be opened or read
struct DictionaryError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

}  // namespace wordsieve

namespace wordsieve::guard {

// Throws RuntimeException using fmt and ...args
template <typename RuntimeException = std::runtime_error, typename ...Args>
[[noreturn]] inline void formatError(std::format_string<Args...> fmt, Args&&... args) {
    throw RuntimeException(std::format(fmt, std::forward<Args>(args)...));
}

// Throws staticMsg at compile time, otherwise Exception(staticMsg)
template <typename Exception = std::runtime_error>
[[noreturn]] constexpr inline void hybridError(std::string_view staticMsg) {
    if (std::is_constant_evaluated()) {
        throw staticMsg;
    } else {
        throw Exception(std::string{staticMsg});
    }
}

/*
Guard noExceptCond at compile time (if possible) otherwise runtime
*/
template <typename Exception = std::runtime_error>
constexpr inline void hybridGuard(bool noExceptCond, std::string_view staticMsg) {
    if (std::is_constant_evaluated()) {
        if (!noExceptCond) throw staticMsg;
    } else {
        if (!noExceptCond) throw Exception(std::string{staticMsg});
    }
}

// Guard noExceptCond at runtime
template <typename Exception = std::runtime_error, typename ...Args>
inline void runtimeGuard(bool noExceptCond, std::format_string<Args...> fmt, Args&&... args) {
    if (!noExceptCond) formatError<Exception>(fmt, std::forward<Args>(args)...);
}

} // end namespace wordsieve::guard
