#pragma once

#include <chrono>
#include <ratio>

namespace wordsieve::timing {

// Measures time since construction or the last lap()
template <typename Rep = double, typename Period = std::ratio<1>>
struct Timer {
private:
    using Clock = std::chrono::steady_clock;
    using Duration = std::chrono::duration<Rep, Period>;

    Clock::time_point tp = Clock::now();

public:
    Timer() noexcept = default;

    // Returns elapsed time and restarts the timer
    Duration lap() noexcept {
        const auto now = Clock::now();
        const auto elapsed = std::chrono::duration_cast<Duration>(now - tp);
        tp = now;
        return elapsed;
    }
};

}
