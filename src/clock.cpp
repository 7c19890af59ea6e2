#include "clock.h"

#include <thread>

Clock::TimePoint SteadyClock::now() {
    return std::chrono::steady_clock::now();
}

void SteadyClock::sleepFor(Duration duration) {
    std::this_thread::sleep_for(duration);
}
