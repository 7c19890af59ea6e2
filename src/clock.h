#ifndef INCLUDE_CLOCK_H
#define INCLUDE_CLOCK_H

#include <chrono>

class Clock {
public:
    typedef std::chrono::steady_clock::time_point TimePoint;
    typedef std::chrono::steady_clock::duration   Duration;

    virtual ~Clock() {}

    virtual TimePoint now() = 0;
    virtual void sleepFor(Duration duration) = 0;
};

class SteadyClock : public Clock {
public:
    TimePoint now();
    void sleepFor(Duration duration);
};

#endif // INCLUDE_CLOCK_H
