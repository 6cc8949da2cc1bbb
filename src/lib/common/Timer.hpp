#pragma once

#include <boost/chrono.hpp>

template<typename Clock>
class Timer {
public:
    Timer() : _start(Clock::now()) {}

    double seconds() const {
        return boost::chrono::duration<double>(Clock::now() - _start).count();
    }

private:
    typename Clock::time_point _start;
};

typedef Timer<boost::chrono::steady_clock> SteadyTimer;
