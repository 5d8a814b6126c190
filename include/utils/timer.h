#pragma once
/**
 * @file timer.h
 * @brief Steady-clock timer and the injectable sleep used by retry loops
 */

#include <chrono>
#include <functional>
#include <thread>

namespace btd6_pilot {

/**
 * @brief High-resolution CPU timer on the steady clock
 */
class HighResTimer {
public:
    using Clock = std::chrono::steady_clock;

    void start() {
        m_start = Clock::now();
        m_stop = m_start;
    }

    void stop() {
        m_stop = Clock::now();
    }

    double elapsedMs() const {
        return std::chrono::duration<double, std::milli>(m_stop - m_start).count();
    }

    double currentElapsedMs() const {
        return std::chrono::duration<double, std::milli>(Clock::now() - m_start).count();
    }

private:
    Clock::time_point m_start{};
    Clock::time_point m_stop{};
};

/**
 * @brief Injectable sleep; tests substitute a recorder
 */
using SleepFn = std::function<void(std::chrono::milliseconds)>;

inline void realSleep(std::chrono::milliseconds d) {
    if (d.count() > 0) std::this_thread::sleep_for(d);
}

} // namespace btd6_pilot
