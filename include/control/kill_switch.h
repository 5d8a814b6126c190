#pragma once
/**
 * @file kill_switch.h
 * @brief Cooperative cancellation and the hotkey that triggers it
 */

#include "input/input_controller.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace btd6_pilot {

/**
 * @brief Stop flag checked by the run loop between actions
 *
 * requestStop() only touches a lock-free atomic and is safe to call from a
 * signal handler.
 */
class CancellationToken {
public:
    void requestStop() noexcept { m_stop.store(true); }
    bool stopRequested() const noexcept { return m_stop.load(); }
    void reset() noexcept { m_stop.store(false); }

private:
    std::atomic<bool> m_stop{false};
};

/**
 * @brief Polls a key on a background thread and cancels the token when it is held
 *
 * Give the listener its own InputController: platform backends are not
 * shared across threads.
 */
class KillSwitchListener {
public:
    KillSwitchListener(std::shared_ptr<InputController> input,
                       std::string key,
                       CancellationToken& token,
                       std::chrono::milliseconds pollInterval = std::chrono::milliseconds(50));
    ~KillSwitchListener();

    KillSwitchListener(const KillSwitchListener&) = delete;
    KillSwitchListener& operator=(const KillSwitchListener&) = delete;

    void start();
    void stop();
    bool isRunning() const { return m_running.load(); }

    /**
     * @brief One poll on the calling thread
     * @return true if the key is down (token cancelled)
     */
    bool pollOnce();

    const std::string& key() const { return m_key; }

private:
    void run();

    std::shared_ptr<InputController> m_input;
    std::string m_key;
    CancellationToken& m_token;
    std::chrono::milliseconds m_pollInterval;

    std::mutex m_mutex;
    std::condition_variable m_cv;
    bool m_stopRequested = false;
    std::atomic<bool> m_running{false};
    std::thread m_thread;
};

} // namespace btd6_pilot
