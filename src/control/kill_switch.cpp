#include "control/kill_switch.h"
#include "utils/logger.h"

#include <exception>

namespace btd6_pilot {

KillSwitchListener::KillSwitchListener(std::shared_ptr<InputController> input,
                                       std::string key,
                                       CancellationToken& token,
                                       std::chrono::milliseconds pollInterval)
    : m_input(std::move(input))
    , m_key(std::move(key))
    , m_token(token)
    , m_pollInterval(pollInterval) {}

KillSwitchListener::~KillSwitchListener() {
    stop();
}

void KillSwitchListener::start() {
    if (m_running.load() || !m_input) return;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_stopRequested = false;
    }
    m_running = true;
    m_thread = std::thread(&KillSwitchListener::run, this);
    logInfo("Kill switch armed: hold '" + m_key + "' to stop");
}

void KillSwitchListener::stop() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_stopRequested = true;
    }
    m_cv.notify_all();
    if (m_thread.joinable()) m_thread.join();
    m_running = false;
}

bool KillSwitchListener::pollOnce() {
    bool down = false;
    try {
        down = m_input->isKeyDown(m_key);
    } catch (const std::exception& e) {
        logWarning(std::string("Kill switch poll failed: ") + e.what());
        return false;
    }
    if (down && !m_token.stopRequested()) {
        logWarning("Kill switch '" + m_key + "' pressed, stopping");
        m_token.requestStop();
    }
    return down;
}

void KillSwitchListener::run() {
    std::unique_lock<std::mutex> lock(m_mutex);
    while (!m_stopRequested && !m_token.stopRequested()) {
        lock.unlock();
        pollOnce();
        lock.lock();
        m_cv.wait_for(lock, m_pollInterval, [this] { return m_stopRequested; });
    }
}

} // namespace btd6_pilot
