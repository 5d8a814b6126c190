#include "control/run_state.h"
#include "utils/logger.h"

namespace btd6_pilot {

UpgradeTiers UpgradeStateStore::tiers(const std::string& target) {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_state[target];
}

int UpgradeStateStore::tier(const std::string& target, UpgradePath path) {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_state[target].get(path);
}

bool UpgradeStateStore::commit(const std::string& target, UpgradePath path, int newTier) {
    std::lock_guard<std::mutex> lock(m_mutex);
    UpgradeTiers& t = m_state[target];
    const int current = t.get(path);
    if (newTier != current + 1 || newTier > kMaxTier) {
        logError("Refusing tier change for " + target + " " + pathKey(path) + ": " +
                 std::to_string(current) + " -> " + std::to_string(newTier));
        return false;
    }
    t.set(path, newTier);
    return true;
}

bool UpgradeStateStore::contains(const std::string& target) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_state.count(target) != 0;
}

std::map<std::string, UpgradeTiers> UpgradeStateStore::snapshot() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_state;
}

void StepTracker::markCompleted(int step) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_completed.insert(step);
}

void StepTracker::markRejected(int step) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_rejected.insert(step);
}

bool StepTracker::isCompleted(int step) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_completed.count(step) != 0;
}

bool StepTracker::isRejected(int step) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_rejected.count(step) != 0;
}

bool StepTracker::isDone(int step) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_completed.count(step) != 0 || m_rejected.count(step) != 0;
}

std::set<int> StepTracker::completed() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_completed;
}

std::set<int> StepTracker::rejected() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_rejected;
}

} // namespace btd6_pilot
