#pragma once
/**
 * @file run_state.h
 * @brief Per-run upgrade tiers and step bookkeeping
 *
 * Both structures are only ever mutated from the control thread. They are
 * still mutex-guarded because the kill-switch and currency threads share the
 * process and the runner reports progress from its signal path.
 */

#include "types.h"

#include <map>
#include <mutex>
#include <set>
#include <string>

namespace btd6_pilot {

/**
 * @brief Tier per path per entity; tiers only ever move up by one
 */
class UpgradeStateStore {
public:
    /**
     * @brief Current tiers; first reference initializes the entity to all zero
     */
    UpgradeTiers tiers(const std::string& target);

    int tier(const std::string& target, UpgradePath path);

    /**
     * @brief Record a verified upgrade
     * @return false (and no change) unless newTier == current + 1 and <= kMaxTier
     */
    bool commit(const std::string& target, UpgradePath path, int newTier);

    bool contains(const std::string& target) const;
    std::map<std::string, UpgradeTiers> snapshot() const;

private:
    mutable std::mutex m_mutex;
    std::map<std::string, UpgradeTiers> m_state;
};

/**
 * @brief Completed and rejected step identifiers; both sets only grow
 */
class StepTracker {
public:
    void markCompleted(int step);
    void markRejected(int step);

    bool isCompleted(int step) const;
    bool isRejected(int step) const;

    /// Completed or rejected: never scheduled again
    bool isDone(int step) const;

    std::set<int> completed() const;
    std::set<int> rejected() const;

private:
    mutable std::mutex m_mutex;
    std::set<int> m_completed;
    std::set<int> m_rejected;
};

} // namespace btd6_pilot
