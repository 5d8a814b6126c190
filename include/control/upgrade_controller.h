#pragma once
/**
 * @file upgrade_controller.h
 * @brief One-tier-per-call, vision-verified tower upgrades
 */

#include "control/region_targeting.h"
#include "control/retry_executor.h"
#include "control/retry_policy.h"
#include "control/run_state.h"
#include "input/input_controller.h"
#include "types.h"
#include "utils/profiler.h"

#include <array>
#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace btd6_pilot {

struct UpgradeConfig {
    std::vector<Region> targetRegions;          ///< Upgrade panel, left or right side
    double targetThreshold = 85.0;
    double upgradeThreshold = 15.0;
    int targetAttempts = 3;
    int pixelDelta = 0;
    std::chrono::milliseconds targetDelay{500};
    std::chrono::milliseconds upgradeDelay{500};
    RetryPolicy applyPolicy;                    ///< maxAttempts = verification attempts
    std::array<std::string, kPathCount> pathKeys{{",", ".", "/"}};
    Point restingSpot;

    static UpgradeConfig fromSettings(const GlobalConfig& config, const TimingSettings& timing);
};

enum class UpgradeOutcome {
    Completed,          ///< Tier committed, requested tier reached
    Advanced,           ///< Tier committed, more passes needed
    AlreadySatisfied    ///< Current tier >= requested, nothing sent
};

const char* toString(UpgradeOutcome outcome);

struct UpgradeResult {
    UpgradeOutcome outcome = UpgradeOutcome::AlreadySatisfied;
    int previousTier = 0;
    int newTier = 0;
    int attempts = 0;           ///< Upgrade key presses
    bool stepCompleted = false;
};

/// Resolves a tower's fixed position; nullopt when it was never placed
using PositionLookup = std::function<std::optional<Point>(const std::string& target)>;

/**
 * @brief Validate -> Locate -> Target -> Apply(1..N) -> Commit | Abort
 *
 * Each call advances the path by at most one tier. The caller re-runs the
 * action on later passes until the step reports completed.
 */
class UpgradeController {
public:
    UpgradeController(RetryExecutor& executor,
                      RegionTargeting& targeting,
                      InputController& input,
                      UpgradeStateStore& state,
                      PositionLookup positions,
                      UpgradeConfig config,
                      Profiler* profiler = nullptr);

    /**
     * @throws UpgradeStateError invalid action or unknown tower; nothing was sent
     * @throws UpgradeVerificationError targeting or verification exhausted; state unchanged
     */
    UpgradeResult run(const UpgradeAction& action);

    /**
     * @throws UpgradeStateError on an empty target or a tier outside 1..5
     */
    static void validate(const UpgradeAction& action);

    const UpgradeConfig& config() const { return m_config; }

private:
    /**
     * @brief Press the path key until the panel region differs from its pre-targeting image
     * @param attempts Set to the number of key presses made
     */
    bool applyUntilVerified(const UpgradeAction& action,
                            const Region& region,
                            const cv::Mat& baseline,
                            int newTier,
                            int& attempts);

    RetryExecutor& m_executor;
    RegionTargeting& m_targeting;
    InputController& m_input;
    UpgradeStateStore& m_state;
    PositionLookup m_positions;
    UpgradeConfig m_config;
    Profiler* m_profiler;
    vision::ConfirmFn m_confirm;
};

} // namespace btd6_pilot
