/**
 * @file upgrade_controller.cpp
 * @brief Vision-verified upgrades, one tier per call
 */

#include "control/upgrade_controller.h"
#include "errors.h"
#include "utils/logger.h"
#include "vision/image_comparator.h"

namespace btd6_pilot {

UpgradeConfig UpgradeConfig::fromSettings(const GlobalConfig& config, const TimingSettings& timing) {
    UpgradeConfig c;
    c.targetRegions = {config.vision.placeRegion1, config.vision.placeRegion2};
    c.targetThreshold = config.vision.placeThreshold;
    c.upgradeThreshold = config.vision.upgradeThreshold;
    c.targetAttempts = config.vision.maxAttempts;
    c.pixelDelta = config.vision.pixelDelta;
    c.targetDelay = timing.clickDelay;
    c.upgradeDelay = timing.upgradeDelay;
    c.applyPolicy = RetryPolicy::fromSettings(config.retries);
    c.pathKeys = config.hotkeys.upgradePath;
    c.restingSpot = config.vision.cursorRestingSpot;
    return c;
}

const char* toString(UpgradeOutcome outcome) {
    switch (outcome) {
        case UpgradeOutcome::Completed:        return "Completed";
        case UpgradeOutcome::Advanced:         return "Advanced";
        case UpgradeOutcome::AlreadySatisfied: return "AlreadySatisfied";
    }
    return "?";
}

UpgradeController::UpgradeController(RetryExecutor& executor,
                                     RegionTargeting& targeting,
                                     InputController& input,
                                     UpgradeStateStore& state,
                                     PositionLookup positions,
                                     UpgradeConfig config,
                                     Profiler* profiler)
    : m_executor(executor)
    , m_targeting(targeting)
    , m_input(input)
    , m_state(state)
    , m_positions(std::move(positions))
    , m_config(std::move(config))
    , m_profiler(profiler)
    , m_confirm(vision::makeConfirmFn(m_config.pixelDelta)) {}

void UpgradeController::validate(const UpgradeAction& action) {
    if (action.target.empty()) {
        throw UpgradeStateError("Upgrade action at step " + std::to_string(action.step) +
                                " has no target", action.target);
    }
    if (action.tier < 1 || action.tier > kMaxTier) {
        throw UpgradeStateError("Invalid tier " + std::to_string(action.tier) + " for " +
                                pathKey(action.path) + ": must be 1.." + std::to_string(kMaxTier),
                                action.target);
    }
}

UpgradeResult UpgradeController::run(const UpgradeAction& action) {
    validate(action);

    std::optional<Point> position = m_positions ? m_positions(action.target) : std::nullopt;
    if (!position) {
        throw UpgradeStateError("No position found for tower '" + action.target + "'", action.target);
    }

    UpgradeResult result;
    const int current = m_state.tier(action.target, action.path);
    result.previousTier = current;
    result.newTier = current;

    if (current >= action.tier) {
        logInfo(action.target + " " + pathKey(action.path) + " already at tier " +
                std::to_string(current) + " (requested " + std::to_string(action.tier) + ")");
        result.outcome = UpgradeOutcome::AlreadySatisfied;
        result.stepCompleted = true;
        return result;
    }

    // validate() caps the request at kMaxTier, so next never exceeds it
    const int next = current + 1;

    ProfiledOperation prof(m_profiler, "upgrade", action.target);
    CursorRestGuard rest(m_input, m_config.restingSpot);

    logInfo("Upgrading " + action.target + " " + pathKey(action.path) + ": " +
            std::to_string(current) + " -> " + std::to_string(next) +
            " (requested " + std::to_string(action.tier) + ")");

    TargetingResult target = m_targeting.tryTargeting(*position,
                                                      m_config.targetRegions,
                                                      m_config.targetThreshold,
                                                      m_config.targetAttempts,
                                                      m_config.targetDelay,
                                                      m_confirm,
                                                      m_config.pixelDelta);
    prof.checkpoint("targeted");
    if (!target.success) {
        prof.finish(target.attempts, false);
        throw UpgradeVerificationError("Could not focus " + action.target + " at " +
                                       formatPoint(*position) + " for upgrade",
                                       action.target, action.path, next, target.attempts);
    }

    const Region& region = m_config.targetRegions[static_cast<size_t>(target.regionIndex)];
    // Verified against the panel as it looked before the targeting click
    const bool verified = applyUntilVerified(action, region, target.preImage, next, result.attempts);
    prof.checkpoint("applied");

    if (!verified) {
        prof.finish(result.attempts, false);
        throw UpgradeVerificationError("Upgrade verification failed for " + action.target + " " +
                                       pathKey(action.path) + " tier " + std::to_string(next) +
                                       " after " + std::to_string(result.attempts) + " attempts",
                                       action.target, action.path, next, result.attempts);
    }

    if (!m_state.commit(action.target, action.path, next)) {
        prof.finish(result.attempts, false);
        throw UpgradeStateError("Tier for " + action.target + " " + pathKey(action.path) +
                                " changed during the upgrade", action.target);
    }

    result.newTier = next;
    result.stepCompleted = next >= action.tier;
    result.outcome = result.stepCompleted ? UpgradeOutcome::Completed : UpgradeOutcome::Advanced;
    prof.finish(result.attempts, true);
    logInfo("Upgraded " + action.target + " " + pathKey(action.path) + " to tier " +
            std::to_string(next) + (result.stepCompleted ? "" : " (more passes needed)"));
    return result;
}

bool UpgradeController::applyUntilVerified(const UpgradeAction& action,
                                           const Region& region,
                                           const cv::Mat& baseline,
                                           int newTier,
                                           int& attempts) {
    const std::string& key = m_config.pathKeys[static_cast<size_t>(action.path)];
    const int maxAttempts = m_config.applyPolicy.maxAttempts < 1 ? 1 : m_config.applyPolicy.maxAttempts;

    for (int attempt = 1; attempt <= maxAttempts; ++attempt) {
        attempts = attempt;
        m_input.sendKey(key);
        m_executor.sleep(m_config.upgradeDelay);

        std::optional<cv::Mat> post = m_executor.capture().captureRegion(region);
        if (post) {
            const double percent = vision::percentDifference(baseline, *post, m_config.pixelDelta);
            logDebug("Upgrade " + action.target + " tier " + std::to_string(newTier) + " attempt " +
                     std::to_string(attempt) + ": " + std::to_string(percent) + "%");
            if (m_confirm(baseline, *post, m_config.upgradeThreshold)) {
                return true;
            }
            if (vision::DebugImageSink* sink = m_executor.debugImages()) {
                sink->saveComparison("upgrade_" + action.target, baseline, *post);
            }
        } else {
            logWarning("Upgrade verification capture failed for " + action.target +
                       " (attempt " + std::to_string(attempt) + ")");
        }

        if (attempt < maxAttempts) {
            m_executor.sleep(m_config.applyPolicy.delayFor(attempt));
        }
    }
    return false;
}

} // namespace btd6_pilot
