/**
 * @file placement_controller.cpp
 * @brief Vision-confirmed tower and hero placement
 */

#include "control/placement_controller.h"
#include "errors.h"
#include "utils/logger.h"

namespace btd6_pilot {

PlacementConfig PlacementConfig::fromSettings(const VisionSettings& vision, const TimingSettings& timing) {
    PlacementConfig c;
    c.selectRegion = vision.selectRegion;
    c.placeRegions = {vision.placeRegion1, vision.placeRegion2};
    c.selectThreshold = vision.selectThreshold;
    c.placeThreshold = vision.placeThreshold;
    c.maxAttempts = vision.maxAttempts;
    c.pixelDelta = vision.pixelDelta;
    c.selectDelay = timing.clickDelay;
    c.targetDelay = timing.placementDelay;
    c.restingSpot = vision.cursorRestingSpot;
    return c;
}

const char* toString(PlacementPhase phase) {
    switch (phase) {
        case PlacementPhase::Idle:      return "Idle";
        case PlacementPhase::Selecting: return "Selecting";
        case PlacementPhase::Targeting: return "Targeting";
        case PlacementPhase::Done:      return "Done";
        case PlacementPhase::Failed:    return "Failed";
    }
    return "?";
}

PlacementController::PlacementController(RetryExecutor& executor,
                                         RegionTargeting& targeting,
                                         InputController& input,
                                         PlacementConfig config,
                                         Profiler* profiler)
    : m_executor(executor)
    , m_targeting(targeting)
    , m_input(input)
    , m_config(std::move(config))
    , m_profiler(profiler)
    , m_confirm(vision::makeConfirmFn(m_config.pixelDelta)) {}

void PlacementController::sendSelection(const PlacementRequest& request) {
    if (request.kind == EntityKind::Hero) {
        m_input.pressKey(request.hotkey);
        m_executor.sleep(m_config.heroKeyHold);
        m_input.releaseKey(request.hotkey);
    } else {
        m_input.sendKey(request.hotkey);
    }
}

PlacementOutcome PlacementController::place(const PlacementRequest& request) {
    PlacementOutcome outcome;
    ProfiledOperation prof(m_profiler, request.kind == EntityKind::Hero ? "place_hero" : "place_monkey",
                           request.target);

    logInfo("Placing " + request.target + " at " + formatPoint(request.position) +
            " (key '" + request.hotkey + "')");

    // Selecting
    m_phase = PlacementPhase::Selecting;
    const bool selected = m_executor.retryConfirm(
        [&]() { sendSelection(request); },
        m_config.selectRegion,
        m_config.selectThreshold,
        m_config.maxAttempts,
        m_config.selectDelay,
        m_confirm,
        "select_" + request.target);
    outcome.selectAttempts = m_executor.lastAttempts();
    prof.checkpoint("selected");

    if (!selected) {
        m_phase = PlacementPhase::Failed;
        outcome.phase = m_phase;
        logError("Selection of " + request.target + " not confirmed after " +
                 std::to_string(outcome.selectAttempts) + " attempts; placement abandoned");
        prof.finish(outcome.selectAttempts, false);
        return outcome;
    }

    // Targeting; the resting click also deselects whatever the drop left open
    m_phase = PlacementPhase::Targeting;
    TargetingResult target;
    {
        CursorRestGuard rest(m_input, m_config.restingSpot);
        target = m_targeting.tryTargeting(request.position,
                                          m_config.placeRegions,
                                          m_config.placeThreshold,
                                          m_config.maxAttempts,
                                          m_config.targetDelay,
                                          m_confirm,
                                          m_config.pixelDelta);
    }
    outcome.targetAttempts = target.attempts;
    outcome.regionIndex = target.regionIndex;
    prof.checkpoint("targeted");

    if (!target.success) {
        m_phase = PlacementPhase::Failed;
        outcome.phase = m_phase;
        prof.finish(outcome.selectAttempts + outcome.targetAttempts, false);
        throw PlacementError(request.target, request.position, "placement", target.attempts);
    }

    m_phase = PlacementPhase::Done;
    outcome.phase = m_phase;
    prof.finish(outcome.selectAttempts + outcome.targetAttempts, true);
    logInfo("Placed " + request.target + " (region " + std::to_string(target.regionIndex) + ", " +
            std::to_string(target.percent) + "%)");
    return outcome;
}

} // namespace btd6_pilot
