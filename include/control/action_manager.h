#pragma once
/**
 * @file action_manager.h
 * @brief Action plan for one map run: ordering, positions, affordability, dispatch
 */

#include "capture/screen_capture.h"
#include "control/placement_controller.h"
#include "control/region_targeting.h"
#include "control/retry_executor.h"
#include "control/run_state.h"
#include "control/upgrade_controller.h"
#include "game/tower_catalog.h"
#include "input/input_controller.h"
#include "types.h"
#include "utils/profiler.h"
#include "utils/timer.h"
#include "vision/debug_images.h"

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace btd6_pilot {

/**
 * @brief Collaborators constructed once at startup and shared by every controller
 */
struct AutomationContext {
    RetryingCapture& capture;
    InputController& input;
    const GlobalConfig& config;
    const game::TowerCatalog& catalog;
    SleepFn sleep = realSleep;
    Profiler* profiler = nullptr;                   ///< Optional
    vision::DebugImageSink* debugImages = nullptr;  ///< Optional
};

/**
 * @brief Owns the action lists, step bookkeeping and the two controllers
 *
 * The dispatch loop itself belongs to the caller (AutomationRunner); this
 * class answers "what next", "can we pay for it" and "do it".
 */
class ActionManager {
public:
    ActionManager(MapConfig map, AutomationContext context);

    ActionManager(const ActionManager&) = delete;
    ActionManager& operator=(const ActionManager&) = delete;

    /**
     * @brief Lowest-step main action whose step is neither completed nor rejected
     * @return nullptr when the plan is exhausted
     */
    const Action* getNextAction() const;

    void markCompleted(int step);

    /// Structurally invalid steps; never returned by getNextAction again
    void markRejected(int step);

    bool isCompleted(int step) const { return m_steps.isCompleted(step); }
    bool isRejected(int step) const { return m_steps.isRejected(step); }

    /// Main actions whose step is not done yet
    size_t stepsRemaining() const;

    std::optional<Point> getEntityPosition(const std::string& name) const;
    UpgradeTiers upgradeTiers(const std::string& name);

    /**
     * @brief Structural checks that don't depend on the game state
     * @throws UpgradeStateError for an invalid upgrade or one whose tower has no position
     */
    void validate(const Action& action) const;

    /**
     * @brief Cost check for the map's difficulty and mode; unknown costs are unaffordable
     */
    bool canAfford(int money, const Action& action) const;

    /**
     * @brief Dispatch one action and record completion
     *
     * Buy steps complete after dispatch whatever the selection outcome.
     * Upgrade steps complete only once the requested tier is reached.
     *
     * @return true if the step is now completed
     * @throws PlacementError, UpgradeStateError, UpgradeVerificationError
     */
    bool execute(const Action& action);

    /**
     * @brief Hero first, then each pre-play buy, in step order
     * @throws PlacementError when a drop can't be confirmed
     */
    void runPrePlay();

    /// Hotkey for a buy: explicit override, then catalog, then the default key
    std::string resolveHotkey(const BuyAction& action) const;

    const MapConfig& mapConfig() const { return m_map; }
    const TimingSettings& timing() const { return m_timing; }
    const std::vector<Action>& actions() const { return m_map.actions; }
    const std::vector<Action>& prePlayActions() const { return m_map.prePlayActions; }

    UpgradeStateStore& upgradeState() { return m_state; }
    const StepTracker& steps() const { return m_steps; }
    PlacementController& placement() { return m_placement; }
    UpgradeController& upgrades() { return m_upgrades; }

private:
    void buildPositionLookup();
    PlacementOutcome placeBuy(const BuyAction& action);

    MapConfig m_map;
    AutomationContext m_ctx;
    TimingSettings m_timing;

    std::unordered_map<std::string, Point> m_positions;
    UpgradeStateStore m_state;
    StepTracker m_steps;

    RetryExecutor m_executor;
    RegionTargeting m_targeting;
    PlacementController m_placement;
    UpgradeController m_upgrades;
};

} // namespace btd6_pilot
