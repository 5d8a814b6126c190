#pragma once
/**
 * @file placement_controller.h
 * @brief Select a tower or hero by hotkey, then drop it at a position
 */

#include "control/region_targeting.h"
#include "control/retry_executor.h"
#include "input/input_controller.h"
#include "types.h"
#include "utils/profiler.h"

#include <chrono>
#include <string>
#include <vector>

namespace btd6_pilot {

struct PlacementConfig {
    Region selectRegion;
    std::vector<Region> placeRegions;
    double selectThreshold = 40.0;
    double placeThreshold = 85.0;
    int maxAttempts = 3;
    int pixelDelta = 0;
    std::chrono::milliseconds selectDelay{200};     ///< Settle time after a hotkey
    std::chrono::milliseconds targetDelay{500};     ///< Settle time after the drop click
    std::chrono::milliseconds heroKeyHold{100};     ///< Hero selection needs a held key
    Point restingSpot;

    static PlacementConfig fromSettings(const VisionSettings& vision, const TimingSettings& timing);
};

enum class PlacementPhase {
    Idle,
    Selecting,
    Targeting,
    Done,
    Failed
};

const char* toString(PlacementPhase phase);

enum class EntityKind {
    Monkey,
    Hero
};

struct PlacementRequest {
    std::string target;     ///< Display name, used for logs and errors
    Point position;
    std::string hotkey;
    EntityKind kind = EntityKind::Monkey;
};

struct PlacementOutcome {
    PlacementPhase phase = PlacementPhase::Idle;
    int selectAttempts = 0;
    int targetAttempts = 0;
    int regionIndex = -1;
};

/**
 * @brief Idle -> Selecting -> Targeting -> Done | Failed
 *
 * A selection that never confirms ends in Failed and nothing is clicked.
 * A drop that never confirms throws PlacementError: the tower may or may not
 * exist on the field, and nothing downstream can be trusted after that.
 */
class PlacementController {
public:
    PlacementController(RetryExecutor& executor,
                        RegionTargeting& targeting,
                        InputController& input,
                        PlacementConfig config,
                        Profiler* profiler = nullptr);

    /**
     * @throws PlacementError when the drop could not be confirmed
     */
    PlacementOutcome place(const PlacementRequest& request);

    PlacementPhase phase() const { return m_phase; }
    const PlacementConfig& config() const { return m_config; }

private:
    void sendSelection(const PlacementRequest& request);

    RetryExecutor& m_executor;
    RegionTargeting& m_targeting;
    InputController& m_input;
    PlacementConfig m_config;
    Profiler* m_profiler;
    vision::ConfirmFn m_confirm;
    PlacementPhase m_phase = PlacementPhase::Idle;
};

} // namespace btd6_pilot
