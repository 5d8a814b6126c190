#pragma once
/**
 * @file map_starter.h
 * @brief Click through Play -> map -> difficulty -> mode from the home screen
 */

#include "capture/screen_capture.h"
#include "control/kill_switch.h"
#include "control/retry_policy.h"
#include "input/input_controller.h"
#include "types.h"
#include "utils/timer.h"
#include "vision/template_locator.h"

#include <string>
#include <vector>

namespace btd6_pilot {

struct MapStartStep {
    std::string templateName;   ///< File stem under the image directory
    std::string description;    ///< For logs, e.g. "Easy difficulty"
};

/**
 * @brief Lower-case, spaces to '_', apostrophes dropped ("Adora's Temple" -> "adoras_temple")
 */
std::string templateSlug(const std::string& text);

/**
 * @brief button_play, map_<map>, button_<difficulty>, button_<mode>
 *
 * Difficulty and mode are normalized first, so "impop" selects button_impoppable.
 */
std::vector<MapStartStep> mapStartSteps(const MapConfig& map);

/**
 * @brief Load <imageDir>/<template>.png for every step
 * @return Template names that could not be loaded
 */
std::vector<std::string> loadMapStartTemplates(vision::TemplateLocator& locator,
                                               const std::vector<MapStartStep>& steps,
                                               const std::string& imageDir);

class MapStarter {
public:
    MapStarter(RetryingCapture& capture,
               InputController& input,
               const vision::TemplateLocator& locator,
               const ScreenBounds& screen,
               const MapStartSettings& settings,
               SleepFn sleep = realSleep);

    /**
     * @brief Find and click each step's button in order
     * @return false if cancelled before the last click
     * @throws MapStartError when a button has no template or is not found within findAttempts grabs
     */
    bool start(const std::vector<MapStartStep>& steps, const CancellationToken& token);

private:
    std::optional<Point> findOnScreen(const std::string& templateName);

    RetryingCapture& m_capture;
    InputController& m_input;
    const vision::TemplateLocator& m_locator;
    Region m_screen;
    MapStartSettings m_settings;
    RetryPolicy m_findPolicy;
    SleepFn m_sleep;
};

} // namespace btd6_pilot
