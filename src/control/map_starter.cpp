#include "control/map_starter.h"
#include "errors.h"
#include "game/costs.h"
#include "utils/logger.h"

#include <cctype>
#include <filesystem>

namespace btd6_pilot {

std::string templateSlug(const std::string& text) {
    std::string slug;
    for (unsigned char c : text) {
        if (c == '\'') continue;
        if (std::isspace(c)) {
            if (!slug.empty() && slug.back() != '_') slug += '_';
            continue;
        }
        slug += static_cast<char>(std::tolower(c));
    }
    while (!slug.empty() && slug.back() == '_') slug.pop_back();
    return slug;
}

std::vector<MapStartStep> mapStartSteps(const MapConfig& map) {
    const GameSettings settings = game::normalizeDifficultyMode(map.game);
    return {
        {"button_play", "Play button"},
        {"map_" + templateSlug(map.mapName), map.mapName + " map"},
        {"button_" + templateSlug(settings.difficulty), settings.difficulty + " difficulty"},
        {"button_" + templateSlug(settings.mode), settings.mode + " mode"},
    };
}

std::vector<std::string> loadMapStartTemplates(vision::TemplateLocator& locator,
                                               const std::vector<MapStartStep>& steps,
                                               const std::string& imageDir) {
    std::vector<std::string> missing;
    for (const MapStartStep& step : steps) {
        const std::string path = (std::filesystem::path(imageDir) / (step.templateName + ".png")).string();
        if (!locator.loadTemplate(step.templateName, path)) missing.push_back(step.templateName);
    }
    return missing;
}

MapStarter::MapStarter(RetryingCapture& capture,
                       InputController& input,
                       const vision::TemplateLocator& locator,
                       const ScreenBounds& screen,
                       const MapStartSettings& settings,
                       SleepFn sleep)
    : m_capture(capture)
    , m_input(input)
    , m_locator(locator)
    , m_screen{0, 0, screen.width, screen.height}
    , m_settings(settings)
    , m_sleep(std::move(sleep)) {
    m_findPolicy.maxAttempts = m_settings.findAttempts;
    m_findPolicy.baseDelay = m_settings.findDelay;
    m_findPolicy.maxDelay = m_settings.findDelay;
    m_findPolicy.backoffFactor = 1.0;
}

std::optional<Point> MapStarter::findOnScreen(const std::string& templateName) {
    std::optional<cv::Mat> frame = m_capture.captureRegion(m_screen);
    if (!frame) return std::nullopt;
    vision::TemplateMatch match = m_locator.locate(*frame, templateName);
    if (!match.found) {
        logDebug("No match for " + templateName + " (score " + std::to_string(match.score) + ")");
        return std::nullopt;
    }
    return match.center;
}

bool MapStarter::start(const std::vector<MapStartStep>& steps, const CancellationToken& token) {
    for (const MapStartStep& step : steps) {
        if (token.stopRequested()) return false;
        if (!m_locator.hasTemplate(step.templateName)) {
            throw MapStartError(step.description, step.templateName, 0);
        }

        Point at;
        try {
            at = runWithRetry<Point>(m_findPolicy, "find " + step.templateName,
                                     [this, &step]() { return findOnScreen(step.templateName); },
                                     m_sleep);
        } catch (const RetryExhaustedError& e) {
            throw MapStartError(step.description, step.templateName, e.attempts());
        }

        m_input.moveAndClick(at);
        logInfo("Clicked " + step.description + " at " + formatPoint(at));
        m_sleep(m_settings.clickDelay);
    }
    logInfo("Map started");
    return true;
}

} // namespace btd6_pilot
