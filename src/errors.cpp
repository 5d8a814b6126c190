/**
 * @file errors.cpp
 * @brief Automation error types
 */

#include "errors.h"

#include <sstream>

namespace btd6_pilot {

namespace {

std::string withOperation(const std::string& message, const std::string& operation) {
    if (operation.empty()) return message;
    return "[" + operation + "] " + message;
}

} // namespace

std::string formatPoint(const Point& p) {
    std::ostringstream oss;
    oss << "(" << p.x << ", " << p.y << ")";
    return oss.str();
}

std::string formatRegion(const Region& r) {
    std::ostringstream oss;
    oss << "(" << r.left << ", " << r.top << ", " << r.width << ", " << r.height << ")";
    return oss.str();
}

AutomationError::AutomationError(const std::string& message, std::string operation, ErrorContext context)
    : std::runtime_error(withOperation(message, operation))
    , m_operation(std::move(operation))
    , m_context(std::move(context)) {}

std::string AutomationError::describe() const {
    std::string out = what();
    if (m_context.empty()) return out;
    out += " {";
    bool first = true;
    for (const auto& kv : m_context) {
        if (!first) out += ", ";
        out += kv.first + "=" + kv.second;
        first = false;
    }
    out += "}";
    return out;
}

ConfigurationError::ConfigurationError(const std::string& message, std::string settingName)
    : AutomationError(message, "configuration",
                      settingName.empty() ? ErrorContext{} : ErrorContext{{"setting", settingName}})
    , m_settingName(std::move(settingName)) {}

InvalidCoordinateError::InvalidCoordinateError(const Point& point, const std::string& context)
    : ConfigurationError("Invalid coordinates " + formatPoint(point) + " for " + context +
                         ": must be non-negative and on screen", "coordinates")
    , m_point(point) {}

CaptureError::CaptureError(const Region& region)
    : AutomationError("Failed to capture screenshot of region " + formatRegion(region),
                      "screenshot_capture", {{"region", formatRegion(region)}})
    , m_region(region) {}

WindowError::WindowError(const std::string& windowTitle)
    : AutomationError("Failed to activate game window '" + windowTitle + "'",
                      "window_activation", {{"window", windowTitle}}) {}

PlacementError::PlacementError(const std::string& target, const Point& position,
                               const std::string& phase, int attempts)
    : AutomationError("Could not confirm " + phase + " of " + target + " at " + formatPoint(position),
                      "placement",
                      {{"target", target},
                       {"position", formatPoint(position)},
                       {"phase", phase},
                       {"attempts", std::to_string(attempts)}})
    , m_target(target)
    , m_position(position)
    , m_attempts(attempts) {}

UpgradeStateError::UpgradeStateError(const std::string& message, const std::string& target)
    : AutomationError(message, "upgrade_validation", {{"target", target}})
    , m_target(target) {}

UpgradeVerificationError::UpgradeVerificationError(const std::string& message, const std::string& target,
                                                   UpgradePath path, int tier, int attempts)
    : AutomationError(message, "upgrade_verification",
                      {{"target", target},
                       {"path", pathKey(path)},
                       {"tier", std::to_string(tier)},
                       {"attempts", std::to_string(attempts)}})
    , m_target(target)
    , m_path(path)
    , m_tier(tier)
    , m_attempts(attempts) {}

MapStartError::MapStartError(const std::string& description, const std::string& templateName, int attempts)
    : AutomationError("Could not find " + description + " on screen",
                      "map_start",
                      {{"template", templateName}, {"attempts", std::to_string(attempts)}})
    , m_templateName(templateName)
    , m_attempts(attempts) {}

RetryExhaustedError::RetryExhaustedError(const std::string& operation, int attempts, const std::string& lastError)
    : AutomationError("Operation '" + operation + "' failed after " + std::to_string(attempts) + " attempts",
                      operation,
                      {{"attempts", std::to_string(attempts)}, {"last_error", lastError}})
    , m_attempts(attempts)
    , m_lastError(lastError) {}

} // namespace btd6_pilot
