#pragma once
/**
 * @file errors.h
 * @brief Exception hierarchy for automation failures
 *
 * Every error carries the failing operation and a flat key/value context
 * (target, coordinates, attempt counts) so the orchestrator can log it and
 * decide whether the run survives.
 */

#include "types.h"

#include <map>
#include <stdexcept>
#include <string>

namespace btd6_pilot {

using ErrorContext = std::map<std::string, std::string>;

std::string formatPoint(const Point& p);
std::string formatRegion(const Region& r);

/**
 * @brief Root of all automation errors
 */
class AutomationError : public std::runtime_error {
public:
    AutomationError(const std::string& message, std::string operation = {}, ErrorContext context = {});

    const std::string& operation() const { return m_operation; }
    const ErrorContext& context() const { return m_context; }

    /// Message plus " {key=value, ...}" when context is present
    std::string describe() const;

private:
    std::string m_operation;
    ErrorContext m_context;
};

class ConfigurationError : public AutomationError {
public:
    explicit ConfigurationError(const std::string& message, std::string settingName = {});
    const std::string& settingName() const { return m_settingName; }

private:
    std::string m_settingName;
};

class InvalidCoordinateError : public ConfigurationError {
public:
    InvalidCoordinateError(const Point& point, const std::string& context);
    const Point& point() const { return m_point; }

private:
    Point m_point;
};

/**
 * @brief A capture never produced a frame within its retry budget
 */
class CaptureError : public AutomationError {
public:
    explicit CaptureError(const Region& region);
    const Region& region() const { return m_region; }

private:
    Region m_region;
};

class WindowError : public AutomationError {
public:
    explicit WindowError(const std::string& windowTitle);
};

/**
 * @brief Placement could not be visually confirmed; fatal for the run
 */
class PlacementError : public AutomationError {
public:
    PlacementError(const std::string& target, const Point& position, const std::string& phase, int attempts);
    const std::string& target() const { return m_target; }
    const Point& position() const { return m_position; }
    int attempts() const { return m_attempts; }

private:
    std::string m_target;
    Point m_position;
    int m_attempts;
};

/**
 * @brief Upgrade request rejected before any input was sent
 */
class UpgradeStateError : public AutomationError {
public:
    UpgradeStateError(const std::string& message, const std::string& target);
    const std::string& target() const { return m_target; }

private:
    std::string m_target;
};

/**
 * @brief Upgrade attempts ran out without visual confirmation; recoverable
 */
class UpgradeVerificationError : public AutomationError {
public:
    UpgradeVerificationError(const std::string& message, const std::string& target,
                             UpgradePath path, int tier, int attempts);
    const std::string& target() const { return m_target; }
    UpgradePath path() const { return m_path; }
    int tier() const { return m_tier; }
    int attempts() const { return m_attempts; }

private:
    std::string m_target;
    UpgradePath m_path;
    int m_tier;
    int m_attempts;
};

/**
 * @brief A menu button never showed up while starting the map; fatal for the run
 */
class MapStartError : public AutomationError {
public:
    MapStartError(const std::string& description, const std::string& templateName, int attempts);
    const std::string& templateName() const { return m_templateName; }
    int attempts() const { return m_attempts; }

private:
    std::string m_templateName;
    int m_attempts;
};

class RetryExhaustedError : public AutomationError {
public:
    RetryExhaustedError(const std::string& operation, int attempts, const std::string& lastError);
    int attempts() const { return m_attempts; }
    const std::string& lastError() const { return m_lastError; }

private:
    int m_attempts;
    std::string m_lastError;
};

} // namespace btd6_pilot
