#pragma once
/**
 * @file validation.h
 * @brief Bounds and key checks applied to configuration values
 */

#include "types.h"

#include <string>

namespace btd6_pilot {

/**
 * @brief Throw InvalidCoordinateError unless the point lies on screen
 * @param context Used in the message, e.g. "Dart Monkey 01"
 */
void validateCoordinates(const Point& point, const ScreenBounds& bounds, const std::string& context);

/**
 * @brief Throw ConfigurationError unless the region has positive size and fits on screen
 */
void validateRegion(const Region& region, const ScreenBounds& bounds, const std::string& name);

/**
 * @brief Throw ConfigurationError unless key is one printable character or a named key
 */
void validateKey(const std::string& key, const std::string& name);

bool isNamedKey(const std::string& key);

} // namespace btd6_pilot
