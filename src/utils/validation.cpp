/**
 * @file validation.cpp
 * @brief Configuration value checks
 */

#include "utils/validation.h"
#include "errors.h"

#include <algorithm>
#include <array>
#include <cctype>

namespace btd6_pilot {

namespace {

const std::array<const char*, 20> kNamedKeys = {{
    "esc", "space", "enter", "tab", "backspace", "shift", "ctrl", "alt",
    "up", "down", "left", "right",
    "f1", "f2", "f3", "f4", "f5", "f6", "f7", "f8"
}};

} // namespace

bool isNamedKey(const std::string& key) {
    std::string lower = key;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return (char)std::tolower(c); });
    return std::find_if(kNamedKeys.begin(), kNamedKeys.end(),
                        [&](const char* k) { return lower == k; }) != kNamedKeys.end();
}

void validateCoordinates(const Point& point, const ScreenBounds& bounds, const std::string& context) {
    if (point.x < 0 || point.y < 0 || point.x >= bounds.width || point.y >= bounds.height) {
        throw InvalidCoordinateError(point, context);
    }
}

void validateRegion(const Region& region, const ScreenBounds& bounds, const std::string& name) {
    if (region.width <= 0 || region.height <= 0) {
        throw ConfigurationError("Region " + name + " " + formatRegion(region) + " has non-positive size", name);
    }
    if (region.left < 0 || region.top < 0 ||
        region.right() > bounds.width || region.bottom() > bounds.height) {
        throw ConfigurationError("Region " + name + " " + formatRegion(region) + " lies outside the screen", name);
    }
}

void validateKey(const std::string& key, const std::string& name) {
    if (key.size() == 1 && std::isprint(static_cast<unsigned char>(key[0]))) return;
    if (isNamedKey(key)) return;
    throw ConfigurationError("Invalid key '" + key + "' for " + name, name);
}

} // namespace btd6_pilot
