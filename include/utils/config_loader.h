#pragma once
/**
 * @file config_loader.h
 * @brief Configuration file loading utilities
 */

#include "types.h"

#include <string>
#include <vector>

namespace btd6_pilot {

/**
 * @brief Convert an [x1, y1, x2, y2] rectangle into a Region
 * @throws ConfigurationError if the rectangle does not have 4 entries or has non-positive size
 */
Region rectToRegion(const std::vector<int>& rect);

/**
 * @brief Load the global configuration
 *
 * Expected format (see config/global.json):
 * {
 *   "window_title": "BloonsTD6",
 *   "hotkey": { "upgrade_path_1": ",", ... },
 *   "automation": { "logging_level": "INFO", "timing": {...}, "retries": {...} },
 *   "vision": { "select_region": [925, 800, 1135, 950], ... },
 *   "map_filenames": { "monkey_meadow.json": "Monkey Meadow" }
 * }
 *
 * Durations are written in seconds. Missing keys keep the defaults from types.h.
 *
 * @throws ConfigurationError when the file is missing, malformed or holds invalid values
 */
GlobalConfig loadGlobalConfig(const std::string& path);

/**
 * @brief Load one map's action plan
 *
 * Actions that fail structural checks are dropped with a warning;
 * they never reach the scheduler.
 *
 * @throws ConfigurationError when the file is missing or malformed
 */
MapConfig loadMapConfig(const std::string& path, const ScreenBounds& bounds);

/**
 * @brief Lower-case and strip spaces / apostrophes ("Monkey Meadow" -> "monkeymeadow")
 */
std::string normalizeMapName(const std::string& displayName);

/**
 * @brief Resolve a map display name to its config file name
 * @throws ConfigurationError if the map is not listed in map_filenames
 */
std::string mapFilenameFor(const GlobalConfig& config, const std::string& displayName);

/**
 * @brief Display names from map_filenames, sorted
 */
std::vector<std::string> listMapNames(const GlobalConfig& config);

} // namespace btd6_pilot
