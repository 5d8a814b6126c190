/**
 * @file config_loader.cpp
 * @brief Configuration file loading
 */

#include "utils/config_loader.h"
#include "utils/logger.h"
#include "utils/validation.h"
#include "errors.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>

namespace btd6_pilot {

using json = nlohmann::json;

namespace {

json readJsonFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.good()) {
        throw ConfigurationError("Cannot open config file: " + path, path);
    }
    try {
        return json::parse(file);
    } catch (const std::exception& e) {
        throw ConfigurationError("Error parsing config " + path + ": " + e.what(), path);
    }
}

std::chrono::milliseconds secondsValue(const json& obj, const char* key, std::chrono::milliseconds fallback) {
    if (!obj.contains(key)) return fallback;
    const json& v = obj.at(key);
    if (!v.is_number()) {
        throw ConfigurationError(std::string("Expected seconds for '") + key + "'", key);
    }
    double seconds = v.get<double>();
    if (seconds < 0.0) {
        throw ConfigurationError(std::string("Negative delay for '") + key + "'", key);
    }
    return std::chrono::milliseconds(static_cast<long long>(std::llround(seconds * 1000.0)));
}

Region regionValue(const json& obj, const char* key, const Region& fallback) {
    if (!obj.contains(key)) return fallback;
    try {
        return rectToRegion(obj.at(key).get<std::vector<int>>());
    } catch (const json::exception& e) {
        throw ConfigurationError(std::string("Invalid rectangle for '") + key + "': " + e.what(), key);
    }
}

Point pointValue(const json& v) {
    if (v.is_object()) {
        if (!v.contains("x") || !v.contains("y")) {
            throw ConfigurationError("Position object missing 'x' or 'y': " + v.dump(), "position");
        }
        return Point{v.at("x").get<int>(), v.at("y").get<int>()};
    }
    if (v.is_array() && v.size() == 2) {
        return Point{v.at(0).get<int>(), v.at(1).get<int>()};
    }
    throw ConfigurationError("Invalid position format: " + v.dump(), "position");
}

void loadTiming(const json& t, TimingSettings& timing) {
    timing.placementDelay = secondsValue(t, "placement_delay", timing.placementDelay);
    timing.upgradeDelay = secondsValue(t, "upgrade_delay", timing.upgradeDelay);
    timing.clickDelay = secondsValue(t, "click_delay", timing.clickDelay);
    timing.pauseBetweenActions = secondsValue(t, "pause_between_actions", timing.pauseBetweenActions);
}

/**
 * @brief Build one action; returns false and fills errorMessage when the entry is malformed
 */
bool parseAction(const json& entry, const ScreenBounds& bounds, Action& out, std::string& errorMessage) {
    errorMessage.clear();
    if (!entry.is_object()) {
        errorMessage = "action entry is not an object";
        return false;
    }

    const int step = entry.value("step", 0);
    const std::string kind = entry.value("action", "");
    const std::string target = entry.value("target", "");

    if (kind == "buy") {
        if (target.empty() || !entry.contains("position")) {
            errorMessage = "buy action missing target or position";
            return false;
        }
        BuyAction buy;
        buy.step = step;
        buy.target = target;
        try {
            buy.position = pointValue(entry.at("position"));
            validateCoordinates(buy.position, bounds, target);
        } catch (const std::exception& e) {
            errorMessage = e.what();
            return false;
        }
        if (entry.contains("hotkey") && entry.at("hotkey").is_string()) {
            buy.hotkey = entry.at("hotkey").get<std::string>();
        }
        out = buy;
        return true;
    }

    if (kind == "upgrade") {
        if (target.empty() || !entry.contains("upgrade_path") || !entry.at("upgrade_path").is_object()) {
            errorMessage = "missing target or upgrade_path";
            return false;
        }
        const json& up = entry.at("upgrade_path");
        if (up.size() != 1) {
            errorMessage = "must specify exactly one path";
            return false;
        }
        auto it = up.begin();
        auto path = parsePathKey(it.key());
        if (!path) {
            errorMessage = "Invalid path key '" + it.key() + "'";
            return false;
        }
        if (!it.value().is_number_integer()) {
            errorMessage = "tier for " + it.key() + " is not an integer";
            return false;
        }
        UpgradeAction upgrade;
        upgrade.step = step;
        upgrade.target = target;
        upgrade.path = *path;
        upgrade.tier = it.value().get<int>();
        out = upgrade;
        return true;
    }

    errorMessage = "unknown action kind '" + kind + "'";
    return false;
}

std::vector<Action> loadActionList(const json& config, const char* key, const ScreenBounds& bounds) {
    std::vector<Action> actions;
    if (!config.contains(key)) return actions;
    const json& list = config.at(key);
    if (!list.is_array()) {
        throw ConfigurationError(std::string("'") + key + "' must be an array", key);
    }
    for (const auto& entry : list) {
        Action action;
        std::string err;
        if (parseAction(entry, bounds, action, err)) {
            actions.push_back(action);
        } else {
            logWarning(std::string("Dropping ") + key + " entry " + entry.dump() + ": " + err);
        }
    }
    std::stable_sort(actions.begin(), actions.end(), [](const Action& a, const Action& b) {
        return actionStep(a) < actionStep(b);
    });
    return actions;
}

} // namespace

Region rectToRegion(const std::vector<int>& rect) {
    if (rect.size() != 4) {
        throw ConfigurationError("Rectangle must have 4 values [x1, y1, x2, y2]", "region");
    }
    Region r{rect[0], rect[1], rect[2] - rect[0], rect[3] - rect[1]};
    if (r.width <= 0 || r.height <= 0) {
        throw ConfigurationError("Invalid rectangle: x2 <= x1 or y2 <= y1 " + formatRegion(r), "region");
    }
    return r;
}

GlobalConfig loadGlobalConfig(const std::string& path) {
    GlobalConfig cfg;
    json root = readJsonFile(path);
    if (!root.is_object()) {
        throw ConfigurationError("Global config must be a JSON object: " + path, path);
    }

    try {
        cfg.windowTitle = root.value("window_title", cfg.windowTitle);
        cfg.defaultMap = root.value("default_map", cfg.defaultMap);

        if (root.contains("screen")) {
            const json& s = root.at("screen");
            cfg.screen.width = s.value("width", cfg.screen.width);
            cfg.screen.height = s.value("height", cfg.screen.height);
        }

        cfg.hotkeys.heroKey = root.value("hero_key", cfg.hotkeys.heroKey);
        cfg.hotkeys.defaultMonkeyKey = root.value("default_monkey_key", cfg.hotkeys.defaultMonkeyKey);
        cfg.hotkeys.killSwitchKey = root.value("kill_switch_key", cfg.hotkeys.killSwitchKey);
        if (root.contains("hotkey")) {
            const json& h = root.at("hotkey");
            for (int i = 0; i < kPathCount; ++i) {
                const std::string key = "upgrade_path_" + std::to_string(i + 1);
                cfg.hotkeys.upgradePath[i] = h.value(key, cfg.hotkeys.upgradePath[i]);
            }
        }

        if (root.contains("automation")) {
            const json& a = root.at("automation");
            cfg.logLevel = a.value("logging_level", cfg.logLevel);
            cfg.logFile = a.value("log_file", cfg.logFile);
            if (a.contains("timing")) loadTiming(a.at("timing"), cfg.timing);
            if (a.contains("retries")) {
                const json& r = a.at("retries");
                cfg.retries.maxRetries = r.value("max_retries", cfg.retries.maxRetries);
                cfg.retries.retryDelay = secondsValue(r, "retry_delay", cfg.retries.retryDelay);
                cfg.retries.backoffFactor = r.value("backoff_factor", cfg.retries.backoffFactor);
                cfg.retries.maxDelay = secondsValue(r, "max_delay", cfg.retries.maxDelay);
            }
        }

        if (root.contains("vision")) {
            const json& v = root.at("vision");
            VisionSettings& vs = cfg.vision;
            vs.maxAttempts = v.value("max_attempts", vs.maxAttempts);
            vs.selectThreshold = v.value("select_threshold", vs.selectThreshold);
            vs.placeThreshold = v.value("place_threshold", vs.placeThreshold);
            vs.upgradeThreshold = v.value("upgrade_threshold", vs.upgradeThreshold);
            vs.pixelDelta = v.value("pixel_delta", vs.pixelDelta);
            vs.selectRegion = regionValue(v, "select_region", vs.selectRegion);
            vs.placeRegion1 = regionValue(v, "place_region_1", vs.placeRegion1);
            vs.placeRegion2 = regionValue(v, "place_region_2", vs.placeRegion2);
            if (v.contains("cursor_resting_spot")) {
                vs.cursorRestingSpot = pointValue(v.at("cursor_resting_spot"));
            }
            vs.captureRetries = v.value("capture_retries", vs.captureRetries);
            vs.captureRetryDelay = secondsValue(v, "capture_retry_delay", vs.captureRetryDelay);
            vs.currencyRegion = regionValue(v, "currency_region", vs.currencyRegion);
            vs.currencyPollInterval = secondsValue(v, "currency_poll_interval", vs.currencyPollInterval);
            vs.debugImages = v.value("debug_images", vs.debugImages);
            vs.debugDir = v.value("debug_dir", vs.debugDir);
        }

        if (root.contains("map_start")) {
            const json& m = root.at("map_start");
            MapStartSettings& ms = cfg.mapStart;
            ms.enabled = m.value("enabled", ms.enabled);
            ms.imageDir = m.value("image_dir", ms.imageDir);
            ms.matchThreshold = m.value("match_threshold", ms.matchThreshold);
            ms.findAttempts = m.value("find_attempts", ms.findAttempts);
            ms.findDelay = secondsValue(m, "find_delay", ms.findDelay);
            ms.clickDelay = secondsValue(m, "click_delay", ms.clickDelay);
        }

        if (root.contains("profile")) {
            const json& p = root.at("profile");
            cfg.profile.enabled = p.value("enabled", cfg.profile.enabled);
            cfg.profile.jsonPath = p.value("json", cfg.profile.jsonPath);
            cfg.profile.summaryPath = p.value("summary", cfg.profile.summaryPath);
        }

        if (root.contains("map_filenames")) {
            for (const auto& kv : root.at("map_filenames").items()) {
                cfg.mapFilenames[kv.key()] = kv.value().get<std::string>();
            }
        }
    } catch (const json::exception& e) {
        throw ConfigurationError("Invalid value in " + path + ": " + e.what(), path);
    }

    if (cfg.vision.maxAttempts < 1) {
        throw ConfigurationError("vision.max_attempts must be at least 1", "vision.max_attempts");
    }
    if (cfg.retries.maxRetries < 1) {
        throw ConfigurationError("automation.retries.max_retries must be at least 1", "max_retries");
    }
    if (cfg.retries.backoffFactor < 1.0) {
        throw ConfigurationError("automation.retries.backoff_factor must be >= 1", "backoff_factor");
    }

    if (cfg.mapStart.matchThreshold <= 0.0 || cfg.mapStart.matchThreshold > 1.0) {
        throw ConfigurationError("map_start.match_threshold must be in (0, 1]", "match_threshold");
    }
    if (cfg.mapStart.findAttempts < 1) {
        throw ConfigurationError("map_start.find_attempts must be at least 1", "find_attempts");
    }

    validateRegion(cfg.vision.selectRegion, cfg.screen, "select_region");
    validateRegion(cfg.vision.placeRegion1, cfg.screen, "place_region_1");
    validateRegion(cfg.vision.placeRegion2, cfg.screen, "place_region_2");
    validateRegion(cfg.vision.currencyRegion, cfg.screen, "currency_region");
    validateCoordinates(cfg.vision.cursorRestingSpot, cfg.screen, "cursor_resting_spot");
    for (const auto& key : cfg.hotkeys.upgradePath) validateKey(key, "hotkey.upgrade_path");
    validateKey(cfg.hotkeys.heroKey, "hero_key");
    validateKey(cfg.hotkeys.defaultMonkeyKey, "default_monkey_key");
    validateKey(cfg.hotkeys.killSwitchKey, "kill_switch_key");

    return cfg;
}

MapConfig loadMapConfig(const std::string& path, const ScreenBounds& bounds) {
    MapConfig cfg;
    json root = readJsonFile(path);
    if (!root.is_object()) {
        throw ConfigurationError("Map config must be a JSON object: " + path, path);
    }

    try {
        cfg.mapName = root.value("map_name", "");
        cfg.game.difficulty = root.value("difficulty", cfg.game.difficulty);
        cfg.game.mode = root.value("mode", cfg.game.mode);

        if (root.contains("hero")) {
            const json& h = root.at("hero");
            cfg.hero.name = h.value("name", "");
            cfg.hero.hotkey = h.value("hotkey", "");
            if (h.contains("position")) {
                Point p = pointValue(h.at("position"));
                validateCoordinates(p, bounds, "hero " + cfg.hero.name);
                cfg.hero.position = p;
            }
        }

        if (root.contains("timing")) {
            TimingSettings t;
            loadTiming(root.at("timing"), t);
            cfg.timing = t;
        }

        cfg.prePlayActions = loadActionList(root, "pre_play_actions", bounds);
        cfg.actions = loadActionList(root, "actions", bounds);
    } catch (const json::exception& e) {
        throw ConfigurationError("Invalid value in " + path + ": " + e.what(), path);
    }

    if (cfg.mapName.empty()) {
        throw ConfigurationError("Map config missing 'map_name': " + path, "map_name");
    }
    return cfg;
}

std::string normalizeMapName(const std::string& displayName) {
    std::string out;
    out.reserve(displayName.size());
    for (char c : displayName) {
        if (c == ' ' || c == '\'') continue;
        out.push_back((char)std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

std::string mapFilenameFor(const GlobalConfig& config, const std::string& displayName) {
    const std::string wanted = normalizeMapName(displayName);
    for (const auto& kv : config.mapFilenames) {
        if (normalizeMapName(kv.second) == wanted) return kv.first;
    }
    throw ConfigurationError("Map display name not found in config: " + displayName, "map_filenames");
}

std::vector<std::string> listMapNames(const GlobalConfig& config) {
    std::vector<std::string> names;
    names.reserve(config.mapFilenames.size());
    for (const auto& kv : config.mapFilenames) names.push_back(kv.second);
    std::sort(names.begin(), names.end());
    return names;
}

} // namespace btd6_pilot
