#pragma once
/**
 * @file types.h
 * @brief Common type definitions for the BTD6 pilot
 */

#include <array>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace btd6_pilot {

/**
 * @brief Screen coordinate in pixels
 */
struct Point {
    int x = 0;
    int y = 0;

    bool operator==(const Point& o) const { return x == o.x && y == o.y; }
    bool operator!=(const Point& o) const { return !(*this == o); }
};

/**
 * @brief Rectangular screen area used for before/after comparison
 */
struct Region {
    int left = 0;       ///< Top-left X coordinate
    int top = 0;        ///< Top-left Y coordinate
    int width = 0;      ///< Width in pixels
    int height = 0;     ///< Height in pixels

    bool isValid() const { return width > 0 && height > 0 && left >= 0 && top >= 0; }
    int right() const { return left + width; }
    int bottom() const { return top + height; }

    bool operator==(const Region& o) const {
        return left == o.left && top == o.top && width == o.width && height == o.height;
    }
};

/**
 * @brief Display size used to bounds-check coordinates and regions
 */
struct ScreenBounds {
    int width = 1920;
    int height = 1080;
};

// =============================================================================
// Actions
// =============================================================================

/**
 * @brief One of the three independent upgrade paths of a tower
 */
enum class UpgradePath {
    Path1 = 0,
    Path2 = 1,
    Path3 = 2
};

constexpr int kMaxTier = 5;
constexpr int kPathCount = 3;

/**
 * @brief "path_1" / "path_2" / "path_3"
 */
std::string pathKey(UpgradePath path);

/**
 * @brief Parse a path key; nullopt for anything but path_1..path_3
 */
std::optional<UpgradePath> parsePathKey(const std::string& key);

/**
 * @brief Place a tower at a fixed position
 */
struct BuyAction {
    int step = 0;                       ///< Ordering key (not unique)
    std::string target;                 ///< Display name, e.g. "Dart Monkey 01"
    Point position;                     ///< Where to drop the tower
    std::optional<std::string> hotkey;  ///< Overrides the catalog hotkey
};

/**
 * @brief Raise one path of a placed tower to a target tier
 */
struct UpgradeAction {
    int step = 0;
    std::string target;
    UpgradePath path = UpgradePath::Path1;
    int tier = 0;                       ///< Requested tier, 1..5
};

using Action = std::variant<BuyAction, UpgradeAction>;

int actionStep(const Action& action);
const std::string& actionTarget(const Action& action);
std::string describeAction(const Action& action);

/**
 * @brief Tier per path for one tower, all zero until upgraded
 */
struct UpgradeTiers {
    std::array<int, kPathCount> tiers{{0, 0, 0}};

    int get(UpgradePath path) const { return tiers[static_cast<size_t>(path)]; }
    void set(UpgradePath path, int tier) { tiers[static_cast<size_t>(path)] = tier; }

    bool operator==(const UpgradeTiers& o) const { return tiers == o.tiers; }
};

// =============================================================================
// Configuration
// =============================================================================

/**
 * @brief Hero placement from the map config
 */
struct HeroConfig {
    std::string name;
    std::optional<Point> position;
    std::string hotkey;
};

/**
 * @brief Delays in the game's input/render loop
 */
struct TimingSettings {
    std::chrono::milliseconds placementDelay{500};
    std::chrono::milliseconds upgradeDelay{500};
    std::chrono::milliseconds clickDelay{200};
    std::chrono::milliseconds pauseBetweenActions{100};
};

/**
 * @brief Retry budget for upgrade verification and other policy-driven retries
 */
struct RetrySettings {
    int maxRetries = 3;
    std::chrono::milliseconds retryDelay{500};
    double backoffFactor = 1.0;
    std::chrono::milliseconds maxDelay{5000};
};

/**
 * @brief Regions and thresholds for visual confirmation
 */
struct VisionSettings {
    int maxAttempts = 3;
    double selectThreshold = 40.0;      ///< % change for a selection highlight
    double placeThreshold = 85.0;       ///< % change for a placement / targeting
    double upgradeThreshold = 15.0;     ///< % change for an upgrade overlay
    int pixelDelta = 0;                 ///< Per-pixel intensity tolerance

    Region selectRegion{925, 800, 210, 150};
    Region placeRegion1{35, 65, 380, 875};
    Region placeRegion2{1260, 60, 375, 880};
    Point cursorRestingSpot{1035, 1050};

    int captureRetries = 3;
    std::chrono::milliseconds captureRetryDelay{50};

    Region currencyRegion{367, 15, 148, 55};
    std::chrono::milliseconds currencyPollInterval{500};

    bool debugImages = false;
    std::string debugDir = "screenshots";
};

/**
 * @brief Upgrade hotkeys per path
 */
struct HotkeySettings {
    std::array<std::string, kPathCount> upgradePath{{",", ".", "/"}};
    std::string heroKey = "u";
    std::string defaultMonkeyKey = "q";
    std::string killSwitchKey = "esc";

    const std::string& upgradeKey(UpgradePath path) const {
        return upgradePath[static_cast<size_t>(path)];
    }
};

/**
 * @brief Menu navigation from the home screen into the map
 *
 * Button templates are screenshots taken at the game's resolution and
 * stored as <imageDir>/<template>.png.
 */
struct MapStartSettings {
    bool enabled = false;
    std::string imageDir = "data/images";
    double matchThreshold = 0.85;
    int findAttempts = 5;                       ///< Screen grabs per button
    std::chrono::milliseconds findDelay{1000};
    std::chrono::milliseconds clickDelay{1000}; ///< Menu transition after each click
};

struct ProfileSettings {
    bool enabled = false;
    std::string jsonPath;
    std::string summaryPath;
};

/**
 * @brief Process-wide settings loaded once at startup
 */
struct GlobalConfig {
    std::string windowTitle = "BloonsTD6";
    std::string defaultMap = "Monkey Meadow";
    ScreenBounds screen;
    std::string logLevel = "INFO";
    std::string logFile;
    TimingSettings timing;
    RetrySettings retries;
    VisionSettings vision;
    HotkeySettings hotkeys;
    MapStartSettings mapStart;
    ProfileSettings profile;
    std::unordered_map<std::string, std::string> mapFilenames;  ///< file -> display name
};

/**
 * @brief Difficulty/mode pair that selects a cost column
 */
struct GameSettings {
    std::string difficulty = "Medium";
    std::string mode = "Standard";
};

/**
 * @brief One map's opening and main action plan
 */
struct MapConfig {
    std::string mapName;
    GameSettings game;
    HeroConfig hero;
    std::vector<Action> prePlayActions;
    std::vector<Action> actions;
    std::optional<TimingSettings> timing;   ///< Overrides global timing when set
};

} // namespace btd6_pilot
