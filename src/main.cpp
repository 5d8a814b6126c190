/**
 * @file main.cpp
 * @brief BTD6 Pilot - Main entry point
 *
 * Plays a scripted BTD6 map: places the hero and towers and buys upgrades,
 * confirming every input with before/after screen comparison.
 */

#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "capture/screen_capture.h"
#include "control/action_manager.h"
#include "control/automation_runner.h"
#include "control/currency_reader.h"
#include "control/kill_switch.h"
#include "control/map_starter.h"
#include "errors.h"
#include "game/tower_catalog.h"
#include "input/input_controller.h"
#include "types.h"
#include "utils/config_loader.h"
#include "utils/logger.h"
#include "utils/profiler.h"
#include "vision/currency_ocr.h"
#include "vision/debug_images.h"
#include "vision/template_locator.h"

namespace fs = std::filesystem;

using namespace btd6_pilot;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitConfig = 1;
constexpr int kExitFatal = 2;

const char* const kFallbackMap = "Monkey Meadow";

// Cancelled by SIGINT/SIGTERM and by the kill-switch hotkey
CancellationToken g_cancel;

} // anonymous namespace

void signalHandler(int signal) {
    (void)signal;
    g_cancel.requestStop();
}

void printBanner() {
    std::cout << R"(
╔═══════════════════════════════════════════════════════════════╗
║         BTD6 Pilot v1.0                                       ║
║         Vision-confirmed placement and upgrades               ║
╚═══════════════════════════════════════════════════════════════╝
)" << std::endl;
}

void printUsage(const char* programName) {
    std::cout << "Usage: " << programName << " [options]\n\n"
              << "Options:\n"
              << "  --config-dir <dir>      Config directory with global.json and maps/ (default: config)\n"
              << "  --towers <path>         Tower catalog (default: data/btd6_towers.json)\n"
              << "  --map <name>            Map display name (default: default_map from global.json)\n"
              << "  --start-map             Click Play, map, difficulty and mode from the home screen first\n"
              << "  --verbose               Force DEBUG logging\n"
              << "  --profile               Record per-operation timings\n"
              << "  --profile-json <path>   Write profile rows as JSON (implies --profile)\n"
              << "  --profile-summary <path> Write p50/p90/p99 summary (implies --profile)\n"
              << "  --list-maps             List configured maps and exit\n"
              << "  --dry-run               Load and validate everything, print the plan, send no input\n"
              << "  --help, -h              Show this help\n\n"
              << "Exit codes: 0 completed or cancelled, 1 configuration error, 2 fatal run error\n";
}

static std::string resolvePathWithFallbacks(const std::string& path) {
    if (path.empty()) return path;
    if (fs::exists(path)) return path;

    // Common when running from build/ or build\Debug/Release.
    const std::string up1 = std::string("../") + path;
    if (fs::exists(up1)) return up1;

    const std::string up2 = std::string("../../") + path;
    if (fs::exists(up2)) return up2;

    return path;
}

static MapConfig loadMapByName(const GlobalConfig& config, const std::string& configDir,
                               const std::string& displayName) {
    const std::string file = mapFilenameFor(config, displayName);
    return loadMapConfig((fs::path(configDir) / "maps" / file).string(), config.screen);
}

static void printPlan(const MapConfig& map) {
    std::cout << "Map:        " << map.mapName << "\n"
              << "Difficulty: " << map.game.difficulty << "\n"
              << "Mode:       " << map.game.mode << "\n";
    if (map.hero.position) {
        std::cout << "Hero:       " << (map.hero.name.empty() ? "(unnamed)" : map.hero.name)
                  << " at " << formatPoint(*map.hero.position) << "\n";
    }
    std::cout << "\nPre-play actions (" << map.prePlayActions.size() << "):\n";
    for (const Action& a : map.prePlayActions) std::cout << "  " << describeAction(a) << "\n";
    std::cout << "\nActions (" << map.actions.size() << "):\n";
    for (const Action& a : map.actions) std::cout << "  " << describeAction(a) << "\n";
    std::cout << std::endl;
}

int main(int argc, char* argv[]) {
    std::string configDir = "config";
    std::string towersPath = "data/btd6_towers.json";
    std::string mapName;
    std::string profileJson;
    std::string profileSummary;
    bool verbose = false;
    bool profile = false;
    bool listMaps = false;
    bool dryRun = false;
    bool startMap = false;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return kExitOk;
        } else if (arg == "--config-dir" && i + 1 < argc) {
            configDir = argv[++i];
        } else if (arg == "--towers" && i + 1 < argc) {
            towersPath = argv[++i];
        } else if (arg == "--map" && i + 1 < argc) {
            mapName = argv[++i];
        } else if (arg == "--start-map") {
            startMap = true;
        } else if (arg == "--verbose") {
            verbose = true;
        } else if (arg == "--profile") {
            profile = true;
        } else if (arg == "--profile-json" && i + 1 < argc) {
            profileJson = argv[++i];
            profile = true;
        } else if (arg == "--profile-summary" && i + 1 < argc) {
            profileSummary = argv[++i];
            profile = true;
        } else if (arg == "--list-maps") {
            listMaps = true;
        } else if (arg == "--dry-run") {
            dryRun = true;
        } else {
            std::cerr << "Unknown or incomplete option: " << arg << "\n\n";
            printUsage(argv[0]);
            return kExitConfig;
        }
    }

    printBanner();

    // Configuration
    configDir = resolvePathWithFallbacks(configDir);
    towersPath = resolvePathWithFallbacks(towersPath);

    GlobalConfig config;
    try {
        config = loadGlobalConfig((fs::path(configDir) / "global.json").string());
    } catch (const ConfigurationError& e) {
        std::cerr << "ERROR: " << e.describe() << std::endl;
        return kExitConfig;
    }

    setLogLevel(verbose ? LogLevel::DEBUG : parseLogLevel(config.logLevel));
    if (!config.logFile.empty() && !setLogFile(config.logFile)) {
        logWarning("Could not open log file " + config.logFile + "; logging to stdout only");
    }

    if (listMaps) {
        for (const std::string& name : listMapNames(config)) std::cout << "  " << name << "\n";
        return kExitOk;
    }

    if (mapName.empty()) mapName = config.defaultMap;
    MapConfig map;
    try {
        map = loadMapByName(config, configDir, mapName);
    } catch (const ConfigurationError& e) {
        if (mapName == kFallbackMap) {
            logError(e.describe());
            return kExitConfig;
        }
        logWarning("Could not load map '" + mapName + "' (" + e.what() + "); falling back to " + kFallbackMap);
        try {
            map = loadMapByName(config, configDir, kFallbackMap);
        } catch (const ConfigurationError& fallbackError) {
            logError(fallbackError.describe());
            return kExitConfig;
        }
    }

    game::TowerCatalog catalog;
    try {
        catalog = game::TowerCatalog::loadFromFile(towersPath);
    } catch (const ConfigurationError& e) {
        logError(e.describe());
        return kExitConfig;
    }
    logInfo("Loaded " + std::to_string(catalog.size()) + " towers from " + towersPath);

    if (startMap) config.mapStart.enabled = true;

    // Menu templates are loaded up front so a missing image is a configuration error
    vision::TemplateLocator locator(config.mapStart.matchThreshold);
    std::vector<MapStartStep> startSteps;
    if (config.mapStart.enabled) {
        startSteps = mapStartSteps(map);
        const std::string imageDir = resolvePathWithFallbacks(config.mapStart.imageDir);
        const std::vector<std::string> missing = loadMapStartTemplates(locator, startSteps, imageDir);
        if (!missing.empty()) {
            std::string names;
            for (const std::string& name : missing) names += (names.empty() ? "" : ", ") + name + ".png";
            logError("Map start needs button images in " + imageDir + ": " + names);
            return kExitConfig;
        }
    }

    if (dryRun) {
        printPlan(map);
        logInfo("Dry run: configuration valid, no input sent");
        return kExitOk;
    }

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    // Platform collaborators; the background threads get their own backends
    std::shared_ptr<ScreenCapture> captureBackend = createPlatformCapture();
    std::shared_ptr<ScreenCapture> currencyBackend = createPlatformCapture();
    std::shared_ptr<InputController> input = createPlatformInput();
    std::shared_ptr<InputController> killSwitchInput = createPlatformInput();
    std::shared_ptr<GameWindow> window = createPlatformWindow(config.windowTitle);
    if (!captureBackend || !currencyBackend || !input || !killSwitchInput || !window) {
        logError("No screen capture / input backend available on this platform");
        return kExitFatal;
    }

    const VisionSettings& vision = config.vision;
    RetryingCapture capture(captureBackend, vision.captureRetries, vision.captureRetryDelay);
    auto currencyCapture = std::make_shared<RetryingCapture>(currencyBackend, vision.captureRetries,
                                                             vision.captureRetryDelay);

    Profiler profiler(profile || config.profile.enabled);
    vision::DebugImageSink debugImages(vision.debugImages, vision.debugDir);

    CurrencyReader currency(makeScreenCurrencySource(currencyCapture, vision.currencyRegion,
                                                     std::make_shared<vision::CurrencyOcr>()),
                            vision.currencyPollInterval);
    KillSwitchListener killSwitch(killSwitchInput, config.hotkeys.killSwitchKey, g_cancel);

    AutomationContext ctx{capture, *input, config, catalog};
    ctx.profiler = profiler.enabled() ? &profiler : nullptr;
    ctx.debugImages = &debugImages;

    ActionManager actions(map, ctx);
    AutomationRunner runner(actions, *window, capture,
                            [&currency]() { return currency.getCurrency(); },
                            g_cancel,
                            RunnerOptions::fromSettings(config, actions.timing()),
                            config.screen);

    MapStarter starter(capture, *input, locator, config.screen, config.mapStart);
    if (config.mapStart.enabled) runner.enableMapStart(starter, startSteps);

    currency.start();
    killSwitch.start();

    RunStatus status = RunStatus::Fatal;
    std::string fatalError;
    try {
        status = runner.run();
        if (status == RunStatus::Fatal) fatalError = runner.lastError();
    } catch (const std::exception& e) {
        fatalError = std::string("unexpected error: ") + e.what();
        logError(fatalError);
    }

    killSwitch.stop();
    currency.stop();

    if (profiler.enabled()) {
        if (profileJson.empty()) profileJson = config.profile.jsonPath;
        if (profileSummary.empty()) profileSummary = config.profile.summaryPath;
        profiler.flush(profileJson, profileSummary);
    }

    const CaptureStats stats = capture.getStats();
    const RunStats& run = runner.stats();
    logInfo(std::string("Run finished: ") + toString(status) +
            " | dispatched " + std::to_string(run.dispatched) +
            ", completed " + std::to_string(run.completed) +
            ", rejected " + std::to_string(run.rejected) +
            ", upgrade failures " + std::to_string(run.upgradeFailures) +
            " | captures " + std::to_string(stats.requests) +
            " (" + std::to_string(stats.failures) + " failed)");

    switch (status) {
        case RunStatus::Completed:
        case RunStatus::Cancelled:
            return kExitOk;
        case RunStatus::Fatal:
            break;
    }
    std::cerr << "FATAL: " << fatalError << std::endl;
    return kExitFatal;
}
