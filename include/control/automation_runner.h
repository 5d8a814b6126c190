#pragma once
/**
 * @file automation_runner.h
 * @brief Top-level run loop: focus, pre-play, then dispatch until done or cancelled
 */

#include "capture/screen_capture.h"
#include "control/action_manager.h"
#include "control/kill_switch.h"
#include "control/map_starter.h"
#include "control/retry_policy.h"
#include "errors.h"
#include "input/input_controller.h"
#include "types.h"
#include "utils/timer.h"

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace btd6_pilot {

enum class RunStatus {
    Completed,  ///< Every main step completed or rejected
    Cancelled,  ///< Kill switch or signal
    Fatal       ///< Window lost, map not started or a placement could not be confirmed
};

const char* toString(RunStatus status);

/// Latest observed cash
using CurrencyGetter = std::function<int()>;

struct RunnerOptions {
    RetryPolicy windowPolicy;                           ///< Window activation retries
    int loadingScreenChecks = 20;                       ///< 0 disables the loading-screen wait
    std::chrono::milliseconds loadingScreenDelay{500};
    std::chrono::milliseconds pauseBetweenActions{100};

    static RunnerOptions fromSettings(const GlobalConfig& config, const TimingSettings& timing);
};

struct RunStats {
    uint64_t passes = 0;            ///< Loop iterations with an action available
    uint64_t dispatched = 0;
    uint64_t completed = 0;
    uint64_t rejected = 0;
    uint64_t unaffordable = 0;      ///< Passes spent waiting for cash
    uint64_t upgradeFailures = 0;   ///< Recoverable verification failures
};

/**
 * @brief Drives an ActionManager against the live game
 *
 * Error classes:
 *  - PlacementError, MapStartError, window activation failure: Fatal
 *  - any other std::exception: Fatal
 *  - UpgradeStateError: step rejected, run continues
 *  - UpgradeVerificationError: logged, step retried on a later pass
 */
class AutomationRunner {
public:
    AutomationRunner(ActionManager& actions,
                     GameWindow& window,
                     RetryingCapture& capture,
                     CurrencyGetter currency,
                     CancellationToken& token,
                     RunnerOptions options,
                     const ScreenBounds& screen,
                     SleepFn sleep = realSleep);

    /**
     * @brief Navigate from the home screen into the map before pre-play
     *
     * Without this the map must already be running when run() is called.
     */
    void enableMapStart(MapStarter& starter, std::vector<MapStartStep> steps) {
        m_mapStarter = &starter;
        m_mapStartSteps = std::move(steps);
    }

    RunStatus run();

    const RunStats& stats() const { return m_stats; }

    /// Final error text when run() returned Fatal
    const std::string& lastError() const { return m_lastError; }

private:
    bool activateWindow();
    void waitForGameScreen();
    void dispatch(const Action& action);
    void reject(int step, const UpgradeStateError& error);
    RunStatus fatal(const std::string& message);

    ActionManager& m_actions;
    GameWindow& m_window;
    RetryingCapture& m_capture;
    CurrencyGetter m_currency;
    CancellationToken& m_token;
    RunnerOptions m_options;
    ScreenBounds m_screen;
    SleepFn m_sleep;

    MapStarter* m_mapStarter = nullptr;
    std::vector<MapStartStep> m_mapStartSteps;

    RunStats m_stats;
    std::string m_lastError;
};

} // namespace btd6_pilot
