/**
 * @file automation_runner.cpp
 * @brief Run loop and error classification
 */

#include "control/automation_runner.h"
#include "errors.h"
#include "utils/logger.h"
#include "vision/image_comparator.h"

#include <exception>

namespace btd6_pilot {

const char* toString(RunStatus status) {
    switch (status) {
        case RunStatus::Completed: return "Completed";
        case RunStatus::Cancelled: return "Cancelled";
        case RunStatus::Fatal:     return "Fatal";
    }
    return "?";
}

RunnerOptions RunnerOptions::fromSettings(const GlobalConfig& config, const TimingSettings& timing) {
    RunnerOptions o;
    o.windowPolicy = RetryPolicy::fromSettings(config.retries);
    o.pauseBetweenActions = timing.pauseBetweenActions;
    return o;
}

AutomationRunner::AutomationRunner(ActionManager& actions,
                                   GameWindow& window,
                                   RetryingCapture& capture,
                                   CurrencyGetter currency,
                                   CancellationToken& token,
                                   RunnerOptions options,
                                   const ScreenBounds& screen,
                                   SleepFn sleep)
    : m_actions(actions)
    , m_window(window)
    , m_capture(capture)
    , m_currency(std::move(currency))
    , m_token(token)
    , m_options(std::move(options))
    , m_screen(screen)
    , m_sleep(std::move(sleep)) {}

RunStatus AutomationRunner::fatal(const std::string& message) {
    m_lastError = message;
    logError("Fatal: " + message + "; stopping run");
    return RunStatus::Fatal;
}

bool AutomationRunner::activateWindow() {
    try {
        runWithRetry<bool>(m_options.windowPolicy, "window_activation",
                           [this]() -> std::optional<bool> {
                               if (m_window.activate()) return true;
                               return std::nullopt;
                           },
                           m_sleep);
        return true;
    } catch (const RetryExhaustedError& e) {
        logError(e.what());
        return false;
    }
}

void AutomationRunner::waitForGameScreen() {
    const Region screen{0, 0, m_screen.width, m_screen.height};
    for (int check = 0; check < m_options.loadingScreenChecks; ++check) {
        if (m_token.stopRequested()) return;
        std::optional<cv::Mat> frame = m_capture.captureRegion(screen);
        if (!frame || !vision::isMostlyBlack(*frame)) return;
        if (check == 0) logInfo("Waiting for the loading screen to clear");
        m_sleep(m_options.loadingScreenDelay);
    }
    logWarning("Screen still dark after " + std::to_string(m_options.loadingScreenChecks) +
               " checks; continuing");
}

void AutomationRunner::reject(int step, const UpgradeStateError& error) {
    logWarning(error.describe());
    m_actions.markRejected(step);
    ++m_stats.rejected;
}

void AutomationRunner::dispatch(const Action& action) {
    const int step = actionStep(action);
    ++m_stats.dispatched;
    try {
        if (m_actions.execute(action)) ++m_stats.completed;
    } catch (const UpgradeStateError& e) {
        reject(step, e);
    } catch (const UpgradeVerificationError& e) {
        logError(e.describe() + "; step " + std::to_string(step) + " will be retried");
        ++m_stats.upgradeFailures;
    }
}

RunStatus AutomationRunner::run() {
    if (m_token.stopRequested()) return RunStatus::Cancelled;

    logInfo("Starting run on " + m_actions.mapConfig().mapName + " (" +
            m_actions.mapConfig().game.difficulty + ", " + m_actions.mapConfig().game.mode + ")");

    if (!activateWindow()) {
        return fatal(WindowError(m_window.title()).what());
    }

    try {
        if (m_mapStarter && !m_mapStarter->start(m_mapStartSteps, m_token)) {
            logWarning("Run cancelled while starting the map");
            return RunStatus::Cancelled;
        }
        waitForGameScreen();
        m_actions.runPrePlay();

        while (!m_token.stopRequested()) {
            const Action* next = m_actions.getNextAction();
            if (!next) {
                logInfo("All steps done: " + std::to_string(m_stats.completed) + " completed, " +
                        std::to_string(m_stats.rejected) + " rejected");
                return RunStatus::Completed;
            }
            ++m_stats.passes;

            // Invalid upgrades have no cost and would never become affordable
            try {
                m_actions.validate(*next);
            } catch (const UpgradeStateError& e) {
                reject(actionStep(*next), e);
                continue;
            }

            const int money = m_currency ? m_currency() : 0;
            if (!m_actions.canAfford(money, *next)) {
                ++m_stats.unaffordable;
                logDebug("Waiting for cash: $" + std::to_string(money) + " for " + describeAction(*next));
                m_sleep(m_options.pauseBetweenActions);
                continue;
            }

            dispatch(*next);
            m_sleep(m_options.pauseBetweenActions);
        }
    } catch (const MapStartError& e) {
        return fatal("map did not start: " + e.describe());
    } catch (const PlacementError& e) {
        return fatal("unconfirmed placement, field state unknown: " + e.describe());
    } catch (const AutomationError& e) {
        return fatal(e.describe());
    } catch (const std::exception& e) {
        return fatal(std::string("unexpected error: ") + e.what());
    }

    logWarning("Run cancelled with " + std::to_string(m_actions.stepsRemaining()) + " steps remaining");
    return RunStatus::Cancelled;
}

} // namespace btd6_pilot
