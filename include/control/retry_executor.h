#pragma once
/**
 * @file retry_executor.h
 * @brief Perform an action, capture before/after, confirm, retry
 */

#include "capture/screen_capture.h"
#include "types.h"
#include "utils/timer.h"
#include "vision/debug_images.h"
#include "vision/image_comparator.h"

#include <chrono>
#include <functional>
#include <string>

namespace btd6_pilot {

/**
 * @brief Generic retry-and-confirm loop
 *
 * Each attempt: capture pre-image, run the action, wait `delay`, capture the
 * post-image, evaluate the confirmation predicate. The action is re-performed
 * on every attempt since the game sometimes drops the first synthetic input.
 * Capture failures only fail the current attempt.
 */
class RetryExecutor {
public:
    /**
     * @param debugImages Optional sink for unconfirmed pre/post pairs (may be null)
     */
    RetryExecutor(RetryingCapture& capture, SleepFn sleep = realSleep,
                  vision::DebugImageSink* debugImages = nullptr);

    /**
     * @return true on the first confirmed attempt
     */
    bool retryConfirm(const std::function<void()>& action,
                      const Region& region,
                      double threshold,
                      int maxAttempts,
                      std::chrono::milliseconds delay,
                      const vision::ConfirmFn& confirm,
                      const std::string& label = "retry_confirm");

    /**
     * @brief Attempts used by the last retryConfirm call
     */
    int lastAttempts() const { return m_lastAttempts; }

    RetryingCapture& capture() { return m_capture; }
    void sleep(std::chrono::milliseconds d) const { m_sleep(d); }
    vision::DebugImageSink* debugImages() const { return m_debugImages; }

private:
    RetryingCapture& m_capture;
    SleepFn m_sleep;
    vision::DebugImageSink* m_debugImages;
    int m_lastAttempts = 0;
};

} // namespace btd6_pilot
