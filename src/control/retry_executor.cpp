/**
 * @file retry_executor.cpp
 * @brief Retry-and-confirm loop
 */

#include "control/retry_executor.h"
#include "errors.h"
#include "utils/logger.h"

namespace btd6_pilot {

RetryExecutor::RetryExecutor(RetryingCapture& capture, SleepFn sleep, vision::DebugImageSink* debugImages)
    : m_capture(capture)
    , m_sleep(std::move(sleep))
    , m_debugImages(debugImages) {}

bool RetryExecutor::retryConfirm(const std::function<void()>& action,
                                 const Region& region,
                                 double threshold,
                                 int maxAttempts,
                                 std::chrono::milliseconds delay,
                                 const vision::ConfirmFn& confirm,
                                 const std::string& label) {
    m_lastAttempts = 0;
    for (int attempt = 1; attempt <= maxAttempts; ++attempt) {
        m_lastAttempts = attempt;

        std::optional<cv::Mat> pre = m_capture.captureRegion(region);
        if (!pre) {
            logWarning(label + ": pre-image capture failed (attempt " + std::to_string(attempt) +
                       "/" + std::to_string(maxAttempts) + ")");
            m_sleep(delay);
            continue;
        }

        action();
        m_sleep(delay);

        std::optional<cv::Mat> post = m_capture.captureRegion(region);
        if (!post) {
            logWarning(label + ": post-image capture failed (attempt " + std::to_string(attempt) +
                       "/" + std::to_string(maxAttempts) + ")");
            continue;
        }

        if (confirm(*pre, *post, threshold)) {
            logDebug(label + ": confirmed on attempt " + std::to_string(attempt));
            return true;
        }

        logDebug(label + ": " + formatRegion(region) + " diff " +
                 std::to_string(vision::percentDifference(*pre, *post)) + "% below " +
                 std::to_string(threshold) + "% (attempt " + std::to_string(attempt) + ")");
        if (m_debugImages) {
            m_debugImages->saveComparison(label + "_attempt" + std::to_string(attempt), *pre, *post);
        }
    }

    logWarning(label + ": not confirmed after " + std::to_string(maxAttempts) + " attempts");
    return false;
}

} // namespace btd6_pilot
