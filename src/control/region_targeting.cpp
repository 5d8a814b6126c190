/**
 * @file region_targeting.cpp
 * @brief Multi-region OR confirmation of a click
 */

#include "control/region_targeting.h"
#include "errors.h"
#include "utils/logger.h"

#include <optional>

namespace btd6_pilot {

RegionTargeting::RegionTargeting(RetryExecutor& executor, InputController& input)
    : m_executor(executor), m_input(input) {}

TargetingResult RegionTargeting::tryTargeting(const Point& coords,
                                              const std::vector<Region>& regions,
                                              double threshold,
                                              int maxAttempts,
                                              std::chrono::milliseconds delay,
                                              const vision::ConfirmFn& confirm,
                                              int pixelDelta) {
    TargetingResult result;
    RetryingCapture& capture = m_executor.capture();

    std::vector<std::optional<cv::Mat>> pre;
    pre.reserve(regions.size());
    bool anyPre = false;
    for (size_t i = 0; i < regions.size(); ++i) {
        pre.push_back(capture.captureRegion(regions[i]));
        if (pre.back()) {
            anyPre = true;
        } else {
            logWarning("Targeting: pre-image of region " + std::to_string(i) + " " +
                       formatRegion(regions[i]) + " unavailable");
        }
    }
    if (!anyPre) {
        // Clicking without any baseline could never be confirmed
        logError("Targeting at " + formatPoint(coords) + ": no region could be captured");
        return result;
    }

    for (int attempt = 1; attempt <= maxAttempts; ++attempt) {
        result.attempts = attempt;
        m_input.moveAndClick(coords);
        m_executor.sleep(delay);

        for (size_t i = 0; i < regions.size(); ++i) {
            if (!pre[i]) continue;
            std::optional<cv::Mat> post = capture.captureRegion(regions[i]);
            if (!post) {
                logWarning("Targeting: post-image of region " + std::to_string(i) + " unavailable (attempt " +
                           std::to_string(attempt) + ")");
                continue;
            }
            const double percent = vision::percentDifference(*pre[i], *post, pixelDelta);
            if (confirm(*pre[i], *post, threshold)) {
                result.success = true;
                result.regionIndex = static_cast<int>(i);
                result.percent = percent;
                result.preImage = *pre[i];
                result.postImage = *post;
                logDebug("Targeting at " + formatPoint(coords) + " confirmed in region " + std::to_string(i) +
                         " (" + std::to_string(percent) + "%) on attempt " + std::to_string(attempt));
                return result;
            }
            logDebug("Targeting region " + std::to_string(i) + " diff " + std::to_string(percent) +
                     "% < " + std::to_string(threshold) + "%");
            if (auto* sink = m_executor.debugImages()) {
                sink->saveComparison("targeting_region" + std::to_string(i) + "_attempt" + std::to_string(attempt),
                                     *pre[i], *post);
            }
        }
    }

    logWarning("Targeting at " + formatPoint(coords) + " not confirmed after " +
               std::to_string(maxAttempts) + " attempts");
    return result;
}

} // namespace btd6_pilot
