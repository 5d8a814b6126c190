#pragma once
/**
 * @file region_targeting.h
 * @brief Click a screen point and confirm the change in any of several regions
 *
 * The placement/upgrade panel opens on the left or right side of the screen
 * depending on where the tower sits, so the click is confirmed if ANY
 * candidate region changes relative to its own pre-image.
 */

#include "control/retry_executor.h"
#include "input/input_controller.h"

#include <opencv2/core.hpp>

#include <vector>

namespace btd6_pilot {

struct TargetingResult {
    bool success = false;
    int regionIndex = -1;       ///< Region that confirmed, -1 on failure
    int attempts = 0;           ///< Clicks performed
    double percent = 0.0;       ///< Difference in the confirming region
    cv::Mat preImage;           ///< Confirming region before the first click
    cv::Mat postImage;          ///< Confirming region after the confirming click
};

class RegionTargeting {
public:
    RegionTargeting(RetryExecutor& executor, InputController& input);

    /**
     * @brief Click `coords` up to maxAttempts times until any region confirms
     *
     * Pre-images are captured once, before the first click. Each attempt
     * re-captures every region; a failed capture in one region does not stop
     * evaluation of the others.
     */
    TargetingResult tryTargeting(const Point& coords,
                                 const std::vector<Region>& regions,
                                 double threshold,
                                 int maxAttempts,
                                 std::chrono::milliseconds delay,
                                 const vision::ConfirmFn& confirm,
                                 int pixelDelta = 0);

    /**
     * @brief Two-region form (left / right panel)
     */
    TargetingResult tryTargeting(const Point& coords,
                                 const Region& regionA,
                                 const Region& regionB,
                                 double threshold,
                                 int maxAttempts,
                                 std::chrono::milliseconds delay,
                                 const vision::ConfirmFn& confirm,
                                 int pixelDelta = 0) {
        return tryTargeting(coords, std::vector<Region>{regionA, regionB},
                            threshold, maxAttempts, delay, confirm, pixelDelta);
    }

private:
    RetryExecutor& m_executor;
    InputController& m_input;
};

} // namespace btd6_pilot
