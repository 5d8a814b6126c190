#pragma once
/**
 * @file image_comparator.h
 * @brief Before/after pixel-difference scoring for action confirmation
 */

#include <opencv2/core.hpp>

#include <functional>

namespace btd6_pilot::vision {

/// Returned for empty or differently shaped inputs
constexpr double kMaxDifference = 100.0;

/**
 * @brief Percentage of pixels that differ between two images
 *
 * A pixel counts as changed when any channel's absolute difference exceeds
 * pixelDelta (0 means any non-zero difference).
 *
 * @return 0..100; kMaxDifference when the images can't be compared
 */
double percentDifference(const cv::Mat& a, const cv::Mat& b, int pixelDelta = 0);

/**
 * @brief Same shape and type, both non-empty
 */
bool sameShape(const cv::Mat& a, const cv::Mat& b);

struct ConfirmResult {
    bool confirmed = false;
    bool comparable = false;    ///< false on empty or mismatched images
    double percent = kMaxDifference;
};

/**
 * @brief confirmed = percent >= threshold; mismatched shapes never confirm
 */
ConfirmResult confirmChange(const cv::Mat& pre, const cv::Mat& post, double threshold, int pixelDelta = 0);

/**
 * @brief Confirmation predicate used by the retry loops
 */
using ConfirmFn = std::function<bool(const cv::Mat& pre, const cv::Mat& post, double threshold)>;

ConfirmFn makeConfirmFn(int pixelDelta = 0);

/**
 * @brief True when at least `fraction` of pixels are darker than blackLevel (loading screens)
 */
bool isMostlyBlack(const cv::Mat& image, double fraction = 0.9, int blackLevel = 30);

} // namespace btd6_pilot::vision
