/**
 * @file image_comparator.cpp
 * @brief Pixel-difference scoring
 */

#include "vision/image_comparator.h"

#include <opencv2/imgproc.hpp>

#include <vector>

namespace btd6_pilot::vision {

bool sameShape(const cv::Mat& a, const cv::Mat& b) {
    if (a.empty() || b.empty()) return false;
    return a.rows == b.rows && a.cols == b.cols && a.type() == b.type();
}

double percentDifference(const cv::Mat& a, const cv::Mat& b, int pixelDelta) {
    if (!sameShape(a, b)) return kMaxDifference;

    cv::Mat diff;
    cv::absdiff(a, b, diff);

    // Per-pixel maximum over channels
    cv::Mat maxDiff;
    if (diff.channels() == 1) {
        maxDiff = diff;
    } else {
        std::vector<cv::Mat> planes;
        cv::split(diff, planes);
        maxDiff = planes[0].clone();
        for (size_t i = 1; i < planes.size(); ++i) {
            cv::max(maxDiff, planes[i], maxDiff);
        }
    }

    cv::Mat changed = maxDiff > (pixelDelta < 0 ? 0 : pixelDelta);
    const double total = static_cast<double>(a.rows) * a.cols;
    return 100.0 * cv::countNonZero(changed) / total;
}

ConfirmResult confirmChange(const cv::Mat& pre, const cv::Mat& post, double threshold, int pixelDelta) {
    ConfirmResult r;
    r.comparable = sameShape(pre, post);
    r.percent = percentDifference(pre, post, pixelDelta);
    r.confirmed = r.comparable && r.percent >= threshold;
    return r;
}

ConfirmFn makeConfirmFn(int pixelDelta) {
    return [pixelDelta](const cv::Mat& pre, const cv::Mat& post, double threshold) {
        return confirmChange(pre, post, threshold, pixelDelta).confirmed;
    };
}

bool isMostlyBlack(const cv::Mat& image, double fraction, int blackLevel) {
    if (image.empty()) return false;
    cv::Mat gray;
    if (image.channels() == 1) {
        gray = image;
    } else if (image.channels() == 4) {
        cv::cvtColor(image, gray, cv::COLOR_BGRA2GRAY);
    } else {
        cv::cvtColor(image, gray, cv::COLOR_BGR2GRAY);
    }
    const double total = static_cast<double>(gray.rows) * gray.cols;
    const int dark = cv::countNonZero(gray < blackLevel);
    return dark / total >= fraction;
}

} // namespace btd6_pilot::vision
