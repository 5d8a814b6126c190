#pragma once
/**
 * @file debug_images.h
 * @brief PNG dumps of unconfirmed before/after captures
 */

#include <opencv2/core.hpp>

#include <string>

namespace btd6_pilot::vision {

/**
 * @brief Writes pre/post pairs under a directory when enabled
 *
 * Disabled sinks accept calls and do nothing.
 */
class DebugImageSink {
public:
    DebugImageSink() = default;
    DebugImageSink(bool enabled, std::string directory);

    bool enabled() const { return m_enabled; }
    const std::string& directory() const { return m_directory; }

    /**
     * @brief Save <timestamp>_<label>_pre.png and _post.png
     * @return Number of files written
     */
    int saveComparison(const std::string& label, const cv::Mat& pre, const cv::Mat& post);

    /**
     * @brief Replace anything but [A-Za-z0-9_-] with '_'
     */
    static std::string sanitizeLabel(const std::string& label);

private:
    bool m_enabled = false;
    std::string m_directory;
    int m_counter = 0;
};

} // namespace btd6_pilot::vision
