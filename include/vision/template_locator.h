#pragma once
/**
 * @file template_locator.h
 * @brief Find menu buttons on a full-screen capture by template matching
 */

#include "types.h"

#include <opencv2/core.hpp>

#include <map>
#include <string>

namespace btd6_pilot::vision {

struct TemplateMatch {
    bool found = false;
    Point center;           ///< Template center in screen coordinates
    double score = 0.0;     ///< Best TM_CCOEFF_NORMED score
};

/**
 * @brief Named grayscale templates matched with normalized cross-correlation
 *
 * The screen capture starts at (0, 0), so match locations are screen
 * coordinates. Templates must be captured at the game's resolution.
 */
class TemplateLocator {
public:
    explicit TemplateLocator(double threshold = 0.85) : m_threshold(threshold) {}

    /**
     * @brief Load a template from an image file (read as grayscale)
     * @return false if the file is missing or unreadable
     */
    bool loadTemplate(const std::string& name, const std::string& path);

    /// BGR, BGRA or gray
    void addTemplate(const std::string& name, const cv::Mat& image);

    bool hasTemplate(const std::string& name) const;
    size_t templateCount() const { return m_templates.size(); }

    /**
     * @brief Best match of a named template; found is false for an unknown name
     */
    TemplateMatch locate(const cv::Mat& screen, const std::string& name) const;

    double threshold() const { return m_threshold; }

    static TemplateMatch match(const cv::Mat& screen, const cv::Mat& templ, double threshold);

private:
    double m_threshold;
    std::map<std::string, cv::Mat> m_templates;
};

} // namespace btd6_pilot::vision
