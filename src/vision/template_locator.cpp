/**
 * @file template_locator.cpp
 * @brief Template matching for menu navigation
 */

#include "vision/template_locator.h"
#include "utils/logger.h"

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

namespace btd6_pilot::vision {

namespace {

cv::Mat toGray(const cv::Mat& image) {
    if (image.channels() == 1) return image;
    cv::Mat gray;
    if (image.channels() == 4) {
        cv::cvtColor(image, gray, cv::COLOR_BGRA2GRAY);
    } else {
        cv::cvtColor(image, gray, cv::COLOR_BGR2GRAY);
    }
    return gray;
}

} // namespace

bool TemplateLocator::loadTemplate(const std::string& name, const std::string& path) {
    cv::Mat image = cv::imread(path, cv::IMREAD_GRAYSCALE);
    if (image.empty()) {
        logError("Template image not found: " + path);
        return false;
    }
    m_templates[name] = image;
    logDebug("Loaded template '" + name + "' (" + std::to_string(image.cols) + "x" +
             std::to_string(image.rows) + ") from " + path);
    return true;
}

void TemplateLocator::addTemplate(const std::string& name, const cv::Mat& image) {
    m_templates[name] = toGray(image).clone();
}

bool TemplateLocator::hasTemplate(const std::string& name) const {
    return m_templates.count(name) > 0;
}

TemplateMatch TemplateLocator::locate(const cv::Mat& screen, const std::string& name) const {
    auto it = m_templates.find(name);
    if (it == m_templates.end()) return TemplateMatch{};

    TemplateMatch m = match(screen, it->second, m_threshold);
    logDebug("Template '" + name + "': score " + std::to_string(m.score) +
             (m.found ? " at " + std::to_string(m.center.x) + "," + std::to_string(m.center.y) : ""));
    return m;
}

TemplateMatch TemplateLocator::match(const cv::Mat& screen, const cv::Mat& templ, double threshold) {
    TemplateMatch result;
    if (screen.empty() || templ.empty()) return result;

    cv::Mat screenGray = toGray(screen);
    cv::Mat templGray = toGray(templ);
    if (templGray.cols > screenGray.cols || templGray.rows > screenGray.rows) return result;

    cv::Mat scores;
    cv::matchTemplate(screenGray, templGray, scores, cv::TM_CCOEFF_NORMED);

    double minVal = 0.0;
    double maxVal = 0.0;
    cv::Point minLoc;
    cv::Point maxLoc;
    cv::minMaxLoc(scores, &minVal, &maxVal, &minLoc, &maxLoc);

    result.score = maxVal;
    result.center = Point{maxLoc.x + templGray.cols / 2, maxLoc.y + templGray.rows / 2};
    result.found = maxVal >= threshold;
    return result;
}

} // namespace btd6_pilot::vision
