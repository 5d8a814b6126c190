#include "vision/debug_images.h"
#include "utils/logger.h"

#include <opencv2/imgcodecs.hpp>

#include <cctype>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <sstream>

namespace btd6_pilot::vision {

namespace fs = std::filesystem;

namespace {

std::string fileTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    std::tm tmBuf{};
#ifdef _WIN32
    localtime_s(&tmBuf, &time);
#else
    localtime_r(&time, &tmBuf);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tmBuf, "%Y%m%d_%H%M%S");
    return oss.str();
}

} // namespace

DebugImageSink::DebugImageSink(bool enabled, std::string directory)
    : m_enabled(enabled), m_directory(std::move(directory)) {}

std::string DebugImageSink::sanitizeLabel(const std::string& label) {
    std::string out;
    out.reserve(label.size());
    for (char c : label) {
        const unsigned char uc = static_cast<unsigned char>(c);
        out.push_back((std::isalnum(uc) || c == '_' || c == '-') ? c : '_');
    }
    return out.empty() ? std::string("image") : out;
}

int DebugImageSink::saveComparison(const std::string& label, const cv::Mat& pre, const cv::Mat& post) {
    if (!m_enabled) return 0;

    std::error_code ec;
    fs::create_directories(m_directory, ec);
    if (ec) {
        logWarning("Cannot create debug image dir " + m_directory + ": " + ec.message());
        return 0;
    }

    const std::string stem = fileTimestamp() + "_" + std::to_string(++m_counter) + "_" + sanitizeLabel(label);
    int written = 0;
    auto write = [&](const cv::Mat& img, const char* suffix) {
        if (img.empty()) return;
        const std::string path = (fs::path(m_directory) / (stem + suffix)).string();
        try {
            if (cv::imwrite(path, img)) {
                ++written;
                logDebug("Saved debug image " + path);
            } else {
                logWarning("cv::imwrite failed for " + path);
            }
        } catch (const cv::Exception& e) {
            logWarning("cv::imwrite threw for " + path + ": " + e.what());
        }
    };
    write(pre, "_pre.png");
    write(post, "_post.png");
    return written;
}

} // namespace btd6_pilot::vision
