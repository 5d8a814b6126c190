#pragma once
/**
 * @file screen_capture.h
 * @brief Region screenshot interface and bounded-retry wrapper
 */

#include "types.h"
#include "utils/timer.h"

#include <opencv2/core.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace btd6_pilot {

/**
 * @brief Capture statistics
 */
struct CaptureStats {
    uint64_t requests = 0;        ///< captureRegion calls
    uint64_t framesReceived = 0;  ///< Backend grabs that produced an image
    uint64_t framesDropped = 0;   ///< Backend grabs that came back empty
    uint64_t failures = 0;        ///< Requests that exhausted the retry budget
};

/**
 * @brief Platform screenshot backend
 *
 * grab() is a single attempt; transient failures return nullopt.
 */
class ScreenCapture {
public:
    virtual ~ScreenCapture() = default;

    /**
     * @brief Capture a screen region as 8-bit BGR
     */
    virtual std::optional<cv::Mat> grab(const Region& region) = 0;

    virtual std::string name() const = 0;
};

/**
 * @brief Wraps a backend with a small bounded retry budget
 *
 * Only after every attempt failed does captureRegion() surface nullopt to
 * the vision core.
 */
class RetryingCapture {
public:
    RetryingCapture(std::shared_ptr<ScreenCapture> backend,
                    int maxAttempts,
                    std::chrono::milliseconds retryDelay,
                    SleepFn sleep = realSleep);

    std::optional<cv::Mat> captureRegion(const Region& region);

    /**
     * @brief Like captureRegion but throws CaptureError
     */
    cv::Mat captureRegionOrThrow(const Region& region);

    CaptureStats getStats() const { return m_stats; }
    ScreenCapture& backend() { return *m_backend; }

private:
    std::shared_ptr<ScreenCapture> m_backend;
    int m_maxAttempts;
    std::chrono::milliseconds m_retryDelay;
    SleepFn m_sleep;
    CaptureStats m_stats;
};

/**
 * @brief Create the backend for this platform (GDI on Windows, X11 elsewhere)
 * @return nullptr if no backend is available in this build
 */
std::shared_ptr<ScreenCapture> createPlatformCapture();

} // namespace btd6_pilot
