/**
 * @file screen_capture.cpp
 * @brief Bounded-retry capture wrapper and platform backend selection
 */

#include "capture/screen_capture.h"
#include "errors.h"
#include "utils/logger.h"

#if defined(_WIN32)
#include "capture/gdi_capture.h"
#elif defined(BTD6P_HAS_X11)
#include "capture/x11_capture.h"
#endif

#include <algorithm>

namespace btd6_pilot {

RetryingCapture::RetryingCapture(std::shared_ptr<ScreenCapture> backend,
                                 int maxAttempts,
                                 std::chrono::milliseconds retryDelay,
                                 SleepFn sleep)
    : m_backend(std::move(backend))
    , m_maxAttempts((std::max)(1, maxAttempts))
    , m_retryDelay(retryDelay)
    , m_sleep(std::move(sleep)) {}

std::optional<cv::Mat> RetryingCapture::captureRegion(const Region& region) {
    m_stats.requests++;
    if (!m_backend) {
        m_stats.failures++;
        return std::nullopt;
    }
    if (!region.isValid()) {
        logWarning("Refusing to capture invalid region " + formatRegion(region));
        m_stats.failures++;
        return std::nullopt;
    }

    for (int attempt = 1; attempt <= m_maxAttempts; ++attempt) {
        std::optional<cv::Mat> img;
        try {
            img = m_backend->grab(region);
        } catch (const std::exception& e) {
            logWarning(m_backend->name() + " grab threw: " + e.what());
        }
        if (img && !img->empty()) {
            m_stats.framesReceived++;
            return img;
        }
        m_stats.framesDropped++;
        logDebug("Capture of " + formatRegion(region) + " returned nothing (attempt " +
                 std::to_string(attempt) + "/" + std::to_string(m_maxAttempts) + ")");
        if (attempt < m_maxAttempts) m_sleep(m_retryDelay);
    }

    m_stats.failures++;
    logWarning("Capture failed for region " + formatRegion(region) + " after " +
               std::to_string(m_maxAttempts) + " attempts");
    return std::nullopt;
}

cv::Mat RetryingCapture::captureRegionOrThrow(const Region& region) {
    std::optional<cv::Mat> img = captureRegion(region);
    if (!img) throw CaptureError(region);
    return *img;
}

std::shared_ptr<ScreenCapture> createPlatformCapture() {
#if defined(_WIN32)
    return std::make_shared<GdiCapture>();
#elif defined(BTD6P_HAS_X11)
    auto capture = std::make_shared<X11Capture>();
    if (!capture->isOpen()) {
        logError("X11Capture: " + capture->getLastError());
        return nullptr;
    }
    return capture;
#else
    return nullptr;
#endif
}

} // namespace btd6_pilot
