#pragma once
/**
 * @file gdi_capture.h
 * @brief Win32 GDI region capture (BitBlt + GetDIBits)
 */

#include "capture/screen_capture.h"

#include <memory>
#include <string>

namespace btd6_pilot {

/**
 * @brief Desktop capture through the screen DC
 *
 * One memory DC/bitmap pair is created per grab; regions are small enough
 * that caching the bitmap isn't worth the size bookkeeping.
 */
class GdiCapture : public ScreenCapture {
public:
    GdiCapture();
    ~GdiCapture() override;

    // Non-copyable
    GdiCapture(const GdiCapture&) = delete;
    GdiCapture& operator=(const GdiCapture&) = delete;

    std::optional<cv::Mat> grab(const Region& region) override;
    std::string name() const override { return "gdi"; }

    /**
     * @brief Get last error message
     */
    const std::string& getLastError() const;

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace btd6_pilot
