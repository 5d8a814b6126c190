#pragma once
/**
 * @file x11_capture.h
 * @brief X11 root-window region capture (XGetImage)
 */

#include "capture/screen_capture.h"

#include <memory>
#include <string>

namespace btd6_pilot {

class X11Capture : public ScreenCapture {
public:
    /**
     * @param displayName X display, empty for $DISPLAY
     */
    explicit X11Capture(const std::string& displayName = {});
    ~X11Capture() override;

    // Non-copyable
    X11Capture(const X11Capture&) = delete;
    X11Capture& operator=(const X11Capture&) = delete;

    bool isOpen() const;

    std::optional<cv::Mat> grab(const Region& region) override;
    std::string name() const override { return "x11"; }

    /**
     * @brief Root window size
     */
    void getScreenSize(int& width, int& height) const;

    const std::string& getLastError() const;

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace btd6_pilot
