/**
 * @file x11_capture.cpp
 * @brief X11 capture implementation
 */

#include "capture/x11_capture.h"

#include <opencv2/imgproc.hpp>

// After OpenCV: Xlib defines Status/None/Bool as macros
#include <X11/Xlib.h>
#include <X11/Xutil.h>

namespace btd6_pilot {

namespace {

// XGetImage fails with BadMatch for rectangles that leave the root window; the
// default handler would exit the process.
int ignoreXError(Display*, XErrorEvent*) {
    return 0;
}

} // namespace

class X11Capture::Impl {
public:
    explicit Impl(const std::string& displayName) {
        m_display = XOpenDisplay(displayName.empty() ? nullptr : displayName.c_str());
        if (!m_display) {
            m_lastError = "Cannot open display";
            return;
        }
        XSetErrorHandler(ignoreXError);
        m_root = DefaultRootWindow(m_display);
        Screen* screen = DefaultScreenOfDisplay(m_display);
        m_width = screen->width;
        m_height = screen->height;
    }

    ~Impl() {
        if (m_display) XCloseDisplay(m_display);
    }

    std::optional<cv::Mat> grab(const Region& region) {
        if (!m_display) return std::nullopt;
        if (region.right() > m_width || region.bottom() > m_height) {
            m_lastError = "Region exceeds root window";
            return std::nullopt;
        }

        XImage* img = XGetImage(m_display, m_root, region.left, region.top,
                                (unsigned)region.width, (unsigned)region.height,
                                AllPlanes, ZPixmap);
        if (!img) {
            m_lastError = "XGetImage returned null";
            return std::nullopt;
        }

        std::optional<cv::Mat> result;
        if (img->bits_per_pixel == 32) {
            cv::Mat bgra(region.height, region.width, CV_8UC4, img->data, (size_t)img->bytes_per_line);
            cv::Mat bgr;
            cv::cvtColor(bgra, bgr, cv::COLOR_BGRA2BGR);
            result = bgr;
        } else {
            m_lastError = "Unsupported XImage depth " + std::to_string(img->bits_per_pixel);
        }
        XDestroyImage(img);
        return result;
    }

    Display* m_display = nullptr;
    Window m_root = 0;
    int m_width = 0;
    int m_height = 0;
    std::string m_lastError;
};

X11Capture::X11Capture(const std::string& displayName)
    : m_impl(std::make_unique<Impl>(displayName)) {}

X11Capture::~X11Capture() = default;

bool X11Capture::isOpen() const {
    return m_impl->m_display != nullptr;
}

std::optional<cv::Mat> X11Capture::grab(const Region& region) {
    return m_impl->grab(region);
}

void X11Capture::getScreenSize(int& width, int& height) const {
    width = m_impl->m_width;
    height = m_impl->m_height;
}

const std::string& X11Capture::getLastError() const {
    return m_impl->m_lastError;
}

} // namespace btd6_pilot
