/**
 * @file gdi_capture.cpp
 * @brief Win32 GDI capture implementation
 */

#ifndef NOMINMAX
#define NOMINMAX
#endif

#include <Windows.h>

#include "capture/gdi_capture.h"

#include <opencv2/imgproc.hpp>

namespace btd6_pilot {

class GdiCapture::Impl {
public:
    Impl() {
        // Physical pixels; the configured regions are in physical coordinates
        SetProcessDPIAware();
        m_screenDC = GetDC(nullptr);
        if (!m_screenDC) m_lastError = "GetDC(nullptr) failed";
    }

    ~Impl() {
        if (m_screenDC) ReleaseDC(nullptr, m_screenDC);
    }

    std::optional<cv::Mat> grab(const Region& region) {
        if (!m_screenDC) return std::nullopt;

        HDC memDC = CreateCompatibleDC(m_screenDC);
        if (!memDC) {
            m_lastError = "CreateCompatibleDC failed";
            return std::nullopt;
        }
        HBITMAP bitmap = CreateCompatibleBitmap(m_screenDC, region.width, region.height);
        if (!bitmap) {
            DeleteDC(memDC);
            m_lastError = "CreateCompatibleBitmap failed";
            return std::nullopt;
        }
        HGDIOBJ old = SelectObject(memDC, bitmap);

        std::optional<cv::Mat> result;
        if (BitBlt(memDC, 0, 0, region.width, region.height,
                   m_screenDC, region.left, region.top, SRCCOPY)) {
            BITMAPINFOHEADER bi{};
            bi.biSize = sizeof(BITMAPINFOHEADER);
            bi.biWidth = region.width;
            bi.biHeight = -region.height;   // top-down
            bi.biPlanes = 1;
            bi.biBitCount = 32;
            bi.biCompression = BI_RGB;

            cv::Mat bgra(region.height, region.width, CV_8UC4);
            const int lines = GetDIBits(memDC, bitmap, 0, (UINT)region.height, bgra.data,
                                        reinterpret_cast<BITMAPINFO*>(&bi), DIB_RGB_COLORS);
            if (lines == region.height) {
                cv::Mat bgr;
                cv::cvtColor(bgra, bgr, cv::COLOR_BGRA2BGR);
                result = bgr;
            } else {
                m_lastError = "GetDIBits returned " + std::to_string(lines) + " lines";
            }
        } else {
            m_lastError = "BitBlt failed: " + std::to_string(GetLastError());
        }

        SelectObject(memDC, old);
        DeleteObject(bitmap);
        DeleteDC(memDC);
        return result;
    }

    std::string m_lastError;

private:
    HDC m_screenDC = nullptr;
};

GdiCapture::GdiCapture() : m_impl(std::make_unique<Impl>()) {}
GdiCapture::~GdiCapture() = default;

std::optional<cv::Mat> GdiCapture::grab(const Region& region) {
    return m_impl->grab(region);
}

const std::string& GdiCapture::getLastError() const {
    return m_impl->m_lastError;
}

} // namespace btd6_pilot
