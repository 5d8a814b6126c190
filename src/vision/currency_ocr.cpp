#include "vision/currency_ocr.h"

#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <vector>

namespace btd6_pilot::vision {

namespace {

struct Box { int x, y, w, h; };

void findGlyphBoxes(const cv::Mat& bw, std::vector<Box>& boxesOut) {
    boxesOut.clear();
    std::vector<std::vector<cv::Point>> contours;
    cv::Mat work = bw.clone();
    cv::findContours(work, contours, cv::RETR_EXTERNAL, cv::CHAIN_APPROX_SIMPLE);

    const int minH = std::max(8, bw.rows / 3);
    for (const auto& c : contours) {
        cv::Rect r = cv::boundingRect(c);
        if (r.width * r.height < 30) continue;
        if (r.height < minH || r.height > bw.rows) continue;
        if (r.width < 3 || r.width > bw.rows * 2) continue;
        boxesOut.push_back({r.x, r.y, r.width, r.height});
    }
    std::sort(boxesOut.begin(), boxesOut.end(), [](const Box& a, const Box& b) { return a.x < b.x; });
}

// '$' is matched so it can be dropped by the text clean-up instead of being read as a digit
const std::string kGlyphs = "0123456789$";

} // anonymous namespace

std::string cleanCurrencyText(const std::string& text) {
    std::string result;
    result.reserve(text.size());

    for (char c : text) {
        switch (c) {
            case '$': case ',': case ' ': case '\t': case '\n': case '\r':
                continue;
            case 'O': case 'o': result.push_back('0'); break;
            case 'l': case 'I': result.push_back('1'); break;
            case 'S': result.push_back('5'); break;
            default:  result.push_back(c); break;
        }
    }
    return result;
}

std::optional<int> parseCurrencyText(const std::string& text) {
    const std::string cleaned = cleanCurrencyText(text);
    if (cleaned.empty() || cleaned.size() > 9) return std::nullopt;
    for (char c : cleaned) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;
    }
    return std::stoi(cleaned);
}

GlyphReadResult CurrencyOcr::recognize(const cv::Mat& image) const {
    GlyphReadResult out;
    if (image.empty()) return out;

    cv::Mat gray;
    if (image.channels() == 3) {
        cv::cvtColor(image, gray, cv::COLOR_BGR2GRAY);
    } else if (image.channels() == 4) {
        cv::cvtColor(image, gray, cv::COLOR_BGRA2GRAY);
    } else {
        gray = image;
    }

    cv::Mat up;
    cv::resize(gray, up, cv::Size(), 2.0, 2.0, cv::INTER_CUBIC);

    // White digits first; fall back to dark-on-light
    cv::Mat bw;
    std::vector<Box> boxes;
    cv::threshold(up, bw, 0, 255, cv::THRESH_BINARY | cv::THRESH_OTSU);
    findGlyphBoxes(bw, boxes);
    if (boxes.empty()) {
        cv::threshold(up, bw, 0, 255, cv::THRESH_BINARY_INV | cv::THRESH_OTSU);
        findGlyphBoxes(bw, boxes);
    }
    if (boxes.empty()) return out;
    if (boxes.size() > 12) boxes.resize(12);

    const int rowH = std::max(18, static_cast<int>(std::lround(up.rows * 0.9)));
    const int glyphW = std::max(12, static_cast<int>(std::lround(rowH * 0.6)));
    const double fontScale = 0.6 * (rowH / 30.0);
    const int thickness = (rowH < 28) ? 1 : 2;

    std::vector<cv::Mat> templates;
    templates.reserve(kGlyphs.size());
    for (char ch : kGlyphs) {
        cv::Mat glyph(rowH, glyphW, CV_8UC1, cv::Scalar(0));
        cv::putText(glyph, std::string(1, ch), cv::Point(1, rowH - 6),
                    cv::FONT_HERSHEY_SIMPLEX, fontScale, cv::Scalar(255),
                    thickness, cv::LINE_AA);
        templates.push_back(glyph);
    }

    double total = 0.0;
    for (const auto& b : boxes) {
        cv::Rect r(b.x, b.y, b.w, b.h);
        r &= cv::Rect(0, 0, bw.cols, bw.rows);
        if (r.width <= 0 || r.height <= 0) continue;

        cv::Mat patch;
        cv::resize(bw(r), patch, cv::Size(glyphW, rowH), 0, 0, cv::INTER_AREA);

        char bestCh = '?';
        double bestSc = -1.0;
        for (size_t i = 0; i < templates.size(); ++i) {
            cv::Mat res;
            cv::matchTemplate(patch, templates[i], res, cv::TM_CCORR_NORMED);
            double minv, maxv;
            cv::minMaxLoc(res, &minv, &maxv);
            if (maxv > bestSc) { bestSc = maxv; bestCh = kGlyphs[i]; }
        }
        out.text.push_back(bestCh);
        total += bestSc;
    }

    if (!out.text.empty()) {
        out.score = static_cast<float>(total / static_cast<double>(out.text.size()));
    }
    return out;
}

std::optional<int> CurrencyOcr::read(const cv::Mat& image) const {
    GlyphReadResult glyphs = recognize(image);
    if (glyphs.text.empty() || glyphs.score < m_minScore) return std::nullopt;
    return parseCurrencyText(glyphs.text);
}

} // namespace btd6_pilot::vision
