#pragma once
/**
 * @file currency_ocr.h
 * @brief Cash counter recognition by glyph template matching
 */

#include <opencv2/core.hpp>

#include <optional>
#include <string>

namespace btd6_pilot::vision {

struct GlyphReadResult {
    std::string text;       ///< Raw glyph string, e.g. "$1,25O"
    float score = -1.0f;    ///< Mean normalized correlation, -1 if nothing was read
};

/**
 * @brief Strip '$', ',' and blanks, then fix common misreads (O/o->0, l/I->1, S->5)
 */
std::string cleanCurrencyText(const std::string& text);

/**
 * @brief Cleaned text as a non-negative amount
 * @return nullopt unless the cleaned text is 1..9 digits
 */
std::optional<int> parseCurrencyText(const std::string& text);

/**
 * @brief Reads the in-game cash display
 *
 * The counter is white text with a dark outline; the region is binarized
 * with Otsu, split into connected glyph boxes and each box is matched
 * against rendered digit templates.
 */
class CurrencyOcr {
public:
    /**
     * @param minScore Mean glyph score below which a read is discarded
     */
    explicit CurrencyOcr(float minScore = 0.45f) : m_minScore(minScore) {}

    /**
     * @brief Raw glyph recognition on a BGR or gray image
     */
    GlyphReadResult recognize(const cv::Mat& image) const;

    /**
     * @return nullopt when nothing legible is found
     */
    std::optional<int> read(const cv::Mat& image) const;

    float minScore() const { return m_minScore; }

private:
    float m_minScore;
};

} // namespace btd6_pilot::vision
