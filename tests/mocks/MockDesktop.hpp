#ifndef MOCK_DESKTOP_HPP
#define MOCK_DESKTOP_HPP

/**
 * @brief Hand-written fakes for the capture, input and window collaborators
 *
 * FakeCapture serves scripted frames per region, MockInput records every
 * input call, and SimulatedGame wires the two together so that keys and
 * clicks change what the next capture returns.
 */

#include "capture/screen_capture.h"
#include "input/input_controller.h"
#include "types.h"
#include "utils/timer.h"

#include <opencv2/core.hpp>

#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <tuple>
#include <vector>

namespace btd6_pilot::testing {

constexpr int kFrameSize = 10;

inline cv::Mat solidFrame(int value) {
    return cv::Mat(kFrameSize, kFrameSize, CV_8UC3, cv::Scalar(value, value, value));
}

/// First `rows` rows set to `value`, the rest to `background`
inline cv::Mat bandedFrame(int background, int value, int rows) {
    cv::Mat m = solidFrame(background);
    if (rows > kFrameSize) rows = kFrameSize;
    if (rows > 0) {
        m(cv::Rect(0, 0, kFrameSize, rows)).setTo(cv::Scalar(value, value, value));
    }
    return m;
}

/// Uniform noise; a crop of it correlates with nothing but its own origin
inline cv::Mat noiseFrame(uint64_t seed, int width, int height) {
    cv::Mat m(height, width, CV_8UC3);
    cv::RNG rng(seed);
    rng.fill(m, cv::RNG::UNIFORM, cv::Scalar::all(0), cv::Scalar::all(256));
    return m;
}

/// Records requested sleeps instead of sleeping
struct SleepRecorder {
    std::vector<std::chrono::milliseconds> sleeps;
    std::function<void()> onSleep;

    SleepFn fn() {
        return [this](std::chrono::milliseconds d) {
            sleeps.push_back(d);
            if (onSleep) onSleep();
        };
    }

    int count(std::chrono::milliseconds d) const {
        int n = 0;
        for (const auto& s : sleeps) if (s == d) ++n;
        return n;
    }
};

inline SleepFn noSleep() {
    return [](std::chrono::milliseconds) {};
}

class FakeCapture : public ScreenCapture {
public:
    using FrameFn = std::function<std::optional<cv::Mat>(const Region&)>;

    /// Queue frames for a region; nullopt entries simulate a dropped grab
    void script(const Region& region, std::vector<std::optional<cv::Mat>> frames) {
        auto& q = m_scripts[key(region)];
        for (auto& f : frames) q.push_back(std::move(f));
    }

    /// Served once a region's script has run out
    void setRegionDefault(const Region& region, const cv::Mat& frame) {
        m_defaults[key(region)] = frame;
    }

    /// Fallback for regions without a script or default
    void setFrameFn(FrameFn fn) { m_frameFn = std::move(fn); }

    void setEventLog(std::vector<std::string>* log) { m_log = log; }

    std::optional<cv::Mat> grab(const Region& region) override {
        ++m_grabs[key(region)];
        if (m_log) m_log->push_back("grab:" + std::to_string(region.left));

        auto it = m_scripts.find(key(region));
        if (it != m_scripts.end() && !it->second.empty()) {
            std::optional<cv::Mat> f = it->second.front();
            it->second.pop_front();
            if (f) return f->clone();
            return std::nullopt;
        }
        auto d = m_defaults.find(key(region));
        if (d != m_defaults.end()) return d->second.clone();
        if (m_frameFn) return m_frameFn(region);
        return std::nullopt;
    }

    std::string name() const override { return "FakeCapture"; }

    int grabCount(const Region& region) const {
        auto it = m_grabs.find(key(region));
        return it == m_grabs.end() ? 0 : it->second;
    }

private:
    using Key = std::tuple<int, int, int, int>;
    static Key key(const Region& r) { return Key{r.left, r.top, r.width, r.height}; }

    std::map<Key, std::deque<std::optional<cv::Mat>>> m_scripts;
    std::map<Key, cv::Mat> m_defaults;
    std::map<Key, int> m_grabs;
    FrameFn m_frameFn;
    std::vector<std::string>* m_log = nullptr;
};

struct InputEvent {
    enum class Kind { Key, Press, Release, Move, Click };
    Kind kind;
    std::string key;
    Point point;
};

class MockInput : public InputController {
public:
    std::vector<InputEvent> events;
    std::vector<std::string> keysDown;                  ///< Reported by isKeyDown
    std::function<void(const InputEvent&)> onEvent;     ///< Lets a fake game react
    std::vector<std::string>* log = nullptr;

    void sendKey(const std::string& key) override { record({InputEvent::Kind::Key, key, {}}); }
    void pressKey(const std::string& key) override { record({InputEvent::Kind::Press, key, {}}); }
    void releaseKey(const std::string& key) override { record({InputEvent::Kind::Release, key, {}}); }
    void moveTo(const Point& p) override { record({InputEvent::Kind::Move, {}, p}); }
    void moveAndClick(const Point& p) override { record({InputEvent::Kind::Click, {}, p}); }

    bool isKeyDown(const std::string& key) override {
        ++keyPolls;
        for (const auto& k : keysDown) if (k == key) return true;
        return false;
    }

    int keyPolls = 0;

    int clicksAt(const Point& p) const {
        int n = 0;
        for (const auto& e : events) {
            if (e.kind == InputEvent::Kind::Click && e.point == p) ++n;
        }
        return n;
    }

    int clickCount() const { return count(InputEvent::Kind::Click); }

    int keyCount(const std::string& key) const {
        int n = 0;
        for (const auto& e : events) {
            if (e.kind == InputEvent::Kind::Key && e.key == key) ++n;
        }
        return n;
    }

    int count(InputEvent::Kind kind) const {
        int n = 0;
        for (const auto& e : events) if (e.kind == kind) ++n;
        return n;
    }

private:
    void record(const InputEvent& e) {
        events.push_back(e);
        if (log) {
            switch (e.kind) {
                case InputEvent::Kind::Key:     log->push_back("key:" + e.key); break;
                case InputEvent::Kind::Press:   log->push_back("press:" + e.key); break;
                case InputEvent::Kind::Release: log->push_back("release:" + e.key); break;
                case InputEvent::Kind::Move:    log->push_back("move"); break;
                case InputEvent::Kind::Click:   log->push_back("click"); break;
            }
        }
        if (onEvent) onEvent(e);
    }
};

class MockWindow : public GameWindow {
public:
    explicit MockWindow(std::string title = "BloonsTD6") : m_title(std::move(title)) {}

    int failuresBeforeSuccess = 0;  ///< -1: never activates
    int activations = 0;

    bool activate() override {
        ++activations;
        if (failuresBeforeSuccess < 0) return false;
        if (activations <= failuresBeforeSuccess) return false;
        return true;
    }

    const std::string& title() const override { return m_title; }

private:
    std::string m_title;
};

/**
 * @brief Minimal model of the game's reaction to input
 *
 * - A non-upgrade key (or a held hero key) selects an entity; the selection
 *   region turns white.
 * - A click while selected drops a tower there and opens the side panel.
 * - A click on an existing tower opens its side panel.
 * - An upgrade key with the panel open adds two grey rows to the panel image.
 * - A click on the resting spot closes everything.
 */
class SimulatedGame {
public:
    SimulatedGame(FakeCapture& capture, MockInput& input,
                  const Region& selectRegion, const Region& leftPanel, const Region& rightPanel,
                  const Point& restingSpot)
        : m_select(selectRegion), m_left(leftPanel), m_right(rightPanel), m_rest(restingSpot) {
        input.onEvent = [this](const InputEvent& e) { onInput(e); };
        capture.setFrameFn([this](const Region& r) { return frameFor(r); });
    }

    // Behaviour knobs
    int ignoreSelectKeys = 0;       ///< Number of selection keys to drop (-1: all)
    bool ignoreDrops = false;
    bool ignorePanelClicks = false;
    int focusLossKeys = 0;          ///< Upgrade keys that deselect the tower instead (-1: all)
    int panelSide = 0;              ///< 0 left, 1 right
    int darkFrames = 0;             ///< Full-screen grabs that come back black

    // State
    bool selected = false;
    bool panelOpen = false;
    int upgradesApplied = 0;
    std::vector<Point> towers;

    void addTower(const Point& p) { towers.push_back(p); }

private:
    static bool isUpgradeKey(const std::string& k) { return k == "," || k == "." || k == "/"; }

    bool hasTower(const Point& p) const {
        for (const auto& t : towers) if (t == p) return true;
        return false;
    }

    static bool consume(int& budget) {
        if (budget < 0) return true;
        if (budget > 0) { --budget; return true; }
        return false;
    }

    void onInput(const InputEvent& e) {
        switch (e.kind) {
            case InputEvent::Kind::Key:
            case InputEvent::Kind::Press:
                if (isUpgradeKey(e.key)) {
                    if (!panelOpen) break;
                    if (consume(focusLossKeys)) {
                        panelOpen = false;
                    } else {
                        ++upgradesApplied;
                    }
                } else if (!consume(ignoreSelectKeys)) {
                    selected = true;
                }
                break;
            case InputEvent::Kind::Click:
                if (e.point == m_rest) {
                    selected = false;
                    panelOpen = false;
                } else if (selected) {
                    selected = false;
                    if (!ignoreDrops) {
                        towers.push_back(e.point);
                        panelOpen = true;
                    }
                } else if (hasTower(e.point) && !ignorePanelClicks) {
                    panelOpen = true;
                }
                break;
            default:
                break;
        }
    }

    std::optional<cv::Mat> frameFor(const Region& r) {
        if (r == m_select) return selected ? solidFrame(255) : solidFrame(0);
        const Region& panel = panelSide == 0 ? m_left : m_right;
        if (r == panel) {
            if (!panelOpen) return solidFrame(0);
            return bandedFrame(255, 128, upgradesApplied * 2);
        }
        if (r == m_left || r == m_right) return solidFrame(0);
        if (darkFrames > 0) {
            --darkFrames;
            return solidFrame(0);
        }
        return solidFrame(128);
    }

    Region m_select;
    Region m_left;
    Region m_right;
    Point m_rest;
};

} // namespace btd6_pilot::testing

#endif // MOCK_DESKTOP_HPP
