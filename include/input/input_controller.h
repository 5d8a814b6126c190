#pragma once
/**
 * @file input_controller.h
 * @brief Synthetic keyboard/mouse and game-window focus interfaces
 */

#include "types.h"

#include <memory>
#include <string>

namespace btd6_pilot {

/**
 * @brief Fire-and-forget input primitives
 *
 * Keys are single characters ("q", ",") or named keys ("esc", "space", "f1").
 */
class InputController {
public:
    virtual ~InputController() = default;

    /// Momentary press + release
    virtual void sendKey(const std::string& key) = 0;
    virtual void pressKey(const std::string& key) = 0;
    virtual void releaseKey(const std::string& key) = 0;

    virtual void moveTo(const Point& p) = 0;
    virtual void moveAndClick(const Point& p) = 0;

    /// Current physical key state; used by the kill switch
    virtual bool isKeyDown(const std::string& key) = 0;
};

/**
 * @brief Brings the game to the foreground
 */
class GameWindow {
public:
    virtual ~GameWindow() = default;

    /**
     * @return true if the window was found and focused
     */
    virtual bool activate() = 0;

    virtual const std::string& title() const = 0;
};

/**
 * @brief Clicks the resting spot when the scope ends, on every exit path
 *
 * Keeps the cursor out of the comparison regions for the next capture.
 */
class CursorRestGuard {
public:
    CursorRestGuard(InputController& input, const Point& restingSpot)
        : m_input(input), m_restingSpot(restingSpot) {}
    ~CursorRestGuard();

    CursorRestGuard(const CursorRestGuard&) = delete;
    CursorRestGuard& operator=(const CursorRestGuard&) = delete;

    void dismiss() { m_active = false; }

private:
    InputController& m_input;
    Point m_restingSpot;
    bool m_active = true;
};

/**
 * @brief Platform input backend (SendInput on Windows, XTest elsewhere)
 * @return nullptr if no backend is available in this build
 */
std::shared_ptr<InputController> createPlatformInput();

/**
 * @brief Platform window lookup by title (substring match)
 */
std::shared_ptr<GameWindow> createPlatformWindow(const std::string& title);

} // namespace btd6_pilot
