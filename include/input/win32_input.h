#pragma once
/**
 * @file win32_input.h
 * @brief SendInput keyboard/mouse and foreground-window control
 */

#include "input/input_controller.h"

#include <chrono>
#include <string>

namespace btd6_pilot {

class Win32Input : public InputController {
public:
    /**
     * @param clickHold Delay between button down and up
     */
    explicit Win32Input(std::chrono::milliseconds clickHold = std::chrono::milliseconds(50));

    void sendKey(const std::string& key) override;
    void pressKey(const std::string& key) override;
    void releaseKey(const std::string& key) override;
    void moveTo(const Point& p) override;
    void moveAndClick(const Point& p) override;
    bool isKeyDown(const std::string& key) override;

private:
    std::chrono::milliseconds m_clickHold;
};

/**
 * @brief Finds a top-level window whose title contains the given text
 */
class Win32GameWindow : public GameWindow {
public:
    explicit Win32GameWindow(std::string title);

    bool activate() override;
    const std::string& title() const override { return m_title; }

private:
    std::string m_title;
};

} // namespace btd6_pilot
