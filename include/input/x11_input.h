#pragma once
/**
 * @file x11_input.h
 * @brief XTest keyboard/mouse and _NET_ACTIVE_WINDOW focus
 */

#include "input/input_controller.h"

#include <chrono>
#include <memory>
#include <string>

namespace btd6_pilot {

class X11Input : public InputController {
public:
    explicit X11Input(const std::string& displayName = {},
                      std::chrono::milliseconds clickHold = std::chrono::milliseconds(50));
    ~X11Input() override;

    X11Input(const X11Input&) = delete;
    X11Input& operator=(const X11Input&) = delete;

    bool isOpen() const;
    const std::string& getLastError() const;

    void sendKey(const std::string& key) override;
    void pressKey(const std::string& key) override;
    void releaseKey(const std::string& key) override;
    void moveTo(const Point& p) override;
    void moveAndClick(const Point& p) override;
    bool isKeyDown(const std::string& key) override;

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

class X11GameWindow : public GameWindow {
public:
    explicit X11GameWindow(std::string title, const std::string& displayName = {});
    ~X11GameWindow() override;

    X11GameWindow(const X11GameWindow&) = delete;
    X11GameWindow& operator=(const X11GameWindow&) = delete;

    bool activate() override;
    const std::string& title() const override { return m_title; }

private:
    class Impl;
    std::string m_title;
    std::unique_ptr<Impl> m_impl;
};

} // namespace btd6_pilot
