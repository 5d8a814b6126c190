/**
 * @file win32_input.cpp
 * @brief SendInput-based input backend
 */

// Project headers first: wingdi.h defines ERROR, which LogLevel uses
#include "input/win32_input.h"
#include "utils/logger.h"

#ifndef NOMINMAX
#define NOMINMAX
#endif

#include <Windows.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <thread>

namespace btd6_pilot {

namespace {

WORD virtualKeyFor(const std::string& key) {
    std::string k = key;
    std::transform(k.begin(), k.end(), k.begin(), [](unsigned char c) { return (char)std::tolower(c); });
    if (k == "esc") return VK_ESCAPE;
    if (k == "space") return VK_SPACE;
    if (k == "enter") return VK_RETURN;
    if (k == "tab") return VK_TAB;
    if (k == "backspace") return VK_BACK;
    if (k == "shift") return VK_SHIFT;
    if (k == "ctrl") return VK_CONTROL;
    if (k == "alt") return VK_MENU;
    if (k == "up") return VK_UP;
    if (k == "down") return VK_DOWN;
    if (k == "left") return VK_LEFT;
    if (k == "right") return VK_RIGHT;
    if (k.size() >= 2 && k[0] == 'f' && std::isdigit(static_cast<unsigned char>(k[1]))) {
        int n = std::atoi(k.c_str() + 1);
        if (n >= 1 && n <= 12) return (WORD)(VK_F1 + n - 1);
    }
    if (key.size() == 1) {
        SHORT vk = VkKeyScanA(key[0]);
        if (vk != -1) return (WORD)(vk & 0xFF);
    }
    return 0;
}

void sendKeyEvent(WORD vk, bool keyUp) {
    INPUT inp = {};
    inp.type = INPUT_KEYBOARD;
    inp.ki.wVk = vk;
    inp.ki.wScan = (WORD)MapVirtualKeyW(vk, MAPVK_VK_TO_VSC);
    inp.ki.dwFlags = keyUp ? KEYEVENTF_KEYUP : 0;
    if (vk == VK_UP || vk == VK_DOWN || vk == VK_LEFT || vk == VK_RIGHT) {
        inp.ki.dwFlags |= KEYEVENTF_EXTENDEDKEY;
    }
    if (SendInput(1, &inp, sizeof(INPUT)) != 1) {
        logWarning("SendInput (keyboard) was blocked: " + std::to_string(GetLastError()));
    }
}

void sendMouseEvent(DWORD flags) {
    INPUT inp = {};
    inp.type = INPUT_MOUSE;
    inp.mi.dwFlags = flags;
    if (SendInput(1, &inp, sizeof(INPUT)) != 1) {
        logWarning("SendInput (mouse) was blocked: " + std::to_string(GetLastError()));
    }
}

} // namespace

Win32Input::Win32Input(std::chrono::milliseconds clickHold) : m_clickHold(clickHold) {
    SetProcessDPIAware();
}

void Win32Input::sendKey(const std::string& key) {
    pressKey(key);
    releaseKey(key);
}

void Win32Input::pressKey(const std::string& key) {
    WORD vk = virtualKeyFor(key);
    if (!vk) {
        logWarning("No virtual key for '" + key + "'");
        return;
    }
    sendKeyEvent(vk, false);
}

void Win32Input::releaseKey(const std::string& key) {
    WORD vk = virtualKeyFor(key);
    if (!vk) return;
    sendKeyEvent(vk, true);
}

void Win32Input::moveTo(const Point& p) {
    if (!SetCursorPos(p.x, p.y)) {
        logWarning("SetCursorPos failed: " + std::to_string(GetLastError()));
    }
}

void Win32Input::moveAndClick(const Point& p) {
    moveTo(p);
    sendMouseEvent(MOUSEEVENTF_LEFTDOWN);
    std::this_thread::sleep_for(m_clickHold);
    sendMouseEvent(MOUSEEVENTF_LEFTUP);
}

bool Win32Input::isKeyDown(const std::string& key) {
    WORD vk = virtualKeyFor(key);
    if (!vk) return false;
    return (GetAsyncKeyState(vk) & 0x8000) != 0;
}

// =============================================================================
// Game window
// =============================================================================

namespace {

struct FindContext {
    const std::string* needle;
    HWND found;
};

BOOL CALLBACK findWindowProc(HWND hwnd, LPARAM lParam) {
    auto* ctx = reinterpret_cast<FindContext*>(lParam);
    if (!IsWindowVisible(hwnd)) return TRUE;
    char title[256] = {0};
    GetWindowTextA(hwnd, title, (int)sizeof(title));
    if (std::string(title).find(*ctx->needle) != std::string::npos) {
        ctx->found = hwnd;
        return FALSE;
    }
    return TRUE;
}

} // namespace

Win32GameWindow::Win32GameWindow(std::string title) : m_title(std::move(title)) {}

bool Win32GameWindow::activate() {
    FindContext ctx{&m_title, nullptr};
    EnumWindows(findWindowProc, reinterpret_cast<LPARAM>(&ctx));
    HWND hwnd = ctx.found;
    if (!hwnd) {
        logError("Game window not found: " + m_title);
        return false;
    }

    if (IsIconic(hwnd)) ShowWindow(hwnd, SW_RESTORE);

    DWORD targetTid = GetWindowThreadProcessId(hwnd, nullptr);
    DWORD curTid = GetCurrentThreadId();
    if (targetTid != curTid) AttachThreadInput(curTid, targetTid, TRUE);
    BringWindowToTop(hwnd);
    BOOL ok = SetForegroundWindow(hwnd);
    if (targetTid != curTid) AttachThreadInput(curTid, targetTid, FALSE);

    if (!ok) {
        logWarning("SetForegroundWindow refused for " + m_title);
        return GetForegroundWindow() == hwnd;
    }
    logInfo("Activated window: " + m_title);
    return true;
}

} // namespace btd6_pilot
