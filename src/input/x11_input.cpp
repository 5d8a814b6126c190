/**
 * @file x11_input.cpp
 * @brief XTest input backend and EWMH window activation
 */

#include "input/x11_input.h"
#include "utils/logger.h"

#include <X11/Xatom.h>
#include <X11/Xlib.h>
#include <X11/Xutil.h>
#include <X11/keysym.h>
#include <X11/extensions/XTest.h>

#include <algorithm>
#include <cctype>
#include <thread>

namespace btd6_pilot {

namespace {

KeySym keysymFor(const std::string& key) {
    std::string k = key;
    std::transform(k.begin(), k.end(), k.begin(), [](unsigned char c) { return (char)std::tolower(c); });
    if (k == "esc") return XK_Escape;
    if (k == "space") return XK_space;
    if (k == "enter") return XK_Return;
    if (k == "tab") return XK_Tab;
    if (k == "backspace") return XK_BackSpace;
    if (k == "shift") return XK_Shift_L;
    if (k == "ctrl") return XK_Control_L;
    if (k == "alt") return XK_Alt_L;
    if (k == "up") return XK_Up;
    if (k == "down") return XK_Down;
    if (k == "left") return XK_Left;
    if (k == "right") return XK_Right;
    if (k.size() >= 2 && k[0] == 'f' && std::isdigit(static_cast<unsigned char>(k[1]))) {
        std::string name = "F" + k.substr(1);
        return XStringToKeysym(name.c_str());
    }
    // Printable Latin-1 keysyms equal their character codes
    if (key.size() == 1) return static_cast<KeySym>(static_cast<unsigned char>(key[0]));
    return NoSymbol;
}

} // namespace

class X11Input::Impl {
public:
    Impl(const std::string& displayName, std::chrono::milliseconds clickHold)
        : m_clickHold(clickHold) {
        m_display = XOpenDisplay(displayName.empty() ? nullptr : displayName.c_str());
        if (!m_display) {
            m_lastError = "Cannot open display";
            return;
        }
        int eventBase = 0, errorBase = 0, major = 0, minor = 0;
        if (!XTestQueryExtension(m_display, &eventBase, &errorBase, &major, &minor)) {
            m_lastError = "XTest extension not available";
            XCloseDisplay(m_display);
            m_display = nullptr;
            return;
        }
        m_root = DefaultRootWindow(m_display);
    }

    ~Impl() {
        if (m_display) XCloseDisplay(m_display);
    }

    KeyCode keycodeFor(const std::string& key) {
        KeySym sym = keysymFor(key);
        if (sym == NoSymbol) return 0;
        return XKeysymToKeycode(m_display, sym);
    }

    void keyEvent(const std::string& key, bool down) {
        if (!m_display) return;
        KeyCode code = keycodeFor(key);
        if (!code) {
            logWarning("No keycode for '" + key + "'");
            return;
        }
        XTestFakeKeyEvent(m_display, code, down ? True : False, CurrentTime);
        XFlush(m_display);
    }

    void move(const Point& p) {
        if (!m_display) return;
        XWarpPointer(m_display, None, m_root, 0, 0, 0, 0, p.x, p.y);
        XFlush(m_display);
    }

    void click() {
        if (!m_display) return;
        XTestFakeButtonEvent(m_display, Button1, True, CurrentTime);
        XFlush(m_display);
        std::this_thread::sleep_for(m_clickHold);
        XTestFakeButtonEvent(m_display, Button1, False, CurrentTime);
        XFlush(m_display);
    }

    bool keyDown(const std::string& key) {
        if (!m_display) return false;
        KeyCode code = keycodeFor(key);
        if (!code) return false;
        char keys[32] = {0};
        XQueryKeymap(m_display, keys);
        return (keys[code / 8] & (1 << (code % 8))) != 0;
    }

    Display* m_display = nullptr;
    Window m_root = 0;
    std::chrono::milliseconds m_clickHold;
    std::string m_lastError;
};

X11Input::X11Input(const std::string& displayName, std::chrono::milliseconds clickHold)
    : m_impl(std::make_unique<Impl>(displayName, clickHold)) {}

X11Input::~X11Input() = default;

bool X11Input::isOpen() const { return m_impl->m_display != nullptr; }
const std::string& X11Input::getLastError() const { return m_impl->m_lastError; }

void X11Input::sendKey(const std::string& key) {
    pressKey(key);
    releaseKey(key);
}

void X11Input::pressKey(const std::string& key) { m_impl->keyEvent(key, true); }
void X11Input::releaseKey(const std::string& key) { m_impl->keyEvent(key, false); }
void X11Input::moveTo(const Point& p) { m_impl->move(p); }

void X11Input::moveAndClick(const Point& p) {
    m_impl->move(p);
    m_impl->click();
}

bool X11Input::isKeyDown(const std::string& key) { return m_impl->keyDown(key); }

// =============================================================================
// Game window
// =============================================================================

class X11GameWindow::Impl {
public:
    explicit Impl(const std::string& displayName) {
        m_display = XOpenDisplay(displayName.empty() ? nullptr : displayName.c_str());
        if (m_display) m_root = DefaultRootWindow(m_display);
    }

    ~Impl() {
        if (m_display) XCloseDisplay(m_display);
    }

    /// Searches _NET_CLIENT_LIST for a title containing needle
    Window find(const std::string& needle) {
        Atom clientList = XInternAtom(m_display, "_NET_CLIENT_LIST", True);
        if (clientList == None) return 0;

        Atom actualType = 0;
        int actualFormat = 0;
        unsigned long count = 0, bytesAfter = 0;
        unsigned char* data = nullptr;
        if (XGetWindowProperty(m_display, m_root, clientList, 0, 4096, False, XA_WINDOW,
                               &actualType, &actualFormat, &count, &bytesAfter, &data) != Success || !data) {
            return 0;
        }

        Window found = 0;
        auto* windows = reinterpret_cast<Window*>(data);
        for (unsigned long i = 0; i < count && !found; ++i) {
            char* name = nullptr;
            if (XFetchName(m_display, windows[i], &name) && name) {
                if (std::string(name).find(needle) != std::string::npos) found = windows[i];
                XFree(name);
            }
        }
        XFree(data);
        return found;
    }

    bool activate(Window w) {
        Atom activeWindow = XInternAtom(m_display, "_NET_ACTIVE_WINDOW", False);
        XEvent ev{};
        ev.xclient.type = ClientMessage;
        ev.xclient.window = w;
        ev.xclient.message_type = activeWindow;
        ev.xclient.format = 32;
        ev.xclient.data.l[0] = 1;   // source: application
        ev.xclient.data.l[1] = CurrentTime;
        Status st = XSendEvent(m_display, m_root, False,
                               SubstructureRedirectMask | SubstructureNotifyMask, &ev);
        XMapRaised(m_display, w);
        XFlush(m_display);
        return st != 0;
    }

    Display* m_display = nullptr;
    Window m_root = 0;
};

X11GameWindow::X11GameWindow(std::string title, const std::string& displayName)
    : m_title(std::move(title)), m_impl(std::make_unique<Impl>(displayName)) {}

X11GameWindow::~X11GameWindow() = default;

bool X11GameWindow::activate() {
    if (!m_impl->m_display) {
        logError("X11GameWindow: cannot open display");
        return false;
    }
    Window w = m_impl->find(m_title);
    if (!w) {
        logError("Game window not found: " + m_title);
        return false;
    }
    if (!m_impl->activate(w)) {
        logWarning("_NET_ACTIVE_WINDOW request failed for " + m_title);
        return false;
    }
    logInfo("Activated window: " + m_title);
    return true;
}

} // namespace btd6_pilot
