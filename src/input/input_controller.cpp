/**
 * @file input_controller.cpp
 * @brief Cursor guard and platform backend selection
 */

#include "input/input_controller.h"
#include "errors.h"
#include "utils/logger.h"

#if defined(_WIN32)
#include "input/win32_input.h"
#elif defined(BTD6P_HAS_X11)
#include "input/x11_input.h"
#endif

#include <exception>

namespace btd6_pilot {

CursorRestGuard::~CursorRestGuard() {
    if (!m_active) return;
    try {
        m_input.moveAndClick(m_restingSpot);
    } catch (const std::exception& e) {
        logWarning(std::string("Failed to move cursor to resting spot ") + formatPoint(m_restingSpot) + ": " + e.what());
    }
}

std::shared_ptr<InputController> createPlatformInput() {
#if defined(_WIN32)
    return std::make_shared<Win32Input>();
#elif defined(BTD6P_HAS_X11)
    auto input = std::make_shared<X11Input>();
    if (!input->isOpen()) {
        logError("X11Input: " + input->getLastError());
        return nullptr;
    }
    return input;
#else
    return nullptr;
#endif
}

std::shared_ptr<GameWindow> createPlatformWindow(const std::string& title) {
#if defined(_WIN32)
    return std::make_shared<Win32GameWindow>(title);
#elif defined(BTD6P_HAS_X11)
    return std::make_shared<X11GameWindow>(title);
#else
    (void)title;
    return nullptr;
#endif
}

} // namespace btd6_pilot
