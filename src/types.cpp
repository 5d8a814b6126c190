/**
 * @file types.cpp
 * @brief Helpers for the action variant and upgrade paths
 */

#include "types.h"

#include <sstream>

namespace btd6_pilot {

std::string pathKey(UpgradePath path) {
    return "path_" + std::to_string(static_cast<int>(path) + 1);
}

std::optional<UpgradePath> parsePathKey(const std::string& key) {
    if (key == "path_1") return UpgradePath::Path1;
    if (key == "path_2") return UpgradePath::Path2;
    if (key == "path_3") return UpgradePath::Path3;
    return std::nullopt;
}

int actionStep(const Action& action) {
    return std::visit([](const auto& a) { return a.step; }, action);
}

const std::string& actionTarget(const Action& action) {
    return std::visit([](const auto& a) -> const std::string& { return a.target; }, action);
}

std::string describeAction(const Action& action) {
    std::ostringstream oss;
    if (const auto* buy = std::get_if<BuyAction>(&action)) {
        oss << "step " << buy->step << ": buy " << buy->target
            << " at (" << buy->position.x << ", " << buy->position.y << ")";
        if (buy->hotkey) oss << " key '" << *buy->hotkey << "'";
    } else if (const auto* up = std::get_if<UpgradeAction>(&action)) {
        oss << "step " << up->step << ": upgrade " << up->target
            << " " << pathKey(up->path) << " -> " << up->tier;
    }
    return oss.str();
}

} // namespace btd6_pilot
