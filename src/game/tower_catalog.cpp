/**
 * @file tower_catalog.cpp
 * @brief Tower data loading
 */

#include "game/tower_catalog.h"
#include "errors.h"
#include "utils/logger.h"

#include <nlohmann/json.hpp>

#include <cctype>
#include <fstream>
#include <sstream>

namespace btd6_pilot::game {

using json = nlohmann::json;

namespace {

TowerCatalog fromJson(const json& root, const std::string& source) {
    if (!root.is_object()) {
        throw ConfigurationError("Tower data must be an object of categories: " + source, source);
    }

    TowerCatalog catalog;
    for (const auto& category : root.items()) {
        if (!category.value().is_object()) continue;
        for (const auto& entry : category.value().items()) {
            const json& t = entry.value();
            if (!t.is_object()) continue;

            TowerInfo info;
            info.name = t.value("name", entry.key());
            info.category = category.key();
            info.costText = t.value("cost", "");
            std::string hotkey = t.value("hotkey", "");
            if (!hotkey.empty()) {
                info.hotkey = std::string(1, (char)std::tolower(static_cast<unsigned char>(hotkey[0])));
            }

            if (t.contains("upgrade_costs") && t.at("upgrade_costs").is_object()) {
                for (const auto& path : t.at("upgrade_costs").items()) {
                    auto p = parsePathKey(path.key());
                    if (!p) {
                        logWarning("Tower " + info.name + ": ignoring upgrade costs for '" + path.key() + "'");
                        continue;
                    }
                    try {
                        auto rows = path.value().get<std::vector<CostRow>>();
                        info.upgradeCosts[static_cast<size_t>(*p)] = rows;
                    } catch (const json::exception& e) {
                        logWarning("Tower " + info.name + ": bad upgrade costs for " + path.key() + ": " + e.what());
                    }
                }
            }
            catalog.add(std::move(info));
        }
    }
    return catalog;
}

} // namespace

TowerCatalog TowerCatalog::loadFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.good()) {
        throw ConfigurationError("Cannot open tower data: " + path, path);
    }
    try {
        return fromJson(json::parse(file), path);
    } catch (const json::exception& e) {
        throw ConfigurationError("Error parsing tower data " + path + ": " + e.what(), path);
    }
}

TowerCatalog TowerCatalog::parse(const std::string& jsonText) {
    try {
        return fromJson(json::parse(jsonText), "<string>");
    } catch (const json::exception& e) {
        throw ConfigurationError(std::string("Error parsing tower data: ") + e.what(), "towers");
    }
}

void TowerCatalog::add(TowerInfo info) {
    std::string key = info.name;
    m_towers[key] = std::move(info);
}

const TowerInfo* TowerCatalog::find(const std::string& name) const {
    auto it = m_towers.find(name);
    return it == m_towers.end() ? nullptr : &it->second;
}

std::string TowerCatalog::hotkeyFor(const std::string& name, const std::string& fallback) const {
    const TowerInfo* info = find(name);
    if (!info || info->hotkey.empty()) return fallback;
    return info->hotkey;
}

} // namespace btd6_pilot::game
