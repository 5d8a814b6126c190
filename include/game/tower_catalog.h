#pragma once
/**
 * @file tower_catalog.h
 * @brief Static tower data: hotkeys, cost strings, upgrade cost tables
 */

#include "types.h"

#include <array>
#include <string>
#include <unordered_map>
#include <vector>

namespace btd6_pilot::game {

/// Upgrade cost per difficulty column: Easy, Medium, Hard, Impoppable
using CostRow = std::array<int, 4>;

struct TowerInfo {
    std::string name;                   ///< "Dart Monkey"
    std::string category;               ///< "Primary", "Military", ...
    std::string hotkey;                 ///< Single lower-case character, may be empty
    std::string costText;               ///< "$170 ( Easy ) $200 ( Medium ) ..."
    std::array<std::vector<CostRow>, kPathCount> upgradeCosts;  ///< Per path, index tier-1; empty if unknown
};

/**
 * @brief Read-only tower lookup by canonical name
 *
 * Expected format (data/btd6_towers.json):
 * {
 *   "Primary": {
 *     "Dart Monkey": {
 *       "hotkey": "Q",
 *       "cost": "$170 ( Easy ) $200 ( Medium ) $215 ( Hard ) $240 ( Impoppable )",
 *       "upgrade_costs": { "path_1": [[120, 140, 150, 170], ...], ... }
 *     }
 *   }
 * }
 */
class TowerCatalog {
public:
    TowerCatalog() = default;

    /**
     * @throws ConfigurationError on unreadable or malformed data
     */
    static TowerCatalog loadFromFile(const std::string& path);
    static TowerCatalog parse(const std::string& jsonText);

    const TowerInfo* find(const std::string& name) const;

    /**
     * @brief Hotkey for a canonical tower name, or fallback when unknown
     */
    std::string hotkeyFor(const std::string& name, const std::string& fallback) const;

    size_t size() const { return m_towers.size(); }
    bool empty() const { return m_towers.empty(); }

    void add(TowerInfo info);

private:
    std::unordered_map<std::string, TowerInfo> m_towers;
};

} // namespace btd6_pilot::game
