#pragma once
/**
 * @file costs.h
 * @brief Cost resolution by difficulty/mode and the affordability check
 */

#include "game/tower_catalog.h"
#include "types.h"

#include <map>
#include <optional>
#include <string>

namespace btd6_pilot::game {

/**
 * @brief Canonical "Easy"/"Medium"/"Hard" and "Standard"/"Impoppable" labels
 *
 * Known aliases are matched case-insensitively ("impop", "std"); anything
 * else is title-cased.
 */
GameSettings normalizeDifficultyMode(const GameSettings& settings);

/**
 * @brief "$170 ( Easy ) $200 ( Medium )" -> {Easy: 170, Medium: 200}
 */
std::map<std::string, int> parseCostString(const std::string& text);

/**
 * @brief Strip the numeric disambiguator: "Dart Monkey 01" -> "Dart Monkey"
 */
std::string canonicalEntityName(const std::string& displayName);

/**
 * @brief Column into a CostRow: Impoppable mode on Hard selects 3,
 *        otherwise the difficulty, falling back to Medium
 */
int costColumn(const GameSettings& settings);

std::optional<int> resolveTowerCost(const TowerInfo& tower, const GameSettings& settings);
std::optional<int> resolveUpgradeCost(const TowerInfo& tower, UpgradePath path, int tier,
                                      const GameSettings& settings);

/**
 * @brief Fail-closed affordability: missing data means unaffordable (logged)
 *
 * Upgrades are priced at the requested tier.
 */
bool canAfford(int money, const Action& action, const GameSettings& settings, const TowerCatalog& catalog);

} // namespace btd6_pilot::game
