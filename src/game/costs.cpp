/**
 * @file costs.cpp
 * @brief Cost parsing and affordability
 */

#include "game/costs.h"
#include "utils/logger.h"

#include <algorithm>
#include <cctype>
#include <regex>

namespace btd6_pilot::game {

namespace {

const std::regex kCostRegex(R"(\$(\d+) \( ([^)]+) \))");
const std::regex kSuffixRegex(R"(\s+\d+$)");

std::string trim(const std::string& s) {
    size_t b = 0, e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return (char)std::tolower(c); });
    return s;
}

std::string titleCase(const std::string& s) {
    std::string out = s;
    bool startOfWord = true;
    for (char& c : out) {
        const unsigned char uc = static_cast<unsigned char>(c);
        if (std::isalpha(uc)) {
            c = startOfWord ? (char)std::toupper(uc) : (char)std::tolower(uc);
            startOfWord = false;
        } else {
            startOfWord = true;
        }
    }
    return out;
}

} // namespace

GameSettings normalizeDifficultyMode(const GameSettings& settings) {
    const std::string d = lower(trim(settings.difficulty));
    const std::string m = lower(trim(settings.mode));

    GameSettings out;
    if (d == "easy") out.difficulty = "Easy";
    else if (d == "medium") out.difficulty = "Medium";
    else if (d == "hard") out.difficulty = "Hard";
    else out.difficulty = titleCase(settings.difficulty);

    if (m == "standard" || m == "std") out.mode = "Standard";
    else if (m == "impoppable" || m == "impop") out.mode = "Impoppable";
    else out.mode = titleCase(settings.mode);
    return out;
}

std::map<std::string, int> parseCostString(const std::string& text) {
    std::map<std::string, int> costs;
    for (auto it = std::sregex_iterator(text.begin(), text.end(), kCostRegex); it != std::sregex_iterator(); ++it) {
        const std::smatch& m = *it;
        try {
            costs[trim(m[2].str())] = std::stoi(m[1].str());
        } catch (const std::out_of_range&) {
            logWarning("Cost value out of range in '" + text + "'");
        }
    }
    return costs;
}

std::string canonicalEntityName(const std::string& displayName) {
    return trim(std::regex_replace(displayName, kSuffixRegex, ""));
}

int costColumn(const GameSettings& settings) {
    const GameSettings n = normalizeDifficultyMode(settings);
    if (n.mode == "Impoppable" && n.difficulty == "Hard") return 3;
    if (n.difficulty == "Easy") return 0;
    if (n.difficulty == "Medium") return 1;
    if (n.difficulty == "Hard") return 2;
    if (n.difficulty == "Impoppable") return 3;
    return 1;
}

std::optional<int> resolveTowerCost(const TowerInfo& tower, const GameSettings& settings) {
    const auto costs = parseCostString(tower.costText);
    const GameSettings n = normalizeDifficultyMode(settings);

    if (n.mode == "Impoppable" && n.difficulty == "Hard") {
        auto it = costs.find("Impoppable");
        if (it == costs.end()) return std::nullopt;
        return it->second;
    }
    auto it = costs.find(n.difficulty);
    if (it != costs.end()) return it->second;
    it = costs.find("Medium");
    if (it != costs.end()) return it->second;
    return std::nullopt;
}

std::optional<int> resolveUpgradeCost(const TowerInfo& tower, UpgradePath path, int tier,
                                      const GameSettings& settings) {
    if (tier < 1 || tier > kMaxTier) return std::nullopt;
    const auto& rows = tower.upgradeCosts[static_cast<size_t>(path)];
    if (static_cast<int>(rows.size()) < tier) return std::nullopt;
    return rows[static_cast<size_t>(tier - 1)][static_cast<size_t>(costColumn(settings))];
}

bool canAfford(int money, const Action& action, const GameSettings& settings, const TowerCatalog& catalog) {
    const std::string towerName = canonicalEntityName(actionTarget(action));
    const TowerInfo* tower = catalog.find(towerName);
    if (!tower) {
        logWarning("Tower data not found for " + towerName);
        return false;
    }

    std::optional<int> cost;
    if (const auto* up = std::get_if<UpgradeAction>(&action)) {
        cost = resolveUpgradeCost(*tower, up->path, up->tier, settings);
        if (!cost) {
            logWarning("Upgrade cost not found for " + towerName + " " + pathKey(up->path) +
                       " tier " + std::to_string(up->tier) + " (" + settings.difficulty + ", " + settings.mode + ")");
            return false;
        }
    } else {
        cost = resolveTowerCost(*tower, settings);
        if (!cost) {
            logWarning("Cost not found for " + towerName + " (" + settings.difficulty + ", " + settings.mode + ")");
            return false;
        }
    }
    return money >= *cost;
}

} // namespace btd6_pilot::game
