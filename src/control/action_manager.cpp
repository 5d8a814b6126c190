/**
 * @file action_manager.cpp
 * @brief Action plan bookkeeping and dispatch
 */

#include "control/action_manager.h"
#include "errors.h"
#include "game/costs.h"
#include "utils/logger.h"

#include <variant>

namespace btd6_pilot {

namespace {

// Overload set for std::visit
template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

} // anonymous namespace

ActionManager::ActionManager(MapConfig map, AutomationContext context)
    : m_map(std::move(map))
    , m_ctx(std::move(context))
    , m_timing(m_map.timing ? *m_map.timing : m_ctx.config.timing)
    , m_executor(m_ctx.capture, m_ctx.sleep, m_ctx.debugImages)
    , m_targeting(m_executor, m_ctx.input)
    , m_placement(m_executor, m_targeting, m_ctx.input,
                  PlacementConfig::fromSettings(m_ctx.config.vision, m_timing), m_ctx.profiler)
    , m_upgrades(m_executor, m_targeting, m_ctx.input, m_state,
                 [this](const std::string& name) { return getEntityPosition(name); },
                 UpgradeConfig::fromSettings(m_ctx.config, m_timing), m_ctx.profiler) {
    buildPositionLookup();
    logInfo("Action plan for " + m_map.mapName + ": " + std::to_string(m_map.prePlayActions.size()) +
            " pre-play, " + std::to_string(m_map.actions.size()) + " main actions, " +
            std::to_string(m_positions.size()) + " known positions");
}

void ActionManager::buildPositionLookup() {
    // Pre-play first so a main-list buy of the same name wins
    for (const auto* list : {&m_map.prePlayActions, &m_map.actions}) {
        for (const Action& action : *list) {
            if (const auto* buy = std::get_if<BuyAction>(&action)) {
                m_positions[buy->target] = buy->position;
            }
        }
    }
    if (!m_map.hero.name.empty() && m_map.hero.position) {
        m_positions.emplace(m_map.hero.name, *m_map.hero.position);
    }
}

const Action* ActionManager::getNextAction() const {
    const Action* best = nullptr;
    for (const Action& action : m_map.actions) {
        const int step = actionStep(action);
        if (m_steps.isDone(step)) continue;
        if (!best || step < actionStep(*best)) best = &action;
    }
    return best;
}

void ActionManager::markCompleted(int step) {
    m_steps.markCompleted(step);
    logDebug("Step " + std::to_string(step) + " completed");
}

void ActionManager::markRejected(int step) {
    m_steps.markRejected(step);
    logWarning("Step " + std::to_string(step) + " rejected and will be skipped");
}

size_t ActionManager::stepsRemaining() const {
    size_t n = 0;
    for (const Action& action : m_map.actions) {
        if (!m_steps.isDone(actionStep(action))) ++n;
    }
    return n;
}

std::optional<Point> ActionManager::getEntityPosition(const std::string& name) const {
    auto it = m_positions.find(name);
    if (it == m_positions.end()) return std::nullopt;
    return it->second;
}

UpgradeTiers ActionManager::upgradeTiers(const std::string& name) {
    return m_state.tiers(name);
}

void ActionManager::validate(const Action& action) const {
    const auto* upgrade = std::get_if<UpgradeAction>(&action);
    if (!upgrade) return;
    UpgradeController::validate(*upgrade);
    if (!getEntityPosition(upgrade->target)) {
        throw UpgradeStateError("No position found for tower '" + upgrade->target + "'", upgrade->target);
    }
}

bool ActionManager::canAfford(int money, const Action& action) const {
    return game::canAfford(money, action, m_map.game, m_ctx.catalog);
}

std::string ActionManager::resolveHotkey(const BuyAction& action) const {
    if (action.hotkey && !action.hotkey->empty()) return *action.hotkey;
    return m_ctx.catalog.hotkeyFor(game::canonicalEntityName(action.target),
                                   m_ctx.config.hotkeys.defaultMonkeyKey);
}

PlacementOutcome ActionManager::placeBuy(const BuyAction& action) {
    PlacementRequest request;
    request.target = action.target;
    request.position = action.position;
    request.hotkey = resolveHotkey(action);
    request.kind = EntityKind::Monkey;
    PlacementOutcome outcome = m_placement.place(request);
    if (outcome.phase != PlacementPhase::Done) {
        logWarning("Monkey placement did not complete for " + action.target + " at " +
                   formatPoint(action.position));
    }
    return outcome;
}

bool ActionManager::execute(const Action& action) {
    logInfo("Executing " + describeAction(action));

    const bool completed = std::visit(Overloaded{
        [this](const BuyAction& buy) {
            placeBuy(buy);
            return true;
        },
        [this](const UpgradeAction& upgrade) {
            return m_upgrades.run(upgrade).stepCompleted;
        }
    }, action);

    if (completed) markCompleted(actionStep(action));
    return completed;
}

void ActionManager::runPrePlay() {
    const HeroConfig& hero = m_map.hero;
    if (hero.position) {
        PlacementRequest request;
        request.target = hero.name.empty() ? "hero" : hero.name;
        request.position = *hero.position;
        request.hotkey = hero.hotkey.empty() ? m_ctx.config.hotkeys.heroKey : hero.hotkey;
        request.kind = EntityKind::Hero;

        PlacementOutcome outcome = m_placement.place(request);
        if (outcome.phase != PlacementPhase::Done) {
            logWarning("Hero placement did not complete for " + request.target + " at " +
                       formatPoint(request.position));
        }
        m_ctx.sleep(m_timing.placementDelay);
    }

    for (const Action& action : m_map.prePlayActions) {
        if (const auto* buy = std::get_if<BuyAction>(&action)) {
            placeBuy(*buy);
        } else {
            logWarning("Ignoring non-buy pre-play action: " + describeAction(action));
        }
    }
}

} // namespace btd6_pilot
