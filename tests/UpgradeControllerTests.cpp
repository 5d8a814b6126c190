#define BOOST_TEST_MODULE UpgradeControllerTests
#include <boost/test/unit_test.hpp>

#include "control/run_state.h"
#include "control/upgrade_controller.h"
#include "errors.h"
#include "mocks/MockDesktop.hpp"

#include <chrono>
#include <map>
#include <memory>
#include <string>

using namespace btd6_pilot;
using namespace btd6_pilot::testing;
using std::chrono::milliseconds;

namespace {

const Point kDartPosition{640, 360};

GlobalConfig testConfig() {
    GlobalConfig c;
    c.retries.retryDelay = milliseconds(300);
    return c;
}

struct UpgradeFixture {
    GlobalConfig config = testConfig();
    std::shared_ptr<FakeCapture> fake = std::make_shared<FakeCapture>();
    MockInput input;
    SleepRecorder sleeper;
    RetryingCapture capture{fake, 1, milliseconds(0), noSleep()};
    RetryExecutor executor{capture, sleeper.fn()};
    RegionTargeting targeting{executor, input};
    SimulatedGame game{*fake, input, config.vision.selectRegion, config.vision.placeRegion1,
                       config.vision.placeRegion2, config.vision.cursorRestingSpot};
    UpgradeStateStore state;
    std::map<std::string, Point> positions{{"Dart Monkey 01", kDartPosition}};
    UpgradeController controller{executor, targeting, input, state,
                                 [this](const std::string& name) -> std::optional<Point> {
                                     auto it = positions.find(name);
                                     if (it == positions.end()) return std::nullopt;
                                     return it->second;
                                 },
                                 UpgradeConfig::fromSettings(config, config.timing)};

    UpgradeFixture() { game.addTower(kDartPosition); }

    static UpgradeAction upgrade(UpgradePath path, int tier, const std::string& target = "Dart Monkey 01") {
        UpgradeAction a;
        a.step = 20;
        a.target = target;
        a.path = path;
        a.tier = tier;
        return a;
    }
};

} // anonymous namespace

BOOST_AUTO_TEST_SUITE(UpgradeStateStoreTests)

BOOST_AUTO_TEST_CASE(UnknownEntityStartsAtZero) {
    UpgradeStateStore store;
    BOOST_CHECK(!store.contains("Ninja Monkey 01"));
    BOOST_CHECK(store.tiers("Ninja Monkey 01") == UpgradeTiers{});
    BOOST_CHECK(store.contains("Ninja Monkey 01"));
}

BOOST_AUTO_TEST_CASE(CommitOnlyAdvancesByOne) {
    UpgradeStateStore store;
    BOOST_CHECK(!store.commit("Dart Monkey 01", UpgradePath::Path2, 2));
    BOOST_CHECK(store.commit("Dart Monkey 01", UpgradePath::Path2, 1));
    BOOST_CHECK(!store.commit("Dart Monkey 01", UpgradePath::Path2, 1));
    BOOST_CHECK(store.commit("Dart Monkey 01", UpgradePath::Path2, 2));
    BOOST_CHECK_EQUAL(store.tier("Dart Monkey 01", UpgradePath::Path2), 2);
    BOOST_CHECK_EQUAL(store.tier("Dart Monkey 01", UpgradePath::Path1), 0);
}

BOOST_AUTO_TEST_CASE(CommitStopsAtMaxTier) {
    UpgradeStateStore store;
    for (int t = 1; t <= kMaxTier; ++t) {
        BOOST_CHECK(store.commit("Sniper Monkey 01", UpgradePath::Path1, t));
    }
    BOOST_CHECK(!store.commit("Sniper Monkey 01", UpgradePath::Path1, kMaxTier + 1));
    BOOST_CHECK_EQUAL(store.snapshot().at("Sniper Monkey 01").get(UpgradePath::Path1), kMaxTier);
}

BOOST_AUTO_TEST_CASE(StepTrackerSetsOnlyGrow) {
    StepTracker steps;
    steps.markCompleted(10);
    steps.markRejected(30);
    steps.markCompleted(10);

    BOOST_CHECK(steps.isCompleted(10));
    BOOST_CHECK(steps.isRejected(30));
    BOOST_CHECK(steps.isDone(10));
    BOOST_CHECK(steps.isDone(30));
    BOOST_CHECK(!steps.isDone(20));
    BOOST_CHECK_EQUAL(steps.completed().size(), 1u);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(RunTests, UpgradeFixture)

BOOST_AUTO_TEST_CASE(FirstTierOnThirdPath) {
    UpgradeResult r = controller.run(upgrade(UpgradePath::Path3, 1));

    BOOST_CHECK(r.outcome == UpgradeOutcome::Completed);
    BOOST_CHECK(r.stepCompleted);
    BOOST_CHECK_EQUAL(r.previousTier, 0);
    BOOST_CHECK_EQUAL(r.newTier, 1);
    BOOST_CHECK_EQUAL(r.attempts, 1);

    UpgradeTiers expected;
    expected.set(UpgradePath::Path3, 1);
    BOOST_CHECK(state.tiers("Dart Monkey 01") == expected);

    BOOST_CHECK_EQUAL(input.keyCount("/"), 1);
    BOOST_CHECK_EQUAL(input.clicksAt(kDartPosition), 1);
    BOOST_REQUIRE(!input.events.empty());
    BOOST_CHECK(input.events.back().point == config.vision.cursorRestingSpot);
}

BOOST_AUTO_TEST_CASE(LowerRequestedTierIsANoOp) {
    state.commit("Dart Monkey 01", UpgradePath::Path1, 1);
    state.commit("Dart Monkey 01", UpgradePath::Path1, 2);

    UpgradeResult r = controller.run(upgrade(UpgradePath::Path1, 1));

    BOOST_CHECK(r.outcome == UpgradeOutcome::AlreadySatisfied);
    BOOST_CHECK(r.stepCompleted);
    BOOST_CHECK_EQUAL(state.tier("Dart Monkey 01", UpgradePath::Path1), 2);
    BOOST_CHECK(input.events.empty());
}

BOOST_AUTO_TEST_CASE(MultiTierRequestAdvancesOnePerCall) {
    const UpgradeAction action = upgrade(UpgradePath::Path2, 3);

    UpgradeResult first = controller.run(action);
    BOOST_CHECK(first.outcome == UpgradeOutcome::Advanced);
    BOOST_CHECK(!first.stepCompleted);

    UpgradeResult second = controller.run(action);
    BOOST_CHECK(second.outcome == UpgradeOutcome::Advanced);
    BOOST_CHECK_EQUAL(second.newTier, 2);

    UpgradeResult third = controller.run(action);
    BOOST_CHECK(third.outcome == UpgradeOutcome::Completed);
    BOOST_CHECK(third.stepCompleted);
    BOOST_CHECK_EQUAL(state.tier("Dart Monkey 01", UpgradePath::Path2), 3);
    BOOST_CHECK_EQUAL(input.keyCount("."), 3);

    UpgradeResult fourth = controller.run(action);
    BOOST_CHECK(fourth.outcome == UpgradeOutcome::AlreadySatisfied);
    BOOST_CHECK_EQUAL(input.keyCount("."), 3);
}

BOOST_AUTO_TEST_CASE(InvalidActionsAreRejectedBeforeInput) {
    BOOST_CHECK_THROW(controller.run(upgrade(UpgradePath::Path1, 0)), UpgradeStateError);
    BOOST_CHECK_THROW(controller.run(upgrade(UpgradePath::Path1, 6)), UpgradeStateError);
    BOOST_CHECK_THROW(controller.run(upgrade(UpgradePath::Path1, 1, "")), UpgradeStateError);
    BOOST_CHECK(input.events.empty());
}

BOOST_AUTO_TEST_CASE(UnknownTowerIsRejected) {
    try {
        controller.run(upgrade(UpgradePath::Path1, 1, "Ninja Monkey 07"));
        BOOST_FAIL("expected UpgradeStateError");
    } catch (const UpgradeStateError& e) {
        BOOST_CHECK_EQUAL(e.target(), "Ninja Monkey 07");
        BOOST_CHECK(std::string(e.what()).find("No position found for tower 'Ninja Monkey 07'") !=
                    std::string::npos);
    }
    BOOST_CHECK(input.events.empty());
    BOOST_CHECK(!state.contains("Ninja Monkey 07"));
}

BOOST_AUTO_TEST_CASE(UnverifiedUpgradeLeavesStateUntouched) {
    game.focusLossKeys = -1;

    try {
        controller.run(upgrade(UpgradePath::Path1, 1));
        BOOST_FAIL("expected UpgradeVerificationError");
    } catch (const UpgradeVerificationError& e) {
        BOOST_CHECK_EQUAL(e.target(), "Dart Monkey 01");
        BOOST_CHECK(e.path() == UpgradePath::Path1);
        BOOST_CHECK_EQUAL(e.tier(), 1);
        BOOST_CHECK_EQUAL(e.attempts(), config.retries.maxRetries);
    }

    BOOST_CHECK_EQUAL(state.tier("Dart Monkey 01", UpgradePath::Path1), 0);
    BOOST_CHECK_EQUAL(input.keyCount(","), config.retries.maxRetries);
    BOOST_CHECK(input.events.back().point == config.vision.cursorRestingSpot);
    // Policy delay between presses, not after the last one
    BOOST_CHECK_EQUAL(sleeper.count(milliseconds(300)), config.retries.maxRetries - 1);
}

BOOST_AUTO_TEST_CASE(VerificationComparesAgainstPanelBeforeTargeting) {
    const Region& panel = config.vision.placeRegion1;
    // Closed panel, then the panel opened by the targeting click
    fake->script(panel, {solidFrame(0), solidFrame(255)});
    // After the key only one row of the open panel changes: 10% against the
    // open panel, 90% against the closed one
    fake->setRegionDefault(panel, bandedFrame(255, 0, 1));

    UpgradeResult r = controller.run(upgrade(UpgradePath::Path1, 1));

    BOOST_CHECK(r.outcome == UpgradeOutcome::Completed);
    BOOST_CHECK_EQUAL(r.attempts, 1);
    BOOST_CHECK_EQUAL(input.keyCount(","), 1);
    BOOST_CHECK_EQUAL(state.tier("Dart Monkey 01", UpgradePath::Path1), 1);
}

BOOST_AUTO_TEST_CASE(UnfocusedTowerSendsNoUpgradeKey) {
    game.ignorePanelClicks = true;

    BOOST_CHECK_THROW(controller.run(upgrade(UpgradePath::Path1, 1)), UpgradeVerificationError);
    BOOST_CHECK_EQUAL(input.keyCount(","), 0);
    BOOST_CHECK_EQUAL(input.clicksAt(kDartPosition), config.vision.maxAttempts);
    BOOST_CHECK_EQUAL(state.tier("Dart Monkey 01", UpgradePath::Path1), 0);
    BOOST_CHECK(input.events.back().point == config.vision.cursorRestingSpot);
}

BOOST_AUTO_TEST_CASE(PanelOnRightSideIsVerified) {
    game.panelSide = 1;

    UpgradeResult r = controller.run(upgrade(UpgradePath::Path1, 1));
    BOOST_CHECK(r.outcome == UpgradeOutcome::Completed);
    BOOST_CHECK_EQUAL(state.tier("Dart Monkey 01", UpgradePath::Path1), 1);
}

BOOST_AUTO_TEST_CASE(PathsAreIndependent) {
    controller.run(upgrade(UpgradePath::Path1, 1));
    controller.run(upgrade(UpgradePath::Path3, 1));

    UpgradeTiers t = state.tiers("Dart Monkey 01");
    BOOST_CHECK_EQUAL(t.get(UpgradePath::Path1), 1);
    BOOST_CHECK_EQUAL(t.get(UpgradePath::Path2), 0);
    BOOST_CHECK_EQUAL(t.get(UpgradePath::Path3), 1);
}

BOOST_AUTO_TEST_SUITE_END()
