#define BOOST_TEST_MODULE RetryExecutorTests
#include <boost/test/unit_test.hpp>

#include "control/retry_executor.h"
#include "errors.h"
#include "vision/image_comparator.h"
#include "mocks/MockDesktop.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <vector>

using namespace btd6_pilot;
using namespace btd6_pilot::testing;
using std::chrono::milliseconds;

namespace {

struct ExecutorFixture {
    std::shared_ptr<FakeCapture> fake = std::make_shared<FakeCapture>();
    SleepRecorder sleeper;
    RetryingCapture capture{fake, 1, milliseconds(0), noSleep()};
    RetryExecutor executor{capture, sleeper.fn()};
    vision::ConfirmFn confirm = vision::makeConfirmFn();
    Region region{100, 100, 10, 10};
    int actions = 0;

    std::function<void()> action() {
        return [this]() { ++actions; };
    }
};

} // anonymous namespace

BOOST_FIXTURE_TEST_SUITE(RetryConfirmTests, ExecutorFixture)

BOOST_AUTO_TEST_CASE(ConfirmsOnFirstAttempt) {
    fake->script(region, {solidFrame(0), solidFrame(255)});

    BOOST_CHECK(executor.retryConfirm(action(), region, 40.0, 3, milliseconds(200), confirm));
    BOOST_CHECK_EQUAL(actions, 1);
    BOOST_CHECK_EQUAL(executor.lastAttempts(), 1);
    BOOST_CHECK_EQUAL(fake->grabCount(region), 2);
}

BOOST_AUTO_TEST_CASE(RepeatsActionUntilConfirmed) {
    fake->script(region, {solidFrame(0), solidFrame(0), solidFrame(0), solidFrame(255)});

    BOOST_CHECK(executor.retryConfirm(action(), region, 40.0, 3, milliseconds(200), confirm));
    BOOST_CHECK_EQUAL(actions, 2);
    BOOST_CHECK_EQUAL(executor.lastAttempts(), 2);
}

BOOST_AUTO_TEST_CASE(GivesUpAfterMaxAttempts) {
    fake->setRegionDefault(region, solidFrame(0));

    BOOST_CHECK(!executor.retryConfirm(action(), region, 40.0, 3, milliseconds(200), confirm));
    BOOST_CHECK_EQUAL(actions, 3);
    BOOST_CHECK_EQUAL(executor.lastAttempts(), 3);
    BOOST_CHECK_EQUAL(sleeper.count(milliseconds(200)), 3);
}

BOOST_AUTO_TEST_CASE(FailedPreCaptureSkipsTheAction) {
    fake->script(region, {std::nullopt, solidFrame(0), solidFrame(255)});

    BOOST_CHECK(executor.retryConfirm(action(), region, 40.0, 3, milliseconds(50), confirm));
    BOOST_CHECK_EQUAL(actions, 1);
    BOOST_CHECK_EQUAL(executor.lastAttempts(), 2);
}

BOOST_AUTO_TEST_CASE(FailedPostCaptureOnlyFailsThatAttempt) {
    fake->script(region, {solidFrame(0), std::nullopt, solidFrame(0), solidFrame(255)});

    BOOST_CHECK(executor.retryConfirm(action(), region, 40.0, 3, milliseconds(50), confirm));
    BOOST_CHECK_EQUAL(actions, 2);
}

BOOST_AUTO_TEST_CASE(ChangeBelowThresholdIsNotConfirmed) {
    fake->script(region, {solidFrame(0), bandedFrame(0, 255, 3)});     // 30%
    fake->setRegionDefault(region, solidFrame(0));

    BOOST_CHECK(!executor.retryConfirm(action(), region, 40.0, 1, milliseconds(0), confirm));
    BOOST_CHECK_EQUAL(actions, 1);
}

BOOST_AUTO_TEST_CASE(PreCaptureActionPostCaptureOrder) {
    std::vector<std::string> log;
    fake->setEventLog(&log);
    fake->script(region, {solidFrame(0), solidFrame(255)});

    auto logged = [&log]() { log.push_back("action"); };
    BOOST_CHECK(executor.retryConfirm(logged, region, 40.0, 3, milliseconds(0), confirm));

    BOOST_REQUIRE_EQUAL(log.size(), 3u);
    BOOST_CHECK_EQUAL(log[0], "grab:100");
    BOOST_CHECK_EQUAL(log[1], "action");
    BOOST_CHECK_EQUAL(log[2], "grab:100");
}

BOOST_AUTO_TEST_CASE(ZeroAttemptsNeverActs) {
    fake->setRegionDefault(region, solidFrame(0));
    BOOST_CHECK(!executor.retryConfirm(action(), region, 40.0, 0, milliseconds(0), confirm));
    BOOST_CHECK_EQUAL(actions, 0);
    BOOST_CHECK_EQUAL(executor.lastAttempts(), 0);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(RetryingCaptureTests)

BOOST_AUTO_TEST_CASE(RetriesDroppedFramesWithinBudget) {
    auto fake = std::make_shared<FakeCapture>();
    Region region{0, 0, 10, 10};
    fake->script(region, {std::nullopt, std::nullopt, solidFrame(7)});
    SleepRecorder sleeper;
    RetryingCapture capture(fake, 3, milliseconds(50), sleeper.fn());

    std::optional<cv::Mat> img = capture.captureRegion(region);
    BOOST_REQUIRE(img.has_value());
    BOOST_CHECK_EQUAL(static_cast<int>(img->at<cv::Vec3b>(0, 0)[0]), 7);
    BOOST_CHECK_EQUAL(sleeper.count(milliseconds(50)), 2);

    CaptureStats stats = capture.getStats();
    BOOST_CHECK_EQUAL(stats.requests, 1u);
    BOOST_CHECK_EQUAL(stats.framesDropped, 2u);
    BOOST_CHECK_EQUAL(stats.framesReceived, 1u);
    BOOST_CHECK_EQUAL(stats.failures, 0u);
}

BOOST_AUTO_TEST_CASE(SurfacesNulloptAfterBudget) {
    auto fake = std::make_shared<FakeCapture>();
    Region region{0, 0, 10, 10};
    RetryingCapture capture(fake, 2, milliseconds(0), noSleep());

    BOOST_CHECK(!capture.captureRegion(region).has_value());
    BOOST_CHECK_EQUAL(fake->grabCount(region), 2);
    BOOST_CHECK_EQUAL(capture.getStats().failures, 1u);
    BOOST_CHECK_THROW(capture.captureRegionOrThrow(region), CaptureError);
}

BOOST_AUTO_TEST_CASE(InvalidRegionIsNeverGrabbed) {
    auto fake = std::make_shared<FakeCapture>();
    fake->setFrameFn([](const Region&) { return std::optional<cv::Mat>(solidFrame(1)); });
    RetryingCapture capture(fake, 3, milliseconds(0), noSleep());

    Region bad{0, 0, 0, 10};
    BOOST_CHECK(!capture.captureRegion(bad).has_value());
    BOOST_CHECK_EQUAL(fake->grabCount(bad), 0);
}

BOOST_AUTO_TEST_SUITE_END()
