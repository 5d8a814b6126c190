#define BOOST_TEST_MODULE RetryPolicyTests
#include <boost/test/unit_test.hpp>

#include "control/retry_policy.h"
#include "errors.h"
#include "mocks/MockDesktop.hpp"

#include <chrono>
#include <optional>
#include <stdexcept>

using namespace btd6_pilot;
using namespace btd6_pilot::testing;
using std::chrono::milliseconds;

BOOST_AUTO_TEST_SUITE(DelayTests)

BOOST_AUTO_TEST_CASE(ExponentialBackoffIsCapped) {
    RetryPolicy policy;
    policy.baseDelay = milliseconds(100);
    policy.backoffFactor = 2.0;
    policy.maxDelay = milliseconds(1000);

    BOOST_CHECK(policy.delayFor(1) == milliseconds(100));
    BOOST_CHECK(policy.delayFor(2) == milliseconds(200));
    BOOST_CHECK(policy.delayFor(3) == milliseconds(400));
    BOOST_CHECK(policy.delayFor(4) == milliseconds(800));
    BOOST_CHECK(policy.delayFor(5) == milliseconds(1000));
}

BOOST_AUTO_TEST_CASE(FlatPolicyKeepsBaseDelay) {
    RetryPolicy policy;
    policy.baseDelay = milliseconds(250);
    policy.backoffFactor = 1.0;

    BOOST_CHECK(policy.delayFor(1) == milliseconds(250));
    BOOST_CHECK(policy.delayFor(4) == milliseconds(250));
}

BOOST_AUTO_TEST_CASE(FactorBelowOneIsTreatedAsFlat) {
    RetryPolicy policy;
    policy.baseDelay = milliseconds(300);
    policy.backoffFactor = 0.5;
    BOOST_CHECK(policy.delayFor(3) == milliseconds(300));
}

BOOST_AUTO_TEST_CASE(FromSettingsCopiesEveryField) {
    RetrySettings s;
    s.maxRetries = 5;
    s.retryDelay = milliseconds(750);
    s.backoffFactor = 1.5;
    s.maxDelay = milliseconds(3000);

    RetryPolicy p = RetryPolicy::fromSettings(s);
    BOOST_CHECK_EQUAL(p.maxAttempts, 5);
    BOOST_CHECK(p.baseDelay == milliseconds(750));
    BOOST_CHECK_EQUAL(p.backoffFactor, 1.5);
    BOOST_CHECK(p.maxDelay == milliseconds(3000));
    BOOST_CHECK(p.delayFor(2) == milliseconds(1125));
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(ClassificationTests)

BOOST_AUTO_TEST_CASE(CaptureFailuresAreRetryable) {
    BOOST_CHECK(classifyDefault(CaptureError(Region{0, 0, 10, 10})) == ErrorClass::Retryable);
    BOOST_CHECK(classifyDefault(RetryExhaustedError("inner", 2, "x")) == ErrorClass::Retryable);
}

BOOST_AUTO_TEST_CASE(EverythingElseIsFatal) {
    BOOST_CHECK(classifyDefault(ConfigurationError("bad")) == ErrorClass::Fatal);
    BOOST_CHECK(classifyDefault(UpgradeStateError("bad", "Dart Monkey 01")) == ErrorClass::Fatal);
    BOOST_CHECK(classifyDefault(std::runtime_error("boom")) == ErrorClass::Fatal);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(RunWithRetryTests)

BOOST_AUTO_TEST_CASE(ReturnsFirstValue) {
    SleepRecorder sleeper;
    RetryPolicy policy;
    policy.maxAttempts = 5;
    policy.baseDelay = milliseconds(10);

    int calls = 0;
    std::function<std::optional<int>()> fn = [&calls]() -> std::optional<int> {
        ++calls;
        if (calls < 3) return std::nullopt;
        return 42;
    };

    BOOST_CHECK_EQUAL(runWithRetry<int>(policy, "answer", fn, sleeper.fn()), 42);
    BOOST_CHECK_EQUAL(calls, 3);
    BOOST_CHECK_EQUAL(sleeper.sleeps.size(), 2u);
}

BOOST_AUTO_TEST_CASE(RetryableExceptionsConsumeAttempts) {
    SleepRecorder sleeper;
    RetryPolicy policy;
    policy.maxAttempts = 3;
    policy.baseDelay = milliseconds(100);
    policy.backoffFactor = 2.0;

    int calls = 0;
    std::function<std::optional<bool>()> fn = [&calls]() -> std::optional<bool> {
        ++calls;
        throw CaptureError(Region{0, 0, 10, 10});
    };

    try {
        runWithRetry<bool>(policy, "capture", fn, sleeper.fn());
        BOOST_FAIL("expected RetryExhaustedError");
    } catch (const RetryExhaustedError& e) {
        BOOST_CHECK_EQUAL(e.attempts(), 3);
        BOOST_CHECK(e.lastError().find("Failed to capture") != std::string::npos);
    }
    BOOST_CHECK_EQUAL(calls, 3);
    BOOST_REQUIRE_EQUAL(sleeper.sleeps.size(), 2u);
    BOOST_CHECK(sleeper.sleeps[0] == milliseconds(100));
    BOOST_CHECK(sleeper.sleeps[1] == milliseconds(200));
}

BOOST_AUTO_TEST_CASE(FatalExceptionsPropagateImmediately) {
    RetryPolicy policy;
    policy.maxAttempts = 4;

    int calls = 0;
    std::function<std::optional<int>()> fn = [&calls]() -> std::optional<int> {
        ++calls;
        throw ConfigurationError("missing key", "vision");
    };

    BOOST_CHECK_THROW(runWithRetry<int>(policy, "load", fn, noSleep()), ConfigurationError);
    BOOST_CHECK_EQUAL(calls, 1);
}

BOOST_AUTO_TEST_CASE(CustomClassifierCanRetryAnything) {
    RetryPolicy policy;
    policy.maxAttempts = 2;
    policy.classify = [](const std::exception&) { return ErrorClass::Retryable; };

    int calls = 0;
    std::function<std::optional<int>()> fn = [&calls]() -> std::optional<int> {
        ++calls;
        throw std::runtime_error("flaky");
    };

    BOOST_CHECK_THROW(runWithRetry<int>(policy, "flaky", fn, noSleep()), RetryExhaustedError);
    BOOST_CHECK_EQUAL(calls, 2);
}

BOOST_AUTO_TEST_CASE(NonPositiveBudgetStillTriesOnce) {
    RetryPolicy policy;
    policy.maxAttempts = 0;

    int calls = 0;
    std::function<std::optional<int>()> fn = [&calls]() -> std::optional<int> {
        ++calls;
        return 7;
    };
    BOOST_CHECK_EQUAL(runWithRetry<int>(policy, "once", fn, noSleep()), 7);
    BOOST_CHECK_EQUAL(calls, 1);
}

BOOST_AUTO_TEST_SUITE_END()
