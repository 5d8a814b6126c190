#define BOOST_TEST_MODULE CurrencyReaderTests
#include <boost/test/unit_test.hpp>

#include "control/currency_reader.h"
#include "control/kill_switch.h"
#include "vision/currency_ocr.h"
#include "mocks/MockDesktop.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace btd6_pilot;
using namespace btd6_pilot::testing;
using std::chrono::milliseconds;

namespace {

/// Polls `done` for up to two seconds
template <typename Pred>
bool waitFor(Pred done) {
    for (int i = 0; i < 400; ++i) {
        if (done()) return true;
        std::this_thread::sleep_for(milliseconds(5));
    }
    return done();
}

CurrencySource scripted(std::vector<std::optional<int>> values) {
    auto queue = std::make_shared<std::vector<std::optional<int>>>(std::move(values));
    auto index = std::make_shared<size_t>(0);
    return [queue, index]() -> std::optional<int> {
        if (*index >= queue->size()) return std::nullopt;
        return (*queue)[(*index)++];
    };
}

} // anonymous namespace

BOOST_AUTO_TEST_SUITE(CurrencyTextTests)

BOOST_AUTO_TEST_CASE(CleanupFixesCommonMisreads) {
    BOOST_CHECK_EQUAL(vision::cleanCurrencyText("$1,25O"), "1250");
    BOOST_CHECK_EQUAL(vision::cleanCurrencyText(" $ l2S "), "125");
    BOOST_CHECK_EQUAL(vision::cleanCurrencyText("Io0"), "100");
}

BOOST_AUTO_TEST_CASE(ParseAcceptsOnlyShortDigitStrings) {
    BOOST_REQUIRE(vision::parseCurrencyText("$1,25O").has_value());
    BOOST_CHECK_EQUAL(*vision::parseCurrencyText("$1,25O"), 1250);
    BOOST_CHECK_EQUAL(*vision::parseCurrencyText("0"), 0);
    BOOST_CHECK_EQUAL(*vision::parseCurrencyText("999,999,999"), 999999999);

    BOOST_CHECK(!vision::parseCurrencyText("").has_value());
    BOOST_CHECK(!vision::parseCurrencyText("$").has_value());
    BOOST_CHECK(!vision::parseCurrencyText("12?4").has_value());
    BOOST_CHECK(!vision::parseCurrencyText("1234567890").has_value());
}

BOOST_AUTO_TEST_CASE(EmptyImageReadsNothing) {
    vision::CurrencyOcr ocr;
    vision::GlyphReadResult raw = ocr.recognize(cv::Mat());
    BOOST_CHECK(raw.text.empty());
    BOOST_CHECK_EQUAL(raw.score, -1.0f);
    BOOST_CHECK(!ocr.read(cv::Mat()).has_value());
}

BOOST_AUTO_TEST_CASE(ScreenSourceWithoutFrameIsIllegible) {
    auto fake = std::make_shared<FakeCapture>();
    auto capture = std::make_shared<RetryingCapture>(fake, 2, milliseconds(0), noSleep());
    const Region region{367, 15, 148, 55};

    CurrencySource source = makeScreenCurrencySource(capture, region, std::make_shared<vision::CurrencyOcr>());
    BOOST_CHECK(!source().has_value());
    BOOST_CHECK_EQUAL(fake->grabCount(region), 2);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(CurrencyReaderTests)

BOOST_AUTO_TEST_CASE(KeepsLastLegibleValue) {
    CurrencyReader reader(scripted({std::nullopt, 500, std::nullopt, 650}), milliseconds(10));

    BOOST_CHECK_EQUAL(reader.getCurrency(), 0);
    BOOST_CHECK(!reader.pollOnce());
    BOOST_CHECK_EQUAL(reader.getCurrency(), 0);
    BOOST_CHECK(reader.pollOnce());
    BOOST_CHECK_EQUAL(reader.getCurrency(), 500);
    BOOST_CHECK(!reader.pollOnce());
    BOOST_CHECK_EQUAL(reader.getCurrency(), 500);
    BOOST_CHECK(reader.pollOnce());
    BOOST_CHECK_EQUAL(reader.getCurrency(), 650);

    BOOST_CHECK_EQUAL(reader.readCount(), 4u);
    BOOST_CHECK_EQUAL(reader.failedReads(), 2u);
}

BOOST_AUTO_TEST_CASE(ThrowingSourceCountsAsFailedRead) {
    CurrencyReader reader([]() -> std::optional<int> { throw std::runtime_error("display lost"); },
                          milliseconds(10));
    BOOST_CHECK(!reader.pollOnce());
    BOOST_CHECK_EQUAL(reader.failedReads(), 1u);
    BOOST_CHECK_EQUAL(reader.getCurrency(), 0);
}

BOOST_AUTO_TEST_CASE(BackgroundThreadPollsUntilStopped) {
    std::atomic<int> calls{0};
    CurrencyReader reader([&calls]() -> std::optional<int> {
        ++calls;
        return 300;
    }, milliseconds(5));

    reader.start();
    reader.start();
    BOOST_CHECK(reader.isRunning());
    BOOST_CHECK(waitFor([&reader]() { return reader.getCurrency() == 300; }));
    BOOST_CHECK(waitFor([&calls]() { return calls.load() >= 2; }));

    reader.stop();
    BOOST_CHECK(!reader.isRunning());
    const int afterStop = calls.load();
    std::this_thread::sleep_for(milliseconds(30));
    BOOST_CHECK_EQUAL(calls.load(), afterStop);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(KillSwitchTests)

BOOST_AUTO_TEST_CASE(TokenStartsClearAndResets) {
    CancellationToken token;
    BOOST_CHECK(!token.stopRequested());
    token.requestStop();
    BOOST_CHECK(token.stopRequested());
    token.reset();
    BOOST_CHECK(!token.stopRequested());
}

BOOST_AUTO_TEST_CASE(HeldKeyCancelsToken) {
    auto input = std::make_shared<MockInput>();
    CancellationToken token;
    KillSwitchListener listener(input, "esc", token);

    BOOST_CHECK(!listener.pollOnce());
    BOOST_CHECK(!token.stopRequested());

    input->keysDown.push_back("esc");
    BOOST_CHECK(listener.pollOnce());
    BOOST_CHECK(token.stopRequested());
    BOOST_CHECK_EQUAL(input->keyPolls, 2);
}

BOOST_AUTO_TEST_CASE(ListenerThreadCancelsToken) {
    auto input = std::make_shared<MockInput>();
    input->keysDown.push_back("f8");
    CancellationToken token;
    KillSwitchListener listener(input, "f8", token, milliseconds(5));

    listener.start();
    BOOST_CHECK(waitFor([&token]() { return token.stopRequested(); }));
    listener.stop();

    BOOST_CHECK(!listener.isRunning());
    BOOST_CHECK_GE(input->keyPolls, 1);
}

BOOST_AUTO_TEST_CASE(OtherKeysAreIgnored) {
    auto input = std::make_shared<MockInput>();
    input->keysDown.push_back("q");
    CancellationToken token;
    KillSwitchListener listener(input, "esc", token);

    BOOST_CHECK(!listener.pollOnce());
    BOOST_CHECK(!token.stopRequested());
    BOOST_CHECK_EQUAL(listener.key(), "esc");
}

BOOST_AUTO_TEST_SUITE_END()
