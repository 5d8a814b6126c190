#include "control/currency_reader.h"
#include "utils/logger.h"

#include <exception>

namespace btd6_pilot {

CurrencySource makeScreenCurrencySource(std::shared_ptr<RetryingCapture> capture,
                                        const Region& region,
                                        std::shared_ptr<const vision::CurrencyOcr> ocr) {
    return [capture, region, ocr]() -> std::optional<int> {
        std::optional<cv::Mat> image = capture->captureRegion(region);
        if (!image) return std::nullopt;
        return ocr->read(*image);
    };
}

CurrencyReader::CurrencyReader(CurrencySource source, std::chrono::milliseconds pollInterval)
    : m_source(std::move(source)), m_pollInterval(pollInterval) {}

CurrencyReader::~CurrencyReader() {
    stop();
}

void CurrencyReader::start() {
    if (m_running.load()) return;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_stopRequested = false;
    }
    m_running = true;
    m_thread = std::thread(&CurrencyReader::run, this);
    logInfo("Currency reader started (every " + std::to_string(m_pollInterval.count()) + " ms)");
}

void CurrencyReader::stop() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_stopRequested = true;
    }
    m_cv.notify_all();
    if (m_thread.joinable()) {
        m_thread.join();
        logInfo("Currency reader stopped after " + std::to_string(m_reads.load()) + " reads");
    }
    m_running = false;
}

int CurrencyReader::getCurrency() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_currency;
}

bool CurrencyReader::pollOnce() {
    std::optional<int> value;
    try {
        value = m_source();
    } catch (const std::exception& e) {
        logWarning(std::string("Currency read failed: ") + e.what());
    }
    ++m_reads;

    if (!value) {
        ++m_failedReads;
        return false;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    if (*value != m_currency) {
        logDebug("Currency: " + std::to_string(*value));
    }
    m_currency = *value;
    return true;
}

void CurrencyReader::run() {
    std::unique_lock<std::mutex> lock(m_mutex);
    while (!m_stopRequested) {
        lock.unlock();
        pollOnce();
        lock.lock();
        m_cv.wait_for(lock, m_pollInterval, [this] { return m_stopRequested; });
    }
}

} // namespace btd6_pilot
