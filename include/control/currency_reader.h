#pragma once
/**
 * @file currency_reader.h
 * @brief Background polling of the in-game cash counter
 */

#include "capture/screen_capture.h"
#include "types.h"
#include "vision/currency_ocr.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

namespace btd6_pilot {

/// One read of the currency; nullopt when the counter was illegible
using CurrencySource = std::function<std::optional<int>()>;

/**
 * @brief Capture + OCR source; owns its own capture so it never shares a
 *        backend connection with the control thread
 */
CurrencySource makeScreenCurrencySource(std::shared_ptr<RetryingCapture> capture,
                                        const Region& region,
                                        std::shared_ptr<const vision::CurrencyOcr> ocr);

/**
 * @brief Polls a CurrencySource on its own thread
 *
 * getCurrency() returns the last legible value (0 before the first one).
 * The value may lag the game by one poll interval.
 */
class CurrencyReader {
public:
    CurrencyReader(CurrencySource source, std::chrono::milliseconds pollInterval);
    ~CurrencyReader();

    CurrencyReader(const CurrencyReader&) = delete;
    CurrencyReader& operator=(const CurrencyReader&) = delete;

    /// No-op if already running
    void start();

    /// Wakes the poll thread and joins it
    void stop();

    bool isRunning() const { return m_running.load(); }
    int getCurrency() const;

    /**
     * @brief Run the source once on the calling thread
     * @return true if the read was legible
     */
    bool pollOnce();

    uint64_t readCount() const { return m_reads.load(); }
    uint64_t failedReads() const { return m_failedReads.load(); }

private:
    void run();

    CurrencySource m_source;
    std::chrono::milliseconds m_pollInterval;

    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    bool m_stopRequested = false;
    int m_currency = 0;

    std::atomic<bool> m_running{false};
    std::atomic<uint64_t> m_reads{0};
    std::atomic<uint64_t> m_failedReads{0};
    std::thread m_thread;
};

} // namespace btd6_pilot
