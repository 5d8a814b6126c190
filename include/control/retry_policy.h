#pragma once
/**
 * @file retry_policy.h
 * @brief Explicit retry policy and a single generic retry function
 */

#include "errors.h"
#include "types.h"
#include "utils/logger.h"
#include "utils/timer.h"

#include <chrono>
#include <exception>
#include <functional>
#include <optional>
#include <string>

namespace btd6_pilot {

enum class ErrorClass {
    Retryable,
    Fatal
};

/**
 * @brief Default classifier: capture failures and exhausted inner retries are retryable
 */
ErrorClass classifyDefault(const std::exception& e);

struct RetryPolicy {
    int maxAttempts = 3;
    std::chrono::milliseconds baseDelay{500};
    double backoffFactor = 1.0;
    std::chrono::milliseconds maxDelay{5000};
    std::function<ErrorClass(const std::exception&)> classify = classifyDefault;

    /**
     * @brief min(baseDelay * backoffFactor^(attempt-1), maxDelay), attempt is 1-based
     */
    std::chrono::milliseconds delayFor(int attempt) const;

    static RetryPolicy fromSettings(const RetrySettings& s);
};

/**
 * @brief Call fn until it yields a value or attempts run out
 *
 * nullopt from fn and Retryable exceptions both consume an attempt; Fatal
 * exceptions propagate unchanged.
 *
 * @throws RetryExhaustedError after policy.maxAttempts failed attempts
 */
template <typename T>
T runWithRetry(const RetryPolicy& policy,
               const std::string& operation,
               const std::function<std::optional<T>()>& fn,
               const SleepFn& sleep = realSleep) {
    const int attempts = policy.maxAttempts < 1 ? 1 : policy.maxAttempts;
    std::string lastError = "no result";

    for (int attempt = 1; attempt <= attempts; ++attempt) {
        try {
            std::optional<T> result = fn();
            if (result) return *result;
            lastError = "no result";
        } catch (const std::exception& e) {
            if (policy.classify(e) == ErrorClass::Fatal) throw;
            lastError = e.what();
        }
        logWarning(operation + " attempt " + std::to_string(attempt) + "/" +
                   std::to_string(attempts) + " failed: " + lastError);
        if (attempt < attempts) sleep(policy.delayFor(attempt));
    }
    throw RetryExhaustedError(operation, attempts, lastError);
}

} // namespace btd6_pilot
