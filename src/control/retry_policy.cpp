#include "control/retry_policy.h"

#include <algorithm>
#include <cmath>

namespace btd6_pilot {

ErrorClass classifyDefault(const std::exception& e) {
    if (dynamic_cast<const CaptureError*>(&e)) return ErrorClass::Retryable;
    if (dynamic_cast<const RetryExhaustedError*>(&e)) return ErrorClass::Retryable;
    return ErrorClass::Fatal;
}

std::chrono::milliseconds RetryPolicy::delayFor(int attempt) const {
    const int exponent = attempt < 1 ? 0 : attempt - 1;
    const double factor = backoffFactor < 1.0 ? 1.0 : backoffFactor;
    const double ms = static_cast<double>(baseDelay.count()) * std::pow(factor, exponent);
    const double capped = (std::min)(ms, static_cast<double>(maxDelay.count()));
    return std::chrono::milliseconds(static_cast<long long>(std::llround(capped)));
}

RetryPolicy RetryPolicy::fromSettings(const RetrySettings& s) {
    RetryPolicy p;
    p.maxAttempts = s.maxRetries;
    p.baseDelay = s.retryDelay;
    p.backoffFactor = s.backoffFactor;
    p.maxDelay = s.maxDelay;
    return p;
}

} // namespace btd6_pilot
