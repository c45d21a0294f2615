#pragma once

#include <algorithm>
#include <chrono>
#include <thread>
#include "errors.hpp"
#include "logging.hpp"

namespace stockguard {

/**
 * Bounded exponential backoff for transient datastore failures. Only
 * TransientError is retried; insufficient stock is a result, not an error.
 */
struct RetryPolicy {
    int max_attempts = 3;
    std::chrono::milliseconds initial_delay{10};
    std::chrono::milliseconds max_delay{200};

    std::chrono::milliseconds delay_for(int attempt) const {
        auto delay = initial_delay;
        for (int i = 1; i < attempt && delay < max_delay; i++) delay *= 2;
        return std::min(delay, max_delay);
    }
};

/**
 * Run `operation`, retrying it while it throws a transient StockguardError.
 * The last failure propagates once attempts are exhausted.
 */
template<typename Operation>
auto with_retry(const RetryPolicy& policy, const char* name, Operation&& operation)
    -> decltype(operation()) {
    for (int attempt = 1;; attempt++) {
        try {
            return operation();
        } catch (const StockguardError& e) {
            if (!e.is_transient() || attempt >= policy.max_attempts) throw;
            auto delay = policy.delay_for(attempt);
            log_debug("retry", "transient_failure",
                      {{"operation", name}, {"attempt", attempt},
                       {"delay_ms", delay.count()}, {"error", e.what()}});
            std::this_thread::sleep_for(delay);
        }
    }
}

}  // namespace stockguard
