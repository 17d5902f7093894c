#pragma once

#include "CalloutTypes.h"
#include "Logger.h"
#include <chrono>
#include <string>
#include <thread>

namespace Callout {

/**
 * @brief Stable identifier for an error kind (e.g. "AddressMismatch")
 */
std::string ErrorKindToString(ErrorKind kind);

/**
 * @brief Whether a failure of this kind may succeed if attempted again
 *
 * Only network and availability kinds qualify. Cryptographic failures,
 * validation failures and AddressMismatch never do.
 */
bool IsRetryable(ErrorKind kind);

/**
 * @brief Short user-facing description of an error kind
 */
std::string UserMessageFor(ErrorKind kind);

struct RetryPolicy {
    int maxAttempts = 3;
    int initialDelayMs = 1000;
    bool exponentialBackoff = true;
};

/**
 * @brief Re-invoke a Result-returning callable while its failure is retryable
 *
 * The core never retries on its own; this helper is for outer callers
 * (the command-line tool) that want a retry policy around network work.
 *
 * @param fn Callable returning Result<T>
 * @param policy Attempt count and delay schedule
 * @return The first successful result, or the last failure
 */
template<typename Fn>
auto WithRetry(Fn&& fn, const RetryPolicy& policy = RetryPolicy()) -> decltype(fn()) {
    auto result = fn();
    int delayMs = policy.initialDelayMs;

    for (int attempt = 1; attempt < policy.maxAttempts; ++attempt) {
        if (result.success || !IsRetryable(result.errorKind)) {
            break;
        }

        CALLOUT_LOG_WARNING("Retry", "Retrying after retryable failure",
                            "Attempt: " + std::to_string(attempt) + "/" +
                                std::to_string(policy.maxAttempts) +
                                " | Kind: " + ErrorKindToString(result.errorKind));

        if (delayMs > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(delayMs));
        }
        if (policy.exponentialBackoff) {
            delayMs *= 2;
        }

        result = fn();
    }

    return result;
}

} // namespace Callout
