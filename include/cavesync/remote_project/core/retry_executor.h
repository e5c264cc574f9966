/**
 * @file retry_executor.h
 * @brief Bounded retry with exponential backoff
 */

#ifndef CAVESYNC_REMOTE_PROJECT_CORE_RETRY_EXECUTOR_H
#define CAVESYNC_REMOTE_PROJECT_CORE_RETRY_EXECUTOR_H

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include "cavesync/remote_project/core/cancellation.h"
#include "cavesync/remote_project/core/logging.h"
#include "cavesync/remote_project/core/types.h"

namespace cavesync::remote_project {

/**
 * @brief Retry policy for remote operations
 */
struct retry_policy {
    /// Total attempts including the first one
    std::size_t max_attempts = 3;

    /// Delay before the second attempt; doubles for each later one
    std::chrono::milliseconds base_delay{1000};

    /// Upper bound for a single delay
    std::chrono::milliseconds max_delay{30000};

    /// Stretch each delay by up to +25% (never shortens it)
    bool use_jitter = false;

    /**
     * @brief Single attempt, for non-idempotent operations
     */
    [[nodiscard]] static auto no_retry() -> retry_policy {
        retry_policy policy;
        policy.max_attempts = 1;
        return policy;
    }
};

/**
 * @brief Delay to wait before attempt @p attempt (attempt >= 2)
 *
 * base_delay * 2^(attempt-2), capped at max_delay. Attempt 1 has no delay.
 */
[[nodiscard]] auto calculate_retry_delay(const retry_policy& policy, std::size_t attempt)
    -> std::chrono::milliseconds;

/**
 * @brief Runs an operation returning result<T> until it succeeds, fails with
 *        a non-retryable error, or runs out of attempts
 *
 * Only errors classified by is_retryable() are retried. After the final
 * failed attempt the last error is returned unchanged. Waiting between
 * attempts goes through the cancellation token, so a cancelled operation
 * stops immediately with operation_cancelled and starts no new attempt.
 */
class retry_executor {
public:
    explicit retry_executor(retry_policy policy = {}) : policy_(std::move(policy)) {}

    [[nodiscard]] auto policy() const -> const retry_policy& { return policy_; }

    template <typename Operation>
    auto execute(Operation&& operation,
                 std::string_view operation_name,
                 const cancellation_token& token = {}) const
        -> std::invoke_result_t<Operation&> {
        using result_type = std::invoke_result_t<Operation&>;

        const std::size_t max_attempts = policy_.max_attempts == 0 ? 1 : policy_.max_attempts;

        for (std::size_t attempt = 1;; ++attempt) {
            if (token.is_cancelled()) {
                return result_type{unexpected{error{error_code::operation_cancelled,
                    std::string(operation_name) + " cancelled"}}};
            }

            result_type outcome = operation();
            if (outcome.has_value()) {
                return outcome;
            }

            const auto& err = outcome.error();
            if (!is_retryable(err)) {
                return outcome;
            }

            if (attempt >= max_attempts) {
                log_exhausted(operation_name, attempt, err);
                return outcome;
            }

            auto delay = calculate_retry_delay(policy_, attempt + 1);
            log_retry(operation_name, attempt, max_attempts, delay, err);

            if (token.wait_for(delay)) {
                return result_type{unexpected{error{error_code::operation_cancelled,
                    std::string(operation_name) + " cancelled after attempt " +
                        std::to_string(attempt) + ": " + err.message}}};
            }
        }
    }

    /**
     * @brief One-shot form taking the bounds directly
     */
    template <typename Operation>
    static auto execute(Operation&& operation,
                        std::size_t max_attempts,
                        std::chrono::milliseconds base_delay,
                        const cancellation_token& token = {})
        -> std::invoke_result_t<Operation&> {
        retry_policy policy;
        policy.max_attempts = max_attempts;
        policy.base_delay = base_delay;
        policy.max_delay = std::max(policy.max_delay, base_delay);
        return retry_executor{policy}.execute(std::forward<Operation>(operation),
                                              "operation", token);
    }

private:
    static void log_retry(std::string_view operation_name,
                          std::size_t attempt,
                          std::size_t max_attempts,
                          std::chrono::milliseconds delay,
                          const error& err);

    static void log_exhausted(std::string_view operation_name,
                              std::size_t attempts,
                              const error& err);

    retry_policy policy_;
};

}  // namespace cavesync::remote_project

#endif  // CAVESYNC_REMOTE_PROJECT_CORE_RETRY_EXECUTOR_H
