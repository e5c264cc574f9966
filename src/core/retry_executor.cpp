/**
 * @file retry_executor.cpp
 * @brief Backoff calculation and retry logging
 */

#include <cavesync/remote_project/core/retry_executor.h>

#include <algorithm>
#include <random>

namespace cavesync::remote_project {

auto calculate_retry_delay(const retry_policy& policy, std::size_t attempt)
    -> std::chrono::milliseconds {
    if (attempt < 2) {
        return std::chrono::milliseconds{0};
    }

    auto delay = static_cast<double>(policy.base_delay.count());
    for (std::size_t i = 2; i < attempt; ++i) {
        delay *= 2.0;
        if (delay >= static_cast<double>(policy.max_delay.count())) {
            break;
        }
    }

    delay = std::min(delay, static_cast<double>(policy.max_delay.count()));

    if (policy.use_jitter) {
        thread_local std::mt19937 gen(std::random_device{}());
        std::uniform_real_distribution<> dis(1.0, 1.25);
        delay *= dis(gen);
    }

    return std::chrono::milliseconds(static_cast<int64_t>(delay));
}

void retry_executor::log_retry(std::string_view operation_name,
                               std::size_t attempt,
                               std::size_t max_attempts,
                               std::chrono::milliseconds delay,
                               const error& err) {
    operation_log_context ctx;
    ctx.attempt = static_cast<uint32_t>(attempt);
    ctx.max_attempts = static_cast<uint32_t>(max_attempts);
    ctx.duration_ms = static_cast<uint64_t>(delay.count());
    if (err.http_status != 0) {
        ctx.http_status = err.http_status;
    }
    ctx.error_message = err.message;

    RP_LOG_WARN_CTX(log_category::retry,
                    std::string(operation_name) + " failed (" +
                        std::string(to_string(err.code)) + "), retrying in " +
                        std::to_string(delay.count()) + "ms",
                    ctx);
}

void retry_executor::log_exhausted(std::string_view operation_name,
                                   std::size_t attempts,
                                   const error& err) {
    operation_log_context ctx;
    ctx.attempt = static_cast<uint32_t>(attempts);
    if (err.http_status != 0) {
        ctx.http_status = err.http_status;
    }
    ctx.error_message = err.message;

    RP_LOG_ERROR_CTX(log_category::retry,
                     std::string(operation_name) + " failed after " +
                         std::to_string(attempts) + " attempt(s)",
                     ctx);
}

}  // namespace cavesync::remote_project
