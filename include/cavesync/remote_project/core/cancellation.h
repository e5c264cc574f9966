/**
 * @file cancellation.h
 * @brief Cooperative cancellation for blocking and async operations
 */

#ifndef CAVESYNC_REMOTE_PROJECT_CORE_CANCELLATION_H
#define CAVESYNC_REMOTE_PROJECT_CORE_CANCELLATION_H

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

namespace cavesync::remote_project {

/**
 * @brief Observer side of a cancellation_source
 *
 * A default-constructed token is never cancelled. Cancellation only stops
 * the client from waiting or retrying; requests already sent stay sent.
 */
class cancellation_token {
public:
    cancellation_token() = default;

    [[nodiscard]] auto is_cancelled() const -> bool;

    /**
     * @brief Block for up to @p duration, waking early on cancellation
     * @return true if the token is cancelled when the wait ends
     */
    auto wait_for(std::chrono::milliseconds duration) const -> bool;

private:
    friend class cancellation_source;

    struct state {
        std::mutex mutex;
        std::condition_variable cv;
        bool cancelled = false;
    };

    explicit cancellation_token(std::shared_ptr<state> s) : state_(std::move(s)) {}

    std::shared_ptr<state> state_;
};

/**
 * @brief Owner side: hands out tokens and triggers cancellation
 */
class cancellation_source {
public:
    cancellation_source();

    [[nodiscard]] auto token() const -> cancellation_token;

    /**
     * @brief Cancel every token from this source; idempotent
     */
    void cancel();

    [[nodiscard]] auto is_cancelled() const -> bool;

private:
    std::shared_ptr<cancellation_token::state> state_;
};

}  // namespace cavesync::remote_project

#endif  // CAVESYNC_REMOTE_PROJECT_CORE_CANCELLATION_H
