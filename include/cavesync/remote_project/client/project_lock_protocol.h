/**
 * @file project_lock_protocol.h
 * @brief Acquire, refresh and release of server-side project edit locks
 */

#ifndef CAVESYNC_REMOTE_PROJECT_CLIENT_PROJECT_LOCK_PROTOCOL_H
#define CAVESYNC_REMOTE_PROJECT_CLIENT_PROJECT_LOCK_PROTOCOL_H

#include <chrono>
#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "cavesync/remote_project/client/session_manager.h"
#include "cavesync/remote_project/core/cancellation.h"
#include "cavesync/remote_project/core/project_types.h"
#include "cavesync/remote_project/core/retry_executor.h"
#include "cavesync/remote_project/http/http_types.h"

namespace cavesync::remote_project {

/**
 * @brief Client side of the one-editor-per-project lock
 *
 * The server is the authority; this class only remembers which locks it
 * believes it holds and until when. The lease is not announced by the
 * server, so lease_expires_at is a local estimate refreshed on every
 * successful acquire. A conflict is an ordinary outcome (false), not an
 * error; errors are reserved for authentication and transport failures.
 *
 * @note Thread-safe.
 */
class project_lock_protocol {
public:
    project_lock_protocol(std::shared_ptr<session_manager> sessions,
                          std::shared_ptr<http_client_interface> http,
                          retry_executor retry,
                          std::chrono::seconds lease);

    project_lock_protocol(const project_lock_protocol&) = delete;
    auto operator=(const project_lock_protocol&) -> project_lock_protocol& = delete;

    /**
     * @brief Take the lock, or extend it if this client already holds it
     * @return true when held afterwards, false when another user holds it
     *         or the server refused; errors for not_authenticated,
     *         authentication_failed, transport failures after retries
     */
    [[nodiscard]] auto acquire_or_refresh(const std::string& project_id,
                                          const cancellation_token& token = {})
        -> result<bool>;

    /**
     * @brief Give the lock back
     * @return true when released, false when this client did not hold it
     *         (no request is sent for a lock this client never acquired)
     *
     * A lock past the local lease estimate is still released on the server,
     * which alone knows whether the lease really ran out.
     */
    [[nodiscard]] auto release(const std::string& project_id,
                               const cancellation_token& token = {}) -> result<bool>;

    /**
     * @brief Release every lock this client believes it holds
     * @return Number of locks released; the first error stops the sweep
     */
    [[nodiscard]] auto release_all(const cancellation_token& token = {})
        -> result<std::size_t>;

    /**
     * @brief Held and within the local lease estimate
     */
    [[nodiscard]] auto is_held(const std::string& project_id) const -> bool;

    /**
     * @brief Local snapshot; nullopt when not held or past the lease
     */
    [[nodiscard]] auto lock_state(const std::string& project_id) const
        -> std::optional<project_lock>;

    [[nodiscard]] auto held_locks() const -> std::vector<project_lock>;

    /**
     * @brief Forget all local lock state without contacting the server
     */
    void forget_all();

    [[nodiscard]] auto lease() const -> std::chrono::seconds { return lease_; }

private:
    enum class lock_action { acquire, release };

    [[nodiscard]] auto send(lock_action action,
                            const std::string& project_id,
                            const cancellation_token& token) -> result<http_response>;

    std::shared_ptr<session_manager> sessions_;
    std::shared_ptr<http_client_interface> http_;
    retry_executor retry_;
    std::chrono::seconds lease_;

    mutable std::mutex mutex_;
    std::map<std::string, project_lock> locks_;
};

}  // namespace cavesync::remote_project

#endif  // CAVESYNC_REMOTE_PROJECT_CLIENT_PROJECT_LOCK_PROTOCOL_H
