/**
 * @file session_manager.h
 * @brief Authentication and ownership of the current session
 */

#ifndef CAVESYNC_REMOTE_PROJECT_CLIENT_SESSION_MANAGER_H
#define CAVESYNC_REMOTE_PROJECT_CLIENT_SESSION_MANAGER_H

#include <memory>
#include <mutex>
#include <string>
#include <string_view>

#include "cavesync/remote_project/core/cancellation.h"
#include "cavesync/remote_project/core/project_types.h"
#include "cavesync/remote_project/core/retry_executor.h"
#include "cavesync/remote_project/core/types.h"
#include "cavesync/remote_project/http/http_types.h"

namespace cavesync::remote_project {

/**
 * @brief Owns the single active session
 *
 * Sessions are immutable and published by pointer swap, so readers always
 * see either the previous session or the new one, never a mix. A failed
 * authenticate() leaves no session behind.
 *
 * @code
 * session_manager sessions(make_http_client(), retry_executor{});
 * auto result = sessions.authenticate(
 *     credentials::from_password("user@example.com", "secret"), "www.speleoDB.org");
 * if (!result) {
 *     // result.error().code == error_code::authentication_failed, ...
 * }
 * @endcode
 *
 * @note Thread-safe.
 */
class session_manager {
public:
    session_manager(std::shared_ptr<http_client_interface> http,
                    retry_executor retry,
                    std::string user_agent = "cavesync-remote-project");

    session_manager(const session_manager&) = delete;
    auto operator=(const session_manager&) -> session_manager& = delete;

    /**
     * @brief Log in with password or OAuth credentials
     *
     * Credentials and the instance host are validated before any request
     * is sent. On success the new session replaces the previous one.
     *
     * @return The new session, or invalid_credentials, invalid_instance_url,
     *         authentication_failed (with http_status), network_error,
     *         request_timeout, operation_cancelled
     */
    [[nodiscard]] auto authenticate(const credentials& creds,
                                    std::string_view instance_host,
                                    const cancellation_token& token = {})
        -> result<std::shared_ptr<const session>>;

    /**
     * @brief Drop the session; idempotent, no server call
     */
    void logout();

    [[nodiscard]] auto is_authenticated() const -> bool;

    /**
     * @brief Current session, or nullptr
     */
    [[nodiscard]] auto current_session() const -> std::shared_ptr<const session>;

    /**
     * @brief Current session, or not_authenticated
     */
    [[nodiscard]] auto require_session() const -> result<std::shared_ptr<const session>>;

    [[nodiscard]] auto current_instance() const -> result<instance_url>;

    /**
     * @brief Authorization, Accept and User-Agent headers for @p s
     */
    [[nodiscard]] auto request_headers(const session& s) const -> http_headers;

private:
    [[nodiscard]] auto login_with_password(const password_credentials& creds,
                                           const instance_url& instance,
                                           const cancellation_token& token)
        -> result<std::string>;

    [[nodiscard]] auto login_with_oauth(const oauth_credentials& creds,
                                        const instance_url& instance,
                                        const cancellation_token& token)
        -> result<std::string>;

    void publish(std::shared_ptr<const session> next);

    std::shared_ptr<http_client_interface> http_;
    retry_executor retry_;
    std::string user_agent_;

    mutable std::mutex mutex_;
    std::shared_ptr<const session> session_;
};

}  // namespace cavesync::remote_project

#endif  // CAVESYNC_REMOTE_PROJECT_CLIENT_SESSION_MANAGER_H
