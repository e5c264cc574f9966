/**
 * @file remote_project_client.h
 * @brief Public facade: sessions, projects, locks and archive transfers
 */

#ifndef CAVESYNC_REMOTE_PROJECT_CLIENT_REMOTE_PROJECT_CLIENT_H
#define CAVESYNC_REMOTE_PROJECT_CLIENT_REMOTE_PROJECT_CLIENT_H

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "cavesync/remote_project/adapters/thread_pool_adapter.h"
#include "cavesync/remote_project/client/client_types.h"
#include "cavesync/remote_project/core/cancellation.h"
#include "cavesync/remote_project/core/instance_url.h"
#include "cavesync/remote_project/core/project_types.h"
#include "cavesync/remote_project/core/retry_executor.h"
#include "cavesync/remote_project/core/types.h"
#include "cavesync/remote_project/http/http_types.h"

namespace cavesync::remote_project {

/**
 * @brief Client for the remote project backend
 *
 * Every project operation requires an authenticated session and fails with
 * not_authenticated, without touching the network, otherwise. Uploads also
 * require this client to hold the project's lock.
 *
 * Each blocking operation has an _async twin that runs it on the worker
 * executor. The client waits for outstanding async work when destroyed or
 * move-assigned over; moving it while work is pending is safe.
 *
 * @code
 * auto client = remote_project_client::builder()
 *                   .with_archive_root("/home/me/.ariane")
 *                   .build();
 * if (!client) {
 *     return;
 * }
 * auto& c = client.value();
 * if (c.authenticate(credentials::from_password("me@example.com", "pw"),
 *                    "www.speleoDB.org")) {
 *     auto locked = c.acquire_or_refresh(project_id);
 *     if (locked && locked.value()) {
 *         (void)c.upload("Surveyed the north branch", project_id);
 *         (void)c.release(project_id);
 *     }
 * }
 * @endcode
 */
class remote_project_client {
public:
    /**
     * @brief Builder for remote_project_client
     */
    class builder {
    public:
        builder();

        /**
         * @brief Start from an existing configuration
         */
        auto with_config(client_config config) -> builder&;

        /**
         * @brief Directory receiving {project_id}.{extension} archives
         */
        auto with_archive_root(std::filesystem::path root) -> builder&;

        /**
         * @brief Archive file extension without the dot (default: "tml")
         */
        auto with_archive_extension(std::string extension) -> builder&;

        /**
         * @brief Timeout for API requests (default: 60s)
         */
        auto with_request_timeout(std::chrono::milliseconds timeout) -> builder&;

        /**
         * @brief Timeout for archive downloads (default: 120s)
         */
        auto with_download_timeout(std::chrono::milliseconds timeout) -> builder&;

        /**
         * @brief Local estimate of the server lock lease (default: 30min)
         */
        auto with_lock_lease(std::chrono::seconds lease) -> builder&;

        auto with_retry_policy(retry_policy policy) -> builder&;

        /**
         * @brief Worker threads for async operations (0 = hardware concurrency)
         */
        auto with_worker_count(std::size_t count) -> builder&;

        /**
         * @brief Refuse uploads identical to this empty-project archive
         */
        auto with_empty_template(std::filesystem::path path) -> builder&;

        auto with_user_agent(std::string user_agent) -> builder&;

        /**
         * @brief Use @p http for every request instead of the network_system client
         */
        auto with_http_client(std::shared_ptr<http_client_interface> http) -> builder&;

        /**
         * @brief Use a separate transport for archive downloads
         */
        auto with_download_http_client(std::shared_ptr<http_client_interface> http)
            -> builder&;

        auto with_executor(std::shared_ptr<adapters::task_executor_interface> executor)
            -> builder&;

        /**
         * @brief Build the client instance
         * @return The client, or invalid_configuration
         */
        [[nodiscard]] auto build() -> result<remote_project_client>;

    private:
        client_config config_;
        std::shared_ptr<http_client_interface> http_;
        std::shared_ptr<http_client_interface> download_http_;
        std::shared_ptr<adapters::task_executor_interface> executor_;
    };

    // Non-copyable, movable
    remote_project_client(const remote_project_client&) = delete;
    auto operator=(const remote_project_client&) -> remote_project_client& = delete;
    remote_project_client(remote_project_client&&) noexcept;
    auto operator=(remote_project_client&&) noexcept -> remote_project_client&;
    ~remote_project_client();

    // ========================================================================
    // Session
    // ========================================================================

    /**
     * @brief Log in; replaces any previous session
     * @param creds Exactly one of password or OAuth credentials
     * @param instance_host Host as typed by the user, with or without scheme
     */
    [[nodiscard]] auto authenticate(const credentials& creds,
                                    std::string_view instance_host,
                                    const cancellation_token& token = {}) -> result<void>;

    /**
     * @brief Forget the session and all local lock state; no server call
     *
     * Locks still held on the server stay there until their lease runs
     * out. Call release_all() first to hand them back.
     */
    void logout();

    [[nodiscard]] auto is_authenticated() const -> bool;

    [[nodiscard]] auto current_instance() const -> result<instance_url>;

    // ========================================================================
    // Projects
    // ========================================================================

    [[nodiscard]] auto list_projects(const cancellation_token& token = {})
        -> result<std::vector<project>>;

    /**
     * @brief Create a project; never retried automatically
     * @return The created project, or project_validation_failed
     */
    [[nodiscard]] auto create_project(const project_creation_request& request)
        -> result<project>;

    // ========================================================================
    // Locks
    // ========================================================================

    /**
     * @brief Take or extend the edit lock
     * @return true when held, false when someone else holds it
     */
    [[nodiscard]] auto acquire_or_refresh(const std::string& project_id,
                                          const cancellation_token& token = {})
        -> result<bool>;

    /**
     * @brief As above, refusing read-only projects with access_denied
     */
    [[nodiscard]] auto acquire_or_refresh(const project& target,
                                          const cancellation_token& token = {})
        -> result<bool>;

    [[nodiscard]] auto release(const std::string& project_id,
                               const cancellation_token& token = {}) -> result<bool>;

    /**
     * @brief Release every lock this client holds
     * @return Number of locks released
     */
    [[nodiscard]] auto release_all(const cancellation_token& token = {})
        -> result<std::size_t>;

    [[nodiscard]] auto lock_state(const std::string& project_id) const
        -> std::optional<project_lock>;

    [[nodiscard]] auto held_locks() const -> std::vector<project_lock>;

    // ========================================================================
    // Archives
    // ========================================================================

    /**
     * @brief Upload the local archive {archive_root}/{project_id}.{extension}
     * @return lock_not_held without a request unless this client holds the lock
     */
    [[nodiscard]] auto upload(const std::string& message,
                              const std::string& project_id,
                              const cancellation_token& token = {}) -> result<void>;

    [[nodiscard]] auto upload_bytes(const std::string& message,
                                    const std::string& project_id,
                                    const byte_buffer& archive,
                                    const cancellation_token& token = {}) -> result<void>;

    /**
     * @brief Download the latest archive, replacing the local copy atomically
     */
    [[nodiscard]] auto download(const std::string& project_id,
                                const cancellation_token& token = {})
        -> result<std::filesystem::path>;

    [[nodiscard]] auto download_verified(const std::string& project_id,
                                         std::string_view expected_sha256,
                                         const cancellation_token& token = {})
        -> result<std::filesystem::path>;

    [[nodiscard]] auto archive_path(const std::string& project_id) const
        -> std::filesystem::path;

    // ========================================================================
    // Async
    // ========================================================================

    [[nodiscard]] auto authenticate_async(credentials creds,
                                          std::string instance_host,
                                          cancellation_token token = {})
        -> std::future<result<void>>;

    [[nodiscard]] auto logout_async() -> std::future<result<void>>;

    [[nodiscard]] auto list_projects_async(cancellation_token token = {})
        -> std::future<result<std::vector<project>>>;

    [[nodiscard]] auto create_project_async(project_creation_request request)
        -> std::future<result<project>>;

    [[nodiscard]] auto acquire_or_refresh_async(std::string project_id,
                                                cancellation_token token = {})
        -> std::future<result<bool>>;

    [[nodiscard]] auto release_async(std::string project_id, cancellation_token token = {})
        -> std::future<result<bool>>;

    [[nodiscard]] auto upload_async(std::string message,
                                    std::string project_id,
                                    cancellation_token token = {})
        -> std::future<result<void>>;

    [[nodiscard]] auto download_async(std::string project_id, cancellation_token token = {})
        -> std::future<result<std::filesystem::path>>;

    [[nodiscard]] auto config() const -> const client_config&;

private:
    struct impl;

    remote_project_client(client_config config,
                          std::shared_ptr<http_client_interface> http,
                          std::shared_ptr<http_client_interface> download_http,
                          std::shared_ptr<adapters::task_executor_interface> executor);

    template <typename T, typename Operation>
    auto run_async(Operation&& operation) -> std::future<result<T>>;

    std::unique_ptr<impl> impl_;
};

}  // namespace cavesync::remote_project

#endif  // CAVESYNC_REMOTE_PROJECT_CLIENT_REMOTE_PROJECT_CLIENT_H
