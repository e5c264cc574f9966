/**
 * @file client_types.h
 * @brief Client configuration and backend API routes
 */

#ifndef CAVESYNC_REMOTE_PROJECT_CLIENT_CLIENT_TYPES_H
#define CAVESYNC_REMOTE_PROJECT_CLIENT_CLIENT_TYPES_H

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "cavesync/remote_project/core/logging.h"
#include "cavesync/remote_project/core/retry_executor.h"
#include "cavesync/remote_project/core/types.h"

namespace cavesync::remote_project {

/**
 * @brief REST routes of the backend, relative to the instance URL
 */
struct api_routes {
    static constexpr std::string_view password_login = "/api/v1/user/auth/login/";
    static constexpr std::string_view auth_token = "/api/v1/user/auth-token/";
    static constexpr std::string_view projects = "/api/v1/projects/";

    [[nodiscard]] static auto acquire(std::string_view project_id) -> std::string;
    [[nodiscard]] static auto release(std::string_view project_id) -> std::string;
    [[nodiscard]] static auto upload_archive(std::string_view project_id) -> std::string;
    [[nodiscard]] static auto download_archive(std::string_view project_id) -> std::string;
};

/**
 * @brief Client configuration
 */
struct client_config {
    /// Directory receiving downloaded archives as {project_id}.{archive_extension}
    std::filesystem::path archive_root = default_archive_root();
    std::string archive_extension = "tml";

    std::chrono::milliseconds request_timeout{60000};
    std::chrono::milliseconds download_timeout{120000};

    /// Local estimate of the server lock lease; refresh before it runs out
    std::chrono::seconds lock_lease{1800};

    retry_policy retry;

    /// Async worker threads (0 = hardware concurrency)
    std::size_t worker_count = 0;

    /// Archive of a freshly created, empty project; uploads identical to it are refused
    std::optional<std::filesystem::path> empty_template_path;

    std::string user_agent = "cavesync-remote-project";

    /// Instance host remembered by the host application, if any
    std::optional<std::string> default_instance;

    log_level min_log_level = log_level::info;

    /**
     * @brief Check the configuration
     * @return invalid_configuration on the first bad field
     */
    [[nodiscard]] auto validate() const -> result<void>;

    /**
     * @brief Defaults overlaid with CAVESYNC_ARCHIVE_ROOT, CAVESYNC_INSTANCE
     *        and CAVESYNC_LOG_LEVEL
     */
    [[nodiscard]] static auto from_environment() -> client_config;

    /**
     * @brief $HOME/.ariane, else %USERPROFILE%/.ariane, else a relative .ariane
     */
    [[nodiscard]] static auto default_archive_root() -> std::filesystem::path;
};

}  // namespace cavesync::remote_project

#endif  // CAVESYNC_REMOTE_PROJECT_CLIENT_CLIENT_TYPES_H
