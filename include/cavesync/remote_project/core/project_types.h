/**
 * @file project_types.h
 * @brief Value types for sessions, projects and project locks
 */

#ifndef CAVESYNC_REMOTE_PROJECT_CORE_PROJECT_TYPES_H
#define CAVESYNC_REMOTE_PROJECT_CORE_PROJECT_TYPES_H

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

#include "cavesync/remote_project/core/instance_url.h"
#include "cavesync/remote_project/core/types.h"

namespace cavesync::remote_project {

using clock_type = std::chrono::system_clock;

/**
 * @brief Permission of the current user on a project
 */
enum class access_level {
    admin,
    read_and_write,
    read_only
};

[[nodiscard]] constexpr auto to_string(access_level level) noexcept -> const char* {
    switch (level) {
        case access_level::admin: return "ADMIN";
        case access_level::read_and_write: return "READ_AND_WRITE";
        case access_level::read_only: return "READ_ONLY";
        default: return "READ_ONLY";
    }
}

/**
 * @brief Parse the server's permission string; unknown values map to read_only
 */
[[nodiscard]] auto parse_access_level(std::string_view value) noexcept -> access_level;

/**
 * @brief Only ADMIN and READ_AND_WRITE may take the edit lock
 */
[[nodiscard]] constexpr auto can_acquire_lock(access_level level) noexcept -> bool {
    return level == access_level::admin || level == access_level::read_and_write;
}

/**
 * @brief Holder of a project's server-side mutex, as reported by the server
 */
struct mutex_info {
    std::optional<std::string> user;
    std::optional<std::string> creation_date;

    /**
     * @brief Holder name for display, "unknown user" when absent
     */
    [[nodiscard]] auto describe_holder() const -> std::string {
        return user && !user->empty() ? *user : std::string("unknown user");
    }
};

/**
 * @brief Immutable snapshot of a remote project
 *
 * Identity is id. Never mutated locally; each API response yields a new one.
 */
struct project {
    std::string id;
    std::string name;
    std::string description;
    std::string country_code;
    std::optional<double> latitude;
    std::optional<double> longitude;
    std::string modified_date;
    std::string creation_date;
    access_level permission = access_level::read_only;
    std::optional<mutex_info> active_mutex;

    [[nodiscard]] auto operator==(const project& other) const -> bool {
        return id == other.id;
    }
};

/**
 * @brief Client-local belief about a project's edit lock
 */
struct project_lock {
    std::string project_id;
    bool held_by_this_client = false;
    clock_type::time_point acquired_at;
    clock_type::time_point lease_expires_at;

    /**
     * @brief Held and not past its lease
     */
    [[nodiscard]] auto is_active(clock_type::time_point now = clock_type::now()) const
        -> bool {
        return held_by_this_client && now < lease_expires_at;
    }
};

/**
 * @brief Authenticated context, owned by session_manager and never mutated
 */
struct session {
    std::string token;
    instance_url instance;
    clock_type::time_point authenticated_at;
};

struct password_credentials {
    std::string email;
    std::string password;
};

struct oauth_credentials {
    std::string token;
};

/**
 * @brief Login material: exactly one of password or oauth must be set
 */
struct credentials {
    std::optional<password_credentials> password;
    std::optional<oauth_credentials> oauth;

    [[nodiscard]] static auto from_password(std::string email, std::string password)
        -> credentials {
        credentials c;
        c.password = password_credentials{std::move(email), std::move(password)};
        return c;
    }

    [[nodiscard]] static auto from_oauth(std::string token) -> credentials {
        credentials c;
        c.oauth = oauth_credentials{std::move(token)};
        return c;
    }

    /**
     * @brief Check that exactly one non-empty credential form is present
     * @return invalid_credentials otherwise
     */
    [[nodiscard]] auto validate() const -> result<void>;
};

/**
 * @brief Payload for creating a new remote project
 */
struct project_creation_request {
    std::string name;
    std::string description;
    std::string country_code;
    std::optional<double> latitude;
    std::optional<double> longitude;

    /**
     * @brief Check required fields and coordinate ranges
     * @return project_validation_failed on the first violation
     */
    [[nodiscard]] auto validate() const -> result<void>;
};

}  // namespace cavesync::remote_project

#endif  // CAVESYNC_REMOTE_PROJECT_CORE_PROJECT_TYPES_H
