/**
 * @file client_types.cpp
 * @brief Client configuration and API route helpers
 */

#include "cavesync/remote_project/client/client_types.h"

#include <cctype>
#include <cstdlib>
#include <iomanip>
#include <sstream>

namespace cavesync::remote_project {

namespace {

auto encode_path_segment(std::string_view segment) -> std::string {
    std::ostringstream escaped;
    escaped.fill('0');
    escaped << std::hex;

    for (char c : segment) {
        auto uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc) || c == '-' || c == '_' || c == '.' || c == '~') {
            escaped << c;
        } else {
            escaped << '%' << std::setw(2) << std::uppercase << static_cast<int>(uc)
                    << std::nouppercase;
        }
    }
    return escaped.str();
}

auto project_route(std::string_view project_id, std::string_view suffix) -> std::string {
    return std::string(api_routes::projects) + encode_path_segment(project_id) + "/" +
           std::string(suffix);
}

auto env(const char* name) -> std::optional<std::string> {
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0') {
        return std::nullopt;
    }
    return std::string(value);
}

}  // namespace

auto api_routes::acquire(std::string_view project_id) -> std::string {
    return project_route(project_id, "acquire/");
}

auto api_routes::release(std::string_view project_id) -> std::string {
    return project_route(project_id, "release/");
}

auto api_routes::upload_archive(std::string_view project_id) -> std::string {
    return project_route(project_id, "upload/ariane_tml/");
}

auto api_routes::download_archive(std::string_view project_id) -> std::string {
    return project_route(project_id, "download/ariane_tml/");
}

auto client_config::validate() const -> result<void> {
    auto fail = [](const char* message) -> result<void> {
        return unexpected{error{error_code::invalid_configuration, message}};
    };

    if (archive_root.empty()) {
        return fail("Archive root directory must not be empty");
    }
    if (archive_extension.empty() ||
        archive_extension.find_first_of("/\\.") != std::string::npos) {
        return fail("Archive extension must be a bare extension such as \"tml\"");
    }
    if (request_timeout.count() <= 0 || download_timeout.count() <= 0) {
        return fail("Timeouts must be positive");
    }
    if (lock_lease.count() <= 0) {
        return fail("Lock lease must be positive");
    }
    if (retry.max_attempts == 0) {
        return fail("Retry policy needs at least one attempt");
    }
    if (retry.base_delay.count() < 0 || retry.max_delay < retry.base_delay) {
        return fail("Retry delays must satisfy 0 <= base_delay <= max_delay");
    }
    return {};
}

auto client_config::from_environment() -> client_config {
    client_config config;

    if (auto root = env("CAVESYNC_ARCHIVE_ROOT")) {
        config.archive_root = *root;
    }
    if (auto instance = env("CAVESYNC_INSTANCE")) {
        config.default_instance = *instance;
    }
    if (auto level = env("CAVESYNC_LOG_LEVEL")) {
        if (auto parsed = parse_log_level(*level)) {
            config.min_log_level = *parsed;
        } else {
            RP_LOG_WARN(log_category::client,
                        "Ignoring unknown CAVESYNC_LOG_LEVEL '" + *level + "'");
        }
    }
    return config;
}

auto client_config::default_archive_root() -> std::filesystem::path {
    if (auto home = env("HOME")) {
        return std::filesystem::path(*home) / ".ariane";
    }
    if (auto profile = env("USERPROFILE")) {
        return std::filesystem::path(*profile) / ".ariane";
    }
    return std::filesystem::path(".ariane");
}

}  // namespace cavesync::remote_project
