/**
 * @file project_types.cpp
 * @brief Validation for credentials and project creation requests
 */

#include <cavesync/remote_project/core/project_types.h>

#include <cctype>
#include <cmath>

namespace cavesync::remote_project {

auto parse_access_level(std::string_view value) noexcept -> access_level {
    if (value == "ADMIN") return access_level::admin;
    if (value == "READ_AND_WRITE") return access_level::read_and_write;
    return access_level::read_only;
}

auto credentials::validate() const -> result<void> {
    if (password && oauth) {
        return unexpected{error{error_code::invalid_credentials,
                                "Supply either email/password or an OAuth token, not both"}};
    }
    if (password) {
        if (password->email.empty() || password->password.empty()) {
            return unexpected{error{error_code::invalid_credentials,
                                    "Email and password must not be empty"}};
        }
        return {};
    }
    if (oauth) {
        if (oauth->token.empty()) {
            return unexpected{error{error_code::invalid_credentials,
                                    "OAuth token must not be empty"}};
        }
        return {};
    }
    return unexpected{error{error_code::invalid_credentials,
                            "No credentials supplied"}};
}

auto project_creation_request::validate() const -> result<void> {
    auto fail = [](std::string message) -> result<void> {
        return unexpected{error{error_code::project_validation_failed, std::move(message)}};
    };

    if (name.empty()) {
        return fail("Project name is required");
    }
    if (description.empty()) {
        return fail("Project description is required");
    }
    if (country_code.size() != 2 ||
        !std::isalpha(static_cast<unsigned char>(country_code[0])) ||
        !std::isalpha(static_cast<unsigned char>(country_code[1]))) {
        return fail("Country must be a two-letter code");
    }
    if (latitude.has_value() != longitude.has_value()) {
        return fail("Latitude and longitude must be given together");
    }
    if (latitude && (!std::isfinite(*latitude) || *latitude < -90.0 || *latitude > 90.0)) {
        return fail("Latitude must be within [-90, 90]");
    }
    if (longitude &&
        (!std::isfinite(*longitude) || *longitude < -180.0 || *longitude > 180.0)) {
        return fail("Longitude must be within [-180, 180]");
    }
    return {};
}

}  // namespace cavesync::remote_project
