/**
 * @file error_codes.h
 * @brief Error codes for remote_project (-800 to -869 range)
 *
 * Error code ranges:
 * - -800 to -809: Authentication Errors
 * - -810 to -819: Lock Errors
 * - -820 to -829: Project Errors
 * - -830 to -839: Transport Errors
 * - -840 to -849: Transfer Errors
 * - -850 to -859: Local File Errors
 * - -860 to -869: Configuration / Argument Errors
 */

#ifndef CAVESYNC_REMOTE_PROJECT_CORE_ERROR_CODES_H
#define CAVESYNC_REMOTE_PROJECT_CORE_ERROR_CODES_H

#include <cstdint>
#include <string_view>

namespace cavesync::remote_project {

/**
 * @brief Error codes for remote project operations
 */
enum class error_code : int32_t {
    success = 0,

    // Authentication Errors (-800 to -809)
    invalid_credentials = -800,
    authentication_failed = -801,
    not_authenticated = -802,
    invalid_instance_url = -803,

    // Lock Errors (-810 to -819)
    lock_conflict = -810,
    lock_not_held = -811,

    // Project Errors (-820 to -829)
    project_not_found = -820,
    project_validation_failed = -821,
    access_denied = -822,

    // Transport Errors (-830 to -839)
    network_error = -830,
    request_timeout = -831,
    server_error = -832,
    unexpected_status = -833,
    invalid_response = -834,
    operation_cancelled = -835,

    // Transfer Errors (-840 to -849)
    upload_failed = -840,
    download_failed = -841,
    checksum_mismatch = -842,
    empty_archive_rejected = -843,

    // Local File Errors (-850 to -859)
    file_not_found = -850,
    file_read_error = -851,
    file_write_error = -852,

    // Configuration / Argument Errors (-860 to -869)
    invalid_argument = -860,
    invalid_configuration = -861,
    internal_error = -869,
};

/**
 * @brief Convert error_code to string
 */
[[nodiscard]] constexpr auto to_string(error_code code) noexcept -> std::string_view {
    switch (code) {
        case error_code::success:
            return "success";

        // Authentication Errors
        case error_code::invalid_credentials:
            return "invalid credentials";
        case error_code::authentication_failed:
            return "authentication rejected by server";
        case error_code::not_authenticated:
            return "not authenticated";
        case error_code::invalid_instance_url:
            return "invalid instance URL";

        // Lock Errors
        case error_code::lock_conflict:
            return "project locked by another user";
        case error_code::lock_not_held:
            return "project lock not held by this client";

        // Project Errors
        case error_code::project_not_found:
            return "project not found";
        case error_code::project_validation_failed:
            return "project validation failed";
        case error_code::access_denied:
            return "access denied";

        // Transport Errors
        case error_code::network_error:
            return "network error";
        case error_code::request_timeout:
            return "request timeout";
        case error_code::server_error:
            return "server error";
        case error_code::unexpected_status:
            return "unexpected HTTP status";
        case error_code::invalid_response:
            return "invalid server response";
        case error_code::operation_cancelled:
            return "operation cancelled";

        // Transfer Errors
        case error_code::upload_failed:
            return "upload failed";
        case error_code::download_failed:
            return "download failed";
        case error_code::checksum_mismatch:
            return "SHA-256 verification failed";
        case error_code::empty_archive_rejected:
            return "refusing to upload an empty project archive";

        // Local File Errors
        case error_code::file_not_found:
            return "local file not found";
        case error_code::file_read_error:
            return "file read error";
        case error_code::file_write_error:
            return "file write error";

        // Configuration / Argument Errors
        case error_code::invalid_argument:
            return "invalid argument";
        case error_code::invalid_configuration:
            return "invalid configuration";
        case error_code::internal_error:
            return "internal error";

        default:
            return "unknown error";
    }
}

/**
 * @brief Check if error code is in authentication error range
 */
[[nodiscard]] constexpr auto is_auth_error(error_code code) noexcept -> bool {
    auto v = static_cast<int32_t>(code);
    return v <= -800 && v >= -809;
}

/**
 * @brief Check if error code is in lock error range
 */
[[nodiscard]] constexpr auto is_lock_error(error_code code) noexcept -> bool {
    auto v = static_cast<int32_t>(code);
    return v <= -810 && v >= -819;
}

/**
 * @brief Check if error code is in project error range
 */
[[nodiscard]] constexpr auto is_project_error(error_code code) noexcept -> bool {
    auto v = static_cast<int32_t>(code);
    return v <= -820 && v >= -829;
}

/**
 * @brief Check if error code is in transport error range
 */
[[nodiscard]] constexpr auto is_transport_error(error_code code) noexcept -> bool {
    auto v = static_cast<int32_t>(code);
    return v <= -830 && v >= -839;
}

/**
 * @brief Check if error code is in transfer error range
 */
[[nodiscard]] constexpr auto is_transfer_error(error_code code) noexcept -> bool {
    auto v = static_cast<int32_t>(code);
    return v <= -840 && v >= -849;
}

/**
 * @brief Check if error code is in local file error range
 */
[[nodiscard]] constexpr auto is_io_error(error_code code) noexcept -> bool {
    auto v = static_cast<int32_t>(code);
    return v <= -850 && v >= -859;
}

/**
 * @brief Check if error code is in configuration error range
 */
[[nodiscard]] constexpr auto is_config_error(error_code code) noexcept -> bool {
    auto v = static_cast<int32_t>(code);
    return v <= -860 && v >= -869;
}

/**
 * @brief Check if an HTTP status is worth retrying (5xx and 408)
 */
[[nodiscard]] constexpr auto is_retryable_status(int status_code) noexcept -> bool {
    return status_code == 408 || (status_code >= 500 && status_code < 600);
}

/**
 * @brief Check if the error code alone marks a transient failure
 */
[[nodiscard]] constexpr auto is_retryable(error_code code) noexcept -> bool {
    switch (code) {
        case error_code::network_error:
        case error_code::request_timeout:
        case error_code::server_error:
            return true;
        default:
            return false;
    }
}

}  // namespace cavesync::remote_project

#endif  // CAVESYNC_REMOTE_PROJECT_CORE_ERROR_CODES_H
