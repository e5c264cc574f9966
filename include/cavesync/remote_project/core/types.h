/**
 * @file types.h
 * @brief Core result and error types for remote_project
 */

#ifndef CAVESYNC_REMOTE_PROJECT_CORE_TYPES_H
#define CAVESYNC_REMOTE_PROJECT_CORE_TYPES_H

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "cavesync/remote_project/core/error_codes.h"

namespace cavesync::remote_project {

/**
 * @brief Raw byte buffer used for archives and HTTP bodies
 */
using byte_buffer = std::vector<uint8_t>;

/**
 * @brief Error type with code, message and the HTTP status that caused it
 *
 * http_status is 0 when the failure did not come from an HTTP response.
 */
struct error {
    error_code code;
    std::string message;
    int http_status = 0;

    error() : code(error_code::success) {}
    explicit error(error_code c) : code(c), message(to_string(c)) {}
    error(error_code c, std::string msg) : code(c), message(std::move(msg)) {}
    error(error_code c, std::string msg, int status)
        : code(c), message(std::move(msg)), http_status(status) {}

    [[nodiscard]] explicit operator bool() const noexcept {
        return code != error_code::success;
    }
};

/**
 * @brief Retry classification for a concrete error
 *
 * Transport failures and 5xx/408 responses are transient. Every other 4xx,
 * local precondition failures and integrity failures are not.
 */
[[nodiscard]] inline auto is_retryable(const error& err) noexcept -> bool {
    if (err.code == error_code::operation_cancelled ||
        err.code == error_code::checksum_mismatch) {
        return false;
    }
    if (is_retryable(err.code)) {
        return true;
    }
    return err.http_status != 0 && is_retryable_status(err.http_status);
}

/**
 * @brief Wrapper for unexpected error (used with result<T>)
 */
struct unexpected {
    error err;

    explicit unexpected(error e) : err(std::move(e)) {}
};

/**
 * @brief Result type for operations that can fail
 *
 * Contains either a value of type T or an error.
 */
template <typename T>
class result {
public:
    result() : value_(std::nullopt), error_{} {}

    result(T value) : value_(std::move(value)), error_{} {}

    result(unexpected u) : value_(std::nullopt), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return value_.has_value(); }
    [[nodiscard]] explicit operator bool() const noexcept { return value_.has_value(); }

    [[nodiscard]] auto value() & -> T& { return *value_; }
    [[nodiscard]] auto value() const& -> const T& { return *value_; }
    [[nodiscard]] auto value() && -> T&& { return std::move(*value_); }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    std::optional<T> value_;
    struct error error_;
};

/**
 * @brief Specialization of result for void return type
 */
template <>
class result<void> {
public:
    result() : has_value_(true) {}

    result(unexpected u) : has_value_(false), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return has_value_; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value_; }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    bool has_value_;
    struct error error_;
};

}  // namespace cavesync::remote_project

#endif  // CAVESYNC_REMOTE_PROJECT_CORE_TYPES_H
