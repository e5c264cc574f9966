/**
 * @file json_codec.h
 * @brief JSON request bodies and response parsing for the backend REST API
 */

#ifndef CAVESYNC_REMOTE_PROJECT_HTTP_JSON_CODEC_H
#define CAVESYNC_REMOTE_PROJECT_HTTP_JSON_CODEC_H

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "cavesync/remote_project/core/project_types.h"
#include "cavesync/remote_project/core/error_codes.h"
#include "cavesync/remote_project/core/types.h"

namespace cavesync::remote_project::json_codec {

// ============================================================================
// Request bodies
// ============================================================================

/**
 * @brief {"email": ..., "password": ...}
 */
[[nodiscard]] auto encode_login(const password_credentials& creds) -> std::string;

/**
 * @brief Project creation body; coordinates are sent as strings
 */
[[nodiscard]] auto encode_project_request(const project_creation_request& request)
    -> std::string;

// ============================================================================
// Responses
// ============================================================================

/**
 * @brief Read the "token" field of an auth response
 * @return The token, or invalid_response
 */
[[nodiscard]] auto decode_token(std::string_view body) -> result<std::string>;

/**
 * @brief Parse a project, either bare or wrapped in {"data": {...}}
 */
[[nodiscard]] auto decode_project(std::string_view body) -> result<project>;

/**
 * @brief Parse a project list, either a bare array or {"data": [...]}
 */
[[nodiscard]] auto decode_project_list(std::string_view body) -> result<std::vector<project>>;

/**
 * @brief Server-provided error text ("error", "detail" or "message"), if any
 */
[[nodiscard]] auto extract_error_message(std::string_view body) -> std::optional<std::string>;

/**
 * @brief Error for a non-success response: "{what} (HTTP {status}): {server text}"
 *
 * http_status is always set, so 5xx and 408 responses stay retryable
 * whatever @p code is.
 */
[[nodiscard]] auto status_error(error_code code,
                                int status_code,
                                std::string_view body,
                                std::string_view what) -> error;

}  // namespace cavesync::remote_project::json_codec

#endif  // CAVESYNC_REMOTE_PROJECT_HTTP_JSON_CODEC_H
