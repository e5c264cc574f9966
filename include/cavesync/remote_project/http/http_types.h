/**
 * @file http_types.h
 * @brief HTTP response type and the injectable client interface
 */

#ifndef CAVESYNC_REMOTE_PROJECT_HTTP_HTTP_TYPES_H
#define CAVESYNC_REMOTE_PROJECT_HTTP_HTTP_TYPES_H

#include <algorithm>
#include <cctype>
#include <map>
#include <optional>
#include <string>
#include <string_view>

#include "cavesync/remote_project/core/types.h"

namespace cavesync::remote_project {

using http_headers = std::map<std::string, std::string>;

/**
 * @brief Fixed header names and values expected by the backend
 */
struct http_header {
    static constexpr std::string_view authorization = "Authorization";
    static constexpr std::string_view content_type = "Content-Type";
    static constexpr std::string_view accept = "Accept";
    static constexpr std::string_view user_agent = "User-Agent";
    static constexpr std::string_view token_prefix = "Token ";
    static constexpr std::string_view json_content_type = "application/json; charset=utf-8";
};

/**
 * @brief HTTP response returned by http_client_interface
 */
struct http_response {
    int status_code = 0;
    http_headers headers;
    byte_buffer body;

    [[nodiscard]] auto get_body_string() const -> std::string {
        return std::string(body.begin(), body.end());
    }

    /**
     * @brief Get header value by key (case-insensitive)
     */
    [[nodiscard]] auto get_header(const std::string& key) const
        -> std::optional<std::string> {
        auto it = headers.find(key);
        if (it != headers.end()) {
            return it->second;
        }

        auto lower = [](std::string value) {
            std::transform(value.begin(), value.end(), value.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return value;
        };
        auto lower_key = lower(key);
        for (const auto& [k, v] : headers) {
            if (lower(k) == lower_key) {
                return v;
            }
        }
        return std::nullopt;
    }

    [[nodiscard]] auto is_success() const -> bool {
        return status_code >= 200 && status_code < 300;
    }

    [[nodiscard]] auto is_client_error() const -> bool {
        return status_code >= 400 && status_code < 500;
    }

    [[nodiscard]] auto is_server_error() const -> bool {
        return status_code >= 500 && status_code < 600;
    }
};

/**
 * @brief HTTP client interface used by every remote component
 *
 * Implementations return an error only when no HTTP response was received
 * (network_error or request_timeout). Any status code, including 4xx/5xx,
 * comes back as a successful result for the caller to interpret.
 * Tests inject in-memory implementations through this interface.
 */
class http_client_interface {
public:
    virtual ~http_client_interface() = default;

    /**
     * @brief Execute GET request
     */
    [[nodiscard]] virtual auto get(
        const std::string& url,
        const http_headers& query,
        const http_headers& headers) -> result<http_response> = 0;

    /**
     * @brief Execute POST request with string body
     */
    [[nodiscard]] virtual auto post(
        const std::string& url,
        const std::string& body,
        const http_headers& headers) -> result<http_response> = 0;

    /**
     * @brief Execute POST request with binary body
     */
    [[nodiscard]] virtual auto post(
        const std::string& url,
        const byte_buffer& body,
        const http_headers& headers) -> result<http_response> = 0;
};

}  // namespace cavesync::remote_project

#endif  // CAVESYNC_REMOTE_PROJECT_HTTP_HTTP_TYPES_H
