/**
 * @file http_client.h
 * @brief network_system backed implementation of http_client_interface
 */

#ifndef CAVESYNC_REMOTE_PROJECT_HTTP_HTTP_CLIENT_H
#define CAVESYNC_REMOTE_PROJECT_HTTP_HTTP_CLIENT_H

#include "cavesync/remote_project/http/http_types.h"

#include <chrono>
#include <memory>
#include <string>

namespace cavesync::remote_project {

/**
 * @brief HTTP client wrapping kcenon::network::core::http_client
 *
 * Without network_system every request fails with network_error.
 *
 * @note Thread-safe for concurrent requests.
 */
class http_client : public http_client_interface {
public:
    /**
     * @brief Construct HTTP client with timeout
     * @param timeout Whole-request timeout
     */
    explicit http_client(
        std::chrono::milliseconds timeout = std::chrono::milliseconds(60000));

    ~http_client() override;

    http_client(const http_client&) = delete;
    auto operator=(const http_client&) -> http_client& = delete;
    http_client(http_client&&) noexcept;
    auto operator=(http_client&&) noexcept -> http_client&;

    [[nodiscard]] auto get(
        const std::string& url,
        const http_headers& query,
        const http_headers& headers) -> result<http_response> override;

    [[nodiscard]] auto post(
        const std::string& url,
        const std::string& body,
        const http_headers& headers) -> result<http_response> override;

    [[nodiscard]] auto post(
        const std::string& url,
        const byte_buffer& body,
        const http_headers& headers) -> result<http_response> override;

    /**
     * @brief Check if the HTTP transport is available
     * @return true if network_system is compiled in
     */
    [[nodiscard]] auto is_available() const noexcept -> bool;

    [[nodiscard]] auto timeout() const noexcept -> std::chrono::milliseconds;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

/**
 * @brief Factory function to create the default HTTP client
 */
[[nodiscard]] auto make_http_client(
    std::chrono::milliseconds timeout = std::chrono::milliseconds(60000))
    -> std::shared_ptr<http_client_interface>;

/**
 * @brief Map a transport failure message to network_error or request_timeout
 */
[[nodiscard]] auto classify_transport_failure(const std::string& method,
                                              const std::string& url,
                                              const std::string& detail) -> error;

}  // namespace cavesync::remote_project

#endif  // CAVESYNC_REMOTE_PROJECT_HTTP_HTTP_CLIENT_H
