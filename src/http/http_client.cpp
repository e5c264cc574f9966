/**
 * @file http_client.cpp
 * @brief network_system HTTP client adapter
 */

#include "cavesync/remote_project/http/http_client.h"

#include <algorithm>
#include <cctype>

#include "cavesync/remote_project/config/feature_flags.h"
#include "cavesync/remote_project/core/logging.h"

#if KCENON_WITH_NETWORK_SYSTEM
#include <kcenon/network/core/http_client.h>
#endif

namespace cavesync::remote_project {

// ============================================================================
// Implementation
// ============================================================================

struct http_client::impl {
#if KCENON_WITH_NETWORK_SYSTEM
    std::shared_ptr<kcenon::network::core::http_client> client;
#endif
    std::chrono::milliseconds timeout;
    bool available = false;

    explicit impl(std::chrono::milliseconds t) : timeout(t) {
#if KCENON_WITH_NETWORK_SYSTEM
        client = std::make_shared<kcenon::network::core::http_client>(timeout);
        available = true;
#endif
    }

#if KCENON_WITH_NETWORK_SYSTEM
    static auto convert_response(
        const kcenon::network::internal::http_response& resp) -> http_response {
        http_response converted;
        converted.status_code = resp.status_code;
        converted.headers = resp.headers;
        converted.body = byte_buffer(resp.body.begin(), resp.body.end());
        return converted;
    }

    template <typename Response>
    auto finish(const char* method, const std::string& url, Response&& response)
        -> result<http_response> {
        if (response.is_err()) {
            auto err = classify_transport_failure(method, url, response.error().message);
            RP_LOG_DEBUG(log_category::http, err.message);
            return unexpected{std::move(err)};
        }
        auto converted = convert_response(response.value());
        RP_LOG_TRACE(log_category::http, std::string(method) + " " + url + " -> " +
                                             std::to_string(converted.status_code));
        return converted;
    }
#endif
};

#if !KCENON_WITH_NETWORK_SYSTEM
namespace {

auto unavailable(const char* method, const std::string& url) -> result<http_response> {
    return unexpected{error{error_code::network_error,
        std::string("HTTP ") + method + " " + url +
            " failed: HTTP transport not available (network_system not built in)"}};
}

}  // namespace
#endif

// ============================================================================
// Constructor / Destructor
// ============================================================================

http_client::http_client(std::chrono::milliseconds timeout)
    : impl_(std::make_unique<impl>(timeout)) {}

http_client::~http_client() = default;

http_client::http_client(http_client&&) noexcept = default;
auto http_client::operator=(http_client&&) noexcept -> http_client& = default;

// ============================================================================
// HTTP Operations
// ============================================================================

auto http_client::get(
    const std::string& url,
    const http_headers& query,
    const http_headers& headers) -> result<http_response> {
#if KCENON_WITH_NETWORK_SYSTEM
    return impl_->finish("GET", url, impl_->client->get(url, query, headers));
#else
    (void)query;
    (void)headers;
    return unavailable("GET", url);
#endif
}

auto http_client::post(
    const std::string& url,
    const std::string& body,
    const http_headers& headers) -> result<http_response> {
#if KCENON_WITH_NETWORK_SYSTEM
    return impl_->finish("POST", url, impl_->client->post(url, body, headers));
#else
    (void)body;
    (void)headers;
    return unavailable("POST", url);
#endif
}

auto http_client::post(
    const std::string& url,
    const byte_buffer& body,
    const http_headers& headers) -> result<http_response> {
#if KCENON_WITH_NETWORK_SYSTEM
    return impl_->finish("POST", url, impl_->client->post(url, body, headers));
#else
    (void)body;
    (void)headers;
    return unavailable("POST", url);
#endif
}

// ============================================================================
// Utilities
// ============================================================================

auto http_client::is_available() const noexcept -> bool {
    return impl_->available;
}

auto http_client::timeout() const noexcept -> std::chrono::milliseconds {
    return impl_->timeout;
}

auto make_http_client(std::chrono::milliseconds timeout)
    -> std::shared_ptr<http_client_interface> {
    return std::make_shared<http_client>(timeout);
}

auto classify_transport_failure(const std::string& method,
                                const std::string& url,
                                const std::string& detail) -> error {
    std::string lower = detail;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    bool timed_out = lower.find("timeout") != std::string::npos ||
                     lower.find("timed out") != std::string::npos;

    return error{timed_out ? error_code::request_timeout : error_code::network_error,
                 "HTTP " + method + " " + url + " failed: " +
                     (detail.empty() ? std::string("no response") : detail)};
}

}  // namespace cavesync::remote_project
