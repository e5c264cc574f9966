/**
 * @file instance_url.h
 * @brief Normalized base URL of a backend instance
 */

#ifndef CAVESYNC_REMOTE_PROJECT_CORE_INSTANCE_URL_H
#define CAVESYNC_REMOTE_PROJECT_CORE_INSTANCE_URL_H

#include <cavesync/remote_project/core/types.h>

#include <string>
#include <string_view>

namespace cavesync::remote_project {

/**
 * @brief Normalized form of a user-supplied host string
 *
 * The scheme is derived from the host, never taken from the input:
 * loopback and RFC 1918 addresses (localhost, 127.*, 10.*, 172.16-31.*,
 * 192.168.*, each with an optional port) use http, everything else https.
 * Trailing slashes are stripped. Host case is preserved; equality ignores it.
 *
 * @code
 * auto url = instance_url::parse("HTTP://Example.COM/api/");
 * // url.value().to_string() == "https://Example.COM/api"
 * @endcode
 */
class instance_url {
public:
    static constexpr std::string_view default_host = "www.speleoDB.org";

    /**
     * @brief Normalize a host string
     * @return The normalized URL, or invalid_instance_url
     */
    [[nodiscard]] static auto parse(std::string_view input) -> result<instance_url>;

    /**
     * @brief The public instance used when the user configured none
     */
    [[nodiscard]] static auto default_instance() -> instance_url;

    [[nodiscard]] auto scheme() const -> const std::string& { return scheme_; }

    /**
     * @brief Host, optional port and optional path prefix, without scheme
     */
    [[nodiscard]] auto authority() const -> const std::string& { return authority_; }

    [[nodiscard]] auto is_local() const noexcept -> bool { return local_; }

    /**
     * @brief "scheme://authority"
     */
    [[nodiscard]] auto to_string() const -> std::string;

    /**
     * @brief Append an absolute API path ("/api/v1/...") to the base URL
     */
    [[nodiscard]] auto resolve(std::string_view path) const -> std::string;

    [[nodiscard]] auto operator==(const instance_url& other) const -> bool;

private:
    instance_url(std::string scheme, std::string authority, bool local);

    std::string scheme_;
    std::string authority_;
    bool local_;
};

/**
 * @brief Check whether a host (with optional port) is a loopback or private address
 */
[[nodiscard]] auto is_local_address(std::string_view host) -> bool;

}  // namespace cavesync::remote_project

#endif  // CAVESYNC_REMOTE_PROJECT_CORE_INSTANCE_URL_H
