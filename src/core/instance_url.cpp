/**
 * @file instance_url.cpp
 * @brief Instance URL normalization
 */

#include <cavesync/remote_project/core/instance_url.h>

#include <algorithm>
#include <cctype>
#include <regex>

namespace cavesync::remote_project {

namespace {

const std::regex& local_host_pattern() {
    static const std::regex pattern(
        R"(^(localhost|127\.\d{1,3}\.\d{1,3}\.\d{1,3}|10\.\d{1,3}\.\d{1,3}\.\d{1,3})"
        R"(|172\.(1[6-9]|2\d|3[01])\.\d{1,3}\.\d{1,3}|192\.168\.\d{1,3}\.\d{1,3})(:\d+)?$)",
        std::regex::icase);
    return pattern;
}

auto to_lower(std::string_view value) -> std::string {
    std::string out(value);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

auto trim(std::string_view value) -> std::string_view {
    auto is_space = [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; };
    while (!value.empty() && is_space(value.front())) value.remove_prefix(1);
    while (!value.empty() && is_space(value.back())) value.remove_suffix(1);
    return value;
}

}  // namespace

instance_url::instance_url(std::string scheme, std::string authority, bool local)
    : scheme_(std::move(scheme)), authority_(std::move(authority)), local_(local) {}

auto instance_url::parse(std::string_view input) -> result<instance_url> {
    auto value = trim(input);

    auto separator = value.find("://");
    if (separator != std::string_view::npos) {
        auto scheme = to_lower(value.substr(0, separator));
        if (scheme != "http" && scheme != "https") {
            return unexpected{error{error_code::invalid_instance_url,
                                    "Unsupported scheme: " + std::string(input)}};
        }
        value.remove_prefix(separator + 3);
    }

    while (!value.empty() && value.back() == '/') {
        value.remove_suffix(1);
    }

    if (value.empty() || value.front() == '/') {
        return unexpected{error{error_code::invalid_instance_url,
                                "Missing host in instance URL: '" + std::string(input) + "'"}};
    }

    if (std::any_of(value.begin(), value.end(), [](char c) {
            return std::isspace(static_cast<unsigned char>(c)) != 0 || c == '?' || c == '#';
        })) {
        return unexpected{error{error_code::invalid_instance_url,
                                "Malformed instance URL: '" + std::string(input) + "'"}};
    }

    std::string authority(value);
    auto host = std::string_view(authority).substr(0, authority.find('/'));
    bool local = is_local_address(host);

    return instance_url{local ? "http" : "https", std::move(authority), local};
}

auto instance_url::default_instance() -> instance_url {
    return instance_url{"https", std::string(default_host), false};
}

auto instance_url::to_string() const -> std::string {
    return scheme_ + "://" + authority_;
}

auto instance_url::resolve(std::string_view path) const -> std::string {
    std::string url = to_string();
    if (!path.empty() && path.front() != '/') {
        url += '/';
    }
    url += path;
    return url;
}

auto instance_url::operator==(const instance_url& other) const -> bool {
    return scheme_ == other.scheme_ && to_lower(authority_) == to_lower(other.authority_);
}

auto is_local_address(std::string_view host) -> bool {
    std::string value(host);
    return std::regex_match(value, local_host_pattern());
}

}  // namespace cavesync::remote_project
