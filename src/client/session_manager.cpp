/**
 * @file session_manager.cpp
 * @brief Password and OAuth login against the backend
 */

#include "cavesync/remote_project/client/session_manager.h"

#include "cavesync/remote_project/client/client_types.h"
#include "cavesync/remote_project/core/logging.h"
#include "cavesync/remote_project/http/json_codec.h"

namespace cavesync::remote_project {

session_manager::session_manager(std::shared_ptr<http_client_interface> http,
                                 retry_executor retry,
                                 std::string user_agent)
    : http_(std::move(http)), retry_(std::move(retry)), user_agent_(std::move(user_agent)) {}

auto session_manager::authenticate(const credentials& creds,
                                   std::string_view instance_host,
                                   const cancellation_token& token)
    -> result<std::shared_ptr<const session>> {
    if (auto valid = creds.validate(); !valid) {
        return unexpected{valid.error()};
    }

    auto instance = instance_url::parse(instance_host);
    if (!instance) {
        return unexpected{instance.error()};
    }

    operation_log_context ctx;
    ctx.instance = instance.value().to_string();
    RP_LOG_INFO_CTX(log_category::session,
                    creds.password ? "Authenticating with password" : "Authenticating with OAuth token",
                    ctx);

    auto auth_token = creds.password
                          ? login_with_password(*creds.password, instance.value(), token)
                          : login_with_oauth(*creds.oauth, instance.value(), token);

    if (!auth_token) {
        publish(nullptr);
        if (auth_token.error().http_status != 0) {
            ctx.http_status = auth_token.error().http_status;
        }
        ctx.error_message = auth_token.error().message;
        RP_LOG_WARN_CTX(log_category::session, "Authentication failed", ctx);
        return unexpected{auth_token.error()};
    }

    auto next = std::make_shared<const session>(
        session{std::move(auth_token.value()), instance.value(), clock_type::now()});
    publish(next);

    RP_LOG_INFO_CTX(log_category::session, "Authenticated", ctx);
    return std::shared_ptr<const session>(next);
}

auto session_manager::login_with_password(const password_credentials& creds,
                                          const instance_url& instance,
                                          const cancellation_token& token)
    -> result<std::string> {
    const auto url = instance.resolve(api_routes::password_login);
    const auto body = json_codec::encode_login(creds);

    http_headers headers{
        {std::string(http_header::content_type), std::string(http_header::json_content_type)},
        {std::string(http_header::accept), "application/json"},
        {std::string(http_header::user_agent), user_agent_},
    };

    return retry_.execute(
        [&]() -> result<std::string> {
            auto response = http_->post(url, body, headers);
            if (!response) {
                return unexpected{response.error()};
            }
            const auto& r = response.value();
            if (!r.is_success()) {
                return unexpected{json_codec::status_error(error_code::authentication_failed,
                                                           r.status_code,
                                                           r.get_body_string(),
                                                           "Login rejected")};
            }
            return json_codec::decode_token(r.get_body_string());
        },
        "login", token);
}

auto session_manager::login_with_oauth(const oauth_credentials& creds,
                                       const instance_url& instance,
                                       const cancellation_token& token)
    -> result<std::string> {
    const auto url = instance.resolve(api_routes::auth_token);

    http_headers headers{
        {std::string(http_header::authorization),
         std::string(http_header::token_prefix) + creds.token},
        {std::string(http_header::accept), "application/json"},
        {std::string(http_header::user_agent), user_agent_},
    };

    return retry_.execute(
        [&]() -> result<std::string> {
            auto response = http_->get(url, {}, headers);
            if (!response) {
                return unexpected{response.error()};
            }
            const auto& r = response.value();
            if (!r.is_success()) {
                return unexpected{json_codec::status_error(error_code::authentication_failed,
                                                           r.status_code,
                                                           r.get_body_string(),
                                                           "OAuth token rejected")};
            }
            // The server may confirm the OAuth token without issuing a new one
            auto issued = json_codec::decode_token(r.get_body_string());
            if (issued && !issued.value().empty()) {
                return issued;
            }
            return creds.token;
        },
        "oauth_login", token);
}

void session_manager::logout() {
    bool had_session = false;
    {
        std::lock_guard lock(mutex_);
        had_session = session_ != nullptr;
        session_.reset();
    }
    if (had_session) {
        RP_LOG_INFO(log_category::session, "Logged out");
    }
}

auto session_manager::is_authenticated() const -> bool {
    std::lock_guard lock(mutex_);
    return session_ != nullptr;
}

auto session_manager::current_session() const -> std::shared_ptr<const session> {
    std::lock_guard lock(mutex_);
    return session_;
}

auto session_manager::require_session() const -> result<std::shared_ptr<const session>> {
    auto current = current_session();
    if (!current) {
        return unexpected{error{error_code::not_authenticated,
                                "No active session; call authenticate() first"}};
    }
    return current;
}

auto session_manager::current_instance() const -> result<instance_url> {
    auto current = require_session();
    if (!current) {
        return unexpected{current.error()};
    }
    return current.value()->instance;
}

auto session_manager::request_headers(const session& s) const -> http_headers {
    return {
        {std::string(http_header::authorization),
         std::string(http_header::token_prefix) + s.token},
        {std::string(http_header::accept), "application/json"},
        {std::string(http_header::user_agent), user_agent_},
    };
}

void session_manager::publish(std::shared_ptr<const session> next) {
    std::lock_guard lock(mutex_);
    session_ = std::move(next);
}

}  // namespace cavesync::remote_project
