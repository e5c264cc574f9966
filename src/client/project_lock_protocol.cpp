/**
 * @file project_lock_protocol.cpp
 * @brief Project lock requests and local lease tracking
 */

#include "cavesync/remote_project/client/project_lock_protocol.h"

#include "cavesync/remote_project/client/client_types.h"
#include "cavesync/remote_project/core/logging.h"
#include "cavesync/remote_project/http/json_codec.h"

namespace cavesync::remote_project {

project_lock_protocol::project_lock_protocol(std::shared_ptr<session_manager> sessions,
                                             std::shared_ptr<http_client_interface> http,
                                             retry_executor retry,
                                             std::chrono::seconds lease)
    : sessions_(std::move(sessions)),
      http_(std::move(http)),
      retry_(std::move(retry)),
      lease_(lease) {}

auto project_lock_protocol::send(lock_action action,
                                 const std::string& project_id,
                                 const cancellation_token& token) -> result<http_response> {
    auto current = sessions_->require_session();
    if (!current) {
        return unexpected{current.error()};
    }
    const auto& s = *current.value();

    const auto url = s.instance.resolve(action == lock_action::acquire
                                            ? api_routes::acquire(project_id)
                                            : api_routes::release(project_id));
    const auto headers = sessions_->request_headers(s);
    const char* name = action == lock_action::acquire ? "acquire_lock" : "release_lock";

    return retry_.execute(
        [&]() -> result<http_response> {
            auto response = http_->post(url, std::string{}, headers);
            if (!response) {
                return response;
            }
            if (response.value().is_server_error() || response.value().status_code == 408) {
                return unexpected{json_codec::status_error(error_code::server_error,
                                                           response.value().status_code,
                                                           response.value().get_body_string(),
                                                           name)};
            }
            return response;
        },
        name, token);
}

auto project_lock_protocol::acquire_or_refresh(const std::string& project_id,
                                               const cancellation_token& token)
    -> result<bool> {
    if (project_id.empty()) {
        return unexpected{error{error_code::invalid_argument, "Project id must not be empty"}};
    }

    auto response = send(lock_action::acquire, project_id, token);
    if (!response) {
        return unexpected{response.error()};
    }
    const auto& r = response.value();

    operation_log_context ctx;
    ctx.project_id = project_id;
    ctx.http_status = r.status_code;

    if (r.is_success()) {
        const auto now = clock_type::now();
        bool refreshed = false;
        {
            std::lock_guard lock(mutex_);
            auto& entry = locks_[project_id];
            refreshed = entry.is_active(now);
            if (!refreshed) {
                entry.project_id = project_id;
                entry.held_by_this_client = true;
                entry.acquired_at = now;
            }
            entry.lease_expires_at = now + lease_;
        }
        RP_LOG_INFO_CTX(log_category::lock,
                        refreshed ? "Lock refreshed" : "Lock acquired", ctx);
        return true;
    }

    if (r.status_code == 401) {
        return unexpected{json_codec::status_error(error_code::authentication_failed,
                                                   r.status_code,
                                                   r.get_body_string(),
                                                   "Lock request not authorized")};
    }

    {
        std::lock_guard lock(mutex_);
        locks_.erase(project_id);
    }

    ctx.error_message = json_codec::extract_error_message(r.get_body_string());
    RP_LOG_WARN_CTX(log_category::lock, "Lock not granted", ctx);
    return false;
}

auto project_lock_protocol::release(const std::string& project_id,
                                    const cancellation_token& token) -> result<bool> {
    if (auto current = sessions_->require_session(); !current) {
        return unexpected{current.error()};
    }

    // A stale entry is still sent: only the server knows whether its lease ran out
    {
        std::lock_guard lock(mutex_);
        if (locks_.find(project_id) == locks_.end()) {
            return false;
        }
    }

    auto response = send(lock_action::release, project_id, token);
    if (!response) {
        return unexpected{response.error()};
    }
    const auto& r = response.value();

    if (r.status_code == 401) {
        return unexpected{json_codec::status_error(error_code::authentication_failed,
                                                   r.status_code,
                                                   r.get_body_string(),
                                                   "Release not authorized")};
    }

    {
        std::lock_guard lock(mutex_);
        locks_.erase(project_id);
    }

    operation_log_context ctx;
    ctx.project_id = project_id;
    ctx.http_status = r.status_code;

    if (r.is_success()) {
        RP_LOG_INFO_CTX(log_category::lock, "Lock released", ctx);
        return true;
    }

    ctx.error_message = json_codec::extract_error_message(r.get_body_string());
    RP_LOG_WARN_CTX(log_category::lock, "Server did not recognise this client's lock", ctx);
    return false;
}

auto project_lock_protocol::release_all(const cancellation_token& token)
    -> result<std::size_t> {
    std::vector<std::string> ids;
    {
        std::lock_guard lock(mutex_);
        for (const auto& [id, entry] : locks_) {
            ids.push_back(id);
        }
    }

    std::size_t released = 0;
    for (const auto& id : ids) {
        auto outcome = release(id, token);
        if (!outcome) {
            return unexpected{outcome.error()};
        }
        if (outcome.value()) {
            ++released;
        }
    }
    return released;
}

auto project_lock_protocol::is_held(const std::string& project_id) const -> bool {
    std::lock_guard lock(mutex_);
    auto it = locks_.find(project_id);
    return it != locks_.end() && it->second.is_active();
}

auto project_lock_protocol::lock_state(const std::string& project_id) const
    -> std::optional<project_lock> {
    std::lock_guard lock(mutex_);
    auto it = locks_.find(project_id);
    if (it == locks_.end() || !it->second.is_active()) {
        return std::nullopt;
    }
    return it->second;
}

auto project_lock_protocol::held_locks() const -> std::vector<project_lock> {
    const auto now = clock_type::now();
    std::lock_guard lock(mutex_);
    std::vector<project_lock> held;
    for (const auto& [id, entry] : locks_) {
        if (entry.is_active(now)) {
            held.push_back(entry);
        }
    }
    return held;
}

void project_lock_protocol::forget_all() {
    std::lock_guard lock(mutex_);
    locks_.clear();
}

}  // namespace cavesync::remote_project
