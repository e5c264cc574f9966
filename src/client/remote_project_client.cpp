/**
 * @file remote_project_client.cpp
 * @brief Implementation of the remote project facade
 */

#include "cavesync/remote_project/client/remote_project_client.h"

#include <algorithm>
#include <mutex>

#include "cavesync/remote_project/client/file_transfer_engine.h"
#include "cavesync/remote_project/client/project_lock_protocol.h"
#include "cavesync/remote_project/client/session_manager.h"
#include "cavesync/remote_project/core/logging.h"
#include "cavesync/remote_project/http/http_client.h"
#include "cavesync/remote_project/http/json_codec.h"

namespace cavesync::remote_project {

struct remote_project_client::impl {
    client_config config;
    std::shared_ptr<http_client_interface> http;
    retry_executor retry;
    std::shared_ptr<session_manager> sessions;
    std::shared_ptr<project_lock_protocol> locks;
    std::shared_ptr<file_transfer_engine> transfers;
    std::shared_ptr<adapters::task_executor_interface> executor;

    std::mutex inflight_mutex;
    std::vector<std::future<void>> inflight;

    impl(client_config cfg,
         std::shared_ptr<http_client_interface> api_http,
         std::shared_ptr<http_client_interface> download_http,
         std::shared_ptr<adapters::task_executor_interface> exec)
        : config(std::move(cfg)),
          http(std::move(api_http)),
          retry(config.retry),
          executor(std::move(exec)) {
        sessions = std::make_shared<session_manager>(http, retry, config.user_agent);
        locks = std::make_shared<project_lock_protocol>(sessions, http, retry, config.lock_lease);
        transfers = std::make_shared<file_transfer_engine>(
            sessions, http, std::move(download_http), retry,
            transfer_config{config.archive_root, config.archive_extension,
                            config.empty_template_path});
    }

    ~impl() { drain(); }

    void track(std::future<void> task) {
        std::lock_guard lock(inflight_mutex);
        inflight.erase(std::remove_if(inflight.begin(), inflight.end(),
                                      [](const std::future<void>& f) {
                                          return !f.valid() ||
                                                 f.wait_for(std::chrono::seconds(0)) ==
                                                     std::future_status::ready;
                                      }),
                       inflight.end());
        inflight.push_back(std::move(task));
    }

    void drain() {
        std::vector<std::future<void>> pending;
        {
            std::lock_guard lock(inflight_mutex);
            pending.swap(inflight);
        }
        for (auto& task : pending) {
            if (task.valid()) {
                task.wait();
            }
        }
    }

    [[nodiscard]] auto list_projects(const cancellation_token& token)
        -> result<std::vector<project>> {
        auto current = sessions->require_session();
        if (!current) {
            return unexpected{current.error()};
        }
        const auto& s = *current.value();
        const auto url = s.instance.resolve(api_routes::projects);
        const auto headers = sessions->request_headers(s);

        auto response = retry.execute(
            [&]() -> result<http_response> {
                auto r = http->get(url, {}, headers);
                if (!r) {
                    return r;
                }
                if (!r.value().is_success()) {
                    auto code = r.value().status_code == 401 ? error_code::authentication_failed
                                                             : error_code::unexpected_status;
                    return unexpected{json_codec::status_error(
                        code, r.value().status_code, r.value().get_body_string(),
                        "Listing projects failed")};
                }
                return r;
            },
            "list_projects", token);

        if (!response) {
            return unexpected{response.error()};
        }

        auto projects = json_codec::decode_project_list(response.value().get_body_string());
        if (projects) {
            RP_LOG_DEBUG(log_category::client,
                         "Listed " + std::to_string(projects.value().size()) + " project(s)");
        }
        return projects;
    }

    [[nodiscard]] auto create_project(const project_creation_request& request)
        -> result<project> {
        auto current = sessions->require_session();
        if (!current) {
            return unexpected{current.error()};
        }
        if (auto valid = request.validate(); !valid) {
            return unexpected{valid.error()};
        }

        const auto& s = *current.value();
        auto headers = sessions->request_headers(s);
        headers[std::string(http_header::content_type)] =
            std::string(http_header::json_content_type);

        // Repeating a create could duplicate the project, so one attempt only
        auto response = http->post(s.instance.resolve(api_routes::projects),
                                   json_codec::encode_project_request(request), headers);
        if (!response) {
            return unexpected{response.error()};
        }

        const auto& r = response.value();
        if (!r.is_success()) {
            auto code = error_code::unexpected_status;
            if (r.status_code == 400) {
                code = error_code::project_validation_failed;
            } else if (r.status_code == 401) {
                code = error_code::authentication_failed;
            } else if (r.status_code == 403) {
                code = error_code::access_denied;
            }
            return unexpected{json_codec::status_error(code, r.status_code,
                                                       r.get_body_string(),
                                                       "Project creation failed")};
        }

        auto created = json_codec::decode_project(r.get_body_string());
        if (created) {
            operation_log_context ctx;
            ctx.project_id = created.value().id;
            ctx.http_status = r.status_code;
            RP_LOG_INFO_CTX(log_category::client, "Project created", ctx);
        }
        return created;
    }

    [[nodiscard]] auto require_lock(const std::string& project_id) const -> result<void> {
        if (auto current = sessions->require_session(); !current) {
            return unexpected{current.error()};
        }
        if (!locks->is_held(project_id)) {
            return unexpected{error{error_code::lock_not_held,
                                    "Acquire the lock of project " + project_id +
                                        " before uploading"}};
        }
        return {};
    }

    [[nodiscard]] auto authenticate(const credentials& creds,
                                    std::string_view instance_host,
                                    const cancellation_token& token) -> result<void> {
        auto session = sessions->authenticate(creds, instance_host, token);
        if (!session) {
            locks->forget_all();
            return unexpected{session.error()};
        }
        return {};
    }

    void logout() {
        locks->forget_all();
        sessions->logout();
    }

    [[nodiscard]] auto upload(const std::string& message,
                              const std::string& project_id,
                              const cancellation_token& token) -> result<void> {
        if (auto allowed = require_lock(project_id); !allowed) {
            return allowed;
        }
        return transfers->upload(message, project_id, token);
    }
};

// ============================================================================
// builder
// ============================================================================

remote_project_client::builder::builder() = default;

auto remote_project_client::builder::with_config(client_config config) -> builder& {
    config_ = std::move(config);
    return *this;
}

auto remote_project_client::builder::with_archive_root(std::filesystem::path root)
    -> builder& {
    config_.archive_root = std::move(root);
    return *this;
}

auto remote_project_client::builder::with_archive_extension(std::string extension)
    -> builder& {
    config_.archive_extension = std::move(extension);
    return *this;
}

auto remote_project_client::builder::with_request_timeout(std::chrono::milliseconds timeout)
    -> builder& {
    config_.request_timeout = timeout;
    return *this;
}

auto remote_project_client::builder::with_download_timeout(std::chrono::milliseconds timeout)
    -> builder& {
    config_.download_timeout = timeout;
    return *this;
}

auto remote_project_client::builder::with_lock_lease(std::chrono::seconds lease) -> builder& {
    config_.lock_lease = lease;
    return *this;
}

auto remote_project_client::builder::with_retry_policy(retry_policy policy) -> builder& {
    config_.retry = std::move(policy);
    return *this;
}

auto remote_project_client::builder::with_worker_count(std::size_t count) -> builder& {
    config_.worker_count = count;
    return *this;
}

auto remote_project_client::builder::with_empty_template(std::filesystem::path path)
    -> builder& {
    config_.empty_template_path = std::move(path);
    return *this;
}

auto remote_project_client::builder::with_user_agent(std::string user_agent) -> builder& {
    config_.user_agent = std::move(user_agent);
    return *this;
}

auto remote_project_client::builder::with_http_client(
    std::shared_ptr<http_client_interface> http) -> builder& {
    http_ = std::move(http);
    return *this;
}

auto remote_project_client::builder::with_download_http_client(
    std::shared_ptr<http_client_interface> http) -> builder& {
    download_http_ = std::move(http);
    return *this;
}

auto remote_project_client::builder::with_executor(
    std::shared_ptr<adapters::task_executor_interface> executor) -> builder& {
    executor_ = std::move(executor);
    return *this;
}

auto remote_project_client::builder::build() -> result<remote_project_client> {
    if (auto valid = config_.validate(); !valid) {
        return unexpected{valid.error()};
    }

    auto http = http_ ? http_ : make_http_client(config_.request_timeout);
    auto download_http = download_http_ ? download_http_
                         : http_        ? http_
                                        : make_http_client(config_.download_timeout);
    auto executor = executor_ ? executor_
                              : adapters::executor_factory::create(config_.worker_count);

    return remote_project_client{std::move(config_), std::move(http), std::move(download_http),
                                 std::move(executor)};
}

// ============================================================================
// remote_project_client
// ============================================================================

remote_project_client::remote_project_client(
    client_config config,
    std::shared_ptr<http_client_interface> http,
    std::shared_ptr<http_client_interface> download_http,
    std::shared_ptr<adapters::task_executor_interface> executor)
    : impl_(std::make_unique<impl>(std::move(config), std::move(http),
                                   std::move(download_http), std::move(executor))) {
    get_logger().initialize();
    get_logger().set_level(impl_->config.min_log_level);
}

remote_project_client::remote_project_client(remote_project_client&&) noexcept = default;

auto remote_project_client::operator=(remote_project_client&& other) noexcept
    -> remote_project_client& {
    if (this != &other) {
        impl_ = std::move(other.impl_);
    }
    return *this;
}

remote_project_client::~remote_project_client() = default;

auto remote_project_client::config() const -> const client_config& {
    return impl_->config;
}

auto remote_project_client::authenticate(const credentials& creds,
                                         std::string_view instance_host,
                                         const cancellation_token& token) -> result<void> {
    return impl_->authenticate(creds, instance_host, token);
}

void remote_project_client::logout() {
    impl_->logout();
}

auto remote_project_client::is_authenticated() const -> bool {
    return impl_->sessions->is_authenticated();
}

auto remote_project_client::current_instance() const -> result<instance_url> {
    return impl_->sessions->current_instance();
}

auto remote_project_client::list_projects(const cancellation_token& token)
    -> result<std::vector<project>> {
    return impl_->list_projects(token);
}

auto remote_project_client::create_project(const project_creation_request& request)
    -> result<project> {
    return impl_->create_project(request);
}

auto remote_project_client::acquire_or_refresh(const std::string& project_id,
                                               const cancellation_token& token)
    -> result<bool> {
    return impl_->locks->acquire_or_refresh(project_id, token);
}

auto remote_project_client::acquire_or_refresh(const project& target,
                                               const cancellation_token& token)
    -> result<bool> {
    if (auto current = impl_->sessions->require_session(); !current) {
        return unexpected{current.error()};
    }
    if (!can_acquire_lock(target.permission)) {
        return unexpected{error{error_code::access_denied,
                                std::string("Project ") + target.id + " is " +
                                    to_string(target.permission)}};
    }
    return impl_->locks->acquire_or_refresh(target.id, token);
}

auto remote_project_client::release(const std::string& project_id,
                                    const cancellation_token& token) -> result<bool> {
    return impl_->locks->release(project_id, token);
}

auto remote_project_client::release_all(const cancellation_token& token)
    -> result<std::size_t> {
    if (auto current = impl_->sessions->require_session(); !current) {
        return unexpected{current.error()};
    }
    return impl_->locks->release_all(token);
}

auto remote_project_client::lock_state(const std::string& project_id) const
    -> std::optional<project_lock> {
    return impl_->locks->lock_state(project_id);
}

auto remote_project_client::held_locks() const -> std::vector<project_lock> {
    return impl_->locks->held_locks();
}

auto remote_project_client::upload(const std::string& message,
                                   const std::string& project_id,
                                   const cancellation_token& token) -> result<void> {
    return impl_->upload(message, project_id, token);
}

auto remote_project_client::upload_bytes(const std::string& message,
                                         const std::string& project_id,
                                         const byte_buffer& archive,
                                         const cancellation_token& token) -> result<void> {
    if (auto allowed = impl_->require_lock(project_id); !allowed) {
        return allowed;
    }
    return impl_->transfers->upload_bytes(message, project_id, archive, token);
}

auto remote_project_client::download(const std::string& project_id,
                                     const cancellation_token& token)
    -> result<std::filesystem::path> {
    return impl_->transfers->download(project_id, token);
}

auto remote_project_client::download_verified(const std::string& project_id,
                                              std::string_view expected_sha256,
                                              const cancellation_token& token)
    -> result<std::filesystem::path> {
    return impl_->transfers->download_verified(project_id, expected_sha256, token);
}

auto remote_project_client::archive_path(const std::string& project_id) const
    -> std::filesystem::path {
    return impl_->transfers->archive_path(project_id);
}

// ============================================================================
// Async
// ============================================================================

template <typename T, typename Operation>
auto remote_project_client::run_async(Operation&& operation) -> std::future<result<T>> {
    auto promise = std::make_shared<std::promise<result<T>>>();
    auto future = promise->get_future();

    impl_->track(impl_->executor->submit(
        [promise, op = std::forward<Operation>(operation)]() mutable {
            try {
                promise->set_value(op());
            } catch (...) {
                promise->set_exception(std::current_exception());
            }
        }));

    return future;
}

auto remote_project_client::authenticate_async(credentials creds,
                                               std::string instance_host,
                                               cancellation_token token)
    -> std::future<result<void>> {
    return run_async<void>([self = impl_.get(), creds = std::move(creds),
                            host = std::move(instance_host), token]() {
        return self->authenticate(creds, host, token);
    });
}

auto remote_project_client::logout_async() -> std::future<result<void>> {
    return run_async<void>([self = impl_.get()]() -> result<void> {
        self->logout();
        return {};
    });
}

auto remote_project_client::list_projects_async(cancellation_token token)
    -> std::future<result<std::vector<project>>> {
    return run_async<std::vector<project>>(
        [self = impl_.get(), token]() { return self->list_projects(token); });
}

auto remote_project_client::create_project_async(project_creation_request request)
    -> std::future<result<project>> {
    return run_async<project>([self = impl_.get(), request = std::move(request)]() {
        return self->create_project(request);
    });
}

auto remote_project_client::acquire_or_refresh_async(std::string project_id,
                                                     cancellation_token token)
    -> std::future<result<bool>> {
    return run_async<bool>([self = impl_.get(), id = std::move(project_id), token]() {
        return self->locks->acquire_or_refresh(id, token);
    });
}

auto remote_project_client::release_async(std::string project_id, cancellation_token token)
    -> std::future<result<bool>> {
    return run_async<bool>([self = impl_.get(), id = std::move(project_id), token]() {
        return self->locks->release(id, token);
    });
}

auto remote_project_client::upload_async(std::string message,
                                         std::string project_id,
                                         cancellation_token token)
    -> std::future<result<void>> {
    return run_async<void>([self = impl_.get(), msg = std::move(message),
                            id = std::move(project_id), token]() {
        return self->upload(msg, id, token);
    });
}

auto remote_project_client::download_async(std::string project_id, cancellation_token token)
    -> std::future<result<std::filesystem::path>> {
    return run_async<std::filesystem::path>(
        [self = impl_.get(), id = std::move(project_id), token]() {
            return self->transfers->download(id, token);
        });
}

}  // namespace cavesync::remote_project
