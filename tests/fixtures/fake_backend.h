/**
 * @file fake_backend.h
 * @brief In-memory project backend implementing http_client_interface
 */

#ifndef CAVESYNC_REMOTE_PROJECT_TEST_FAKE_BACKEND_H
#define CAVESYNC_REMOTE_PROJECT_TEST_FAKE_BACKEND_H

#include <cavesync/remote_project/http/http_types.h>

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>

namespace cavesync::remote_project::test {

/**
 * @brief Server double with single-holder project locks
 *
 * Locks belong to users, so two sessions of different users compete for
 * the same project. Uploads store the "artifact" part; downloads return it.
 * Failures can be injected per path fragment.
 */
class fake_backend : public http_client_interface {
public:
    struct stored_project {
        nlohmann::json meta;
        std::string permission = "ADMIN";
        std::optional<std::string> lock_holder;
        std::optional<byte_buffer> archive;
        std::string last_message;
        int uploads = 0;
    };

    void add_user(const std::string& email, const std::string& password) {
        std::lock_guard lock(mutex_);
        users_[email] = password;
    }

    void add_oauth_token(const std::string& token, const std::string& email) {
        std::lock_guard lock(mutex_);
        oauth_[token] = email;
    }

    void add_project(const std::string& id, const std::string& name,
                     const std::string& permission = "ADMIN") {
        std::lock_guard lock(mutex_);
        stored_project p;
        p.meta = {{"id", id},
                  {"name", name},
                  {"description", name + " survey"},
                  {"country", "FR"},
                  {"latitude", "45.1234"},
                  {"longitude", "5.6789"},
                  {"modified_date", "2024-01-01T00:00:00Z"},
                  {"creation_date", "2024-01-01T00:00:00Z"}};
        p.permission = permission;
        projects_[id] = std::move(p);
    }

    /**
     * @brief Answer the next @p times requests whose path contains
     *        @p fragment with @p status (0 = network failure)
     */
    void inject_failure(const std::string& fragment, int status, int times = 1) {
        std::lock_guard lock(mutex_);
        for (int i = 0; i < times; ++i) {
            failures_.push_back({fragment, status});
        }
    }

    void set_latency(std::chrono::milliseconds latency) { latency_ms_ = latency.count(); }

    [[nodiscard]] auto request_count() const -> std::size_t { return requests_.load(); }

    [[nodiscard]] auto lock_holder(const std::string& id) const -> std::optional<std::string> {
        std::lock_guard lock(mutex_);
        auto it = projects_.find(id);
        return it == projects_.end() ? std::nullopt : it->second.lock_holder;
    }

    [[nodiscard]] auto stored_archive(const std::string& id) const -> std::optional<byte_buffer> {
        std::lock_guard lock(mutex_);
        auto it = projects_.find(id);
        return it == projects_.end() ? std::nullopt : it->second.archive;
    }

    [[nodiscard]] auto last_message(const std::string& id) const -> std::string {
        std::lock_guard lock(mutex_);
        auto it = projects_.find(id);
        return it == projects_.end() ? std::string{} : it->second.last_message;
    }

    [[nodiscard]] auto upload_count(const std::string& id) const -> int {
        std::lock_guard lock(mutex_);
        auto it = projects_.find(id);
        return it == projects_.end() ? 0 : it->second.uploads;
    }

    /**
     * @brief Drop every issued session token (server-side logout)
     */
    void revoke_all_tokens() {
        std::lock_guard lock(mutex_);
        tokens_.clear();
    }

    [[nodiscard]] auto get(const std::string& url,
                           const http_headers& /*query*/,
                           const http_headers& headers) -> result<http_response> override {
        return handle("GET", url, headers, {});
    }

    [[nodiscard]] auto post(const std::string& url,
                            const std::string& body,
                            const http_headers& headers) -> result<http_response> override {
        return handle("POST", url, headers, byte_buffer(body.begin(), body.end()));
    }

    [[nodiscard]] auto post(const std::string& url,
                            const byte_buffer& body,
                            const http_headers& headers) -> result<http_response> override {
        return handle("POST", url, headers, body);
    }

private:
    static auto reply(int status, const nlohmann::json& body = nlohmann::json::object())
        -> result<http_response> {
        http_response response;
        response.status_code = status;
        auto text = body.dump();
        response.body.assign(text.begin(), text.end());
        return response;
    }

    static auto path_of(const std::string& url) -> std::string {
        auto pos = url.find("/api/");
        return pos == std::string::npos ? url : url.substr(pos);
    }

    auto handle(const std::string& method, const std::string& url,
                const http_headers& headers, const byte_buffer& body)
        -> result<http_response> {
        ++requests_;
        if (auto latency = latency_ms_.load(); latency > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(latency));
        }

        const auto path = path_of(url);
        std::lock_guard lock(mutex_);

        for (auto it = failures_.begin(); it != failures_.end(); ++it) {
            if (path.find(it->first) != std::string::npos) {
                int status = it->second;
                failures_.erase(it);
                if (status == 0) {
                    return unexpected{error{error_code::network_error, "connection reset"}};
                }
                return reply(status, {{"error", "injected failure"}});
            }
        }

        if (path == "/api/v1/user/auth/login/" && method == "POST") {
            auto doc = nlohmann::json::parse(body.begin(), body.end(), nullptr, false);
            if (doc.is_discarded() || !doc.contains("email") || !doc.contains("password")) {
                return reply(400, {{"error", "Malformed login"}});
            }
            auto user = users_.find(doc["email"].get<std::string>());
            if (user == users_.end() || user->second != doc["password"].get<std::string>()) {
                return reply(401, {{"error", "Invalid credentials"}});
            }
            return reply(200, {{"token", issue_token(user->first)}});
        }

        if (path == "/api/v1/user/auth-token/" && method == "GET") {
            auto oauth = oauth_.find(token_of(headers));
            if (oauth == oauth_.end()) {
                return reply(401, {{"detail", "Invalid token."}});
            }
            return reply(200, {{"token", issue_token(oauth->second)}});
        }

        auto user_it = tokens_.find(token_of(headers));
        if (user_it == tokens_.end()) {
            return reply(401, {{"detail", "Invalid token."}});
        }
        const auto user = user_it->second;

        if (path == "/api/v1/projects/") {
            if (method == "GET") {
                auto list = nlohmann::json::array();
                for (const auto& [id, p] : projects_) {
                    list.push_back(render(p));
                }
                return reply(200, {{"data", list}});
            }
            auto doc = nlohmann::json::parse(body.begin(), body.end(), nullptr, false);
            if (doc.is_discarded() || !doc.contains("name") || doc["name"] == "") {
                return reply(400, {{"error", "name is required"}});
            }
            auto id = "p-" + std::to_string(++next_id_);
            stored_project p;
            p.meta = doc;
            p.meta["id"] = id;
            p.meta["modified_date"] = "2024-06-01T00:00:00Z";
            p.meta["creation_date"] = "2024-06-01T00:00:00Z";
            projects_[id] = p;
            return reply(201, {{"data", render(projects_[id])}});
        }

        const std::string prefix = "/api/v1/projects/";
        if (path.rfind(prefix, 0) != 0) {
            return reply(404, {{"error", "Not found"}});
        }
        auto rest = path.substr(prefix.size());
        auto slash = rest.find('/');
        auto id = rest.substr(0, slash);
        auto action = slash == std::string::npos ? std::string{} : rest.substr(slash + 1);

        auto project_it = projects_.find(id);

        if (action == "download/ariane_tml/" && method == "GET") {
            if (project_it == projects_.end() || !project_it->second.archive) {
                return reply(422, {{"error", "Project has no file"}});
            }
            http_response response;
            response.status_code = 200;
            response.body = *project_it->second.archive;
            return response;
        }

        if (project_it == projects_.end()) {
            return reply(404, {{"error", "Project not found"}});
        }
        auto& p = project_it->second;

        if (action == "acquire/" && method == "POST") {
            if (p.lock_holder && *p.lock_holder != user) {
                return reply(409, {{"error", "Project is locked by " + *p.lock_holder}});
            }
            p.lock_holder = user;
            return reply(200, {{"data", render(p)}});
        }

        if (action == "release/" && method == "POST") {
            if (!p.lock_holder || *p.lock_holder != user) {
                return reply(403, {{"error", "You do not own the project lock"}});
            }
            p.lock_holder.reset();
            return reply(200, {{"data", render(p)}});
        }

        if (action == "upload/ariane_tml/" && method == "POST") {
            if (!p.lock_holder || *p.lock_holder != user) {
                return reply(403, {{"error", "Project is not locked by you"}});
            }
            auto content_type = headers.find("Content-Type");
            if (content_type == headers.end()) {
                return reply(400, {{"error", "Missing content type"}});
            }
            auto artifact = extract_part(body, content_type->second, "artifact");
            auto message = extract_part(body, content_type->second, "message");
            if (!artifact || !message) {
                return reply(400, {{"error", "Malformed multipart body"}});
            }
            p.archive = std::move(*artifact);
            p.last_message = std::string(message->begin(), message->end());
            ++p.uploads;
            return reply(200, {{"data", render(p)}});
        }

        return reply(405, {{"error", "Method not allowed"}});
    }

    auto issue_token(const std::string& user) -> std::string {
        auto token = "tok" + std::to_string(++next_token_) + "x" + user.substr(0, user.find('@'));
        tokens_[token] = user;
        return token;
    }

    static auto token_of(const http_headers& headers) -> std::string {
        auto it = headers.find("Authorization");
        if (it == headers.end() || it->second.rfind("Token ", 0) != 0) {
            return {};
        }
        return it->second.substr(6);
    }

    auto render(const stored_project& p) const -> nlohmann::json {
        auto out = p.meta;
        out["permission"] = p.permission;
        if (p.lock_holder) {
            out["active_mutex"] = {{"user", *p.lock_holder},
                                   {"creation_date", "2024-06-01T00:00:00Z"}};
        } else {
            out["active_mutex"] = nullptr;
        }
        return out;
    }

    static auto extract_part(const byte_buffer& body, const std::string& content_type,
                             const std::string& name) -> std::optional<byte_buffer> {
        auto marker = content_type.find("boundary=");
        if (marker == std::string::npos) {
            return std::nullopt;
        }
        const std::string delimiter = "\r\n--" + content_type.substr(marker + 9);
        const std::string text(body.begin(), body.end());

        auto header = text.find("name=\"" + name + "\"");
        if (header == std::string::npos) {
            return std::nullopt;
        }
        auto start = text.find("\r\n\r\n", header);
        if (start == std::string::npos) {
            return std::nullopt;
        }
        start += 4;
        auto end = text.find(delimiter, start);
        if (end == std::string::npos) {
            return std::nullopt;
        }
        return byte_buffer(body.begin() + static_cast<std::ptrdiff_t>(start),
                           body.begin() + static_cast<std::ptrdiff_t>(end));
    }

    mutable std::mutex mutex_;
    std::map<std::string, std::string> users_;
    std::map<std::string, std::string> oauth_;
    std::map<std::string, std::string> tokens_;
    std::map<std::string, stored_project> projects_;
    std::deque<std::pair<std::string, int>> failures_;
    std::atomic<long long> latency_ms_{0};
    std::atomic<std::size_t> requests_{0};
    int next_id_ = 0;
    int next_token_ = 0;
};

}  // namespace cavesync::remote_project::test

#endif  // CAVESYNC_REMOTE_PROJECT_TEST_FAKE_BACKEND_H
