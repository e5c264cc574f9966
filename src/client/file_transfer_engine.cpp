/**
 * @file file_transfer_engine.cpp
 * @brief Archive upload and download
 */

#include "cavesync/remote_project/client/file_transfer_engine.h"

#include <chrono>
#include <fstream>
#include <iterator>
#include <string_view>

#include "cavesync/remote_project/client/client_types.h"
#include "cavesync/remote_project/core/checksum.h"
#include "cavesync/remote_project/core/logging.h"
#include "cavesync/remote_project/http/json_codec.h"

namespace cavesync::remote_project {

namespace {

constexpr std::string_view artifact_content_type = "application/octet-stream";

auto read_file(const std::filesystem::path& path) -> result<byte_buffer> {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return unexpected{error{error_code::file_not_found,
                                "Archive not found: " + path.string()}};
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return unexpected{error{error_code::file_read_error,
                                "Cannot open archive: " + path.string()}};
    }

    byte_buffer data((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad()) {
        return unexpected{error{error_code::file_read_error,
                                "Cannot read archive: " + path.string()}};
    }
    return data;
}

/**
 * @brief A project id must name one file directly under the archive root
 */
auto check_project_id(std::string_view project_id) -> result<void> {
    if (project_id.empty()) {
        return unexpected{error{error_code::invalid_argument, "Project id must not be empty"}};
    }
    const bool escapes = project_id.front() == '.' ||
                         project_id.find('/') != std::string_view::npos ||
                         project_id.find('\\') != std::string_view::npos ||
                         project_id.find('\0') != std::string_view::npos ||
                         project_id.find("..") != std::string_view::npos;
    if (escapes) {
        return unexpected{error{error_code::invalid_argument,
                                "Project id '" + std::string(project_id) +
                                    "' cannot name a local archive"}};
    }
    return {};
}

auto temp_path_for(const std::filesystem::path& target) -> std::filesystem::path {
    auto temp = target;
    temp += ".tmp_" + multipart_encoder::generate_boundary().substr(0, 16);
    return temp;
}

auto elapsed_ms(std::chrono::steady_clock::time_point since) -> uint64_t {
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
                                     std::chrono::steady_clock::now() - since)
                                     .count());
}

}  // namespace

file_transfer_engine::file_transfer_engine(std::shared_ptr<session_manager> sessions,
                                           std::shared_ptr<http_client_interface> http,
                                           std::shared_ptr<http_client_interface> download_http,
                                           retry_executor retry,
                                           transfer_config config)
    : sessions_(std::move(sessions)),
      http_(std::move(http)),
      download_http_(download_http ? std::move(download_http) : http_),
      retry_(std::move(retry)),
      config_(std::move(config)) {}

auto file_transfer_engine::archive_path(std::string_view project_id) const
    -> std::filesystem::path {
    return config_.archive_root /
           (std::string(project_id) + "." + config_.archive_extension);
}

// ============================================================================
// Upload
// ============================================================================

auto file_transfer_engine::upload(const std::string& message,
                                  const std::string& project_id,
                                  const cancellation_token& token) -> result<void> {
    if (auto valid = check_project_id(project_id); !valid) {
        return valid;
    }
    auto archive = read_file(archive_path(project_id));
    if (!archive) {
        return unexpected{archive.error()};
    }
    return upload_bytes(message, project_id, archive.value(), token);
}

auto file_transfer_engine::is_empty_template(const byte_buffer& archive) const
    -> result<bool> {
    if (!config_.empty_template_path) {
        return false;
    }
    auto template_digest = checksum::sha256_file(*config_.empty_template_path);
    if (!template_digest) {
        return unexpected{template_digest.error()};
    }
    return checksum::sha256(std::span<const uint8_t>(archive)) == template_digest.value();
}

auto file_transfer_engine::upload_bytes(const std::string& message,
                                        const std::string& project_id,
                                        const byte_buffer& archive,
                                        const cancellation_token& token) -> result<void> {
    if (auto valid = check_project_id(project_id); !valid) {
        return unexpected{valid.error()};
    }

    auto current = sessions_->require_session();
    if (!current) {
        return unexpected{current.error()};
    }
    const auto& s = *current.value();

    auto empty = is_empty_template(archive);
    if (!empty) {
        return unexpected{empty.error()};
    }
    if (empty.value()) {
        return unexpected{error{error_code::empty_archive_rejected,
                                "Archive of project " + project_id +
                                    " is identical to the empty project template"}};
    }

    auto body = encoder_.build({
        multipart_part::text("message", message),
        multipart_part::file("artifact", archive, std::string(artifact_content_type),
                             project_id + "." + config_.archive_extension),
    });
    if (!body) {
        return unexpected{body.error()};
    }

    const auto url = s.instance.resolve(api_routes::upload_archive(project_id));
    auto headers = sessions_->request_headers(s);
    headers[std::string(http_header::content_type)] = body.value().content_type;

    operation_log_context ctx;
    ctx.project_id = project_id;
    ctx.bytes = archive.size();
    RP_LOG_INFO_CTX(log_category::transfer, "Uploading archive", ctx);

    const auto started = std::chrono::steady_clock::now();
    auto outcome = retry_.execute(
        [&]() -> result<void> {
            auto response = http_->post(url, body.value().bytes, headers);
            if (!response) {
                return unexpected{response.error()};
            }
            const auto& r = response.value();
            if (!r.is_success()) {
                return unexpected{json_codec::status_error(error_code::upload_failed,
                                                           r.status_code,
                                                           r.get_body_string(),
                                                           "Upload rejected")};
            }
            return {};
        },
        "upload", token);

    ctx.duration_ms = elapsed_ms(started);
    if (!outcome) {
        if (outcome.error().http_status != 0) {
            ctx.http_status = outcome.error().http_status;
        }
        ctx.error_message = outcome.error().message;
        RP_LOG_ERROR_CTX(log_category::transfer, "Upload failed", ctx);
        return outcome;
    }

    RP_LOG_INFO_CTX(log_category::transfer, "Upload complete", ctx);
    return {};
}

// ============================================================================
// Download
// ============================================================================

auto file_transfer_engine::download(const std::string& project_id,
                                    const cancellation_token& token)
    -> result<std::filesystem::path> {
    return fetch_to(project_id, std::nullopt, token);
}

auto file_transfer_engine::download_verified(const std::string& project_id,
                                             std::string_view expected_sha256,
                                             const cancellation_token& token)
    -> result<std::filesystem::path> {
    if (!checksum::is_valid_digest(expected_sha256)) {
        return unexpected{error{error_code::invalid_argument,
                                "Expected digest must be 64 hex characters"}};
    }
    return fetch_to(project_id, expected_sha256, token);
}

auto file_transfer_engine::fetch_to(const std::string& project_id,
                                    std::optional<std::string_view> expected_sha256,
                                    const cancellation_token& token)
    -> result<std::filesystem::path> {
    if (auto valid = check_project_id(project_id); !valid) {
        return unexpected{valid.error()};
    }

    auto current = sessions_->require_session();
    if (!current) {
        return unexpected{current.error()};
    }
    const auto& s = *current.value();

    const auto url = s.instance.resolve(api_routes::download_archive(project_id));
    const auto headers = sessions_->request_headers(s);

    operation_log_context ctx;
    ctx.project_id = project_id;
    RP_LOG_INFO_CTX(log_category::transfer, "Downloading archive", ctx);

    const auto started = std::chrono::steady_clock::now();
    auto response = retry_.execute(
        [&]() -> result<http_response> {
            auto r = download_http_->get(url, {}, headers);
            if (!r) {
                return r;
            }
            const auto status = r.value().status_code;
            if (status == 422) {
                return unexpected{json_codec::status_error(error_code::project_not_found,
                                                           status,
                                                           r.value().get_body_string(),
                                                           "Project has no downloadable archive")};
            }
            if (!r.value().is_success()) {
                return unexpected{json_codec::status_error(error_code::download_failed,
                                                           status,
                                                           r.value().get_body_string(),
                                                           "Download rejected")};
            }
            return r;
        },
        "download", token);

    ctx.duration_ms = elapsed_ms(started);
    if (!response) {
        if (response.error().http_status != 0) {
            ctx.http_status = response.error().http_status;
        }
        ctx.error_message = response.error().message;
        RP_LOG_ERROR_CTX(log_category::transfer, "Download failed", ctx);
        return unexpected{response.error()};
    }

    const auto& body = response.value().body;
    ctx.bytes = body.size();

    if (expected_sha256) {
        auto actual = checksum::sha256(std::span<const uint8_t>(body));
        if (!checksum::digests_equal(actual, *expected_sha256)) {
            ctx.error_message = "expected " + std::string(*expected_sha256) + ", got " + actual;
            RP_LOG_ERROR_CTX(log_category::transfer, "Downloaded archive failed verification", ctx);
            return unexpected{error{error_code::checksum_mismatch,
                                    "SHA-256 mismatch for project " + project_id}};
        }
    }

    const auto target = archive_path(project_id);
    const auto temp = temp_path_for(target);

    std::error_code ec;
    std::filesystem::create_directories(config_.archive_root, ec);
    if (ec) {
        return unexpected{error{error_code::file_write_error,
                                "Cannot create archive root " + config_.archive_root.string() +
                                    ": " + ec.message()}};
    }

    {
        std::ofstream file(temp, std::ios::binary | std::ios::trunc);
        if (!file) {
            return unexpected{error{error_code::file_write_error,
                                    "Cannot create " + temp.string()}};
        }
        file.write(reinterpret_cast<const char*>(body.data()),
                   static_cast<std::streamsize>(body.size()));
        file.close();
        if (!file) {
            std::filesystem::remove(temp, ec);
            return unexpected{error{error_code::file_write_error,
                                    "Cannot write " + temp.string()}};
        }
    }

    std::filesystem::rename(temp, target, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(temp, ignored);
        return unexpected{error{error_code::file_write_error,
                                "Cannot move downloaded archive into place: " + ec.message()}};
    }

    RP_LOG_INFO_CTX(log_category::transfer, "Download complete", ctx);
    return target;
}

}  // namespace cavesync::remote_project
