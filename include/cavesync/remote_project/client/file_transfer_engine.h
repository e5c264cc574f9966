/**
 * @file file_transfer_engine.h
 * @brief Archive upload (multipart) and download (atomic write)
 */

#ifndef CAVESYNC_REMOTE_PROJECT_CLIENT_FILE_TRANSFER_ENGINE_H
#define CAVESYNC_REMOTE_PROJECT_CLIENT_FILE_TRANSFER_ENGINE_H

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "cavesync/remote_project/client/session_manager.h"
#include "cavesync/remote_project/core/cancellation.h"
#include "cavesync/remote_project/core/retry_executor.h"
#include "cavesync/remote_project/core/types.h"
#include "cavesync/remote_project/http/http_types.h"
#include "cavesync/remote_project/http/multipart_body.h"

namespace cavesync::remote_project {

/**
 * @brief Local layout of downloaded archives
 */
struct transfer_config {
    std::filesystem::path archive_root;
    std::string archive_extension = "tml";
    std::optional<std::filesystem::path> empty_template_path;
};

/**
 * @brief Moves project archives between the backend and the archive root
 *
 * Uploads are multipart/form-data with a "message" text part and an
 * "artifact" file part named {project_id}.{extension}. Downloads land in
 * {archive_root}/{project_id}.{extension}: the body is written to a
 * temporary file in the same directory and renamed over the target, so an
 * interrupted download never leaves a truncated archive behind.
 *
 * This class does not check lock ownership; remote_project_client does.
 *
 * @note Thread-safe for different projects. Concurrent downloads of the
 *       same project race on the final rename; the last one wins.
 */
class file_transfer_engine {
public:
    file_transfer_engine(std::shared_ptr<session_manager> sessions,
                         std::shared_ptr<http_client_interface> http,
                         std::shared_ptr<http_client_interface> download_http,
                         retry_executor retry,
                         transfer_config config);

    file_transfer_engine(const file_transfer_engine&) = delete;
    auto operator=(const file_transfer_engine&) -> file_transfer_engine& = delete;

    /**
     * @brief Path of a project's local archive
     */
    [[nodiscard]] auto archive_path(std::string_view project_id) const
        -> std::filesystem::path;

    /**
     * @brief Upload the local archive of @p project_id
     *
     * Every transfer refuses with invalid_argument a project id that is not
     * a single file name (separators, "..", a leading dot).
     * @return file_not_found / file_read_error for the local file, otherwise
     *         as upload_bytes()
     */
    [[nodiscard]] auto upload(const std::string& message,
                              const std::string& project_id,
                              const cancellation_token& token = {}) -> result<void>;

    /**
     * @brief Upload an archive held in memory
     * @return empty_archive_rejected when identical to the empty-project
     *         template, upload_failed (with http_status) for a refused
     *         upload, or a transport error after retries
     */
    [[nodiscard]] auto upload_bytes(const std::string& message,
                                    const std::string& project_id,
                                    const byte_buffer& archive,
                                    const cancellation_token& token = {}) -> result<void>;

    /**
     * @brief Download the latest archive into the archive root
     * @return Path of the written archive, or project_not_found (HTTP 422),
     *         download_failed (with http_status), file_write_error, or a
     *         transport error after retries
     */
    [[nodiscard]] auto download(const std::string& project_id,
                                const cancellation_token& token = {})
        -> result<std::filesystem::path>;

    /**
     * @brief Download and check the SHA-256 before replacing the local archive
     * @return checksum_mismatch without touching the existing archive when
     *         the digest differs
     */
    [[nodiscard]] auto download_verified(const std::string& project_id,
                                         std::string_view expected_sha256,
                                         const cancellation_token& token = {})
        -> result<std::filesystem::path>;

    [[nodiscard]] auto config() const -> const transfer_config& { return config_; }

private:
    [[nodiscard]] auto fetch_to(const std::string& project_id,
                                std::optional<std::string_view> expected_sha256,
                                const cancellation_token& token)
        -> result<std::filesystem::path>;

    [[nodiscard]] auto is_empty_template(const byte_buffer& archive) const -> result<bool>;

    std::shared_ptr<session_manager> sessions_;
    std::shared_ptr<http_client_interface> http_;
    std::shared_ptr<http_client_interface> download_http_;
    retry_executor retry_;
    transfer_config config_;
    multipart_encoder encoder_;
};

}  // namespace cavesync::remote_project

#endif  // CAVESYNC_REMOTE_PROJECT_CLIENT_FILE_TRANSFER_ENGINE_H
