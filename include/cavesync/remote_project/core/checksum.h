/**
 * @file checksum.h
 * @brief SHA-256 digests for archive integrity verification
 */

#ifndef CAVESYNC_REMOTE_PROJECT_CORE_CHECKSUM_H
#define CAVESYNC_REMOTE_PROJECT_CORE_CHECKSUM_H

#include <cavesync/remote_project/core/types.h>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>

namespace cavesync::remote_project {

/**
 * @brief SHA-256 calculations backed by OpenSSL EVP
 *
 * Digests are rendered as 64 lowercase hex characters. They are a
 * client-side verification aid and never leave the process.
 */
class checksum {
public:
    /**
     * @brief Calculate SHA-256 hash of data
     * @param data Input data span
     * @return SHA-256 hash as hex string
     */
    [[nodiscard]] static auto sha256(std::span<const uint8_t> data) -> std::string;

    [[nodiscard]] static auto sha256(std::string_view data) -> std::string;

    /**
     * @brief Calculate SHA-256 hash of a file, streaming it in blocks
     * @param path Path to the file
     * @return SHA-256 hash as hex string, or file_not_found / file_read_error
     */
    [[nodiscard]] static auto sha256_file(const std::filesystem::path& path)
        -> result<std::string>;

    /**
     * @brief Verify SHA-256 hash of a file
     * @param path Path to the file
     * @param expected Expected hash as hex string (case-insensitive)
     * @return true if hash matches, false otherwise (including unreadable files)
     */
    [[nodiscard]] static auto verify_sha256(
        const std::filesystem::path& path, std::string_view expected) -> bool;

    /**
     * @brief Compare two hex digests, ignoring case
     */
    [[nodiscard]] static auto digests_equal(std::string_view lhs, std::string_view rhs) -> bool;

    /**
     * @brief Check that a string looks like a SHA-256 hex digest
     */
    [[nodiscard]] static auto is_valid_digest(std::string_view digest) -> bool;
};

}  // namespace cavesync::remote_project

#endif  // CAVESYNC_REMOTE_PROJECT_CORE_CHECKSUM_H
