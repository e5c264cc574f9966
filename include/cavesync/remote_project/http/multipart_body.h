/**
 * @file multipart_body.h
 * @brief multipart/form-data body encoder
 */

#ifndef CAVESYNC_REMOTE_PROJECT_HTTP_MULTIPART_BODY_H
#define CAVESYNC_REMOTE_PROJECT_HTTP_MULTIPART_BODY_H

#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "cavesync/remote_project/core/types.h"

namespace cavesync::remote_project {

/**
 * @brief One named part of a multipart body
 */
struct multipart_part {
    std::string name;
    std::string content_type;
    std::optional<std::string> filename;
    byte_buffer bytes;

    /**
     * @brief Text field, "text/plain" unless overridden
     */
    [[nodiscard]] static auto text(std::string name,
                                   std::string_view value,
                                   std::string content_type = "text/plain")
        -> multipart_part;

    /**
     * @brief Binary field; a filename marks it as a file upload
     */
    [[nodiscard]] static auto file(std::string name,
                                   byte_buffer bytes,
                                   std::string content_type,
                                   std::optional<std::string> filename = std::nullopt)
        -> multipart_part;
};

/**
 * @brief Encoded body ready to send
 *
 * content_type is the complete Content-Type header value and must be sent
 * unchanged.
 */
struct multipart_body {
    std::string content_type;
    byte_buffer bytes;
    std::string boundary;
};

/**
 * @brief Builds multipart/form-data payloads
 *
 * Parts are written in the given order:
 * @code
 * --{boundary}\r\n
 * Content-Disposition: form-data; name="{name}"[; filename="{filename}"]\r\n
 * Content-Type: {type}\r\n
 * \r\n
 * {bytes}\r\n
 * ...
 * --{boundary}--\r\n
 * @endcode
 *
 * Every build() draws a fresh boundary (32 lowercase hex characters from
 * RAND_bytes). A boundary equal to the previous one from this encoder, or
 * occurring inside any part, is drawn again.
 *
 * @note Thread-safe.
 */
class multipart_encoder {
public:
    using boundary_generator = std::function<std::string()>;

    static constexpr std::size_t boundary_length = 32;

    multipart_encoder();

    /**
     * @brief Use a custom boundary source (tests)
     */
    explicit multipart_encoder(boundary_generator generator);

    /**
     * @brief Encode parts with a new boundary
     * @return The body, or invalid_argument for malformed parts
     */
    [[nodiscard]] auto build(const std::vector<multipart_part>& parts) -> result<multipart_body>;

    /**
     * @brief Pure encoding with a caller-chosen boundary
     */
    [[nodiscard]] static auto encode(const std::vector<multipart_part>& parts,
                                     std::string_view boundary) -> result<byte_buffer>;

    /**
     * @brief Random boundary: 32 lowercase hex characters
     */
    [[nodiscard]] static auto generate_boundary() -> std::string;

    [[nodiscard]] static auto content_type_for(std::string_view boundary) -> std::string;

private:
    [[nodiscard]] static auto validate(const std::vector<multipart_part>& parts) -> result<void>;

    [[nodiscard]] static auto appears_in(const std::vector<multipart_part>& parts,
                                         std::string_view boundary) -> bool;

    boundary_generator generator_;
    std::string last_boundary_;
    std::mutex mutex_;
};

}  // namespace cavesync::remote_project

#endif  // CAVESYNC_REMOTE_PROJECT_HTTP_MULTIPART_BODY_H
