/**
 * @file multipart_body.cpp
 * @brief multipart/form-data encoding
 */

#include "cavesync/remote_project/http/multipart_body.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <random>

#include <openssl/rand.h>

namespace cavesync::remote_project {

namespace {

constexpr std::string_view CRLF = "\r\n";
constexpr std::size_t MAX_BOUNDARY_LENGTH = 70;
constexpr int MAX_BOUNDARY_DRAWS = 8;

void append(byte_buffer& out, std::string_view text) {
    out.insert(out.end(), text.begin(), text.end());
}

auto is_header_safe(std::string_view value) -> bool {
    return value.find_first_of("\"\r\n") == std::string_view::npos;
}

auto is_boundary_char(char c) -> bool {
    static constexpr std::string_view extra = "'()+_,-./:=?";
    return std::isalnum(static_cast<unsigned char>(c)) != 0 ||
           extra.find(c) != std::string_view::npos;
}

}  // namespace

// ============================================================================
// multipart_part
// ============================================================================

auto multipart_part::text(std::string name, std::string_view value, std::string content_type)
    -> multipart_part {
    multipart_part part;
    part.name = std::move(name);
    part.content_type = std::move(content_type);
    part.bytes.assign(value.begin(), value.end());
    return part;
}

auto multipart_part::file(std::string name,
                          byte_buffer bytes,
                          std::string content_type,
                          std::optional<std::string> filename) -> multipart_part {
    multipart_part part;
    part.name = std::move(name);
    part.content_type = std::move(content_type);
    part.filename = std::move(filename);
    part.bytes = std::move(bytes);
    return part;
}

// ============================================================================
// multipart_encoder
// ============================================================================

multipart_encoder::multipart_encoder() : generator_(&multipart_encoder::generate_boundary) {}

multipart_encoder::multipart_encoder(boundary_generator generator)
    : generator_(std::move(generator)) {}

auto multipart_encoder::build(const std::vector<multipart_part>& parts)
    -> result<multipart_body> {
    auto valid = validate(parts);
    if (!valid) {
        return unexpected{valid.error()};
    }

    std::string boundary;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (int draw = 0; draw < MAX_BOUNDARY_DRAWS; ++draw) {
            auto candidate = generator_();
            if (candidate.empty() || candidate == last_boundary_ ||
                appears_in(parts, candidate)) {
                continue;
            }
            boundary = std::move(candidate);
            break;
        }
        if (boundary.empty()) {
            return unexpected{error{error_code::internal_error,
                                    "Could not draw a unique multipart boundary"}};
        }
        last_boundary_ = boundary;
    }

    auto bytes = encode(parts, boundary);
    if (!bytes) {
        return unexpected{bytes.error()};
    }

    multipart_body body;
    body.content_type = content_type_for(boundary);
    body.bytes = std::move(bytes.value());
    body.boundary = std::move(boundary);
    return body;
}

auto multipart_encoder::encode(const std::vector<multipart_part>& parts,
                               std::string_view boundary) -> result<byte_buffer> {
    if (boundary.empty() || boundary.size() > MAX_BOUNDARY_LENGTH ||
        !std::all_of(boundary.begin(), boundary.end(), is_boundary_char)) {
        return unexpected{error{error_code::invalid_argument,
                                "Invalid multipart boundary: '" + std::string(boundary) + "'"}};
    }

    auto valid = validate(parts);
    if (!valid) {
        return unexpected{valid.error()};
    }

    std::size_t total = boundary.size() + 8;
    for (const auto& part : parts) {
        total += part.bytes.size() + part.name.size() + part.content_type.size() +
                 (part.filename ? part.filename->size() : 0) + boundary.size() + 96;
    }

    byte_buffer out;
    out.reserve(total);

    for (const auto& part : parts) {
        append(out, "--");
        append(out, boundary);
        append(out, CRLF);

        append(out, "Content-Disposition: form-data; name=\"");
        append(out, part.name);
        append(out, "\"");
        if (part.filename) {
            append(out, "; filename=\"");
            append(out, *part.filename);
            append(out, "\"");
        }
        append(out, CRLF);

        append(out, "Content-Type: ");
        append(out, part.content_type);
        append(out, CRLF);
        append(out, CRLF);

        out.insert(out.end(), part.bytes.begin(), part.bytes.end());
        append(out, CRLF);
    }

    append(out, "--");
    append(out, boundary);
    append(out, "--");
    append(out, CRLF);

    return out;
}

auto multipart_encoder::generate_boundary() -> std::string {
    static constexpr char HEX[] = "0123456789abcdef";
    std::array<unsigned char, boundary_length / 2> random{};

    if (RAND_bytes(random.data(), static_cast<int>(random.size())) != 1) {
        // OpenSSL could not seed; fall back to the OS random device
        std::random_device rd;
        for (auto& b : random) {
            b = static_cast<unsigned char>(rd() & 0xff);
        }
    }

    std::string boundary;
    boundary.reserve(boundary_length);
    for (auto b : random) {
        boundary.push_back(HEX[b >> 4]);
        boundary.push_back(HEX[b & 0x0f]);
    }
    return boundary;
}

auto multipart_encoder::content_type_for(std::string_view boundary) -> std::string {
    return "multipart/form-data; boundary=" + std::string(boundary);
}

auto multipart_encoder::validate(const std::vector<multipart_part>& parts) -> result<void> {
    if (parts.empty()) {
        return unexpected{error{error_code::invalid_argument,
                                "Multipart body needs at least one part"}};
    }

    for (const auto& part : parts) {
        if (part.name.empty() || !is_header_safe(part.name)) {
            return unexpected{error{error_code::invalid_argument,
                                    "Invalid multipart part name: '" + part.name + "'"}};
        }
        if (part.content_type.empty() ||
            part.content_type.find_first_of("\r\n") != std::string::npos) {
            return unexpected{error{error_code::invalid_argument,
                                    "Part '" + part.name + "' needs a content type"}};
        }
        if (part.filename && (part.filename->empty() || !is_header_safe(*part.filename))) {
            return unexpected{error{error_code::invalid_argument,
                                    "Invalid filename for part '" + part.name + "'"}};
        }
    }
    return {};
}

auto multipart_encoder::appears_in(const std::vector<multipart_part>& parts,
                                   std::string_view boundary) -> bool {
    return std::any_of(parts.begin(), parts.end(), [boundary](const multipart_part& part) {
        return std::search(part.bytes.begin(), part.bytes.end(),
                           boundary.begin(), boundary.end()) != part.bytes.end() ||
               (part.filename && part.filename->find(boundary) != std::string::npos);
    });
}

}  // namespace cavesync::remote_project
