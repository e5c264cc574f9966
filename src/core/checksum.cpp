/**
 * @file checksum.cpp
 * @brief Implementation of SHA-256 utilities
 */

#include <cavesync/remote_project/core/checksum.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <fstream>
#include <memory>

#include <openssl/evp.h>

namespace cavesync::remote_project {

namespace {

constexpr std::size_t FILE_READ_BLOCK = 64 * 1024;

struct md_ctx_deleter {
    void operator()(EVP_MD_CTX* ctx) const noexcept { EVP_MD_CTX_free(ctx); }
};

using md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, md_ctx_deleter>;

auto to_hex(const unsigned char* digest, unsigned int length) -> std::string {
    static constexpr char HEX[] = "0123456789abcdef";
    std::string out;
    out.reserve(static_cast<std::size_t>(length) * 2);
    for (unsigned int i = 0; i < length; ++i) {
        out.push_back(HEX[digest[i] >> 4]);
        out.push_back(HEX[digest[i] & 0x0f]);
    }
    return out;
}

auto new_sha256_context() -> md_ctx_ptr {
    md_ctx_ptr ctx(EVP_MD_CTX_new());
    if (ctx && EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        ctx.reset();
    }
    return ctx;
}

auto finish(EVP_MD_CTX* ctx) -> std::string {
    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(ctx, digest.data(), &length) != 1) {
        return {};
    }
    return to_hex(digest.data(), length);
}

}  // namespace

auto checksum::sha256(std::span<const uint8_t> data) -> std::string {
    auto ctx = new_sha256_context();
    if (!ctx || EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1) {
        return {};
    }
    return finish(ctx.get());
}

auto checksum::sha256(std::string_view data) -> std::string {
    return sha256(std::span<const uint8_t>(
        reinterpret_cast<const uint8_t*>(data.data()), data.size()));
}

auto checksum::sha256_file(const std::filesystem::path& path) -> result<std::string> {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return unexpected{error{error_code::file_not_found,
                                "File not found: " + path.string()}};
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return unexpected{error{error_code::file_read_error,
                                "Cannot open file: " + path.string()}};
    }

    auto ctx = new_sha256_context();
    if (!ctx) {
        return unexpected{error{error_code::internal_error,
                                "Failed to initialize SHA-256 context"}};
    }

    std::vector<char> buffer(FILE_READ_BLOCK);
    while (file) {
        file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        auto count = file.gcount();
        if (count > 0 &&
            EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<std::size_t>(count)) != 1) {
            return unexpected{error{error_code::internal_error, "SHA-256 update failed"}};
        }
    }

    if (file.bad()) {
        return unexpected{error{error_code::file_read_error,
                                "Error reading file: " + path.string()}};
    }

    auto digest = finish(ctx.get());
    if (digest.empty()) {
        return unexpected{error{error_code::internal_error, "SHA-256 finalization failed"}};
    }
    return digest;
}

auto checksum::verify_sha256(const std::filesystem::path& path, std::string_view expected)
    -> bool {
    auto actual = sha256_file(path);
    return actual.has_value() && digests_equal(actual.value(), expected);
}

auto checksum::digests_equal(std::string_view lhs, std::string_view rhs) -> bool {
    return lhs.size() == rhs.size() &&
           std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](char a, char b) {
               return std::tolower(static_cast<unsigned char>(a)) ==
                      std::tolower(static_cast<unsigned char>(b));
           });
}

auto checksum::is_valid_digest(std::string_view digest) -> bool {
    return digest.size() == 64 &&
           std::all_of(digest.begin(), digest.end(),
                       [](char c) { return std::isxdigit(static_cast<unsigned char>(c)) != 0; });
}

}  // namespace cavesync::remote_project
