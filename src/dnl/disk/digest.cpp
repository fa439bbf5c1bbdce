// Copyright (c) 2026 changcheng967. All rights reserved.

#include <dnl/disk/digest.hpp>
#include <openssl/evp.h>
#include <algorithm>
#include <fstream>
#include <memory>
#include <vector>

namespace dnl::disk {

namespace {

struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const noexcept { EVP_MD_CTX_free(ctx); }
};
using MdCtx = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

std::string to_hex(const unsigned char* data, unsigned int len) {
    static constexpr char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (unsigned int i = 0; i < len; ++i) {
        out += digits[data[i] >> 4];
        out += digits[data[i] & 0x0F];
    }
    return out;
}

} // namespace

std::expected<std::string, std::error_code>
sha256_file(std::string_view path, std::size_t buffer_size) noexcept {
    try {
        std::ifstream file{std::string(path), std::ios::binary};
        if (!file.is_open()) {
            return std::unexpected(make_error_code(DiskErrc::file_not_found));
        }

        MdCtx ctx{EVP_MD_CTX_new()};
        if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
            return std::unexpected(make_error_code(DiskErrc::read_error));
        }

        std::vector<char> buffer(std::max<std::size_t>(buffer_size, 1));
        while (file.read(buffer.data(), static_cast<std::streamsize>(buffer.size())) || file.gcount() > 0) {
            if (EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<std::size_t>(file.gcount())) != 1) {
                return std::unexpected(make_error_code(DiskErrc::read_error));
            }
        }
        if (file.bad()) {
            return std::unexpected(make_error_code(DiskErrc::read_error));
        }

        unsigned char hash[EVP_MAX_MD_SIZE];
        unsigned int hash_len = 0;
        if (EVP_DigestFinal_ex(ctx.get(), hash, &hash_len) != 1) {
            return std::unexpected(make_error_code(DiskErrc::read_error));
        }
        return to_hex(hash, hash_len);
    } catch (const std::bad_alloc&) {
        return std::unexpected(std::make_error_code(std::errc::not_enough_memory));
    }
}

std::string sha256_hex(std::string_view data) {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;
    EVP_Digest(data.data(), data.size(), hash, &hash_len, EVP_sha256(), nullptr);
    return to_hex(hash, hash_len);
}

} // namespace dnl::disk
