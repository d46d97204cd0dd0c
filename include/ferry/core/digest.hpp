#pragma once

#include "ferry/core/result.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

typedef struct evp_md_ctx_st EVP_MD_CTX;

namespace ferry::core {

using Digest = std::array<std::uint8_t, 32>;

/**
 * @brief Incremental SHA-256 over OpenSSL EVP
 *
 * Not copyable; a finished hasher must be reset() before reuse.
 */
class Sha256 {
public:
    Sha256();
    ~Sha256();

    Sha256(const Sha256&) = delete;
    Sha256& operator=(const Sha256&) = delete;

    void update(const std::uint8_t* data, std::size_t size);
    void update(const std::vector<std::uint8_t>& data) { update(data.data(), data.size()); }
    Digest finish();
    void reset();

private:
    EVP_MD_CTX* ctx_;
};

Digest sha256(const std::uint8_t* data, std::size_t size);
Digest sha256(const std::vector<std::uint8_t>& data);
Digest sha256(const std::string& data);

/// Streams a file through SHA-256; Storage error if it cannot be read.
ferry::Result<Digest> sha256_file(const std::filesystem::path& path);

std::string to_hex(const Digest& digest);
ferry::Result<Digest> digest_from_hex(const std::string& hex);

} // namespace ferry::core
