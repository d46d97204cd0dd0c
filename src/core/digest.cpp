#include "ferry/core/digest.hpp"

#include <openssl/evp.h>

#include <fstream>
#include <stdexcept>

namespace ferry::core {

Sha256::Sha256() : ctx_(EVP_MD_CTX_new()) {
    if (ctx_ == nullptr) {
        throw std::runtime_error("EVP_MD_CTX_new failed");
    }
    reset();
}

Sha256::~Sha256() {
    EVP_MD_CTX_free(ctx_);
}

void Sha256::reset() {
    if (EVP_DigestInit_ex(ctx_, EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("EVP_DigestInit_ex failed");
    }
}

void Sha256::update(const std::uint8_t* data, std::size_t size) {
    if (size == 0) {
        return;
    }
    if (EVP_DigestUpdate(ctx_, data, size) != 1) {
        throw std::runtime_error("EVP_DigestUpdate failed");
    }
}

Digest Sha256::finish() {
    Digest out{};
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx_, out.data(), &len) != 1 || len != out.size()) {
        throw std::runtime_error("EVP_DigestFinal_ex failed");
    }
    return out;
}

Digest sha256(const std::uint8_t* data, std::size_t size) {
    Sha256 hasher;
    hasher.update(data, size);
    return hasher.finish();
}

Digest sha256(const std::vector<std::uint8_t>& data) {
    return sha256(data.data(), data.size());
}

Digest sha256(const std::string& data) {
    return sha256(reinterpret_cast<const std::uint8_t*>(data.data()), data.size());
}

ferry::Result<Digest> sha256_file(const std::filesystem::path& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        return ferry::Err<Digest>(ferry::Error::storage("failed to open file for hashing", path.string()));
    }

    Sha256 hasher;
    std::vector<std::uint8_t> buffer(64 * 1024);
    while (input.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(buffer.size())) ||
           input.gcount() > 0) {
        hasher.update(buffer.data(), static_cast<std::size_t>(input.gcount()));
    }
    if (input.bad()) {
        return ferry::Err<Digest>(ferry::Error::storage("read error while hashing", path.string()));
    }
    return ferry::Ok(hasher.finish());
}

std::string to_hex(const Digest& digest) {
    static const char* kHex = "0123456789abcdef";
    std::string out;
    out.reserve(digest.size() * 2);
    for (std::uint8_t byte : digest) {
        out.push_back(kHex[byte >> 4]);
        out.push_back(kHex[byte & 0x0F]);
    }
    return out;
}

ferry::Result<Digest> digest_from_hex(const std::string& hex) {
    Digest out{};
    if (hex.size() != out.size() * 2) {
        return ferry::Err<Digest>(ferry::Error::protocol("digest must be 64 hex characters"));
    }
    auto nibble = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    };
    for (std::size_t i = 0; i < out.size(); ++i) {
        const int hi = nibble(hex[2 * i]);
        const int lo = nibble(hex[2 * i + 1]);
        if (hi < 0 || lo < 0) {
            return ferry::Err<Digest>(ferry::Error::protocol("invalid hex digit in digest"));
        }
        out[i] = static_cast<std::uint8_t>((hi << 4) | lo);
    }
    return ferry::Ok(out);
}

} // namespace ferry::core
