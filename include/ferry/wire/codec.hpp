#pragma once

/**
 * @file codec.hpp
 * @brief Primitive big-endian encoding shared by every ferry frame
 *
 * FORMAT:
 * - integers: fixed width, network byte order
 * - strings and byte arrays: [u32 length][bytes]
 * - digests: 32 raw bytes
 *
 * ByteReader never reads past the end of its buffer. The first underflow
 * latches failed(); later reads return zero values, so a decoder can read a
 * whole structure and check once.
 */

#include "ferry/core/digest.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace ferry::wire {

class ByteWriter {
public:
    void u8(std::uint8_t value) { buffer_.push_back(value); }
    void u32(std::uint32_t value);
    void u64(std::uint64_t value);
    void i64(std::int64_t value) { u64(static_cast<std::uint64_t>(value)); }
    void boolean(bool value) { u8(value ? 1 : 0); }
    void string(const std::string& value);
    void bytes(const std::vector<std::uint8_t>& value);
    void digest(const core::Digest& value);

    const std::vector<std::uint8_t>& data() const noexcept { return buffer_; }
    std::vector<std::uint8_t> take() { return std::move(buffer_); }

private:
    std::vector<std::uint8_t> buffer_;
};

class ByteReader {
public:
    ByteReader(const std::uint8_t* data, std::size_t size) : data_(data), size_(size) {}
    explicit ByteReader(const std::vector<std::uint8_t>& data) : ByteReader(data.data(), data.size()) {}

    std::uint8_t u8();
    std::uint32_t u32();
    std::uint64_t u64();
    std::int64_t i64() { return static_cast<std::int64_t>(u64()); }
    bool boolean() { return u8() != 0; }
    std::string string();
    std::vector<std::uint8_t> bytes();
    core::Digest digest();

    [[nodiscard]] bool failed() const noexcept { return failed_; }
    [[nodiscard]] std::size_t remaining() const noexcept { return size_ - cursor_; }
    [[nodiscard]] bool at_end() const noexcept { return cursor_ == size_; }

private:
    bool take(std::size_t count);

    const std::uint8_t* data_;
    std::size_t size_;
    std::size_t cursor_ = 0;
    bool failed_ = false;
};

} // namespace ferry::wire
