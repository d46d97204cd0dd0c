#include "ferry/wire/codec.hpp"

namespace ferry::wire {

void ByteWriter::u32(std::uint32_t value) {
    for (int shift = 24; shift >= 0; shift -= 8) {
        buffer_.push_back(static_cast<std::uint8_t>(value >> shift));
    }
}

void ByteWriter::u64(std::uint64_t value) {
    for (int shift = 56; shift >= 0; shift -= 8) {
        buffer_.push_back(static_cast<std::uint8_t>(value >> shift));
    }
}

void ByteWriter::string(const std::string& value) {
    u32(static_cast<std::uint32_t>(value.size()));
    buffer_.insert(buffer_.end(), value.begin(), value.end());
}

void ByteWriter::bytes(const std::vector<std::uint8_t>& value) {
    u32(static_cast<std::uint32_t>(value.size()));
    buffer_.insert(buffer_.end(), value.begin(), value.end());
}

void ByteWriter::digest(const core::Digest& value) {
    buffer_.insert(buffer_.end(), value.begin(), value.end());
}

bool ByteReader::take(std::size_t count) {
    if (failed_ || count > size_ - cursor_) {
        failed_ = true;
        return false;
    }
    return true;
}

std::uint8_t ByteReader::u8() {
    if (!take(1)) {
        return 0;
    }
    return data_[cursor_++];
}

std::uint32_t ByteReader::u32() {
    if (!take(4)) {
        return 0;
    }
    std::uint32_t value = 0;
    for (int i = 0; i < 4; ++i) {
        value = (value << 8) | data_[cursor_++];
    }
    return value;
}

std::uint64_t ByteReader::u64() {
    if (!take(8)) {
        return 0;
    }
    std::uint64_t value = 0;
    for (int i = 0; i < 8; ++i) {
        value = (value << 8) | data_[cursor_++];
    }
    return value;
}

std::string ByteReader::string() {
    const std::uint32_t length = u32();
    if (!take(length)) {
        return {};
    }
    std::string value(reinterpret_cast<const char*>(data_ + cursor_), length);
    cursor_ += length;
    return value;
}

std::vector<std::uint8_t> ByteReader::bytes() {
    const std::uint32_t length = u32();
    if (!take(length)) {
        return {};
    }
    std::vector<std::uint8_t> value(data_ + cursor_, data_ + cursor_ + length);
    cursor_ += length;
    return value;
}

core::Digest ByteReader::digest() {
    core::Digest value{};
    if (!take(value.size())) {
        return value;
    }
    for (auto& byte : value) {
        byte = data_[cursor_++];
    }
    return value;
}

} // namespace ferry::wire
