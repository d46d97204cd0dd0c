#include "ferry/transfer/compression.hpp"

#include <lz4.h>
#include <spdlog/spdlog.h>

#include <limits>
#include <string>

namespace ferry::transfer {

const char* to_string(CompressionDecision decision) noexcept {
    switch (decision) {
        case CompressionDecision::Undecided: return "undecided";
        case CompressionDecision::Enabled: return "enabled";
        case CompressionDecision::Disabled: return "disabled";
    }
    return "undecided";
}

std::optional<CompressionDecision> parse_compression_decision(const std::string& name) noexcept {
    if (name == "undecided") return CompressionDecision::Undecided;
    if (name == "enabled") return CompressionDecision::Enabled;
    if (name == "disabled") return CompressionDecision::Disabled;
    return std::nullopt;
}

CompressionStage::CompressionStage(core::CompressionMode mode, std::uint64_t total_size, std::uint64_t min_size,
                                   double min_reduction, std::optional<CompressionDecision> restored)
    : min_reduction_(min_reduction) {
    switch (mode) {
        case core::CompressionMode::Never:
            decision_ = CompressionDecision::Disabled;
            break;
        case core::CompressionMode::Always:
            decision_ = CompressionDecision::Enabled;
            break;
        case core::CompressionMode::Auto:
            decision_ = total_size > min_size ? CompressionDecision::Undecided : CompressionDecision::Disabled;
            break;
    }
    if (mode == core::CompressionMode::Auto && restored && *restored != CompressionDecision::Undecided) {
        decision_ = *restored;
    }
}

CompressionDecision CompressionStage::decision() const {
    std::lock_guard lock(mutex_);
    return decision_;
}

std::optional<double> CompressionStage::sampled_reduction() const {
    std::lock_guard lock(mutex_);
    return sampled_reduction_;
}

CompressionStage::Output CompressionStage::maybe_compress(const std::vector<std::uint8_t>& raw) {
    Output out;
    {
        std::lock_guard lock(mutex_);
        if (decision_ == CompressionDecision::Disabled || raw.empty()) {
            out.payload = raw;
            return out;
        }

        if (decision_ == CompressionDecision::Undecided) {
            auto sample = compress(raw);
            const double reduction =
                1.0 - static_cast<double>(sample.size()) / static_cast<double>(raw.size());
            sampled_reduction_ = reduction;
            if (reduction >= min_reduction_ && sample.size() < raw.size()) {
                decision_ = CompressionDecision::Enabled;
                spdlog::debug("Compression enabled (sample saved {:.1f}%)", reduction * 100.0);
                out.payload = std::move(sample);
                out.compressed = true;
            } else {
                decision_ = CompressionDecision::Disabled;
                spdlog::debug("Compression disabled (sample saved {:.1f}%)", reduction * 100.0);
                out.payload = raw;
            }
            return out;
        }
    }

    // Enabled: a chunk that does not shrink still goes out raw.
    auto packed = compress(raw);
    if (packed.size() < raw.size()) {
        out.payload = std::move(packed);
        out.compressed = true;
    } else {
        out.payload = raw;
    }
    return out;
}

std::vector<std::uint8_t> CompressionStage::compress(const std::vector<std::uint8_t>& raw) {
    const int bound = LZ4_compressBound(static_cast<int>(raw.size()));
    std::vector<std::uint8_t> packed(static_cast<std::size_t>(bound));
    const int written = LZ4_compress_default(reinterpret_cast<const char*>(raw.data()),
                                             reinterpret_cast<char*>(packed.data()),
                                             static_cast<int>(raw.size()), bound);
    if (written <= 0) {
        // LZ4 only fails on bad bounds; treat as incompressible.
        return raw;
    }
    packed.resize(static_cast<std::size_t>(written));
    return packed;
}

ferry::Result<std::vector<std::uint8_t>> CompressionStage::decompress(const std::vector<std::uint8_t>& payload,
                                                                      std::size_t raw_length) {
    if (raw_length > static_cast<std::size_t>(std::numeric_limits<int>::max()) ||
        payload.size() > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
        return ferry::Err<std::vector<std::uint8_t>>(ferry::Error::integrity("compressed chunk too large"));
    }
    std::vector<std::uint8_t> raw(raw_length);
    const int size = LZ4_decompress_safe(reinterpret_cast<const char*>(payload.data()),
                                         reinterpret_cast<char*>(raw.data()),
                                         static_cast<int>(payload.size()),
                                         static_cast<int>(raw_length));
    if (size < 0 || static_cast<std::size_t>(size) != raw_length) {
        return ferry::Err<std::vector<std::uint8_t>>(ferry::Error::integrity("LZ4 decompression failed"));
    }
    return ferry::Ok(std::move(raw));
}

} // namespace ferry::transfer
