#pragma once

#include "ferry/core/config.hpp"
#include "ferry/core/result.hpp"

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace ferry::transfer {

enum class CompressionDecision : std::uint8_t {
    Undecided = 0,
    Enabled = 1,
    Disabled = 2
};

const char* to_string(CompressionDecision decision) noexcept;
std::optional<CompressionDecision> parse_compression_decision(const std::string& name) noexcept;

/**
 * @brief Per-transfer LZ4 layer over chunk payloads
 *
 * In Auto mode the decision is taken exactly once: the first payload that
 * passes through is compressed as a sample and compression stays enabled
 * only if it saved at least `min_reduction` of the bytes. Transfers no
 * larger than `min_size` are never compressed. The decision is restorable
 * so a resumed transfer keeps the original choice.
 *
 * Thread-safe.
 */
class CompressionStage {
public:
    struct Output {
        std::vector<std::uint8_t> payload;
        bool compressed = false;
    };

    CompressionStage(core::CompressionMode mode,
                     std::uint64_t total_size,
                     std::uint64_t min_size = 1024 * 1024,
                     double min_reduction = 0.10,
                     std::optional<CompressionDecision> restored = std::nullopt);

    /// Returns the payload to put on the wire for one raw chunk.
    Output maybe_compress(const std::vector<std::uint8_t>& raw);

    CompressionDecision decision() const;

    /// 1 - compressed/raw measured on the sample; nullopt before sampling.
    std::optional<double> sampled_reduction() const;

    static std::vector<std::uint8_t> compress(const std::vector<std::uint8_t>& raw);
    static ferry::Result<std::vector<std::uint8_t>> decompress(const std::vector<std::uint8_t>& payload,
                                                               std::size_t raw_length);

private:
    double min_reduction_;
    mutable std::mutex mutex_;
    CompressionDecision decision_;
    std::optional<double> sampled_reduction_;
};

} // namespace ferry::transfer
