#pragma once

#include "ferry/core/result.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace ferry::core {

enum class CompressionMode {
    Auto,   ///< decide once per transfer from a sample
    Always,
    Never
};

enum class SymlinkPolicy {
    Follow,   ///< transfer the link target's content under the link path
    Preserve  ///< record the link itself and recreate it on the receiver
};

const char* to_string(CompressionMode mode) noexcept;
const char* to_string(SymlinkPolicy policy) noexcept;
std::optional<CompressionMode> parse_compression_mode(const std::string& name) noexcept;

/**
 * @brief Engine-wide tunables
 *
 * Every field has a working default, so a default-constructed config is
 * valid. Durations keep their unit in the JSON key name.
 */
struct EngineConfig {
    std::string node_id;
    std::filesystem::path state_dir{"ferry-state"};
    std::filesystem::path download_dir{"downloads"};

    std::uint32_t max_parallel_streams = 4;
    std::uint32_t max_concurrent_transfers = 3;
    std::optional<std::uint64_t> total_bandwidth_limit; ///< bytes/s, nullopt = unlimited
    std::uint64_t min_bandwidth_per_transfer = 64 * 1024;

    CompressionMode compression = CompressionMode::Auto;
    std::uint64_t compression_min_size = 1024 * 1024;
    double compression_min_reduction = 0.10;

    std::uint32_t reorder_window = 32;
    std::uint32_t max_chunk_retries = 3;
    std::uint32_t max_file_retries = 2;
    std::chrono::milliseconds retry_backoff{50};

    std::chrono::milliseconds negotiation_timeout{5000};
    std::chrono::milliseconds stall_timeout{10000};
    std::chrono::seconds capability_cache_ttl{300};
    std::uint32_t checkpoint_interval_chunks = 64;

    std::uint64_t large_file_threshold = 10ULL * 1024 * 1024;
    std::uint64_t small_file_threshold = 64 * 1024;
    SymlinkPolicy symlink_policy = SymlinkPolicy::Follow;

    std::chrono::milliseconds bandwidth_refill_interval{100};
    std::uint32_t compute_threads = 2;
    std::chrono::seconds history_retention{300};

    std::string log_level = "info";

    ferry::Result<void> validate() const;
};

/// Reads a JSON config file; missing keys keep their defaults.
ferry::Result<EngineConfig> load_config(const std::filesystem::path& path);
ferry::Result<EngineConfig> parse_config(const std::string& json_text);
ferry::Result<void> save_config(const EngineConfig& config, const std::filesystem::path& path);
std::string dump_config(const EngineConfig& config);

} // namespace ferry::core
