#include "ferry/core/config.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>

namespace ferry::core {
namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

template<typename T>
void read_key(const json& doc, const char* key, T& out) {
    auto it = doc.find(key);
    if (it != doc.end()) {
        out = it->get<T>();
    }
}

template<typename Duration>
void read_duration(const json& doc, const char* key, Duration& out) {
    auto it = doc.find(key);
    if (it != doc.end()) {
        out = Duration{it->get<typename Duration::rep>()};
    }
}

ferry::Result<CompressionMode> parse_compression(const std::string& text) {
    if (auto mode = parse_compression_mode(text)) {
        return ferry::Ok(*mode);
    }
    return ferry::Err<CompressionMode>(ferry::Error::config("unknown compression mode '" + text + "'"));
}

ferry::Result<SymlinkPolicy> parse_symlink_policy(const std::string& text) {
    if (text == "follow") return ferry::Ok(SymlinkPolicy::Follow);
    if (text == "preserve") return ferry::Ok(SymlinkPolicy::Preserve);
    return ferry::Err<SymlinkPolicy>(ferry::Error::config("unknown symlink policy '" + text + "'"));
}

json to_json(const EngineConfig& config) {
    json doc;
    doc["node_id"] = config.node_id;
    doc["state_dir"] = config.state_dir.string();
    doc["download_dir"] = config.download_dir.string();
    doc["max_parallel_streams"] = config.max_parallel_streams;
    doc["max_concurrent_transfers"] = config.max_concurrent_transfers;
    doc["total_bandwidth_limit"] = config.total_bandwidth_limit ? json(*config.total_bandwidth_limit) : json(nullptr);
    doc["min_bandwidth_per_transfer"] = config.min_bandwidth_per_transfer;
    doc["compression"] = to_string(config.compression);
    doc["compression_min_size"] = config.compression_min_size;
    doc["compression_min_reduction"] = config.compression_min_reduction;
    doc["reorder_window"] = config.reorder_window;
    doc["max_chunk_retries"] = config.max_chunk_retries;
    doc["max_file_retries"] = config.max_file_retries;
    doc["retry_backoff_ms"] = config.retry_backoff.count();
    doc["negotiation_timeout_ms"] = config.negotiation_timeout.count();
    doc["stall_timeout_ms"] = config.stall_timeout.count();
    doc["capability_cache_ttl_s"] = config.capability_cache_ttl.count();
    doc["checkpoint_interval_chunks"] = config.checkpoint_interval_chunks;
    doc["large_file_threshold"] = config.large_file_threshold;
    doc["small_file_threshold"] = config.small_file_threshold;
    doc["symlink_policy"] = to_string(config.symlink_policy);
    doc["bandwidth_refill_interval_ms"] = config.bandwidth_refill_interval.count();
    doc["compute_threads"] = config.compute_threads;
    doc["history_retention_s"] = config.history_retention.count();
    doc["log_level"] = config.log_level;
    return doc;
}

} // namespace

const char* to_string(CompressionMode mode) noexcept {
    switch (mode) {
        case CompressionMode::Auto: return "auto";
        case CompressionMode::Always: return "always";
        case CompressionMode::Never: return "never";
    }
    return "auto";
}

std::optional<CompressionMode> parse_compression_mode(const std::string& name) noexcept {
    if (name == "auto") return CompressionMode::Auto;
    if (name == "always") return CompressionMode::Always;
    if (name == "never") return CompressionMode::Never;
    return std::nullopt;
}

const char* to_string(SymlinkPolicy policy) noexcept {
    return policy == SymlinkPolicy::Preserve ? "preserve" : "follow";
}

ferry::Result<void> EngineConfig::validate() const {
    if (max_parallel_streams < 1 || max_parallel_streams > 4) {
        return ferry::Err<void>(ferry::Error::config("max_parallel_streams must be between 1 and 4"));
    }
    if (max_concurrent_transfers == 0) {
        return ferry::Err<void>(ferry::Error::config("max_concurrent_transfers must be > 0"));
    }
    if (total_bandwidth_limit && *total_bandwidth_limit == 0) {
        return ferry::Err<void>(ferry::Error::config("total_bandwidth_limit must be > 0 or null"));
    }
    if (compression_min_reduction < 0.0 || compression_min_reduction >= 1.0) {
        return ferry::Err<void>(ferry::Error::config("compression_min_reduction must be in [0, 1)"));
    }
    if (reorder_window == 0) {
        return ferry::Err<void>(ferry::Error::config("reorder_window must be > 0"));
    }
    if (bandwidth_refill_interval.count() <= 0) {
        return ferry::Err<void>(ferry::Error::config("bandwidth_refill_interval_ms must be > 0"));
    }
    if (compute_threads == 0) {
        return ferry::Err<void>(ferry::Error::config("compute_threads must be > 0"));
    }
    if (stall_timeout.count() <= 0 || negotiation_timeout.count() <= 0) {
        return ferry::Err<void>(ferry::Error::config("timeouts must be > 0"));
    }
    return ferry::Ok();
}

ferry::Result<EngineConfig> parse_config(const std::string& json_text) {
    EngineConfig config;
    try {
        const json doc = json::parse(json_text);
        if (!doc.is_object()) {
            return ferry::Err<EngineConfig>(ferry::Error::config("config root must be an object"));
        }

        read_key(doc, "node_id", config.node_id);
        std::string dir;
        if (doc.contains("state_dir")) {
            read_key(doc, "state_dir", dir);
            config.state_dir = dir;
        }
        if (doc.contains("download_dir")) {
            read_key(doc, "download_dir", dir);
            config.download_dir = dir;
        }
        read_key(doc, "max_parallel_streams", config.max_parallel_streams);
        read_key(doc, "max_concurrent_transfers", config.max_concurrent_transfers);
        if (auto it = doc.find("total_bandwidth_limit"); it != doc.end()) {
            if (it->is_null()) {
                config.total_bandwidth_limit.reset();
            } else {
                config.total_bandwidth_limit = it->get<std::uint64_t>();
            }
        }
        read_key(doc, "min_bandwidth_per_transfer", config.min_bandwidth_per_transfer);
        if (auto it = doc.find("compression"); it != doc.end()) {
            auto mode = parse_compression(it->get<std::string>());
            if (mode.is_error()) {
                return ferry::Err<EngineConfig>(mode.error());
            }
            config.compression = mode.value();
        }
        read_key(doc, "compression_min_size", config.compression_min_size);
        read_key(doc, "compression_min_reduction", config.compression_min_reduction);
        read_key(doc, "reorder_window", config.reorder_window);
        read_key(doc, "max_chunk_retries", config.max_chunk_retries);
        read_key(doc, "max_file_retries", config.max_file_retries);
        read_duration(doc, "retry_backoff_ms", config.retry_backoff);
        read_duration(doc, "negotiation_timeout_ms", config.negotiation_timeout);
        read_duration(doc, "stall_timeout_ms", config.stall_timeout);
        read_duration(doc, "capability_cache_ttl_s", config.capability_cache_ttl);
        read_key(doc, "checkpoint_interval_chunks", config.checkpoint_interval_chunks);
        read_key(doc, "large_file_threshold", config.large_file_threshold);
        read_key(doc, "small_file_threshold", config.small_file_threshold);
        if (auto it = doc.find("symlink_policy"); it != doc.end()) {
            auto policy = parse_symlink_policy(it->get<std::string>());
            if (policy.is_error()) {
                return ferry::Err<EngineConfig>(policy.error());
            }
            config.symlink_policy = policy.value();
        }
        read_duration(doc, "bandwidth_refill_interval_ms", config.bandwidth_refill_interval);
        read_key(doc, "compute_threads", config.compute_threads);
        read_duration(doc, "history_retention_s", config.history_retention);
        read_key(doc, "log_level", config.log_level);
    } catch (const json::exception& e) {
        return ferry::Err<EngineConfig>(ferry::Error::config(std::string("invalid config: ") + e.what()));
    }

    if (auto valid = config.validate(); valid.is_error()) {
        return ferry::Err<EngineConfig>(valid.error());
    }
    return ferry::Ok(std::move(config));
}

ferry::Result<EngineConfig> load_config(const fs::path& path) {
    std::ifstream input(path);
    if (!input) {
        return ferry::Err<EngineConfig>(ferry::Error::config("cannot open config file", path.string()));
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    auto parsed = parse_config(buffer.str());
    if (parsed.is_error()) {
        auto error = parsed.error();
        error.path = path.string();
        return ferry::Err<EngineConfig>(std::move(error));
    }
    return parsed;
}

std::string dump_config(const EngineConfig& config) {
    return to_json(config).dump(2);
}

ferry::Result<void> save_config(const EngineConfig& config, const fs::path& path) {
    std::error_code ec;
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path(), ec);
    }
    std::ofstream output(path, std::ios::trunc);
    if (!output) {
        return ferry::Err<void>(ferry::Error::storage("cannot write config file", path.string()));
    }
    output << dump_config(config) << '\n';
    if (!output) {
        return ferry::Err<void>(ferry::Error::storage("failed writing config file", path.string()));
    }
    return ferry::Ok();
}

} // namespace ferry::core
