#pragma once

#include "ferry/core/clock.hpp"
#include "ferry/core/config.hpp"
#include "ferry/core/result.hpp"
#include "ferry/transfer/types.hpp"

#include <filesystem>
#include <set>
#include <string>
#include <vector>

namespace ferry::transfer {

/**
 * @brief Scans local paths into an immutable TransferManifest
 *
 * Each input path contributes its own name as the top-level entry. Files
 * are hashed with a streaming SHA-256, so memory use does not depend on
 * file size. Entries are sorted by path before the manifest checksum is
 * computed, which makes the checksum independent of scan order.
 */
class ManifestBuilder {
public:
    ManifestBuilder(std::string sender_id,
                    core::SymlinkPolicy policy = core::SymlinkPolicy::Follow,
                    core::Clock clock = core::system_clock());

    ferry::Result<TransferManifest> build(const std::vector<std::filesystem::path>& paths) const;

private:
    struct ScanState {
        TransferManifest manifest;
        std::set<std::string> seen_paths;
    };

    ferry::Result<void> add_path(const std::filesystem::path& source, const std::string& relative,
                                 std::set<std::filesystem::path>& ancestors, ScanState& state) const;
    ferry::Result<void> add_directory(const std::filesystem::path& source, const std::string& relative,
                                      std::set<std::filesystem::path>& ancestors, ScanState& state) const;
    ferry::Result<void> add_file(const std::filesystem::path& source, const std::string& relative,
                                 ScanState& state) const;
    ferry::Result<void> add_link(const std::filesystem::path& source, const std::string& relative,
                                 ScanState& state) const;

    std::string sender_id_;
    core::SymlinkPolicy policy_;
    core::Clock clock_;
};

class ManifestValidator {
public:
    /// Checks counts, sizes, chunk counts, path safety and the checksum.
    static ferry::Result<void> validate(const TransferManifest& manifest);
};

/// Rejects empty, absolute and parent-escaping ('..') relative paths.
bool is_safe_relative_path(const std::string& path);

} // namespace ferry::transfer
