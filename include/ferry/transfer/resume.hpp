#pragma once

#include "ferry/core/clock.hpp"
#include "ferry/core/result.hpp"
#include "ferry/transfer/compression.hpp"
#include "ferry/transfer/types.hpp"

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace ferry::transfer {

/**
 * @brief Everything a later session needs to continue a transfer
 *
 * The token carries the contiguous watermark; verified_files lists files
 * past the watermark that are already complete on the receiver.
 */
struct ResumeRecord {
    ResumeToken token;
    TransferManifest manifest;  ///< including sender-local source paths
    std::string peer_id;
    TransferOptions options;
    CompressionDecision compression = CompressionDecision::Undecided;
    std::optional<double> compression_reduction;
    std::vector<std::uint32_t> verified_files;
    std::optional<transport::TransportProtocol> last_transport;
};

/**
 * @brief One JSON document per transfer under `<state_dir>/resume/`
 */
class ResumeStore {
public:
    explicit ResumeStore(std::filesystem::path state_dir);

    ferry::Result<void> save(const ResumeRecord& record);
    ferry::Result<ResumeRecord> load(const std::string& transfer_id) const;
    ferry::Result<void> remove(const std::string& transfer_id);

    [[nodiscard]] bool exists(const std::string& transfer_id) const;
    [[nodiscard]] std::vector<std::string> list() const;
    [[nodiscard]] std::filesystem::path path_for(const std::string& transfer_id) const;

private:
    std::filesystem::path dir_;
    mutable std::mutex mutex_;
};

/**
 * @brief Issues, validates and consumes resume tokens
 *
 * checkpoint() persists the record and returns a fresh token valid for 24
 * hours. resume() rejects expired, unknown, superseded or unreadable tokens
 * with a Resume error, re-hashes the source of the last completed file, and
 * on success removes the record: a token resumes at most once.
 */
class ResumeManager {
public:
    explicit ResumeManager(ResumeStore& store, core::Clock clock = core::system_clock());

    ferry::Result<ResumeToken> checkpoint(ResumeRecord record);
    ferry::Result<ResumeRecord> resume(const ResumeToken& token);

    ferry::Result<void> discard(const std::string& transfer_id);

    /// Deletes expired records; returns how many were removed.
    std::size_t purge_expired();

    [[nodiscard]] core::TimePoint now() const { return clock_(); }

private:
    ferry::Result<void> verify_last_completed(const ResumeRecord& record) const;

    ResumeStore& store_;
    core::Clock clock_;
};

} // namespace ferry::transfer
