#pragma once

#include "ferry/core/result.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <set>
#include <string>

namespace ferry::security {

namespace fs = std::filesystem;

/// What the receiver knows about an incoming transfer before any chunk flows.
struct TransferOffer {
    std::string transfer_id;
    std::string sender_id;
    std::uint64_t total_size = 0;
    std::uint64_t file_count = 0;
};

/**
 * @brief Authorizes incoming transfers on the receiving node
 *
 * Called once per incoming transfer. On success returns the directory the
 * transfer is written under. A refusal is a Rejected error; too little free
 * space is a Storage error carrying the download path.
 */
class PeerTrust {
public:
    virtual ~PeerTrust() = default;

    virtual ferry::Result<fs::path> authorize(const TransferOffer& offer) = 0;
};

/**
 * @brief Accepts every sender (or an allow-list) and checks free disk space
 */
class DefaultPeerTrust : public PeerTrust {
public:
    explicit DefaultPeerTrust(fs::path download_dir,
                              std::optional<std::set<std::string>> allowed_senders = std::nullopt,
                              std::uint64_t reserve_bytes = 0);

    ferry::Result<fs::path> authorize(const TransferOffer& offer) override;

    void allow(const std::string& sender_id);
    void deny(const std::string& sender_id);

    [[nodiscard]] const fs::path& download_dir() const noexcept { return download_dir_; }

private:
    fs::path download_dir_;
    std::optional<std::set<std::string>> allowed_;
    std::set<std::string> denied_;
    std::uint64_t reserve_bytes_;
};

} // namespace ferry::security
