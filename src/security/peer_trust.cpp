#include "ferry/security/peer_trust.hpp"

#include <spdlog/spdlog.h>

#include <system_error>

namespace ferry::security {

DefaultPeerTrust::DefaultPeerTrust(fs::path download_dir, std::optional<std::set<std::string>> allowed_senders,
                                   std::uint64_t reserve_bytes)
    : download_dir_(std::move(download_dir)), allowed_(std::move(allowed_senders)), reserve_bytes_(reserve_bytes) {}

void DefaultPeerTrust::allow(const std::string& sender_id) {
    denied_.erase(sender_id);
    if (allowed_) {
        allowed_->insert(sender_id);
    }
}

void DefaultPeerTrust::deny(const std::string& sender_id) {
    denied_.insert(sender_id);
    if (allowed_) {
        allowed_->erase(sender_id);
    }
}

ferry::Result<fs::path> DefaultPeerTrust::authorize(const TransferOffer& offer) {
    if (denied_.count(offer.sender_id) != 0 || (allowed_ && allowed_->count(offer.sender_id) == 0)) {
        spdlog::warn("Refusing transfer {} from {}", offer.transfer_id, offer.sender_id);
        return ferry::Err<fs::path>(ferry::Error::rejected("rejected-by-peer"));
    }

    std::error_code ec;
    fs::create_directories(download_dir_, ec);
    if (ec) {
        return ferry::Err<fs::path>(
            ferry::Error::storage("cannot create download directory: " + ec.message(), download_dir_.string()));
    }

    auto info = fs::space(download_dir_, ec);
    if (ec) {
        return ferry::Err<fs::path>(
            ferry::Error::storage("cannot query free space: " + ec.message(), download_dir_.string()));
    }
    if (info.available < offer.total_size + reserve_bytes_) {
        return ferry::Err<fs::path>(ferry::Error::storage(
            "insufficient disk space: need " + std::to_string(offer.total_size) + " bytes, " +
                std::to_string(info.available) + " available",
            download_dir_.string()));
    }

    return ferry::Ok(download_dir_);
}

} // namespace ferry::security
