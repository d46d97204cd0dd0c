#include "ferry/transfer/resume.hpp"

#include "ferry/core/digest.hpp"
#include "ferry/core/ids.hpp"
#include "ferry/transfer/records.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <stdexcept>
#include <system_error>

namespace ferry::transfer {
namespace fs = std::filesystem;
using json = nlohmann::json;

ResumeStore::ResumeStore(fs::path state_dir) : dir_(std::move(state_dir) / "resume") {}

fs::path ResumeStore::path_for(const std::string& transfer_id) const {
    return dir_ / (transfer_id + ".json");
}

ferry::Result<void> ResumeStore::save(const ResumeRecord& record) {
    if (!core::is_valid_id(record.token.transfer_id)) {
        return ferry::Err<void>(ferry::Error::resume("invalid transfer id '" + record.token.transfer_id + "'"));
    }

    json verified = json::array();
    for (auto index : record.verified_files) {
        verified.push_back(index);
    }

    json doc = {
        {"version", 1},
        {"token", token_to_json(record.token)},
        {"manifest", manifest_to_json(record.manifest)},
        {"peer_id", record.peer_id},
        {"options", options_to_json(record.options)},
        {"compression", to_string(record.compression)},
        {"compression_reduction",
         record.compression_reduction ? json(*record.compression_reduction) : json(nullptr)},
        {"verified_files", verified},
        {"last_transport", record.last_transport ? json(transport::to_string(*record.last_transport)) : json(nullptr)},
    };

    std::lock_guard lock(mutex_);
    return write_json_atomically(path_for(record.token.transfer_id), doc);
}

ferry::Result<ResumeRecord> ResumeStore::load(const std::string& transfer_id) const {
    if (!core::is_valid_id(transfer_id)) {
        return ferry::Err<ResumeRecord>(ferry::Error::resume("unknown resume token"));
    }

    std::lock_guard lock(mutex_);
    const auto path = path_for(transfer_id);
    if (!fs::exists(path)) {
        return ferry::Err<ResumeRecord>(ferry::Error::resume("unknown resume token", path.string()));
    }

    auto doc = read_json(path);
    if (doc.is_error()) {
        return ferry::Err<ResumeRecord>(ferry::Error::resume("corrupt checkpoint: " + doc.error().message, path.string()));
    }

    try {
        const auto& root = doc.value();
        ResumeRecord record;
        record.token = token_from_json(root.at("token"));
        record.manifest = manifest_from_json(root.at("manifest"));
        record.peer_id = root.at("peer_id").get<std::string>();
        record.options = options_from_json(root.at("options"));
        auto decision = parse_compression_decision(root.at("compression").get<std::string>());
        if (!decision) {
            throw std::runtime_error("unknown compression decision");
        }
        record.compression = *decision;
        if (auto it = root.find("compression_reduction"); it != root.end() && !it->is_null()) {
            record.compression_reduction = it->get<double>();
        }
        for (const auto& index : root.at("verified_files")) {
            record.verified_files.push_back(index.get<std::uint32_t>());
        }
        if (auto it = root.find("last_transport"); it != root.end() && !it->is_null()) {
            record.last_transport = transport::parse_protocol(it->get<std::string>());
        }
        if (record.token.transfer_id != transfer_id || record.manifest.transfer_id != transfer_id) {
            throw std::runtime_error("transfer id does not match file name");
        }
        return ferry::Ok(std::move(record));
    } catch (const std::exception& e) {
        return ferry::Err<ResumeRecord>(ferry::Error::resume(std::string("corrupt checkpoint: ") + e.what(),
                                                             path.string()));
    }
}

ferry::Result<void> ResumeStore::remove(const std::string& transfer_id) {
    std::lock_guard lock(mutex_);
    std::error_code ec;
    fs::remove(path_for(transfer_id), ec);
    if (ec) {
        return ferry::Err<void>(ferry::Error::storage("cannot remove checkpoint: " + ec.message(),
                                                      path_for(transfer_id).string()));
    }
    return ferry::Ok();
}

bool ResumeStore::exists(const std::string& transfer_id) const {
    std::lock_guard lock(mutex_);
    std::error_code ec;
    return fs::exists(path_for(transfer_id), ec);
}

std::vector<std::string> ResumeStore::list() const {
    std::lock_guard lock(mutex_);
    std::vector<std::string> ids;
    std::error_code ec;
    if (!fs::is_directory(dir_, ec)) {
        return ids;
    }
    for (const auto& entry : fs::directory_iterator(dir_, ec)) {
        if (entry.path().extension() == ".json") {
            ids.push_back(entry.path().stem().string());
        }
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

ResumeManager::ResumeManager(ResumeStore& store, core::Clock clock)
    : store_(store), clock_(std::move(clock)) {}

ferry::Result<ResumeToken> ResumeManager::checkpoint(ResumeRecord record) {
    record.token.transfer_id = record.manifest.transfer_id;
    record.token.created_at = clock_();
    record.token.expires_at = record.token.created_at + kResumeTokenTtl;

    if (auto saved = store_.save(record); saved.is_error()) {
        return ferry::Err<ResumeToken>(saved.error());
    }
    spdlog::debug("Checkpoint {} at file {} chunk {} ({} bytes)", record.token.transfer_id,
                  record.token.last_completed_file, record.token.last_completed_chunk,
                  record.token.bytes_completed);
    return ferry::Ok(record.token);
}

ferry::Result<ResumeRecord> ResumeManager::resume(const ResumeToken& token) {
    const auto now = clock_();
    if (token.is_expired(now)) {
        return ferry::Err<ResumeRecord>(ferry::Error::resume("resume token expired"));
    }

    auto loaded = store_.load(token.transfer_id);
    if (loaded.is_error()) {
        return loaded;
    }
    auto record = std::move(loaded.value());

    if (record.token.is_expired(now)) {
        return ferry::Err<ResumeRecord>(ferry::Error::resume("resume token expired"));
    }
    if (record.token.session_id != token.session_id ||
        record.token.last_completed_file != token.last_completed_file ||
        record.token.last_completed_chunk != token.last_completed_chunk) {
        return ferry::Err<ResumeRecord>(ferry::Error::resume("resume token does not match the stored checkpoint"));
    }
    if (record.token.last_completed_file >= static_cast<std::int64_t>(record.manifest.files.size())) {
        return ferry::Err<ResumeRecord>(ferry::Error::resume("resume position outside the manifest"));
    }

    if (auto verified = verify_last_completed(record); verified.is_error()) {
        return ferry::Err<ResumeRecord>(verified.error());
    }

    if (auto removed = store_.remove(token.transfer_id); removed.is_error()) {
        return ferry::Err<ResumeRecord>(removed.error());
    }

    spdlog::info("Resuming transfer {} after file {} chunk {}", token.transfer_id, token.last_completed_file,
                 token.last_completed_chunk);
    return ferry::Ok(std::move(record));
}

ferry::Result<void> ResumeManager::verify_last_completed(const ResumeRecord& record) const {
    if (record.token.last_completed_file < 0) {
        return ferry::Ok();
    }
    const auto& entry = record.manifest.files[static_cast<std::size_t>(record.token.last_completed_file)];
    if (entry.kind == EntryKind::Symlink) {
        return ferry::Ok();
    }

    auto digest = core::sha256_file(entry.source);
    if (digest.is_error()) {
        return ferry::Err<void>(ferry::Error::resume("cannot re-verify " + entry.path + ": " + digest.error().message,
                                                     entry.source.string()));
    }
    if (digest.value() != entry.checksum) {
        spdlog::warn("Source of {} changed since the checkpoint", entry.path);
        return ferry::Err<void>(
            ferry::Error::resume("source changed since checkpoint; start a fresh transfer", entry.source.string()));
    }
    return ferry::Ok();
}

ferry::Result<void> ResumeManager::discard(const std::string& transfer_id) {
    return store_.remove(transfer_id);
}

std::size_t ResumeManager::purge_expired() {
    std::size_t removed = 0;
    const auto now = clock_();
    for (const auto& id : store_.list()) {
        auto record = store_.load(id);
        if (record.is_ok() && !record.value().token.is_expired(now)) {
            continue;
        }
        if (store_.remove(id).is_ok()) {
            spdlog::info("Dropped {} checkpoint {}", record.is_ok() ? "expired" : "unreadable", id);
            removed++;
        }
    }
    return removed;
}

} // namespace ferry::transfer
