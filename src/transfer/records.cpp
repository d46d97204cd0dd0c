#include "ferry/transfer/records.hpp"

#include "ferry/core/platform.hpp"

#include <fstream>
#include <stdexcept>
#include <system_error>

namespace ferry::transfer {
namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

core::Digest digest_field(const json& doc, const char* key) {
    auto digest = core::digest_from_hex(doc.at(key).get<std::string>());
    if (digest.is_error()) {
        throw std::runtime_error(std::string(key) + ": " + digest.error().message);
    }
    return digest.value();
}

core::TimePoint time_field(const json& doc, const char* key) {
    return core::from_unix_millis(doc.at(key).get<std::int64_t>());
}

json optional_u64(const std::optional<std::uint64_t>& value) {
    return value ? json(*value) : json(nullptr);
}

} // namespace

json manifest_to_json(const TransferManifest& manifest) {
    json files = json::array();
    for (const auto& file : manifest.files) {
        files.push_back({
            {"path", file.path},
            {"size", file.size},
            {"checksum", core::to_hex(file.checksum)},
            {"permissions", file.permissions},
            {"modified_at", core::to_unix_millis(file.modified_at)},
            {"chunk_count", file.chunk_count},
            {"kind", file.kind == EntryKind::Symlink ? "symlink" : "file"},
            {"link_target", file.link_target},
            {"source", file.source.string()},
        });
    }

    json directories = json::array();
    for (const auto& dir : manifest.directories) {
        directories.push_back({
            {"path", dir.path},
            {"permissions", dir.permissions},
            {"created_at", core::to_unix_millis(dir.created_at)},
        });
    }

    return {
        {"transfer_id", manifest.transfer_id},
        {"sender_id", manifest.sender_id},
        {"created_at", core::to_unix_millis(manifest.created_at)},
        {"total_size", manifest.total_size},
        {"file_count", manifest.file_count},
        {"checksum", core::to_hex(manifest.checksum)},
        {"files", files},
        {"directories", directories},
    };
}

TransferManifest manifest_from_json(const json& doc) {
    TransferManifest manifest;
    manifest.transfer_id = doc.at("transfer_id").get<std::string>();
    manifest.sender_id = doc.at("sender_id").get<std::string>();
    manifest.created_at = time_field(doc, "created_at");
    manifest.total_size = doc.at("total_size").get<std::uint64_t>();
    manifest.file_count = doc.at("file_count").get<std::uint32_t>();
    manifest.checksum = digest_field(doc, "checksum");

    for (const auto& item : doc.at("files")) {
        FileEntry file;
        file.path = item.at("path").get<std::string>();
        file.size = item.at("size").get<std::uint64_t>();
        file.checksum = digest_field(item, "checksum");
        file.permissions = item.at("permissions").get<std::uint32_t>();
        file.modified_at = time_field(item, "modified_at");
        file.chunk_count = item.at("chunk_count").get<std::uint64_t>();
        file.kind = item.at("kind").get<std::string>() == "symlink" ? EntryKind::Symlink : EntryKind::Regular;
        file.link_target = item.value("link_target", std::string{});
        file.source = item.value("source", std::string{});
        manifest.files.push_back(std::move(file));
    }
    for (const auto& item : doc.at("directories")) {
        DirectoryEntry dir;
        dir.path = item.at("path").get<std::string>();
        dir.permissions = item.at("permissions").get<std::uint32_t>();
        dir.created_at = time_field(item, "created_at");
        manifest.directories.push_back(std::move(dir));
    }
    return manifest;
}

json token_to_json(const ResumeToken& token) {
    return {
        {"transfer_id", token.transfer_id},
        {"session_id", token.session_id},
        {"last_completed_file", token.last_completed_file},
        {"last_completed_chunk", token.last_completed_chunk},
        {"bytes_completed", token.bytes_completed},
        {"created_at", core::to_unix_millis(token.created_at)},
        {"expires_at", core::to_unix_millis(token.expires_at)},
    };
}

ResumeToken token_from_json(const json& doc) {
    ResumeToken token;
    token.transfer_id = doc.at("transfer_id").get<std::string>();
    token.session_id = doc.at("session_id").get<std::string>();
    token.last_completed_file = doc.at("last_completed_file").get<std::int64_t>();
    token.last_completed_chunk = doc.at("last_completed_chunk").get<std::int64_t>();
    token.bytes_completed = doc.at("bytes_completed").get<std::uint64_t>();
    token.created_at = time_field(doc, "created_at");
    token.expires_at = time_field(doc, "expires_at");
    return token;
}

json options_to_json(const TransferOptions& options) {
    return {
        {"preferred_transport",
         options.preferred_transport ? json(transport::to_string(*options.preferred_transport)) : json(nullptr)},
        {"bandwidth_limit", optional_u64(options.bandwidth_limit)},
        {"compression", options.compression ? json(core::to_string(*options.compression)) : json(nullptr)},
    };
}

TransferOptions options_from_json(const json& doc) {
    TransferOptions options;
    if (auto it = doc.find("preferred_transport"); it != doc.end() && !it->is_null()) {
        options.preferred_transport = transport::parse_protocol(it->get<std::string>());
        if (!options.preferred_transport) {
            throw std::runtime_error("unknown transport '" + it->get<std::string>() + "'");
        }
    }
    if (auto it = doc.find("bandwidth_limit"); it != doc.end() && !it->is_null()) {
        options.bandwidth_limit = it->get<std::uint64_t>();
    }
    if (auto it = doc.find("compression"); it != doc.end() && !it->is_null()) {
        options.compression = core::parse_compression_mode(it->get<std::string>());
        if (!options.compression) {
            throw std::runtime_error("unknown compression mode '" + it->get<std::string>() + "'");
        }
    }
    return options;
}

json request_to_json(const TransferRequest& request) {
    json paths = json::array();
    for (const auto& path : request.paths) {
        paths.push_back(path.string());
    }
    return {
        {"paths", paths},
        {"peer_id", request.peer_id},
        {"options", options_to_json(request.options)},
    };
}

TransferRequest request_from_json(const json& doc) {
    TransferRequest request;
    for (const auto& path : doc.at("paths")) {
        request.paths.emplace_back(path.get<std::string>());
    }
    request.peer_id = doc.at("peer_id").get<std::string>();
    if (auto it = doc.find("options"); it != doc.end()) {
        request.options = options_from_json(*it);
    }
    return request;
}

ferry::Result<void> write_json_atomically(const fs::path& path, const json& doc) {
    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
        return ferry::Err<void>(ferry::Error::storage("cannot create directory: " + ec.message(),
                                                      path.parent_path().string()));
    }

    auto tmp = path;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            return ferry::Err<void>(ferry::Error::storage("cannot open for writing", tmp.string()));
        }
        out << doc.dump(2);
        out.flush();
        if (!out) {
            return ferry::Err<void>(ferry::Error::storage("write failed", tmp.string()));
        }
    }

    fs::rename(tmp, path, ec);
    if (ec) {
        fs::remove(tmp, ec);
        return ferry::Err<void>(ferry::Error::storage("cannot rename into place", path.string()));
    }
    return ferry::Ok();
}

ferry::Result<json> read_json(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return ferry::Err<json>(ferry::Error::storage("cannot open for reading", path.string()));
    }
    try {
        return ferry::Ok(json::parse(in));
    } catch (const json::exception& e) {
        return ferry::Err<json>(ferry::Error::storage(std::string("malformed record: ") + e.what(), path.string()));
    }
}

} // namespace ferry::transfer
