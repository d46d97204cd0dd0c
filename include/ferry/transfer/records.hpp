#pragma once

#include "ferry/transfer/types.hpp"

#include <nlohmann/json.hpp>

namespace ferry::transfer {

// JSON forms of the persisted records. The from_json functions throw
// (nlohmann::json::exception or std::runtime_error) on malformed input;
// stores catch at their boundary and convert to ferry::Error.

nlohmann::json manifest_to_json(const TransferManifest& manifest);
TransferManifest manifest_from_json(const nlohmann::json& doc);

nlohmann::json token_to_json(const ResumeToken& token);
ResumeToken token_from_json(const nlohmann::json& doc);

nlohmann::json options_to_json(const TransferOptions& options);
TransferOptions options_from_json(const nlohmann::json& doc);

nlohmann::json request_to_json(const TransferRequest& request);
TransferRequest request_from_json(const nlohmann::json& doc);

/// Writes `doc` to `<path>.tmp` and renames it over `path`.
ferry::Result<void> write_json_atomically(const std::filesystem::path& path, const nlohmann::json& doc);
ferry::Result<nlohmann::json> read_json(const std::filesystem::path& path);

} // namespace ferry::transfer
