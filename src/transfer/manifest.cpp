#include "ferry/transfer/manifest.hpp"

#include "ferry/core/digest.hpp"
#include "ferry/core/ids.hpp"
#include "ferry/core/platform.hpp"
#include "ferry/wire/frames.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <set>

namespace ferry::transfer {
namespace fs = std::filesystem;

namespace {

std::uint32_t permission_bits(const fs::file_status& status) {
    return static_cast<std::uint32_t>(status.permissions() & fs::perms::mask) & 0777u;
}

std::string join(const std::string& parent, const std::string& name) {
    return parent.empty() ? name : parent + "/" + name;
}

std::string top_level_name(const fs::path& input) {
    fs::path normal = input.lexically_normal();
    if (normal.filename().empty()) {
        normal = normal.parent_path();
    }
    return normal.filename().string();
}

// Returns the first proper ancestor of `path` found in `leaves`, or an empty string.
std::string leaf_ancestor(const std::string& path, const std::set<std::string>& leaves) {
    for (auto slash = path.find('/'); slash != std::string::npos; slash = path.find('/', slash + 1)) {
        std::string prefix = path.substr(0, slash);
        if (leaves.count(prefix) != 0) {
            return prefix;
        }
    }
    return {};
}

} // namespace

ManifestBuilder::ManifestBuilder(std::string sender_id, core::SymlinkPolicy policy, core::Clock clock)
    : sender_id_(std::move(sender_id)), policy_(policy), clock_(std::move(clock)) {}

ferry::Result<TransferManifest> ManifestBuilder::build(const std::vector<fs::path>& paths) const {
    if (paths.empty()) {
        return ferry::Err<TransferManifest>(ferry::Error::manifest("no input paths"));
    }

    ScanState state;
    for (const auto& input : paths) {
        const std::string name = top_level_name(input);
        if (name.empty() || name == "." || name == "..") {
            return ferry::Err<TransferManifest>(ferry::Error::manifest("cannot derive entry name", input.string()));
        }
        std::set<fs::path> ancestors;
        if (auto res = add_path(input, name, ancestors, state); res.is_error()) {
            return ferry::Err<TransferManifest>(res.error());
        }
    }

    auto& manifest = state.manifest;
    std::sort(manifest.files.begin(), manifest.files.end(),
              [](const FileEntry& a, const FileEntry& b) { return a.path < b.path; });
    std::sort(manifest.directories.begin(), manifest.directories.end(),
              [](const DirectoryEntry& a, const DirectoryEntry& b) { return a.path < b.path; });

    manifest.transfer_id = core::generate_id();
    manifest.sender_id = sender_id_;
    manifest.created_at = clock_();
    manifest.file_count = static_cast<std::uint32_t>(manifest.files.size());
    manifest.total_size = 0;
    for (const auto& file : manifest.files) {
        manifest.total_size += file.size;
    }
    manifest.checksum = wire::manifest_digest(manifest);

    spdlog::debug("Built manifest {}: {} files, {} directories, {} bytes, checksum={}",
                  manifest.transfer_id, manifest.file_count, manifest.directories.size(),
                  manifest.total_size, core::to_hex(manifest.checksum));
    return ferry::Ok(std::move(manifest));
}

ferry::Result<void> ManifestBuilder::add_path(const fs::path& source, const std::string& relative,
                                              std::set<fs::path>& ancestors, ScanState& state) const {
    if (!state.seen_paths.insert(relative).second) {
        return ferry::Err<void>(ferry::Error::manifest("duplicate entry path '" + relative + "'", source.string()));
    }

    std::error_code ec;
    const auto link_status = fs::symlink_status(source, ec);
    if (ec || !fs::exists(link_status)) {
        return ferry::Err<void>(ferry::Error::manifest("path does not exist or is unreadable", source.string()));
    }

    if (fs::is_symlink(link_status)) {
        if (policy_ == core::SymlinkPolicy::Preserve) {
            return add_link(source, relative, state);
        }
        const auto target_status = fs::status(source, ec);
        if (ec || !fs::exists(target_status)) {
            return ferry::Err<void>(ferry::Error::manifest("dangling symbolic link", source.string()));
        }
        if (fs::is_directory(target_status)) {
            return add_directory(source, relative, ancestors, state);
        }
        if (fs::is_regular_file(target_status)) {
            return add_file(source, relative, state);
        }
    } else if (fs::is_directory(link_status)) {
        return add_directory(source, relative, ancestors, state);
    } else if (fs::is_regular_file(link_status)) {
        return add_file(source, relative, state);
    }

    spdlog::warn("Skipping special file {}", source.string());
    state.seen_paths.erase(relative);
    return ferry::Ok();
}

ferry::Result<void> ManifestBuilder::add_directory(const fs::path& source, const std::string& relative,
                                                   std::set<fs::path>& ancestors, ScanState& state) const {
    std::error_code ec;
    const fs::path canonical = fs::canonical(source, ec);
    if (ec) {
        return ferry::Err<void>(ferry::Error::manifest("cannot resolve directory", source.string()));
    }
    if (ancestors.count(canonical) != 0) {
        return ferry::Err<void>(ferry::Error::manifest("symbolic link cycle detected", source.string()));
    }

    auto times = core::file_times(source);
    if (times.is_error()) {
        return ferry::Err<void>(times.error());
    }

    DirectoryEntry entry;
    entry.path = relative;
    entry.permissions = permission_bits(fs::status(source, ec));
    entry.created_at = times.value().modified_at;
    state.manifest.directories.push_back(std::move(entry));

    std::vector<fs::path> children;
    fs::directory_iterator it(source, ec);
    if (ec) {
        return ferry::Err<void>(ferry::Error::manifest("cannot list directory: " + ec.message(), source.string()));
    }
    for (const fs::directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            return ferry::Err<void>(ferry::Error::manifest("directory iteration failed: " + ec.message(),
                                                           source.string()));
        }
        children.push_back(it->path());
    }
    if (ec) {
        return ferry::Err<void>(ferry::Error::manifest("directory iteration failed: " + ec.message(), source.string()));
    }
    std::sort(children.begin(), children.end());

    ancestors.insert(canonical);
    for (const auto& child : children) {
        auto res = add_path(child, join(relative, child.filename().string()), ancestors, state);
        if (res.is_error()) {
            return res;
        }
    }
    ancestors.erase(canonical);
    return ferry::Ok();
}

ferry::Result<void> ManifestBuilder::add_file(const fs::path& source, const std::string& relative,
                                              ScanState& state) const {
    std::error_code ec;
    const auto size = fs::file_size(source, ec);
    if (ec) {
        return ferry::Err<void>(ferry::Error::manifest("cannot read file size: " + ec.message(), source.string()));
    }

    auto digest = core::sha256_file(source);
    if (digest.is_error()) {
        return ferry::Err<void>(ferry::Error::manifest(digest.error().message, source.string()));
    }

    auto times = core::file_times(source);
    if (times.is_error()) {
        return ferry::Err<void>(times.error());
    }

    FileEntry entry;
    entry.path = relative;
    entry.size = size;
    entry.checksum = digest.value();
    entry.permissions = permission_bits(fs::status(source, ec));
    entry.modified_at = times.value().modified_at;
    entry.chunk_count = chunk_count_for(size);
    entry.kind = EntryKind::Regular;
    entry.source = source;
    state.manifest.files.push_back(std::move(entry));
    return ferry::Ok();
}

ferry::Result<void> ManifestBuilder::add_link(const fs::path& source, const std::string& relative,
                                              ScanState& state) const {
    std::error_code ec;
    const auto target = fs::read_symlink(source, ec);
    if (ec) {
        return ferry::Err<void>(ferry::Error::manifest("cannot read symbolic link", source.string()));
    }
    auto times = core::file_times(source, false);
    if (times.is_error()) {
        return ferry::Err<void>(times.error());
    }

    FileEntry entry;
    entry.path = relative;
    entry.kind = EntryKind::Symlink;
    entry.link_target = target.string();
    entry.checksum = core::sha256(entry.link_target);
    entry.permissions = 0777;
    entry.modified_at = times.value().modified_at;
    entry.source = source;
    state.manifest.files.push_back(std::move(entry));
    return ferry::Ok();
}

bool is_safe_relative_path(const std::string& path) {
    if (path.empty() || path.front() == '/' || path.find('\\') != std::string::npos) {
        return false;
    }
    const fs::path parsed(path);
    if (parsed.is_absolute() || parsed.has_root_name()) {
        return false;
    }
    for (const auto& part : parsed) {
        if (part == ".." || part == "." || part.empty()) {
            return false;
        }
    }
    return true;
}

ferry::Result<void> ManifestValidator::validate(const TransferManifest& manifest) {
    if (manifest.file_count != manifest.files.size()) {
        return ferry::Err<void>(ferry::Error::manifest("file_count does not match the file list"));
    }

    std::uint64_t total = 0;
    for (std::size_t i = 0; i < manifest.files.size(); ++i) {
        const auto& file = manifest.files[i];
        if (!is_safe_relative_path(file.path)) {
            return ferry::Err<void>(ferry::Error::manifest("unsafe entry path", file.path));
        }
        if (i > 0 && !(manifest.files[i - 1].path < file.path)) {
            return ferry::Err<void>(ferry::Error::manifest("file entries not sorted or duplicated", file.path));
        }
        if (file.chunk_count != chunk_count_for(file.size)) {
            return ferry::Err<void>(ferry::Error::manifest("chunk_count does not match size", file.path));
        }
        if (file.kind == EntryKind::Symlink && file.size != 0) {
            return ferry::Err<void>(ferry::Error::manifest("link entry with content", file.path));
        }
        total += file.size;
    }
    if (total != manifest.total_size) {
        return ferry::Err<void>(ferry::Error::manifest("total_size does not match file sizes"));
    }

    for (std::size_t i = 0; i < manifest.directories.size(); ++i) {
        const auto& dir = manifest.directories[i];
        if (!is_safe_relative_path(dir.path)) {
            return ferry::Err<void>(ferry::Error::manifest("unsafe directory path", dir.path));
        }
        if (i > 0 && !(manifest.directories[i - 1].path < dir.path)) {
            return ferry::Err<void>(ferry::Error::manifest("directory entries not sorted or duplicated", dir.path));
        }
    }

    // Files and links are leaves: nothing may live beneath one, and no directory may share a leaf's path.
    std::set<std::string> leaves;
    for (const auto& file : manifest.files) {
        leaves.insert(file.path);
    }
    for (const auto& file : manifest.files) {
        if (auto parent = leaf_ancestor(file.path, leaves); !parent.empty()) {
            return ferry::Err<void>(ferry::Error::manifest("entry nested under non-directory '" + parent + "'", file.path));
        }
    }
    for (const auto& dir : manifest.directories) {
        if (leaves.count(dir.path) != 0) {
            return ferry::Err<void>(ferry::Error::manifest("directory collides with a file entry", dir.path));
        }
        if (auto parent = leaf_ancestor(dir.path, leaves); !parent.empty()) {
            return ferry::Err<void>(ferry::Error::manifest("entry nested under non-directory '" + parent + "'", dir.path));
        }
    }

    if (wire::manifest_digest(manifest) != manifest.checksum) {
        return ferry::Err<void>(ferry::Error::manifest("manifest checksum mismatch"));
    }
    return ferry::Ok();
}

} // namespace ferry::transfer
