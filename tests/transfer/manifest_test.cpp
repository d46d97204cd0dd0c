#include "ferry/core/digest.hpp"
#include "ferry/core/ids.hpp"
#include "ferry/transfer/manifest.hpp"
#include "ferry/wire/frames.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>

namespace fs = std::filesystem;
using ferry::ErrorKind;
using ferry::core::SymlinkPolicy;
using ferry::transfer::DirectoryEntry;
using ferry::transfer::EntryKind;
using ferry::transfer::FileEntry;
using ferry::transfer::ManifestBuilder;
using ferry::transfer::ManifestValidator;
using ferry::transfer::kChunkSize;

namespace {

fs::path create_temp_dir() {
    static std::atomic<uint64_t> counter{0};
    const auto base = fs::temp_directory_path();
    const auto timestamp = std::chrono::steady_clock::now().time_since_epoch().count();
    const auto id = timestamp ^ (counter.fetch_add(1) << 8);
    auto unique = base / fs::path("ferry_manifest_test_" + std::to_string(id));
    fs::remove_all(unique);
    fs::create_directories(unique);
    return unique;
}

void write_file(const fs::path& path, const std::string& content) {
    std::ofstream output(path, std::ios::binary | std::ios::trunc);
    output << content;
}

void reseal(ferry::transfer::TransferManifest& manifest) {
    manifest.file_count = static_cast<std::uint32_t>(manifest.files.size());
    manifest.total_size = 0;
    for (const auto& file : manifest.files) {
        manifest.total_size += file.size;
    }
    manifest.checksum = ferry::wire::manifest_digest(manifest);
}

} // namespace

class ManifestTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = create_temp_dir();
    }

    void TearDown() override {
        if (!root_.empty()) {
            fs::remove_all(root_);
        }
    }

    fs::path root_;
};

TEST_F(ManifestTest, ScansDirectoryTree) {
    fs::create_directories(root_ / "album" / "raw");
    write_file(root_ / "album" / "b.jpg", std::string(kChunkSize + 10, 'b'));
    write_file(root_ / "album" / "a.txt", "hello");
    write_file(root_ / "album" / "raw" / "empty.bin", "");

    auto built = ManifestBuilder("sender-1").build({root_ / "album"});
    ASSERT_TRUE(built.is_ok()) << built.error().to_string();
    const auto& manifest = built.value();

    ASSERT_EQ(manifest.file_count, 3u);
    EXPECT_EQ(manifest.files[0].path, "album/a.txt");
    EXPECT_EQ(manifest.files[1].path, "album/b.jpg");
    EXPECT_EQ(manifest.files[2].path, "album/raw/empty.bin");
    EXPECT_EQ(manifest.files[1].chunk_count, 2u);
    EXPECT_EQ(manifest.files[2].chunk_count, 0u);
    EXPECT_EQ(manifest.total_size, kChunkSize + 15);
    EXPECT_EQ(manifest.files[0].checksum, ferry::core::sha256(std::string{"hello"}));

    ASSERT_EQ(manifest.directories.size(), 2u);
    EXPECT_EQ(manifest.directories[0].path, "album");
    EXPECT_EQ(manifest.directories[1].path, "album/raw");

    EXPECT_EQ(manifest.sender_id, "sender-1");
    EXPECT_TRUE(ferry::core::is_valid_id(manifest.transfer_id));
    EXPECT_TRUE(ManifestValidator::validate(manifest).is_ok());
}

TEST_F(ManifestTest, ChecksumIndependentOfInputOrder) {
    write_file(root_ / "one.txt", "1");
    write_file(root_ / "two.txt", "2");

    ManifestBuilder builder("sender");
    auto first = builder.build({root_ / "one.txt", root_ / "two.txt"});
    auto second = builder.build({root_ / "two.txt", root_ / "one.txt"});
    ASSERT_TRUE(first.is_ok());
    ASSERT_TRUE(second.is_ok());
    EXPECT_EQ(first.value().checksum, second.value().checksum);
    EXPECT_NE(first.value().transfer_id, second.value().transfer_id);
}

TEST_F(ManifestTest, MissingPathFails) {
    auto built = ManifestBuilder("sender").build({root_ / "absent"});
    ASSERT_TRUE(built.is_error());
    EXPECT_EQ(built.error().kind, ErrorKind::Manifest);
    EXPECT_EQ(built.error().path, (root_ / "absent").string());

    EXPECT_TRUE(ManifestBuilder("sender").build({}).is_error());
}

TEST_F(ManifestTest, DuplicateTopLevelNamesFail) {
    fs::create_directories(root_ / "x");
    fs::create_directories(root_ / "y");
    write_file(root_ / "x" / "same.txt", "a");
    write_file(root_ / "y" / "same.txt", "b");

    auto built = ManifestBuilder("sender").build({root_ / "x" / "same.txt", root_ / "y" / "same.txt"});
    ASSERT_TRUE(built.is_error());
    EXPECT_EQ(built.error().kind, ErrorKind::Manifest);
}

TEST_F(ManifestTest, SymlinkPolicies) {
    fs::create_directories(root_ / "tree");
    write_file(root_ / "tree" / "target.txt", "content");
    fs::create_symlink("target.txt", root_ / "tree" / "link.txt");

    auto followed = ManifestBuilder("sender", SymlinkPolicy::Follow).build({root_ / "tree"});
    ASSERT_TRUE(followed.is_ok());
    ASSERT_EQ(followed.value().files.size(), 2u);
    EXPECT_EQ(followed.value().files[0].kind, EntryKind::Regular);
    EXPECT_EQ(followed.value().files[0].size, 7u);

    auto preserved = ManifestBuilder("sender", SymlinkPolicy::Preserve).build({root_ / "tree"});
    ASSERT_TRUE(preserved.is_ok());
    const auto& link = preserved.value().files[0];
    EXPECT_EQ(link.path, "tree/link.txt");
    EXPECT_EQ(link.kind, EntryKind::Symlink);
    EXPECT_EQ(link.link_target, "target.txt");
    EXPECT_EQ(link.size, 0u);
}

TEST_F(ManifestTest, SymlinkCycleFails) {
    fs::create_directories(root_ / "loop");
    fs::create_directory_symlink(root_ / "loop", root_ / "loop" / "again");

    auto built = ManifestBuilder("sender").build({root_ / "loop"});
    ASSERT_TRUE(built.is_error());
    EXPECT_NE(built.error().message.find("cycle"), std::string::npos);
}

TEST_F(ManifestTest, ValidatorCatchesTampering) {
    write_file(root_ / "data.bin", std::string(1000, 'd'));
    auto built = ManifestBuilder("sender").build({root_ / "data.bin"});
    ASSERT_TRUE(built.is_ok());

    auto resized = built.value();
    resized.files[0].size = 2000;
    resized.total_size = 2000;
    EXPECT_TRUE(ManifestValidator::validate(resized).is_error());

    auto unsafe = built.value();
    unsafe.files[0].path = "../escape.bin";
    unsafe.checksum = ferry::wire::manifest_digest(unsafe);
    auto result = ManifestValidator::validate(unsafe);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().path, "../escape.bin");

    auto miscounted = built.value();
    miscounted.file_count = 2;
    EXPECT_TRUE(ManifestValidator::validate(miscounted).is_error());

    // A link followed by an entry beneath it would write through the link.
    auto linked = built.value();
    FileEntry link;
    link.path = "link";
    link.kind = EntryKind::Symlink;
    link.link_target = "/etc";
    link.checksum = ferry::core::sha256(link.link_target);
    FileEntry nested;
    nested.path = "link/passwd";
    nested.size = 5;
    nested.chunk_count = 1;
    nested.checksum = ferry::core::sha256(std::string{"owned"});
    linked.files = {link, nested};
    reseal(linked);
    auto through_link = ManifestValidator::validate(linked);
    ASSERT_TRUE(through_link.is_error());
    EXPECT_EQ(through_link.error().kind, ErrorKind::Manifest);
    EXPECT_EQ(through_link.error().path, "link/passwd");

    auto under_link = built.value();
    under_link.files = {link};
    DirectoryEntry hidden;
    hidden.path = "link/sub";
    under_link.directories = {hidden};
    reseal(under_link);
    auto dir_through_link = ManifestValidator::validate(under_link);
    ASSERT_TRUE(dir_through_link.is_error());
    EXPECT_EQ(dir_through_link.error().path, "link/sub");

    auto collided = built.value();
    DirectoryEntry same;
    same.path = "data.bin";
    collided.directories = {same};
    reseal(collided);
    auto collision = ManifestValidator::validate(collided);
    ASSERT_TRUE(collision.is_error());
    EXPECT_EQ(collision.error().path, "data.bin");

    auto under_file = built.value();
    FileEntry inner;
    inner.path = "data.bin/inner";
    under_file.files.push_back(inner);
    reseal(under_file);
    auto file_under_file = ManifestValidator::validate(under_file);
    ASSERT_TRUE(file_under_file.is_error());
    EXPECT_EQ(file_under_file.error().path, "data.bin/inner");
}

TEST_F(ManifestTest, OneByteChangeAltersChecksum) {
    fs::create_directories(root_ / "tree" / "sub");
    const std::string original(3 * kChunkSize + 11, 'x');
    write_file(root_ / "tree" / "a.txt", "first");
    write_file(root_ / "tree" / "sub" / "b.bin", original);

    ManifestBuilder builder("sender");
    auto before = builder.build({root_ / "tree"});
    ASSERT_TRUE(before.is_ok()) << before.error().to_string();

    // Same size and timestamp, one byte different deep inside the file.
    const auto target = root_ / "tree" / "sub" / "b.bin";
    const auto stamp = fs::last_write_time(target);
    auto changed = original;
    changed[2 * kChunkSize + 5] = 'y';
    write_file(target, changed);
    fs::last_write_time(target, stamp);

    auto after = builder.build({root_ / "tree"});
    ASSERT_TRUE(after.is_ok()) << after.error().to_string();
    EXPECT_EQ(after.value().files[1].size, before.value().files[1].size);
    EXPECT_NE(after.value().files[1].checksum, before.value().files[1].checksum);
    EXPECT_NE(after.value().checksum, before.value().checksum);
    EXPECT_EQ(after.value().files[0].checksum, before.value().files[0].checksum);
}

TEST(RelativePath, SafetyRules) {
    EXPECT_TRUE(ferry::transfer::is_safe_relative_path("a/b/c.txt"));
    EXPECT_FALSE(ferry::transfer::is_safe_relative_path(""));
    EXPECT_FALSE(ferry::transfer::is_safe_relative_path("/etc/passwd"));
    EXPECT_FALSE(ferry::transfer::is_safe_relative_path("a/../../b"));
    EXPECT_FALSE(ferry::transfer::is_safe_relative_path("a\\b"));
}
