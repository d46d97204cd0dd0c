#include "ferry/core/ids.hpp"
#include "ferry/transfer/manifest.hpp"
#include "ferry/transfer/resume.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>

namespace fs = std::filesystem;
using namespace ferry::transfer;
using ferry::ErrorKind;
using ferry::core::TimePoint;

namespace {

fs::path create_temp_dir() {
    static std::atomic<uint64_t> counter{0};
    const auto base = fs::temp_directory_path();
    const auto timestamp = std::chrono::steady_clock::now().time_since_epoch().count();
    const auto id = timestamp ^ (counter.fetch_add(1) << 8);
    auto unique = base / fs::path("ferry_resume_test_" + std::to_string(id));
    fs::remove_all(unique);
    fs::create_directories(unique);
    return unique;
}

void write_file(const fs::path& path, const std::string& content) {
    std::ofstream output(path, std::ios::binary | std::ios::trunc);
    output << content;
}

} // namespace

class ResumeTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = create_temp_dir();
        fs::create_directories(root_ / "data");
        write_file(root_ / "data" / "a.bin", std::string(2 * kChunkSize, 'a'));
        write_file(root_ / "data" / "b.bin", std::string(3 * kChunkSize + 1, 'b'));

        auto built = ManifestBuilder("sender").build({root_ / "data"});
        ASSERT_TRUE(built.is_ok()) << built.error().to_string();
        manifest_ = built.value();

        clock_ = [now = now_] { return *now; };
        store_ = std::make_unique<ResumeStore>(root_ / "state");
        manager_ = std::make_unique<ResumeManager>(*store_, clock_);
    }

    void TearDown() override {
        if (!root_.empty()) {
            fs::remove_all(root_);
        }
    }

    ResumeRecord record_at(std::int64_t file, std::int64_t chunk) const {
        ResumeRecord record;
        record.manifest = manifest_;
        record.peer_id = "peer";
        record.token.session_id = "session-1";
        record.token.last_completed_file = file;
        record.token.last_completed_chunk = chunk;
        record.token.bytes_completed = 3 * kChunkSize;
        record.compression = CompressionDecision::Disabled;
        record.last_transport = ferry::transport::TransportProtocol::SimpleStream;
        return record;
    }

    fs::path root_;
    TransferManifest manifest_;
    std::shared_ptr<TimePoint> now_ = std::make_shared<TimePoint>(std::chrono::system_clock::now());
    ferry::core::Clock clock_;
    std::unique_ptr<ResumeStore> store_;
    std::unique_ptr<ResumeManager> manager_;
};

TEST_F(ResumeTest, CheckpointThenResumeOnce) {
    auto token = manager_->checkpoint(record_at(1, 0));
    ASSERT_TRUE(token.is_ok()) << token.error().to_string();
    EXPECT_EQ(token.value().transfer_id, manifest_.transfer_id);
    EXPECT_EQ(token.value().expires_at - token.value().created_at, kResumeTokenTtl);
    EXPECT_TRUE(store_->exists(manifest_.transfer_id));

    auto record = manager_->resume(token.value());
    ASSERT_TRUE(record.is_ok()) << record.error().to_string();
    EXPECT_EQ(record.value().peer_id, "peer");
    EXPECT_EQ(record.value().compression, CompressionDecision::Disabled);
    EXPECT_EQ(record.value().manifest.files.size(), 2u);
    EXPECT_EQ(record.value().manifest.files[1].source, manifest_.files[1].source);
    EXPECT_FALSE(store_->exists(manifest_.transfer_id));

    auto again = manager_->resume(token.value());
    ASSERT_TRUE(again.is_error());
    EXPECT_EQ(again.error().kind, ErrorKind::Resume);
}

TEST_F(ResumeTest, ExpiredTokenIsRejected) {
    auto token = manager_->checkpoint(record_at(0, 1));
    ASSERT_TRUE(token.is_ok());

    *now_ += std::chrono::hours{25};
    auto record = manager_->resume(token.value());
    ASSERT_TRUE(record.is_error());
    EXPECT_EQ(record.error().kind, ErrorKind::Resume);
    EXPECT_NE(record.error().message.find("expired"), std::string::npos);

    EXPECT_EQ(manager_->purge_expired(), 1u);
    EXPECT_TRUE(store_->list().empty());
}

TEST_F(ResumeTest, SupersededTokenIsRejected) {
    auto first = manager_->checkpoint(record_at(0, 0));
    ASSERT_TRUE(first.is_ok());
    auto second = manager_->checkpoint(record_at(1, 1));
    ASSERT_TRUE(second.is_ok());

    auto stale = manager_->resume(first.value());
    ASSERT_TRUE(stale.is_error());
    EXPECT_EQ(stale.error().kind, ErrorKind::Resume);

    EXPECT_TRUE(manager_->resume(second.value()).is_ok());
}

TEST_F(ResumeTest, ChangedSourceIsRejected) {
    auto token = manager_->checkpoint(record_at(0, 1));
    ASSERT_TRUE(token.is_ok());

    write_file(root_ / "data" / "a.bin", std::string(2 * kChunkSize, 'z'));
    auto record = manager_->resume(token.value());
    ASSERT_TRUE(record.is_error());
    EXPECT_EQ(record.error().kind, ErrorKind::Resume);
}

TEST_F(ResumeTest, UnknownTokenIsRejected) {
    ResumeToken token;
    token.transfer_id = ferry::core::generate_id();
    token.expires_at = *now_ + std::chrono::hours{1};
    auto record = manager_->resume(token);
    ASSERT_TRUE(record.is_error());
    EXPECT_EQ(record.error().kind, ErrorKind::Resume);
}

TEST_F(ResumeTest, CorruptCheckpointIsRejectedAndPurged) {
    auto token = manager_->checkpoint(record_at(-1, -1));
    ASSERT_TRUE(token.is_ok());
    write_file(store_->path_for(manifest_.transfer_id), "{ broken");

    auto record = manager_->resume(token.value());
    ASSERT_TRUE(record.is_error());
    EXPECT_EQ(record.error().kind, ErrorKind::Resume);
    EXPECT_EQ(manager_->purge_expired(), 1u);
}

TEST(ResumePosition, FollowsWatermark) {
    TransferManifest manifest;
    FileEntry a;
    a.chunk_count = 2;
    FileEntry empty;
    FileEntry b;
    b.chunk_count = 3;
    manifest.files = {a, empty, b};

    ResumeToken fresh;
    auto start = position_after(fresh, manifest);
    EXPECT_EQ(start.file_index, 0u);
    EXPECT_EQ(start.chunk, 0u);

    ResumeToken mid;
    mid.last_completed_file = 0;
    mid.last_completed_chunk = 0;
    EXPECT_EQ(position_after(mid, manifest).chunk, 1u);

    ResumeToken end_of_first;
    end_of_first.last_completed_file = 0;
    end_of_first.last_completed_chunk = 1;
    auto next = position_after(end_of_first, manifest);
    EXPECT_EQ(next.file_index, 2u);
    EXPECT_EQ(next.chunk, 0u);
}
