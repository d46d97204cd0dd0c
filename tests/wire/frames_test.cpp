#include "ferry/core/platform.hpp"
#include "ferry/wire/frames.hpp"

#include <gtest/gtest.h>

#include <variant>

using namespace ferry::wire;
using ferry::ErrorKind;
using ferry::transfer::FileEntry;
using ferry::transfer::TransferManifest;

namespace {

TransferManifest sample_manifest() {
    TransferManifest manifest;
    manifest.transfer_id = "2f1e6a4c-0000-4000-8000-000000000001";
    manifest.sender_id = "sender";
    manifest.created_at = ferry::core::from_unix_millis(1700000000000);
    FileEntry entry;
    entry.path = "docs/readme.txt";
    entry.size = 70000;
    entry.chunk_count = 2;
    entry.checksum = ferry::core::sha256(std::string{"readme"});
    entry.modified_at = ferry::core::from_unix_millis(1690000000000);
    entry.source = "/home/user/docs/readme.txt";
    manifest.files.push_back(entry);
    manifest.directories.push_back({"docs", 0755, ferry::core::from_unix_millis(1690000000000)});
    manifest.file_count = 1;
    manifest.total_size = entry.size;
    manifest.checksum = manifest_digest(manifest);
    return manifest;
}

} // namespace

TEST(Frames, OfferCarriesManifestWithoutSourcePaths) {
    Offer offer;
    offer.session_id = "session";
    offer.manifest = sample_manifest();
    offer.resume = true;
    offer.position = {0, 1};
    offer.verified_files = {0};

    auto decoded = decode(encode(offer));
    ASSERT_TRUE(decoded.is_ok()) << decoded.error().to_string();
    const auto* out = std::get_if<Offer>(&decoded.value());
    ASSERT_NE(out, nullptr);
    EXPECT_EQ(out->session_id, "session");
    EXPECT_TRUE(out->resume);
    EXPECT_EQ(out->position.chunk, 1u);
    ASSERT_EQ(out->manifest.files.size(), 1u);
    EXPECT_EQ(out->manifest.files[0].path, "docs/readme.txt");
    EXPECT_TRUE(out->manifest.files[0].source.empty());
    EXPECT_EQ(out->manifest.checksum, offer.manifest.checksum);
    EXPECT_EQ(manifest_digest(out->manifest), offer.manifest.checksum);
}

TEST(Frames, ChunkAckStatusSurvives) {
    ChunkAck ack;
    ack.file_index = 3;
    ack.sequence = 9;
    ack.status = AckStatus::OutOfWindow;
    ack.next_expected = 4;
    ack.detail = "gap";

    auto decoded = decode(encode(ack));
    ASSERT_TRUE(decoded.is_ok());
    const auto& out = std::get<ChunkAck>(decoded.value());
    EXPECT_EQ(out.status, AckStatus::OutOfWindow);
    EXPECT_EQ(out.next_expected, 4u);
    EXPECT_EQ(frame_type(decoded.value()), FrameType::ChunkAck);
}

TEST(Frames, RejectsUnknownVersionAndType) {
    auto bytes = encode(Complete{"t"});
    bytes[0] = 99;
    auto wrong_version = decode(bytes);
    ASSERT_TRUE(wrong_version.is_error());
    EXPECT_EQ(wrong_version.error().kind, ErrorKind::Protocol);

    auto unknown = decode({kProtocolVersion, 200});
    ASSERT_TRUE(unknown.is_error());
    EXPECT_EQ(unknown.error().kind, ErrorKind::Protocol);

    EXPECT_TRUE(decode({}).is_error());
}

TEST(Frames, RejectsTruncatedAndTrailingInput) {
    ChunkData chunk;
    chunk.payload = {1, 2, 3, 4};
    chunk.raw_length = 4;
    auto bytes = encode(chunk);

    auto truncated = bytes;
    truncated.pop_back();
    EXPECT_TRUE(decode(truncated).is_error());

    auto trailing = bytes;
    trailing.push_back(0);
    EXPECT_TRUE(decode(trailing).is_error());
}

TEST(Frames, ManifestDigestIgnoresIdentityFields) {
    auto a = sample_manifest();
    auto b = a;
    b.transfer_id = "another";
    b.sender_id = "someone-else";
    EXPECT_EQ(manifest_digest(a), manifest_digest(b));

    b.files[0].size += 1;
    EXPECT_NE(manifest_digest(a), manifest_digest(b));
}
