#include "ferry/transfer/compression.hpp"

#include <gtest/gtest.h>

#include <random>
#include <vector>

using ferry::core::CompressionMode;
using ferry::transfer::CompressionDecision;
using ferry::transfer::CompressionStage;

namespace {

constexpr std::uint64_t kLargeTransfer = 8ULL * 1024 * 1024;

std::vector<std::uint8_t> random_bytes(std::size_t size, unsigned seed) {
    std::mt19937 rng(seed);
    std::vector<std::uint8_t> bytes(size);
    for (auto& b : bytes) {
        b = static_cast<std::uint8_t>(rng() & 0xFF);
    }
    return bytes;
}

std::vector<std::uint8_t> text_bytes(std::size_t size) {
    const std::string line = "2024-01-01 INFO request handled in 12ms path=/api/v1/items\n";
    std::vector<std::uint8_t> bytes;
    bytes.reserve(size);
    while (bytes.size() < size) {
        bytes.push_back(static_cast<std::uint8_t>(line[bytes.size() % line.size()]));
    }
    return bytes;
}

} // namespace

TEST(CompressionStage, CompressibleSampleEnablesCompression) {
    CompressionStage stage(CompressionMode::Auto, kLargeTransfer);
    EXPECT_EQ(stage.decision(), CompressionDecision::Undecided);

    const auto raw = text_bytes(64 * 1024);
    auto out = stage.maybe_compress(raw);
    EXPECT_TRUE(out.compressed);
    EXPECT_LT(out.payload.size(), raw.size());
    EXPECT_EQ(stage.decision(), CompressionDecision::Enabled);
    ASSERT_TRUE(stage.sampled_reduction().has_value());
    EXPECT_GT(*stage.sampled_reduction(), 0.5);

    auto restored = CompressionStage::decompress(out.payload, raw.size());
    ASSERT_TRUE(restored.is_ok());
    EXPECT_EQ(restored.value(), raw);
}

TEST(CompressionStage, SmallSavingDisablesCompression) {
    // Random bytes with a short zero run: LZ4 saves a few percent, under the 10% bar.
    auto raw = random_bytes(64 * 1024, 11);
    std::fill(raw.begin(), raw.begin() + 2600, 0);

    CompressionStage stage(CompressionMode::Auto, kLargeTransfer, 1024 * 1024, 0.10);
    auto out = stage.maybe_compress(raw);
    EXPECT_FALSE(out.compressed);
    EXPECT_EQ(out.payload, raw);
    EXPECT_EQ(stage.decision(), CompressionDecision::Disabled);
    ASSERT_TRUE(stage.sampled_reduction().has_value());
    EXPECT_GT(*stage.sampled_reduction(), 0.0);
    EXPECT_LT(*stage.sampled_reduction(), 0.10);

    // The decision is final for the rest of the transfer.
    auto later = stage.maybe_compress(text_bytes(64 * 1024));
    EXPECT_FALSE(later.compressed);
}

TEST(CompressionStage, SmallTransfersAreNeverCompressed) {
    CompressionStage stage(CompressionMode::Auto, 512 * 1024);
    EXPECT_EQ(stage.decision(), CompressionDecision::Disabled);
    EXPECT_FALSE(stage.maybe_compress(text_bytes(4096)).compressed);
}

TEST(CompressionStage, ExplicitModes) {
    CompressionStage never(CompressionMode::Never, kLargeTransfer);
    EXPECT_FALSE(never.maybe_compress(text_bytes(4096)).compressed);

    CompressionStage always(CompressionMode::Always, 10);
    EXPECT_TRUE(always.maybe_compress(text_bytes(4096)).compressed);

    // Incompressible chunks still go out raw when compression is on.
    auto noise = random_bytes(4096, 3);
    auto out = always.maybe_compress(noise);
    EXPECT_FALSE(out.compressed);
    EXPECT_EQ(out.payload, noise);
}

TEST(CompressionStage, RestoredDecisionWins) {
    CompressionStage stage(CompressionMode::Auto, kLargeTransfer, 1024 * 1024, 0.10, CompressionDecision::Disabled);
    EXPECT_EQ(stage.decision(), CompressionDecision::Disabled);
    EXPECT_FALSE(stage.maybe_compress(text_bytes(4096)).compressed);
}

TEST(CompressionStage, DecompressRejectsGarbage) {
    auto result = CompressionStage::decompress(random_bytes(100, 5), 4096);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ferry::ErrorKind::Integrity);
}
