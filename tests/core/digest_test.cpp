#include "ferry/core/digest.hpp"
#include "ferry/core/ids.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <set>
#include <string>

namespace fs = std::filesystem;
using namespace ferry::core;

namespace {

fs::path create_temp_dir() {
    static std::atomic<uint64_t> counter{0};
    const auto base = fs::temp_directory_path();
    const auto timestamp = std::chrono::steady_clock::now().time_since_epoch().count();
    const auto id = timestamp ^ (counter.fetch_add(1) << 8);
    auto unique = base / fs::path("ferry_digest_test_" + std::to_string(id));
    fs::remove_all(unique);
    fs::create_directories(unique);
    return unique;
}

} // namespace

TEST(Sha256, KnownVectors) {
    EXPECT_EQ(to_hex(sha256(std::string{})),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    EXPECT_EQ(to_hex(sha256(std::string{"abc"})),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(Sha256, IncrementalMatchesOneShot) {
    const std::string text = "the quick brown fox jumps over the lazy dog";
    Sha256 hasher;
    hasher.update(reinterpret_cast<const std::uint8_t*>(text.data()), 10);
    hasher.update(reinterpret_cast<const std::uint8_t*>(text.data()) + 10, text.size() - 10);
    EXPECT_EQ(hasher.finish(), sha256(text));

    hasher.reset();
    hasher.update(reinterpret_cast<const std::uint8_t*>(text.data()), text.size());
    EXPECT_EQ(hasher.finish(), sha256(text));
}

TEST(Sha256, FileDigestMatchesContent) {
    const auto dir = create_temp_dir();
    std::string content(200 * 1024, 'x');
    content[12345] = 'y';
    std::ofstream(dir / "data.bin", std::ios::binary) << content;

    auto digest = sha256_file(dir / "data.bin");
    ASSERT_TRUE(digest.is_ok());
    EXPECT_EQ(digest.value(), sha256(content));

    auto missing = sha256_file(dir / "absent.bin");
    ASSERT_TRUE(missing.is_error());
    EXPECT_EQ(missing.error().kind, ferry::ErrorKind::Storage);

    fs::remove_all(dir);
}

TEST(Sha256, HexParsing) {
    const auto digest = sha256(std::string{"abc"});
    auto parsed = digest_from_hex(to_hex(digest));
    ASSERT_TRUE(parsed.is_ok());
    EXPECT_EQ(parsed.value(), digest);

    EXPECT_TRUE(digest_from_hex("abc").is_error());
    EXPECT_TRUE(digest_from_hex(std::string(64, 'z')).is_error());
}

TEST(Ids, GeneratesDistinctValidIds) {
    std::set<std::string> seen;
    for (int i = 0; i < 100; ++i) {
        const auto id = generate_id();
        EXPECT_TRUE(is_valid_id(id)) << id;
        seen.insert(id);
    }
    EXPECT_EQ(seen.size(), 100u);
    EXPECT_FALSE(is_valid_id("not-an-id"));
    EXPECT_FALSE(is_valid_id(""));
}
