#include "ferry/core/compute_pool.hpp"
#include "ferry/core/digest.hpp"
#include "ferry/events/events.hpp"
#include "ferry/security/peer_trust.hpp"
#include "ferry/security/security_layer.hpp"
#include "ferry/transfer/engine.hpp"
#include "ferry/transfer/receiver.hpp"
#include "ferry/transport/loopback.hpp"
#include "ferry/wire/frames.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <thread>
#include <utility>
#include <variant>
#include <vector>

namespace fs = std::filesystem;
using namespace std::chrono_literals;
using ferry::ErrorKind;
using ferry::transfer::CompressionDecision;
using ferry::transfer::TransferEngine;
using ferry::transfer::TransferReceiver;
using ferry::transfer::TransferRequest;
using ferry::transfer::TransferSession;
using ferry::transfer::TransferState;
using ferry::transfer::kChunkSize;
using ferry::transport::LoopbackNetwork;
using ferry::transport::LoopbackTransport;
using ferry::transport::TransportProtocol;

namespace {

fs::path create_temp_dir() {
    static std::atomic<uint64_t> counter{0};
    const auto base = fs::temp_directory_path();
    const auto timestamp = std::chrono::steady_clock::now().time_since_epoch().count();
    const auto id = timestamp ^ (counter.fetch_add(1) << 8);
    auto unique = base / fs::path("ferry_engine_test_" + std::to_string(id));
    fs::remove_all(unique);
    fs::create_directories(unique);
    return unique;
}

std::string random_bytes(std::size_t size, unsigned seed) {
    std::mt19937 rng(seed);
    std::string data(size, '\0');
    for (auto& byte : data) {
        byte = static_cast<char>(rng() & 0xFF);
    }
    return data;
}

void write_file(const fs::path& path, const std::string& content) {
    fs::create_directories(path.parent_path());
    std::ofstream output(path, std::ios::binary | std::ios::trunc);
    output << content;
}

std::string read_file(const fs::path& path) {
    std::ifstream input(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(input), std::istreambuf_iterator<char>());
}

std::string describe(const TransferSession& session) {
    const auto error = session.error();
    return error ? error->to_string() : std::string("no error");
}

bool wait_for_state(const std::shared_ptr<TransferSession>& session, TransferState state,
                    std::chrono::milliseconds timeout = 5000ms) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (session->state() == state) {
            return true;
        }
        std::this_thread::sleep_for(5ms);
    }
    return session->state() == state;
}

/// Chunk sequences that actually left the sender, optionally corrupting one of them once.
struct Tap {
    std::mutex mutex;
    std::vector<std::uint64_t> sent;
    std::optional<std::uint64_t> corrupt_sequence;
    bool corrupted = false;

    std::vector<std::uint64_t> sequences() {
        std::lock_guard lock(mutex);
        return sent;
    }
};

class TapStream : public ferry::security::FilteredStream {
public:
    TapStream(std::unique_ptr<ferry::transport::Stream> inner, std::shared_ptr<Tap> tap)
        : FilteredStream(std::move(inner)), tap_(std::move(tap)) {}

    ferry::Result<void> send(const std::vector<std::uint8_t>& frame) override {
        auto sent = FilteredStream::send(frame);
        if (sent.is_ok()) {
            auto decoded = ferry::wire::decode(frame);
            if (decoded.is_ok()) {
                if (auto* data = std::get_if<ferry::wire::ChunkData>(&decoded.value())) {
                    std::lock_guard lock(tap_->mutex);
                    tap_->sent.push_back(data->sequence);
                }
            }
        }
        return sent;
    }

protected:
    ferry::Result<std::vector<std::uint8_t>> seal(std::vector<std::uint8_t> frame) override {
        auto decoded = ferry::wire::decode(frame);
        if (decoded.is_error()) {
            return ferry::Ok(std::move(frame));
        }
        auto* data = std::get_if<ferry::wire::ChunkData>(&decoded.value());
        std::lock_guard lock(tap_->mutex);
        if (data == nullptr || tap_->corrupted || tap_->corrupt_sequence != data->sequence || data->payload.empty()) {
            return ferry::Ok(std::move(frame));
        }
        tap_->corrupted = true;
        data->payload[0] ^= 0xFF;
        return ferry::Ok(ferry::wire::encode(decoded.value()));
    }

private:
    std::shared_ptr<Tap> tap_;
};

struct XorCounts {
    std::atomic<std::size_t> sealed{0};
    std::atomic<std::size_t> opened{0};
};

/// Scrambles every frame with a one-byte key; both ends need the same key.
class XorStream : public ferry::security::FilteredStream {
public:
    XorStream(std::unique_ptr<ferry::transport::Stream> inner, std::uint8_t key, std::shared_ptr<XorCounts> counts)
        : FilteredStream(std::move(inner)), key_(key), counts_(std::move(counts)) {}

protected:
    ferry::Result<std::vector<std::uint8_t>> seal(std::vector<std::uint8_t> frame) override {
        scramble(frame);
        ++counts_->sealed;
        return ferry::Ok(std::move(frame));
    }

    ferry::Result<std::vector<std::uint8_t>> open(std::vector<std::uint8_t> frame) override {
        scramble(frame);
        ++counts_->opened;
        return ferry::Ok(std::move(frame));
    }

private:
    void scramble(std::vector<std::uint8_t>& frame) const {
        for (auto& byte : frame) {
            byte ^= key_;
        }
    }

    std::uint8_t key_;
    std::shared_ptr<XorCounts> counts_;
};

class XorSecurity : public ferry::security::SecurityLayer {
public:
    XorSecurity(std::uint8_t key, std::shared_ptr<XorCounts> counts) : key_(key), counts_(std::move(counts)) {}

    std::unique_ptr<ferry::transport::Stream> wrap(std::unique_ptr<ferry::transport::Stream> stream,
                                                   const std::string&) override {
        return std::make_unique<XorStream>(std::move(stream), key_, counts_);
    }

private:
    std::uint8_t key_;
    std::shared_ptr<XorCounts> counts_;
};

class TapSecurity : public ferry::security::SecurityLayer {
public:
    explicit TapSecurity(std::shared_ptr<Tap> tap) : tap_(std::move(tap)) {}

    std::unique_ptr<ferry::transport::Stream> wrap(std::unique_ptr<ferry::transport::Stream> stream,
                                                   const std::string&) override {
        return std::make_unique<TapStream>(std::move(stream), tap_);
    }

private:
    std::shared_ptr<Tap> tap_;
};

} // namespace

class TransferEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = create_temp_dir();
        source_ = root_ / "source";
        downloads_ = root_ / "downloads";
        fs::create_directories(source_);

        config_.node_id = "sender-node";
        config_.state_dir = root_ / "state";
        config_.download_dir = downloads_;
        config_.retry_backoff = 1ms;
        config_.negotiation_timeout = 2000ms;
        config_.stall_timeout = 2000ms;
        config_.compression = ferry::core::CompressionMode::Never;

        trust_ = std::make_unique<ferry::security::DefaultPeerTrust>(downloads_);
        pool_ = std::make_unique<ferry::core::ComputePool>(2);
        tap_ = std::make_shared<Tap>();

        TransferReceiver::Options options;
        options.capabilities.multiplexed = true;
        options.capabilities.simple_stream = true;
        receiver_security_ = receiver_security();
        receiver_ = std::make_unique<TransferReceiver>(*trust_, *receiver_security_, *pool_, options);
        network_.listen("peer", options.capabilities, receiver_->handler());
    }

    virtual std::shared_ptr<ferry::security::SecurityLayer> receiver_security() {
        return std::make_shared<ferry::security::PassthroughSecurity>();
    }

    virtual std::shared_ptr<ferry::security::SecurityLayer> sender_security() {
        return std::make_shared<TapSecurity>(tap_);
    }

    void TearDown() override {
        engine_.reset();
        receiver_->shutdown();
        network_.shutdown();
        receiver_.reset();
        if (!root_.empty()) {
            fs::remove_all(root_);
        }
    }

    TransferEngine& engine() {
        if (!engine_) {
            engine_ = std::make_unique<TransferEngine>(config_, sender_security());
        }
        return *engine_;
    }

    std::shared_ptr<LoopbackTransport> add_transport(TransportProtocol protocol) {
        auto transport = std::make_shared<LoopbackTransport>(network_, protocol);
        engine().register_transport(transport);
        return transport;
    }

    std::shared_ptr<TransferSession> send(const std::vector<fs::path>& paths,
                                          ferry::transfer::TransferOptions options = {}) {
        auto started = engine().start_transfer(TransferRequest{paths, "peer", options});
        EXPECT_TRUE(started.is_ok()) << started.error().to_string();
        return started.is_ok() ? started.value() : nullptr;
    }

    fs::path root_;
    fs::path source_;
    fs::path downloads_;
    ferry::core::EngineConfig config_;

    LoopbackNetwork network_;
    std::shared_ptr<ferry::security::SecurityLayer> receiver_security_;
    std::unique_ptr<ferry::security::DefaultPeerTrust> trust_;
    std::unique_ptr<ferry::core::ComputePool> pool_;
    std::unique_ptr<TransferReceiver> receiver_;
    std::shared_ptr<Tap> tap_;
    std::unique_ptr<TransferEngine> engine_;
};

TEST_F(TransferEngineTest, SendsSingleFile) {
    add_transport(TransportProtocol::SimpleStream);
    const auto content = random_bytes(150000, 1);
    write_file(source_ / "payload.bin", content);

    auto session = send({source_ / "payload.bin"});
    ASSERT_NE(session, nullptr);
    ASSERT_EQ(session->manifest().files.size(), 1u);
    EXPECT_EQ(session->manifest().files[0].chunk_count, 3u);

    ASSERT_EQ(session->wait(), TransferState::Completed) << describe(*session);
    EXPECT_EQ(read_file(downloads_ / "payload.bin"), content);

    const auto info = session->info();
    EXPECT_EQ(info.progress.bytes_transferred, 150000u);
    EXPECT_EQ(info.progress.files_completed, 1u);
    EXPECT_DOUBLE_EQ(info.progress.percentage(), 100.0);
    EXPECT_FALSE(info.resume_token.has_value());
    EXPECT_EQ(info.transport, TransportProtocol::SimpleStream);
    EXPECT_EQ(tap_->sequences(), (std::vector<std::uint64_t>{0, 1, 2}));
    EXPECT_TRUE(engine().get_active_transfers().empty());
}

TEST_F(TransferEngineTest, SendsDirectoryOverParallelStreams) {
    add_transport(TransportProtocol::SimpleStream);
    const auto big = random_bytes(5 * kChunkSize + 123, 2);
    const auto medium = random_bytes(kChunkSize + 7, 3);
    write_file(source_ / "album" / "big.bin", big);
    write_file(source_ / "album" / "raw" / "medium.bin", medium);
    write_file(source_ / "album" / "notes.txt", "hello");
    write_file(source_ / "album" / "raw" / "empty.bin", "");

    auto session = send({source_ / "album"});
    ASSERT_NE(session, nullptr);
    ASSERT_EQ(session->wait(), TransferState::Completed) << describe(*session);

    EXPECT_EQ(read_file(downloads_ / "album" / "big.bin"), big);
    EXPECT_EQ(read_file(downloads_ / "album" / "raw" / "medium.bin"), medium);
    EXPECT_EQ(read_file(downloads_ / "album" / "notes.txt"), "hello");
    ASSERT_TRUE(fs::exists(downloads_ / "album" / "raw" / "empty.bin"));
    EXPECT_EQ(fs::file_size(downloads_ / "album" / "raw" / "empty.bin"), 0u);
    EXPECT_FALSE(fs::exists(downloads_ / ".ferry-partial" / session->manifest().transfer_id));

    const auto info = session->info();
    EXPECT_EQ(info.progress.files_completed, 4u);
    EXPECT_GE(info.parallel_streams, 1u);
    EXPECT_LE(info.parallel_streams, 4u);
}

TEST_F(TransferEngineTest, ResumesAfterTransportFailure) {
    config_.max_parallel_streams = 1;
    auto transport = add_transport(TransportProtocol::SimpleStream);
    const auto content = random_bytes(5 * kChunkSize, 4);
    write_file(source_ / "movie.bin", content);

    // Capability query, offer and two chunks get through; the third chunk breaks the link.
    transport->fail_after_frames(4);

    auto first = send({source_ / "movie.bin"});
    ASSERT_NE(first, nullptr);
    ASSERT_EQ(first->wait(), TransferState::Failed);
    ASSERT_TRUE(first->error().has_value());
    EXPECT_EQ(first->error()->kind, ErrorKind::Transport);

    auto token = first->resume_token();
    ASSERT_TRUE(token.has_value());
    EXPECT_EQ(token->last_completed_file, 0);
    EXPECT_EQ(token->last_completed_chunk, 1);
    EXPECT_EQ(token->bytes_completed, 2 * kChunkSize);
    EXPECT_EQ(tap_->sequences(), (std::vector<std::uint64_t>{0, 1}));

    transport->heal();
    auto resumed = engine().resume_transfer(*token);
    ASSERT_TRUE(resumed.is_ok()) << resumed.error().to_string();
    ASSERT_EQ(resumed.value()->wait(), TransferState::Completed) << describe(*resumed.value());

    EXPECT_EQ(read_file(downloads_ / "movie.bin"), content);
    EXPECT_EQ(tap_->sequences(), (std::vector<std::uint64_t>{0, 1, 2, 3, 4}));
    EXPECT_FALSE(resumed.value()->resume_token().has_value());

    // The token was consumed by the first resume.
    auto again = engine().resume_transfer(*token);
    ASSERT_TRUE(again.is_error());
    EXPECT_EQ(again.error().kind, ErrorKind::Resume);
}

TEST_F(TransferEngineTest, FallsBackToNextTransport) {
    config_.max_parallel_streams = 1;
    auto multiplexed = add_transport(TransportProtocol::Multiplexed);
    auto simple = add_transport(TransportProtocol::SimpleStream);
    const auto content = random_bytes(5 * kChunkSize, 5);
    write_file(source_ / "movie.bin", content);

    std::mutex mutex;
    std::vector<ferry::events::TransportFallbackEvent> fallbacks;
    engine().events().subscribe<ferry::events::TransportFallbackEvent>(
        [&](const ferry::events::TransportFallbackEvent& event) {
            std::lock_guard lock(mutex);
            fallbacks.push_back(event);
        });

    // Capabilities are probed over the simple stream; the multiplexed link carries offer, chunk 0 and chunk 1.
    multiplexed->fail_after_frames(3);

    ferry::transfer::TransferOptions options;
    options.preferred_transport = TransportProtocol::Multiplexed;
    auto session = send({source_ / "movie.bin"}, options);
    ASSERT_NE(session, nullptr);
    ASSERT_EQ(session->wait(), TransferState::Completed) << describe(*session);

    EXPECT_EQ(read_file(downloads_ / "movie.bin"), content);
    EXPECT_EQ(tap_->sequences(), (std::vector<std::uint64_t>{0, 1, 2, 3, 4}));
    EXPECT_EQ(session->transport(), TransportProtocol::SimpleStream);
    EXPECT_TRUE(engine().negotiator().is_degraded("peer", TransportProtocol::Multiplexed));
    EXPECT_GT(simple->frames_sent(), 0u);

    std::lock_guard lock(mutex);
    ASSERT_EQ(fallbacks.size(), 1u);
    EXPECT_EQ(fallbacks[0].from, TransportProtocol::Multiplexed);
    EXPECT_EQ(fallbacks[0].to, TransportProtocol::SimpleStream);
    EXPECT_EQ(fallbacks[0].session_id, session->id());
}

TEST_F(TransferEngineTest, LargeFilesNegotiateMultiplexed) {
    add_transport(TransportProtocol::Multiplexed);
    add_transport(TransportProtocol::SimpleStream);

    auto large = engine().negotiator().negotiate("peer", 50ULL * 1024 * 1024);
    ASSERT_TRUE(large.is_ok()) << large.error().to_string();
    EXPECT_EQ(large.value(), TransportProtocol::Multiplexed);

    auto small = engine().negotiator().negotiate("peer", 1024 * 1024);
    ASSERT_TRUE(small.is_ok());
    EXPECT_EQ(small.value(), TransportProtocol::SimpleStream);
}

TEST_F(TransferEngineTest, RejectedSenderFailsWithoutToken) {
    add_transport(TransportProtocol::SimpleStream);
    trust_->deny("sender-node");
    write_file(source_ / "secret.bin", random_bytes(1000, 6));

    auto session = send({source_ / "secret.bin"});
    ASSERT_NE(session, nullptr);
    ASSERT_EQ(session->wait(), TransferState::Failed);
    ASSERT_TRUE(session->error().has_value());
    EXPECT_EQ(session->error()->kind, ErrorKind::Rejected);
    EXPECT_FALSE(session->resume_token().has_value());
    EXPECT_FALSE(fs::exists(downloads_ / "secret.bin"));
    EXPECT_TRUE(tap_->sequences().empty());
}

TEST_F(TransferEngineTest, RetransmitsCorruptedChunk) {
    config_.max_parallel_streams = 1;
    add_transport(TransportProtocol::SimpleStream);
    const auto content = random_bytes(3 * kChunkSize, 7);
    write_file(source_ / "photo.raw", content);
    tap_->corrupt_sequence = 1;

    std::mutex mutex;
    std::vector<ferry::events::ChunkRetransmittedEvent> retransmits;
    engine().events().subscribe<ferry::events::ChunkRetransmittedEvent>(
        [&](const ferry::events::ChunkRetransmittedEvent& event) {
            std::lock_guard lock(mutex);
            retransmits.push_back(event);
        });

    auto session = send({source_ / "photo.raw"});
    ASSERT_NE(session, nullptr);
    ASSERT_EQ(session->wait(), TransferState::Completed) << describe(*session);
    EXPECT_EQ(read_file(downloads_ / "photo.raw"), content);
    EXPECT_EQ(tap_->sequences(), (std::vector<std::uint64_t>{0, 1, 1, 2}));

    std::lock_guard lock(mutex);
    ASSERT_EQ(retransmits.size(), 1u);
    EXPECT_EQ(retransmits[0].sequence, 1u);
    EXPECT_EQ(retransmits[0].attempt, 1u);
}

TEST_F(TransferEngineTest, CompressesCompressibleData) {
    config_.compression = ferry::core::CompressionMode::Auto;
    add_transport(TransportProtocol::SimpleStream);
    std::string text;
    while (text.size() < 2 * 1024 * 1024) {
        text += "ferry moves files between peers and resumes where it stopped. ";
    }
    write_file(source_ / "log.txt", text);

    auto session = send({source_ / "log.txt"});
    ASSERT_NE(session, nullptr);
    ASSERT_EQ(session->wait(), TransferState::Completed) << describe(*session);
    EXPECT_EQ(session->compression_decision(), CompressionDecision::Enabled);
    EXPECT_EQ(read_file(downloads_ / "log.txt"), text);
}

TEST_F(TransferEngineTest, CancelStopsTransfer) {
    add_transport(TransportProtocol::SimpleStream);
    write_file(source_ / "slow.bin", random_bytes(8 * kChunkSize, 8));

    ferry::transfer::TransferOptions options;
    options.bandwidth_limit = 2 * kChunkSize;
    auto session = send({source_ / "slow.bin"}, options);
    ASSERT_NE(session, nullptr);
    ASSERT_TRUE(wait_for_state(session, TransferState::Transferring));

    ASSERT_TRUE(engine().cancel_transfer(session->id()).is_ok());
    EXPECT_EQ(session->wait(), TransferState::Cancelled);
    EXPECT_FALSE(session->resume_token().has_value());
    EXPECT_FALSE(session->error().has_value());

    auto again = engine().cancel_transfer(session->id());
    ASSERT_TRUE(again.is_error());
    EXPECT_EQ(again.error().kind, ErrorKind::State);
}

TEST_F(TransferEngineTest, ShutdownKeepsCheckpointForRestart) {
    config_.max_parallel_streams = 1;
    add_transport(TransportProtocol::SimpleStream);
    const auto content = random_bytes(8 * kChunkSize, 12);
    write_file(source_ / "slow.bin", content);

    ferry::transfer::TransferOptions options;
    options.bandwidth_limit = 2 * kChunkSize;
    auto session = send({source_ / "slow.bin"}, options);
    ASSERT_NE(session, nullptr);
    const auto deadline = std::chrono::steady_clock::now() + 5000ms;
    while (tap_->sequences().size() < 2 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(5ms);
    }
    ASSERT_GE(tap_->sequences().size(), 2u);

    engine().shutdown();
    ASSERT_EQ(session->state(), TransferState::Failed);
    ASSERT_TRUE(session->error().has_value());
    EXPECT_EQ(session->error()->kind, ErrorKind::Cancelled);
    auto token = session->resume_token();
    ASSERT_TRUE(token.has_value());
    EXPECT_GE(token->bytes_completed, 2 * kChunkSize);
    // No cancel notice reached the receiver, so its partial data survives.
    EXPECT_TRUE(receiver_->has_transfer(session->manifest().transfer_id));

    // A new engine over the same state directory picks the checkpoint up.
    engine_.reset();
    add_transport(TransportProtocol::SimpleStream);
    auto resumed = engine().resume_transfer(*token);
    ASSERT_TRUE(resumed.is_ok()) << resumed.error().to_string();
    ASSERT_EQ(resumed.value()->wait(), TransferState::Completed) << describe(*resumed.value());
    EXPECT_EQ(read_file(downloads_ / "slow.bin"), content);

    auto sent = tap_->sequences();
    std::sort(sent.begin(), sent.end());
    EXPECT_EQ(sent, (std::vector<std::uint64_t>{0, 1, 2, 3, 4, 5, 6, 7}));
}

TEST_F(TransferEngineTest, RefusesToWriteOutsideDownloadRoot) {
    add_transport(TransportProtocol::SimpleStream);
    const auto outside = root_ / "outside";
    fs::create_directories(outside);

    // A manifest whose file sits beneath a link entry never leaves the sender.
    ferry::transfer::TransferManifest crafted;
    crafted.transfer_id = "crafted-transfer";
    crafted.sender_id = "sender-node";
    ferry::transfer::FileEntry link;
    link.path = "link";
    link.kind = ferry::transfer::EntryKind::Symlink;
    link.link_target = outside.string();
    link.checksum = ferry::core::sha256(link.link_target);
    ferry::transfer::FileEntry nested;
    nested.path = "link/owned.txt";
    nested.size = 5;
    nested.chunk_count = 1;
    nested.checksum = ferry::core::sha256(std::string{"owned"});
    crafted.files = {link, nested};
    crafted.file_count = 2;
    crafted.total_size = 5;
    crafted.checksum = ferry::wire::manifest_digest(crafted);
    auto refused = engine().start_transfer(crafted, "peer", {});
    ASSERT_TRUE(refused.is_error());
    EXPECT_EQ(refused.error().kind, ErrorKind::Manifest);

    // A link already present in the download root is not followed either.
    write_file(source_ / "escape" / "owned.txt", "owned");
    fs::create_directories(downloads_);
    fs::create_directory_symlink(outside, downloads_ / "escape");

    auto session = send({source_ / "escape"});
    ASSERT_NE(session, nullptr);
    ASSERT_EQ(session->wait(), TransferState::Failed);
    ASSERT_TRUE(session->error().has_value());
    EXPECT_EQ(session->error()->kind, ErrorKind::Rejected);
    EXPECT_FALSE(fs::exists(outside / "owned.txt"));
    EXPECT_TRUE(tap_->sequences().empty());
}

TEST_F(TransferEngineTest, PausesAndResumes) {
    add_transport(TransportProtocol::SimpleStream);
    const auto content = random_bytes(8 * kChunkSize, 9);
    write_file(source_ / "slow.bin", content);

    ferry::transfer::TransferOptions options;
    options.bandwidth_limit = 2 * kChunkSize;
    auto session = send({source_ / "slow.bin"}, options);
    ASSERT_NE(session, nullptr);
    ASSERT_TRUE(wait_for_state(session, TransferState::Transferring));

    ASSERT_TRUE(engine().pause_transfer(session->id()).is_ok());
    EXPECT_EQ(session->state(), TransferState::Paused);
    EXPECT_TRUE(session->resume_token().has_value());

    auto paused_again = engine().pause_transfer(session->id());
    ASSERT_TRUE(paused_again.is_error());
    EXPECT_EQ(paused_again.error().kind, ErrorKind::State);

    ASSERT_TRUE(engine().set_bandwidth_limit(session->id(), std::nullopt).is_ok());
    ASSERT_TRUE(engine().resume_paused_transfer(session->id()).is_ok());
    ASSERT_EQ(session->wait(), TransferState::Completed) << describe(*session);
    EXPECT_EQ(read_file(downloads_ / "slow.bin"), content);
}

TEST_F(TransferEngineTest, ControlCallsValidateArguments) {
    add_transport(TransportProtocol::SimpleStream);
    write_file(source_ / "slow.bin", random_bytes(8 * kChunkSize, 10));

    auto unknown = engine().get_transfer("no-such-session");
    ASSERT_TRUE(unknown.is_error());
    EXPECT_EQ(unknown.error().kind, ErrorKind::State);
    EXPECT_EQ(engine().session("no-such-session"), nullptr);

    ferry::transfer::TransferOptions options;
    options.bandwidth_limit = 2 * kChunkSize;
    auto session = send({source_ / "slow.bin"}, options);
    ASSERT_NE(session, nullptr);

    auto zero = engine().set_bandwidth_limit(session->id(), 0);
    ASSERT_TRUE(zero.is_error());
    EXPECT_EQ(zero.error().kind, ErrorKind::Config);

    auto info = engine().get_transfer(session->id());
    ASSERT_TRUE(info.is_ok());
    EXPECT_EQ(info.value().peer_id, "peer");
    EXPECT_EQ(info.value().transfer_id, session->manifest().transfer_id);

    ASSERT_TRUE(engine().cancel_transfer(session->id()).is_ok());
    session->wait();
}

TEST_F(TransferEngineTest, MissingSourceFailsToStart) {
    add_transport(TransportProtocol::SimpleStream);
    auto started = engine().start_transfer(TransferRequest{{source_ / "missing.bin"}, "peer", {}});
    ASSERT_TRUE(started.is_error());
    EXPECT_EQ(started.error().kind, ErrorKind::Manifest);
}

TEST_F(TransferEngineTest, UnreachablePeerFails) {
    add_transport(TransportProtocol::SimpleStream);
    write_file(source_ / "a.bin", "abc");

    auto started = engine().start_transfer(TransferRequest{{source_ / "a.bin"}, "nobody", {}});
    ASSERT_TRUE(started.is_ok());
    ASSERT_EQ(started.value()->wait(), TransferState::Failed);
    ASSERT_TRUE(started.value()->error().has_value());
    EXPECT_EQ(started.value()->error()->kind, ErrorKind::Transport);
}

class SealedTransferTest : public TransferEngineTest {
protected:
    std::shared_ptr<ferry::security::SecurityLayer> receiver_security() override {
        return std::make_shared<XorSecurity>(0x5A, receiver_counts_);
    }

    std::shared_ptr<ferry::security::SecurityLayer> sender_security() override {
        return std::make_shared<XorSecurity>(0x5A, sender_counts_);
    }

    std::shared_ptr<XorCounts> sender_counts_ = std::make_shared<XorCounts>();
    std::shared_ptr<XorCounts> receiver_counts_ = std::make_shared<XorCounts>();
};

TEST_F(SealedTransferTest, TransfersThroughScramblingLayerOnBothEnds) {
    add_transport(TransportProtocol::SimpleStream);
    const auto big = random_bytes(4 * kChunkSize + 99, 13);
    const auto small = random_bytes(1234, 14);
    write_file(source_ / "pack" / "big.bin", big);
    write_file(source_ / "pack" / "small.bin", small);

    auto session = send({source_ / "pack"});
    ASSERT_NE(session, nullptr);
    ASSERT_EQ(session->wait(), TransferState::Completed) << describe(*session);

    EXPECT_EQ(read_file(downloads_ / "pack" / "big.bin"), big);
    EXPECT_EQ(read_file(downloads_ / "pack" / "small.bin"), small);
    EXPECT_GT(sender_counts_->sealed.load(), 0u);
    EXPECT_GT(sender_counts_->opened.load(), 0u);
    EXPECT_GT(receiver_counts_->sealed.load(), 0u);
    EXPECT_GT(receiver_counts_->opened.load(), 0u);
}

TEST_F(SealedTransferTest, MismatchedKeysFailTheTransfer) {
    engine_ = std::make_unique<TransferEngine>(config_, std::make_shared<XorSecurity>(0x33, sender_counts_));
    add_transport(TransportProtocol::SimpleStream);
    write_file(source_ / "note.txt", "not for the wrong key");

    auto session = send({source_ / "note.txt"});
    ASSERT_NE(session, nullptr);
    ASSERT_EQ(session->wait(), TransferState::Failed);
    EXPECT_FALSE(fs::exists(downloads_ / "note.txt"));
}
