#include "ferry/transport/loopback.hpp"

#include "ferry/events/event_queue.hpp"

#include <spdlog/spdlog.h>

namespace ferry::transport {
namespace detail {

struct Channel {
    events::ThreadSafeQueue<std::vector<std::uint8_t>> to_listener;
    events::ThreadSafeQueue<std::vector<std::uint8_t>> to_dialer;

    void close() {
        to_listener.shutdown();
        to_dialer.shutdown();
    }
};

struct FaultState {
    std::mutex mutex;
    std::optional<std::uint64_t> budget;  ///< frames still allowed before tripping
    std::uint64_t frames_sent = 0;
    bool tripped = false;
    std::vector<std::weak_ptr<Channel>> channels;

    bool is_tripped() {
        std::lock_guard lock(mutex);
        return tripped;
    }

    /// Accounts one outgoing frame; false when the transport is (now) broken.
    bool on_send() {
        std::vector<std::shared_ptr<Channel>> to_close;
        {
            std::lock_guard lock(mutex);
            if (tripped) {
                return false;
            }
            if (!budget || *budget > 0) {
                if (budget) {
                    --*budget;
                }
                ++frames_sent;
                return true;
            }
            tripped = true;
            for (auto& weak : channels) {
                if (auto channel = weak.lock()) {
                    to_close.push_back(std::move(channel));
                }
            }
            channels.clear();
        }
        for (auto& channel : to_close) {
            channel->close();
        }
        return false;
    }

    void track(const std::shared_ptr<Channel>& channel) {
        std::lock_guard lock(mutex);
        channels.push_back(channel);
    }
};

} // namespace detail

namespace {

class LoopbackStream : public Stream {
public:
    LoopbackStream(std::shared_ptr<detail::Channel> channel, bool dialer, TransportProtocol protocol,
                   std::shared_ptr<detail::FaultState> fault)
        : channel_(std::move(channel)), dialer_(dialer), protocol_(protocol), fault_(std::move(fault)) {}

    ~LoopbackStream() override { close(); }

    ferry::Result<void> send(const std::vector<std::uint8_t>& frame) override {
        if (fault_ && !fault_->on_send()) {
            return ferry::Err<void>(ferry::Error::transport(std::string("injected failure on ") + to_string(protocol_)));
        }
        auto& out = dialer_ ? channel_->to_listener : channel_->to_dialer;
        if (!out.push(frame)) {
            return ferry::Err<void>(ferry::Error::transport("stream closed"));
        }
        return ferry::Ok();
    }

    ferry::Result<std::vector<std::uint8_t>> recv(std::optional<std::chrono::milliseconds> timeout) override {
        if (fault_ && fault_->is_tripped()) {
            return ferry::Err<std::vector<std::uint8_t>>(
                ferry::Error::transport(std::string("injected failure on ") + to_string(protocol_)));
        }
        auto& in = dialer_ ? channel_->to_dialer : channel_->to_listener;
        auto frame = timeout ? in.pop_for(*timeout) : in.pop();
        if (!frame) {
            return ferry::Err<std::vector<std::uint8_t>>(
                ferry::Error::transport(in.is_shutdown() ? "stream closed" : "receive timed out"));
        }
        return ferry::Ok(std::move(*frame));
    }

    void close() override { channel_->close(); }

    [[nodiscard]] TransportProtocol protocol() const noexcept override { return protocol_; }

private:
    std::shared_ptr<detail::Channel> channel_;
    bool dialer_;
    TransportProtocol protocol_;
    std::shared_ptr<detail::FaultState> fault_;
};

} // namespace

LoopbackNetwork::~LoopbackNetwork() {
    shutdown();
}

void LoopbackNetwork::listen(const std::string& peer_id, TransportCapabilities capabilities, StreamHandler handler) {
    std::lock_guard lock(mutex_);
    listeners_[peer_id] = Listener{capabilities, std::move(handler)};
}

void LoopbackNetwork::unlisten(const std::string& peer_id) {
    std::lock_guard lock(mutex_);
    listeners_.erase(peer_id);
}

ferry::Result<std::unique_ptr<Stream>> LoopbackNetwork::connect(const std::string& peer_id, TransportProtocol protocol,
                                                                 const std::shared_ptr<detail::FaultState>& fault) {
    std::lock_guard lock(mutex_);
    if (shut_down_) {
        return ferry::Err<std::unique_ptr<Stream>>(ferry::Error::transport("loopback network is shut down"));
    }
    auto it = listeners_.find(peer_id);
    if (it == listeners_.end() || !it->second.capabilities.supports(protocol)) {
        return ferry::Err<std::unique_ptr<Stream>>(ferry::Error::transport(
            "peer " + peer_id + " unreachable over " + to_string(protocol)));
    }

    auto channel = std::make_shared<detail::Channel>();
    channels_.push_back(channel);
    if (fault) {
        fault->track(channel);
    }

    std::unique_ptr<Stream> listener_end = std::make_unique<LoopbackStream>(channel, false, protocol, nullptr);
    workers_.emplace_back([handler = it->second.handler, stream = std::move(listener_end)]() mutable {
        handler(std::move(stream));
    });
    ++connections_;

    return ferry::Ok<std::unique_ptr<Stream>>(std::make_unique<LoopbackStream>(channel, true, protocol, fault));
}

void LoopbackNetwork::shutdown() {
    std::vector<std::thread> workers;
    {
        std::lock_guard lock(mutex_);
        shut_down_ = true;
        for (auto& weak : channels_) {
            if (auto channel = weak.lock()) {
                channel->close();
            }
        }
        channels_.clear();
        workers.swap(workers_);
    }
    for (auto& worker : workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    if (!workers.empty()) {
        spdlog::debug("Loopback network joined {} connection handlers", workers.size());
    }
}

LoopbackTransport::LoopbackTransport(LoopbackNetwork& network, TransportProtocol protocol)
    : network_(network), protocol_(protocol), fault_(std::make_shared<detail::FaultState>()) {}

ferry::Result<TransportCapabilities> LoopbackTransport::query_capabilities(const std::string& peer_id,
                                                                           std::chrono::milliseconds timeout) {
    return probe_capabilities(*this, peer_id, timeout);
}

ferry::Result<std::unique_ptr<Stream>> LoopbackTransport::open_stream(const std::string& peer_id) {
    if (fault_->is_tripped()) {
        return ferry::Err<std::unique_ptr<Stream>>(
            ferry::Error::transport(std::string("injected failure on ") + to_string(protocol_)));
    }
    return network_.connect(peer_id, protocol_, fault_);
}

void LoopbackTransport::fail_after_frames(std::uint64_t frames) {
    std::lock_guard lock(fault_->mutex);
    fault_->budget = frames;
}

void LoopbackTransport::fail_now() {
    fail_after_frames(0);
    fault_->on_send();
}

void LoopbackTransport::heal() {
    std::lock_guard lock(fault_->mutex);
    fault_->budget.reset();
    fault_->tripped = false;
}

std::uint64_t LoopbackTransport::frames_sent() const {
    std::lock_guard lock(fault_->mutex);
    return fault_->frames_sent;
}

bool LoopbackTransport::failed() const {
    std::lock_guard lock(fault_->mutex);
    return fault_->tripped;
}

} // namespace ferry::transport
