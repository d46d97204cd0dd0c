#pragma once

#include "ferry/transport/transport.hpp"

#include <boost/asio.hpp>

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace ferry::transport {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

constexpr std::uint32_t kMaxFrameSize = 16 * 1024 * 1024;

/**
 * @brief Length-prefixed frame stream over one TCP connection
 *
 * Frames travel as [u32 big-endian length][bytes]. Each stream runs its own
 * io_context so a timed recv() is a bounded run_for() of pending async
 * operations; close() is posted onto that context and aborts them.
 */
class TcpStream : public Stream {
public:
    TcpStream();
    ~TcpStream() override;

    ferry::Result<void> connect(const std::string& host, std::uint16_t port, std::chrono::milliseconds timeout);

    ferry::Result<void> send(const std::vector<std::uint8_t>& frame) override;
    ferry::Result<std::vector<std::uint8_t>> recv(std::optional<std::chrono::milliseconds> timeout) override;
    void close() override;

    [[nodiscard]] TransportProtocol protocol() const noexcept override { return TransportProtocol::SimpleStream; }

    tcp::socket& socket() noexcept { return socket_; }

private:
    /// Runs the context until `done` or timeout; cancels outstanding work on timeout.
    bool run(const std::atomic<bool>& done, std::optional<std::chrono::milliseconds> timeout);

    asio::io_context io_;
    tcp::socket socket_;
    std::atomic<bool> closed_{false};
};

/**
 * @brief Accepts inbound TCP connections and hands each to a StreamHandler
 *
 * Accepting runs on a dedicated thread; every connection gets its own
 * handler thread. stop() closes the acceptor and all live streams.
 */
class TcpListener {
public:
    TcpListener(std::uint16_t port, StreamHandler handler);
    ~TcpListener();

    TcpListener(const TcpListener&) = delete;
    TcpListener& operator=(const TcpListener&) = delete;

    void start();
    void stop();

    /// Actual bound port (useful when constructed with port 0).
    [[nodiscard]] std::uint16_t port() const noexcept { return port_; }

private:
    void do_accept();

    asio::io_context io_;
    tcp::acceptor acceptor_;
    StreamHandler handler_;
    std::uint16_t port_;
    std::thread accept_thread_;

    std::mutex mutex_;
    std::vector<std::thread> workers_;
    std::vector<std::weak_ptr<TcpStream>> live_streams_;
    bool stopped_ = false;
};

/// Simple-stream transport dialing peers registered with add_peer().
class TcpTransport : public Transport {
public:
    explicit TcpTransport(std::chrono::milliseconds connect_timeout = std::chrono::milliseconds{5000});

    void add_peer(const std::string& peer_id, std::string host, std::uint16_t port);

    [[nodiscard]] TransportProtocol protocol() const noexcept override { return TransportProtocol::SimpleStream; }

    ferry::Result<TransportCapabilities> query_capabilities(const std::string& peer_id,
                                                            std::chrono::milliseconds timeout) override;

    ferry::Result<std::unique_ptr<Stream>> open_stream(const std::string& peer_id) override;

private:
    struct Endpoint {
        std::string host;
        std::uint16_t port = 0;
    };

    std::chrono::milliseconds connect_timeout_;
    std::mutex mutex_;
    std::map<std::string, Endpoint> peers_;
};

} // namespace ferry::transport
