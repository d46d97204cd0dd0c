#include "ferry/transport/tcp_transport.hpp"

#include <spdlog/spdlog.h>

#include <array>

namespace ferry::transport {

namespace {

/// Hands a listener-owned stream to a handler while the listener keeps a weak reference.
class SharedStream : public Stream {
public:
    explicit SharedStream(std::shared_ptr<TcpStream> inner) : inner_(std::move(inner)) {}

    ferry::Result<void> send(const std::vector<std::uint8_t>& frame) override { return inner_->send(frame); }

    ferry::Result<std::vector<std::uint8_t>> recv(std::optional<std::chrono::milliseconds> timeout) override {
        return inner_->recv(timeout);
    }

    void close() override { inner_->close(); }

    [[nodiscard]] TransportProtocol protocol() const noexcept override { return inner_->protocol(); }

private:
    std::shared_ptr<TcpStream> inner_;
};

} // namespace

// ──────────────────────────────────────────────────────────
// TcpStream
// ──────────────────────────────────────────────────────────

TcpStream::TcpStream() : socket_(io_) {}

TcpStream::~TcpStream() {
    closed_ = true;
    boost::system::error_code ec;
    socket_.shutdown(tcp::socket::shutdown_both, ec);
    socket_.close(ec);
}

bool TcpStream::run(const std::atomic<bool>& done, std::optional<std::chrono::milliseconds> timeout) {
    io_.restart();
    if (timeout) {
        const auto deadline = std::chrono::steady_clock::now() + *timeout;
        while (!done && std::chrono::steady_clock::now() < deadline && !io_.stopped()) {
            io_.run_one_until(deadline);
        }
    } else {
        while (!done && !io_.stopped()) {
            io_.run_one();
        }
    }

    if (done) {
        return true;
    }

    boost::system::error_code ec;
    socket_.cancel(ec);
    io_.restart();
    while (!done && io_.run_one() > 0) {
    }
    return false;
}

ferry::Result<void> TcpStream::connect(const std::string& host, std::uint16_t port,
                                       std::chrono::milliseconds timeout) {
    boost::system::error_code ec;
    tcp::resolver resolver(io_);
    const auto endpoints = resolver.resolve(host, std::to_string(port), ec);
    if (ec) {
        return ferry::Err<void>(ferry::Error::transport("cannot resolve " + host + ": " + ec.message()));
    }

    std::atomic<bool> done{false};
    boost::system::error_code result;
    asio::async_connect(socket_, endpoints,
                        [&](const boost::system::error_code& error, const tcp::endpoint&) {
                            result = error;
                            done = true;
                        });

    if (!run(done, timeout)) {
        return ferry::Err<void>(ferry::Error::transport("connect to " + host + " timed out"));
    }
    if (result) {
        return ferry::Err<void>(ferry::Error::transport("connect to " + host + " failed: " + result.message()));
    }
    socket_.set_option(tcp::no_delay(true), ec);
    spdlog::debug("Connected to {}:{}", host, port);
    return ferry::Ok();
}

ferry::Result<void> TcpStream::send(const std::vector<std::uint8_t>& frame) {
    if (closed_) {
        return ferry::Err<void>(ferry::Error::transport("stream closed"));
    }
    if (frame.size() > kMaxFrameSize) {
        return ferry::Err<void>(ferry::Error::protocol("frame exceeds maximum size"));
    }

    const auto length = static_cast<std::uint32_t>(frame.size());
    const std::array<std::uint8_t, 4> header{
        static_cast<std::uint8_t>(length >> 24), static_cast<std::uint8_t>(length >> 16),
        static_cast<std::uint8_t>(length >> 8), static_cast<std::uint8_t>(length)};
    const std::array<asio::const_buffer, 2> buffers{asio::buffer(header), asio::buffer(frame)};

    std::atomic<bool> done{false};
    boost::system::error_code result;
    asio::async_write(socket_, buffers, [&](const boost::system::error_code& error, std::size_t) {
        result = error;
        done = true;
    });

    run(done, std::nullopt);
    if (result) {
        return ferry::Err<void>(ferry::Error::transport("send failed: " + result.message()));
    }
    return ferry::Ok();
}

ferry::Result<std::vector<std::uint8_t>> TcpStream::recv(std::optional<std::chrono::milliseconds> timeout) {
    using Bytes = std::vector<std::uint8_t>;
    if (closed_) {
        return ferry::Err<Bytes>(ferry::Error::transport("stream closed"));
    }

    std::array<std::uint8_t, 4> header{};
    Bytes body;
    std::atomic<bool> done{false};
    boost::system::error_code result;

    asio::async_read(socket_, asio::buffer(header), [&](const boost::system::error_code& error, std::size_t) {
        if (error) {
            result = error;
            done = true;
            return;
        }
        const std::uint32_t length = (static_cast<std::uint32_t>(header[0]) << 24) |
                                     (static_cast<std::uint32_t>(header[1]) << 16) |
                                     (static_cast<std::uint32_t>(header[2]) << 8) |
                                     static_cast<std::uint32_t>(header[3]);
        if (length > kMaxFrameSize) {
            result = asio::error::message_size;
            done = true;
            return;
        }
        body.resize(length);
        asio::async_read(socket_, asio::buffer(body), [&](const boost::system::error_code& body_error, std::size_t) {
            result = body_error;
            done = true;
        });
    });

    if (!run(done, timeout)) {
        return ferry::Err<Bytes>(ferry::Error::transport("receive timed out"));
    }
    if (result) {
        return ferry::Err<Bytes>(ferry::Error::transport(
            result == asio::error::eof ? std::string("stream closed") : "receive failed: " + result.message()));
    }
    return ferry::Ok(std::move(body));
}

void TcpStream::close() {
    if (closed_.exchange(true)) {
        return;
    }
    asio::post(io_, [this]() {
        boost::system::error_code ec;
        socket_.shutdown(tcp::socket::shutdown_both, ec);
        socket_.close(ec);
    });
}

// ──────────────────────────────────────────────────────────
// TcpListener
// ──────────────────────────────────────────────────────────

TcpListener::TcpListener(std::uint16_t port, StreamHandler handler)
    : acceptor_(io_, tcp::endpoint(tcp::v4(), port)),
      handler_(std::move(handler)),
      port_(acceptor_.local_endpoint().port()) {
    spdlog::info("Transfer listener bound to port {}", port_);
}

TcpListener::~TcpListener() {
    stop();
}

void TcpListener::start() {
    do_accept();
    accept_thread_ = std::thread([this]() { io_.run(); });
}

void TcpListener::do_accept() {
    auto stream = std::make_shared<TcpStream>();
    acceptor_.async_accept(stream->socket(), [this, stream](boost::system::error_code ec) {
        if (ec == asio::error::operation_aborted) {
            return;
        }
        if (ec) {
            spdlog::error("Accept error: {}", ec.message());
        } else {
            spdlog::debug("Accepted transfer connection");
            std::lock_guard lock(mutex_);
            if (stopped_) {
                return;
            }
            live_streams_.push_back(stream);
            workers_.emplace_back([handler = handler_, stream]() {
                handler(std::make_unique<SharedStream>(stream));
            });
        }
        do_accept();
    });
}

void TcpListener::stop() {
    std::vector<std::thread> workers;
    {
        std::lock_guard lock(mutex_);
        if (stopped_) {
            return;
        }
        stopped_ = true;
        for (auto& weak : live_streams_) {
            if (auto stream = weak.lock()) {
                stream->close();
            }
        }
        live_streams_.clear();
        workers.swap(workers_);
    }

    asio::post(io_, [this]() {
        boost::system::error_code ec;
        acceptor_.close(ec);
    });
    if (accept_thread_.joinable()) {
        accept_thread_.join();
    }
    for (auto& worker : workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

// ──────────────────────────────────────────────────────────
// TcpTransport
// ──────────────────────────────────────────────────────────

TcpTransport::TcpTransport(std::chrono::milliseconds connect_timeout) : connect_timeout_(connect_timeout) {}

void TcpTransport::add_peer(const std::string& peer_id, std::string host, std::uint16_t port) {
    std::lock_guard lock(mutex_);
    peers_[peer_id] = Endpoint{std::move(host), port};
}

ferry::Result<TransportCapabilities> TcpTransport::query_capabilities(const std::string& peer_id,
                                                                      std::chrono::milliseconds timeout) {
    return probe_capabilities(*this, peer_id, timeout);
}

ferry::Result<std::unique_ptr<Stream>> TcpTransport::open_stream(const std::string& peer_id) {
    Endpoint endpoint;
    {
        std::lock_guard lock(mutex_);
        auto it = peers_.find(peer_id);
        if (it == peers_.end()) {
            return ferry::Err<std::unique_ptr<Stream>>(ferry::Error::transport("unknown TCP peer " + peer_id));
        }
        endpoint = it->second;
    }

    auto stream = std::make_unique<TcpStream>();
    if (auto res = stream->connect(endpoint.host, endpoint.port, connect_timeout_); res.is_error()) {
        return ferry::Err<std::unique_ptr<Stream>>(res.error());
    }
    return ferry::Ok<std::unique_ptr<Stream>>(std::move(stream));
}

} // namespace ferry::transport
