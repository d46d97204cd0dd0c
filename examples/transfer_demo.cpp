#include "ferry/core/compute_pool.hpp"
#include "ferry/core/config.hpp"
#include "ferry/core/logging.hpp"
#include "ferry/events/components.hpp"
#include "ferry/events/event_stream.hpp"
#include "ferry/security/peer_trust.hpp"
#include "ferry/security/security_layer.hpp"
#include "ferry/transfer/engine.hpp"
#include "ferry/transfer/receiver.hpp"
#include "ferry/transport/loopback.hpp"
#include "ferry/transport/tcp_transport.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <variant>
#include <vector>

namespace fs = std::filesystem;
using namespace ferry;

namespace {

std::atomic<bool> g_stop{false};

void on_signal(int) {
    g_stop = true;
}

void usage() {
    std::cout << "Usage:\n"
              << "  ferry_demo [--config FILE] loopback <download-dir> <path>...\n"
              << "  ferry_demo [--config FILE] receive <port> <download-dir>\n"
              << "  ferry_demo [--config FILE] send <host> <port> <path>...\n";
}

void print_progress(const events::StreamEvent& event) {
    if (auto* progress = std::get_if<events::TransferProgressEvent>(&event)) {
        const auto& p = progress->progress;
        std::cout << "\r  " << p.bytes_transferred << "/" << p.total_bytes << " bytes ("
                  << static_cast<int>(p.percentage()) << "%), " << p.files_completed << "/" << p.total_files
                  << " files, " << static_cast<std::uint64_t>(p.current_speed) << " B/s" << std::flush;
    } else if (auto* changed = std::get_if<events::TransferStateChangedEvent>(&event)) {
        std::cout << "\n  state: " << transfer::to_string(changed->to);
        if (changed->error) {
            std::cout << " (" << changed->error->to_string() << ")";
        }
        std::cout << std::endl;
    }
}

int drive(transfer::TransferEngine& engine, const transfer::TransferRequest& request) {
    events::EventStream stream(engine.events());

    auto session = engine.start_transfer(request);
    if (session.is_error()) {
        spdlog::error("Cannot start transfer: {}", session.error().to_string());
        return 1;
    }

    while (!session.value()->wait_for(std::chrono::milliseconds{200})) {
        if (g_stop) {
            if (auto cancelled = session.value()->cancel(); cancelled.is_error()) {
                spdlog::warn("{}", cancelled.error().to_string());
            }
        }
        while (auto event = stream.try_next()) {
            print_progress(*event);
        }
    }
    while (auto event = stream.try_next()) {
        print_progress(*event);
    }

    const auto info = session.value()->info();
    if (info.state != transfer::TransferState::Completed) {
        if (info.resume_token) {
            std::cout << "Resume token kept for transfer " << info.resume_token->transfer_id << std::endl;
        }
        return 1;
    }
    return 0;
}

int run_loopback(const core::EngineConfig& config, const fs::path& download_dir, const std::vector<fs::path>& paths) {
    transport::LoopbackNetwork network;
    core::ComputePool receiver_pool(config.compute_threads);
    security::PassthroughSecurity security;
    security::DefaultPeerTrust trust(download_dir);

    transfer::TransferReceiver::Options options;
    options.reorder_window = config.reorder_window;
    options.capabilities.multiplexed = true;
    options.capabilities.simple_stream = true;
    transfer::TransferReceiver receiver(trust, security, receiver_pool, options);
    network.listen("local", options.capabilities, receiver.handler());

    int status = 0;
    {
        transfer::TransferEngine engine(config);
        events::LoggerComponent logger(engine.events());
        events::MetricsComponent metrics(engine.events());
        engine.register_transport(
            std::make_shared<transport::LoopbackTransport>(network, transport::TransportProtocol::Multiplexed));
        engine.register_transport(
            std::make_shared<transport::LoopbackTransport>(network, transport::TransportProtocol::SimpleStream));

        status = drive(engine, transfer::TransferRequest{paths, "local", {}});
        metrics.print_stats();
        engine.shutdown();
    }

    receiver.shutdown();
    network.shutdown();
    return status;
}

int run_receive(const core::EngineConfig& config, std::uint16_t port, const fs::path& download_dir) {
    core::ComputePool pool(config.compute_threads);
    security::PassthroughSecurity security;
    security::DefaultPeerTrust trust(download_dir);
    events::EventBus bus;
    events::LoggerComponent logger(bus);

    transfer::TransferReceiver::Options options;
    options.reorder_window = config.reorder_window;
    options.capabilities.max_parallel_streams = config.max_parallel_streams;
    transfer::TransferReceiver receiver(trust, security, pool, options, &bus);

    transport::TcpListener listener(port, receiver.handler());
    listener.start();
    spdlog::info("Receiving into {} on port {}", download_dir.string(), listener.port());

    while (!g_stop) {
        std::this_thread::sleep_for(std::chrono::milliseconds{200});
    }
    receiver.shutdown();
    listener.stop();
    return 0;
}

int run_send(const core::EngineConfig& config, const std::string& host, std::uint16_t port,
             const std::vector<fs::path>& paths) {
    auto tcp = std::make_shared<transport::TcpTransport>(config.negotiation_timeout);
    tcp->add_peer("remote", host, port);

    transfer::TransferEngine engine(config);
    events::LoggerComponent logger(engine.events());
    events::MetricsComponent metrics(engine.events());
    engine.register_transport(tcp);

    const int status = drive(engine, transfer::TransferRequest{paths, "remote", {}});
    metrics.print_stats();
    return status;
}

} // namespace

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);

    core::EngineConfig config;
    if (args.size() >= 2 && args[0] == "--config") {
        auto loaded = core::load_config(args[1]);
        if (loaded.is_error()) {
            std::cerr << loaded.error().to_string() << std::endl;
            return 1;
        }
        config = loaded.value();
        args.erase(args.begin(), args.begin() + 2);
    }
    if (auto configured = core::configure_logging(config); configured.is_error()) {
        std::cerr << configured.error().to_string() << std::endl;
        return 1;
    }

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    if (args.size() >= 3 && args[0] == "loopback") {
        return run_loopback(config, args[1], std::vector<fs::path>(args.begin() + 2, args.end()));
    }
    if (args.size() == 3 && args[0] == "receive") {
        return run_receive(config, static_cast<std::uint16_t>(std::stoi(args[1])), args[2]);
    }
    if (args.size() >= 4 && args[0] == "send") {
        return run_send(config, args[1], static_cast<std::uint16_t>(std::stoi(args[2])),
                        std::vector<fs::path>(args.begin() + 3, args.end()));
    }
    usage();
    return 1;
}
