/**
 * @file transfer_bridge.cpp
 * @brief Runs the transfer engine behind a JSON-lines channel
 *
 * stdin   inbound replies and commands, one JSON object per line
 * stdout  outbound events and command results, one JSON object per line
 * stderr  logs
 *
 * Run with:
 *   ./build/cirrus_transfer_bridge [config.json]
 *
 * Try:
 *   echo '{"type":"health"}' | ./build/cirrus_transfer_bridge
 *
 * With admin_port set in the configuration:
 *   curl http://127.0.0.1:<port>/status
 *   curl -X POST http://127.0.0.1:<port>/maintenance/cleanup-stuck
 */

#include "cirrus/core/config.hpp"
#include "cirrus/core/platform.hpp"
#include "cirrus/events/components.hpp"
#include "cirrus/events/event_bus.hpp"
#include "cirrus/events/event_queue.hpp"
#include "cirrus/network/admin_server.hpp"
#include "cirrus/network/curl_upload_client.hpp"
#include "cirrus/transfer/engine.hpp"
#include "cirrus/transfer/protocol.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <iostream>
#include <memory>
#include <string>
#include <thread>

using namespace cirrus;
using cirrus::events::EventBus;
using cirrus::events::ThreadSafeQueue;
namespace protocol = cirrus::transfer::protocol;

namespace {

// Every outbound event goes through the single writer so lines never interleave
template<typename EventType>
void forward_to_stdout(EventBus& bus, ThreadSafeQueue<std::string>& lines) {
    bus.subscribe<EventType>([&lines](const EventType& event) {
        lines.push(protocol::encode(event).dump());
    });
}

void configure_logging(const std::string& level) {
    auto logger = spdlog::stderr_color_mt("cirrus");
    spdlog::set_default_logger(logger);
    spdlog::set_level(spdlog::level::from_str(level));
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");
}

} // namespace

int main(int argc, char* argv[]) {
    EngineConfig config;
    std::string config_error;
    if (argc > 1) {
        auto loaded = load_engine_config(argv[1]);
        if (loaded.is_ok()) {
            config = loaded.value();
        } else {
            config_error = loaded.error();
        }
    }

    configure_logging(config.log_level);
    if (!config_error.empty()) {
        spdlog::error("{}", config_error);
        return 1;
    }

    spdlog::info("════════════════════════════════════════════");
    spdlog::info("cirrus transfer bridge {} on {}", CIRRUS_VERSION, platform_name());
    spdlog::info("════════════════════════════════════════════");

    EventBus bus;
    events::LoggerComponent logger(bus);
    events::MetricsComponent metrics(bus);

    // ════════════════════════════════════════════════════════════
    // Outbound channel: stdout writer
    // ════════════════════════════════════════════════════════════

    ThreadSafeQueue<std::string> lines;
    forward_to_stdout<events::InitFileUploadRequested>(bus, lines);
    forward_to_stdout<events::CreateFolderRequested>(bus, lines);
    forward_to_stdout<events::BlockCompleted>(bus, lines);
    forward_to_stdout<events::ThumbnailCompleted>(bus, lines);
    forward_to_stdout<events::FinalizeTransferRequested>(bus, lines);
    forward_to_stdout<events::TransferProgressed>(bus, lines);
    forward_to_stdout<events::TransferFinished>(bus, lines);
    forward_to_stdout<events::TransferRejected>(bus, lines);

    std::thread writer([&lines]() {
        while (auto line = lines.pop()) {
            std::cout << *line << '\n' << std::flush;
        }
    });

    // ════════════════════════════════════════════════════════════
    // Engine and optional admin endpoint
    // ════════════════════════════════════════════════════════════

    network::CurlUploadClient uploader;
    transfer::TransferEngine engine(config, bus, uploader);
    engine.start();

    std::unique_ptr<network::AdminServer> admin;
    if (config.admin_port != 0) {
        try {
            admin = std::make_unique<network::AdminServer>(engine, config.admin_port);
            admin->start();
        } catch (const boost::system::system_error& e) {
            spdlog::error("[Admin] failed to bind port {}: {}", config.admin_port, e.what());
        }
    }

    // ════════════════════════════════════════════════════════════
    // Inbound channel: stdin reader
    // ════════════════════════════════════════════════════════════

    protocol::MessageDispatcher dispatcher(engine);
    std::string line;
    while (std::getline(std::cin, line)) {
        if (line.empty()) {
            continue;
        }
        auto result = dispatcher.dispatch_line(line);
        if (result.is_error()) {
            spdlog::warn("[Inbound] rejected: {}", result.error());
            lines.push(protocol::command_result("error", {{"error", result.error()}}).dump());
            continue;
        }
        if (result.value().has_value()) {
            lines.push(result.value()->dump());
        }
    }

    spdlog::info("stdin closed, shutting down");
    if (admin) {
        admin->stop();
    }
    engine.stop();
    metrics.print_stats();

    lines.shutdown();
    writer.join();
    return 0;
}
