// ─────────────────────────────────────────────────────────────────────────────
// lensbridge-server - REST bridge for the HuskyLens2 tool server
// ─────────────────────────────────────────────────────────────────────────────
// Keeps one session open against the camera and exposes it as plain HTTP.
//
// Usage:
//   lensbridge-server --upstream-url http://192.168.1.161:3000
//   lensbridge-server --host 0.0.0.0 --port 9000 --debug --log-file bridge.log
//
// Then:
//   curl http://localhost:8080/health
//   curl -X POST http://localhost:8080/call -H 'Content-Type: application/json' \
//        -d '{"tool":"Huskylens2:get_recognition_result","arguments":{"operation":"get_result"}}'

#include <cxxopts.hpp>
#include <spdlog/spdlog.h>

#include "lensbridge/client/session_client.hpp"
#include "lensbridge/log/logger.hpp"
#include "lensbridge/log/spdlog_logger.hpp"
#include "lensbridge/server/bridge_server.hpp"

#include <boost/system/system_error.hpp>

#include <chrono>
#include <cstdint>
#include <iostream>
#include <memory>
#include <string>

using namespace lensbridge;

namespace {

void install_logger(bool debug, const std::string& log_file) {
    const auto level = level_for_verbosity(debug);
    if (log_file.empty()) {
        set_logger(make_spdlog_console_logger(level));
    } else {
        set_logger(make_spdlog_console_file_logger(log_file, level));
    }
}

void log_usage_hints(std::uint16_t port) {
    auto& logger = get_logger();
    logger.info("Test commands:");
    logger.info_fmt("  curl http://localhost:{}/health", port);
    logger.info_fmt("  curl -X POST http://localhost:{}/call -H 'Content-Type: application/json' "
                    "-d '{{\"tool\":\"Huskylens2:get_recognition_result\",\"arguments\":{{\"operation\":\"get_result\"}}}}'",
                    port);
    logger.info("Use Ctrl+C to stop");
}

}  // namespace

int main(int argc, char* argv[]) {
    cxxopts::Options options("lensbridge-server", "HuskyLens MCP Bridge - REST bridge for the HuskyLens2 camera");

    options.add_options()
        ("u,upstream-url", "URL of the HuskyLens tool server",
            cxxopts::value<std::string>()->default_value("http://192.168.1.161:3000"))
        ("host", "Bridge listen address", cxxopts::value<std::string>()->default_value("127.0.0.1"))
        ("p,port", "Bridge listen port", cxxopts::value<std::uint16_t>()->default_value("8080"))
        ("call-timeout", "Seconds to wait for a tool call", cxxopts::value<int>()->default_value("30"))
        ("log-file", "Also write logs to this file", cxxopts::value<std::string>()->default_value(""))
        ("d,debug", "Enable debug logging")
        ("h,help", "Print usage");

    try {
        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            std::cout << options.help() << "\n";
            return 0;
        }

        const bool debug = result["debug"].as<bool>();
        install_logger(debug, result["log-file"].as<std::string>());

        const int call_timeout_seconds = result["call-timeout"].as<int>();
        if (call_timeout_seconds <= 0) {
            std::cerr << "--call-timeout must be positive\n";
            return 1;
        }

        SessionClientConfig client_config;
        client_config
            .with_base_url(result["upstream-url"].as<std::string>())
            .with_call_timeout(std::chrono::seconds(call_timeout_seconds));

        BridgeConfig bridge_config;
        bridge_config
            .with_host(result["host"].as<std::string>())
            .with_port(result["port"].as<std::uint16_t>());

        SessionClient client(client_config);
        client.start();
        get_logger().info_fmt("Upstream client started for {}", client.config().base_url);

        BridgeServer server(client, bridge_config);
        log_usage_hints(bridge_config.port);
        server.run();

        client.stop();
        spdlog::shutdown();
        return 0;

    } catch (const cxxopts::exceptions::exception& e) {
        std::cerr << "Error: " << e.what() << "\n\n" << options.help() << "\n";
        return 1;
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    } catch (const boost::system::system_error& e) {
        get_logger().fatal(std::string("Cannot start bridge server: ") + e.what());
        return 1;
    }
}
