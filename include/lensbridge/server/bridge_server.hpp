#pragma once

#include "lensbridge/client/session_client.hpp"
#include "lensbridge/protocol/json_rpc.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/beast/http.hpp>

#include <atomic>
#include <cstdint>
#include <string>

namespace lensbridge {

// ─────────────────────────────────────────────────────────────────────────────
// Bridge Configuration
// ─────────────────────────────────────────────────────────────────────────────

struct BridgeConfig {
    std::string host{"127.0.0.1"};
    std::uint16_t port{8080};  // 0 picks a free port, see BridgeServer::bound_port()

    // Reported by GET /
    std::string name{"HuskyLens MCP Bridge"};
    std::string version{"1.0.0"};
    std::string description{"Bridge for HuskyLens2 MCP server"};

    BridgeConfig& with_host(std::string value) {
        host = std::move(value);
        return *this;
    }

    BridgeConfig& with_port(std::uint16_t value) {
        port = value;
        return *this;
    }
};

using HttpRequest = boost::beast::http::request<boost::beast::http::string_body>;
using HttpResponse = boost::beast::http::response<boost::beast::http::string_body>;

// ═══════════════════════════════════════════════════════════════════════════
// BridgeServer
// ═══════════════════════════════════════════════════════════════════════════
// Stateless REST surface over a SessionClient:
//
//   GET  /        bridge information
//   GET  /health  liveness and session flag
//   GET  /tools   tool listing from the device
//   POST /call    {"tool": "...", "arguments": {...}}
//
// Every response carries permissive CORS headers; OPTIONS on any path is
// answered directly.
//
// One io_context on the calling thread. Requests are handled one at a time,
// so the session client never sees concurrent calls.

class BridgeServer {
public:
    BridgeServer(SessionClient& client, BridgeConfig config);
    ~BridgeServer();

    BridgeServer(const BridgeServer&) = delete;
    BridgeServer& operator=(const BridgeServer&) = delete;

    /// Route one request. Never throws; internal failures become 500.
    [[nodiscard]] HttpResponse handle(const HttpRequest& request);

    /// Bind, accept and serve until stop(), SIGINT or SIGTERM.
    /// Throws boost::system::system_error if the address cannot be bound.
    void run();

    /// Stop the accept loop. Safe from any thread and from signal handlers
    /// installed through asio.
    void stop();

    /// Port actually bound, 0 before run() has bound the socket
    [[nodiscard]] std::uint16_t bound_port() const noexcept { return bound_port_.load(); }

    [[nodiscard]] const BridgeConfig& config() const noexcept { return config_; }

private:
    [[nodiscard]] HttpResponse route(const HttpRequest& request);

    [[nodiscard]] HttpResponse handle_info(const HttpRequest& request);
    [[nodiscard]] HttpResponse handle_health(const HttpRequest& request);
    [[nodiscard]] HttpResponse handle_list_tools(const HttpRequest& request);
    [[nodiscard]] HttpResponse handle_tool_call(const HttpRequest& request);

    [[nodiscard]] static HttpResponse json_response(
        const HttpRequest& request, boost::beast::http::status status, const Json& body);
    [[nodiscard]] static HttpResponse text_response(
        const HttpRequest& request, boost::beast::http::status status, std::string body);
    [[nodiscard]] static HttpResponse error_response(
        const HttpRequest& request, boost::beast::http::status status, std::string_view message);
    static void apply_cors(HttpResponse& response);

    SessionClient& client_;
    BridgeConfig config_;
    boost::asio::io_context ioc_;
    std::atomic<std::uint16_t> bound_port_{0};
};

}  // namespace lensbridge
