#include <catch2/catch_test_macros.hpp>

#include "lensbridge/server/bridge_server.hpp"
#include "mocks/capture_logger.hpp"
#include "mocks/mock_http_client.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>

#include <chrono>
#include <memory>
#include <string>
#include <thread>

using namespace lensbridge;
using lensbridge::testing::MockHttpClient;
using lensbridge::testing::ScopedCaptureLogger;

namespace http = boost::beast::http;

namespace {

constexpr const char* kAnnouncement = "data: /message?session_id=ab12\n";

// Bridge over a SessionClient whose transport is a MockHttpClient
struct TestBridge {
    MockHttpClient* mock{nullptr};
    std::unique_ptr<SessionClient> client;
    std::unique_ptr<BridgeServer> server;

    TestBridge() {
        auto transport = std::make_unique<MockHttpClient>();
        mock = transport.get();
        client = std::make_unique<SessionClient>(
            SessionClientConfig{}.with_base_url("http://device:3000"), std::move(transport));
        server = std::make_unique<BridgeServer>(*client, BridgeConfig{}.with_port(0));
    }

    HttpResponse get(const std::string& target) {
        HttpRequest request{http::verb::get, target, 11};
        return server->handle(request);
    }

    HttpResponse post(const std::string& target, const std::string& body) {
        HttpRequest request{http::verb::post, target, 11};
        request.set(http::field::content_type, "application/json");
        request.body() = body;
        request.prepare_payload();
        return server->handle(request);
    }

    // Session announcement followed by one message endpoint answer
    void queue_call_result(const Json& result) {
        mock->queue_stream(200, {kAnnouncement});
        mock->queue_response(200, Json{{"jsonrpc", "2.0"}, {"id", 1}, {"result", result}}.dump());
    }
};

Json json_body(const HttpResponse& response) {
    return Json::parse(response.body());
}

std::string header(const HttpResponse& response, http::field field) {
    const auto value = response[field];
    return std::string(value.data(), value.size());
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Info and Health
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("GET / describes the bridge", "[server][info]") {
    TestBridge bridge;

    const auto response = bridge.get("/");

    REQUIRE(response.result() == http::status::ok);
    REQUIRE(header(response, http::field::content_type) == "application/json");

    const auto body = json_body(response);
    REQUIRE(body["name"] == "HuskyLens MCP Bridge");
    REQUIRE(body["version"] == "1.0.0");
    REQUIRE(body["upstream"] == "http://device:3000");
    REQUIRE(body["session_id"].is_null());
    REQUIRE(body["endpoints"]["/call"] == "Call a tool (POST)");
    REQUIRE(body["endpoints"].size() == 4);
}

TEST_CASE("GET / reports the active session id", "[server][info]") {
    TestBridge bridge;
    bridge.mock->queue_stream(200, {kAnnouncement});
    REQUIRE(bridge.client->establish().has_value());

    REQUIRE(json_body(bridge.get("/"))["session_id"] == "ab12");
}

TEST_CASE("GET /health reports the session flag", "[server][health]") {
    TestBridge bridge;

    auto body = json_body(bridge.get("/health"));
    REQUIRE(body["status"] == "healthy");
    REQUIRE(body["upstream"] == "http://device:3000");
    REQUIRE(body["sessionEstablished"] == false);

    bridge.mock->queue_stream(200, {kAnnouncement});
    REQUIRE(bridge.client->establish().has_value());

    body = json_body(bridge.get("/health?verbose=1"));
    REQUIRE(body["sessionEstablished"] == true);
}

TEST_CASE("GET /health does not contact the device", "[server][health]") {
    TestBridge bridge;

    (void)bridge.get("/health");

    REQUIRE(bridge.mock->request_count() == 0);
}

// ═══════════════════════════════════════════════════════════════════════════
// Tools
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("GET /tools returns the normalized listing envelope", "[server][tools]") {
    TestBridge bridge;
    const Json listing{
        {"jsonrpc", "2.0"},
        {"id", 1},
        {"result", {{"content", Json::array({
            {{"type", "text"}, {"text", "Huskylens2:take_photo"}},
            {{"type", "text"}, {"text", "Huskylens2:switch_algorithm"}}
        })}}}
    };
    bridge.mock->queue_stream(200, {"data: " + listing.dump() + "\n"});

    const auto response = bridge.get("/tools");

    REQUIRE(response.result() == http::status::ok);
    REQUIRE(json_body(response) == Json::parse(R"({
        "jsonrpc": "2.0", "id": 1,
        "result": {"isError": false, "content": "Huskylens2:take_photo\nHuskylens2:switch_algorithm"}
    })"));
}

TEST_CASE("GET /tools wraps failures in an error envelope", "[server][tools]") {
    TestBridge bridge;
    bridge.mock->queue_stream(200, {"data: [DONE]\n"});

    const auto response = bridge.get("/tools");

    REQUIRE(response.result() == http::status::ok);
    REQUIRE(json_body(response)["error"]["message"] == "No response received");
}

// ═══════════════════════════════════════════════════════════════════════════
// Tool Calls
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("POST /call requires a tool name", "[server][call]") {
    TestBridge bridge;

    const auto response = bridge.post("/call", "{}");

    REQUIRE(response.result() == http::status::bad_request);
    REQUIRE(json_body(response) == Json{{"error", "Missing tool parameter"}});
    REQUIRE(bridge.mock->request_count() == 0);

    REQUIRE(bridge.post("/call", R"({"tool": ""})").result() == http::status::bad_request);
    REQUIRE(bridge.post("/call", R"({"tool": 7})").result() == http::status::bad_request);
}

TEST_CASE("POST /call rejects bodies that are not JSON objects", "[server][call]") {
    TestBridge bridge;

    for (const std::string body : {"not json", "[1, 2]", "", "\"tool\""}) {
        const auto response = bridge.post("/call", body);
        REQUIRE(response.result() == http::status::bad_request);
        REQUIRE(json_body(response)["error"] == "Invalid JSON");
    }
}

TEST_CASE("POST /call rejects non-object arguments", "[server][call]") {
    TestBridge bridge;

    const auto response = bridge.post("/call", R"({"tool": "tools", "arguments": [1]})");

    REQUIRE(response.result() == http::status::bad_request);
    REQUIRE(json_body(response)["error"] == "Invalid arguments");
}

TEST_CASE("POST /call renders JSON text content as JSON", "[server][call]") {
    TestBridge bridge;
    bridge.queue_call_result(Json{{"content", Json::array({{{"type", "text"}, {"text", "{\"a\":1}"}}})}});

    const auto response = bridge.post("/call", R"({"tool": "Huskylens2:get_recognition_result"})");

    REQUIRE(response.result() == http::status::ok);
    REQUIRE(header(response, http::field::content_type) == "application/json");
    REQUIRE(json_body(response) == Json{{"a", 1}});
}

TEST_CASE("POST /call renders plain text content as text", "[server][call]") {
    TestBridge bridge;
    bridge.queue_call_result(Json{{"content", Json::array({
        {{"type", "text"}, {"text", "Algorithm switched"}},
        {{"type", "text"}, {"text", "face_recognition"}}
    })}});

    const auto response = bridge.post("/call", R"({"tool": "Huskylens2:switch_algorithm", "arguments": {"algorithm": "face_recognition"}})");

    REQUIRE(response.result() == http::status::ok);
    REQUIRE(header(response, http::field::content_type) == "text/plain; charset=utf-8");
    REQUIRE(response.body() == "Algorithm switched\nface_recognition");

    const auto sent = Json::parse(bridge.mock->last_request()->body);
    REQUIRE(sent["params"]["arguments"]["algorithm"] == "face_recognition");
}

TEST_CASE("POST /call renders scalar JSON content as JSON", "[server][call]") {
    TestBridge bridge;
    bridge.queue_call_result(Json{{"content", "42"}});

    const auto response = bridge.post("/call", R"({"tool": "Huskylens2:get_count", "arguments": null})");

    REQUIRE(header(response, http::field::content_type) == "application/json");
    REQUIRE(response.body() == "42");
}

TEST_CASE("POST /call returns error envelopes with status 200", "[server][call]") {
    TestBridge bridge;
    bridge.mock->queue_connection_error();

    const auto response = bridge.post("/call", R"({"tool": "tools"})");

    REQUIRE(response.result() == http::status::ok);
    REQUIRE(json_body(response)["error"]["message"] == "Failed to establish session");
    REQUIRE(json_body(response)["error"]["code"] == -32603);
}

TEST_CASE("POST /call logs the tool name", "[server][call]") {
    ScopedCaptureLogger capture(LogLevel::Info);
    TestBridge bridge;
    bridge.queue_call_result(Json{{"content", "ok"}});

    (void)bridge.post("/call", R"({"tool": "Huskylens2:take_photo"})");

    REQUIRE(capture->contains(LogLevel::Info, "Calling tool: Huskylens2:take_photo"));
}

// ═══════════════════════════════════════════════════════════════════════════
// Routing and CORS
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Unknown paths return 404", "[server][routing]") {
    TestBridge bridge;

    const auto response = bridge.get("/nope");

    REQUIRE(response.result() == http::status::not_found);
    REQUIRE(json_body(response)["error"] == "Not found");
}

TEST_CASE("Wrong methods return 405", "[server][routing]") {
    TestBridge bridge;

    REQUIRE(bridge.get("/call").result() == http::status::method_not_allowed);
    REQUIRE(bridge.post("/health", "{}").result() == http::status::method_not_allowed);
    REQUIRE(bridge.post("/tools", "{}").result() == http::status::method_not_allowed);
    REQUIRE(json_body(bridge.post("/", "{}"))["error"] == "Method not allowed");
}

TEST_CASE("OPTIONS is answered on any path", "[server][cors]") {
    TestBridge bridge;
    HttpRequest request{http::verb::options, "/anything", 11};

    const auto response = bridge.server->handle(request);

    REQUIRE(response.result() == http::status::ok);
    REQUIRE(response.body().empty());
    REQUIRE(header(response, http::field::access_control_allow_origin) == "*");
    REQUIRE(header(response, http::field::access_control_allow_methods) == "GET, POST, OPTIONS");
    REQUIRE(header(response, http::field::access_control_allow_headers) == "Content-Type");
}

TEST_CASE("Every response carries CORS headers", "[server][cors]") {
    TestBridge bridge;

    REQUIRE(header(bridge.get("/health"), http::field::access_control_allow_origin) == "*");
    REQUIRE(header(bridge.get("/nope"), http::field::access_control_allow_origin) == "*");
    REQUIRE(header(bridge.post("/call", "{}"), http::field::access_control_allow_origin) == "*");
}

// ═══════════════════════════════════════════════════════════════════════════
// Socket
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("BridgeServer serves requests over TCP", "[server][socket]") {
    TestBridge bridge;
    REQUIRE(bridge.server->bound_port() == 0);

    std::thread server_thread([&bridge] { bridge.server->run(); });

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while ((bridge.server->bound_port() == 0) && (std::chrono::steady_clock::now() < deadline)) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    const auto port = bridge.server->bound_port();

    HttpResponse response;
    if (port != 0) {
        boost::asio::io_context ioc;
        boost::beast::tcp_stream stream(ioc);
        stream.connect(boost::asio::ip::tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), port));

        HttpRequest request{http::verb::get, "/health", 11};
        request.set(http::field::host, "127.0.0.1");
        http::write(stream, request);

        boost::beast::flat_buffer buffer;
        http::read(stream, buffer, response);

        boost::beast::error_code ec;
        stream.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
    }

    bridge.server->stop();
    server_thread.join();

    REQUIRE(port != 0);
    REQUIRE(response.result() == http::status::ok);
    REQUIRE(Json::parse(response.body())["status"] == "healthy");
    REQUIRE(header(response, http::field::access_control_allow_origin) == "*");
}
