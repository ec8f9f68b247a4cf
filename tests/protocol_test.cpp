#include <catch2/catch_test_macros.hpp>

#include "lensbridge/client/client_error.hpp"
#include "lensbridge/protocol/json_rpc.hpp"
#include "lensbridge/protocol/tool_result.hpp"

using namespace lensbridge;

// ═══════════════════════════════════════════════════════════════════════════
// JSON-RPC Envelopes
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("tool_call request has the device's envelope shape", "[protocol][jsonrpc]") {
    const auto request = JsonRpcRequest::tool_call(5, "Huskylens2:get_recognition_result",
                                                   Json{{"operation", "get_result"}});
    const auto payload = request.to_json();

    REQUIRE(payload["jsonrpc"] == "2.0");
    REQUIRE(payload["method"] == "tools/call");
    REQUIRE(payload["id"] == 5);
    REQUIRE(payload["params"]["name"] == "Huskylens2:get_recognition_result");
    REQUIRE(payload["params"]["arguments"]["operation"] == "get_result");
}

TEST_CASE("tool_call substitutes an empty object for null arguments", "[protocol][jsonrpc]") {
    const auto payload = JsonRpcRequest::tool_call(1, "tools", Json()).to_json();

    REQUIRE(payload["params"]["arguments"].is_object());
    REQUIRE(payload["params"]["arguments"].empty());
}

TEST_CASE("JsonRpcRequest omits absent params", "[protocol][jsonrpc]") {
    const JsonRpcRequest request("ping", 9);
    const auto payload = request.to_json();

    REQUIRE(payload.contains("params") == false);
    REQUIRE(request.id() == 9);
    REQUIRE(request.method() == "ping");
}

TEST_CASE("error_envelope uses the internal error code", "[protocol][jsonrpc]") {
    const auto envelope = error_envelope("Request timeout");

    REQUIRE(envelope == Json{{"error", {{"code", -32603}, {"message", "Request timeout"}}}});
    REQUIRE(is_error_envelope(envelope));
}

TEST_CASE("response_id reads integer ids only", "[protocol][jsonrpc]") {
    REQUIRE(response_id(Json{{"id", 12}}).value() == 12);
    REQUIRE(response_id(Json{{"id", "12"}}).has_value() == false);
    REQUIRE(response_id(Json{{"result", {}}}).has_value() == false);
    REQUIRE(response_id(Json::array()).has_value() == false);
}

TEST_CASE("ClientError envelopes carry the message", "[protocol][errors]") {
    REQUIRE(ClientError::upstream_http(502).to_envelope()["error"]["message"] == "HTTP 502");
    REQUIRE(ClientError::timeout().to_envelope()["error"]["message"] == "Request timeout");
    REQUIRE(ClientError::no_response().to_envelope()["error"]["message"] == "No response received");
    REQUIRE(ClientError::establish_failed().to_envelope()["error"]["code"] == kInternalErrorCode);
    REQUIRE(to_string(ClientErrorCode::UpstreamHttp) == "UpstreamHttp");
}

// ═══════════════════════════════════════════════════════════════════════════
// ToolResult
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("ToolResult joins text items with newlines", "[protocol][result]") {
    const auto result = ToolResult::from_json(Json::parse(R"({
        "content": [
            {"type": "text", "text": "a"},
            {"type": "text", "text": "b"}
        ]
    })"));

    REQUIRE(result.text() == "a\nb");
    REQUIRE(result.is_error == false);
    REQUIRE(result.dropped_count() == 0);
}

TEST_CASE("ToolResult keeps resource links out of the text", "[protocol][result]") {
    const auto result = ToolResult::from_json(Json::parse(R"({
        "isError": false,
        "content": [
            {"type": "text", "text": "1 face"},
            {"type": "resource_link", "name": "snapshot.jpg", "uri": "file:///snap/1.jpg", "mimeType": "image/jpeg"},
            {"type": "image", "data": "AAAA", "mimeType": "image/png"}
        ]
    })"));

    REQUIRE(result.text() == "1 face");
    REQUIRE(result.dropped_count() == 2);

    const auto* link = std::get_if<ResourceLink>(&result.content[1]);
    REQUIRE(link != nullptr);
    REQUIRE(link->name == "snapshot.jpg");
    REQUIRE(link->uri == "file:///snap/1.jpg");
    REQUIRE(link->mime_type.value() == "image/jpeg");
}

TEST_CASE("ToolResult treats a string content as one fragment", "[protocol][result]") {
    const auto result = ToolResult::from_json(Json{{"content", "plain"}, {"isError", true}});

    REQUIRE(result.text() == "plain");
    REQUIRE(result.is_error);
}

TEST_CASE("ToolResult tolerates malformed items", "[protocol][result]") {
    const auto result = ToolResult::from_json(Json::parse(R"({
        "isError": "yes",
        "content": [42, {"text": "no type"}, {"type": "text", "text": "kept"}]
    })"));

    REQUIRE(result.is_error == false);
    REQUIRE(result.text() == "kept");
    REQUIRE(result.dropped_count() == 2);
}

TEST_CASE("ToolResult keeps an empty fragment for text items without text", "[protocol][result]") {
    const auto result = ToolResult::from_json(Json::parse(R"({
        "content": [
            {"type": "text", "text": "a"},
            {"type": "text"},
            {"type": "text", "text": 7},
            {"type": "text", "text": "b"}
        ]
    })"));

    REQUIRE(result.text() == "a\n\n\nb");
    REQUIRE(result.dropped_count() == 0);
}

// ═══════════════════════════════════════════════════════════════════════════
// normalize_response
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("normalize_response flattens content", "[protocol][normalize]") {
    const auto envelope = Json::parse(R"({
        "jsonrpc": "2.0", "id": 4,
        "result": {"content": [{"type": "text", "text": "a"}, {"type": "text", "text": "b"}]}
    })");

    const auto normalized = normalize_response(envelope);

    REQUIRE(normalized == Json::parse(R"({
        "jsonrpc": "2.0", "id": 4,
        "result": {"isError": false, "content": "a\nb"}
    })"));
}

TEST_CASE("normalize_response is idempotent", "[protocol][normalize]") {
    const auto envelope = Json::parse(R"({
        "jsonrpc": "2.0", "id": 8,
        "result": {
            "isError": true,
            "content": [
                {"type": "text", "text": "x"},
                {"type": "resource_link", "name": "n", "uri": "u"},
                {"type": "text", "text": "y"}
            ]
        }
    })");

    const auto once = normalize_response(envelope);
    const auto twice = normalize_response(once);

    REQUIRE(once == twice);
    REQUIRE(once["result"]["content"] == "x\ny");
    REQUIRE(once["result"]["isError"] == true);
}

TEST_CASE("normalize_response passes error envelopes through", "[protocol][normalize]") {
    const auto envelope = Json::parse(R"({"jsonrpc": "2.0", "id": 2, "error": {"code": -32601, "message": "Unknown tool"}})");

    REQUIRE(normalize_response(envelope) == envelope);
}

TEST_CASE("normalize_response defaults a missing result", "[protocol][normalize]") {
    const auto normalized = normalize_response(Json{{"jsonrpc", "2.0"}, {"id", 3}});

    REQUIRE(normalized["result"]["isError"] == false);
    REQUIRE(normalized["result"]["content"] == "");
    REQUIRE(normalized["id"] == 3);
}

TEST_CASE("normalize_response keeps blank lines for empty text items", "[protocol][normalize]") {
    const auto envelope = Json::parse(R"({
        "jsonrpc": "2.0", "id": 6,
        "result": {"content": [{"type": "text", "text": "a"}, {"type": "text"}, {"type": "text", "text": "b"}]}
    })");

    REQUIRE(normalize_response(envelope)["result"]["content"] == "a\n\nb");
}

TEST_CASE("normalize_response leaves non-object results alone", "[protocol][normalize]") {
    const auto envelope = Json{{"jsonrpc", "2.0"}, {"id", 3}, {"result", Json::array({1, 2})}};

    REQUIRE(normalize_response(envelope) == envelope);
}

TEST_CASE("normalize_response uses null for a missing id", "[protocol][normalize]") {
    const auto normalized = normalize_response(Json{{"result", {{"content", "t"}}}});

    REQUIRE(normalized["id"].is_null());
    REQUIRE(normalized["jsonrpc"] == "2.0");
    REQUIRE(normalized["result"]["content"] == "t");
}
