#pragma once

#include "lensbridge/protocol/json_rpc.hpp"
#include "lensbridge/transport/http_types.hpp"

#include <chrono>
#include <cstddef>
#include <string>

namespace lensbridge {

// ─────────────────────────────────────────────────────────────────────────────
// Session Client Configuration
// ─────────────────────────────────────────────────────────────────────────────
// Everything needed to talk to one device. Fixed at construction.

struct SessionClientConfig {
    // ─────────────────────────────────────────────────────────────────────────
    // Upstream
    // ─────────────────────────────────────────────────────────────────────────

    // Base URL of the device's tool server, e.g. "http://192.168.1.161:3000".
    // Must be http:// or https://; a path prefix is allowed.
    std::string base_url{"http://192.168.1.161:3000"};

    // Stream path, relative to base_url. GET opens a session, POST is the
    // fallback for calls whose answer only arrives on the stream.
    std::string session_path{"/sse"};

    // Sent with every upstream request
    HeaderMap default_headers;

    bool verify_ssl{true};

    // ─────────────────────────────────────────────────────────────────────────
    // Timeouts
    // ─────────────────────────────────────────────────────────────────────────

    std::chrono::milliseconds connect_timeout{10'000};

    // Whole POST to the message endpoint
    std::chrono::milliseconds call_timeout{30'000};

    // Session establishment scan and stream fallback scan
    std::chrono::milliseconds stream_timeout{30'000};

    // ─────────────────────────────────────────────────────────────────────────
    // Tool Listing
    // ─────────────────────────────────────────────────────────────────────────
    // The device has no tools/list; listing is itself a tool call.

    std::string list_tools_name{"tools"};
    Json list_tools_arguments = Json{{"operation", "list"}};

    // Longest line accepted from a stream
    std::size_t max_line_buffer{1024 * 1024};

    // ─────────────────────────────────────────────────────────────────────────
    // Builder-Style Helpers
    // ─────────────────────────────────────────────────────────────────────────

    SessionClientConfig& with_base_url(std::string url);
    SessionClientConfig& with_header(const std::string& name, const std::string& value);
    SessionClientConfig& with_connect_timeout(std::chrono::milliseconds timeout);
    SessionClientConfig& with_call_timeout(std::chrono::milliseconds timeout);
    SessionClientConfig& with_stream_timeout(std::chrono::milliseconds timeout);
    SessionClientConfig& with_list_tools(std::string name, Json arguments);
};

}  // namespace lensbridge
