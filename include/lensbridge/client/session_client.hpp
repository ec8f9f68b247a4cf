#pragma once

#include "lensbridge/client/client_error.hpp"
#include "lensbridge/client/session_client_config.hpp"
#include "lensbridge/protocol/json_rpc.hpp"
#include "lensbridge/transport/http_client.hpp"
#include "lensbridge/transport/http_types.hpp"
#include "lensbridge/transport/session_manager.hpp"
#include "lensbridge/transport/stream_line_parser.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace lensbridge {

// ═══════════════════════════════════════════════════════════════════════════
// SessionClient
// ═══════════════════════════════════════════════════════════════════════════
// Holds one session against the device's tool server and turns it into a
// plain request/response call.
//
//   1. GET <base>/sse and wait for the announcement line
//        data: /message?session_id=<id>
//   2. POST the JSON-RPC envelope to that endpoint
//   3. The answer is either the POST body (plain JSON, or data-prefixed
//      lines) or, when the body carries neither, an event on a POST to the
//      stream path that repeats the request
//   4. The answer is normalized to {isError, content:"text"}
//
// call() and list_tools() never fail out of band: every failure comes back
// as {"error":{"code":-32603,"message":...}}.
//
// Not safe for concurrent calls. The stream fallback assumes one call in
// flight; the bridge server serializes requests.

class SessionClient {
public:
    /// Throws std::invalid_argument if config.base_url is not an http(s) URL
    explicit SessionClient(SessionClientConfig config);

    /// Same, with a caller-provided transport (tests use MockHttpClient)
    SessionClient(SessionClientConfig config, std::unique_ptr<IHttpClient> client);

    ~SessionClient();

    SessionClient(const SessionClient&) = delete;
    SessionClient& operator=(const SessionClient&) = delete;
    SessionClient(SessionClient&&) = delete;
    SessionClient& operator=(SessionClient&&) = delete;

    // ─────────────────────────────────────────────────────────────────────────
    // Lifecycle
    // ─────────────────────────────────────────────────────────────────────────

    /// Re-arm the transport and try to establish a session. A failure is
    /// logged; the first call() retries.
    void start();

    /// Open the session stream and read until the device announces the
    /// message endpoint. Replaces any existing session.
    [[nodiscard]] ClientResult<SessionInfo> establish();

    /// Cancel the transport and drop the session. Safe to call repeatedly.
    void stop();

    // ─────────────────────────────────────────────────────────────────────────
    // Calls
    // ─────────────────────────────────────────────────────────────────────────

    /// Invoke a tool. Establishes a session first if there is none.
    /// Returns the normalized response or an error envelope.
    [[nodiscard]] Json call(const std::string& name, const Json& arguments = Json::object());

    /// Issue the configured listing call on the stream path and return the
    /// response envelope as received.
    [[nodiscard]] Json list_tools();

    // ─────────────────────────────────────────────────────────────────────────
    // Introspection
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] std::optional<std::string> session_id() const;
    [[nodiscard]] std::optional<std::string> message_url() const;
    [[nodiscard]] bool session_established() const;
    [[nodiscard]] SessionState state() const;

    /// Id of the most recent request, 0 before the first one
    [[nodiscard]] std::int64_t last_request_id() const noexcept;

    [[nodiscard]] const SessionClientConfig& config() const noexcept { return config_; }
    [[nodiscard]] const UrlComponents& upstream() const noexcept { return url_; }

private:
    void configure_client();

    [[nodiscard]] std::int64_t next_request_id();
    [[nodiscard]] std::string session_target() const;

    /// Discovery line to SessionInfo; nullopt if the endpoint is unusable
    [[nodiscard]] std::optional<SessionInfo> session_from_event(const StreamEvent& event) const;

    [[nodiscard]] ClientResult<SessionInfo> ensure_session();
    [[nodiscard]] ClientResult<Json> post_call(const SessionInfo& session, const JsonRpcRequest& request);

    /// Decoded envelope, nullopt when the body needs the stream fallback
    [[nodiscard]] ClientResult<std::optional<Json>> decode_post_body(const std::string& body) const;

    [[nodiscard]] ClientResult<Json> stream_call(const JsonRpcRequest& request);

    void recover_session(const std::string& reason);

    SessionClientConfig config_;
    UrlComponents url_;
    std::unique_ptr<IHttpClient> http_client_;
    SessionManager session_manager_;
    std::atomic<std::int64_t> request_id_{0};
};

}  // namespace lensbridge
