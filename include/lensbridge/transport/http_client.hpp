#pragma once

#include "lensbridge/transport/http_types.hpp"

#include <tl/expected.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace lensbridge {

// ─────────────────────────────────────────────────────────────────────────────
// HTTP Client Error
// ─────────────────────────────────────────────────────────────────────────────

struct HttpClientError {
    enum class Code {
        ConnectionFailed,
        Timeout,
        SslError,
        InvalidRequest,
        Cancelled,
        Unknown
    };

    Code code;
    std::string message;

    static HttpClientError connection_failed(const std::string& msg) {
        return {Code::ConnectionFailed, msg};
    }
    static HttpClientError timeout(const std::string& msg) {
        return {Code::Timeout, msg};
    }
    static HttpClientError ssl_error(const std::string& msg) {
        return {Code::SslError, msg};
    }
    static HttpClientError invalid_request(const std::string& msg) {
        return {Code::InvalidRequest, msg};
    }
    static HttpClientError cancelled() {
        return {Code::Cancelled, "Request cancelled"};
    }
    static HttpClientError unknown(const std::string& msg) {
        return {Code::Unknown, msg};
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// Responses
// ─────────────────────────────────────────────────────────────────────────────

struct HttpClientResponse {
    int status_code{0};
    HeaderMap headers;
    std::string body;
};

// Outcome of a streamed request. The body has already been handed to the
// chunk handler; `stopped_by_handler` is set when the handler asked to stop
// before the server closed the stream.
struct HttpStreamResponse {
    int status_code{0};
    HeaderMap headers;
    bool stopped_by_handler{false};
};

template <typename T>
using HttpClientResult = tl::expected<T, HttpClientError>;

// Receives body bytes as they arrive. Return false to close the stream.
using ChunkHandler = std::function<bool(std::string_view chunk)>;

// ─────────────────────────────────────────────────────────────────────────────
// IHttpClient
// ─────────────────────────────────────────────────────────────────────────────
// Transport seam of the session client. The production implementation uses
// cpr; tests substitute MockHttpClient with canned bodies and stream chunks.
//
// Paths are request targets ("/message?session_id=...") relative to the base
// URL; they are validated before use.

class IHttpClient {
public:
    virtual ~IHttpClient() = default;

    // ─────────────────────────────────────────────────────────────────────────
    // Configuration
    // ─────────────────────────────────────────────────────────────────────────

    // Scheme, host and port of the upstream device ("http://10.0.0.5:3000")
    virtual void set_base_url(const std::string& url) = 0;

    virtual void set_default_headers(const HeaderMap& headers) = 0;

    virtual void set_connect_timeout(std::chrono::milliseconds timeout) = 0;

    virtual void set_verify_ssl(bool verify) = 0;

    // ─────────────────────────────────────────────────────────────────────────
    // Requests
    // ─────────────────────────────────────────────────────────────────────────

    // Buffered POST; the whole exchange must finish within `timeout`
    [[nodiscard]] virtual HttpClientResult<HttpClientResponse> post(
        const std::string& path,
        const std::string& body,
        const std::string& content_type,
        std::chrono::milliseconds timeout,
        const HeaderMap& headers = {}
    ) = 0;

    // Streamed request. Chunks are delivered to `on_chunk` in arrival order
    // until the server closes the stream, the handler returns false, or
    // `timeout` elapses (reported as HttpClientError::Code::Timeout).
    // `body` and `content_type` are ignored for GET.
    [[nodiscard]] virtual HttpClientResult<HttpStreamResponse> stream(
        HttpMethod method,
        const std::string& path,
        const std::string& body,
        const std::string& content_type,
        std::chrono::milliseconds timeout,
        const ChunkHandler& on_chunk,
        const HeaderMap& headers = {}
    ) = 0;

    // ─────────────────────────────────────────────────────────────────────────
    // Lifecycle
    // ─────────────────────────────────────────────────────────────────────────

    // Refuse further requests until reset()
    virtual void cancel() = 0;

    virtual void reset() = 0;
};

// Creates the cpr-backed client
std::unique_ptr<IHttpClient> make_http_client();

}  // namespace lensbridge
