#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Session Client Error
// ═══════════════════════════════════════════════════════════════════════════
// Failures inside SessionClient travel as ClientResult<T>. At the public
// boundary they become an in-band JSON-RPC error envelope (to_envelope()), so
// REST callers always receive a JSON body.

#include "lensbridge/protocol/json_rpc.hpp"

#include <tl/expected.hpp>

#include <string>
#include <string_view>

namespace lensbridge {

enum class ClientErrorCode {
    Session,            ///< No session could be established, or no response on the stream
    Timeout,            ///< Message endpoint did not answer within call_timeout
    ProtocolDecode,     ///< Upstream body could not be decoded
    UpstreamHttp,       ///< Message endpoint answered with a non-200 status
    RequestValidation,  ///< Caller supplied an unusable request
    Transport           ///< Connection-level failure
};

[[nodiscard]] constexpr std::string_view to_string(ClientErrorCode code) noexcept {
    switch (code) {
        case ClientErrorCode::Session:           return "Session";
        case ClientErrorCode::Timeout:           return "Timeout";
        case ClientErrorCode::ProtocolDecode:    return "ProtocolDecode";
        case ClientErrorCode::UpstreamHttp:      return "UpstreamHttp";
        case ClientErrorCode::RequestValidation: return "RequestValidation";
        case ClientErrorCode::Transport:         return "Transport";
    }
    return "Unknown";
}

struct ClientError {
    ClientErrorCode code;
    std::string message;

    // ─────────────────────────────────────────────────────────────────────────
    // Factory Methods
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] static ClientError session(std::string msg) {
        return {ClientErrorCode::Session, std::move(msg)};
    }

    [[nodiscard]] static ClientError establish_failed() {
        return {ClientErrorCode::Session, "Failed to establish session"};
    }

    [[nodiscard]] static ClientError no_response() {
        return {ClientErrorCode::Session, "No response received"};
    }

    [[nodiscard]] static ClientError timeout() {
        return {ClientErrorCode::Timeout, "Request timeout"};
    }

    [[nodiscard]] static ClientError protocol_decode(std::string msg) {
        return {ClientErrorCode::ProtocolDecode, std::move(msg)};
    }

    [[nodiscard]] static ClientError upstream_http(int status_code) {
        return {ClientErrorCode::UpstreamHttp, "HTTP " + std::to_string(status_code)};
    }

    [[nodiscard]] static ClientError request_validation(std::string msg) {
        return {ClientErrorCode::RequestValidation, std::move(msg)};
    }

    [[nodiscard]] static ClientError transport(std::string msg) {
        return {ClientErrorCode::Transport, std::move(msg)};
    }

    /// {"error":{"code":-32603,"message":message}}
    [[nodiscard]] Json to_envelope() const {
        return error_envelope(message, kInternalErrorCode);
    }
};

template <typename T>
using ClientResult = tl::expected<T, ClientError>;

}  // namespace lensbridge
