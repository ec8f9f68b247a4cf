#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace lensbridge {

using Json = nlohmann::json;

inline constexpr std::string_view kJsonRpcVersion{"2.0"};
inline constexpr std::string_view kToolCallMethod{"tools/call"};

/// Code of every error the bridge synthesizes itself (JSON-RPC internal error)
inline constexpr std::int64_t kInternalErrorCode = -32603;

// ─────────────────────────────────────────────────────────────────────────────
// Requests
// ─────────────────────────────────────────────────────────────────────────────

class JsonRpcRequest {
public:
    JsonRpcRequest(std::string method, std::int64_t id, std::optional<Json> params = std::nullopt);

    /// {"method":"tools/call","params":{"name":..,"arguments":..},...}
    [[nodiscard]] static JsonRpcRequest tool_call(std::int64_t id, std::string name, Json arguments);

    [[nodiscard]] const std::string& method() const noexcept;
    [[nodiscard]] std::int64_t id() const noexcept;
    [[nodiscard]] const std::optional<Json>& params() const noexcept;

    [[nodiscard]] Json to_json() const;

private:
    std::string method_;
    std::int64_t id_;
    std::optional<Json> params_;
};

// ─────────────────────────────────────────────────────────────────────────────
// Errors
// ─────────────────────────────────────────────────────────────────────────────

struct JsonRpcError {
    std::int64_t code{kInternalErrorCode};
    std::string message;
    std::optional<Json> data{};

    [[nodiscard]] Json to_json() const;
};

/// {"error":{"code":code,"message":message}}
[[nodiscard]] Json error_envelope(std::string_view message, std::int64_t code = kInternalErrorCode);

[[nodiscard]] bool is_error_envelope(const Json& envelope);

/// Integer id of a response envelope, if it carries one
[[nodiscard]] std::optional<std::int64_t> response_id(const Json& envelope);

}  // namespace lensbridge
