#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace lensbridge {

// ─────────────────────────────────────────────────────────────────────────────
// Stream Lines
// ─────────────────────────────────────────────────────────────────────────────
//
// The device speaks a reduced form of Server-Sent Events: every meaningful
// line carries the "data: " prefix and stands on its own. There are no
// multi-line events, no event/id/retry fields, and a line can be any of:
//
//   data: /message?session_id=3f2a-9c      session announcement
//   data: /message                          endpoint without a session id
//   data: {"jsonrpc":"2.0","id":4,...}      response payload
//   data: 17                                positional counter, ignored
//   data: [DONE]                            end of the response stream
//
// LineBuffer splits raw body chunks into lines; classify_line() turns each
// line into a StreamEvent.
//
// ─────────────────────────────────────────────────────────────────────────────

inline constexpr std::string_view kDataPrefix = "data: ";
inline constexpr std::string_view kTerminalSentinel = "[DONE]";
inline constexpr std::string_view kSessionIdKey = "session_id=";
inline constexpr std::string_view kMessagePathPrefix = "/message";

/// Thrown when an unterminated line grows past LineBufferConfig::max_buffer_size;
/// the buffer is cleared first
class StreamBufferOverflowError : public std::runtime_error {
public:
    explicit StreamBufferOverflowError(std::size_t size, std::size_t limit)
        : std::runtime_error("Stream buffer overflow: " + std::to_string(size) +
                            " bytes exceeds limit of " + std::to_string(limit))
        , buffer_size(size)
        , buffer_limit(limit)
    {}

    std::size_t buffer_size;
    std::size_t buffer_limit;
};

struct LineBufferConfig {
    /// Maximum unconsumed bytes held between feeds (default 1MB)
    std::size_t max_buffer_size{1024 * 1024};
};

/// Incremental line splitter for streamed bodies.
///
/// Chunks may split a line anywhere, including between '\r' and '\n'.
/// Lines are returned without their terminator.
class LineBuffer {
public:
    LineBuffer() = default;
    explicit LineBuffer(LineBufferConfig config) : config_(config) {}

    /// Append a chunk and return every line it completes.
    /// Throws StreamBufferOverflowError if the pending data exceeds the limit.
    [[nodiscard]] std::vector<std::string> feed(std::string_view chunk);

    /// Return the unterminated trailing line, if any, and clear the buffer.
    [[nodiscard]] std::optional<std::string> finish();

    void reset();

    [[nodiscard]] std::size_t buffer_size() const noexcept { return buffer_.size() - buffer_pos_; }

    [[nodiscard]] const LineBufferConfig& config() const noexcept { return config_; }

private:
    LineBufferConfig config_;
    std::string buffer_;
    std::size_t buffer_pos_{0};

    void maybe_compact_buffer();
};

// ─────────────────────────────────────────────────────────────────────────────
// Stream Events
// ─────────────────────────────────────────────────────────────────────────────

struct SessionToken {
    std::string session_id;
    std::string endpoint_path;  // the full data value, e.g. "/message?session_id=..."
};

struct MessagePath {
    std::string endpoint_path;
};

struct JsonPayload {
    nlohmann::json value;
};

struct Sentinel {};

struct PositionalNumber {
    std::uint64_t value;
};

struct Unrecognized {
    std::string data;
    std::string reason;
};

using StreamEvent = std::variant<
    SessionToken,
    MessagePath,
    JsonPayload,
    Sentinel,
    PositionalNumber,
    Unrecognized
>;

/// Value after the "data: " prefix with surrounding whitespace trimmed,
/// or nullopt if the line does not carry the prefix.
[[nodiscard]] std::optional<std::string_view> extract_data(std::string_view line);

/// First `session_id=` occurrence followed by a [a-f0-9-]+ token
[[nodiscard]] std::optional<std::string> find_session_id(std::string_view data);

/// Classify the data value of a line. Precedence: sentinel, JSON container,
/// session token, message path, positional number, other JSON scalar.
[[nodiscard]] StreamEvent classify_data(std::string_view data);

/// nullopt for lines without the data prefix
[[nodiscard]] std::optional<StreamEvent> classify_line(std::string_view line);

[[nodiscard]] std::string_view event_name(const StreamEvent& event) noexcept;

}  // namespace lensbridge
