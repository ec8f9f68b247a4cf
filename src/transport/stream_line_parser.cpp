#include "lensbridge/transport/stream_line_parser.hpp"

#include "lensbridge/json/payload_json.hpp"

#include <algorithm>
#include <charconv>

namespace lensbridge {

// Compact buffer when consumed portion exceeds this threshold (4KB)
constexpr std::size_t buffer_compact_threshold = 4096;

// ─────────────────────────────────────────────────────────────────────────────
// LineBuffer
// ─────────────────────────────────────────────────────────────────────────────

std::vector<std::string> LineBuffer::feed(std::string_view chunk) {
    std::vector<std::string> lines;

    buffer_ += chunk;

    std::size_t newline_pos = 0;
    while ((newline_pos = buffer_.find('\n', buffer_pos_)) != std::string::npos) {
        std::string_view line_view(buffer_.data() + buffer_pos_, newline_pos - buffer_pos_);

        const bool has_carriage_return =
            (!line_view.empty()) && (line_view.back() == '\r');
        if (has_carriage_return) {
            line_view.remove_suffix(1);
        }

        buffer_pos_ = newline_pos + 1;
        lines.emplace_back(line_view);
    }

    // Only the unterminated remainder counts against the limit
    const std::size_t pending = buffer_.size() - buffer_pos_;
    if (pending > config_.max_buffer_size) {
        reset();
        throw StreamBufferOverflowError(pending, config_.max_buffer_size);
    }

    maybe_compact_buffer();

    return lines;
}

std::optional<std::string> LineBuffer::finish() {
    std::string_view rest(buffer_.data() + buffer_pos_, buffer_.size() - buffer_pos_);
    if ((rest.empty() == false) && (rest.back() == '\r')) {
        rest.remove_suffix(1);
    }

    std::optional<std::string> line;
    if (rest.empty() == false) {
        line = std::string(rest);
    }
    reset();
    return line;
}

void LineBuffer::reset() {
    buffer_.clear();
    buffer_pos_ = 0;
}

void LineBuffer::maybe_compact_buffer() {
    if (buffer_pos_ == buffer_.size()) {
        buffer_.clear();
        buffer_pos_ = 0;
        return;
    }
    if (buffer_pos_ > buffer_compact_threshold) {
        buffer_.erase(0, buffer_pos_);
        buffer_pos_ = 0;
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// Classification
// ─────────────────────────────────────────────────────────────────────────────

namespace {

bool is_space(char c) {
    return (c == ' ') || (c == '\t') || (c == '\r') || (c == '\n') ||
           (c == '\f') || (c == '\v');
}

std::string_view trim(std::string_view text) {
    while ((text.empty() == false) && is_space(text.front())) {
        text.remove_prefix(1);
    }
    while ((text.empty() == false) && is_space(text.back())) {
        text.remove_suffix(1);
    }
    return text;
}

bool is_session_id_char(char c) {
    return ((c >= 'a') && (c <= 'f')) || ((c >= '0') && (c <= '9')) || (c == '-');
}

bool is_all_digits(std::string_view text) {
    return (text.empty() == false) &&
           std::ranges::all_of(text, [](char c) { return (c >= '0') && (c <= '9'); });
}

}  // namespace

std::optional<std::string_view> extract_data(std::string_view line) {
    if (line.starts_with(kDataPrefix) == false) {
        return std::nullopt;
    }
    return trim(line.substr(kDataPrefix.size()));
}

std::optional<std::string> find_session_id(std::string_view data) {
    std::size_t pos = 0;
    while ((pos = data.find(kSessionIdKey, pos)) != std::string_view::npos) {
        const std::size_t token_start = pos + kSessionIdKey.size();
        std::size_t token_end = token_start;
        while ((token_end < data.size()) && is_session_id_char(data[token_end])) {
            ++token_end;
        }
        if (token_end > token_start) {
            return std::string(data.substr(token_start, token_end - token_start));
        }
        pos = token_start;
    }
    return std::nullopt;
}

StreamEvent classify_data(std::string_view data) {
    if (data == kTerminalSentinel) {
        return Sentinel{};
    }

    const bool looks_like_container =
        (data.empty() == false) && ((data.front() == '{') || (data.front() == '['));
    if (looks_like_container) {
        auto parsed = parse_payload(data);
        if (!parsed) {
            return Unrecognized{std::string(data), parsed.error().message};
        }
        return JsonPayload{std::move(*parsed)};
    }

    if (data.find(kSessionIdKey) != std::string_view::npos) {
        auto session_id = find_session_id(data);
        if (session_id.has_value() == false) {
            return Unrecognized{std::string(data), "Malformed session id"};
        }
        return SessionToken{std::move(*session_id), std::string(data)};
    }

    if (data.starts_with(kMessagePathPrefix)) {
        return MessagePath{std::string(data)};
    }

    if (is_all_digits(data)) {
        std::uint64_t value = 0;
        auto [ptr, ec] = std::from_chars(data.data(), data.data() + data.size(), value);
        if ((ec == std::errc{}) && (ptr == data.data() + data.size())) {
            return PositionalNumber{value};
        }
        return Unrecognized{std::string(data), "Numeric value out of range"};
    }

    auto parsed = parse_payload(data);
    if (parsed) {
        return JsonPayload{std::move(*parsed)};
    }
    return Unrecognized{std::string(data), parsed.error().message};
}

std::optional<StreamEvent> classify_line(std::string_view line) {
    const auto data = extract_data(line);
    if (data.has_value() == false) {
        return std::nullopt;
    }
    return classify_data(*data);
}

std::string_view event_name(const StreamEvent& event) noexcept {
    struct Namer {
        std::string_view operator()(const SessionToken&) const noexcept { return "session-token"; }
        std::string_view operator()(const MessagePath&) const noexcept { return "message-path"; }
        std::string_view operator()(const JsonPayload&) const noexcept { return "json-payload"; }
        std::string_view operator()(const Sentinel&) const noexcept { return "sentinel"; }
        std::string_view operator()(const PositionalNumber&) const noexcept { return "positional-number"; }
        std::string_view operator()(const Unrecognized&) const noexcept { return "unrecognized"; }
    };
    return std::visit(Namer{}, event);
}

}  // namespace lensbridge
