#pragma once

// ─────────────────────────────────────────────────────────────────────────────
// Payload JSON Decoding
// ─────────────────────────────────────────────────────────────────────────────
//
// Everything the bridge receives (stream data lines, message endpoint bodies,
// inbound REST bodies, tool result text) is decoded here with simdjson and
// handed to the rest of the code as nlohmann::json. Outgoing envelopes are
// built and serialized with nlohmann directly.
//
// Unlike a plain document iteration, scalar documents ("42", "\"text\"",
// "true") are accepted, and trailing bytes after the first value are an
// error, so `parse_payload("{\"a\":1} junk")` fails.
//
// ─────────────────────────────────────────────────────────────────────────────

#include <nlohmann/json.hpp>
#include <simdjson.h>
#include <tl/expected.hpp>

#include <string>
#include <string_view>

namespace lensbridge {

struct PayloadParseError {
    std::string message;

    PayloadParseError() = default;
    explicit PayloadParseError(std::string msg)
        : message(std::move(msg))
    {}
};

using PayloadResult = tl::expected<nlohmann::json, PayloadParseError>;

struct PayloadParserConfig {
    // Nesting limit for device payloads; recognition results are shallow
    std::size_t max_depth{64};
};

class PayloadParser {
public:
    PayloadParser() = default;
    explicit PayloadParser(PayloadParserConfig config) : config_(config) {}

    [[nodiscard]] PayloadResult parse(std::string_view text);

    [[nodiscard]] const PayloadParserConfig& config() const noexcept { return config_; }

private:
    simdjson::ondemand::parser parser_;
    PayloadParserConfig config_;

    [[nodiscard]] PayloadResult convert_document(simdjson::ondemand::document& doc);
    [[nodiscard]] PayloadResult convert(simdjson::ondemand::value value, std::size_t depth);
    [[nodiscard]] PayloadResult convert_object(simdjson::ondemand::object obj, std::size_t depth);
    [[nodiscard]] PayloadResult convert_array(simdjson::ondemand::array arr, std::size_t depth);
};

// Decode with a thread-local parser
[[nodiscard]] PayloadResult parse_payload(std::string_view text);

// Decode and require a JSON object (response envelopes, REST bodies)
[[nodiscard]] PayloadResult parse_payload_object(std::string_view text);

}  // namespace lensbridge
