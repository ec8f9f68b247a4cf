#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "lensbridge/json/payload_json.hpp"

using namespace lensbridge;
using Json = nlohmann::json;

// ─────────────────────────────────────────────────────────────────────────────
// Documents
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("parse_payload handles response envelopes", "[json][simdjson]") {
    auto result = parse_payload(R"({
        "jsonrpc": "2.0",
        "id": 7,
        "result": {"isError": false, "content": [{"type": "text", "text": "ok"}]}
    })");

    REQUIRE(result.has_value());
    REQUIRE((*result)["id"] == 7);
    REQUIRE((*result)["result"]["isError"] == false);
    REQUIRE((*result)["result"]["content"][0]["text"] == "ok");
}

TEST_CASE("parse_payload handles mixed arrays", "[json][simdjson]") {
    auto result = parse_payload(R"([1, "two", true, null, 3.14])");

    REQUIRE(result.has_value());
    REQUIRE(result->size() == 5);
    REQUIRE((*result)[0] == 1);
    REQUIRE((*result)[1] == "two");
    REQUIRE((*result)[2] == true);
    REQUIRE((*result)[3].is_null());
    REQUIRE_THAT((*result)[4].get<double>(), Catch::Matchers::WithinRel(3.14, 0.001));
}

TEST_CASE("parse_payload accepts scalar documents", "[json][simdjson]") {
    auto number = parse_payload("42");
    REQUIRE(number.has_value());
    REQUIRE(*number == 42);

    auto negative = parse_payload("-17");
    REQUIRE(negative.has_value());
    REQUIRE(*negative == -17);

    auto text = parse_payload(R"("hello")");
    REQUIRE(text.has_value());
    REQUIRE(*text == "hello");

    auto flag = parse_payload("false");
    REQUIRE(flag.has_value());
    REQUIRE(*flag == false);

    auto nothing = parse_payload("null");
    REQUIRE(nothing.has_value());
    REQUIRE(nothing->is_null());
}

TEST_CASE("parse_payload keeps large unsigned values", "[json][simdjson]") {
    auto result = parse_payload(R"({"big": 18446744073709551615})");

    REQUIRE(result.has_value());
    REQUIRE((*result)["big"].get<std::uint64_t>() == 18446744073709551615ULL);
}

TEST_CASE("parse_payload unescapes strings", "[json][simdjson]") {
    auto result = parse_payload(R"({"content": "{\"a\":1}\nline"})");

    REQUIRE(result.has_value());
    REQUIRE((*result)["content"] == "{\"a\":1}\nline");
}

// ─────────────────────────────────────────────────────────────────────────────
// Failures
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("parse_payload rejects malformed input", "[json][simdjson]") {
    REQUIRE(parse_payload(R"({"key": )").has_value() == false);
    REQUIRE(parse_payload("not json").has_value() == false);
    REQUIRE(parse_payload("").has_value() == false);
}

TEST_CASE("parse_payload rejects trailing content", "[json][simdjson]") {
    auto result = parse_payload(R"({"a": 1} junk)");

    REQUIRE(result.has_value() == false);
    REQUIRE(result.error().message.empty() == false);
}

TEST_CASE("PayloadParser enforces the depth limit", "[json][simdjson]") {
    PayloadParser parser(PayloadParserConfig{.max_depth = 3});

    REQUIRE(parser.parse(R"({"a": {"b": 1}})").has_value());
    REQUIRE(parser.parse(R"({"a": {"b": {"c": {"d": 1}}}})").has_value() == false);
}

TEST_CASE("parse_payload_object requires an object", "[json][simdjson]") {
    REQUIRE(parse_payload_object(R"({"tool": "x"})").has_value());

    auto array = parse_payload_object("[1, 2]");
    REQUIRE(array.has_value() == false);
    REQUIRE(array.error().message == "Expected a JSON object");

    REQUIRE(parse_payload_object("12").has_value() == false);
}

TEST_CASE("parse_payload is reusable across calls", "[json][simdjson]") {
    for (int i = 0; i < 10; ++i) {
        auto result = parse_payload(R"({"id": )" + std::to_string(i) + "}");
        REQUIRE(result.has_value());
        REQUIRE((*result)["id"] == i);
    }
}
