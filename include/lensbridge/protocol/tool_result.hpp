#pragma once

#include "lensbridge/protocol/json_rpc.hpp"

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace lensbridge {

// ═══════════════════════════════════════════════════════════════════════════
// Tool Result Content
// ═══════════════════════════════════════════════════════════════════════════
// The device answers tool calls with a mix of text items and references to
// images it stored ("resource_link"). Only text reaches REST callers; links
// are logged so an operator can still find the snapshot.

struct TextContent {
    std::string text;

    static TextContent from_json(const Json& j) {
        TextContent content;
        const auto it = j.find("text");
        if ((it != j.end()) && it->is_string()) {
            content.text = it->get<std::string>();
        }
        return content;
    }
};

struct ResourceLink {
    std::string name;
    std::string uri;
    std::optional<std::string> mime_type;

    static ResourceLink from_json(const Json& j) {
        ResourceLink link;
        if (j.contains("name") && j["name"].is_string()) {
            link.name = j["name"].get<std::string>();
        }
        if (j.contains("uri") && j["uri"].is_string()) {
            link.uri = j["uri"].get<std::string>();
        }
        if (j.contains("mimeType") && j["mimeType"].is_string()) {
            link.mime_type = j["mimeType"].get<std::string>();
        }
        return link;
    }
};

/// Anything else: images, audio, embedded resources, malformed items
struct OtherContent {
    std::string type;  // "" when the item had no string "type"
};

using Content = std::variant<TextContent, ResourceLink, OtherContent>;

[[nodiscard]] Content content_from_json(const Json& item);

// ═══════════════════════════════════════════════════════════════════════════
// ToolResult
// ═══════════════════════════════════════════════════════════════════════════

struct ToolResult {
    bool is_error = false;
    std::vector<Content> content;

    /// Reads `isError` (non-boolean counts as false) and `content`, which may
    /// be a list of items or a bare string (one text item).
    static ToolResult from_json(const Json& result);

    /// Text items joined by "\n", in order
    [[nodiscard]] std::string text() const;

    /// Number of items that are not text
    [[nodiscard]] std::size_t dropped_count() const;

    /// {"isError":..,"content":"<text()>"}
    [[nodiscard]] Json to_json() const;
};

// ─────────────────────────────────────────────────────────────────────────────
// Response Normalization
// ─────────────────────────────────────────────────────────────────────────────

/// Collapse a decoded response envelope into
///   {"jsonrpc":"2.0","id":<id>,"result":{"isError":bool,"content":"text"}}
///
/// Error envelopes and non-object results pass through unchanged. A missing
/// result counts as {}. Dropped non-text items are logged. Applying it twice
/// gives the same envelope as applying it once.
[[nodiscard]] Json normalize_response(const Json& envelope);

}  // namespace lensbridge
