#include "lensbridge/protocol/tool_result.hpp"

#include "lensbridge/log/logger.hpp"

namespace lensbridge {

Content content_from_json(const Json& item) {
    if (item.is_object() == false) {
        return OtherContent{};
    }

    const auto type_it = item.find("type");
    const bool has_type = (type_it != item.end()) && type_it->is_string();
    if (has_type == false) {
        return OtherContent{};
    }

    const auto type = type_it->get<std::string>();
    // A text item without usable text still contributes an empty fragment
    if (type == "text") {
        return TextContent::from_json(item);
    }
    if (type == "resource_link") {
        return ResourceLink::from_json(item);
    }
    return OtherContent{type};
}

ToolResult ToolResult::from_json(const Json& result) {
    ToolResult parsed;

    const auto error_it = result.find("isError");
    if ((error_it != result.end()) && error_it->is_boolean()) {
        parsed.is_error = error_it->get<bool>();
    }

    const auto content_it = result.find("content");
    if (content_it == result.end()) {
        return parsed;
    }

    if (content_it->is_array()) {
        for (const auto& item : *content_it) {
            parsed.content.push_back(content_from_json(item));
        }
    } else if (content_it->is_string()) {
        parsed.content.push_back(TextContent{content_it->get<std::string>()});
    }

    return parsed;
}

std::string ToolResult::text() const {
    std::string joined;
    bool first = true;
    for (const auto& item : content) {
        const auto* text = std::get_if<TextContent>(&item);
        if (text == nullptr) {
            continue;
        }
        if (first == false) {
            joined += '\n';
        }
        joined += text->text;
        first = false;
    }
    return joined;
}

std::size_t ToolResult::dropped_count() const {
    std::size_t count = 0;
    for (const auto& item : content) {
        if (std::holds_alternative<TextContent>(item) == false) {
            ++count;
        }
    }
    return count;
}

Json ToolResult::to_json() const {
    return Json{{"isError", is_error}, {"content", text()}};
}

namespace {

void log_dropped_items(const ToolResult& result) {
    auto& logger = get_logger();
    for (const auto& item : result.content) {
        if (const auto* link = std::get_if<ResourceLink>(&item)) {
            logger.info_fmt("Resource link: {} ({})", link->name, link->uri);
        } else if (const auto* other = std::get_if<OtherContent>(&item)) {
            logger.debug_fmt("Dropped non-text content item (type '{}')", other->type);
        }
    }
}

}  // namespace

Json normalize_response(const Json& envelope) {
    if (envelope.is_object() == false) {
        return envelope;
    }
    if (is_error_envelope(envelope)) {
        return envelope;
    }

    const auto result_it = envelope.find("result");
    const Json result = (result_it != envelope.end()) ? *result_it : Json::object();
    if (result.is_object() == false) {
        return envelope;
    }

    const auto parsed = ToolResult::from_json(result);
    if (parsed.dropped_count() > 0) {
        log_dropped_items(parsed);
    }

    const auto id_it = envelope.find("id");
    Json normalized = Json::object();
    normalized["jsonrpc"] = std::string(kJsonRpcVersion);
    normalized["id"] = (id_it != envelope.end()) ? *id_it : Json(nullptr);
    normalized["result"] = parsed.to_json();
    return normalized;
}

}  // namespace lensbridge
