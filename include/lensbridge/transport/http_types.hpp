#pragma once

#include <ada.h>

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <optional>
#include <ranges>
#include <string>
#include <string_view>
#include <unordered_map>

namespace lensbridge {

// ─────────────────────────────────────────────────────────────────────────────
// Headers
// ─────────────────────────────────────────────────────────────────────────────
// HTTP header names are case-insensitive (RFC 7230); lookups go through
// find_header() so "content-type" from the device matches "Content-Type".

using HeaderMap = std::unordered_map<std::string, std::string>;

inline HeaderMap::const_iterator find_header(
    const HeaderMap& headers,
    std::string_view name
) {
    return std::ranges::find_if(headers,
        [&name](const auto& pair) {
            const auto& key = pair.first;
            return key.size() == name.size() &&
                   std::ranges::equal(key, name,
                       [](char a, char b) {
                           return std::tolower(static_cast<unsigned char>(a)) ==
                                  std::tolower(static_cast<unsigned char>(b));
                       });
        });
}

inline std::optional<std::string> get_header(
    const HeaderMap& headers,
    std::string_view name
) {
    const auto it = find_header(headers, name);
    if (it != headers.end()) {
        return it->second;
    }
    return std::nullopt;
}

// ─────────────────────────────────────────────────────────────────────────────
// HTTP Method
// ─────────────────────────────────────────────────────────────────────────────
// Upstream uses GET (open the session stream) and POST (message endpoint and
// stream fallback).

enum class HttpMethod {
    Get,
    Post
};

inline std::string to_string(HttpMethod method) {
    switch (method) {
        case HttpMethod::Get:  return "GET";
        case HttpMethod::Post: return "POST";
    }
    return "UNKNOWN";
}

// ─────────────────────────────────────────────────────────────────────────────
// Upstream URL
// ─────────────────────────────────────────────────────────────────────────────

struct UrlComponents {
    std::string scheme;   // "http" or "https"
    std::string host;     // "192.168.1.161"
    std::uint16_t port;   // explicit port or scheme default
    std::string path;     // path prefix, "" when the base URL has none

    [[nodiscard]] bool is_secure() const {
        return scheme == "https";
    }

    [[nodiscard]] std::string origin() const {
        return scheme + "://" + host + ":" + std::to_string(port);
    }

    // Origin plus path prefix, without a trailing slash; upstream paths such
    // as "/sse" are appended to this verbatim.
    [[nodiscard]] std::string base() const {
        return origin() + path;
    }
};

// Parse an http(s) base URL with ada. A trailing "/" on the path is dropped.
// Returns nullopt for invalid URLs and non-HTTP schemes.
std::optional<UrlComponents> parse_url(const std::string& url);

struct ResolvedEndpoint {
    std::string url;     // absolute, normalized by ada
    std::string target;  // path and query, sent relative to the origin
};

// Resolve an endpoint announced by the device against the base URL.
// Absolute http(s) URLs are kept, paths are appended to the base prefix.
// Returns nullopt when the result is not a valid URL.
std::optional<ResolvedEndpoint> resolve_endpoint(const UrlComponents& base, std::string_view endpoint);

}  // namespace lensbridge
