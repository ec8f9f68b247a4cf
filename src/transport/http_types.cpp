#include "lensbridge/transport/http_types.hpp"

namespace lensbridge {

namespace {

std::string scheme_of(const ada::url& parsed) {
    std::string scheme = std::string(parsed.get_protocol());
    // ada reports "http:" including the colon
    const bool has_colon = (scheme.empty() == false) && (scheme.back() == ':');
    if (has_colon) {
        scheme.pop_back();
    }
    return scheme;
}

}  // namespace

std::optional<UrlComponents> parse_url(const std::string& url) {
    auto parsed = ada::parse<ada::url>(url);
    if (parsed.has_value() == false) {
        return std::nullopt;
    }

    const auto& ada_url = parsed.value();

    std::string scheme = scheme_of(ada_url);
    const bool is_http = (scheme == "http");
    const bool is_https = (scheme == "https");
    if ((is_http || is_https) == false) {
        return std::nullopt;
    }

    std::string host = std::string(ada_url.get_hostname());
    if (host.empty()) {
        return std::nullopt;
    }

    std::uint16_t port = is_https ? 443 : 80;
    const auto port_str = ada_url.get_port();
    if (port_str.empty() == false) {
        port = static_cast<std::uint16_t>(std::stoi(std::string(port_str)));
    }

    std::string path = std::string(ada_url.get_pathname());
    while ((path.empty() == false) && (path.back() == '/')) {
        path.pop_back();
    }

    UrlComponents result;
    result.scheme = std::move(scheme);
    result.host = std::move(host);
    result.port = port;
    result.path = std::move(path);
    return result;
}

std::optional<ResolvedEndpoint> resolve_endpoint(const UrlComponents& base, std::string_view endpoint) {
    const bool is_absolute = endpoint.starts_with("http://") || endpoint.starts_with("https://");

    std::string candidate;
    if (is_absolute) {
        candidate = std::string(endpoint);
    } else {
        candidate = base.base();
        if (endpoint.starts_with("/") == false) {
            candidate += '/';
        }
        candidate += endpoint;
    }

    auto parsed = ada::parse<ada::url>(candidate);
    if (parsed.has_value() == false) {
        return std::nullopt;
    }
    ResolvedEndpoint resolved;
    resolved.url = std::string(parsed->get_href());
    resolved.target = std::string(parsed->get_pathname()) + std::string(parsed->get_search());
    return resolved;
}

}  // namespace lensbridge
