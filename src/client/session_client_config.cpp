#include "lensbridge/client/session_client_config.hpp"

namespace lensbridge {

SessionClientConfig& SessionClientConfig::with_base_url(std::string url) {
    base_url = std::move(url);
    return *this;
}

SessionClientConfig& SessionClientConfig::with_header(const std::string& name, const std::string& value) {
    default_headers[name] = value;
    return *this;
}

SessionClientConfig& SessionClientConfig::with_connect_timeout(std::chrono::milliseconds timeout) {
    connect_timeout = timeout;
    return *this;
}

SessionClientConfig& SessionClientConfig::with_call_timeout(std::chrono::milliseconds timeout) {
    call_timeout = timeout;
    return *this;
}

SessionClientConfig& SessionClientConfig::with_stream_timeout(std::chrono::milliseconds timeout) {
    stream_timeout = timeout;
    return *this;
}

SessionClientConfig& SessionClientConfig::with_list_tools(std::string name, Json arguments) {
    list_tools_name = std::move(name);
    list_tools_arguments = std::move(arguments);
    return *this;
}

}  // namespace lensbridge
