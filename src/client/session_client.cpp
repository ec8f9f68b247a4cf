#include "lensbridge/client/session_client.hpp"

#include "lensbridge/json/payload_json.hpp"
#include "lensbridge/log/logger.hpp"
#include "lensbridge/protocol/tool_result.hpp"

#include <stdexcept>

namespace lensbridge {

namespace {

constexpr std::string_view kJsonContentType = "application/json";

std::string describe_session(const SessionInfo& session) {
    if (session.session_id.has_value()) {
        return redact_token(*session.session_id);
    }
    return "<no id>";
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// Construction
// ─────────────────────────────────────────────────────────────────────────────

SessionClient::SessionClient(SessionClientConfig config)
    : SessionClient(std::move(config), make_http_client())
{}

SessionClient::SessionClient(SessionClientConfig config, std::unique_ptr<IHttpClient> client)
    : config_(std::move(config))
    , http_client_(std::move(client))
{
    auto parsed = parse_url(config_.base_url);
    const bool url_valid = parsed.has_value();
    if (url_valid == false) {
        throw std::invalid_argument("Invalid upstream URL: " + config_.base_url);
    }
    url_ = std::move(*parsed);

    if (http_client_ == nullptr) {
        throw std::invalid_argument("SessionClient requires an HTTP client");
    }
    configure_client();

    session_manager_.on_state_change([](SessionState old_state, SessionState new_state) {
        get_logger().debug_fmt("Session state: {} -> {}",
            to_string(old_state), to_string(new_state));
    });
    session_manager_.on_session_established([](const SessionInfo& session) {
        get_logger().info_fmt("Session established: {}", describe_session(session));
        get_logger().info_fmt("Message endpoint: {}", session.message_url);
    });
    session_manager_.on_session_lost([](const std::string& reason) {
        get_logger().warn_fmt("Session lost: {}", reason);
    });
}

SessionClient::~SessionClient() {
    stop();
}

void SessionClient::configure_client() {
    http_client_->set_base_url(url_.origin());
    http_client_->set_default_headers(config_.default_headers);
    http_client_->set_connect_timeout(config_.connect_timeout);
    http_client_->set_verify_ssl(config_.verify_ssl);
}

// ─────────────────────────────────────────────────────────────────────────────
// Lifecycle
// ─────────────────────────────────────────────────────────────────────────────

void SessionClient::start() {
    http_client_->reset();

    auto session = establish();
    if (!session) {
        get_logger().warn_fmt("Initial session establishment failed: {}", session.error().message);
        LENSBRIDGE_LOG_INFO("Session will be established on the first call");
    }
}

ClientResult<SessionInfo> SessionClient::establish() {
    session_manager_.begin_connect();
    get_logger().debug_fmt("Opening session stream {}{}", url_.origin(), session_target());

    LineBuffer lines(LineBufferConfig{config_.max_line_buffer});
    std::optional<SessionInfo> discovered;
    std::optional<std::string> scan_error;
    bool opened = false;

    auto consider = [this, &discovered](std::string_view line) -> bool {
        LENSBRIDGE_LOG_TRACE("Session stream line: " + clip_for_log(line));
        auto event = classify_line(line);
        if (event.has_value() == false) {
            return false;
        }
        discovered = session_from_event(*event);
        return discovered.has_value();
    };

    auto on_chunk = [&](std::string_view chunk) -> bool {
        if (opened == false) {
            opened = session_manager_.stream_opened();
        }
        try {
            for (const auto& line : lines.feed(chunk)) {
                if (consider(line)) {
                    return false;
                }
            }
        } catch (const StreamBufferOverflowError& e) {
            scan_error = e.what();
            return false;
        }
        return true;
    };

    auto streamed = http_client_->stream(
        HttpMethod::Get, session_target(), "", "", config_.stream_timeout, on_chunk);

    if (streamed && (discovered.has_value() == false) && (scan_error.has_value() == false)) {
        auto tail = lines.finish();
        if (tail.has_value()) {
            consider(*tail);
        }
    }

    std::string failure;
    if (!streamed) {
        failure = streamed.error().message;
    } else if (scan_error.has_value()) {
        failure = *scan_error;
    } else if (streamed->status_code != 200) {
        failure = "HTTP " + std::to_string(streamed->status_code);
    } else if (discovered.has_value() == false) {
        failure = "Stream ended without a session announcement";
    } else if (session_manager_.session_discovered(*discovered) == false) {
        failure = "Invalid session announcement";
    }

    if (failure.empty() == false) {
        session_manager_.connection_failed(failure);
        get_logger().error_fmt("Failed to establish session: {}", failure);
        return tl::unexpected(ClientError::session(failure));
    }

    return *discovered;
}

void SessionClient::stop() {
    http_client_->cancel();
    if (session_manager_.state() != SessionState::Disconnected) {
        LENSBRIDGE_LOG_INFO("Closing upstream session");
    }
    session_manager_.reset();
}

// ─────────────────────────────────────────────────────────────────────────────
// Calls
// ─────────────────────────────────────────────────────────────────────────────

Json SessionClient::call(const std::string& name, const Json& arguments) {
    if (name.empty()) {
        return ClientError::request_validation("Missing tool name").to_envelope();
    }
    const bool arguments_usable = arguments.is_object() || arguments.is_null();
    if (arguments_usable == false) {
        return ClientError::request_validation("Tool arguments must be an object").to_envelope();
    }

    auto session = ensure_session();
    if (!session) {
        return session.error().to_envelope();
    }

    const auto request = JsonRpcRequest::tool_call(next_request_id(), name, arguments);
    get_logger().debug_fmt("Calling tool '{}' (id {})", name, request.id());

    auto response = post_call(*session, request);
    if (!response) {
        get_logger().error_fmt("Tool '{}' failed: {}", name, response.error().message);
        return response.error().to_envelope();
    }
    return normalize_response(*response);
}

Json SessionClient::list_tools() {
    const auto request = JsonRpcRequest::tool_call(
        next_request_id(), config_.list_tools_name, config_.list_tools_arguments);
    get_logger().debug_fmt("Listing tools (id {})", request.id());

    auto response = stream_call(request);
    if (!response) {
        return response.error().to_envelope();
    }
    return normalize_response(*response);
}

// ─────────────────────────────────────────────────────────────────────────────
// Introspection
// ─────────────────────────────────────────────────────────────────────────────

std::optional<std::string> SessionClient::session_id() const {
    return session_manager_.session_id();
}

std::optional<std::string> SessionClient::message_url() const {
    auto session = session_manager_.session();
    if (session.has_value() == false) {
        return std::nullopt;
    }
    return session->message_url;
}

bool SessionClient::session_established() const {
    return session_manager_.is_active();
}

SessionState SessionClient::state() const {
    return session_manager_.state();
}

std::int64_t SessionClient::last_request_id() const noexcept {
    return request_id_.load();
}

// ─────────────────────────────────────────────────────────────────────────────
// Internals
// ─────────────────────────────────────────────────────────────────────────────

std::int64_t SessionClient::next_request_id() {
    return request_id_.fetch_add(1) + 1;
}

std::string SessionClient::session_target() const {
    return url_.path + config_.session_path;
}

std::optional<SessionInfo> SessionClient::session_from_event(const StreamEvent& event) const {
    SessionInfo session;
    std::string_view endpoint;

    if (const auto* token = std::get_if<SessionToken>(&event)) {
        session.session_id = token->session_id;
        endpoint = token->endpoint_path;
    } else if (const auto* path = std::get_if<MessagePath>(&event)) {
        endpoint = path->endpoint_path;
    } else {
        return std::nullopt;
    }

    auto resolved = resolve_endpoint(url_, endpoint);
    if (resolved.has_value() == false) {
        get_logger().warn_fmt("Ignoring unusable message endpoint: {}", clip_for_log(endpoint));
        return std::nullopt;
    }

    // Requests go to the configured origin only
    const auto resolved_url = parse_url(resolved->url);
    const bool same_origin = resolved_url.has_value() && (resolved_url->origin() == url_.origin());
    if (same_origin == false) {
        get_logger().warn_fmt("Ignoring message endpoint on another origin: {}", clip_for_log(endpoint));
        return std::nullopt;
    }

    session.endpoint_target = std::move(resolved->target);
    session.message_url = std::move(resolved->url);
    return session;
}

ClientResult<SessionInfo> SessionClient::ensure_session() {
    auto current = session_manager_.session();
    if (current.has_value() && session_manager_.is_active()) {
        return *current;
    }

    LENSBRIDGE_LOG_INFO("No active session, establishing one");
    auto established = establish();
    if (!established) {
        return tl::unexpected(ClientError::establish_failed());
    }
    return established;
}

ClientResult<Json> SessionClient::post_call(const SessionInfo& session, const JsonRpcRequest& request) {
    const auto body = request.to_json().dump();
    LENSBRIDGE_LOG_TRACE("POST body: " + clip_for_log(body, 512));

    auto posted = http_client_->post(
        session.endpoint_target, body, std::string(kJsonContentType), config_.call_timeout);

    if (!posted) {
        const auto& error = posted.error();
        if (error.code == HttpClientError::Code::Timeout) {
            get_logger().warn_fmt("Request {} timed out", request.id());
            return tl::unexpected(ClientError::timeout());
        }
        if (error.code != HttpClientError::Code::Cancelled) {
            recover_session(error.message);
        }
        return tl::unexpected(ClientError::transport(error.message));
    }

    if (posted->status_code != 200) {
        get_logger().warn_fmt("Message endpoint returned HTTP {}", posted->status_code);
        return tl::unexpected(ClientError::upstream_http(posted->status_code));
    }

    auto decoded = decode_post_body(posted->body);
    if (!decoded) {
        return tl::unexpected(decoded.error());
    }
    if (decoded->has_value()) {
        return std::move(**decoded);
    }

    get_logger().debug_fmt("Response body for request {} carries no envelope, reading the stream", request.id());
    return stream_call(request);
}

ClientResult<std::optional<Json>> SessionClient::decode_post_body(const std::string& body) const {
    if (body.starts_with(kDataPrefix)) {
        LineBuffer lines(LineBufferConfig{config_.max_line_buffer});
        std::vector<std::string> all_lines;
        try {
            all_lines = lines.feed(body);
        } catch (const StreamBufferOverflowError& e) {
            return tl::unexpected(ClientError::protocol_decode(e.what()));
        }
        auto tail = lines.finish();
        if (tail.has_value()) {
            all_lines.push_back(std::move(*tail));
        }

        for (const auto& line : all_lines) {
            auto event = classify_line(line);
            if (event.has_value() == false) {
                continue;
            }
            auto* payload = std::get_if<JsonPayload>(&*event);
            if ((payload != nullptr) && payload->value.is_object()) {
                return std::optional<Json>(std::move(payload->value));
            }
            if (auto* unrecognized = std::get_if<Unrecognized>(&*event)) {
                get_logger().debug_fmt("Skipping response line: {} ({})",
                    clip_for_log(unrecognized->data), unrecognized->reason);
            }
        }
        return tl::unexpected(ClientError::no_response());
    }

    auto direct = parse_payload_object(body);
    if (direct) {
        return std::optional<Json>(std::move(*direct));
    }
    return std::optional<Json>{};
}

ClientResult<Json> SessionClient::stream_call(const JsonRpcRequest& request) {
    const std::int64_t request_id = request.id();

    LineBuffer lines(LineBufferConfig{config_.max_line_buffer});
    std::optional<Json> matched;
    std::optional<std::string> scan_error;

    // true ends the scan
    auto consider = [&matched, request_id](std::string_view line) -> bool {
        auto event = classify_line(line);
        if (event.has_value() == false) {
            return false;
        }

        if (std::holds_alternative<Sentinel>(*event)) {
            LENSBRIDGE_LOG_TRACE("Stream sentinel reached");
            return true;
        }
        if (auto* payload = std::get_if<JsonPayload>(&*event)) {
            const bool is_match = payload->value.is_object() &&
                                  (response_id(payload->value) == request_id);
            if (is_match) {
                matched = std::move(payload->value);
                return true;
            }
            get_logger().debug_fmt("Skipping stream payload: {}", clip_for_log(payload->value.dump()));
            return false;
        }
        if (auto* unrecognized = std::get_if<Unrecognized>(&*event)) {
            get_logger().debug_fmt("Skipping stream line: {} ({})",
                clip_for_log(unrecognized->data), unrecognized->reason);
            return false;
        }
        if (auto* number = std::get_if<PositionalNumber>(&*event)) {
            get_logger().trace_fmt("Skipping positional number {}", number->value);
            return false;
        }
        LENSBRIDGE_LOG_DEBUG("Skipping session announcement on the response stream");
        return false;
    };

    auto on_chunk = [&](std::string_view chunk) -> bool {
        try {
            for (const auto& line : lines.feed(chunk)) {
                if (consider(line)) {
                    return false;
                }
            }
        } catch (const StreamBufferOverflowError& e) {
            scan_error = e.what();
            return false;
        }
        return true;
    };

    auto streamed = http_client_->stream(
        HttpMethod::Post, session_target(), request.to_json().dump(),
        std::string(kJsonContentType), config_.stream_timeout, on_chunk);

    if (matched.has_value()) {
        return std::move(*matched);
    }

    if (!streamed) {
        const auto& error = streamed.error();
        if (error.code == HttpClientError::Code::Timeout) {
            get_logger().warn_fmt("No response for request {} within the stream timeout", request_id);
            return tl::unexpected(ClientError::no_response());
        }
        return tl::unexpected(ClientError::transport(error.message));
    }
    if (scan_error.has_value()) {
        return tl::unexpected(ClientError::protocol_decode(*scan_error));
    }

    if (streamed->stopped_by_handler == false) {
        auto tail = lines.finish();
        if (tail.has_value() && consider(*tail) && matched.has_value()) {
            return std::move(*matched);
        }
    }

    get_logger().warn_fmt("No response received for request {} (HTTP {})", request_id, streamed->status_code);
    return tl::unexpected(ClientError::no_response());
}

void SessionClient::recover_session(const std::string& reason) {
    session_manager_.invalidate(reason);

    LENSBRIDGE_LOG_INFO("Re-establishing session");
    auto session = establish();
    if (!session) {
        get_logger().warn_fmt("Session recovery failed: {}", session.error().message);
    }
}

}  // namespace lensbridge
