#include "lensbridge/server/bridge_server.hpp"

#include "lensbridge/json/payload_json.hpp"
#include "lensbridge/log/logger.hpp"

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/beast/core.hpp>

#include <csignal>
#include <memory>

namespace lensbridge {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
using tcp = asio::ip::tcp;

namespace {

constexpr std::chrono::seconds kReadTimeout{30};

std::string_view path_of(boost::beast::string_view raw_target) {
    std::string_view target(raw_target.data(), raw_target.size());
    const auto query_pos = target.find('?');
    if (query_pos != std::string_view::npos) {
        target = target.substr(0, query_pos);
    }
    return target;
}

// ─────────────────────────────────────────────────────────────────────────────
// Connection
// ─────────────────────────────────────────────────────────────────────────────
// Reads one request, writes one response, closes.

class Connection : public std::enable_shared_from_this<Connection> {
public:
    Connection(tcp::socket&& socket, BridgeServer& server)
        : stream_(std::move(socket))
        , server_(server)
    {}

    void run() {
        stream_.expires_after(kReadTimeout);
        http::async_read(stream_, buffer_, request_,
            beast::bind_front_handler(&Connection::on_read, shared_from_this()));
    }

private:
    void on_read(beast::error_code ec, std::size_t /*bytes_transferred*/) {
        if (ec == http::error::end_of_stream) {
            close();
            return;
        }
        if (ec) {
            get_logger().debug_fmt("Request read failed: {}", ec.message());
            return;
        }

        response_ = server_.handle(request_);
        response_.keep_alive(false);
        response_.prepare_payload();

        stream_.expires_after(kReadTimeout);
        http::async_write(stream_, response_,
            beast::bind_front_handler(&Connection::on_write, shared_from_this()));
    }

    void on_write(beast::error_code ec, std::size_t /*bytes_transferred*/) {
        if (ec) {
            get_logger().debug_fmt("Response write failed: {}", ec.message());
        }
        close();
    }

    void close() {
        beast::error_code ec;
        stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
    }

    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    HttpRequest request_;
    HttpResponse response_;
    BridgeServer& server_;
};

// ─────────────────────────────────────────────────────────────────────────────
// Listener
// ─────────────────────────────────────────────────────────────────────────────

class Listener : public std::enable_shared_from_this<Listener> {
public:
    Listener(asio::io_context& ioc, BridgeServer& server)
        : ioc_(ioc)
        , acceptor_(ioc)
        , server_(server)
    {}

    // Throws boost::system::system_error
    std::uint16_t open(const tcp::endpoint& endpoint) {
        acceptor_.open(endpoint.protocol());
        acceptor_.set_option(asio::socket_base::reuse_address(true));
        acceptor_.bind(endpoint);
        acceptor_.listen(asio::socket_base::max_listen_connections);
        return acceptor_.local_endpoint().port();
    }

    void run() {
        do_accept();
    }

private:
    void do_accept() {
        acceptor_.async_accept(ioc_,
            beast::bind_front_handler(&Listener::on_accept, shared_from_this()));
    }

    void on_accept(beast::error_code ec, tcp::socket socket) {
        if (ec == asio::error::operation_aborted) {
            return;
        }
        if (ec) {
            get_logger().warn_fmt("Accept failed: {}", ec.message());
        } else {
            std::make_shared<Connection>(std::move(socket), server_)->run();
        }
        do_accept();
    }

    asio::io_context& ioc_;
    tcp::acceptor acceptor_;
    BridgeServer& server_;
};

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// Construction
// ─────────────────────────────────────────────────────────────────────────────

BridgeServer::BridgeServer(SessionClient& client, BridgeConfig config)
    : client_(client)
    , config_(std::move(config))
{}

BridgeServer::~BridgeServer() {
    stop();
}

// ─────────────────────────────────────────────────────────────────────────────
// Serving
// ─────────────────────────────────────────────────────────────────────────────

void BridgeServer::run() {
    const auto address = asio::ip::make_address(config_.host);
    const tcp::endpoint endpoint{address, config_.port};

    auto listener = std::make_shared<Listener>(ioc_, *this);
    bound_port_.store(listener->open(endpoint));
    listener->run();

    asio::signal_set signals(ioc_, SIGINT, SIGTERM);
    signals.async_wait([this](const boost::system::error_code& ec, int signal_number) {
        if (!ec) {
            get_logger().info_fmt("Received signal {}, shutting down", signal_number);
            stop();
        }
    });

    get_logger().info_fmt("Bridge server running at http://{}:{}", config_.host, bound_port());
    ioc_.run();
    LENSBRIDGE_LOG_INFO("Bridge server stopped");
}

void BridgeServer::stop() {
    ioc_.stop();
}

// ─────────────────────────────────────────────────────────────────────────────
// Routing
// ─────────────────────────────────────────────────────────────────────────────

HttpResponse BridgeServer::handle(const HttpRequest& request) {
    HttpResponse response;
    try {
        response = route(request);
    } catch (const std::exception& e) {
        get_logger().error_fmt("Error handling {} {}: {}",
            std::string(request.method_string().data(), request.method_string().size()),
            std::string(path_of(request.target())), e.what());
        response = error_response(request, http::status::internal_server_error, e.what());
    }
    apply_cors(response);
    return response;
}

HttpResponse BridgeServer::route(const HttpRequest& request) {
    const auto method = request.method();
    if (method == http::verb::options) {
        HttpResponse response{http::status::ok, request.version()};
        response.prepare_payload();
        return response;
    }

    const auto path = path_of(request.target());
    const bool is_get = (method == http::verb::get);
    const bool is_post = (method == http::verb::post);

    if (path == "/") {
        return is_get ? handle_info(request)
                      : error_response(request, http::status::method_not_allowed, "Method not allowed");
    }
    if (path == "/health") {
        return is_get ? handle_health(request)
                      : error_response(request, http::status::method_not_allowed, "Method not allowed");
    }
    if (path == "/tools") {
        return is_get ? handle_list_tools(request)
                      : error_response(request, http::status::method_not_allowed, "Method not allowed");
    }
    if (path == "/call") {
        return is_post ? handle_tool_call(request)
                       : error_response(request, http::status::method_not_allowed, "Method not allowed");
    }

    return error_response(request, http::status::not_found, "Not found");
}

// ─────────────────────────────────────────────────────────────────────────────
// Handlers
// ─────────────────────────────────────────────────────────────────────────────

HttpResponse BridgeServer::handle_info(const HttpRequest& request) {
    const auto session_id = client_.session_id();

    Json body = Json::object();
    body["name"] = config_.name;
    body["version"] = config_.version;
    body["description"] = config_.description;
    body["upstream"] = client_.config().base_url;
    body["session_id"] = session_id.has_value() ? Json(*session_id) : Json(nullptr);
    body["endpoints"] = Json{
        {"/", "This info page"},
        {"/health", "Health check"},
        {"/tools", "List available tools"},
        {"/call", "Call a tool (POST)"}
    };
    return json_response(request, http::status::ok, body);
}

HttpResponse BridgeServer::handle_health(const HttpRequest& request) {
    const Json body{
        {"status", "healthy"},
        {"upstream", client_.config().base_url},
        {"sessionEstablished", client_.session_established()}
    };
    return json_response(request, http::status::ok, body);
}

HttpResponse BridgeServer::handle_list_tools(const HttpRequest& request) {
    return json_response(request, http::status::ok, client_.list_tools());
}

HttpResponse BridgeServer::handle_tool_call(const HttpRequest& request) {
    auto body = parse_payload_object(request.body());
    if (!body) {
        get_logger().debug_fmt("Rejected /call body: {}", body.error().message);
        return error_response(request, http::status::bad_request, "Invalid JSON");
    }

    const auto tool_it = body->find("tool");
    const bool has_tool = (tool_it != body->end()) && tool_it->is_string() &&
                          (tool_it->get_ref<const std::string&>().empty() == false);
    if (has_tool == false) {
        return error_response(request, http::status::bad_request, "Missing tool parameter");
    }
    const auto tool = tool_it->get<std::string>();

    Json arguments = Json::object();
    const auto arguments_it = body->find("arguments");
    if ((arguments_it != body->end()) && (arguments_it->is_null() == false)) {
        if (arguments_it->is_object() == false) {
            return error_response(request, http::status::bad_request, "Invalid arguments");
        }
        arguments = *arguments_it;
    }

    get_logger().info_fmt("Calling tool: {}", tool);
    const auto result = client_.call(tool, arguments);

    // Tools answer with text that is usually JSON; pass it through as such
    const auto result_it = result.find("result");
    const bool has_result = (result_it != result.end()) && result_it->is_object();
    if (has_result) {
        const auto content_it = result_it->find("content");
        const bool has_text = (content_it != result_it->end()) && content_it->is_string();
        if (has_text) {
            const auto& content = content_it->get_ref<const std::string&>();
            auto parsed = parse_payload(content);
            if (parsed) {
                return json_response(request, http::status::ok, *parsed);
            }
            return text_response(request, http::status::ok, content);
        }
    }

    return json_response(request, http::status::ok, result);
}

// ─────────────────────────────────────────────────────────────────────────────
// Response Helpers
// ─────────────────────────────────────────────────────────────────────────────

HttpResponse BridgeServer::json_response(
    const HttpRequest& request, http::status status, const Json& body
) {
    HttpResponse response{status, request.version()};
    response.set(http::field::content_type, "application/json");
    response.body() = body.dump();
    response.prepare_payload();
    return response;
}

HttpResponse BridgeServer::text_response(
    const HttpRequest& request, http::status status, std::string body
) {
    HttpResponse response{status, request.version()};
    response.set(http::field::content_type, "text/plain; charset=utf-8");
    response.body() = std::move(body);
    response.prepare_payload();
    return response;
}

HttpResponse BridgeServer::error_response(
    const HttpRequest& request, http::status status, std::string_view message
) {
    return json_response(request, status, Json{{"error", std::string(message)}});
}

void BridgeServer::apply_cors(HttpResponse& response) {
    response.set(http::field::access_control_allow_origin, "*");
    response.set(http::field::access_control_allow_methods, "GET, POST, OPTIONS");
    response.set(http::field::access_control_allow_headers, "Content-Type");
}

}  // namespace lensbridge
