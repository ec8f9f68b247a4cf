#include "lensbridge/transport/http_client.hpp"

#include <cpr/cpr.h>

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <vector>

namespace lensbridge {

// ─────────────────────────────────────────────────────────────────────────────
// CprHttpClient
// ─────────────────────────────────────────────────────────────────────────────
// cpr (libcurl underneath) for both buffered POSTs and streamed bodies.
// Streaming uses cpr::WriteCallback: returning false from the callback makes
// curl abort the transfer, which is how a scan closes the stream early.

class CprHttpClient : public IHttpClient {
public:
    CprHttpClient() = default;
    ~CprHttpClient() override = default;

    void set_base_url(const std::string& url) override {
        base_url_ = url;
    }

    void set_default_headers(const HeaderMap& headers) override {
        default_headers_ = headers;
    }

    void set_connect_timeout(std::chrono::milliseconds timeout) override {
        connect_timeout_ = timeout;
    }

    void set_verify_ssl(bool verify) override {
        verify_ssl_ = verify;
    }

    HttpClientResult<HttpClientResponse> post(
        const std::string& path,
        const std::string& body,
        const std::string& content_type,
        std::chrono::milliseconds timeout,
        const HeaderMap& headers
    ) override {
        if (cancelled_.load()) {
            return tl::unexpected(HttpClientError::cancelled());
        }

        auto url = build_url(path);
        if (!url) {
            return tl::unexpected(url.error());
        }

        auto request_headers = build_headers(headers);
        request_headers["Content-Type"] = content_type;

        auto response = cpr::Post(
            cpr::Url{*url},
            request_headers,
            cpr::Body{body},
            cpr::ConnectTimeout{connect_timeout_},
            cpr::Timeout{timeout},
            cpr::VerifySsl{verify_ssl_}
        );

        if (response.error.code != cpr::ErrorCode::OK) {
            return tl::unexpected(map_error(response.error));
        }

        HttpClientResponse result;
        result.status_code = static_cast<int>(response.status_code);
        result.body = response.text;
        for (const auto& [name, value] : response.header) {
            result.headers[name] = value;
        }
        return result;
    }

    HttpClientResult<HttpStreamResponse> stream(
        HttpMethod method,
        const std::string& path,
        const std::string& body,
        const std::string& content_type,
        std::chrono::milliseconds timeout,
        const ChunkHandler& on_chunk,
        const HeaderMap& headers
    ) override {
        if (cancelled_.load()) {
            return tl::unexpected(HttpClientError::cancelled());
        }

        auto url = build_url(path);
        if (!url) {
            return tl::unexpected(url.error());
        }

        auto request_headers = build_headers(headers);
        request_headers["Accept"] = "text/event-stream";

        bool stopped_by_handler = false;
        auto write_callback = cpr::WriteCallback{
            [&on_chunk, &stopped_by_handler, this](std::string_view data, std::intptr_t /*userdata*/) -> bool {
                if (cancelled_.load()) {
                    stopped_by_handler = true;
                    return false;
                }
                const bool keep_reading = on_chunk(data);
                if (keep_reading == false) {
                    stopped_by_handler = true;
                }
                return keep_reading;
            }
        };

        cpr::Session session;
        session.SetUrl(cpr::Url{*url});
        session.SetConnectTimeout(cpr::ConnectTimeout{connect_timeout_});
        session.SetTimeout(cpr::Timeout{timeout});
        session.SetVerifySsl(cpr::VerifySsl{verify_ssl_});
        session.SetWriteCallback(write_callback);

        cpr::Response response;
        if (method == HttpMethod::Post) {
            request_headers["Content-Type"] = content_type;
            session.SetHeader(request_headers);
            session.SetBody(cpr::Body{body});
            response = session.Post();
        } else {
            session.SetHeader(request_headers);
            response = session.Get();
        }

        // An abort requested by the handler surfaces from curl as a write
        // error; that is a normal end of scan, not a transport failure.
        const bool failed = (response.error.code != cpr::ErrorCode::OK);
        if (failed && (stopped_by_handler == false)) {
            return tl::unexpected(map_error(response.error));
        }

        HttpStreamResponse result;
        result.status_code = static_cast<int>(response.status_code);
        result.stopped_by_handler = stopped_by_handler;
        for (const auto& [name, value] : response.header) {
            result.headers[name] = value;
        }
        return result;
    }

    void cancel() override {
        // In-flight buffered requests run to completion; streams stop at the
        // next chunk.
        cancelled_.store(true);
    }

    void reset() override {
        cancelled_.store(false);
    }

private:
    // ─────────────────────────────────────────────────────────────────────────
    // Request target validation
    // ─────────────────────────────────────────────────────────────────────────
    // The message endpoint is announced by the device, so its target is
    // checked before being appended to the base URL: no control characters,
    // no dot segments (literal or percent-encoded).

    static bool contains_control_characters(std::string_view target) {
        return std::ranges::any_of(target, [](unsigned char c) {
            return (c < 0x20) || (c == 0x7F);
        });
    }

    static bool contains_dot_segment(std::string_view path) {
        std::string lower(path);
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        return (lower.find("..") != std::string::npos) ||
               (lower.find("%2e%2e") != std::string::npos) ||
               (lower.find("%2e.") != std::string::npos) ||
               (lower.find(".%2e") != std::string::npos) ||
               (lower.find("%252e") != std::string::npos);
    }

    HttpClientResult<std::string> build_url(const std::string& target) const {
        if (target.empty() || target.front() != '/') {
            return tl::unexpected(HttpClientError::invalid_request(
                "Request target must start with '/': " + target));
        }
        if (contains_control_characters(target)) {
            return tl::unexpected(HttpClientError::invalid_request(
                "Request target contains control characters"));
        }

        // Only the path part is checked; query values are opaque tokens
        const auto query_pos = target.find('?');
        const std::string_view path = std::string_view(target).substr(0, query_pos);
        if (contains_dot_segment(path)) {
            return tl::unexpected(HttpClientError::invalid_request(
                "Request target contains a dot segment: " + target));
        }

        return base_url_ + target;
    }

    cpr::Header build_headers(const HeaderMap& extra_headers) const {
        cpr::Header cpr_headers;
        for (const auto& [name, value] : default_headers_) {
            cpr_headers[name] = value;
        }
        for (const auto& [name, value] : extra_headers) {
            cpr_headers[name] = value;
        }
        return cpr_headers;
    }

    static HttpClientError map_error(const cpr::Error& error) {
        const std::string& msg = error.message;
        const bool is_ssl_error =
            (msg.find("SSL") != std::string::npos) ||
            (msg.find("ssl") != std::string::npos) ||
            (msg.find("certificate") != std::string::npos) ||
            (msg.find("TLS") != std::string::npos);
        if (is_ssl_error) {
            return HttpClientError::ssl_error(msg);
        }

        switch (error.code) {
            case cpr::ErrorCode::OK:
                return HttpClientError::unknown("No error");

            case cpr::ErrorCode::OPERATION_TIMEDOUT:
                return HttpClientError::timeout(msg);

            case cpr::ErrorCode::SSL_CONNECT_ERROR:
                return HttpClientError::ssl_error(msg);

            default:
                return HttpClientError::connection_failed(msg);
        }
    }

    std::string base_url_;
    HeaderMap default_headers_;
    std::chrono::milliseconds connect_timeout_{10000};
    bool verify_ssl_{true};

    std::atomic<bool> cancelled_{false};
};

std::unique_ptr<IHttpClient> make_http_client() {
    return std::make_unique<CprHttpClient>();
}

}  // namespace lensbridge
