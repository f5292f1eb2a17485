#pragma once

#include "mcpwire/transport/http_types.hpp"

#include <tl/expected.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace mcpwire {

// ─────────────────────────────────────────────────────────────────────────────
// HTTP Client Error
// ─────────────────────────────────────────────────────────────────────────────

struct HttpClientError {
    enum class Code {
        ConnectionFailed,
        Timeout,
        SslError,
        InvalidPath,
        Cancelled,
        Unknown
    };

    Code code{Code::Unknown};
    std::string message;

    static HttpClientError connection_failed(const std::string& msg) {
        return {Code::ConnectionFailed, msg};
    }
    static HttpClientError timeout(const std::string& msg) {
        return {Code::Timeout, msg};
    }
    static HttpClientError ssl_error(const std::string& msg) {
        return {Code::SslError, msg};
    }
    static HttpClientError invalid_path(const std::string& msg) {
        return {Code::InvalidPath, msg};
    }
    static HttpClientError cancelled() {
        return {Code::Cancelled, "request cancelled"};
    }
    static HttpClientError unknown(const std::string& msg) {
        return {Code::Unknown, msg};
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// HTTP Client Response
// ─────────────────────────────────────────────────────────────────────────────

struct HttpClientResponse {
    int status_code{0};
    HeaderMap headers;
    std::string body;

    [[nodiscard]] bool is_success() const {
        return (status_code >= 200) && (status_code < 300);
    }

    [[nodiscard]] bool is_sse() const {
        const auto content_type = get_header(headers, "Content-Type");
        const bool found = content_type.has_value();
        if (found == false) {
            return false;
        }
        return content_type->find("text/event-stream") != std::string::npos;
    }

    [[nodiscard]] bool is_json() const {
        const auto content_type = get_header(headers, "Content-Type");
        const bool found = content_type.has_value();
        if (found == false) {
            return false;
        }
        return content_type->find("application/json") != std::string::npos;
    }
};

template <typename T>
using HttpClientResult = tl::expected<T, HttpClientError>;

// Receives body bytes of a streaming GET as they arrive. Returning false
// aborts the transfer.
using StreamChunkHandler = std::function<bool(std::string_view chunk)>;

// ─────────────────────────────────────────────────────────────────────────────
// IHttpClient
// ─────────────────────────────────────────────────────────────────────────────
// The seam between the event-stream transport and the HTTP stack, so the
// transport can be tested against MockHttpClient.
//
// Thread-safety: post() and stream_get() are called from different threads
// (sender and stream reader) and must not interfere. cancel() may be called
// from any thread and must make an in-flight stream_get() return promptly.

class IHttpClient {
public:
    virtual ~IHttpClient() = default;

    // ─────────────────────────────────────────────────────────────────────────
    // Configuration (before first request)
    // ─────────────────────────────────────────────────────────────────────────

    virtual void set_base_url(const std::string& url) = 0;
    virtual void set_default_headers(const HeaderMap& headers) = 0;
    virtual void set_connect_timeout(std::chrono::milliseconds timeout) = 0;
    virtual void set_read_timeout(std::chrono::milliseconds timeout) = 0;
    virtual void set_verify_ssl(bool verify) = 0;

    // ─────────────────────────────────────────────────────────────────────────
    // Requests
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] virtual HttpClientResult<HttpClientResponse> post(
        const std::string& path,
        const std::string& body,
        const std::string& content_type,
        const HeaderMap& headers = {}
    ) = 0;

    // Long-lived GET whose body is delivered incrementally through on_chunk.
    // Returns when the server ends the response, the handler returns false,
    // or cancel() is called. The returned response carries status and headers;
    // its body is empty.
    [[nodiscard]] virtual HttpClientResult<HttpClientResponse> stream_get(
        const std::string& path,
        const HeaderMap& headers,
        const StreamChunkHandler& on_chunk
    ) = 0;

    // ─────────────────────────────────────────────────────────────────────────
    // Lifecycle
    // ─────────────────────────────────────────────────────────────────────────

    // Abort in-flight requests and refuse new ones until reset().
    virtual void cancel() = 0;
    virtual void reset() = 0;
};

// Creates the cpr-backed client.
[[nodiscard]] std::unique_ptr<IHttpClient> make_http_client();

}  // namespace mcpwire
