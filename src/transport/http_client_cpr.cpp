#include "mcpwire/transport/http_client.hpp"

#include <cpr/cpr.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdint>
#include <mutex>

namespace mcpwire {

// ─────────────────────────────────────────────────────────────────────────────
// CprHttpClient
// ─────────────────────────────────────────────────────────────────────────────
// cpr (libcurl underneath). post() is a plain blocking request. stream_get()
// feeds the body through a WriteCallback and polls the cancel flag from a
// ProgressCallback, which libcurl invokes even while the stream is idle.

class CprHttpClient : public IHttpClient {
public:
    CprHttpClient() = default;
    ~CprHttpClient() override = default;

    // ─────────────────────────────────────────────────────────────────────────
    // Configuration
    // ─────────────────────────────────────────────────────────────────────────

    void set_base_url(const std::string& url) override {
        std::lock_guard<std::mutex> lock(config_mutex_);
        base_url_ = url;
        while ((base_url_.empty() == false) && (base_url_.back() == '/')) {
            base_url_.pop_back();
        }
    }

    void set_default_headers(const HeaderMap& headers) override {
        std::lock_guard<std::mutex> lock(config_mutex_);
        default_headers_ = headers;
    }

    void set_connect_timeout(std::chrono::milliseconds timeout) override {
        std::lock_guard<std::mutex> lock(config_mutex_);
        connect_timeout_ = timeout;
    }

    void set_read_timeout(std::chrono::milliseconds timeout) override {
        std::lock_guard<std::mutex> lock(config_mutex_);
        read_timeout_ = timeout;
    }

    void set_verify_ssl(bool verify) override {
        std::lock_guard<std::mutex> lock(config_mutex_);
        verify_ssl_ = verify;
    }

    // ─────────────────────────────────────────────────────────────────────────
    // Requests
    // ─────────────────────────────────────────────────────────────────────────

    HttpClientResult<HttpClientResponse> post(
        const std::string& path,
        const std::string& body,
        const std::string& content_type,
        const HeaderMap& headers
    ) override {
        const bool is_cancelled = cancelled_.load();
        if (is_cancelled) {
            return tl::unexpected(HttpClientError::cancelled());
        }

        auto url = build_url(path);
        if (url.has_value() == false) {
            return tl::unexpected(url.error());
        }

        auto request_headers = build_headers(headers);
        request_headers["Content-Type"] = content_type;

        const auto options = snapshot();
        auto response = cpr::Post(
            cpr::Url{*url},
            request_headers,
            cpr::Body{body},
            cpr::ConnectTimeout{options.connect_timeout},
            cpr::Timeout{options.read_timeout},
            cpr::VerifySsl{options.verify_ssl}
        );
        return convert_response(response);
    }

    HttpClientResult<HttpClientResponse> stream_get(
        const std::string& path,
        const HeaderMap& headers,
        const StreamChunkHandler& on_chunk
    ) override {
        const bool is_cancelled = cancelled_.load();
        if (is_cancelled) {
            return tl::unexpected(HttpClientError::cancelled());
        }

        auto url = build_url(path);
        if (url.has_value() == false) {
            return tl::unexpected(url.error());
        }

        bool handler_stopped = false;
        auto write = [&on_chunk, &handler_stopped](std::string_view data, intptr_t) -> bool {
            const bool keep_going = on_chunk(data);
            if (keep_going == false) {
                handler_stopped = true;
            }
            return keep_going;
        };
        auto progress = [this](auto, auto, auto, auto, intptr_t) -> bool {
            return cancelled_.load() == false;
        };

        // No total timeout: the stream is expected to stay open indefinitely.
        const auto options = snapshot();
        auto response = cpr::Get(
            cpr::Url{*url},
            build_headers(headers),
            cpr::ConnectTimeout{options.connect_timeout},
            cpr::VerifySsl{options.verify_ssl},
            cpr::WriteCallback{write},
            cpr::ProgressCallback{progress}
        );

        if (cancelled_.load() || handler_stopped) {
            return tl::unexpected(HttpClientError::cancelled());
        }

        auto converted = convert_response(response);
        if (converted.has_value()) {
            converted->body.clear();
        }
        return converted;
    }

    // ─────────────────────────────────────────────────────────────────────────
    // Lifecycle
    // ─────────────────────────────────────────────────────────────────────────

    void cancel() override {
        cancelled_.store(true);
    }

    void reset() override {
        cancelled_.store(false);
    }

private:
    struct Options {
        std::chrono::milliseconds connect_timeout;
        std::chrono::milliseconds read_timeout;
        bool verify_ssl;
    };

    Options snapshot() {
        std::lock_guard<std::mutex> lock(config_mutex_);
        return Options{connect_timeout_, read_timeout_, verify_ssl_};
    }

    // ─────────────────────────────────────────────────────────────────────────
    // Path Validation
    // ─────────────────────────────────────────────────────────────────────────
    // Endpoint paths come from configuration; anything that could climb out
    // of the base URL is refused.

    static bool contains_traversal_pattern(const std::string& path) {
        std::string lower = path;
        std::transform(lower.begin(), lower.end(), lower.begin(),
                      [](unsigned char c) { return std::tolower(c); });

        if (lower.find("..") != std::string::npos) {
            return true;
        }
        if (lower.find("%2e%2e") != std::string::npos ||
            lower.find("%2e.") != std::string::npos ||
            lower.find(".%2e") != std::string::npos) {
            return true;
        }
        if (lower.find("%252e") != std::string::npos) {
            return true;
        }
        return lower.find('\\') != std::string::npos || lower.find("%5c") != std::string::npos;
    }

    static bool contains_control_characters(const std::string& path) {
        return std::any_of(path.begin(), path.end(), [](unsigned char c) {
            return (c < 0x20) || (c == 0x7F);
        });
    }

    HttpClientResult<std::string> build_url(const std::string& path) {
        if (contains_control_characters(path)) {
            return tl::unexpected(HttpClientError::invalid_path("path contains control characters"));
        }
        if (contains_traversal_pattern(path)) {
            return tl::unexpected(HttpClientError::invalid_path("path traversal pattern in: " + path));
        }

        std::lock_guard<std::mutex> lock(config_mutex_);
        if (path.empty()) {
            return base_url_ + "/";
        }
        if (path.front() != '/') {
            return base_url_ + "/" + path;
        }
        return base_url_ + path;
    }

    cpr::Header build_headers(const HeaderMap& extra_headers) {
        std::lock_guard<std::mutex> lock(config_mutex_);
        cpr::Header cpr_headers;
        for (const auto& [name, value] : default_headers_) {
            cpr_headers[name] = value;
        }
        for (const auto& [name, value] : extra_headers) {
            cpr_headers[name] = value;
        }
        return cpr_headers;
    }

    static HttpClientResult<HttpClientResponse> convert_response(const cpr::Response& response) {
        const bool has_error = (response.error.code != cpr::ErrorCode::OK);
        if (has_error) {
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
                return HttpClientError::unknown("no error");
            case cpr::ErrorCode::OPERATION_TIMEDOUT:
                return HttpClientError::timeout(msg);
            case cpr::ErrorCode::SSL_CONNECT_ERROR:
                return HttpClientError::ssl_error(msg);
            default:
                return HttpClientError::connection_failed(msg);
        }
    }

    mutable std::mutex config_mutex_;
    std::string base_url_;
    HeaderMap default_headers_;
    std::chrono::milliseconds connect_timeout_{10000};
    std::chrono::milliseconds read_timeout_{30000};
    bool verify_ssl_{true};

    std::atomic<bool> cancelled_{false};
};

std::unique_ptr<IHttpClient> make_http_client() {
    return std::make_unique<CprHttpClient>();
}

}  // namespace mcpwire
