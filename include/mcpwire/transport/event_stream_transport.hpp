#pragma once

#include "mcpwire/transport.hpp"
#include "mcpwire/transport/http_client.hpp"
#include "mcpwire/transport/sse_parser.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace mcpwire {

// ═══════════════════════════════════════════════════════════════════════════
// Event-Stream Transport Configuration
// ═══════════════════════════════════════════════════════════════════════════

struct EventStreamTransportConfig {
    // Base URL; stream_path and post_path are appended to its path.
    std::string url;
    std::string stream_path{"/events"};
    std::string post_path{"/message"};

    HeaderMap headers;

    std::chrono::milliseconds connect_timeout{10000};
    std::chrono::milliseconds request_timeout{30000};  // POST round trip
    std::chrono::milliseconds read_timeout{0};         // receive(); 0 = wait indefinitely
    bool verify_ssl{true};

    // Pause before re-opening a failed or finished stream. A server retry:
    // field replaces it.
    std::chrono::milliseconds stream_retry_delay{2000};

    // Inbound messages held for receive(). Exceeding it fails the transport.
    std::size_t max_queued_messages{1024};

    SseParserConfig sse;

    EventStreamTransportConfig& with_url(std::string value) {
        url = std::move(value);
        return *this;
    }

    EventStreamTransportConfig& with_paths(std::string stream, std::string post) {
        stream_path = std::move(stream);
        post_path = std::move(post);
        return *this;
    }

    EventStreamTransportConfig& with_header(const std::string& name, const std::string& value) {
        headers[name] = value;
        return *this;
    }

    EventStreamTransportConfig& with_stream_retry_delay(std::chrono::milliseconds delay) {
        stream_retry_delay = delay;
        return *this;
    }
};

// ═══════════════════════════════════════════════════════════════════════════
// Event-Stream Transport
// ═══════════════════════════════════════════════════════════════════════════
// Inbound messages arrive as Server-Sent Events on a long-lived GET kept open
// by a reader thread; outbound messages are POSTed one per request. A POST
// response that carries messages (SSE or JSON body) feeds the inbound queue
// as well.
//
// Stream failures never surface from receive(): the reader logs them, waits
// stream_retry_delay and reconnects with Last-Event-ID. probe() is how the
// connection layer learns the stream is down.
//
// An inbound queue that overflows is a hard failure: receive() and probe()
// return a Network error until the transport is reopened, so no reply is lost
// without its connection resetting.

class EventStreamTransport final : public ITransport {
public:
    explicit EventStreamTransport(EventStreamTransportConfig config);
    EventStreamTransport(EventStreamTransportConfig config, std::unique_ptr<IHttpClient> client);
    ~EventStreamTransport() override;

    EventStreamTransport(const EventStreamTransport&) = delete;
    EventStreamTransport& operator=(const EventStreamTransport&) = delete;
    EventStreamTransport(EventStreamTransport&&) = delete;
    EventStreamTransport& operator=(EventStreamTransport&&) = delete;

    [[nodiscard]] TransportKind kind() const noexcept override { return TransportKind::EventStream; }

    [[nodiscard]] TransportResult<void> open() override;
    [[nodiscard]] TransportResult<void> send(std::string_view payload) override;
    [[nodiscard]] TransportResult<std::string> receive() override;
    [[nodiscard]] TransportResult<void> probe(std::chrono::milliseconds deadline) override;
    TransportResult<void> close() override;
    [[nodiscard]] bool is_open() const noexcept override;

    void set_auth_token(std::optional<std::string> token) override;

    [[nodiscard]] std::optional<std::string> last_event_id() const;
    [[nodiscard]] std::chrono::milliseconds stream_retry_delay() const;
    [[nodiscard]] std::size_t queued_messages() const;

    [[nodiscard]] const EventStreamTransportConfig& config() const noexcept { return config_; }

private:
    void stream_reader_loop();
    [[nodiscard]] bool on_stream_chunk(std::string_view chunk);
    void handle_event(const SseEvent& event);
    void enqueue(std::string payload);
    void record_stream_failure(std::string reason);
    void record_stream_healthy();
    [[nodiscard]] HeaderMap request_headers() const;

    EventStreamTransportConfig config_;
    std::unique_ptr<IHttpClient> http_client_;

    // Lifecycle, auth and stream health
    mutable std::mutex mutex_;
    bool open_{false};
    std::optional<std::string> auth_token_;
    std::optional<std::string> stream_failure_;
    std::optional<std::string> last_event_id_;
    std::chrono::milliseconds retry_delay_;
    std::condition_variable retry_cv_;

    std::atomic<bool> running_{false};
    std::thread stream_thread_;
    SseParser stream_parser_;  // stream thread only

    // Inbound queue
    mutable std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::deque<std::string> queue_;
    bool queue_closed_{true};
    std::size_t overflowed_{0};  // messages refused since the queue filled
};

}  // namespace mcpwire
