#include "mcpwire/transport/event_stream_transport.hpp"
#include "mcpwire/log/logger.hpp"

namespace mcpwire {

namespace {

constexpr std::string_view kLog = "event_stream";

TransportError to_transport_error(const HttpClientError& error) {
    switch (error.code) {
        case HttpClientError::Code::Timeout:
            return TransportError::timeout(error.message);
        case HttpClientError::Code::Cancelled:
            return TransportError::closed(error.message);
        case HttpClientError::Code::InvalidPath:
            return TransportError::protocol(error.message);
        case HttpClientError::Code::ConnectionFailed:
        case HttpClientError::Code::SslError:
        case HttpClientError::Code::Unknown:
            break;
    }
    return TransportError::network(error.message);
}

std::string truncate_for_log(std::string_view text) {
    constexpr std::size_t kMax = 100;
    if (text.size() <= kMax) {
        return std::string(text);
    }
    return std::string(text.substr(0, kMax)) + "...";
}

}  // namespace

EventStreamTransport::EventStreamTransport(EventStreamTransportConfig config)
    : EventStreamTransport(std::move(config), make_http_client()) {}

EventStreamTransport::EventStreamTransport(EventStreamTransportConfig config,
                                           std::unique_ptr<IHttpClient> client)
    : config_(std::move(config))
    , http_client_(std::move(client))
    , retry_delay_(config_.stream_retry_delay)
    , stream_parser_(config_.sse) {}

EventStreamTransport::~EventStreamTransport() {
    (void)close();
}

// ─────────────────────────────────────────────────────────────────────────────
// Lifecycle
// ─────────────────────────────────────────────────────────────────────────────

TransportResult<void> EventStreamTransport::open() {
    const auto url = parse_url(config_.url);
    const bool url_ok = url.has_value();
    if (url_ok == false) {
        return tl::unexpected(TransportError::protocol("invalid event-stream URL: " + config_.url));
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (open_) {
            return {};
        }
        open_ = true;
        stream_failure_.reset();
        retry_delay_ = config_.stream_retry_delay;
    }

    // A previous stream thread has been joined by close().
    http_client_->set_base_url(url->origin() + url->base_path());
    http_client_->set_default_headers(config_.headers);
    http_client_->set_connect_timeout(config_.connect_timeout);
    http_client_->set_read_timeout(config_.request_timeout);
    http_client_->set_verify_ssl(config_.verify_ssl);
    http_client_->reset();

    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        queue_.clear();
        queue_closed_ = false;
        overflowed_ = 0;
    }

    stream_parser_.reset();
    running_.store(true);
    stream_thread_ = std::thread([this]() {
        stream_reader_loop();
    });

    get_logger().info_fmt(kLog, "opened {} (stream {}, post {})",
                          url->origin() + url->base_path(), config_.stream_path, config_.post_path);
    return {};
}

TransportResult<void> EventStreamTransport::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (open_ == false) {
            return {};
        }
        open_ = false;
        running_.store(false);
    }
    retry_cv_.notify_all();

    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        queue_closed_ = true;
    }
    queue_cv_.notify_all();

    http_client_->cancel();
    const bool joinable = stream_thread_.joinable() &&
                          (stream_thread_.get_id() != std::this_thread::get_id());
    if (joinable) {
        stream_thread_.join();
    }

    MCPWIRE_LOG_INFO(kLog, "closed");
    return {};
}

bool EventStreamTransport::is_open() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return open_;
}

void EventStreamTransport::set_auth_token(std::optional<std::string> token) {
    std::lock_guard<std::mutex> lock(mutex_);
    auth_token_ = std::move(token);
}

// ─────────────────────────────────────────────────────────────────────────────
// Outbound
// ─────────────────────────────────────────────────────────────────────────────

TransportResult<void> EventStreamTransport::send(std::string_view payload) {
    const bool open = is_open();
    if (open == false) {
        return tl::unexpected(TransportError::closed());
    }

    HeaderMap headers = request_headers();
    headers["Accept"] = "application/json, text/event-stream";

    auto result = http_client_->post(config_.post_path, std::string(payload), "application/json", headers);
    if (result.has_value() == false) {
        get_logger().warn_fmt(kLog, "POST {} failed: {}", config_.post_path, result.error().message);
        return tl::unexpected(to_transport_error(result.error()));
    }

    const auto& response = *result;
    if (response.is_success() == false) {
        return tl::unexpected(TransportError::http_status(
            response.status_code,
            "POST " + config_.post_path + " returned HTTP " + std::to_string(response.status_code)));
    }

    const bool has_body = (response.body.empty() == false);
    if (has_body == false) {
        return {};
    }

    if (response.is_sse()) {
        SseParser body_parser(config_.sse);
        auto events = body_parser.feed(response.body);
        if (events.has_value() == false) {
            get_logger().warn_fmt(kLog, "dropping SSE response body: {}", events.error().message);
            return {};
        }
        // A body without the trailing blank line still ends the last event.
        auto tail = body_parser.feed("\n\n");
        if (tail.has_value()) {
            events->insert(events->end(), tail->begin(), tail->end());
        }
        for (const auto& event : *events) {
            if (event.is_message()) {
                enqueue(event.data);
            }
        }
    } else if (response.is_json()) {
        enqueue(response.body);
    } else {
        get_logger().debug_fmt(kLog, "ignoring POST response body: {}", truncate_for_log(response.body));
    }
    return {};
}

HeaderMap EventStreamTransport::request_headers() const {
    HeaderMap headers;
    std::lock_guard<std::mutex> lock(mutex_);
    if (auth_token_.has_value()) {
        headers["Authorization"] = "Bearer " + *auth_token_;
    }
    return headers;
}

// ─────────────────────────────────────────────────────────────────────────────
// Inbound
// ─────────────────────────────────────────────────────────────────────────────

TransportResult<std::string> EventStreamTransport::receive() {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    const auto ready = [this]() {
        return queue_closed_ || (overflowed_ > 0) || (queue_.empty() == false);
    };

    const bool bounded = (config_.read_timeout.count() > 0);
    if (bounded) {
        const bool woke = queue_cv_.wait_for(lock, config_.read_timeout, ready);
        if (woke == false) {
            return tl::unexpected(TransportError::timeout("no event within read timeout"));
        }
    } else {
        queue_cv_.wait(lock, ready);
    }

    if (queue_closed_) {
        return tl::unexpected(TransportError::closed());
    }
    if (overflowed_ > 0) {
        return tl::unexpected(TransportError::network(
            "inbound queue overflowed, " + std::to_string(overflowed_) + " message(s) refused"));
    }
    std::string payload = std::move(queue_.front());
    queue_.pop_front();
    return payload;
}

TransportResult<void> EventStreamTransport::probe(std::chrono::milliseconds deadline) {
    (void)deadline;  // health is tracked by the stream thread; nothing to wait for
    std::lock_guard<std::mutex> lock(mutex_);
    if (open_ == false) {
        return tl::unexpected(TransportError::closed());
    }
    if (stream_failure_.has_value()) {
        return tl::unexpected(TransportError::network("event stream down: " + *stream_failure_));
    }
    std::lock_guard<std::mutex> queue_lock(queue_mutex_);
    if (overflowed_ > 0) {
        return tl::unexpected(TransportError::network("inbound queue overflowed"));
    }
    return {};
}

void EventStreamTransport::enqueue(std::string payload) {
    bool first_overflow = false;
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (queue_closed_) {
            return;
        }
        if (queue_.size() >= config_.max_queued_messages) {
            first_overflow = (overflowed_ == 0);
            ++overflowed_;
        } else if (overflowed_ == 0) {
            queue_.push_back(std::move(payload));
        } else {
            ++overflowed_;
        }
    }
    queue_cv_.notify_one();
    if (first_overflow) {
        get_logger().error_fmt(kLog, "inbound queue full ({} messages), failing the transport",
                               config_.max_queued_messages);
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// Stream Reader
// ─────────────────────────────────────────────────────────────────────────────

void EventStreamTransport::stream_reader_loop() {
    MCPWIRE_LOG_DEBUG(kLog, "stream reader started");

    while (running_.load()) {
        HeaderMap headers = request_headers();
        headers["Accept"] = "text/event-stream";
        headers["Cache-Control"] = "no-cache";
        const auto resume_from = last_event_id();
        if (resume_from.has_value()) {
            headers["Last-Event-ID"] = *resume_from;
            get_logger().debug_fmt(kLog, "resuming stream from event id {}", *resume_from);
        }

        stream_parser_.reset();
        auto result = http_client_->stream_get(
            config_.stream_path, headers,
            [this](std::string_view chunk) { return on_stream_chunk(chunk); });

        if (running_.load() == false) {
            break;
        }

        if (result.has_value() == false) {
            // Cancelled here means on_stream_chunk aborted and already recorded why.
            const bool aborted = (result.error().code == HttpClientError::Code::Cancelled);
            if (aborted == false) {
                record_stream_failure(result.error().message);
            }
        } else if (result->is_success() == false) {
            record_stream_failure("HTTP " + std::to_string(result->status_code));
        } else {
            record_stream_failure("stream ended by server");
        }

        std::unique_lock<std::mutex> lock(mutex_);
        const auto delay = retry_delay_;
        get_logger().debug_fmt(kLog, "re-opening stream in {}ms", delay.count());
        retry_cv_.wait_for(lock, delay, [this]() { return running_.load() == false; });
    }

    MCPWIRE_LOG_DEBUG(kLog, "stream reader exiting");
}

bool EventStreamTransport::on_stream_chunk(std::string_view chunk) {
    if (running_.load() == false) {
        return false;
    }
    record_stream_healthy();

    auto events = stream_parser_.feed(chunk);
    if (events.has_value() == false) {
        record_stream_failure(events.error().message);
        return false;
    }
    for (const auto& event : *events) {
        handle_event(event);
    }

    // retry: may arrive on an event with no data, which is never dispatched.
    const auto hint = stream_parser_.retry_hint();
    if (hint.has_value()) {
        std::lock_guard<std::mutex> lock(mutex_);
        retry_delay_ = std::chrono::milliseconds(*hint);
    }
    return true;
}

void EventStreamTransport::handle_event(const SseEvent& event) {
    if (event.id.has_value()) {
        std::lock_guard<std::mutex> lock(mutex_);
        last_event_id_ = event.id;
    }

    if (event.is_message() == false) {
        get_logger().trace_fmt(kLog, "ignoring '{}' event", event.event.value_or(""));
        return;
    }
    get_logger().trace_fmt(kLog, "event: {}", truncate_for_log(event.data));
    enqueue(event.data);
}

void EventStreamTransport::record_stream_failure(std::string reason) {
    get_logger().warn_fmt(kLog, "stream error: {}", reason);
    std::lock_guard<std::mutex> lock(mutex_);
    stream_failure_ = std::move(reason);
}

void EventStreamTransport::record_stream_healthy() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stream_failure_.has_value()) {
        stream_failure_.reset();
    }
}

std::optional<std::string> EventStreamTransport::last_event_id() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_event_id_;
}

std::chrono::milliseconds EventStreamTransport::stream_retry_delay() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return retry_delay_;
}

std::size_t EventStreamTransport::queued_messages() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return queue_.size();
}

}  // namespace mcpwire
