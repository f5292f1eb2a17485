#pragma once

#include <tl/expected.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mcpwire {

/// One dispatched Server-Sent Event.
///
///   event: <type>        optional, "message" when absent
///   id: <event-id>       optional, remembered for Last-Event-ID
///   data: <payload>      repeated lines are joined with '\n'
///   retry: <ms>          optional reconnection hint
///   <blank line>         dispatch
///
struct SseEvent {
    std::optional<std::string> id;
    std::optional<std::string> event;
    std::string data;
    std::optional<std::uint32_t> retry;

    /// True for events the transport treats as protocol messages.
    [[nodiscard]] bool is_message() const noexcept {
        return (event.has_value() == false) || (*event == "message");
    }
};

struct SseParseError {
    std::size_t buffer_size{0};
    std::size_t buffer_limit{0};
    std::string message;
};

struct SseParserConfig {
    /// Undelivered bytes (an unterminated line) allowed before feed() fails.
    std::size_t max_buffer_size{1024 * 1024};

    /// Events whose data exceeds this are dropped, not dispatched.
    std::size_t max_event_size{512 * 1024};
};

/// Incremental SSE parser. Chunks may split lines, fields or events
/// anywhere; partial input is kept until the rest arrives.
class SseParser {
public:
    SseParser() = default;
    explicit SseParser(SseParserConfig config) : config_(config) {}

    /// Returns the events completed by this chunk. Fails (and resets) when
    /// the buffered remainder would exceed max_buffer_size.
    [[nodiscard]] tl::expected<std::vector<SseEvent>, SseParseError> feed(std::string_view chunk);

    /// Drops buffered input and any half-built event. last_event_id() survives:
    /// it is needed to resume the stream after the reset.
    void reset();

    /// Most recent id field seen, dispatched or not.
    [[nodiscard]] const std::optional<std::string>& last_event_id() const noexcept {
        return last_event_id_;
    }

    /// Most recent valid retry field seen.
    [[nodiscard]] std::optional<std::uint32_t> retry_hint() const noexcept {
        return retry_hint_;
    }

    [[nodiscard]] std::size_t buffer_size() const noexcept { return buffer_.size() - buffer_pos_; }
    [[nodiscard]] std::size_t dropped_events() const noexcept { return dropped_events_; }

private:
    void maybe_compact_buffer();
    void process_field(std::string_view line);
    [[nodiscard]] std::optional<SseEvent> finish_event();

    SseParserConfig config_;
    std::string buffer_;
    std::size_t buffer_pos_{0};

    std::string current_data_;
    bool current_has_data_{false};
    std::optional<std::string> current_id_;
    std::optional<std::string> current_event_;
    std::optional<std::uint32_t> current_retry_;

    std::optional<std::string> last_event_id_;
    std::optional<std::uint32_t> retry_hint_;
    std::size_t dropped_events_{0};
};

}  // namespace mcpwire
