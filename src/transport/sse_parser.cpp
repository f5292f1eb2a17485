#include "mcpwire/transport/sse_parser.hpp"

#include <charconv>

namespace mcpwire {

namespace {

// Consumed bytes are erased lazily, once they pass this size.
constexpr std::size_t kCompactThreshold = 4096;

}  // namespace

tl::expected<std::vector<SseEvent>, SseParseError> SseParser::feed(std::string_view chunk) {
    std::vector<SseEvent> events;

    buffer_.append(chunk);

    std::size_t newline_pos = 0;
    while ((newline_pos = buffer_.find('\n', buffer_pos_)) != std::string::npos) {
        std::string_view line(buffer_.data() + buffer_pos_, newline_pos - buffer_pos_);
        if ((line.empty() == false) && (line.back() == '\r')) {
            line.remove_suffix(1);
        }
        buffer_pos_ = newline_pos + 1;

        if (line.empty()) {
            auto event = finish_event();
            if (event.has_value()) {
                events.push_back(std::move(*event));
            }
            continue;
        }
        process_field(line);
    }

    maybe_compact_buffer();

    const std::size_t pending = buffer_size();
    if (pending > config_.max_buffer_size) {
        SseParseError error{
            pending,
            config_.max_buffer_size,
            "SSE line of " + std::to_string(pending) + " bytes exceeds limit of " +
                std::to_string(config_.max_buffer_size)
        };
        reset();
        return tl::unexpected(std::move(error));
    }

    return events;
}

void SseParser::maybe_compact_buffer() {
    if (buffer_pos_ == buffer_.size()) {
        buffer_.clear();
        buffer_pos_ = 0;
    } else if (buffer_pos_ > kCompactThreshold) {
        buffer_.erase(0, buffer_pos_);
        buffer_pos_ = 0;
    }
}

void SseParser::reset() {
    buffer_.clear();
    buffer_pos_ = 0;
    current_data_.clear();
    current_has_data_ = false;
    current_id_.reset();
    current_event_.reset();
    current_retry_.reset();
}

void SseParser::process_field(std::string_view line) {
    if (line.front() == ':') {
        return;  // comment / keep-alive
    }

    std::string_view name = line;
    std::string_view value;
    const std::size_t colon = line.find(':');
    if (colon != std::string_view::npos) {
        name = line.substr(0, colon);
        value = line.substr(colon + 1);
        if ((value.empty() == false) && (value.front() == ' ')) {
            value.remove_prefix(1);
        }
    }

    if (name == "data") {
        if (current_has_data_) {
            current_data_ += '\n';
        }
        current_data_ += value;
        current_has_data_ = true;
    } else if (name == "event") {
        current_event_ = std::string(value);
    } else if (name == "id") {
        // Ids containing NUL are ignored.
        if (value.find('\0') == std::string_view::npos) {
            current_id_ = std::string(value);
            last_event_id_ = current_id_;
        }
    } else if (name == "retry") {
        std::uint32_t retry_ms = 0;
        const auto* end = value.data() + value.size();
        const auto [ptr, ec] = std::from_chars(value.data(), end, retry_ms);
        if ((ec == std::errc{}) && (ptr == end)) {
            current_retry_ = retry_ms;
            retry_hint_ = retry_ms;
        }
    }
    // Unknown fields are ignored.
}

std::optional<SseEvent> SseParser::finish_event() {
    std::optional<SseEvent> result;

    const bool oversized = (current_data_.size() > config_.max_event_size);
    if (oversized) {
        ++dropped_events_;
    } else if (current_has_data_) {
        result = SseEvent{
            std::move(current_id_),
            std::move(current_event_),
            std::move(current_data_),
            current_retry_
        };
    }

    current_data_.clear();
    current_has_data_ = false;
    current_id_.reset();
    current_event_.reset();
    current_retry_.reset();
    return result;
}

}  // namespace mcpwire
