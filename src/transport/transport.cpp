#include "mcpwire/transport.hpp"

#include <algorithm>
#include <cctype>
#include <string>

namespace mcpwire {

std::string_view to_string(TransportKind kind) noexcept {
    switch (kind) {
        case TransportKind::Pipe:        return "pipe";
        case TransportKind::EventStream: return "event_stream";
        case TransportKind::Socket:      return "socket";
    }
    return "unknown";
}

std::optional<TransportKind> parse_transport_kind(std::string_view text) noexcept {
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if ((lower == "pipe") || (lower == "stdio")) {
        return TransportKind::Pipe;
    }
    if ((lower == "event_stream") || (lower == "event-stream") || (lower == "sse")) {
        return TransportKind::EventStream;
    }
    if ((lower == "socket") || (lower == "tcp")) {
        return TransportKind::Socket;
    }
    return std::nullopt;
}

std::string_view to_string(TransportError::Category category) noexcept {
    switch (category) {
        case TransportError::Category::Network:  return "network";
        case TransportError::Category::Timeout:  return "timeout";
        case TransportError::Category::Protocol: return "protocol";
        case TransportError::Category::Closed:   return "closed";
    }
    return "unknown";
}

}  // namespace mcpwire
