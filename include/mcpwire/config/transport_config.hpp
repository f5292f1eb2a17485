#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Transport Configuration
// ═══════════════════════════════════════════════════════════════════════════
// Which transport serves which capability, and the parameters of each
// transport in use. Validated once, up front: TransportRouter refuses to
// construct from an invalid config, so nothing here can fail at runtime.

#include "mcpwire/connection/connection_options.hpp"
#include "mcpwire/protocol/message.hpp"
#include "mcpwire/transport.hpp"
#include "mcpwire/transport/event_stream_transport.hpp"
#include "mcpwire/transport/pipe_transport.hpp"
#include "mcpwire/transport/socket_transport.hpp"

#include <tl/expected.hpp>

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace mcpwire {

enum class CapabilityKind {
    Tool,
    Resource,
    Prompt,
    Auth,
    Default
};

[[nodiscard]] std::string_view to_string(CapabilityKind kind) noexcept;

// "tool"/"tools", "resource"/"resources", "prompt"/"prompts", "auth", "default"
[[nodiscard]] std::optional<CapabilityKind> parse_capability_kind(std::string_view text) noexcept;

// ─────────────────────────────────────────────────────────────────────────────
// Config Error
// ─────────────────────────────────────────────────────────────────────────────

struct ConfigError {
    enum class Code {
        MissingParameter,
        InvalidValue,
        DuplicateBinding,
        UnknownKind
    };

    Code code{Code::InvalidValue};
    std::string field;  // dotted path, e.g. "socket.port"
    std::string message;

    static ConfigError missing(std::string field, std::string msg) {
        return {Code::MissingParameter, std::move(field), std::move(msg)};
    }
    static ConfigError invalid(std::string field, std::string msg) {
        return {Code::InvalidValue, std::move(field), std::move(msg)};
    }
    static ConfigError duplicate_binding(std::string field, std::string msg) {
        return {Code::DuplicateBinding, std::move(field), std::move(msg)};
    }
    static ConfigError unknown_kind(std::string field, std::string msg) {
        return {Code::UnknownKind, std::move(field), std::move(msg)};
    }

    [[nodiscard]] std::string describe() const {
        return field.empty() ? message : field + ": " + message;
    }
};

[[nodiscard]] std::string_view to_string(ConfigError::Code code) noexcept;

class ConfigException : public std::runtime_error {
public:
    explicit ConfigException(ConfigError error)
        : std::runtime_error("invalid transport config: " + error.describe())
        , error_(std::move(error)) {}

    [[nodiscard]] const ConfigError& error() const noexcept { return error_; }

private:
    ConfigError error_;
};

// ─────────────────────────────────────────────────────────────────────────────
// Transport Config
// ─────────────────────────────────────────────────────────────────────────────

struct CapabilityBinding {
    CapabilityKind capability{CapabilityKind::Default};
    TransportKind transport{TransportKind::Pipe};
};

struct TransportConfig {
    std::optional<PipeTransportConfig> pipe;
    std::optional<EventStreamTransportConfig> event_stream;
    std::optional<SocketTransportConfig> socket;

    TransportKind default_transport{TransportKind::Pipe};
    std::vector<CapabilityBinding> bindings;  // checked in order

    ConnectionOptions connection;
    AuthTokenProvider auth;  // socket and event-stream only

    TransportConfig& with_pipe(PipeTransportConfig config);
    TransportConfig& with_event_stream(EventStreamTransportConfig config);
    TransportConfig& with_socket(SocketTransportConfig config);
    TransportConfig& with_default(TransportKind kind);
    TransportConfig& with_binding(CapabilityKind capability, TransportKind transport);
    TransportConfig& with_connection_options(ConnectionOptions options);
    TransportConfig& with_auth(AuthTokenProvider provider);

    [[nodiscard]] tl::expected<void, ConfigError> validate() const;

    // Transport serving `capability`: its binding if any, else the default.
    [[nodiscard]] TransportKind transport_for(CapabilityKind capability) const;

    // Default first, then bound kinds in binding order, without repeats.
    [[nodiscard]] std::vector<TransportKind> referenced_kinds() const;

    // Reads an already-resolved document:
    //   {
    //     "default_transport": "pipe",
    //     "bindings": [{"capability": "tool", "transport": "socket"}],
    //     "pipe": {...}, "event_stream": {...}, "socket": {...},
    //     "connection": {...}
    //   }
    // Durations are integer milliseconds in "*_ms" members. The result is not
    // validated; call validate() on it.
    [[nodiscard]] static tl::expected<TransportConfig, ConfigError> from_json(const Json& document);
};

}  // namespace mcpwire
