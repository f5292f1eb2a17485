#include "mcpwire/config/transport_config.hpp"
#include "mcpwire/transport/http_types.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <limits>
#include <map>
#include <set>
#include <type_traits>

namespace mcpwire {

namespace {

std::string lowercase(std::string_view text) {
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower;
}

// ─────────────────────────────────────────────────────────────────────────────
// JSON Field Reader
// ─────────────────────────────────────────────────────────────────────────────
// Reads optional members of one object into typed fields. Absent members keep
// their defaults; the first type mismatch is remembered and later reads are
// skipped.

template <typename T>
struct is_duration : std::false_type {};
template <typename Rep, typename Period>
struct is_duration<std::chrono::duration<Rep, Period>> : std::true_type {};

class FieldReader {
public:
    FieldReader(const Json& object, std::string prefix)
        : object_(object), prefix_(std::move(prefix)) {}

    template <typename T>
    void read(const char* name, T& out) {
        if (error_.has_value()) {
            return;
        }
        const auto it = object_.find(name);
        if (it == object_.end()) {
            return;
        }
        const Json& value = *it;
        const std::string field = prefix_ + name;

        if constexpr (std::is_same_v<T, std::string>) {
            if (value.is_string() == false) {
                fail(field, "expected a string");
                return;
            }
            out = value.get<std::string>();
        } else if constexpr (std::is_same_v<T, std::optional<std::string>>) {
            if (value.is_string() == false) {
                fail(field, "expected a string");
                return;
            }
            out = value.get<std::string>();
        } else if constexpr (std::is_same_v<T, bool>) {
            if (value.is_boolean() == false) {
                fail(field, "expected true or false");
                return;
            }
            out = value.get<bool>();
        } else if constexpr (std::is_floating_point_v<T>) {
            if (value.is_number() == false) {
                fail(field, "expected a number");
                return;
            }
            out = value.get<T>();
        } else if constexpr (std::is_integral_v<T>) {
            const auto number = read_unsigned(value, field, std::numeric_limits<T>::max());
            if (number.has_value()) {
                out = static_cast<T>(*number);
            }
        } else if constexpr (is_duration<T>::value) {
            const auto number = read_unsigned(value, field, std::numeric_limits<std::int64_t>::max());
            if (number.has_value()) {
                out = std::chrono::duration_cast<T>(std::chrono::milliseconds{static_cast<std::int64_t>(*number)});
            }
        } else if constexpr (std::is_same_v<T, std::vector<std::string>>) {
            const bool all_strings = value.is_array() &&
                std::all_of(value.begin(), value.end(), [](const Json& v) { return v.is_string(); });
            if (all_strings == false) {
                fail(field, "expected an array of strings");
                return;
            }
            out = value.get<std::vector<std::string>>();
        } else {
            // string-to-string maps (environment, headers)
            if (value.is_object() == false) {
                fail(field, "expected an object of strings");
                return;
            }
            T result;
            for (const auto& [key, item] : value.items()) {
                if (item.is_string() == false) {
                    fail(field + "." + key, "expected a string");
                    return;
                }
                result[key] = item.get<std::string>();
            }
            out = std::move(result);
        }
    }

    void fail(const std::string& field, std::string message) {
        if (error_.has_value() == false) {
            error_ = ConfigError::invalid(field, std::move(message));
        }
    }

    [[nodiscard]] const std::optional<ConfigError>& error() const noexcept { return error_; }

private:
    std::optional<std::uint64_t> read_unsigned(const Json& value, const std::string& field, std::uint64_t max) {
        const bool is_non_negative_integer =
            value.is_number_unsigned() || (value.is_number_integer() && (value.get<std::int64_t>() >= 0));
        if (is_non_negative_integer == false) {
            fail(field, "expected a non-negative integer");
            return std::nullopt;
        }
        const auto number = value.get<std::uint64_t>();
        if (number > max) {
            fail(field, "value " + std::to_string(number) + " is out of range");
            return std::nullopt;
        }
        return number;
    }

    const Json& object_;
    std::string prefix_;
    std::optional<ConfigError> error_;
};

tl::expected<void, ConfigError> require_object(const Json& value, const std::string& field) {
    if (value.is_object() == false) {
        return tl::unexpected(ConfigError::invalid(field, "expected an object"));
    }
    return {};
}

tl::expected<PipeTransportConfig, ConfigError> pipe_from_json(const Json& block) {
    auto is_object = require_object(block, "pipe");
    if (is_object.has_value() == false) {
        return tl::unexpected(is_object.error());
    }

    PipeTransportConfig config;
    FieldReader reader(block, "pipe.");
    reader.read("command", config.command);
    reader.read("args", config.args);
    reader.read("env", config.environment);
    reader.read("working_directory", config.working_directory);
    reader.read("max_message_size", config.max_message_size);
    reader.read("read_timeout_ms", config.read_timeout);
    reader.read("close_grace_period_ms", config.close_grace_period);
    reader.read("skip_command_validation", config.skip_command_validation);
    reader.read("read_fd", config.attach_read_fd);
    reader.read("write_fd", config.attach_write_fd);

    std::string pipe_mode;
    reader.read("mode", pipe_mode);
    std::string stderr_mode;
    reader.read("stderr", stderr_mode);
    if (reader.error().has_value()) {
        return tl::unexpected(*reader.error());
    }

    const std::string lowered_mode = lowercase(pipe_mode);
    if (lowered_mode.empty() || (lowered_mode == "spawn")) {
        config.mode = PipeMode::Spawn;
    } else if (lowered_mode == "attach") {
        config.mode = PipeMode::Attach;
    } else {
        return tl::unexpected(ConfigError::invalid("pipe.mode", "expected spawn or attach"));
    }

    const std::string mode = lowercase(stderr_mode);
    if (mode.empty() || (mode == "discard")) {
        config.stderr_handling = StderrHandling::Discard;
    } else if (mode == "passthrough") {
        config.stderr_handling = StderrHandling::Passthrough;
    } else if (mode == "capture") {
        config.stderr_handling = StderrHandling::Capture;
    } else {
        return tl::unexpected(ConfigError::invalid("pipe.stderr", "expected discard, passthrough or capture"));
    }
    return config;
}

tl::expected<EventStreamTransportConfig, ConfigError> event_stream_from_json(const Json& block) {
    auto is_object = require_object(block, "event_stream");
    if (is_object.has_value() == false) {
        return tl::unexpected(is_object.error());
    }

    EventStreamTransportConfig config;
    FieldReader reader(block, "event_stream.");
    reader.read("url", config.url);
    reader.read("stream_path", config.stream_path);
    reader.read("post_path", config.post_path);
    reader.read("headers", config.headers);
    reader.read("connect_timeout_ms", config.connect_timeout);
    reader.read("request_timeout_ms", config.request_timeout);
    reader.read("read_timeout_ms", config.read_timeout);
    reader.read("verify_ssl", config.verify_ssl);
    reader.read("stream_retry_delay_ms", config.stream_retry_delay);
    reader.read("max_queued_messages", config.max_queued_messages);
    reader.read("max_event_size", config.sse.max_event_size);
    if (reader.error().has_value()) {
        return tl::unexpected(*reader.error());
    }
    return config;
}

tl::expected<SocketTransportConfig, ConfigError> socket_from_json(const Json& block) {
    auto is_object = require_object(block, "socket");
    if (is_object.has_value() == false) {
        return tl::unexpected(is_object.error());
    }

    SocketTransportConfig config;
    FieldReader reader(block, "socket.");
    reader.read("host", config.host);
    reader.read("port", config.port);
    reader.read("connect_timeout_ms", config.connect_timeout);
    reader.read("read_timeout_ms", config.read_timeout);
    reader.read("write_timeout_ms", config.write_timeout);
    reader.read("max_frame_size", config.max_frame_size);

    std::string mode;
    reader.read("mode", mode);
    if (reader.error().has_value()) {
        return tl::unexpected(*reader.error());
    }

    const std::string lower = lowercase(mode);
    if (lower.empty() || (lower == "connect")) {
        config.mode = SocketMode::Connect;
    } else if ((lower == "listen") || (lower == "bind")) {
        config.mode = SocketMode::Listen;
    } else {
        return tl::unexpected(ConfigError::invalid("socket.mode", "expected connect or listen"));
    }
    return config;
}

tl::expected<ConnectionOptions, ConfigError> connection_from_json(const Json& block) {
    auto is_object = require_object(block, "connection");
    if (is_object.has_value() == false) {
        return tl::unexpected(is_object.error());
    }

    ConnectionOptions options;
    FieldReader reader(block, "connection.");
    reader.read("heartbeat_interval_ms", options.heartbeat_interval);
    reader.read("heartbeat_timeout_ms", options.heartbeat_timeout);
    reader.read("confirmation_probes", options.confirmation_probes);
    reader.read("probe_interval_ms", options.probe_interval);
    reader.read("max_reconnect_attempts", options.max_reconnect_attempts);
    reader.read("backoff_base_ms", options.backoff_base);
    reader.read("backoff_multiplier", options.backoff_multiplier);
    reader.read("backoff_cap_ms", options.backoff_cap);
    reader.read("backoff_jitter", options.backoff_jitter);
    reader.read("sweep_interval_ms", options.sweep_interval);
    if (reader.error().has_value()) {
        return tl::unexpected(*reader.error());
    }
    return options;
}

tl::expected<TransportKind, ConfigError> kind_from_json(const Json& value, const std::string& field) {
    if (value.is_string() == false) {
        return tl::unexpected(ConfigError::invalid(field, "expected a transport name"));
    }
    const auto kind = parse_transport_kind(value.get<std::string>());
    if (kind.has_value() == false) {
        return tl::unexpected(ConfigError::unknown_kind(
            field, "unknown transport '" + value.get<std::string>() + "'"));
    }
    return *kind;
}

tl::expected<CapabilityKind, ConfigError> capability_from_text(const std::string& text, const std::string& field) {
    const auto capability = parse_capability_kind(text);
    if (capability.has_value() == false) {
        return tl::unexpected(ConfigError::unknown_kind(field, "unknown capability '" + text + "'"));
    }
    return *capability;
}

tl::expected<std::vector<CapabilityBinding>, ConfigError> bindings_from_json(const Json& value) {
    std::vector<CapabilityBinding> bindings;

    if (value.is_object()) {
        for (const auto& [name, target] : value.items()) {
            const std::string field = "bindings." + name;
            auto capability = capability_from_text(name, field);
            if (capability.has_value() == false) {
                return tl::unexpected(capability.error());
            }
            auto transport = kind_from_json(target, field);
            if (transport.has_value() == false) {
                return tl::unexpected(transport.error());
            }
            bindings.push_back({*capability, *transport});
        }
        return bindings;
    }

    if (value.is_array() == false) {
        return tl::unexpected(ConfigError::invalid("bindings", "expected an array or an object"));
    }
    for (std::size_t i = 0; i < value.size(); ++i) {
        const Json& entry = value[i];
        const std::string field = "bindings[" + std::to_string(i) + "]";
        const bool well_formed = entry.is_object() &&
                                 entry.contains("capability") && entry["capability"].is_string() &&
                                 entry.contains("transport");
        if (well_formed == false) {
            return tl::unexpected(ConfigError::missing(field, "expected {\"capability\": ..., \"transport\": ...}"));
        }
        auto capability = capability_from_text(entry["capability"].get<std::string>(), field + ".capability");
        if (capability.has_value() == false) {
            return tl::unexpected(capability.error());
        }
        auto transport = kind_from_json(entry["transport"], field + ".transport");
        if (transport.has_value() == false) {
            return tl::unexpected(transport.error());
        }
        bindings.push_back({*capability, *transport});
    }
    return bindings;
}

// ─────────────────────────────────────────────────────────────────────────────
// Validation
// ─────────────────────────────────────────────────────────────────────────────

tl::expected<void, ConfigError> validate_pipe(const PipeTransportConfig& config) {
    if (config.mode == PipeMode::Attach) {
        if ((config.attach_read_fd < 0) || (config.attach_write_fd < 0)) {
            return tl::unexpected(ConfigError::invalid("pipe.read_fd", "descriptors must be non-negative"));
        }
    } else if (config.command.empty()) {
        return tl::unexpected(ConfigError::missing("pipe.command", "command is required"));
    }
    if (config.max_message_size == 0) {
        return tl::unexpected(ConfigError::invalid("pipe.max_message_size", "must be positive"));
    }
    return {};
}

tl::expected<void, ConfigError> validate_event_stream(const EventStreamTransportConfig& config) {
    if (config.url.empty()) {
        return tl::unexpected(ConfigError::missing("event_stream.url", "url is required"));
    }
    const auto url = parse_url(config.url);
    if (url.has_value() == false) {
        return tl::unexpected(ConfigError::invalid("event_stream.url", "not an http(s) URL: " + config.url));
    }
    if (config.stream_path.empty() || config.post_path.empty()) {
        return tl::unexpected(ConfigError::invalid("event_stream", "stream_path and post_path must be set"));
    }
    if (config.max_queued_messages == 0) {
        return tl::unexpected(ConfigError::invalid("event_stream.max_queued_messages", "must be positive"));
    }
    return {};
}

tl::expected<void, ConfigError> validate_socket(const SocketTransportConfig& config) {
    if (config.host.empty()) {
        return tl::unexpected(ConfigError::missing("socket.host", "host is required"));
    }
    const bool needs_port = (config.mode == SocketMode::Connect);
    if (needs_port && (config.port == 0)) {
        return tl::unexpected(ConfigError::missing("socket.port", "port is required in connect mode"));
    }
    if (config.max_frame_size == 0) {
        return tl::unexpected(ConfigError::invalid("socket.max_frame_size", "must be positive"));
    }
    return {};
}

tl::expected<void, ConfigError> validate_connection(const ConnectionOptions& options) {
    if (options.heartbeat_timeout.count() <= 0) {
        return tl::unexpected(ConfigError::invalid("connection.heartbeat_timeout_ms", "must be positive"));
    }
    if (options.sweep_interval.count() <= 0) {
        return tl::unexpected(ConfigError::invalid("connection.sweep_interval_ms", "must be positive"));
    }
    if (options.heartbeat_interval.count() < 0 || options.probe_interval.count() < 0) {
        return tl::unexpected(ConfigError::invalid("connection", "intervals cannot be negative"));
    }
    if (options.backoff_base.count() <= 0) {
        return tl::unexpected(ConfigError::invalid("connection.backoff_base_ms", "must be positive"));
    }
    if (options.backoff_cap < options.backoff_base) {
        return tl::unexpected(ConfigError::invalid("connection.backoff_cap_ms", "must not be below backoff_base_ms"));
    }
    if (options.backoff_multiplier < 1.0) {
        return tl::unexpected(ConfigError::invalid("connection.backoff_multiplier", "must be at least 1"));
    }
    if ((options.backoff_jitter < 0.0) || (options.backoff_jitter > 1.0)) {
        return tl::unexpected(ConfigError::invalid("connection.backoff_jitter", "must be within [0, 1]"));
    }
    return {};
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// Names
// ─────────────────────────────────────────────────────────────────────────────

std::string_view to_string(CapabilityKind kind) noexcept {
    switch (kind) {
        case CapabilityKind::Tool:     return "tool";
        case CapabilityKind::Resource: return "resource";
        case CapabilityKind::Prompt:   return "prompt";
        case CapabilityKind::Auth:     return "auth";
        case CapabilityKind::Default:  return "default";
    }
    return "unknown";
}

std::optional<CapabilityKind> parse_capability_kind(std::string_view text) noexcept {
    const std::string lower = lowercase(text);
    if ((lower == "tool") || (lower == "tools")) {
        return CapabilityKind::Tool;
    }
    if ((lower == "resource") || (lower == "resources")) {
        return CapabilityKind::Resource;
    }
    if ((lower == "prompt") || (lower == "prompts")) {
        return CapabilityKind::Prompt;
    }
    if (lower == "auth") {
        return CapabilityKind::Auth;
    }
    if (lower == "default") {
        return CapabilityKind::Default;
    }
    return std::nullopt;
}

std::string_view to_string(ConfigError::Code code) noexcept {
    switch (code) {
        case ConfigError::Code::MissingParameter: return "MissingParameter";
        case ConfigError::Code::InvalidValue:     return "InvalidValue";
        case ConfigError::Code::DuplicateBinding: return "DuplicateBinding";
        case ConfigError::Code::UnknownKind:      return "UnknownKind";
    }
    return "Unknown";
}

// ─────────────────────────────────────────────────────────────────────────────
// Builder
// ─────────────────────────────────────────────────────────────────────────────

TransportConfig& TransportConfig::with_pipe(PipeTransportConfig config) {
    pipe = std::move(config);
    return *this;
}

TransportConfig& TransportConfig::with_event_stream(EventStreamTransportConfig config) {
    event_stream = std::move(config);
    return *this;
}

TransportConfig& TransportConfig::with_socket(SocketTransportConfig config) {
    socket = std::move(config);
    return *this;
}

TransportConfig& TransportConfig::with_default(TransportKind kind) {
    default_transport = kind;
    return *this;
}

TransportConfig& TransportConfig::with_binding(CapabilityKind capability, TransportKind transport) {
    bindings.push_back({capability, transport});
    return *this;
}

TransportConfig& TransportConfig::with_connection_options(ConnectionOptions options) {
    connection = options;
    return *this;
}

TransportConfig& TransportConfig::with_auth(AuthTokenProvider provider) {
    auth = std::move(provider);
    return *this;
}

// ─────────────────────────────────────────────────────────────────────────────
// Queries
// ─────────────────────────────────────────────────────────────────────────────

TransportKind TransportConfig::transport_for(CapabilityKind capability) const {
    const auto it = std::find_if(bindings.begin(), bindings.end(),
        [capability](const CapabilityBinding& b) { return b.capability == capability; });
    return (it != bindings.end()) ? it->transport : default_transport;
}

std::vector<TransportKind> TransportConfig::referenced_kinds() const {
    std::vector<TransportKind> kinds{default_transport};
    for (const auto& binding : bindings) {
        const bool seen = std::find(kinds.begin(), kinds.end(), binding.transport) != kinds.end();
        if (seen == false) {
            kinds.push_back(binding.transport);
        }
    }
    return kinds;
}

tl::expected<void, ConfigError> TransportConfig::validate() const {
    std::set<CapabilityKind> bound;
    for (const auto& binding : bindings) {
        const bool inserted = bound.insert(binding.capability).second;
        if (inserted == false) {
            return tl::unexpected(ConfigError::duplicate_binding(
                "bindings", "capability '" + std::string(to_string(binding.capability)) + "' is bound twice"));
        }
    }

    for (const auto kind : referenced_kinds()) {
        const std::string name(to_string(kind));
        tl::expected<void, ConfigError> checked;
        switch (kind) {
            case TransportKind::Pipe:
                if (pipe.has_value() == false) {
                    return tl::unexpected(ConfigError::missing(name, "transport is referenced but not configured"));
                }
                checked = validate_pipe(*pipe);
                break;
            case TransportKind::EventStream:
                if (event_stream.has_value() == false) {
                    return tl::unexpected(ConfigError::missing(name, "transport is referenced but not configured"));
                }
                checked = validate_event_stream(*event_stream);
                break;
            case TransportKind::Socket:
                if (socket.has_value() == false) {
                    return tl::unexpected(ConfigError::missing(name, "transport is referenced but not configured"));
                }
                checked = validate_socket(*socket);
                break;
        }
        if (checked.has_value() == false) {
            return checked;
        }
    }

    return validate_connection(connection);
}

// ─────────────────────────────────────────────────────────────────────────────
// JSON
// ─────────────────────────────────────────────────────────────────────────────

tl::expected<TransportConfig, ConfigError> TransportConfig::from_json(const Json& document) {
    auto is_object = require_object(document, "");
    if (is_object.has_value() == false) {
        return tl::unexpected(ConfigError::invalid("", "config document must be an object"));
    }

    TransportConfig config;

    const auto default_it = document.find("default_transport");
    if (default_it == document.end()) {
        return tl::unexpected(ConfigError::missing("default_transport", "default_transport is required"));
    }
    auto default_kind = kind_from_json(*default_it, "default_transport");
    if (default_kind.has_value() == false) {
        return tl::unexpected(default_kind.error());
    }
    config.default_transport = *default_kind;

    if (document.contains("bindings")) {
        auto bindings = bindings_from_json(document["bindings"]);
        if (bindings.has_value() == false) {
            return tl::unexpected(bindings.error());
        }
        config.bindings = std::move(*bindings);
    }

    if (document.contains("pipe")) {
        auto block = pipe_from_json(document["pipe"]);
        if (block.has_value() == false) {
            return tl::unexpected(block.error());
        }
        config.pipe = std::move(*block);
    }
    if (document.contains("event_stream")) {
        auto block = event_stream_from_json(document["event_stream"]);
        if (block.has_value() == false) {
            return tl::unexpected(block.error());
        }
        config.event_stream = std::move(*block);
    }
    if (document.contains("socket")) {
        auto block = socket_from_json(document["socket"]);
        if (block.has_value() == false) {
            return tl::unexpected(block.error());
        }
        config.socket = std::move(*block);
    }
    if (document.contains("connection")) {
        auto options = connection_from_json(document["connection"]);
        if (options.has_value() == false) {
            return tl::unexpected(options.error());
        }
        config.connection = *options;
    }

    return config;
}

}  // namespace mcpwire
