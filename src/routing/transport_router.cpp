#include "mcpwire/routing/transport_router.hpp"
#include "mcpwire/log/logger.hpp"
#include "mcpwire/transport/event_stream_transport.hpp"
#include "mcpwire/transport/pipe_transport.hpp"
#include "mcpwire/transport/socket_transport.hpp"

namespace mcpwire {

namespace {

constexpr std::string_view kLog = "router";

}  // namespace

std::unique_ptr<ITransport> make_transport(TransportKind kind, const TransportConfig& config) {
    switch (kind) {
        case TransportKind::Pipe:
            return std::make_unique<PipeTransport>(*config.pipe);
        case TransportKind::EventStream:
            return std::make_unique<EventStreamTransport>(*config.event_stream);
        case TransportKind::Socket:
            return std::make_unique<SocketTransport>(*config.socket);
    }
    return nullptr;
}

TransportRouter::TransportRouter(TransportConfig config, TransportFactory factory)
    : config_(std::move(config)) {
    auto valid = config_.validate();
    if (valid.has_value() == false) {
        get_logger().error_fmt(kLog, "rejecting config: {}", valid.error().describe());
        throw ConfigException(valid.error());
    }

    for (const auto kind : config_.referenced_kinds()) {
        auto transport = factory(kind, config_);
        if (transport == nullptr) {
            throw ConfigException(ConfigError::invalid(
                std::string(to_string(kind)), "no transport could be built"));
        }

        // Credentials are attached at the transport level, which the pipe has none of.
        AuthTokenProvider auth = (kind == TransportKind::Pipe) ? AuthTokenProvider{} : config_.auth;
        auto manager = std::make_unique<ConnectionManager>(std::move(transport), config_.connection, std::move(auth));

        manager->on_failed([this, kind](const std::string& reason) {
            std::vector<ConnectionFailedCallback> callbacks;
            {
                std::lock_guard<std::mutex> lock(callback_mutex_);
                callbacks = failed_callbacks_;
            }
            get_logger().error_fmt(kLog, "{} connection failed: {}", to_string(kind), reason);
            for (const auto& callback : callbacks) {
                callback(kind, reason);
            }
        });
        connections_.emplace(kind, std::move(manager));
    }

    for (const auto& binding : config_.bindings) {
        get_logger().debug_fmt(kLog, "{} -> {}", to_string(binding.capability), to_string(binding.transport));
    }
    get_logger().info_fmt(kLog, "{} connection(s), default {}", connections_.size(), to_string(config_.default_transport));
}

TransportRouter::~TransportRouter() {
    shutdown();
}

ConnectionManager& TransportRouter::resolve(CapabilityKind capability) {
    return connection(config_.transport_for(capability));
}

ConnectionManager& TransportRouter::connection(TransportKind kind) {
    // Every kind transport_for() can return was built in the constructor.
    return *connections_.at(kind);
}

void TransportRouter::start() {
    for (auto& [kind, manager] : connections_) {
        manager->start();
    }
}

void TransportRouter::shutdown() {
    for (auto& [kind, manager] : connections_) {
        manager->shutdown();
    }
}

std::vector<ConnectionManager*> TransportRouter::connections() {
    std::vector<ConnectionManager*> result;
    result.reserve(connections_.size());
    for (auto& [kind, manager] : connections_) {
        result.push_back(manager.get());
    }
    return result;
}

std::vector<TransportKind> TransportRouter::failed_connections() const {
    std::vector<TransportKind> failed;
    for (const auto& [kind, manager] : connections_) {
        if (manager->state() == ConnectionState::Failed) {
            failed.push_back(kind);
        }
    }
    return failed;
}

void TransportRouter::on_connection_failed(ConnectionFailedCallback callback) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    failed_callbacks_.push_back(std::move(callback));
}

}  // namespace mcpwire
