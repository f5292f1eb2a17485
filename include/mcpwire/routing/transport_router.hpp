#pragma once

#include "mcpwire/config/transport_config.hpp"
#include "mcpwire/connection/connection_manager.hpp"
#include "mcpwire/transport.hpp"

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <vector>

namespace mcpwire {

// ═══════════════════════════════════════════════════════════════════════════
// Transport Router
// ═══════════════════════════════════════════════════════════════════════════
// Maps capability kinds onto connections. One ConnectionManager is built per
// transport kind the config references; capabilities bound to the same kind
// share it, so a failure of one transport leaves capabilities routed
// elsewhere working.

// Builds the transport for `kind`. The config has been validated, so the
// matching parameter block is present.
using TransportFactory = std::function<std::unique_ptr<ITransport>(TransportKind kind, const TransportConfig& config)>;

[[nodiscard]] std::unique_ptr<ITransport> make_transport(TransportKind kind, const TransportConfig& config);

class TransportRouter {
public:
    using ConnectionFailedCallback = std::function<void(TransportKind kind, const std::string& reason)>;

    /// Throws ConfigException when `config` does not validate.
    explicit TransportRouter(TransportConfig config, TransportFactory factory = make_transport);
    ~TransportRouter();

    TransportRouter(const TransportRouter&) = delete;
    TransportRouter& operator=(const TransportRouter&) = delete;
    TransportRouter(TransportRouter&&) = delete;
    TransportRouter& operator=(TransportRouter&&) = delete;

    [[nodiscard]] ConnectionManager& resolve(CapabilityKind capability);

    /// Throws std::out_of_range for a kind the config does not reference.
    [[nodiscard]] ConnectionManager& connection(TransportKind kind);

    void start();
    void shutdown();

    [[nodiscard]] std::vector<ConnectionManager*> connections();
    [[nodiscard]] std::vector<TransportKind> failed_connections() const;

    void on_connection_failed(ConnectionFailedCallback callback);

    [[nodiscard]] const TransportConfig& config() const noexcept { return config_; }

private:
    TransportConfig config_;
    std::map<TransportKind, std::unique_ptr<ConnectionManager>> connections_;

    std::mutex callback_mutex_;
    std::vector<ConnectionFailedCallback> failed_callbacks_;
};

}  // namespace mcpwire
