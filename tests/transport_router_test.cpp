#include <catch2/catch_test_macros.hpp>

#include "mcpwire/routing/transport_router.hpp"

#include "mocks/mock_transport.hpp"

#include <algorithm>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <vector>

using namespace mcpwire;
using namespace mcpwire::testing;
using namespace std::chrono_literals;

namespace {

// One MockPeer per transport kind; the factory builds MockTransports on them.
struct MockNetwork {
    std::map<TransportKind, std::shared_ptr<MockPeer>> peers{
        {TransportKind::Pipe, std::make_shared<MockPeer>()},
        {TransportKind::EventStream, std::make_shared<MockPeer>()},
        {TransportKind::Socket, std::make_shared<MockPeer>()},
    };
    std::vector<TransportKind> built;

    TransportFactory factory() {
        return [this](TransportKind kind, const TransportConfig&) -> std::unique_ptr<ITransport> {
            built.push_back(kind);
            return std::make_unique<MockTransport>(peers.at(kind), kind);
        };
    }

    MockPeer& peer(TransportKind kind) { return *peers.at(kind); }
};

TransportConfig mixed_config() {
    PipeTransportConfig pipe;
    pipe.command = "resource-server";
    SocketTransportConfig socket;
    socket.port = 7400;

    ConnectionOptions options;
    options.with_heartbeat(0ms, 50ms)
           .with_confirmation(1, 5ms)
           .with_reconnect(0, 1ms, 10ms);

    TransportConfig config;
    config.with_pipe(pipe)
          .with_socket(socket)
          .with_default(TransportKind::Pipe)
          .with_binding(CapabilityKind::Tool, TransportKind::Socket)
          .with_binding(CapabilityKind::Prompt, TransportKind::Socket)
          .with_connection_options(options);
    return config;
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// Construction
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("TransportRouter refuses an invalid config before building anything", "[router][config]") {
    MockNetwork network;
    auto config = mixed_config();
    config.socket.reset();

    try {
        TransportRouter router(config, network.factory());
        FAIL("expected ConfigException");
    } catch (const ConfigException& e) {
        REQUIRE(e.error().code == ConfigError::Code::MissingParameter);
        REQUIRE(e.error().field == "socket");
    }
    REQUIRE(network.built.empty());
}

TEST_CASE("TransportRouter rejects a factory that builds nothing", "[router][config]") {
    TransportFactory broken = [](TransportKind, const TransportConfig&) -> std::unique_ptr<ITransport> {
        return nullptr;
    };
    REQUIRE_THROWS_AS(TransportRouter(mixed_config(), broken), ConfigException);
}

TEST_CASE("TransportRouter builds one connection per referenced kind", "[router]") {
    MockNetwork network;
    TransportRouter router(mixed_config(), network.factory());

    REQUIRE(network.built == std::vector<TransportKind>{TransportKind::Pipe, TransportKind::Socket});
    REQUIRE(router.connections().size() == 2);
    REQUIRE_THROWS_AS(router.connection(TransportKind::EventStream), std::out_of_range);
}

// ─────────────────────────────────────────────────────────────────────────────
// Resolution
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("TransportRouter resolves capabilities to their transports", "[router]") {
    MockNetwork network;
    TransportRouter router(mixed_config(), network.factory());

    auto& tools = router.resolve(CapabilityKind::Tool);
    auto& prompts = router.resolve(CapabilityKind::Prompt);
    auto& resources = router.resolve(CapabilityKind::Resource);
    auto& fallback = router.resolve(CapabilityKind::Default);

    REQUIRE(tools.transport_kind() == TransportKind::Socket);
    REQUIRE(resources.transport_kind() == TransportKind::Pipe);

    // Capabilities on the same kind share one connection.
    REQUIRE(&tools == &prompts);
    REQUIRE(&resources == &fallback);
    REQUIRE(&tools != &resources);
    REQUIRE(&router.connection(TransportKind::Socket) == &tools);
}

TEST_CASE("TransportRouter starts and shuts down every connection", "[router][lifecycle]") {
    MockNetwork network;
    TransportRouter router(mixed_config(), network.factory());

    router.start();
    for (auto* manager : router.connections()) {
        REQUIRE(manager->wait_for_state(ConnectionState::Active, 2000ms));
    }
    REQUIRE(network.peer(TransportKind::Pipe).is_open());
    REQUIRE(network.peer(TransportKind::Socket).is_open());

    // Traffic for a capability goes out on its transport only.
    REQUIRE(router.resolve(CapabilityKind::Tool).send(Notification{"tools/ping", std::nullopt}).has_value());
    REQUIRE(network.peer(TransportKind::Socket).sent().size() == 1);
    REQUIRE(network.peer(TransportKind::Pipe).sent().empty());

    router.shutdown();
    for (auto* manager : router.connections()) {
        REQUIRE(manager->state() == ConnectionState::Closed);
    }
    REQUIRE(network.peer(TransportKind::Socket).is_open() == false);
}

TEST_CASE("TransportRouter hands credentials to network transports only", "[router][auth]") {
    MockNetwork network;
    auto config = mixed_config();
    config.with_auth([]() -> tl::expected<std::string, std::string> { return std::string("bearer-xyz"); });

    TransportRouter router(config, network.factory());
    router.start();
    REQUIRE(router.connection(TransportKind::Pipe).wait_for_state(ConnectionState::Active, 2000ms));
    REQUIRE(router.connection(TransportKind::Socket).wait_for_state(ConnectionState::Active, 2000ms));

    const auto socket_tokens = network.peer(TransportKind::Socket).auth_tokens();
    REQUIRE(socket_tokens.size() == 1);
    REQUIRE(socket_tokens[0] == "bearer-xyz");

    const auto pipe_tokens = network.peer(TransportKind::Pipe).auth_tokens();
    REQUIRE(pipe_tokens.size() == 1);
    REQUIRE(pipe_tokens[0].has_value() == false);
}

TEST_CASE("TransportRouter isolates a failed transport", "[router][failure]") {
    MockNetwork network;
    network.peer(TransportKind::Socket).fail_opens(1, "connection refused");

    TransportRouter router(mixed_config(), network.factory());

    std::mutex mutex;
    std::condition_variable cv;
    std::vector<TransportKind> reported;
    router.on_connection_failed([&](TransportKind kind, const std::string&) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            reported.push_back(kind);
        }
        cv.notify_all();
    });

    router.start();
    REQUIRE(router.connection(TransportKind::Socket).wait_for_state(ConnectionState::Failed, 2000ms));
    REQUIRE(router.connection(TransportKind::Pipe).wait_for_state(ConnectionState::Active, 2000ms));

    REQUIRE(router.failed_connections() == std::vector<TransportKind>{TransportKind::Socket});
    {
        std::unique_lock<std::mutex> lock(mutex);
        REQUIRE(cv.wait_for(lock, 2000ms, [&]() { return reported.empty() == false; }));
        REQUIRE(reported == std::vector<TransportKind>{TransportKind::Socket});
    }

    // Tools are down, resources still flow.
    auto tool_call = router.resolve(CapabilityKind::Tool).send(Notification{"tools/ping", std::nullopt});
    REQUIRE(tool_call.error().code == CallErrorCode::NotConnected);
    REQUIRE(router.resolve(CapabilityKind::Resource).send(Notification{"resources/ping", std::nullopt}).has_value());
}
