#include <catch2/catch_test_macros.hpp>

#include "mcpwire/connection/connection_manager.hpp"
#include "mcpwire/protocol/codec.hpp"

#include "mocks/mock_transport.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

using namespace mcpwire;
using namespace mcpwire::testing;
using namespace std::chrono_literals;

namespace {

// Heartbeat off, one quick confirmation probe, immediate reconnects.
ConnectionOptions fast_options() {
    ConnectionOptions options;
    options.with_heartbeat(0ms, 50ms)
           .with_confirmation(1, 5ms)
           .with_reconnect(3, 1ms, 10ms)
           .with_backoff_jitter(0.0)
           .with_sweep_interval(5ms);
    return options;
}

// Records every state change reported by a ConnectionManager.
class StateRecorder {
public:
    void attach(ConnectionManager& manager) {
        manager.on_state_change([this](ConnectionState from, ConnectionState to) {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                transitions_.emplace_back(from, to);
            }
            cv_.notify_all();
        });
    }

    // True once `state` has been entered at least `times` times.
    bool wait_for_entry(ConnectionState state, std::size_t times = 1,
                        std::chrono::milliseconds timeout = 3000ms) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [&]() { return count_locked(state) >= times; });
    }

    std::size_t entries(ConnectionState state) {
        std::lock_guard<std::mutex> lock(mutex_);
        return count_locked(state);
    }

    std::vector<std::pair<ConnectionState, ConnectionState>> transitions() {
        std::lock_guard<std::mutex> lock(mutex_);
        return transitions_;
    }

private:
    std::size_t count_locked(ConnectionState state) const {
        return static_cast<std::size_t>(std::count_if(transitions_.begin(), transitions_.end(),
            [state](const auto& t) { return t.second == state; }));
    }

    std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<std::pair<ConnectionState, ConnectionState>> transitions_;
};

// Collects inbound messages handed over by the reader thread.
class InboundInbox {
public:
    ConnectionManager::InboundHandler handler() {
        return [this](const Message& message) {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                messages_.push_back(message);
            }
            cv_.notify_all();
        };
    }

    bool wait_for(std::size_t count, std::chrono::milliseconds timeout = 2000ms) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [&]() { return messages_.size() >= count; });
    }

    std::vector<Message> messages() {
        std::lock_guard<std::mutex> lock(mutex_);
        return messages_;
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<Message> messages_;
};

CallFuture pending_call(ConnectionManager& manager, std::int64_t id) {
    auto future = manager.correlation().add(RequestId::integer(id), "pending",
                                            CorrelationTable::Clock::now() + 1h);
    REQUIRE(future.has_value());
    return std::move(*future);
}

CallResult<Json> resolved(CallFuture& future) {
    REQUIRE(future.wait_for(3s) == std::future_status::ready);
    return future.get();
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// State Table
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("ConnectionState transition table", "[connection][state]") {
    using S = ConnectionState;

    REQUIRE(is_valid_transition(S::Initializing, S::Active));
    REQUIRE(is_valid_transition(S::Initializing, S::Reconnecting));
    REQUIRE(is_valid_transition(S::Initializing, S::Failed));
    REQUIRE(is_valid_transition(S::Active, S::Degraded));
    REQUIRE(is_valid_transition(S::Degraded, S::Active));
    REQUIRE(is_valid_transition(S::Degraded, S::Reconnecting));
    REQUIRE(is_valid_transition(S::Reconnecting, S::Active));
    REQUIRE(is_valid_transition(S::Reconnecting, S::Failed));

    REQUIRE(is_valid_transition(S::Active, S::Reconnecting) == false);
    REQUIRE(is_valid_transition(S::Active, S::Failed) == false);
    REQUIRE(is_valid_transition(S::Degraded, S::Failed) == false);
    REQUIRE(is_valid_transition(S::Reconnecting, S::Degraded) == false);

    for (auto from : {S::Initializing, S::Active, S::Degraded, S::Reconnecting}) {
        REQUIRE(is_valid_transition(from, S::Closed));
        REQUIRE(is_terminal(from) == false);
    }
    for (auto to : {S::Initializing, S::Active, S::Degraded, S::Reconnecting, S::Closed, S::Failed}) {
        REQUIRE(is_valid_transition(S::Closed, to) == false);
        REQUIRE(is_valid_transition(S::Failed, to) == false);
    }

    REQUIRE(accepts_traffic(S::Active));
    REQUIRE(accepts_traffic(S::Degraded));
    REQUIRE(accepts_traffic(S::Reconnecting) == false);
    REQUIRE(accepts_traffic(S::Initializing) == false);
    REQUIRE(to_string(S::Reconnecting) == "Reconnecting");
}

TEST_CASE("ConnectionOptions builders", "[connection][options]") {
    ConnectionOptions defaults;
    REQUIRE(defaults.heartbeat_interval == 15000ms);
    REQUIRE(defaults.confirmation_probes == 2);
    REQUIRE(defaults.max_reconnect_attempts == 5);

    auto options = ConnectionOptions{}
        .with_heartbeat(100ms, 20ms)
        .with_confirmation(4, 30ms)
        .with_reconnect(7, 10ms, 900ms)
        .with_backoff_jitter(0.5)
        .with_sweep_interval(3ms);

    REQUIRE(options.heartbeat_interval == 100ms);
    REQUIRE(options.heartbeat_timeout == 20ms);
    REQUIRE(options.confirmation_probes == 4);
    REQUIRE(options.probe_interval == 30ms);
    REQUIRE(options.max_reconnect_attempts == 7);
    REQUIRE(options.backoff_base == 10ms);
    REQUIRE(options.backoff_cap == 900ms);
    REQUIRE(options.backoff_jitter == 0.5);
    REQUIRE(options.sweep_interval == 3ms);
}

// ─────────────────────────────────────────────────────────────────────────────
// Startup
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("ConnectionManager opens the transport and becomes Active", "[connection]") {
    auto peer = std::make_shared<MockPeer>();
    ConnectionManager manager(std::make_unique<MockTransport>(peer), fast_options());

    REQUIRE(manager.state() == ConnectionState::Initializing);
    REQUIRE(manager.transport_kind() == TransportKind::Socket);

    manager.start();
    REQUIRE(manager.wait_for_state(ConnectionState::Active, 2000ms));
    REQUIRE(peer->is_open());
    REQUIRE(peer->successful_opens() == 1);
    REQUIRE(manager.reconnect_attempts() == 0);

    manager.shutdown();
    REQUIRE(manager.state() == ConnectionState::Closed);
    REQUIRE(peer->is_open() == false);
}

TEST_CASE("ConnectionManager fails at once when the first open fails and reconnects are off", "[connection]") {
    auto peer = std::make_shared<MockPeer>();
    peer->fail_opens(1, "no route to host");
    auto options = fast_options();
    options.max_reconnect_attempts = 0;

    ConnectionManager manager(std::make_unique<MockTransport>(peer), options);
    std::atomic<int> failed_calls{0};
    manager.on_failed([&failed_calls](const std::string&) { ++failed_calls; });

    manager.start();
    REQUIRE(manager.wait_for_state(ConnectionState::Failed, 2000ms));
    REQUIRE(manager.last_error().find("no route to host") != std::string::npos);
    REQUIRE(failed_calls.load() == 1);
    REQUIRE(manager.backoff_history().empty());
}

TEST_CASE("ConnectionManager retries a failed first open", "[connection][reconnect]") {
    auto peer = std::make_shared<MockPeer>();
    peer->fail_opens(3);
    auto options = fast_options()
        .with_reconnect(5, 10ms, 1000ms)
        .with_backoff_jitter(0.0);

    ConnectionManager manager(std::make_unique<MockTransport>(peer), options);
    StateRecorder recorder;
    recorder.attach(manager);

    manager.start();
    REQUIRE(recorder.wait_for_entry(ConnectionState::Active));

    REQUIRE(peer->open_attempts() == 4);
    REQUIRE(manager.reconnect_attempts() == 0);

    const auto history = manager.backoff_history();
    REQUIRE(history == std::vector<std::chrono::milliseconds>{10ms, 20ms, 40ms});

    const auto transitions = recorder.transitions();
    REQUIRE(transitions.front() == std::make_pair(ConnectionState::Initializing, ConnectionState::Reconnecting));
    REQUIRE(transitions.back() == std::make_pair(ConnectionState::Reconnecting, ConnectionState::Active));
}

// ─────────────────────────────────────────────────────────────────────────────
// Degraded and Recovery
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("ConnectionManager recovers from a transient fault without reopening", "[connection][degraded]") {
    auto peer = std::make_shared<MockPeer>();
    ConnectionManager manager(std::make_unique<MockTransport>(peer), fast_options());
    StateRecorder recorder;
    recorder.attach(manager);

    manager.start();
    REQUIRE(recorder.wait_for_entry(ConnectionState::Active));
    auto call = pending_call(manager, 1);

    // A malformed frame leaves the channel usable.
    peer->push_receive_error(TransportError::protocol("bad frame"));

    REQUIRE(recorder.wait_for_entry(ConnectionState::Degraded));
    REQUIRE(recorder.wait_for_entry(ConnectionState::Active, 2));
    REQUIRE(recorder.entries(ConnectionState::Reconnecting) == 0);
    REQUIRE(peer->successful_opens() == 1);
    REQUIRE(peer->probes() >= 1);

    // Calls survive a Degraded episode that ends in recovery.
    REQUIRE(call.wait_for(50ms) == std::future_status::timeout);
    REQUIRE(manager.correlation().contains(RequestId::integer(1)));
}

TEST_CASE("ConnectionManager treats a send failure as a fault", "[connection][degraded]") {
    auto peer = std::make_shared<MockPeer>();
    ConnectionManager manager(std::make_unique<MockTransport>(peer), fast_options());
    StateRecorder recorder;
    recorder.attach(manager);

    manager.start();
    REQUIRE(recorder.wait_for_entry(ConnectionState::Active));

    peer->fail_sends(true);
    auto sent = manager.send(Notification{"notifications/progress", Json{{"progress", 1}}});
    REQUIRE(sent.has_value() == false);
    REQUIRE(sent.error().code == CallErrorCode::Transport);
    REQUIRE(sent.error().message.find("broken pipe") != std::string::npos);
    peer->fail_sends(false);

    REQUIRE(recorder.wait_for_entry(ConnectionState::Degraded));
    REQUIRE(recorder.wait_for_entry(ConnectionState::Active, 2));

    REQUIRE(manager.send(Notification{"notifications/progress", Json{{"progress", 2}}}).has_value());
    REQUIRE(peer->sent().size() == 1);
}

TEST_CASE("ConnectionManager heartbeat failure degrades the connection", "[connection][heartbeat]") {
    auto peer = std::make_shared<MockPeer>();
    auto options = fast_options()
        .with_heartbeat(20ms, 10ms)
        .with_confirmation(100, 10ms);
    ConnectionManager manager(std::make_unique<MockTransport>(peer), options);
    StateRecorder recorder;
    recorder.attach(manager);

    manager.start();
    REQUIRE(recorder.wait_for_entry(ConnectionState::Active));

    peer->fail_probes(true);
    REQUIRE(recorder.wait_for_entry(ConnectionState::Degraded));
    REQUIRE(manager.last_error().find("heartbeat missed") != std::string::npos);

    peer->fail_probes(false);
    REQUIRE(recorder.wait_for_entry(ConnectionState::Active, 2));
    REQUIRE(recorder.entries(ConnectionState::Reconnecting) == 0);
}

// ─────────────────────────────────────────────────────────────────────────────
// Reconnecting
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("ConnectionManager reconnects a dropped channel and resets pending calls", "[connection][reconnect]") {
    auto peer = std::make_shared<MockPeer>();
    ConnectionManager manager(std::make_unique<MockTransport>(peer), fast_options());
    StateRecorder recorder;
    recorder.attach(manager);

    manager.start();
    REQUIRE(recorder.wait_for_entry(ConnectionState::Active));
    auto call = pending_call(manager, 42);

    peer->break_channel();

    auto result = resolved(call);
    REQUIRE(result.has_value() == false);
    REQUIRE(result.error().code == CallErrorCode::ConnectionReset);

    REQUIRE(recorder.wait_for_entry(ConnectionState::Active, 2));
    REQUIRE(recorder.entries(ConnectionState::Reconnecting) == 1);
    REQUIRE(peer->successful_opens() == 2);

    using S = ConnectionState;
    const std::vector<std::pair<S, S>> expected{
        {S::Initializing, S::Active},
        {S::Active, S::Degraded},
        {S::Degraded, S::Reconnecting},
        {S::Reconnecting, S::Active},
    };
    REQUIRE(recorder.transitions() == expected);
    REQUIRE(manager.reconnect_attempts() == 0);
    REQUIRE(manager.correlation().size() == 0);

    // The new channel carries traffic.
    peer->echo_requests();
    REQUIRE(manager.send(Request{RequestId::integer(43), "ping", std::nullopt}).has_value());
    REQUIRE(peer->wait_for_sent(1, 1000ms));
}

TEST_CASE("ConnectionManager backoff starts over after a successful reconnect", "[connection][reconnect]") {
    auto peer = std::make_shared<MockPeer>();
    peer->fail_opens(2);
    auto options = fast_options()
        .with_reconnect(5, 10ms, 1000ms)
        .with_backoff_jitter(0.0);

    ConnectionManager manager(std::make_unique<MockTransport>(peer), options);
    StateRecorder recorder;
    recorder.attach(manager);

    manager.start();
    REQUIRE(recorder.wait_for_entry(ConnectionState::Active));
    REQUIRE(manager.backoff_history() == std::vector<std::chrono::milliseconds>{10ms, 20ms});

    peer->fail_opens(1);
    peer->break_channel();
    REQUIRE(recorder.wait_for_entry(ConnectionState::Active, 2));

    REQUIRE(manager.backoff_history() == std::vector<std::chrono::milliseconds>{10ms, 20ms, 10ms, 20ms});
    REQUIRE(manager.reconnect_attempts() == 0);
}

TEST_CASE("ConnectionManager gives up after the last reconnect attempt", "[connection][reconnect]") {
    auto peer = std::make_shared<MockPeer>();
    auto options = fast_options();
    options.max_reconnect_attempts = 2;
    ConnectionManager manager(std::make_unique<MockTransport>(peer), options, {},
                              std::make_unique<NoBackoff>());

    std::mutex reason_mutex;
    std::string failure_reason;
    manager.on_failed([&](const std::string& reason) {
        std::lock_guard<std::mutex> lock(reason_mutex);
        failure_reason = reason;
    });

    manager.start();
    REQUIRE(manager.wait_for_state(ConnectionState::Active, 2000ms));
    auto call = pending_call(manager, 1);

    peer->fail_opens(10);
    peer->break_channel();

    REQUIRE(manager.wait_for_state(ConnectionState::Failed, 3000ms));

    auto result = resolved(call);
    REQUIRE(result.error().code == CallErrorCode::ReconnectExhausted);

    {
        std::lock_guard<std::mutex> lock(reason_mutex);
        REQUIRE(failure_reason.find("gave up after 2 reconnect attempt(s)") != std::string::npos);
        REQUIRE(failure_reason.find("connection refused") != std::string::npos);
    }
    REQUIRE(peer->open_attempts() == 3);
    REQUIRE(manager.backoff_history() == std::vector<std::chrono::milliseconds>{0ms, 0ms});

    auto sent = manager.send(Notification{"late", std::nullopt});
    REQUIRE(sent.error().code == CallErrorCode::NotConnected);
}

// ─────────────────────────────────────────────────────────────────────────────
// Authentication
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("ConnectionManager asks the auth provider before every open", "[connection][auth]") {
    auto peer = std::make_shared<MockPeer>();
    std::atomic<int> issued{0};
    AuthTokenProvider provider = [&issued]() -> tl::expected<std::string, std::string> {
        return "token-" + std::to_string(++issued);
    };

    ConnectionManager manager(std::make_unique<MockTransport>(peer), fast_options(), provider);
    StateRecorder recorder;
    recorder.attach(manager);

    manager.start();
    REQUIRE(recorder.wait_for_entry(ConnectionState::Active));
    peer->break_channel();
    REQUIRE(recorder.wait_for_entry(ConnectionState::Active, 2));

    const auto tokens = peer->auth_tokens();
    REQUIRE(tokens.size() == 2);
    REQUIRE(tokens[0] == "token-1");
    REQUIRE(tokens[1] == "token-2");
}

TEST_CASE("ConnectionManager does not open when the auth provider fails", "[connection][auth]") {
    auto peer = std::make_shared<MockPeer>();
    auto options = fast_options();
    options.max_reconnect_attempts = 0;

    SECTION("provider reports an error") {
        AuthTokenProvider provider = []() -> tl::expected<std::string, std::string> {
            return tl::unexpected(std::string("token expired"));
        };
        ConnectionManager manager(std::make_unique<MockTransport>(peer), options, provider);
        manager.start();

        REQUIRE(manager.wait_for_state(ConnectionState::Failed, 2000ms));
        REQUIRE(manager.last_error().find("auth provider failed: token expired") != std::string::npos);
    }

    SECTION("provider throws") {
        AuthTokenProvider provider = []() -> tl::expected<std::string, std::string> {
            throw std::runtime_error("keychain locked");
        };
        ConnectionManager manager(std::make_unique<MockTransport>(peer), options, provider);
        manager.start();

        REQUIRE(manager.wait_for_state(ConnectionState::Failed, 2000ms));
        REQUIRE(manager.last_error().find("keychain locked") != std::string::npos);
    }

    REQUIRE(peer->open_attempts() == 0);
}

// ─────────────────────────────────────────────────────────────────────────────
// Traffic
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("ConnectionManager refuses to send outside Active and Degraded", "[connection][send]") {
    auto peer = std::make_shared<MockPeer>();
    ConnectionManager manager(std::make_unique<MockTransport>(peer), fast_options());

    auto before = manager.send(Notification{"early", std::nullopt});
    REQUIRE(before.has_value() == false);
    REQUIRE(before.error().code == CallErrorCode::NotConnected);
    REQUIRE(before.error().message.find("Initializing") != std::string::npos);

    manager.start();
    REQUIRE(manager.wait_for_state(ConnectionState::Active, 2000ms));
    REQUIRE(manager.send(Notification{"ok", std::nullopt}).has_value());

    manager.shutdown();
    auto after = manager.send(Notification{"late", std::nullopt});
    REQUIRE(after.error().code == CallErrorCode::NotConnected);
    REQUIRE(peer->sent().size() == 1);
}

TEST_CASE("ConnectionManager delivers decoded messages and drops undecodable ones", "[connection][inbound]") {
    auto peer = std::make_shared<MockPeer>();
    ConnectionManager manager(std::make_unique<MockTransport>(peer), fast_options());
    StateRecorder recorder;
    recorder.attach(manager);
    InboundInbox inbox;
    manager.set_inbound_handler(inbox.handler());

    manager.start();
    REQUIRE(recorder.wait_for_entry(ConnectionState::Active));

    peer->push_inbound("this is not json");
    peer->push_inbound(R"({"jsonrpc":"2.0","method":"notifications/message","params":{"level":"info"}})");
    peer->push_inbound(R"({"jsonrpc":"2.0","id":9,"result":{}})");

    REQUIRE(inbox.wait_for(2));
    const auto messages = inbox.messages();
    REQUIRE(messages.size() == 2);
    REQUIRE(std::holds_alternative<Notification>(messages[0]));
    REQUIRE(std::holds_alternative<Response>(messages[1]));

    // Garbage is not a connection fault.
    REQUIRE(recorder.entries(ConnectionState::Degraded) == 0);
}

TEST_CASE("ConnectionManager survives an inbound handler that throws", "[connection][inbound]") {
    auto peer = std::make_shared<MockPeer>();
    ConnectionManager manager(std::make_unique<MockTransport>(peer), fast_options());
    InboundInbox inbox;
    auto record = inbox.handler();
    std::atomic<bool> thrown{false};
    manager.set_inbound_handler([&](const Message& message) {
        const bool first = (thrown.exchange(true) == false);
        if (first) {
            throw std::runtime_error("handler bug");
        }
        record(message);
    });

    manager.start();
    REQUIRE(manager.wait_for_state(ConnectionState::Active, 2000ms));

    peer->push_inbound(encode_message(Notification{"first", std::nullopt}));
    peer->push_inbound(encode_message(Notification{"second", std::nullopt}));

    REQUIRE(inbox.wait_for(1));
    REQUIRE(std::get<Notification>(inbox.messages()[0]).method == "second");
    REQUIRE(manager.state() == ConnectionState::Active);
}

TEST_CASE("ConnectionManager replacing the handler waits for a running delivery", "[connection][inbound]") {
    auto peer = std::make_shared<MockPeer>();
    ConnectionManager manager(std::make_unique<MockTransport>(peer), fast_options());
    std::atomic<bool> entered{false};
    std::atomic<bool> release{false};
    std::atomic<bool> finished{false};
    manager.set_inbound_handler([&](const Message&) {
        entered = true;
        while (release.load() == false) {
            std::this_thread::sleep_for(1ms);
        }
        finished = true;
    });

    manager.start();
    REQUIRE(manager.wait_for_state(ConnectionState::Active, 2000ms));
    peer->push_inbound(encode_message(Notification{"slow", std::nullopt}));

    const auto until = std::chrono::steady_clock::now() + 2000ms;
    while ((entered.load() == false) && (std::chrono::steady_clock::now() < until)) {
        std::this_thread::sleep_for(1ms);
    }
    REQUIRE(entered.load());

    std::atomic<bool> replaced{false};
    std::atomic<bool> finished_before_return{false};
    std::thread replacer([&]() {
        manager.set_inbound_handler(nullptr);
        finished_before_return = finished.load();
        replaced = true;
    });

    std::this_thread::sleep_for(100ms);
    const bool returned_early = replaced.load();
    release = true;
    replacer.join();

    REQUIRE(returned_early == false);
    REQUIRE(replaced.load());
    REQUIRE(finished_before_return.load());
}

// ─────────────────────────────────────────────────────────────────────────────
// Deadlines and Shutdown
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("ConnectionManager sweeps overdue calls", "[connection][deadline]") {
    auto peer = std::make_shared<MockPeer>();
    ConnectionManager manager(std::make_unique<MockTransport>(peer), fast_options());
    manager.start();
    REQUIRE(manager.wait_for_state(ConnectionState::Active, 2000ms));

    auto future = manager.correlation().add(RequestId::integer(1), "tools/call",
                                            CorrelationTable::Clock::now() + 30ms);
    REQUIRE(future.has_value());

    auto result = resolved(*future);
    REQUIRE(result.has_value() == false);
    REQUIRE(result.error().code == CallErrorCode::Timeout);
    REQUIRE(manager.correlation().size() == 0);
}

TEST_CASE("ConnectionManager shutdown fails pending calls with ConnectionClosed", "[connection][shutdown]") {
    auto peer = std::make_shared<MockPeer>();
    ConnectionManager manager(std::make_unique<MockTransport>(peer), fast_options());
    std::atomic<int> failed_calls{0};
    manager.on_failed([&failed_calls](const std::string&) { ++failed_calls; });

    manager.start();
    REQUIRE(manager.wait_for_state(ConnectionState::Active, 2000ms));
    auto call = pending_call(manager, 5);

    manager.shutdown();
    manager.shutdown();

    REQUIRE(manager.state() == ConnectionState::Closed);
    auto result = resolved(call);
    REQUIRE(result.error().code == CallErrorCode::ConnectionClosed);
    REQUIRE(failed_calls.load() == 0);
    REQUIRE(peer->is_open() == false);
}

TEST_CASE("ConnectionManager shutdown interrupts a reconnect backoff", "[connection][shutdown]") {
    auto peer = std::make_shared<MockPeer>();
    peer->fail_opens(1);
    ConnectionManager manager(std::make_unique<MockTransport>(peer), fast_options(), {},
                              std::make_unique<ConstantBackoff>(10'000ms));

    manager.start();
    REQUIRE(manager.wait_for_state(ConnectionState::Reconnecting, 2000ms));

    const auto started = std::chrono::steady_clock::now();
    manager.shutdown();
    const auto elapsed = std::chrono::steady_clock::now() - started;

    REQUIRE(elapsed < 2s);
    REQUIRE(manager.state() == ConnectionState::Closed);
    REQUIRE(peer->open_attempts() == 1);
}

TEST_CASE("ConnectionManager can be shut down before it starts", "[connection][shutdown]") {
    auto peer = std::make_shared<MockPeer>();
    ConnectionManager manager(std::make_unique<MockTransport>(peer), fast_options());

    manager.shutdown();
    REQUIRE(manager.state() == ConnectionState::Closed);

    manager.start();
    REQUIRE(manager.state() == ConnectionState::Closed);
    REQUIRE(peer->open_attempts() == 0);
}
