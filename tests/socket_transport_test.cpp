#include <catch2/catch_test_macros.hpp>

#include "mcpwire/transport/socket_transport.hpp"

#include <asio/connect.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/write.hpp>

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

using namespace mcpwire;
using namespace std::chrono_literals;

namespace {

// ─────────────────────────────────────────────────────────────────────────────
// Loopback helpers
// ─────────────────────────────────────────────────────────────────────────────

struct Loopback {
    std::unique_ptr<SocketTransport> server;
    std::unique_ptr<SocketTransport> client;
};

bool wait_for_listen(const SocketTransport& server) {
    const auto deadline = std::chrono::steady_clock::now() + 5s;
    while (server.local_port() == 0) {
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(5ms);
    }
    return true;
}

Loopback connect_loopback(std::optional<std::string> client_token = std::nullopt,
                          std::chrono::milliseconds read_timeout = 5000ms,
                          std::chrono::milliseconds client_write_timeout = SocketTransportConfig{}.write_timeout) {
    SocketTransportConfig server_config;
    server_config.mode = SocketMode::Listen;
    server_config.port = 0;
    server_config.connect_timeout = 5000ms;
    server_config.read_timeout = read_timeout;

    Loopback pair;
    pair.server = std::make_unique<SocketTransport>(server_config);

    TransportResult<void> accepted = tl::unexpected(TransportError::network("not run"));
    std::thread acceptor([&]() { accepted = pair.server->open(); });
    REQUIRE(wait_for_listen(*pair.server));

    SocketTransportConfig client_config;
    client_config.mode = SocketMode::Connect;
    client_config.port = pair.server->local_port();
    client_config.connect_timeout = 5000ms;
    client_config.read_timeout = read_timeout;
    client_config.write_timeout = client_write_timeout;
    pair.client = std::make_unique<SocketTransport>(client_config);
    pair.client->set_auth_token(std::move(client_token));

    const auto connected = pair.client->open();
    acceptor.join();

    REQUIRE(connected.has_value());
    REQUIRE(accepted.has_value());
    return pair;
}

std::uint16_t unused_port() {
    asio::io_context io;
    asio::ip::tcp::acceptor acceptor(io, asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0));
    const auto port = acceptor.local_endpoint().port();
    acceptor.close();
    return port;
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// Framing
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("encode_frame writes a big-endian length covering type and payload", "[socket][framing]") {
    const auto frame = encode_frame(FrameType::Data, "abc");

    REQUIRE(frame.size() == kFrameHeaderSize + 3);
    REQUIRE(frame[0] == 0);
    REQUIRE(frame[1] == 0);
    REQUIRE(frame[2] == 0);
    REQUIRE(frame[3] == 4);
    REQUIRE(static_cast<std::uint8_t>(frame[4]) == 0x01);
    REQUIRE(frame.substr(kFrameHeaderSize) == "abc");

    const auto ping = encode_frame(FrameType::Ping);
    REQUIRE(ping.size() == kFrameHeaderSize);
    REQUIRE(ping[3] == 1);
}

TEST_CASE("FrameDecoder reassembles frames split at any byte", "[socket][framing]") {
    const std::string stream = encode_frame(FrameType::Data, R"({"jsonrpc":"2.0","method":"a"})") +
                               encode_frame(FrameType::Ping) +
                               encode_frame(FrameType::Data, "second");

    FrameDecoder decoder;
    std::vector<Frame> frames;
    for (const char byte : stream) {
        auto decoded = decoder.feed(std::string_view(&byte, 1));
        REQUIRE(decoded.has_value());
        frames.insert(frames.end(), decoded->begin(), decoded->end());
    }

    REQUIRE(frames.size() == 3);
    REQUIRE(frames[0].type == FrameType::Data);
    REQUIRE(frames[0].payload == R"({"jsonrpc":"2.0","method":"a"})");
    REQUIRE(frames[1].type == FrameType::Ping);
    REQUIRE(frames[1].payload.empty());
    REQUIRE(frames[2].payload == "second");
    REQUIRE(decoder.buffered() == 0);
}

TEST_CASE("FrameDecoder returns every frame in one read", "[socket][framing]") {
    FrameDecoder decoder;
    const std::string partial = encode_frame(FrameType::Data, "third");

    auto frames = decoder.feed(encode_frame(FrameType::Data, "one") + encode_frame(FrameType::Pong) +
                               partial.substr(0, 6));

    REQUIRE(frames.has_value());
    REQUIRE(frames->size() == 2);
    REQUIRE(decoder.buffered() == 6);

    auto rest = decoder.feed(partial.substr(6));
    REQUIRE(rest->size() == 1);
    REQUIRE((*rest)[0].payload == "third");
}

TEST_CASE("FrameDecoder rejects framing violations", "[socket][framing][errors]") {
    FrameDecoder decoder(16);

    SECTION("zero length") {
        auto result = decoder.feed(std::string("\0\0\0\0", 4));
        REQUIRE(result.has_value() == false);
        REQUIRE(result.error().category == TransportError::Category::Protocol);
    }

    SECTION("oversized frame is rejected from its header alone") {
        const std::string header("\0\0\x01\x00", 4);
        auto result = decoder.feed(header);
        REQUIRE(result.has_value() == false);
        REQUIRE(result.error().category == TransportError::Category::Protocol);
    }

    SECTION("unknown type") {
        std::string frame = encode_frame(FrameType::Data, "x");
        frame[4] = 0x7F;
        auto result = decoder.feed(frame);
        REQUIRE(result.has_value() == false);
        REQUIRE(result.error().message.find("127") != std::string::npos);
    }

    REQUIRE(decoder.buffered() == 0);
}

TEST_CASE("to_string(FrameType)", "[socket][framing]") {
    REQUIRE(to_string(FrameType::Data) == "data");
    REQUIRE(to_string(FrameType::Ping) == "ping");
    REQUIRE(to_string(FrameType::Close) == "close");
}

// ─────────────────────────────────────────────────────────────────────────────
// Exchange
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("SocketTransport exchanges data frames over loopback", "[socket][transport]") {
    auto pair = connect_loopback();
    REQUIRE(pair.client->kind() == TransportKind::Socket);
    REQUIRE(pair.client->is_open());
    REQUIRE(pair.server->is_open());

    REQUIRE(pair.client->send(R"({"jsonrpc":"2.0","id":1,"method":"ping"})").has_value());
    auto at_server = pair.server->receive();
    REQUIRE(at_server.has_value());
    REQUIRE(*at_server == R"({"jsonrpc":"2.0","id":1,"method":"ping"})");

    REQUIRE(pair.server->send(R"({"jsonrpc":"2.0","id":1,"result":{}})").has_value());
    auto at_client = pair.client->receive();
    REQUIRE(at_client.has_value());
    REQUIRE(*at_client == R"({"jsonrpc":"2.0","id":1,"result":{}})");
}

TEST_CASE("SocketTransport preserves message boundaries", "[socket][transport]") {
    auto pair = connect_loopback();

    for (int i = 0; i < 50; ++i) {
        REQUIRE(pair.client->send("message-" + std::to_string(i)).has_value());
    }
    for (int i = 0; i < 50; ++i) {
        auto payload = pair.server->receive();
        REQUIRE(payload.has_value());
        REQUIRE(*payload == "message-" + std::to_string(i));
    }
}

TEST_CASE("SocketTransport sends the auth token on open", "[socket][transport][auth]") {
    auto pair = connect_loopback(std::string("secret-token"));

    REQUIRE(pair.client->send("after-auth").has_value());
    auto payload = pair.server->receive();

    REQUIRE(payload.has_value());
    REQUIRE(*payload == "after-auth");
    REQUIRE(pair.server->peer_auth_token() == "secret-token");
    REQUIRE(pair.client->peer_auth_token().has_value() == false);
}

TEST_CASE("SocketTransport rejects payloads over the frame limit", "[socket][transport][limits]") {
    auto pair = connect_loopback();

    auto sent = pair.client->send(std::string(kDefaultMaxFrameSize + 1, 'x'));

    REQUIRE(sent.has_value() == false);
    REQUIRE(sent.error().category == TransportError::Category::Protocol);
    REQUIRE(pair.client->is_open());
}

// ─────────────────────────────────────────────────────────────────────────────
// Liveness
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("SocketTransport probe succeeds when the peer answers pings", "[socket][transport][probe]") {
    auto pair = connect_loopback();

    // The server answers the ping while it waits for data.
    TransportResult<std::string> at_server = tl::unexpected(TransportError::network("not run"));
    std::thread server_reader([&]() { at_server = pair.server->receive(); });

    const auto probed = pair.client->probe(2000ms);
    const auto sent = pair.client->send("done");
    server_reader.join();

    REQUIRE(probed.has_value());
    REQUIRE(sent.has_value());
    REQUIRE(at_server.has_value());
    REQUIRE(*at_server == "done");
}

TEST_CASE("SocketTransport probe keeps data that arrives before the pong", "[socket][transport][probe]") {
    auto pair = connect_loopback();

    REQUIRE(pair.server->send("early data").has_value());
    TransportResult<std::string> at_server = tl::unexpected(TransportError::network("not run"));
    std::thread server_reader([&]() { at_server = pair.server->receive(); });

    const auto probed = pair.client->probe(2000ms);
    auto early = pair.client->receive();
    const auto sent = pair.client->send("done");
    server_reader.join();

    REQUIRE(probed.has_value());
    REQUIRE(early.has_value());
    REQUIRE(*early == "early data");
    REQUIRE(sent.has_value());
    REQUIRE(*at_server == "done");
}

TEST_CASE("SocketTransport probe times out against a stalled peer", "[socket][transport][probe]") {
    auto pair = connect_loopback();

    // The server never reads, so the ping goes unanswered.
    const auto started = std::chrono::steady_clock::now();
    auto probed = pair.client->probe(150ms);
    const auto elapsed = std::chrono::steady_clock::now() - started;

    REQUIRE(probed.has_value() == false);
    REQUIRE(probed.error().category == TransportError::Category::Timeout);
    REQUIRE(probed.error().message.find("stalled") != std::string::npos);
    REQUIRE(elapsed >= 140ms);
    REQUIRE(elapsed < 2s);
}

TEST_CASE("SocketTransport probe and close stay bounded when the peer stops reading", "[socket][transport][probe]") {
    // No write deadline: the sender parks once both socket buffers are full.
    auto pair = connect_loopback(std::nullopt, 5000ms, 0ms);

    const std::string chunk(1024 * 1024, 'x');
    std::atomic<bool> sender_done{false};
    std::atomic<int> chunks_sent{0};
    TransportResult<void> last_send;
    std::thread sender([&]() {
        while (true) {
            last_send = pair.client->send(chunk);
            if (last_send.has_value() == false) {
                break;
            }
            ++chunks_sent;
        }
        sender_done.store(true);
    });

    // Wait until the count stops moving: the sender is blocked in a write.
    int previous = -1;
    const auto settle_deadline = std::chrono::steady_clock::now() + 10s;
    while ((chunks_sent.load() != previous) && (std::chrono::steady_clock::now() < settle_deadline)) {
        previous = chunks_sent.load();
        std::this_thread::sleep_for(300ms);
    }
    REQUIRE(sender_done.load() == false);

    const auto probe_started = std::chrono::steady_clock::now();
    auto probed = pair.client->probe(200ms);
    const auto probe_elapsed = std::chrono::steady_clock::now() - probe_started;

    REQUIRE(probed.has_value() == false);
    REQUIRE(probed.error().category == TransportError::Category::Timeout);
    REQUIRE(probed.error().message.find("stalled") != std::string::npos);
    REQUIRE(probe_elapsed < 2s);

    const auto close_started = std::chrono::steady_clock::now();
    REQUIRE(pair.client->close().has_value());
    const auto close_elapsed = std::chrono::steady_clock::now() - close_started;
    sender.join();

    REQUIRE(close_elapsed < 2s);
    REQUIRE(sender_done.load());
    REQUIRE(last_send.has_value() == false);
    REQUIRE(last_send.error().category == TransportError::Category::Closed);
}

TEST_CASE("SocketTransport send gives up at the write timeout", "[socket][transport][limits]") {
    SocketTransportConfig server_config;
    server_config.mode = SocketMode::Listen;
    server_config.connect_timeout = 5000ms;
    SocketTransport server(server_config);
    TransportResult<void> accepted = tl::unexpected(TransportError::network("not run"));
    std::thread acceptor([&]() { accepted = server.open(); });
    REQUIRE(wait_for_listen(server));

    SocketTransportConfig client_config;
    client_config.port = server.local_port();
    client_config.write_timeout = 200ms;
    SocketTransport client(client_config);
    REQUIRE(client.open().has_value());
    acceptor.join();
    REQUIRE(accepted.has_value());

    // The server never reads; some send eventually misses its deadline.
    const std::string chunk(1024 * 1024, 'x');
    const auto started = std::chrono::steady_clock::now();
    TransportResult<void> sent;
    for (int i = 0; (i < 256) && sent.has_value(); ++i) {
        sent = client.send(chunk);
    }
    const auto elapsed = std::chrono::steady_clock::now() - started;

    REQUIRE(sent.has_value() == false);
    const bool stalled = (sent.error().category == TransportError::Category::Timeout) ||
                         (sent.error().category == TransportError::Category::Closed);
    REQUIRE(stalled);
    REQUIRE(elapsed < 10s);
}

TEST_CASE("SocketTransport probe on a closed transport fails immediately", "[socket][transport][probe]") {
    SocketTransport transport(SocketTransportConfig{});

    auto probed = transport.probe(1000ms);
    REQUIRE(probed.error().category == TransportError::Category::Closed);
}

TEST_CASE("SocketTransport read timeout is transient", "[socket][transport]") {
    auto pair = connect_loopback(std::nullopt, 50ms);

    auto payload = pair.client->receive();
    REQUIRE(payload.has_value() == false);
    REQUIRE(payload.error().is_transient());

    REQUIRE(pair.server->send("later").has_value());
    auto later = pair.client->receive();
    REQUIRE(later.has_value());
    REQUIRE(*later == "later");
}

// ─────────────────────────────────────────────────────────────────────────────
// Lifecycle
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("SocketTransport reports the peer's close frame", "[socket][transport][lifecycle]") {
    auto pair = connect_loopback();

    REQUIRE(pair.server->close().has_value());

    auto payload = pair.client->receive();
    REQUIRE(payload.has_value() == false);
    REQUIRE(payload.error().category == TransportError::Category::Closed);
}

TEST_CASE("SocketTransport close unblocks a pending receive", "[socket][transport][lifecycle]") {
    auto pair = connect_loopback(std::nullopt, 0ms);

    std::atomic<bool> returned{false};
    TransportResult<std::string> result = tl::unexpected(TransportError::network("not run"));
    std::thread reader([&]() {
        result = pair.client->receive();
        returned.store(true);
    });

    std::this_thread::sleep_for(100ms);
    REQUIRE(returned.load() == false);

    REQUIRE(pair.client->close().has_value());
    reader.join();

    REQUIRE(result.has_value() == false);
    REQUIRE(result.error().category == TransportError::Category::Closed);
    REQUIRE(pair.client->is_open() == false);
}

TEST_CASE("SocketTransport send after close fails with Closed", "[socket][transport][lifecycle]") {
    auto pair = connect_loopback();
    REQUIRE(pair.client->close().has_value());
    REQUIRE(pair.client->close().has_value());

    auto sent = pair.client->send("late");
    REQUIRE(sent.error().category == TransportError::Category::Closed);
}

TEST_CASE("SocketTransport can reconnect after close", "[socket][transport][lifecycle]") {
    auto first = connect_loopback();
    REQUIRE(first.client->close().has_value());
    REQUIRE(first.server->close().has_value());

    SocketTransportConfig server_config;
    server_config.mode = SocketMode::Listen;
    server_config.connect_timeout = 5000ms;
    SocketTransport server(server_config);
    TransportResult<void> accepted = tl::unexpected(TransportError::network("not run"));
    std::thread acceptor([&]() { accepted = server.open(); });
    REQUIRE(wait_for_listen(server));

    // Same client settings, new listener.
    SocketTransportConfig client_config = first.client->config();
    client_config.port = server.local_port();
    SocketTransport client(client_config);
    REQUIRE(client.open().has_value());
    acceptor.join();
    REQUIRE(accepted.has_value());

    REQUIRE(client.send("again").has_value());
    auto payload = server.receive();
    REQUIRE(payload.has_value());
    REQUIRE(*payload == "again");

    // A closed server can listen again too.
    REQUIRE(server.close().has_value());
    std::thread reacceptor([&]() { accepted = server.open(); });
    REQUIRE(wait_for_listen(server));
    SocketTransportConfig second_config = client_config;
    second_config.port = server.local_port();
    SocketTransport second_client(second_config);
    REQUIRE(second_client.open().has_value());
    reacceptor.join();
    REQUIRE(accepted.has_value());
}

TEST_CASE("SocketTransport treats a framing error as a closed connection", "[socket][transport][errors]") {
    SocketTransportConfig config;
    config.mode = SocketMode::Listen;
    config.connect_timeout = 5000ms;
    config.read_timeout = 5000ms;
    SocketTransport server(config);
    TransportResult<void> accepted = tl::unexpected(TransportError::network("not run"));
    std::thread acceptor([&]() { accepted = server.open(); });
    REQUIRE(wait_for_listen(server));

    asio::io_context io;
    asio::ip::tcp::socket raw(io);
    asio::error_code ec;
    raw.connect(asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), server.local_port()), ec);
    acceptor.join();
    REQUIRE_FALSE(ec);
    REQUIRE(accepted.has_value());

    // A zero-length header: nothing after it can be framed.
    const std::string garbage("\0\0\0\0more bytes", 14);
    asio::write(raw, asio::buffer(garbage), ec);
    REQUIRE_FALSE(ec);

    auto first = server.receive();
    REQUIRE(first.has_value() == false);
    REQUIRE(first.error().category == TransportError::Category::Closed);
    REQUIRE(first.error().message.find("framing") != std::string::npos);

    auto second = server.receive();
    REQUIRE(second.has_value() == false);
    REQUIRE(second.error().category == TransportError::Category::Closed);
}

TEST_CASE("SocketTransport connect to a closed port fails", "[socket][transport][errors]") {
    SocketTransportConfig config;
    config.port = unused_port();
    config.connect_timeout = 2000ms;
    SocketTransport transport(config);

    auto opened = transport.open();
    REQUIRE(opened.has_value() == false);
    REQUIRE(opened.error().category == TransportError::Category::Network);
    REQUIRE(transport.is_open() == false);
}

TEST_CASE("SocketTransport accept gives up after the timeout", "[socket][transport][errors]") {
    SocketTransportConfig config;
    config.mode = SocketMode::Listen;
    config.connect_timeout = 100ms;
    SocketTransport transport(config);

    auto opened = transport.open();
    REQUIRE(opened.has_value() == false);
    REQUIRE(opened.error().category == TransportError::Category::Timeout);
    REQUIRE(transport.local_port() == 0);
}

TEST_CASE("SocketTransport rejects an invalid listen address", "[socket][transport][errors]") {
    SocketTransportConfig config;
    config.mode = SocketMode::Listen;
    config.host = "not-an-address";
    SocketTransport transport(config);

    auto opened = transport.open();
    REQUIRE(opened.error().category == TransportError::Category::Protocol);
}
