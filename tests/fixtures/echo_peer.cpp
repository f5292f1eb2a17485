// Subordinate process used by the pipe transport tests.
//
// Reads newline-delimited messages from stdin and answers every request with
// {"method": ..., "params": ...}. A few methods change that:
//   "peer/delay"   {"ms": N}    reply after N milliseconds (on its own thread)
//   "peer/notify"  {}           send a "peer/event" notification, then reply
//   "peer/stderr"  {"text": s}  write s to stderr, then reply
//   "peer/exit"    {"code": N}  exit immediately with status N, no reply
//   "peer/garbage" {}           write a line that is not a message, then reply
// Notifications are ignored. Exits with 0 on EOF.

#include "mcpwire/protocol/codec.hpp"
#include "mcpwire/transport/pipe_transport.hpp"

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <variant>
#include <vector>

namespace {

// Serves over our own stdin/stdout.
mcpwire::PipeTransport& peer_transport() {
    static mcpwire::PipeTransport transport(mcpwire::PipeTransportConfig::attached());
    return transport;
}

void write_line(const std::string& line) {
    auto sent = peer_transport().send(line);
    if (sent.has_value() == false) {
        std::cerr << "echo_peer: send failed: " << sent.error().message << std::endl;
    }
}

mcpwire::Json echo_result(const mcpwire::Request& request) {
    return {{"method", request.method}, {"params", request.params.value_or(mcpwire::Json())}};
}

void reply(const mcpwire::Request& request) {
    write_line(mcpwire::encode_message(mcpwire::Response{request.id, echo_result(request)}));
}

std::int64_t int_param(const mcpwire::Request& request, const char* name, std::int64_t fallback) {
    if (request.params.has_value() == false || request.params->is_object() == false) {
        return fallback;
    }
    return request.params->value(name, fallback);
}

}  // namespace

int main() {
    auto& transport = peer_transport();
    auto opened = transport.open();
    if (opened.has_value() == false) {
        std::cerr << "echo_peer: " << opened.error().message << std::endl;
        return 2;
    }

    std::vector<std::thread> delayed;

    while (true) {
        auto line = transport.receive();
        if (line.has_value() == false) {
            if (line.error().category == mcpwire::TransportError::Category::Protocol) {
                continue;  // oversized line, already skipped
            }
            break;  // EOF
        }

        auto message = mcpwire::decode_message(*line);
        if (message.has_value() == false) {
            write_line(mcpwire::encode_message(mcpwire::ErrorResponse{
                std::nullopt,
                mcpwire::ErrorObject{mcpwire::ErrorObject::kParseError, message.error().message, std::nullopt}}));
            continue;
        }

        const auto* request = std::get_if<mcpwire::Request>(&*message);
        if (request == nullptr) {
            continue;
        }

        if (request->method == "peer/exit") {
            std::_Exit(static_cast<int>(int_param(*request, "code", 0)));
        }

        if (request->method == "peer/delay") {
            const auto ms = int_param(*request, "ms", 0);
            delayed.emplace_back([copy = *request, ms]() {
                std::this_thread::sleep_for(std::chrono::milliseconds(ms));
                reply(copy);
            });
            continue;
        }

        if (request->method == "peer/notify") {
            write_line(mcpwire::encode_message(
                mcpwire::Notification{"peer/event", mcpwire::Json{{"source", "echo_peer"}}}));
        } else if (request->method == "peer/stderr") {
            std::string text;
            if (request->params.has_value() && request->params->is_object()) {
                text = request->params->value("text", std::string{});
            }
            std::cerr << text << std::endl;
        } else if (request->method == "peer/garbage") {
            write_line("this is not a message");
        }

        reply(*request);
    }

    for (auto& thread : delayed) {
        thread.join();
    }
    auto closed = transport.close();
    return closed.has_value() ? 0 : 1;
}
