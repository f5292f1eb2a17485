// Example: Capability Routing
//
// Reads a transport config (JSON), routes tool calls and everything else to
// the transports it names, and makes one call per capability.
//
//   mcpwire_routing_example config.json [--log-level debug]
//   mcpwire_routing_example --command "npx -y @modelcontextprotocol/server-everything"

#include <mcpwire/config/transport_config.hpp>
#include <mcpwire/dispatch/message_dispatcher.hpp>
#include <mcpwire/log/spdlog_logger.hpp>
#include <mcpwire/protocol/codec.hpp>
#include <mcpwire/routing/transport_router.hpp>

#include <nlohmann/json.hpp>

#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

using namespace mcpwire;

namespace {

std::vector<std::string> split_words(const std::string& text) {
    std::istringstream in(text);
    std::vector<std::string> words;
    std::string word;
    while (in >> word) {
        words.push_back(word);
    }
    return words;
}

// Everything on one pipe transport.
TransportConfig pipe_only_config(const std::string& command_line) {
    auto words = split_words(command_line);
    PipeTransportConfig pipe;
    if (words.empty() == false) {
        pipe.command = words.front();
        pipe.args.assign(words.begin() + 1, words.end());
    }
    pipe.stderr_handling = StderrHandling::Passthrough;

    TransportConfig config;
    config.with_pipe(pipe).with_default(TransportKind::Pipe);
    return config;
}

void print_result(const std::string& label, const CallResult<Json>& result) {
    std::cout << "=== " << label << " ===\n";
    if (result.has_value()) {
        std::cout << result->dump(2) << "\n\n";
        return;
    }
    std::cerr << "  failed (" << to_string(result.error().code) << "): " << result.error().message << "\n\n";
}

}  // namespace

int main(int argc, char* argv[]) {
    std::string config_path;
    std::string command_line = "npx -y @modelcontextprotocol/server-everything";
    LogLevel log_level = LogLevel::Info;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--command" && i + 1 < argc) {
            command_line = argv[++i];
        } else if (arg == "--log-level" && i + 1 < argc) {
            const auto parsed = parse_log_level(argv[++i]);
            if (parsed.has_value() == false) {
                std::cerr << "unknown log level: " << argv[i] << "\n";
                return 2;
            }
            log_level = *parsed;
        } else {
            config_path = arg;
        }
    }

    set_logger(make_spdlog_console_logger(log_level));

    // 1. Load the config
    TransportConfig config;
    if (config_path.empty()) {
        config = pipe_only_config(command_line);
    } else {
        std::ifstream file(config_path);
        if (file.is_open() == false) {
            std::cerr << "cannot open " << config_path << "\n";
            return 2;
        }
        const Json document = Json::parse(file, nullptr, false);
        if (document.is_discarded()) {
            std::cerr << config_path << " is not valid JSON\n";
            return 2;
        }
        auto loaded = TransportConfig::from_json(document);
        if (loaded.has_value() == false) {
            std::cerr << "config error: " << loaded.error().describe() << "\n";
            return 2;
        }
        config = std::move(*loaded);
    }

    // 2. Build the router; a bad config stops here
    std::unique_ptr<TransportRouter> router;
    try {
        router = std::make_unique<TransportRouter>(std::move(config));
    } catch (const ConfigException& e) {
        std::cerr << e.what() << "\n";
        return 2;
    }

    router->on_connection_failed([](TransportKind kind, const std::string& reason) {
        std::cerr << "[" << to_string(kind) << "] connection failed: " << reason << "\n";
    });

    // 3. Dispatcher; unsolicited traffic is printed as it arrives
    MessageDispatcher dispatcher(*router);
    dispatcher.set_inbound_sink([](const Message& message, TransportKind source) {
        std::cout << "<- [" << to_string(source) << "] " << encode_message(message) << "\n";
    });

    router->start();
    for (auto* connection : router->connections()) {
        const bool active = connection->wait_for_state(ConnectionState::Active, std::chrono::seconds(30));
        if (active == false) {
            std::cerr << to_string(connection->transport_kind()) << " did not come up: "
                      << connection->last_error() << "\n";
            router->shutdown();
            return 1;
        }
    }

    // 4. One call per capability
    const Json client_info = {{"name", "mcpwire-routing-example"}, {"version", "0.1.0"}};
    print_result("initialize", dispatcher.call(CapabilityKind::Default, "initialize",
        Json{{"protocolVersion", "2025-06-18"}, {"capabilities", Json::object()}, {"clientInfo", client_info}}));

    auto initialized = dispatcher.notify(CapabilityKind::Default, "notifications/initialized");
    if (initialized.has_value() == false) {
        std::cerr << "notify failed: " << initialized.error().message << "\n";
    }

    print_result("tools/list", dispatcher.call(CapabilityKind::Tool, "tools/list"));
    print_result("resources/list", dispatcher.call(CapabilityKind::Resource, "resources/list"));
    print_result("prompts/list", dispatcher.call(CapabilityKind::Prompt, "prompts/list"));

    router->shutdown();
    return 0;
}
