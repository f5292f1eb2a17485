#include "mcpwire/protocol/message.hpp"

namespace mcpwire {

Json RequestId::to_json() const {
    return std::visit([](const auto& v) { return Json(v); }, value);
}

std::string to_string(const RequestId& id) {
    if (id.is_integer()) {
        return std::to_string(std::get<std::int64_t>(id.value));
    }
    return "\"" + std::get<std::string>(id.value) + "\"";
}

std::optional<RequestId> message_id(const Message& message) {
    if (const auto* request = std::get_if<Request>(&message)) {
        return request->id;
    }
    if (const auto* response = std::get_if<Response>(&message)) {
        return response->id;
    }
    if (const auto* error = std::get_if<ErrorResponse>(&message)) {
        return error->id;
    }
    return std::nullopt;
}

std::string_view message_kind(const Message& message) noexcept {
    switch (message.index()) {
        case 0: return "request";
        case 1: return "response";
        case 2: return "notification";
        case 3: return "error";
        default: return "unknown";
    }
}

}  // namespace mcpwire
