#pragma once

#include <nlohmann/json.hpp>

#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace mcpwire {

using Json = nlohmann::json;

inline constexpr std::string_view kJsonRpcVersion{"2.0"};

// ─────────────────────────────────────────────────────────────────────────────
// Request ID
// ─────────────────────────────────────────────────────────────────────────────
// Integer or string. Ids we allocate are always integers; peers may echo
// either form and matching is exact (1 and "1" are different ids).

struct RequestId {
    std::variant<std::int64_t, std::string> value;

    static RequestId integer(std::int64_t v) { return RequestId{v}; }
    static RequestId string(std::string v) { return RequestId{std::move(v)}; }

    [[nodiscard]] bool is_integer() const noexcept {
        return std::holds_alternative<std::int64_t>(value);
    }

    [[nodiscard]] Json to_json() const;

    auto operator<=>(const RequestId&) const = default;
    bool operator==(const RequestId&) const = default;
};

[[nodiscard]] std::string to_string(const RequestId& id);

// ─────────────────────────────────────────────────────────────────────────────
// Message Variants
// ─────────────────────────────────────────────────────────────────────────────

struct Request {
    RequestId id;
    std::string method;
    std::optional<Json> params;

    bool operator==(const Request&) const = default;
};

struct Response {
    RequestId id;
    Json result;

    bool operator==(const Response&) const = default;
};

struct Notification {
    std::string method;
    std::optional<Json> params;

    bool operator==(const Notification&) const = default;
};

// Error payload carried by an error response: {code, message, data?}
struct ErrorObject {
    std::int64_t code{0};
    std::string message;
    std::optional<Json> data;

    // Standard JSON-RPC codes
    static constexpr std::int64_t kParseError     = -32700;
    static constexpr std::int64_t kInvalidRequest = -32600;
    static constexpr std::int64_t kMethodNotFound = -32601;
    static constexpr std::int64_t kInvalidParams  = -32602;
    static constexpr std::int64_t kInternalError  = -32603;

    bool operator==(const ErrorObject&) const = default;
};

// A response whose outcome is an error. `id` is empty when the peer could not
// tell which request failed (it sent "id": null).
struct ErrorResponse {
    std::optional<RequestId> id;
    ErrorObject error;

    bool operator==(const ErrorResponse&) const = default;
};

using Message = std::variant<Request, Response, Notification, ErrorResponse>;

// Correlation id of a message, if it has one (Notifications never do).
[[nodiscard]] std::optional<RequestId> message_id(const Message& message);

// "request", "response", "notification" or "error"
[[nodiscard]] std::string_view message_kind(const Message& message) noexcept;

}  // namespace mcpwire
