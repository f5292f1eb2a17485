#include "mcpwire/protocol/codec.hpp"

#include "mcpwire/json/fast_json.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <limits>

namespace mcpwire {

namespace {

bool is_blank(std::string_view payload) {
    return std::all_of(payload.begin(), payload.end(), [](unsigned char c) {
        return std::isspace(c) != 0;
    });
}

bool is_structured(const Json& node) {
    const bool is_object = node.is_object();
    const bool is_array = node.is_array();
    return (is_object == true) || (is_array == true);
}

DecodeResult<RequestId> parse_id(const Json& id_node) {
    if (id_node.is_number_unsigned() == true) {
        const auto value = id_node.get<std::uint64_t>();
        if (value > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            return tl::unexpected(DecodeError::invalid_field("id", "an integer within the signed 64-bit range"));
        }
        return RequestId::integer(static_cast<std::int64_t>(value));
    }
    if (id_node.is_number_integer() == true) {
        return RequestId::integer(id_node.get<std::int64_t>());
    }
    if (id_node.is_string() == true) {
        return RequestId::string(id_node.get<std::string>());
    }
    return tl::unexpected(DecodeError::invalid_field("id", "an integer or string"));
}

DecodeResult<std::optional<Json>> parse_params(const Json& document) {
    const bool has_params = document.contains("params");
    if (has_params == false) {
        return std::optional<Json>{};
    }
    const Json& params_node = document.at("params");
    if (is_structured(params_node) == false) {
        return tl::unexpected(DecodeError::invalid_field("params", "an object or array"));
    }
    return std::optional<Json>{params_node};
}

DecodeResult<ErrorObject> parse_error_object(const Json& error_node) {
    if (error_node.is_object() == false) {
        return tl::unexpected(DecodeError::invalid_field("error", "an object"));
    }

    const bool has_code = error_node.contains("code");
    if (has_code == false) {
        return tl::unexpected(DecodeError::missing_field("error.code"));
    }
    if (error_node.at("code").is_number_integer() == false) {
        return tl::unexpected(DecodeError::invalid_field("error.code", "an integer"));
    }

    const bool has_message = error_node.contains("message");
    if (has_message == false) {
        return tl::unexpected(DecodeError::missing_field("error.message"));
    }
    if (error_node.at("message").is_string() == false) {
        return tl::unexpected(DecodeError::invalid_field("error.message", "a string"));
    }

    ErrorObject error;
    error.code = error_node.at("code").get<std::int64_t>();
    error.message = error_node.at("message").get<std::string>();
    if (error_node.contains("data")) {
        error.data = error_node.at("data");
    }
    return error;
}

DecodeResult<Message> parse_call(const Json& document) {
    const Json& method_node = document.at("method");
    if (method_node.is_string() == false) {
        return tl::unexpected(DecodeError::invalid_field("method", "a string"));
    }

    auto params = parse_params(document);
    if (params.has_value() == false) {
        return tl::unexpected(params.error());
    }

    const bool has_id = document.contains("id");
    if (has_id == false) {
        return Notification{method_node.get<std::string>(), std::move(*params)};
    }

    auto id = parse_id(document.at("id"));
    if (id.has_value() == false) {
        return tl::unexpected(id.error());
    }
    return Request{std::move(*id), method_node.get<std::string>(), std::move(*params)};
}

DecodeResult<Message> parse_reply(const Json& document) {
    const bool has_result = document.contains("result");
    const bool has_error = document.contains("error");
    if (has_result && has_error) {
        return tl::unexpected(DecodeError::malformed("response carries both result and error"));
    }

    const bool has_id = document.contains("id");
    if (has_id == false) {
        return tl::unexpected(DecodeError::missing_field("id"));
    }
    const Json& id_node = document.at("id");

    if (has_error) {
        auto error = parse_error_object(document.at("error"));
        if (error.has_value() == false) {
            return tl::unexpected(error.error());
        }
        ErrorResponse response;
        response.error = std::move(*error);
        if (id_node.is_null() == false) {
            auto id = parse_id(id_node);
            if (id.has_value() == false) {
                return tl::unexpected(id.error());
            }
            response.id = std::move(*id);
        }
        return response;
    }

    auto id = parse_id(id_node);
    if (id.has_value() == false) {
        return tl::unexpected(id.error());
    }
    return Response{std::move(*id), document.at("result")};
}

}  // namespace

std::string_view to_string(DecodeError::Code code) noexcept {
    switch (code) {
        case DecodeError::Code::Malformed:      return "malformed";
        case DecodeError::Code::UnknownVariant: return "unknown_variant";
        case DecodeError::Code::MissingField:   return "missing_field";
        case DecodeError::Code::InvalidField:   return "invalid_field";
        case DecodeError::Code::Oversized:      return "oversized";
    }
    return "unknown";
}

// ─────────────────────────────────────────────────────────────────────────────
// Encoding
// ─────────────────────────────────────────────────────────────────────────────

Json message_to_json(const Message& message) {
    Json payload = Json::object();
    payload["jsonrpc"] = std::string(kJsonRpcVersion);

    std::visit([&payload](const auto& m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, Request>) {
            payload["id"] = m.id.to_json();
            payload["method"] = m.method;
            if (m.params.has_value()) {
                payload["params"] = *m.params;
            }
        } else if constexpr (std::is_same_v<T, Response>) {
            payload["id"] = m.id.to_json();
            payload["result"] = m.result;
        } else if constexpr (std::is_same_v<T, Notification>) {
            payload["method"] = m.method;
            if (m.params.has_value()) {
                payload["params"] = *m.params;
            }
        } else {
            payload["id"] = m.id.has_value() ? m.id->to_json() : Json(nullptr);
            Json error = Json::object();
            error["code"] = m.error.code;
            error["message"] = m.error.message;
            if (m.error.data.has_value()) {
                error["data"] = *m.error.data;
            }
            payload["error"] = std::move(error);
        }
    }, message);

    return payload;
}

std::string encode_message(const Message& message) {
    // dump() escapes control characters inside strings, so the result never
    // contains a raw '\n'. Invalid UTF-8 is replaced rather than thrown.
    return message_to_json(message).dump(-1, ' ', false, Json::error_handler_t::replace);
}

// ─────────────────────────────────────────────────────────────────────────────
// Decoding
// ─────────────────────────────────────────────────────────────────────────────

DecodeResult<Message> message_from_json(const Json& document) {
    if (document.is_object() == false) {
        return tl::unexpected(DecodeError::unknown_variant(
            std::string("expected a JSON object, got ") + document.type_name()));
    }

    const bool has_version = document.contains("jsonrpc");
    if (has_version == false) {
        return tl::unexpected(DecodeError::missing_field("jsonrpc"));
    }
    const Json& version_node = document.at("jsonrpc");
    if ((version_node.is_string() == false) || (version_node.get<std::string>() != kJsonRpcVersion)) {
        return tl::unexpected(DecodeError::invalid_field("jsonrpc", "\"2.0\""));
    }

    const bool has_method = document.contains("method");
    if (has_method) {
        return parse_call(document);
    }

    const bool is_reply = document.contains("result") || document.contains("error");
    if (is_reply) {
        return parse_reply(document);
    }

    return tl::unexpected(DecodeError::unknown_variant(
        "object has neither \"method\" nor \"result\"/\"error\""));
}

DecodeResult<Message> decode_message(std::string_view payload, std::size_t max_size) {
    if (payload.size() > max_size) {
        return tl::unexpected(DecodeError::oversized(payload.size(), max_size));
    }
    if (is_blank(payload)) {
        return tl::unexpected(DecodeError::malformed("empty payload"));
    }

    auto document = fast_parse(payload);
    if (document.has_value() == false) {
        return tl::unexpected(DecodeError::malformed("invalid JSON: " + document.error().message));
    }
    return message_from_json(*document);
}

}  // namespace mcpwire
