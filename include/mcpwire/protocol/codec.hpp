#pragma once

#include "mcpwire/protocol/message.hpp"

#include <tl/expected.hpp>

#include <cstddef>
#include <string>
#include <string_view>

namespace mcpwire {

// ─────────────────────────────────────────────────────────────────────────────
// Decode Errors
// ─────────────────────────────────────────────────────────────────────────────

struct DecodeError {
    enum class Code {
        Malformed,       // empty, not JSON, or contradictory (result + error)
        UnknownVariant,  // valid JSON that is none of the four message shapes
        MissingField,    // required member absent
        InvalidField,    // member present with the wrong type or value
        Oversized        // payload exceeds the configured limit
    };

    Code code{Code::Malformed};
    std::string message;

    static DecodeError malformed(std::string msg) {
        return {Code::Malformed, std::move(msg)};
    }
    static DecodeError unknown_variant(std::string msg) {
        return {Code::UnknownVariant, std::move(msg)};
    }
    static DecodeError missing_field(std::string_view field) {
        return {Code::MissingField, "missing required field \"" + std::string(field) + "\""};
    }
    static DecodeError invalid_field(std::string_view field, std::string_view expected) {
        return {Code::InvalidField,
                "field \"" + std::string(field) + "\" must be " + std::string(expected)};
    }
    static DecodeError oversized(std::size_t size, std::size_t limit) {
        return {Code::Oversized,
                "payload of " + std::to_string(size) + " bytes exceeds limit of " +
                    std::to_string(limit)};
    }
};

[[nodiscard]] std::string_view to_string(DecodeError::Code code) noexcept;

template <typename T>
using DecodeResult = tl::expected<T, DecodeError>;

// ─────────────────────────────────────────────────────────────────────────────
// Codec
// ─────────────────────────────────────────────────────────────────────────────
// The encoded form is identical for every transport: one compact JSON object
// with no raw newlines. Framing is the transport's job.

inline constexpr std::size_t kDefaultMaxMessageSize = 4 * 1024 * 1024;

[[nodiscard]] Json message_to_json(const Message& message);

[[nodiscard]] std::string encode_message(const Message& message);

// Unknown members are ignored. A missing "jsonrpc" member is a MissingField
// error; any value other than "2.0" is InvalidField.
[[nodiscard]] DecodeResult<Message> decode_message(
    std::string_view payload,
    std::size_t max_size = kDefaultMaxMessageSize
);

// Same rules, for a document that has already been parsed.
[[nodiscard]] DecodeResult<Message> message_from_json(const Json& document);

}  // namespace mcpwire
