#pragma once

// ─────────────────────────────────────────────────────────────────────────────
// Inbound JSON parsing
// ─────────────────────────────────────────────────────────────────────────────
//
// Every inbound payload, whatever the transport, goes through fast_parse():
// simdjson's DOM parser validates the complete document (trailing garbage,
// bad UTF-8 and truncated input are all rejected up front) and the result is
// converted to nlohmann::json, which the rest of the library works with.
//
// Outbound messages are built and dumped with nlohmann directly.
//
// ─────────────────────────────────────────────────────────────────────────────

#include <nlohmann/json.hpp>
#include <simdjson.h>
#include <tl/expected.hpp>

#include <cstddef>
#include <string>
#include <string_view>

namespace mcpwire {

using Json = nlohmann::json;

struct FastParseError {
    std::string message;
};

using FastParseResult = tl::expected<Json, FastParseError>;

class FastJsonParser {
public:
    static constexpr std::size_t kDefaultMaxDepth = 64;

    FastJsonParser() = default;
    explicit FastJsonParser(std::size_t max_depth) : max_depth_(max_depth) {}

    // Not thread-safe: one parser per thread (see fast_parse()).
    [[nodiscard]] FastParseResult parse(std::string_view text);

    [[nodiscard]] std::size_t max_depth() const noexcept { return max_depth_; }

private:
    [[nodiscard]] FastParseResult convert(const simdjson::dom::element& element, std::size_t depth) const;

    simdjson::dom::parser parser_;
    std::size_t max_depth_{kDefaultMaxDepth};
};

// Parses with a thread_local FastJsonParser.
[[nodiscard]] FastParseResult fast_parse(std::string_view text);

// Name of the SIMD kernel simdjson selected at runtime ("haswell", "arm64", "fallback", ...).
[[nodiscard]] std::string fast_json_implementation();

}  // namespace mcpwire
