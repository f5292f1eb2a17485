#pragma once

#include "mcpwire/transport.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <optional>
#include <ranges>
#include <string>
#include <string_view>

namespace mcpwire {

// ─────────────────────────────────────────────────────────────────────────────
// Case-Insensitive Header Lookup (RFC 7230)
// ─────────────────────────────────────────────────────────────────────────────

inline HeaderMap::const_iterator find_header(const HeaderMap& headers, std::string_view name) {
    return std::ranges::find_if(headers, [&name](const auto& pair) {
        const auto& key = pair.first;
        return key.size() == name.size() &&
               std::ranges::equal(key, name, [](char a, char b) {
                   return std::tolower(static_cast<unsigned char>(a)) ==
                          std::tolower(static_cast<unsigned char>(b));
               });
    });
}

inline std::optional<std::string> get_header(const HeaderMap& headers, std::string_view name) {
    const auto it = find_header(headers, name);
    const bool found = (it != headers.end());
    if (found) {
        return it->second;
    }
    return std::nullopt;
}

enum class HttpMethod {
    Get,
    Post
};

inline std::string_view to_string(HttpMethod method) noexcept {
    switch (method) {
        case HttpMethod::Get:  return "GET";
        case HttpMethod::Post: return "POST";
    }
    return "UNKNOWN";
}

// ─────────────────────────────────────────────────────────────────────────────
// URL Components
// ─────────────────────────────────────────────────────────────────────────────

struct UrlComponents {
    std::string scheme;     // "http" or "https"
    std::string host;
    std::uint16_t port{0};  // explicit, or the scheme default
    std::string path;       // always starts with '/'
    std::string query;      // includes '?', may be empty

    [[nodiscard]] bool is_secure() const {
        return scheme == "https";
    }

    /// scheme://host:port, the base every request path is appended to
    [[nodiscard]] std::string origin() const {
        return scheme + "://" + host + ":" + std::to_string(port);
    }

    /// Path prefix for endpoint paths; "" when the URL path is just "/"
    [[nodiscard]] std::string base_path() const {
        if (path == "/") {
            return "";
        }
        const bool trailing_slash = (path.empty() == false) && (path.back() == '/');
        return trailing_slash ? path.substr(0, path.size() - 1) : path;
    }
};

// Parses with ada (WHATWG URL standard). Only http and https URLs with a
// non-empty host are accepted.
[[nodiscard]] std::optional<UrlComponents> parse_url(std::string_view url);

}  // namespace mcpwire
