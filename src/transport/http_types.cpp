#include "mcpwire/transport/http_types.hpp"

#include <ada.h>

#include <charconv>

namespace mcpwire {

std::optional<UrlComponents> parse_url(std::string_view url) {
    auto parsed = ada::parse<ada::url>(url);
    const bool parse_failed = (parsed.has_value() == false);
    if (parse_failed) {
        return std::nullopt;
    }
    const auto& ada_url = parsed.value();

    // ada reports the protocol with its trailing colon ("https:")
    std::string scheme(ada_url.get_protocol());
    if ((scheme.empty() == false) && (scheme.back() == ':')) {
        scheme.pop_back();
    }
    const bool is_http = (scheme == "http");
    const bool is_https = (scheme == "https");
    if ((is_http || is_https) == false) {
        return std::nullopt;
    }

    std::string host(ada_url.get_hostname());
    if (host.empty()) {
        return std::nullopt;
    }

    std::uint16_t port = is_https ? 443 : 80;
    const std::string port_text(ada_url.get_port());
    if (port_text.empty() == false) {
        const auto* end = port_text.data() + port_text.size();
        const auto [ptr, ec] = std::from_chars(port_text.data(), end, port);
        if ((ec != std::errc{}) || (ptr != end)) {
            return std::nullopt;
        }
    }

    UrlComponents result;
    result.scheme = std::move(scheme);
    result.host = std::move(host);
    result.port = port;
    result.path = std::string(ada_url.get_pathname());
    if (result.path.empty()) {
        result.path = "/";
    }
    result.query = std::string(ada_url.get_search());
    return result;
}

}  // namespace mcpwire
