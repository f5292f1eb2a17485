#include "mcpwire/json/fast_json.hpp"

namespace mcpwire {

namespace {

FastParseError simdjson_failure(simdjson::error_code code) {
    return FastParseError{std::string(simdjson::error_message(code))};
}

}  // namespace

FastParseResult FastJsonParser::parse(std::string_view text) {
    // parse(const char*, size_t) copies into an internally padded buffer.
    simdjson::dom::element root;
    const auto code = parser_.parse(text.data(), text.size()).get(root);
    if (code != simdjson::SUCCESS) {
        return tl::unexpected(simdjson_failure(code));
    }
    return convert(root, 0);
}

FastParseResult FastJsonParser::convert(const simdjson::dom::element& element, std::size_t depth) const {
    if (depth > max_depth_) {
        return tl::unexpected(FastParseError{
            "maximum nesting depth exceeded (" + std::to_string(max_depth_) + ")"
        });
    }

    switch (element.type()) {
        case simdjson::dom::element_type::OBJECT: {
            simdjson::dom::object object;
            const auto code = element.get_object().get(object);
            if (code != simdjson::SUCCESS) {
                return tl::unexpected(simdjson_failure(code));
            }
            Json out = Json::object();
            for (const auto& field : object) {
                auto child = convert(field.value, depth + 1);
                if (child.has_value() == false) {
                    return child;
                }
                out[std::string(field.key)] = std::move(*child);
            }
            return out;
        }

        case simdjson::dom::element_type::ARRAY: {
            simdjson::dom::array array;
            const auto code = element.get_array().get(array);
            if (code != simdjson::SUCCESS) {
                return tl::unexpected(simdjson_failure(code));
            }
            Json out = Json::array();
            for (const simdjson::dom::element child_element : array) {
                auto child = convert(child_element, depth + 1);
                if (child.has_value() == false) {
                    return child;
                }
                out.push_back(std::move(*child));
            }
            return out;
        }

        case simdjson::dom::element_type::STRING: {
            std::string_view value;
            const auto code = element.get_string().get(value);
            if (code != simdjson::SUCCESS) {
                return tl::unexpected(simdjson_failure(code));
            }
            return Json(std::string(value));
        }

        case simdjson::dom::element_type::INT64: {
            std::int64_t value = 0;
            const auto code = element.get_int64().get(value);
            if (code != simdjson::SUCCESS) {
                return tl::unexpected(simdjson_failure(code));
            }
            return Json(value);
        }

        case simdjson::dom::element_type::UINT64: {
            std::uint64_t value = 0;
            const auto code = element.get_uint64().get(value);
            if (code != simdjson::SUCCESS) {
                return tl::unexpected(simdjson_failure(code));
            }
            return Json(value);
        }

        case simdjson::dom::element_type::DOUBLE: {
            double value = 0.0;
            const auto code = element.get_double().get(value);
            if (code != simdjson::SUCCESS) {
                return tl::unexpected(simdjson_failure(code));
            }
            return Json(value);
        }

        case simdjson::dom::element_type::BOOL: {
            bool value = false;
            const auto code = element.get_bool().get(value);
            if (code != simdjson::SUCCESS) {
                return tl::unexpected(simdjson_failure(code));
            }
            return Json(value);
        }

        case simdjson::dom::element_type::NULL_VALUE:
            return Json(nullptr);
    }

    return tl::unexpected(FastParseError{"unknown JSON element type"});
}

FastParseResult fast_parse(std::string_view text) {
    thread_local FastJsonParser parser;
    return parser.parse(text);
}

std::string fast_json_implementation() {
    return std::string(simdjson::get_active_implementation()->name());
}

}  // namespace mcpwire
