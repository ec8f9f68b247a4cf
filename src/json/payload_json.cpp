#include "lensbridge/json/payload_json.hpp"

namespace lensbridge {

namespace {

PayloadParseError from_simdjson(simdjson::error_code code) {
    return PayloadParseError(std::string(simdjson::error_message(code)));
}

template <typename Source>
PayloadResult read_number(Source& source) {
    auto int_val = source.get_int64();
    if (int_val.error() == simdjson::SUCCESS) {
        return nlohmann::json(int_val.value());
    }

    auto uint_val = source.get_uint64();
    if (uint_val.error() == simdjson::SUCCESS) {
        return nlohmann::json(uint_val.value());
    }

    auto double_val = source.get_double();
    if (double_val.error() == simdjson::SUCCESS) {
        return nlohmann::json(double_val.value());
    }

    return tl::unexpected(PayloadParseError("Failed to parse number"));
}

}  // namespace

PayloadResult PayloadParser::parse(std::string_view text) {
    simdjson::padded_string padded(text);

    auto doc_result = parser_.iterate(padded);
    if (doc_result.error() != simdjson::SUCCESS) {
        return tl::unexpected(from_simdjson(doc_result.error()));
    }

    try {
        auto doc = std::move(doc_result).value();
        auto converted = convert_document(doc);
        if (!converted) {
            return converted;
        }
        if (doc.at_end() == false) {
            return tl::unexpected(PayloadParseError("Trailing content after JSON value"));
        }
        return converted;
    } catch (const simdjson::simdjson_error& e) {
        return tl::unexpected(PayloadParseError(e.what()));
    }
}

// Scalar documents cannot be read through get_value(), so the root is
// dispatched here and only containers recurse into convert().
PayloadResult PayloadParser::convert_document(simdjson::ondemand::document& doc) {
    auto type_result = doc.type();
    if (type_result.error() != simdjson::SUCCESS) {
        return tl::unexpected(from_simdjson(type_result.error()));
    }

    switch (type_result.value()) {
        case simdjson::ondemand::json_type::object: {
            auto obj = doc.get_object();
            if (obj.error() != simdjson::SUCCESS) {
                return tl::unexpected(from_simdjson(obj.error()));
            }
            return convert_object(obj.value(), 1);
        }

        case simdjson::ondemand::json_type::array: {
            auto arr = doc.get_array();
            if (arr.error() != simdjson::SUCCESS) {
                return tl::unexpected(from_simdjson(arr.error()));
            }
            return convert_array(arr.value(), 1);
        }

        case simdjson::ondemand::json_type::string: {
            auto str = doc.get_string();
            if (str.error() != simdjson::SUCCESS) {
                return tl::unexpected(from_simdjson(str.error()));
            }
            return nlohmann::json(std::string(str.value()));
        }

        case simdjson::ondemand::json_type::number:
            return read_number(doc);

        case simdjson::ondemand::json_type::boolean: {
            auto bool_val = doc.get_bool();
            if (bool_val.error() != simdjson::SUCCESS) {
                return tl::unexpected(from_simdjson(bool_val.error()));
            }
            return nlohmann::json(bool_val.value());
        }

        case simdjson::ondemand::json_type::null: {
            auto is_null = doc.is_null();
            if (is_null.error() != simdjson::SUCCESS || is_null.value() == false) {
                return tl::unexpected(PayloadParseError("Invalid null literal"));
            }
            return nlohmann::json(nullptr);
        }

        default:
            break;
    }

    return tl::unexpected(PayloadParseError("Unknown JSON type"));
}

PayloadResult PayloadParser::convert(simdjson::ondemand::value value, std::size_t depth) {
    if (depth > config_.max_depth) {
        return tl::unexpected(PayloadParseError(
            "Maximum nesting depth exceeded (" + std::to_string(config_.max_depth) + ")"
        ));
    }

    auto type_result = value.type();
    if (type_result.error() != simdjson::SUCCESS) {
        return tl::unexpected(from_simdjson(type_result.error()));
    }

    switch (type_result.value()) {
        case simdjson::ondemand::json_type::object: {
            auto obj = value.get_object();
            if (obj.error() != simdjson::SUCCESS) {
                return tl::unexpected(from_simdjson(obj.error()));
            }
            return convert_object(obj.value(), depth + 1);
        }

        case simdjson::ondemand::json_type::array: {
            auto arr = value.get_array();
            if (arr.error() != simdjson::SUCCESS) {
                return tl::unexpected(from_simdjson(arr.error()));
            }
            return convert_array(arr.value(), depth + 1);
        }

        case simdjson::ondemand::json_type::string: {
            auto str = value.get_string();
            if (str.error() != simdjson::SUCCESS) {
                return tl::unexpected(from_simdjson(str.error()));
            }
            return nlohmann::json(std::string(str.value()));
        }

        case simdjson::ondemand::json_type::number:
            return read_number(value);

        case simdjson::ondemand::json_type::boolean: {
            auto bool_val = value.get_bool();
            if (bool_val.error() != simdjson::SUCCESS) {
                return tl::unexpected(from_simdjson(bool_val.error()));
            }
            return nlohmann::json(bool_val.value());
        }

        case simdjson::ondemand::json_type::null:
            return nlohmann::json(nullptr);

        default:
            break;
    }

    return tl::unexpected(PayloadParseError("Unknown JSON type"));
}

PayloadResult PayloadParser::convert_object(simdjson::ondemand::object obj, std::size_t depth) {
    if (depth > config_.max_depth) {
        return tl::unexpected(PayloadParseError(
            "Maximum nesting depth exceeded (" + std::to_string(config_.max_depth) + ")"
        ));
    }

    nlohmann::json result = nlohmann::json::object();

    for (auto field : obj) {
        auto key_result = field.unescaped_key();
        if (key_result.error() != simdjson::SUCCESS) {
            return tl::unexpected(from_simdjson(key_result.error()));
        }
        std::string key(key_result.value());

        auto val_result = field.value();
        if (val_result.error() != simdjson::SUCCESS) {
            return tl::unexpected(from_simdjson(val_result.error()));
        }

        auto converted = convert(val_result.value(), depth);
        if (!converted) {
            return converted;
        }
        result[std::move(key)] = std::move(*converted);
    }

    return result;
}

PayloadResult PayloadParser::convert_array(simdjson::ondemand::array arr, std::size_t depth) {
    if (depth > config_.max_depth) {
        return tl::unexpected(PayloadParseError(
            "Maximum nesting depth exceeded (" + std::to_string(config_.max_depth) + ")"
        ));
    }

    nlohmann::json result = nlohmann::json::array();

    for (auto element : arr) {
        if (element.error() != simdjson::SUCCESS) {
            return tl::unexpected(from_simdjson(element.error()));
        }

        auto converted = convert(element.value(), depth);
        if (!converted) {
            return converted;
        }
        result.push_back(std::move(*converted));
    }

    return result;
}

PayloadResult parse_payload(std::string_view text) {
    thread_local PayloadParser parser;
    return parser.parse(text);
}

PayloadResult parse_payload_object(std::string_view text) {
    auto parsed = parse_payload(text);
    if (!parsed) {
        return parsed;
    }
    if (parsed->is_object() == false) {
        return tl::unexpected(PayloadParseError("Expected a JSON object"));
    }
    return parsed;
}

}  // namespace lensbridge
