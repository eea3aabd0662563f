#include "taskmcp/codec.hpp"
#include "taskmcp/error.hpp"
#include <nlohmann/json.hpp>
#include <simdjson.h>
#include <string>

namespace taskmcp {

namespace {

// Convert simdjson value to nlohmann::json recursively
nlohmann::json simdjson_to_nlohmann(simdjson::ondemand::value val) {
    switch (val.type()) {
        case simdjson::ondemand::json_type::object: {
            nlohmann::json obj = nlohmann::json::object();
            for (auto field : val.get_object()) {
                std::string_view key = field.unescaped_key();
                obj[std::string(key)] = simdjson_to_nlohmann(field.value());
            }
            return obj;
        }
        case simdjson::ondemand::json_type::array: {
            nlohmann::json arr = nlohmann::json::array();
            for (auto elem : val.get_array()) {
                arr.push_back(simdjson_to_nlohmann(elem.value()));
            }
            return arr;
        }
        case simdjson::ondemand::json_type::string: {
            std::string_view sv = val.get_string();
            return nlohmann::json(std::string(sv));
        }
        case simdjson::ondemand::json_type::number: {
            // Integer first so correlation ids keep their exact value
            auto result_int = val.get_int64();
            if (result_int.error() == simdjson::SUCCESS) {
                return nlohmann::json(result_int.value());
            }
            auto result_uint = val.get_uint64();
            if (result_uint.error() == simdjson::SUCCESS) {
                return nlohmann::json(result_uint.value());
            }
            return nlohmann::json(val.get_double().value());
        }
        case simdjson::ondemand::json_type::boolean:
            return nlohmann::json(val.get_bool().value());
        case simdjson::ondemand::json_type::null:
            return nlohmann::json(nullptr);
        default:
            throw ParseError("Unsupported JSON value");
    }
}

// Top-level scalars are not reachable through get_value().
nlohmann::json scalar_document_to_nlohmann(simdjson::ondemand::document& doc) {
    switch (doc.type()) {
        case simdjson::ondemand::json_type::string:
            return nlohmann::json(std::string(std::string_view(doc.get_string())));
        case simdjson::ondemand::json_type::number: {
            auto result_int = doc.get_int64();
            if (result_int.error() == simdjson::SUCCESS) {
                return nlohmann::json(result_int.value());
            }
            auto result_uint = doc.get_uint64();
            if (result_uint.error() == simdjson::SUCCESS) {
                return nlohmann::json(result_uint.value());
            }
            return nlohmann::json(doc.get_double().value());
        }
        case simdjson::ondemand::json_type::boolean:
            return nlohmann::json(doc.get_bool().value());
        case simdjson::ondemand::json_type::null:
        {
            bool is_null = doc.is_null();
            if (!is_null) throw ParseError("Invalid literal");
            return nlohmann::json(nullptr);
        }
        default:
            throw ParseError("Unsupported JSON document");
    }
}

} // anonymous namespace

nlohmann::json Codec::parse(std::string_view raw) {
    if (raw.empty()) {
        throw ParseError("Empty input");
    }

    // simdjson requires padded input
    simdjson::ondemand::parser parser;
    simdjson::padded_string padded(raw.data(), raw.size());

    simdjson::ondemand::document doc;
    auto error = parser.iterate(padded).get(doc);
    if (error) {
        throw ParseError(std::string("JSON parse error: ") + simdjson::error_message(error));
    }

    nlohmann::json j;
    try {
        bool scalar = false;
        auto scalar_check = doc.is_scalar().get(scalar);
        if (scalar_check) {
            throw ParseError(std::string("JSON parse error: ")
                             + simdjson::error_message(scalar_check));
        }
        if (scalar) {
            j = scalar_document_to_nlohmann(doc);
        } else {
            j = simdjson_to_nlohmann(doc.get_value());
        }
        if (!doc.at_end()) {
            throw ParseError("Trailing content after JSON document");
        }
    } catch (const ParseError&) {
        throw;
    } catch (const std::exception& e) {
        throw ParseError(std::string("JSON conversion error: ") + e.what());
    }
    return j;
}

std::string Codec::serialize(const Response& response) {
    nlohmann::json j = response;
    // dump() escapes control characters, so the output is always one line
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace taskmcp
