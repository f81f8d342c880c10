#include "kagimcp/codec.hpp"
#include "kagimcp/error.hpp"
#include "kagimcp/version.hpp"
#include <nlohmann/json.hpp>
#include <simdjson.h>
#include <stdexcept>
#include <string>

namespace kagimcp {

namespace {

// Convert simdjson value to nlohmann::json recursively. depth is the number
// of enclosing containers; descending past Codec::MAX_NESTING_DEPTH throws.
nlohmann::json simdjson_to_nlohmann(simdjson::ondemand::value val, size_t depth) {
    switch (val.type()) {
        case simdjson::ondemand::json_type::object: {
            if (depth >= Codec::MAX_NESTING_DEPTH) {
                throw McpParseError("Nesting too deep");
            }
            nlohmann::json obj = nlohmann::json::object();
            auto object = val.get_object();
            for (auto field : object) {
                std::string_view key = field.unescaped_key();
                obj[std::string(key)] = simdjson_to_nlohmann(field.value(), depth + 1);
            }
            return obj;
        }
        case simdjson::ondemand::json_type::array: {
            if (depth >= Codec::MAX_NESTING_DEPTH) {
                throw McpParseError("Nesting too deep");
            }
            nlohmann::json arr = nlohmann::json::array();
            for (auto elem : val.get_array()) {
                arr.push_back(simdjson_to_nlohmann(elem.value(), depth + 1));
            }
            return arr;
        }
        case simdjson::ondemand::json_type::string: {
            std::string_view sv = val.get_string();
            return nlohmann::json(std::string(sv));
        }
        case simdjson::ondemand::json_type::number: {
            // Integers keep their exact value, everything else becomes a double
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
            throw McpParseError("Unexpected JSON value type");
    }
}

std::string dump_or_throw(const nlohmann::json& j) {
    try {
        return j.dump();
    } catch (const nlohmann::json::exception& e) {
        throw McpEncodeError(std::string("JSON encode error: ") + e.what());
    }
}

} // anonymous namespace

nlohmann::json Codec::parse_json(std::string_view raw) {
    if (raw.empty()) {
        throw McpParseError("Empty input");
    }

    // simdjson requires padded input. Its own depth limit is only asserted,
    // so conversion stops well short of it.
    simdjson::ondemand::parser parser;
    static_assert(MAX_NESTING_DEPTH < simdjson::DEFAULT_MAX_DEPTH,
                  "conversion limit must stay below the parser limit");
    simdjson::padded_string padded(raw.data(), raw.size());

    simdjson::ondemand::document doc;
    auto error = parser.iterate(padded).get(doc);
    if (error) {
        throw McpParseError(std::string("JSON parse error: ") + simdjson::error_message(error));
    }

    nlohmann::json j;
    try {
        auto root = doc.get_value();
        if (root.error()) {
            throw McpParseError("Message must be a JSON object");
        }
        j = simdjson_to_nlohmann(root.value(), 0);
        if (!doc.at_end()) {
            throw McpParseError("Trailing content after JSON value");
        }
    } catch (const McpParseError&) {
        throw;
    } catch (const std::exception& e) {
        throw McpParseError(std::string("JSON parse error: ") + e.what());
    }

    if (!j.is_object()) {
        throw McpParseError("Message must be a JSON object");
    }
    return j;
}

JsonRpcRequest Codec::request_from_object(const nlohmann::json& j) {
    auto version = j.find("jsonrpc");
    if (version == j.end()) {
        throw McpParseError("Missing 'jsonrpc' field");
    }
    if (!version->is_string() || version->get<std::string>() != JSONRPC_VERSION) {
        throw McpParseError("Invalid jsonrpc version, expected '2.0'");
    }

    auto method = j.find("method");
    if (method == j.end()) {
        throw McpParseError("Missing 'method' field");
    }
    if (!method->is_string()) {
        throw McpParseError("'method' must be a string");
    }

    JsonRpcRequest req;
    from_json(j, req);
    return req;
}

JsonRpcRequest Codec::parse(std::string_view raw) {
    return request_from_object(parse_json(raw));
}

JsonRpcResponse Codec::parse_response(std::string_view raw) {
    nlohmann::json j = parse_json(raw);
    auto version = j.find("jsonrpc");
    if (version == j.end() || !version->is_string()
        || version->get<std::string>() != JSONRPC_VERSION) {
        throw McpParseError("Invalid jsonrpc version, expected '2.0'");
    }
    if (!j.contains("id")) {
        throw McpParseError("Missing 'id' field");
    }
    try {
        return j.get<JsonRpcResponse>();
    } catch (const std::exception& e) {
        throw McpParseError(std::string("Malformed response: ") + e.what());
    }
}

std::string Codec::serialize(const JsonRpcResponse& resp) {
    nlohmann::json j;
    to_json(j, resp);
    return dump_or_throw(j);
}

std::string Codec::serialize(const JsonRpcRequest& req) {
    nlohmann::json j;
    to_json(j, req);
    return dump_or_throw(j);
}

} // namespace kagimcp
