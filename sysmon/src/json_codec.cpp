#include "json_codec.hpp"

#include <limits>

namespace sysmon::codec {

namespace {

RequestId decode_id(const nlohmann::json& root) {
    auto id_obj = find_key(root, "id");
    if (!id_obj || id_obj->is_null()) {
        return {};
    }
    if (id_obj->is_string()) {
        return id_obj->get<std::string>();
    }
    if (id_obj->is_number_integer() && !id_obj->is_number_unsigned()) {
        return id_obj->get<std::int64_t>();
    }
    if (id_obj->is_number_unsigned()) {
        auto value = id_obj->get<std::uint64_t>();
        if (value <= static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            return static_cast<std::int64_t>(value);
        }
    }
    throw DecodeError(ErrorCode::InvalidRequest, "Invalid request: id must be a string or an integer");
}

Request decode_object(const nlohmann::json& root) {
    if (!root.is_object()) {
        throw DecodeError(ErrorCode::InvalidRequest, "Invalid request: expected a JSON object");
    }

    Request req;
    req.id = decode_id(root);

    if (auto version_obj = find_key(root, "jsonrpc")) {
        req.jsonrpc = as_string(*version_obj, kJsonRpcVersion);
    }

    auto method_obj = find_key(root, "method");
    if (!method_obj || !method_obj->is_string()) {
        throw DecodeError(ErrorCode::InvalidRequest, "Invalid request: method must be a string", req.id);
    }
    req.method = method_obj->get<std::string>();

    if (auto params_obj = find_key(root, "params")) {
        if (!params_obj->is_null()) {
            req.params = *params_obj;
        }
    }

    return req;
}

} // namespace

Request decode_request(const std::string& bytes) {
    nlohmann::json root;
    try {
        root = nlohmann::json::parse(bytes);
    } catch (const nlohmann::json::parse_error& exc) {
        throw DecodeError(ErrorCode::ParseError, exc.what());
    }
    return decode_object(root);
}

nlohmann::json id_to_json(const RequestId& id) {
    if (auto text = std::get_if<std::string>(&id)) {
        return *text;
    }
    if (auto number = std::get_if<std::int64_t>(&id)) {
        return *number;
    }
    return nullptr;
}

nlohmann::json response_to_json(const Response& response) {
    nlohmann::json out = nlohmann::json::object();
    out["jsonrpc"] = response.jsonrpc;
    out["id"] = id_to_json(response.id);
    if (response.error) {
        nlohmann::json error = {{"code", response.error->code}, {"message", response.error->message}};
        if (response.error->data) {
            error["data"] = *response.error->data;
        }
        out["error"] = std::move(error);
    } else {
        out["result"] = response.result ? *response.result : nlohmann::json::object();
    }
    return out;
}

std::string encode_response(const Response& response) {
    return response_to_json(response).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

const nlohmann::json* find_key(const nlohmann::json& object, const std::string& key) {
    if (!object.is_object()) {
        return nullptr;
    }
    auto it = object.find(key);
    if (it == object.end()) {
        return nullptr;
    }
    return &*it;
}

std::string as_string(const nlohmann::json& value, const std::string& fallback) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    return fallback;
}

} // namespace sysmon::codec
