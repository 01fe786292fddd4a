#pragma once

#include "protocol.hpp"

#include <nlohmann/json.hpp>

#include <stdexcept>
#include <string>

namespace sysmon::codec {

/**
 * Raised when bytes cannot be turned into a Request.
 *
 * code() is ParseError for text that is not JSON and InvalidRequest for JSON
 * that does not have the shape of a request. id() holds whatever identifier
 * could still be recovered, so the error can be correlated by the peer.
 */
class DecodeError : public std::runtime_error {
public:
    DecodeError(ErrorCode code, const std::string& message, RequestId id = {})
        : std::runtime_error(message), code_(code), id_(std::move(id)) {}

    ErrorCode code() const { return code_; }
    const RequestId& id() const { return id_; }

private:
    ErrorCode code_;
    RequestId id_;
};

Request decode_request(const std::string& bytes);

std::string encode_response(const Response& response);
nlohmann::json response_to_json(const Response& response);

nlohmann::json id_to_json(const RequestId& id);

const nlohmann::json* find_key(const nlohmann::json& object, const std::string& key);
std::string as_string(const nlohmann::json& value, const std::string& fallback = "");

} // namespace sysmon::codec
