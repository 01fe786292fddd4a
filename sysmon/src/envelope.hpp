#pragma once

#include "protocol.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace sysmon {

/// Response carrying `result`; `error` stays empty.
Response make_success(const RequestId& id, nlohmann::json result);

/// Response carrying `error`; `result` stays empty.
Response make_failure(const RequestId& id, ErrorCode code, const std::string& message,
                      std::optional<nlohmann::json> data = std::nullopt);

bool is_error(const Response& response, ErrorCode code);

} // namespace sysmon
