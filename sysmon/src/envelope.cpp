#include "envelope.hpp"

namespace sysmon {

Response make_success(const RequestId& id, nlohmann::json result) {
    Response response;
    response.id = id;
    response.result = std::move(result);
    return response;
}

Response make_failure(const RequestId& id, ErrorCode code, const std::string& message,
                      std::optional<nlohmann::json> data) {
    Response response;
    response.id = id;
    response.error = ErrorObject{static_cast<int>(code), message, std::move(data)};
    return response;
}

bool is_error(const Response& response, ErrorCode code) {
    return response.error && response.error->code == static_cast<int>(code);
}

} // namespace sysmon
