#include "coffer/transfer/transfer_api.hpp"
#include <nlohmann/json.hpp>

namespace coffer::transfer {

using core::ErrorCode;
using core::Result;

Result result_from_response(const server::HttpResponse& response) {
    if (response.ok()) {
        return Result();
    }
    
    if (response.status == server::http_status::TOO_MANY_REQUESTS) {
        return Result(ErrorCode::RATE_LIMITED, "Server is rate limiting chunk uploads");
    }
    if (response.status == server::http_status::RANGE_NOT_SATISFIABLE) {
        return Result(ErrorCode::RANGE_NOT_SATISFIABLE, "Requested chunk is past the end of the file");
    }
    
    auto body = nlohmann::json::parse(response.body_text(), nullptr, false);
    if (body.is_object() && body.contains("error") && body.at("error").is_string()) {
        std::string message = body.value("message", "");
        return Result(core::error_code_from_name(body.at("error").get<std::string>()), message);
    }
    
    return Result(ErrorCode::IO_ERROR, "Server responded with status " + std::to_string(response.status));
}

} // namespace coffer::transfer
