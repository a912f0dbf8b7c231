#include "ai_gateway/core/errors.hpp"
#include "ai_gateway/core/utf8.hpp"

#include <utility>

namespace ai_gateway {

// ============ 错误分类映射 ============

int http_status(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::BadRequest:          return 400;
        case ErrorKind::Unauthorized:        return 401;
        case ErrorKind::NotFound:            return 404;
        case ErrorKind::RateLimited:         return 429;
        case ErrorKind::Cancelled:           return 499;
        case ErrorKind::Internal:            return 500;
        case ErrorKind::UpstreamError:       return 502;
        case ErrorKind::UpstreamInterrupted: return 502;
        case ErrorKind::Timeout:             return 504;
    }
    return 500;
}

const char* error_type(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::BadRequest:
        case ErrorKind::NotFound:
            return "invalid_request_error";
        case ErrorKind::Unauthorized:        return "authentication_error";
        case ErrorKind::RateLimited:         return "rate_limit_error";
        case ErrorKind::Cancelled:           return "request_cancelled";
        case ErrorKind::Internal:            return "server_error";
        case ErrorKind::UpstreamError:
        case ErrorKind::UpstreamInterrupted:
            return "api_error";
        case ErrorKind::Timeout:             return "timeout_error";
    }
    return "server_error";
}

const char* error_code(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::BadRequest:          return "invalid_request";
        case ErrorKind::Unauthorized:        return "invalid_api_key";
        case ErrorKind::NotFound:            return "model_not_found";
        case ErrorKind::RateLimited:         return "rate_limit_exceeded";
        case ErrorKind::Cancelled:           return "cancelled";
        case ErrorKind::Internal:            return "internal_error";
        case ErrorKind::UpstreamError:       return "upstream_error";
        case ErrorKind::UpstreamInterrupted: return "upstream_interrupted";
        case ErrorKind::Timeout:             return "timeout";
    }
    return "internal_error";
}

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::BadRequest:          return "BadRequest";
        case ErrorKind::Unauthorized:        return "Unauthorized";
        case ErrorKind::NotFound:            return "NotFound";
        case ErrorKind::RateLimited:         return "RateLimited";
        case ErrorKind::Cancelled:           return "Cancelled";
        case ErrorKind::Internal:            return "InternalError";
        case ErrorKind::UpstreamError:       return "UpstreamError";
        case ErrorKind::UpstreamInterrupted: return "UpstreamInterrupted";
        case ErrorKind::Timeout:             return "Timeout";
    }
    return "InternalError";
}

// ============ GatewayError ============

GatewayError::GatewayError(ErrorKind kind, const std::string& message,
                           std::string param, std::string detail)
    : std::runtime_error(message)
    , kind_(kind)
    , param_(std::move(param))
    , detail_(std::move(detail))
{}

std::string GatewayError::public_message() const {
    if (kind_ == ErrorKind::Internal) {
        return "Internal server error";
    }
    return what();
}

GatewayError GatewayError::bad_request(const std::string& message, const std::string& param) {
    return GatewayError(ErrorKind::BadRequest, message, param);
}

GatewayError GatewayError::not_found(const std::string& model) {
    return GatewayError(ErrorKind::NotFound, "model not found: " + model, "model");
}

GatewayError GatewayError::upstream(const std::string& message, const std::string& detail) {
    return GatewayError(ErrorKind::UpstreamError, message, "", detail);
}

GatewayError GatewayError::internal(const std::string& detail) {
    return GatewayError(ErrorKind::Internal, "Internal server error", "", detail);
}

BatchError::BatchError(ErrorKind kind, const std::string& message, size_t begin, size_t end)
    : GatewayError(kind,
                   message + " (inputs [" + std::to_string(begin) + ", " + std::to_string(end) + "))",
                   "input")
    , begin_(begin)
    , end_(end)
{}

// ============ ErrorEncoder ============

nlohmann::json ErrorEncoder::to_json(ErrorKind kind, const std::string& message,
                                     const std::string& param) {
    nlohmann::json j;
    j["error"]["message"] = message;
    j["error"]["type"] = error_type(kind);
    j["error"]["param"] = param.empty() ? nlohmann::json(nullptr) : nlohmann::json(param);
    j["error"]["code"] = error_code(kind);
    return j;
}

nlohmann::json ErrorEncoder::to_json(const GatewayError& error) {
    return to_json(error.kind(), error.public_message(), error.param());
}

std::string ErrorEncoder::encode(ErrorKind kind, const std::string& message,
                                 const std::string& param) {
    return dump_json(to_json(kind, message, param));
}

std::string ErrorEncoder::encode(const GatewayError& error) {
    return dump_json(to_json(error));
}

} // namespace ai_gateway
