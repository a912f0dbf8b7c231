#pragma once

#include "ai_gateway/core/api_export.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <stdexcept>
#include <string>

namespace ai_gateway {

/**
 * 网关错误分类
 * 每一类对应固定的 HTTP 状态码与 OpenAI 错误 type/code
 */
enum class ErrorKind {
    BadRequest,           // 400 请求体不符合 dialect schema
    Unauthorized,         // 401 凭证被拒绝
    NotFound,             // 404 模型未注册
    RateLimited,          // 429 并发槽位耗尽
    Cancelled,            // 499 客户端断开或主动取消
    Internal,             // 500 网关内部错误（不向客户端泄露细节）
    UpstreamError,        // 502 上游返回错误或首字节前连接失败
    UpstreamInterrupted,  // 502 上游在流中途断开
    Timeout               // 504 超过请求截止时间
};

AI_GATEWAY_API int http_status(ErrorKind kind);
AI_GATEWAY_API const char* error_type(ErrorKind kind);
AI_GATEWAY_API const char* error_code(ErrorKind kind);
AI_GATEWAY_API const char* error_kind_name(ErrorKind kind);

/**
 * GatewayError - 核心内部统一抛出的异常
 *
 * message 是可以返回给客户端的文本；detail 只写日志
 */
class AI_GATEWAY_API GatewayError : public std::runtime_error {
public:
    GatewayError(ErrorKind kind, const std::string& message,
                 std::string param = "", std::string detail = "");

    ErrorKind kind() const { return kind_; }
    int status() const { return http_status(kind_); }
    const std::string& param() const { return param_; }
    const std::string& detail() const { return detail_; }

    // 客户端可见的消息，Internal 只返回通用文案
    std::string public_message() const;

    static GatewayError bad_request(const std::string& message, const std::string& param = "");
    static GatewayError not_found(const std::string& model);
    static GatewayError upstream(const std::string& message, const std::string& detail = "");
    static GatewayError internal(const std::string& detail);

private:
    ErrorKind kind_;
    std::string param_;
    std::string detail_;
};

/**
 * 批量 embedding 某个分片失败
 * 携带失败分片在原始输入中的区间 [begin, end)
 */
class AI_GATEWAY_API BatchError : public GatewayError {
public:
    BatchError(ErrorKind kind, const std::string& message, size_t begin, size_t end);

    size_t begin() const { return begin_; }
    size_t end() const { return end_; }

private:
    size_t begin_;
    size_t end_;
};

/**
 * 错误响应 Encoder（OpenAI 错误格式）
 * {"error": {"message", "type", "param", "code"}}
 */
class AI_GATEWAY_API ErrorEncoder {
public:
    static nlohmann::json to_json(ErrorKind kind, const std::string& message,
                                  const std::string& param = "");
    static nlohmann::json to_json(const GatewayError& error);

    static std::string encode(ErrorKind kind, const std::string& message,
                              const std::string& param = "");
    static std::string encode(const GatewayError& error);

    static std::string invalid_request(const std::string& message) {
        return encode(ErrorKind::BadRequest, message);
    }

    static std::string unauthorized() {
        return encode(ErrorKind::Unauthorized, "Invalid API key");
    }

    static std::string rate_limit() {
        return encode(ErrorKind::RateLimited, "Rate limit exceeded");
    }

    static std::string server_error() {
        return encode(ErrorKind::Internal, "Internal server error");
    }
};

} // namespace ai_gateway
