#pragma once

#include "ai_gateway/core/api_export.hpp"
#include "ai_gateway/core/stream_event.hpp"
#include "ai_gateway/types.hpp"
#include "ai_gateway/upstream/sse_parser.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <initializer_list>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace ai_gateway {

/**
 * StreamEncoder - 客户端方向
 * 把 StreamEvent 编码成客户端方言的 SSE 帧
 */
class AI_GATEWAY_API StreamEncoder {
public:
    virtual ~StreamEncoder() = default;

    // 编码单个事件；返回空串表示该事件在此方言下不产生输出
    virtual std::string encode(const StreamEvent& event) = 0;
};

/**
 * StreamDecoder - 上游方向
 * 把上游的一个 SSE 事件解码成零个或多个 StreamEvent
 */
class AI_GATEWAY_API StreamDecoder {
public:
    virtual ~StreamDecoder() = default;

    virtual std::vector<StreamEvent> decode(const SseEvent& event) = 0;

    // 上游是否已经发出完成信号（[DONE] / finish_reason / response.completed）
    bool completed() const { return completed_; }

protected:
    bool started_ = false;
    bool completed_ = false;
};

/**
 * DialectAdapter - 一个 API 方言的双向翻译
 *
 * 客户端方向：decode 请求、encode 响应、流式事件编码
 * 上游方向：encode 请求、decode 响应、流式事件解码
 */
class AI_GATEWAY_API DialectAdapter {
public:
    virtual ~DialectAdapter() = default;

    virtual Dialect dialect() const = 0;

    virtual bool supports_streaming() const { return true; }

    // ============ 客户端方向 ============

    /**
     * 解析客户端请求体
     * @throws GatewayError(BadRequest) 不符合方言 schema
     */
    virtual CanonicalRequest decode(const nlohmann::json& payload) const = 0;

    /**
     * 编码非流式响应（request 提供模型名、编码格式等上下文）
     */
    virtual nlohmann::json encode(const CanonicalRequest& request,
                                  const CanonicalResponse& response) const = 0;

    /**
     * 为一次流式调用创建事件编码器
     * @throws GatewayError(BadRequest) 方言不支持流式
     */
    virtual std::unique_ptr<StreamEncoder> stream_encoder(const CanonicalRequest& request) const = 0;

    // ============ 上游方向 ============

    // 相对于 provider base url 的路径，如 "/chat/completions"
    virtual std::string upstream_path() const = 0;

    virtual nlohmann::json encode_request(const CanonicalRequest& request,
                                          const std::string& upstream_model) const = 0;

    /**
     * 解析上游非流式响应
     * @throws GatewayError(UpstreamError) 上游负载格式错误
     */
    virtual CanonicalResponse decode_response(const nlohmann::json& payload) const = 0;

    virtual std::unique_ptr<StreamDecoder> stream_decoder() const = 0;
};

/**
 * 获取方言对应的 adapter（进程内单例）
 */
AI_GATEWAY_API const DialectAdapter& adapter_for(Dialect dialect);

/**
 * 客户端方言能否路由到该上游方言
 * chat / responses 可以互通，embeddings 只能到 embeddings
 */
AI_GATEWAY_API bool dialects_compatible(Dialect client, Dialect upstream);

// ============ 方言实现共用的工具函数 ============

namespace detail {

AI_GATEWAY_API std::string generate_id(const std::string& prefix, const std::string& separator = "-");
AI_GATEWAY_API int64_t now_seconds();

AI_GATEWAY_API std::string sse_data(const nlohmann::json& data);
AI_GATEWAY_API std::string sse_event(const std::string& event, const nlohmann::json& data);

AI_GATEWAY_API void require_object(const nlohmann::json& payload);
AI_GATEWAY_API std::string require_model(const nlohmann::json& payload);
AI_GATEWAY_API std::optional<double> read_temperature(const nlohmann::json& payload);
AI_GATEWAY_API bool read_stream(const nlohmann::json& payload);

/**
 * 文本内容：字符串、null 或文本 part 数组
 * @param where 出错时用于定位字段，如 "messages[2].content"
 */
AI_GATEWAY_API std::string content_text(const nlohmann::json& content, const std::string& where);

// 同时识别 prompt/completion 与 input/output 两套命名
AI_GATEWAY_API std::optional<Usage> read_usage(const nlohmann::json& usage);

AI_GATEWAY_API nlohmann::json chat_usage_json(const Usage& usage);
AI_GATEWAY_API nlohmann::json responses_usage_json(const Usage& usage);

/**
 * 拷贝客户端的附加参数
 * @param keys 允许透传的字段
 */
AI_GATEWAY_API void copy_options(const nlohmann::json& extras, nlohmann::json& body,
                                 std::initializer_list<const char*> keys);

AI_GATEWAY_API std::string upstream_error_message(const nlohmann::json& payload);

} // namespace detail

} // namespace ai_gateway
