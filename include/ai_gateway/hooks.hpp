#pragma once

#include "types.hpp"
#include "ai_gateway/core/api_export.hpp"
#include "ai_gateway/core/errors.hpp"
#include "ai_gateway/core/stream_event.hpp"

#include <memory>
#include <string>
#include <vector>

namespace ai_gateway {

/**
 * RequestHook - 请求生命周期回调
 *
 * 1. before_request: 路由解析之后、调用上游之前，可改写请求；抛 GatewayError 则拒绝请求
 * 2. after_response: 上游返回之后、编码之前，可改写响应
 * 3. on_stream_event: 流式响应每个事件写出之前，可改写事件（Done 不经过这里）
 * 4. on_error: 请求以错误结束时通知，只用于观察
 *
 * 默认实现什么都不做，按需覆盖。钩子按注册顺序调用，
 * 可能被多个请求线程同时调用。
 */
class AI_GATEWAY_API RequestHook {
public:
    virtual ~RequestHook() = default;

    virtual std::string name() const = 0;

    virtual void before_request(CanonicalRequest& request, const ModelRoute& route) {
        (void)request;
        (void)route;
    }

    virtual void after_response(const CanonicalRequest& request, CanonicalResponse& response) {
        (void)request;
        (void)response;
    }

    virtual void on_stream_event(const CanonicalRequest& request, StreamEvent& event) {
        (void)request;
        (void)event;
    }

    virtual void on_error(Dialect dialect, const GatewayError& error) {
        (void)dialect;
        (void)error;
    }
};

using HookList = std::vector<std::shared_ptr<RequestHook>>;

} // namespace ai_gateway
