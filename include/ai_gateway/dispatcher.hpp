#pragma once

#include "hooks.hpp"
#include "registry.hpp"
#include "types.hpp"
#include "ai_gateway/batching/batch_coordinator.hpp"
#include "ai_gateway/core/api_export.hpp"
#include "ai_gateway/core/cancellation.hpp"
#include "ai_gateway/core/errors.hpp"
#include "ai_gateway/dialect/adapter.hpp"
#include "ai_gateway/streaming/streaming_proxy.hpp"
#include "ai_gateway/upstream/upstream_client.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace ai_gateway {

struct DispatchOptions {
    BatchOptions batching;
    size_t stream_buffer = 64;   // StreamingProxy 的队列容量
};

/**
 * ClientStream - 交给 HTTP 层的流式响应
 * 从 StreamingProxy 取事件，用客户端方言编码成 SSE 帧
 */
class AI_GATEWAY_API ClientStream {
public:
    // 编码前对每个非 Done 事件调用
    using EventFilter = std::function<void(StreamEvent&)>;

    ClientStream(std::shared_ptr<StreamingProxy> proxy, std::unique_ptr<StreamEncoder> encoder,
                 EventFilter filter = nullptr);

    /**
     * 取下一段待写出的 SSE 文本
     * @return 等待超时返回 nullopt；可能返回空串（该事件在方言下无输出）
     */
    std::optional<std::string> next_frame(std::chrono::milliseconds wait);

    // 已写出 Done，或上游已关闭且无剩余事件
    bool finished() const { return done_ || proxy_->finished(); }

    void cancel() { proxy_->cancel(); }

    StreamingProxy& proxy() { return *proxy_; }

private:
    std::shared_ptr<StreamingProxy> proxy_;
    std::unique_ptr<StreamEncoder> encoder_;
    EventFilter filter_;
    bool done_ = false;
};

/**
 * 分发结果：非流式时 body 有效，流式时 stream 有效
 */
struct DispatchResult {
    int status = 200;
    std::string body;
    std::string content_type = "application/json";
    std::shared_ptr<ClientStream> stream;

    bool is_stream() const { return stream != nullptr; }
};

/**
 * Dispatcher - 请求分发核心
 *
 * decode → resolve → 钩子 → 调用上游（直接 / 批量 / 流式）→ 钩子 → encode。
 * 所有错误在这里统一转为 OpenAI 错误格式与对应 HTTP 状态码。
 */
class AI_GATEWAY_API Dispatcher {
public:
    Dispatcher(std::shared_ptr<ModelRegistry> registry,
               std::shared_ptr<UpstreamClient> upstream,
               DispatchOptions options = DispatchOptions());

    /**
     * 处理原始请求体
     */
    DispatchResult handle(const std::string& body, Dialect dialect, const CancelScope& scope);

    DispatchResult handle(const nlohmann::json& payload, Dialect dialect, const CancelScope& scope);

    /**
     * 注册请求钩子，须在开始处理请求之前完成
     */
    void addHook(std::shared_ptr<RequestHook> hook);

    const HookList& hooks() const { return hooks_; }

    const DispatchOptions& options() const { return options_; }

    static DispatchResult errorResult(const GatewayError& error);

private:
    DispatchResult dispatch(const nlohmann::json& payload, Dialect dialect, const CancelScope& scope);

    CanonicalResponse callOnce(const ModelRoute& route, const CanonicalRequest& request,
                               const CancelScope& scope);
    CanonicalResponse callEmbeddings(const ModelRoute& route, const CanonicalRequest& request,
                                     const CancelScope& scope);
    DispatchResult openStream(const ModelRoute& route, const CanonicalRequest& request,
                              const CancelScope& scope);

    UpstreamCall makeCall(const ModelRoute& route, const CanonicalRequest& request) const;

    DispatchResult failed(Dialect dialect, const GatewayError& error) const;

    std::shared_ptr<ModelRegistry> registry_;
    std::shared_ptr<UpstreamClient> upstream_;
    DispatchOptions options_;
    BatchCoordinator batcher_;
    HookList hooks_;
};

} // namespace ai_gateway
