#pragma once

#include "ai_gateway/core/api_export.hpp"
#include "ai_gateway/core/cancellation.hpp"
#include "ai_gateway/core/event_channel.hpp"
#include "ai_gateway/dialect/adapter.hpp"
#include "ai_gateway/upstream/sse_parser.hpp"
#include "ai_gateway/upstream/upstream_client.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

namespace ai_gateway {

/**
 * 流式调用状态
 * Pending → Opened → Emitting(n) → Closed
 */
enum class ProxyState {
    Pending,    // 尚未收到上游 body 首字节
    Opened,     // 已收到首字节
    Emitting,   // 已转发 n 个事件
    Closed      // 已发出 Done 或客户端已离开
};

AI_GATEWAY_API const char* proxy_state_name(ProxyState state);

/**
 * StreamingProxy - 管理一次上游流式调用
 *
 * 读取线程把上游 SSE 解码为 StreamEvent 推入有界 EventChannel，
 * HTTP 写出端通过 next() 取出。每个流恰好一个 Done：
 * - 上游正常结束（[DONE] 或 EOF）：Done
 * - 上游中途断开且未发出完成信号：Interrupted + Done
 * - 超过截止时间：Error(Timeout) + Done
 * - 首字节前失败：不打开，wait_opened() 抛出错误
 */
class AI_GATEWAY_API StreamingProxy {
public:
    StreamingProxy(std::shared_ptr<UpstreamClient> client,
                   UpstreamCall call,
                   std::unique_ptr<StreamDecoder> decoder,
                   CancelScope scope,
                   size_t buffer_capacity = 64);

    ~StreamingProxy();

    StreamingProxy(const StreamingProxy&) = delete;
    StreamingProxy& operator=(const StreamingProxy&) = delete;

    /**
     * 启动读取线程
     */
    void start();

    /**
     * 阻塞直到上游打开或失败
     * @throws GatewayError 首字节前的失败（上游非 2xx、连接失败、取消、超时）
     */
    void wait_opened();

    /**
     * 取出下一个事件
     * @return 无事件时返回 nullopt（等待超时或已结束）
     */
    std::optional<StreamEvent> next(std::chrono::milliseconds wait);

    /**
     * 客户端离开：停止转发，中断上游读取，等待读取线程退出
     */
    void cancel();

    bool finished() const { return channel_.is_ended(); }

    ProxyState state() const;
    size_t emitted() const { return emitted_.load(); }

private:
    void run();
    bool handle_bytes(const char* data, size_t len);
    bool forward(const std::vector<SseEvent>& events);
    bool emit(StreamEvent event);
    void open();
    void fail_before_open(const GatewayError& error);
    void close(std::optional<StreamEvent> terminal, bool send_done);
    void join_reader();

    std::shared_ptr<UpstreamClient> client_;
    UpstreamCall call_;
    std::unique_ptr<StreamDecoder> decoder_;
    CancelScope scope_;
    EventChannel channel_;
    SseParser parser_;

    mutable std::mutex state_mutex_;
    std::condition_variable state_cv_;
    ProxyState state_ = ProxyState::Pending;
    std::optional<GatewayError> open_error_;

    int upstream_status_ = 0;
    std::string error_body_;
    std::atomic<size_t> emitted_{0};
    std::atomic<bool> cancel_requested_{false};
    bool upstream_done_ = false;   // 收到 [DONE]
    bool done_sent_ = false;

    std::mutex join_mutex_;
    std::thread reader_;
};

} // namespace ai_gateway
