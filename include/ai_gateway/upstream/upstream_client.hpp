#pragma once

#include "ai_gateway/core/api_export.hpp"
#include "ai_gateway/core/cancellation.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <functional>
#include <string>

namespace ai_gateway {

/**
 * 一次上游调用
 */
struct UpstreamCall {
    std::string url;        // 完整地址，如 "https://api.openai.com/v1/chat/completions"
    std::string api_key;    // 为空时不发送 Authorization
    nlohmann::json body;
    bool stream = false;
};

struct UpstreamReply {
    int status = 0;
    std::string body;

    bool ok() const { return status >= 200 && status < 300; }
};

/**
 * UpstreamClient - 上游 provider 的 HTTP 调用抽象
 *
 * 每次调用只尝试一次，不重试。
 * 测试中用进程内的假实现替换。
 */
class AI_GATEWAY_API UpstreamClient {
public:
    // 响应头到达时调用；返回 false 不再读取 body
    using StatusHandler = std::function<bool(int status)>;
    // 每段 body 字节到达时调用；返回 false 中止读取并释放连接
    using ChunkHandler = std::function<bool(const char* data, size_t len)>;

    virtual ~UpstreamClient() = default;

    /**
     * 非流式 POST，读取完整响应
     * @throws GatewayError UpstreamError（连接失败）、Cancelled、Timeout
     */
    virtual UpstreamReply post(const UpstreamCall& call, const CancelScope& scope) = 0;

    /**
     * 流式 POST
     *
     * handler 主动中止或 scope 已取消时正常返回。
     * @throws GatewayError UpstreamError 首字节之前连接失败；
     *         UpstreamInterrupted 已收到数据后连接断开
     */
    virtual void stream(const UpstreamCall& call,
                        const StatusHandler& on_status,
                        const ChunkHandler& on_chunk,
                        const CancelScope& scope) = 0;
};

/**
 * HTTP 客户端配置
 */
struct HttpClientOptions {
    std::chrono::seconds connect_timeout{10};
    std::chrono::seconds read_timeout{300};
};

/**
 * 基于 cpp-httplib 的 UpstreamClient
 */
class AI_GATEWAY_API HttpUpstreamClient : public UpstreamClient {
public:
    explicit HttpUpstreamClient(HttpClientOptions options = HttpClientOptions());

    UpstreamReply post(const UpstreamCall& call, const CancelScope& scope) override;

    void stream(const UpstreamCall& call,
                const StatusHandler& on_status,
                const ChunkHandler& on_chunk,
                const CancelScope& scope) override;

    /**
     * 拆分 URL 为 "scheme://host:port" 与路径
     * @throws GatewayError(Internal) URL 缺少 scheme
     */
    static std::pair<std::string, std::string> split_url(const std::string& url);

private:
    HttpClientOptions options_;
};

/**
 * 上游非 2xx 响应的描述文本，如 "upstream returned HTTP 500: overloaded"
 */
AI_GATEWAY_API std::string describe_upstream_failure(int status, const std::string& body);

} // namespace ai_gateway
