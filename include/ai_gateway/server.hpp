#pragma once

/**
 * AI Gateway Server
 *
 * 对外提供 OpenAI 兼容接口，把请求转发给上游 provider。
 *
 * 示例用法：
 * @code
 * #include <ai_gateway/server.hpp>
 *
 * int main() {
 *     auto registry = std::make_shared<ai_gateway::ModelRegistry>();
 *     registry->registerRoute({"gpt-4o", "openai", ai_gateway::Dialect::ChatCompletions,
 *                              "https://api.openai.com/v1"});
 *
 *     auto dispatcher = std::make_shared<ai_gateway::Dispatcher>(
 *         registry, std::make_shared<ai_gateway::HttpUpstreamClient>());
 *
 *     ai_gateway::Server server(registry, dispatcher);
 *     server.run();
 * }
 * @endcode
 */

#include "dispatcher.hpp"
#include "registry.hpp"
#include "ai_gateway/core/api_export.hpp"

#include <httplib.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace ai_gateway {

/**
 * 服务器配置
 */
struct ServerOptions {
    std::string host = "0.0.0.0";
    int port = 8083;
    int max_concurrency = 32;
    std::chrono::milliseconds request_timeout{600000};
    std::chrono::milliseconds wait_timeout{5000};        // 等待并发槽位的最长时间
    std::chrono::milliseconds stream_poll_interval{10};
    std::vector<std::string> api_keys;                   // 为空表示不启用认证
    std::string owner = "ai-gateway";
};

/**
 * 凭证校验回调，参数为 Bearer 后面的不透明凭证
 */
using Authenticator = std::function<bool(const std::string& credential)>;

/**
 * OpenAI API 兼容网关服务器
 */
class AI_GATEWAY_API Server {
public:
    Server(std::shared_ptr<ModelRegistry> registry,
           std::shared_ptr<Dispatcher> dispatcher,
           ServerOptions options = ServerOptions());

    ~Server();

    // 禁止拷贝
    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    // ============ 配置 ============

    void setMaxConcurrency(int max);

    void setTimeout(std::chrono::milliseconds timeout);

    /**
     * 设置允许的 API key（启用默认认证）
     */
    void setApiKeys(const std::vector<std::string>& api_keys);

    /**
     * 替换默认认证逻辑
     */
    void setAuthenticator(Authenticator authenticator);

    const ServerOptions& options() const { return options_; }

    // ============ 运行控制 ============

    /**
     * 启动服务器（阻塞调用）
     */
    void run();

    /**
     * 启动服务器（非阻塞）
     * @return 后台线程
     */
    std::thread runAsync();

    /**
     * 绑定到随机端口（测试用），随后调用 listenAfterBind()
     * @return 端口号，失败返回 -1
     */
    int bindToAnyPort(const std::string& host = "127.0.0.1");

    bool listenAfterBind();

    void waitUntilReady() const;

    /**
     * 停止服务器
     */
    void stop();

    bool isRunning() const;

private:
    void setupRoutes();
    bool authenticate(const httplib::Request& req) const;

    // 端点处理函数
    void handleHealth(const httplib::Request& req, httplib::Response& res);
    void handleModels(const httplib::Request& req, httplib::Response& res);
    void handleDispatch(const httplib::Request& req, httplib::Response& res, Dialect dialect);

    // 并发控制
    bool acquireSlot();
    void releaseSlot();

private:
    ServerOptions options_;
    std::shared_ptr<ModelRegistry> registry_;
    std::shared_ptr<Dispatcher> dispatcher_;
    Authenticator authenticator_;
    httplib::Server http_server_;

    std::atomic<bool> running_{false};
    std::atomic<int> current_concurrency_{0};
    std::mutex slot_mutex_;
    std::condition_variable slot_cv_;
};

} // namespace ai_gateway
