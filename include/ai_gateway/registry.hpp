#pragma once

#include "types.hpp"
#include "ai_gateway/core/api_export.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace ai_gateway {

/**
 * ModelRegistry - 模型名到上游路由的映射
 *
 * 路由表是不可变快照（shared_ptr<const RouteTable>），
 * 读取时原子加载，修改时复制后原子替换。
 * 并发查询之间互不阻塞，重载期间的查询看到旧表或新表之一。
 *
 * 同一个模型名可以挂多个上游（RouteGroup），resolve() 按权重轮询选择。
 */
class AI_GATEWAY_API ModelRegistry {
public:
    /**
     * 同名模型的一组上游
     * cursor 在快照之间共享，追加上游不会重置轮询位置
     */
    struct RouteGroup {
        std::vector<ModelRoute> backends;
        int total_weight = 0;
        std::shared_ptr<std::atomic<uint64_t>> cursor = std::make_shared<std::atomic<uint64_t>>(0);

        // 加权轮询，权重 3:1 时依次为 a a a b
        const ModelRoute& pick() const;
    };

    using RouteTable = std::unordered_map<std::string, RouteGroup>;

    ModelRegistry();
    explicit ModelRegistry(const std::vector<ModelRoute>& routes);

    ModelRegistry(const ModelRegistry&) = delete;
    ModelRegistry& operator=(const ModelRegistry&) = delete;

    // ============ 查询 ============

    /**
     * 按模型名精确查找，多个上游时按权重轮询
     * @throws GatewayError(NotFound) 模型未注册
     */
    ModelRoute resolve(const std::string& model_name) const;

    // 第一个上游，不推进轮询
    std::optional<ModelRoute> find(const std::string& model_name) const;

    // 模型的全部上游，未注册时为空
    std::vector<ModelRoute> backends(const std::string& model_name) const;

    bool contains(const std::string& model_name) const;

    // 获取所有模型（按名称排序，用于 /v1/models 接口）
    std::vector<std::string> listModels() const;

    // 每个模型一条（第一个上游）
    std::vector<ModelRoute> listRoutes() const;

    // 模型数，不是上游数
    size_t size() const;

    // ============ 修改 ============

    /**
     * 注册单个路由，同名模型的已有上游全部被替换
     * @throws GatewayError(BadRequest) model_name 或 endpoint_url 为空，weight 非正
     */
    void registerRoute(const ModelRoute& route);

    /**
     * 为模型追加一个上游，模型不存在时等同 registerRoute
     * @throws GatewayError(BadRequest) 与已有上游的方言不同
     */
    void addRoute(const ModelRoute& route);

    bool unregisterRoute(const std::string& model_name);

    /**
     * 整表替换，同名路由归入同一组
     */
    void reload(const std::vector<ModelRoute>& routes);

private:
    std::shared_ptr<const RouteTable> snapshot() const;
    void publish(std::shared_ptr<const RouteTable> table);
    static void validate(const ModelRoute& route);
    static void append(RouteGroup& group, const ModelRoute& route);

    std::shared_ptr<const RouteTable> table_;
    std::mutex write_mutex_;  // 串行化写者
};

} // namespace ai_gateway
