#pragma once

#include "dispatcher.hpp"
#include "server.hpp"
#include "types.hpp"
#include "ai_gateway/core/api_export.hpp"

#include <nlohmann/json.hpp>

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace ai_gateway {

/**
 * 上游 provider 配置
 */
struct ProviderConfig {
    std::string name;
    std::string base_url;
    std::string api_key;       // 明文 key，优先于 api_key_env
    std::string api_key_env;   // 从环境变量读取 key
    Dialect dialect = Dialect::ChatCompletions;
};

/**
 * 模型配置，dialect 缺省时沿用 provider 的 dialect
 * 同名的多条模型配置组成一组上游，按 weight 轮询
 */
struct ModelConfig {
    std::string name;
    std::string provider;
    std::optional<Dialect> dialect;
    std::string upstream_model;
    size_t embedding_chunk_size = 0;
    int weight = 1;
};

/**
 * GatewayConfig - 网关配置文件（JSON）
 *
 * @code
 * {
 *   "server": {"host": "0.0.0.0", "port": 8083, "max_concurrency": 32,
 *              "request_timeout_ms": 600000, "wait_timeout_ms": 5000,
 *              "stream_buffer": 64, "api_keys": ["k1"]},
 *   "embeddings": {"chunk_size": 16, "max_concurrency": 4},
 *   "log_level": "info",
 *   "providers": {"openai": {"base_url": "https://api.openai.com/v1",
 *                            "api_key_env": "OPENAI_API_KEY",
 *                            "dialect": "chat_completions"}},
 *   "models": [{"name": "gpt-4o", "provider": "openai"},
 *              {"name": "gpt-4o", "provider": "azure", "weight": 2}]
 * }
 * @endcode
 */
struct AI_GATEWAY_API GatewayConfig {
    ServerOptions server;
    DispatchOptions dispatch;
    std::string log_level = "info";
    std::string log_file;
    std::map<std::string, ProviderConfig> providers;
    std::vector<ModelConfig> models;

    /**
     * @throws GatewayError(BadRequest) 字段缺失、类型错误、未知 dialect/provider、非正数大小
     */
    static GatewayConfig fromJson(const nlohmann::json& j);

    /**
     * 读取并解析配置文件
     * @throws GatewayError(BadRequest) 文件无法读取或不是合法 JSON
     */
    static GatewayConfig loadFile(const std::string& path);

    /**
     * 生成路由表，解析 provider 的 base_url 与凭证
     */
    std::vector<ModelRoute> toRoutes() const;
};

} // namespace ai_gateway
