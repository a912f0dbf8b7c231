#pragma once

#include "ai_gateway/core/api_export.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace ai_gateway {

// ============ Dialect ============

/**
 * API 方言
 * 客户端请求使用的协议，以及上游 provider 使用的协议
 */
enum class Dialect {
    ChatCompletions,
    Responses,
    Embeddings
};

AI_GATEWAY_API const char* dialect_name(Dialect dialect);

/**
 * 解析方言名称（"chat_completions" / "chat" / "responses" / "embeddings"）
 */
AI_GATEWAY_API std::optional<Dialect> parse_dialect(const std::string& name);

// ============ 路由 ============

/**
 * ModelRoute - 模型名到上游 provider 端点的映射
 */
struct ModelRoute {
    std::string model_name;
    std::string provider_id;
    Dialect provider_dialect = Dialect::ChatCompletions;
    std::string endpoint_url;          // 如 "https://api.openai.com/v1"

    std::string upstream_model;        // 发往上游的模型名，空表示与 model_name 相同
    std::string api_key;               // 上游凭证
    size_t embedding_chunk_size = 0;   // 0 表示使用网关默认值
    int weight = 1;                    // 同名模型有多个上游时的轮询权重

    const std::string& target_model() const {
        return upstream_model.empty() ? model_name : upstream_model;
    }
};

// ============ 规范化请求 ============

struct ChatMessage {
    std::string role;
    std::string content;
};

/**
 * CanonicalRequest - 与方言无关的内部请求表示
 * 每次入站调用构造一次，只有 before_request 钩子会在调用上游前修改它
 */
struct CanonicalRequest {
    Dialect dialect = Dialect::ChatCompletions;
    std::string model;
    std::vector<ChatMessage> messages;    // chat / responses
    std::vector<std::string> inputs;      // embeddings
    std::optional<double> temperature;
    bool stream = false;
    nlohmann::json extra_options = nlohmann::json::object();

    bool is_embedding() const { return dialect == Dialect::Embeddings; }
};

// ============ 规范化响应 ============

struct Usage {
    int64_t prompt_tokens = 0;
    int64_t completion_tokens = 0;
    int64_t total_tokens = 0;

    Usage& operator+=(const Usage& other) {
        prompt_tokens += other.prompt_tokens;
        completion_tokens += other.completion_tokens;
        total_tokens += other.total_tokens;
        return *this;
    }
};

enum class ResponseStatus {
    Completed,
    InProgress,
    Incomplete,     // 因长度上限或内容过滤提前结束
    Failed
};

AI_GATEWAY_API const char* response_status_name(ResponseStatus status);

/**
 * 输出内容块
 * 文本输出使用 role/text/finish_reason，embedding 输出使用 embedding/index
 */
struct ContentBlock {
    std::string type = "output_text";
    std::string role = "assistant";
    std::string text;
    std::string finish_reason;
    std::vector<float> embedding;
    size_t index = 0;
};

struct CanonicalResponse {
    std::string id;
    std::string model;
    int64_t created = 0;
    ResponseStatus status = ResponseStatus::Completed;
    std::vector<ContentBlock> output;
    std::optional<Usage> usage;

    // 拼接所有文本块
    std::string text() const;
};

} // namespace ai_gateway
