#include "ai_gateway/dialect/adapter.hpp"
#include "ai_gateway/dialect/chat_completions.hpp"
#include "ai_gateway/dialect/embeddings.hpp"
#include "ai_gateway/dialect/responses.hpp"
#include "ai_gateway/core/errors.hpp"
#include "ai_gateway/core/utf8.hpp"

#include <ctime>
#include <random>
#include <sstream>

namespace ai_gateway {

const DialectAdapter& adapter_for(Dialect dialect) {
    static const ChatCompletionsAdapter chat;
    static const ResponsesAdapter responses;
    static const EmbeddingsAdapter embeddings;

    switch (dialect) {
        case Dialect::ChatCompletions: return chat;
        case Dialect::Responses:       return responses;
        case Dialect::Embeddings:      return embeddings;
    }
    throw GatewayError::internal("no adapter for dialect");
}

bool dialects_compatible(Dialect client, Dialect upstream) {
    if (client == Dialect::Embeddings || upstream == Dialect::Embeddings) {
        return client == upstream;
    }
    return true;
}

namespace detail {

// ============ ID / 时间 ============

std::string generate_id(const std::string& prefix, const std::string& separator) {
    static thread_local std::mt19937 gen(std::random_device{}());
    std::uniform_int_distribution<> dis(0, 15);

    std::stringstream ss;
    ss << prefix << separator;
    for (int i = 0; i < 24; ++i) {
        ss << std::hex << dis(gen);
    }
    return ss.str();
}

int64_t now_seconds() {
    return static_cast<int64_t>(std::time(nullptr));
}

// ============ SSE 帧 ============

std::string sse_data(const nlohmann::json& data) {
    return "data: " + dump_json(data) + "\n\n";
}

std::string sse_event(const std::string& event, const nlohmann::json& data) {
    return "event: " + event + "\ndata: " + dump_json(data) + "\n\n";
}

// ============ 请求字段 ============

void require_object(const nlohmann::json& payload) {
    if (!payload.is_object()) {
        throw GatewayError::bad_request("request body must be a JSON object");
    }
}

std::string require_model(const nlohmann::json& payload) {
    auto it = payload.find("model");
    if (it == payload.end() || it->is_null()) {
        throw GatewayError::bad_request("Missing 'model' field", "model");
    }
    if (!it->is_string() || it->get<std::string>().empty()) {
        throw GatewayError::bad_request("'model' must be a non-empty string", "model");
    }
    return it->get<std::string>();
}

std::optional<double> read_temperature(const nlohmann::json& payload) {
    auto it = payload.find("temperature");
    if (it == payload.end() || it->is_null()) {
        return std::nullopt;
    }
    if (!it->is_number()) {
        throw GatewayError::bad_request("'temperature' must be a number", "temperature");
    }
    double value = it->get<double>();
    if (value < 0.0 || value > 2.0) {
        throw GatewayError::bad_request("'temperature' must be between 0 and 2", "temperature");
    }
    return value;
}

bool read_stream(const nlohmann::json& payload) {
    auto it = payload.find("stream");
    if (it == payload.end() || it->is_null()) {
        return false;
    }
    if (!it->is_boolean()) {
        throw GatewayError::bad_request("'stream' must be a boolean", "stream");
    }
    return it->get<bool>();
}

std::string content_text(const nlohmann::json& content, const std::string& where) {
    if (content.is_null()) {
        return "";
    }
    if (content.is_string()) {
        return content.get<std::string>();
    }
    if (!content.is_array()) {
        throw GatewayError::bad_request(where + " must be a string or an array of content parts");
    }

    std::string text;
    for (const auto& part : content) {
        if (part.is_string()) {
            text += part.get<std::string>();
            continue;
        }
        if (!part.is_object()) {
            throw GatewayError::bad_request(where + " contains a malformed content part");
        }
        std::string type = part.value("type", "text");
        if (type != "text" && type != "input_text" && type != "output_text") {
            throw GatewayError::bad_request(where + " has unsupported content part type: " + type);
        }
        auto it = part.find("text");
        if (it == part.end() || !it->is_string()) {
            throw GatewayError::bad_request(where + " text part is missing 'text'");
        }
        text += it->get<std::string>();
    }
    return text;
}

// ============ usage ============

namespace {

int64_t integer_field(const nlohmann::json& obj, const char* primary, const char* fallback) {
    auto it = obj.find(primary);
    if (it != obj.end() && it->is_number_integer()) {
        return it->get<int64_t>();
    }
    it = obj.find(fallback);
    if (it != obj.end() && it->is_number_integer()) {
        return it->get<int64_t>();
    }
    return 0;
}

} // namespace

std::optional<Usage> read_usage(const nlohmann::json& usage) {
    if (!usage.is_object()) {
        return std::nullopt;
    }
    Usage result;
    result.prompt_tokens = integer_field(usage, "prompt_tokens", "input_tokens");
    result.completion_tokens = integer_field(usage, "completion_tokens", "output_tokens");
    result.total_tokens = integer_field(usage, "total_tokens", "total_tokens");
    if (result.total_tokens == 0) {
        result.total_tokens = result.prompt_tokens + result.completion_tokens;
    }
    return result;
}

nlohmann::json chat_usage_json(const Usage& usage) {
    return {
        {"prompt_tokens", usage.prompt_tokens},
        {"completion_tokens", usage.completion_tokens},
        {"total_tokens", usage.total_tokens}
    };
}

nlohmann::json responses_usage_json(const Usage& usage) {
    return {
        {"input_tokens", usage.prompt_tokens},
        {"output_tokens", usage.completion_tokens},
        {"total_tokens", usage.total_tokens}
    };
}

// ============ 其他 ============

void copy_options(const nlohmann::json& extras, nlohmann::json& body,
                  std::initializer_list<const char*> keys) {
    if (!extras.is_object()) {
        return;
    }
    for (const char* key : keys) {
        auto it = extras.find(key);
        if (it != extras.end() && !body.contains(key)) {
            body[key] = *it;
        }
    }
}

std::string upstream_error_message(const nlohmann::json& payload) {
    if (payload.is_object()) {
        auto it = payload.find("error");
        if (it != payload.end()) {
            if (it->is_object()) {
                auto msg = it->find("message");
                if (msg != it->end() && msg->is_string()) {
                    return msg->get<std::string>();
                }
                return dump_json(*it);
            }
            if (it->is_string()) {
                return it->get<std::string>();
            }
        }
        auto msg = payload.find("message");
        if (msg != payload.end() && msg->is_string()) {
            return msg->get<std::string>();
        }
    }
    return "upstream error";
}

} // namespace detail

} // namespace ai_gateway
