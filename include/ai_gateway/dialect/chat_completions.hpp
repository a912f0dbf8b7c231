#pragma once

#include "adapter.hpp"

#include <string>

namespace ai_gateway {

/**
 * Chat Completions 方言
 * POST /v1/chat/completions，响应文本位于 choices[i].message.content
 */
class AI_GATEWAY_API ChatCompletionsAdapter : public DialectAdapter {
public:
    Dialect dialect() const override { return Dialect::ChatCompletions; }

    CanonicalRequest decode(const nlohmann::json& payload) const override;
    nlohmann::json encode(const CanonicalRequest& request,
                          const CanonicalResponse& response) const override;
    std::unique_ptr<StreamEncoder> stream_encoder(const CanonicalRequest& request) const override;

    std::string upstream_path() const override { return "/chat/completions"; }
    nlohmann::json encode_request(const CanonicalRequest& request,
                                  const std::string& upstream_model) const override;
    CanonicalResponse decode_response(const nlohmann::json& payload) const override;
    std::unique_ptr<StreamDecoder> stream_decoder() const override;
};

/**
 * Chat Completions SSE Encoder
 * data: {"object":"chat.completion.chunk", "choices":[{"delta":...}]}
 */
class AI_GATEWAY_API ChatCompletionsStreamEncoder : public StreamEncoder {
public:
    explicit ChatCompletionsStreamEncoder(std::string model);

    std::string encode(const StreamEvent& event) override;

    const std::string& id() const { return id_; }

private:
    nlohmann::json make_chunk(const nlohmann::json& delta, const nlohmann::json& finish_reason) const;

    std::string id_;
    std::string model_;
    int64_t created_;
    bool role_sent_ = false;
};

/**
 * 上游 chat.completion.chunk 流解码
 */
class AI_GATEWAY_API ChatCompletionsStreamDecoder : public StreamDecoder {
public:
    std::vector<StreamEvent> decode(const SseEvent& event) override;
};

} // namespace ai_gateway
