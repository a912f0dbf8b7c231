#pragma once

#include "adapter.hpp"

#include <string>
#include <vector>

namespace ai_gateway {

/**
 * Embeddings 方言
 * POST /v1/embeddings，响应向量位于 data[].embedding，按 index 对齐输入
 */
class AI_GATEWAY_API EmbeddingsAdapter : public DialectAdapter {
public:
    Dialect dialect() const override { return Dialect::Embeddings; }

    bool supports_streaming() const override { return false; }

    CanonicalRequest decode(const nlohmann::json& payload) const override;
    nlohmann::json encode(const CanonicalRequest& request,
                          const CanonicalResponse& response) const override;
    std::unique_ptr<StreamEncoder> stream_encoder(const CanonicalRequest& request) const override;

    std::string upstream_path() const override { return "/embeddings"; }
    nlohmann::json encode_request(const CanonicalRequest& request,
                                  const std::string& upstream_model) const override;
    CanonicalResponse decode_response(const nlohmann::json& payload) const override;
    std::unique_ptr<StreamDecoder> stream_decoder() const override;

    // float32 小端字节的 base64（encoding_format = "base64"）
    static std::string encode_base64(const std::vector<float>& embedding);
};

} // namespace ai_gateway
