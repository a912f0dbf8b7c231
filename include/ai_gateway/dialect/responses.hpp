#pragma once

#include "adapter.hpp"

#include <string>

namespace ai_gateway {

/**
 * Responses 方言
 * POST /v1/responses，响应文本位于 output[].content[].text
 */
class AI_GATEWAY_API ResponsesAdapter : public DialectAdapter {
public:
    Dialect dialect() const override { return Dialect::Responses; }

    CanonicalRequest decode(const nlohmann::json& payload) const override;
    nlohmann::json encode(const CanonicalRequest& request,
                          const CanonicalResponse& response) const override;
    std::unique_ptr<StreamEncoder> stream_encoder(const CanonicalRequest& request) const override;

    std::string upstream_path() const override { return "/responses"; }
    nlohmann::json encode_request(const CanonicalRequest& request,
                                  const std::string& upstream_model) const override;
    CanonicalResponse decode_response(const nlohmann::json& payload) const override;
    std::unique_ptr<StreamDecoder> stream_decoder() const override;
};

/**
 * Responses SSE Encoder
 *
 * 事件顺序：
 * response.created → response.in_progress → response.output_item.added →
 * response.content_part.added → response.output_text.delta* →
 * response.output_text.done → response.content_part.done →
 * response.output_item.done → response.completed → [DONE]
 *
 * 每帧为 "event: <type>\ndata: {...}\n\n"，sequence_number 从 1 递增
 */
class AI_GATEWAY_API ResponsesStreamEncoder : public StreamEncoder {
public:
    explicit ResponsesStreamEncoder(std::string model);

    std::string encode(const StreamEvent& event) override;

    const std::string& response_id() const { return response_id_; }
    const std::string& item_id() const { return item_id_; }
    int sequence_number() const { return sequence_; }

private:
    std::string emit(const std::string& type, nlohmann::json body);
    std::string open_frames();
    std::string completion_frames();
    nlohmann::json response_object(const char* status) const;
    nlohmann::json message_item(const char* status) const;
    nlohmann::json text_part() const;

    std::string response_id_;
    std::string item_id_;
    std::string model_;
    int64_t created_at_;
    int sequence_ = 0;
    bool opened_ = false;
    bool failed_ = false;
    std::string incomplete_reason_;   // 非空时以 response.incomplete 结束
    std::string text_;
    std::optional<Usage> usage_;
};

/**
 * 上游 Responses 事件流解码
 * 生命周期事件由网关自己合成，这里只保留文本增量、完成与错误
 */
class AI_GATEWAY_API ResponsesStreamDecoder : public StreamDecoder {
public:
    std::vector<StreamEvent> decode(const SseEvent& event) override;
};

} // namespace ai_gateway
