#pragma once

#include "ai_gateway/core/errors.hpp"
#include "ai_gateway/types.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace ai_gateway {

/**
 * StreamEvent 类型枚举
 */
enum class StreamEventType {
    Started,        // 上游流已打开
    TextDelta,      // 文本增量
    Finished,       // 结束原因 / usage
    Error,          // 流内错误
    Interrupted,    // 上游中途断开
    Unknown,        // 无法识别的上游事件，原样透传
    Done            // 终止标记，每个流恰好一个
};

AI_GATEWAY_API const char* stream_event_type_name(StreamEventType type);

/**
 * StreamEvent - 流式调用中的语义事件
 *
 * 上游解码器只产生语义事件，不关心客户端方言；
 * 客户端 StreamEncoder 负责编码成具体的 SSE 帧
 */
struct StreamEvent {
    StreamEventType type = StreamEventType::Done;

    std::string text;
    std::string finish_reason;
    std::optional<Usage> usage;

    ErrorKind error_kind = ErrorKind::UpstreamError;
    std::string error_message;

    // Unknown 事件的原始名称与负载
    std::string name;
    nlohmann::json payload;

    static StreamEvent Started() {
        StreamEvent event;
        event.type = StreamEventType::Started;
        return event;
    }

    static StreamEvent TextDelta(const std::string& delta) {
        StreamEvent event;
        event.type = StreamEventType::TextDelta;
        event.text = delta;
        return event;
    }

    static StreamEvent Finished(const std::string& reason, std::optional<Usage> usage = std::nullopt) {
        StreamEvent event;
        event.type = StreamEventType::Finished;
        event.finish_reason = reason;
        event.usage = usage;
        return event;
    }

    static StreamEvent Error(ErrorKind kind, const std::string& message) {
        StreamEvent event;
        event.type = StreamEventType::Error;
        event.error_kind = kind;
        event.error_message = message;
        return event;
    }

    static StreamEvent Interrupted(const std::string& message) {
        StreamEvent event;
        event.type = StreamEventType::Interrupted;
        event.error_kind = ErrorKind::UpstreamInterrupted;
        event.error_message = message;
        return event;
    }

    static StreamEvent Unknown(const std::string& event_name, const nlohmann::json& raw) {
        StreamEvent event;
        event.type = StreamEventType::Unknown;
        event.name = event_name;
        event.payload = raw;
        return event;
    }

    static StreamEvent DoneMarker() {
        StreamEvent event;
        event.type = StreamEventType::Done;
        return event;
    }

    bool is_done() const {
        return type == StreamEventType::Done;
    }

    bool is_error() const {
        return type == StreamEventType::Error || type == StreamEventType::Interrupted;
    }
};

} // namespace ai_gateway
