#include "ai_gateway/core/stream_event.hpp"

namespace ai_gateway {

const char* stream_event_type_name(StreamEventType type) {
    switch (type) {
        case StreamEventType::Started:     return "started";
        case StreamEventType::TextDelta:   return "text_delta";
        case StreamEventType::Finished:    return "finished";
        case StreamEventType::Error:       return "error";
        case StreamEventType::Interrupted: return "upstream_interrupted";
        case StreamEventType::Unknown:     return "unknown";
        case StreamEventType::Done:        return "done";
    }
    return "unknown";
}

} // namespace ai_gateway
