#include "ai_gateway/upstream/sse_parser.hpp"

namespace ai_gateway {

std::vector<SseEvent> SseParser::feed(const char* data, size_t len) {
    std::vector<SseEvent> out;
    for (size_t i = 0; i < len; ++i) {
        char c = data[i];
        if (c == '\n') {
            if (skip_lf_) {
                skip_lf_ = false;
                continue;
            }
            process_line(out);
        } else if (c == '\r') {
            skip_lf_ = true;
            process_line(out);
        } else {
            skip_lf_ = false;
            line_.push_back(c);
        }
    }
    return out;
}

std::vector<SseEvent> SseParser::finish() {
    std::vector<SseEvent> out;
    if (!line_.empty()) {
        process_line(out);
    }
    if (has_data_) {
        dispatch(out);
    }
    event_.clear();
    id_.clear();
    skip_lf_ = false;
    return out;
}

void SseParser::process_line(std::vector<SseEvent>& out) {
    std::string line;
    line.swap(line_);

    if (line.empty()) {
        dispatch(out);
        return;
    }
    if (line[0] == ':') {
        return;  // 注释 / keep-alive
    }

    std::string field;
    std::string value;
    auto colon = line.find(':');
    if (colon == std::string::npos) {
        field = line;
    } else {
        field = line.substr(0, colon);
        value = line.substr(colon + 1);
        if (!value.empty() && value[0] == ' ') {
            value.erase(0, 1);
        }
    }

    if (field == "data") {
        if (has_data_) {
            data_.push_back('\n');
        }
        data_ += value;
        has_data_ = true;
    } else if (field == "event") {
        event_ = value;
    } else if (field == "id") {
        id_ = value;
    }
    // retry 及其他字段忽略
}

void SseParser::dispatch(std::vector<SseEvent>& out) {
    if (!has_data_) {
        event_.clear();
        return;
    }

    SseEvent event;
    event.event = std::move(event_);
    event.data = std::move(data_);
    event.id = id_;
    event.done = (event.data == "[DONE]");
    out.push_back(std::move(event));

    event_.clear();
    data_.clear();
    has_data_ = false;
}

} // namespace ai_gateway
