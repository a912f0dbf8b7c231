#pragma once

#include "ai_gateway/core/api_export.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace ai_gateway {

/**
 * 一个完整的 SSE 事件
 */
struct SseEvent {
    std::string event;   // "event:" 字段，未给出时为空
    std::string data;    // 多行 data 以 '\n' 连接
    std::string id;
    bool done = false;   // data 为 "[DONE]"
};

/**
 * SseParser - 增量解析 text/event-stream
 *
 * 输入可以在任意字节位置被切分；支持 \n、\r\n、\r 行尾。
 * 空行分发事件，以 ':' 开头的注释行忽略。
 */
class AI_GATEWAY_API SseParser {
public:
    /**
     * 喂入一段原始字节，返回其中已完整的事件
     */
    std::vector<SseEvent> feed(const char* data, size_t len);

    std::vector<SseEvent> feed(const std::string& data) {
        return feed(data.data(), data.size());
    }

    /**
     * 流结束时调用，分发末尾未以空行结束的事件
     */
    std::vector<SseEvent> finish();

    bool has_pending() const {
        return !line_.empty() || has_data_ || !event_.empty();
    }

private:
    void process_line(std::vector<SseEvent>& out);
    void dispatch(std::vector<SseEvent>& out);

    std::string line_;
    std::string event_;
    std::string data_;
    std::string id_;
    bool has_data_ = false;
    bool skip_lf_ = false;   // 上一个字符是 '\r'
};

} // namespace ai_gateway
