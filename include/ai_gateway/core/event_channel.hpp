#pragma once

#include "stream_event.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace ai_gateway {

/**
 * EventChannel - 上游读取线程与 HTTP 写出之间的有界队列
 *
 * 特性：
 * 1. 线程安全（mutex + condition_variable）
 * 2. 有界：队列满时 push 阻塞，形成背压
 * 3. close() 表示生产者结束，消费者可继续取完剩余事件
 * 4. disconnect() 表示消费者离开，push 立即失败并丢弃剩余事件
 */
class EventChannel {
public:
    explicit EventChannel(size_t capacity = 64)
        : capacity_(capacity == 0 ? 1 : capacity)
    {}

    EventChannel(const EventChannel&) = delete;
    EventChannel& operator=(const EventChannel&) = delete;

    /**
     * 推入事件，队列满时阻塞
     * @return true 成功，false 已关闭或已断开
     */
    bool push(StreamEvent event) {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            not_full_.wait(lock, [this] {
                return queue_.size() < capacity_ || closed_ || disconnected_;
            });
            if (closed_ || disconnected_) {
                return false;
            }
            queue_.push_back(std::move(event));
        }
        not_empty_.notify_one();
        return true;
    }

    /**
     * 生产者结束
     */
    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        not_empty_.notify_all();
        not_full_.notify_all();
    }

    /**
     * 消费者断开（客户端离开）
     */
    void disconnect() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            disconnected_ = true;
            closed_ = true;
            queue_.clear();
        }
        not_empty_.notify_all();
        not_full_.notify_all();
    }

    // 已关闭且已取空
    bool is_ended() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_ && queue_.empty();
    }

    bool is_writable() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return !closed_ && !disconnected_;
    }

    bool is_disconnected() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return disconnected_;
    }

    // 非阻塞弹出
    std::optional<StreamEvent> pop() {
        std::optional<StreamEvent> event;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (queue_.empty()) {
                return std::nullopt;
            }
            event = std::move(queue_.front());
            queue_.pop_front();
        }
        not_full_.notify_one();
        return event;
    }

    // 阻塞弹出，等待直到有数据或关闭
    std::optional<StreamEvent> wait_pop() {
        std::optional<StreamEvent> event;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            not_empty_.wait(lock, [this] { return !queue_.empty() || closed_; });
            if (queue_.empty()) {
                return std::nullopt;
            }
            event = std::move(queue_.front());
            queue_.pop_front();
        }
        not_full_.notify_one();
        return event;
    }

    // 带超时的阻塞弹出
    std::optional<StreamEvent> wait_pop_for(std::chrono::milliseconds timeout) {
        std::optional<StreamEvent> event;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            bool ready = not_empty_.wait_for(lock, timeout, [this] {
                return !queue_.empty() || closed_;
            });
            if (!ready || queue_.empty()) {
                return std::nullopt;
            }
            event = std::move(queue_.front());
            queue_.pop_front();
        }
        not_full_.notify_one();
        return event;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

    bool empty() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.empty();
    }

    size_t capacity() const { return capacity_; }

private:
    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    std::deque<StreamEvent> queue_;

    const size_t capacity_;
    bool closed_ = false;
    bool disconnected_ = false;  // 客户端断开标记
};

} // namespace ai_gateway
