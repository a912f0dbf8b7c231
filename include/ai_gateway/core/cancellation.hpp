#pragma once

#include "ai_gateway/core/errors.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>

namespace ai_gateway {

/**
 * CancelScope - 单次请求的取消 / 超时上下文
 *
 * 可拷贝，所有拷贝共享同一个状态：
 * 1. cancel() 之后所有拷贝都看到 cancelled()
 * 2. 可选截止时间，expired() 在到期后返回 true
 * 3. on_cancel() 注册的回调在 cancel() 时执行（用于中断阻塞的上游读取）
 * 4. child() 派生的子作用域可单独取消，父作用域取消时一并取消
 */
class CancelScope {
private:
    struct State;

public:
    using Callback = std::function<void()>;

    /**
     * 回调注册句柄，析构时自动注销
     */
    class Registration {
    public:
        Registration() = default;
        Registration(const Registration&) = delete;
        Registration& operator=(const Registration&) = delete;
        Registration(Registration&& other) noexcept
            : state_(std::move(other.state_)), id_(other.id_) {}

        ~Registration() {
            if (auto state = state_.lock()) {
                std::lock_guard<std::mutex> lock(state->mutex);
                state->callbacks.erase(id_);
            }
        }

    private:
        friend class CancelScope;
        Registration(std::weak_ptr<State> state, uint64_t id)
            : state_(std::move(state)), id_(id) {}

        std::weak_ptr<State> state_;
        uint64_t id_ = 0;
    };

    CancelScope() : state_(std::make_shared<State>()) {}

    explicit CancelScope(std::chrono::milliseconds timeout)
        : state_(std::make_shared<State>())
    {
        state_->deadline = std::chrono::steady_clock::now() + timeout;
    }

    /**
     * 派生子作用域：继承截止时间，父作用域取消时随之取消，
     * 子作用域自身的 cancel() 不会传回父作用域
     */
    CancelScope child() const {
        CancelScope scope(std::make_shared<State>());
        scope.state_->deadline = state_->deadline;
        std::weak_ptr<State> weak = scope.state_;
        Registration link = on_cancel([weak]() {
            if (auto state = weak.lock()) {
                CancelScope(state).cancel();
            }
        });
        scope.state_->parent_link = std::make_unique<Registration>(std::move(link));
        return scope;
    }

    /**
     * 取消（幂等），执行所有已注册回调
     */
    void cancel() const {
        std::map<uint64_t, Callback> callbacks;
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            if (state_->cancelled.exchange(true)) {
                return;
            }
            callbacks.swap(state_->callbacks);
        }
        state_->cv.notify_all();
        for (auto& entry : callbacks) {
            entry.second();
        }
    }

    bool cancelled() const {
        return state_->cancelled.load();
    }

    bool expired() const {
        return state_->deadline.has_value() &&
               std::chrono::steady_clock::now() >= *state_->deadline;
    }

    bool stopped() const {
        return cancelled() || expired();
    }

    /**
     * 距离截止时间的剩余时长；无截止时间时返回 fallback
     */
    std::chrono::milliseconds remaining(
        std::chrono::milliseconds fallback = std::chrono::milliseconds(600000)) const {
        if (!state_->deadline.has_value()) {
            return fallback;
        }
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            *state_->deadline - std::chrono::steady_clock::now());
        return std::max(std::chrono::milliseconds(0), std::min(left, fallback));
    }

    /**
     * 已取消抛 Cancelled，已超时抛 Timeout
     */
    void throw_if_stopped() const {
        if (cancelled()) {
            throw GatewayError(ErrorKind::Cancelled, "request cancelled");
        }
        if (expired()) {
            throw GatewayError(ErrorKind::Timeout, "request timed out");
        }
    }

    /**
     * 可被 cancel() 打断的等待
     * @return true 表示等待期间被取消或已超时
     */
    bool wait_for(std::chrono::milliseconds duration) const {
        std::unique_lock<std::mutex> lock(state_->mutex);
        state_->cv.wait_for(lock, duration, [this] { return state_->cancelled.load(); });
        return stopped();
    }

    /**
     * 注册取消回调；已取消时立即执行
     */
    Registration on_cancel(Callback callback) const {
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            if (!state_->cancelled.load()) {
                uint64_t id = ++state_->next_id;
                state_->callbacks.emplace(id, std::move(callback));
                return Registration(state_, id);
            }
        }
        callback();
        return Registration();
    }

private:
    explicit CancelScope(std::shared_ptr<State> state) : state_(std::move(state)) {}

    struct State {
        std::atomic<bool> cancelled{false};
        std::optional<std::chrono::steady_clock::time_point> deadline;
        std::mutex mutex;
        std::condition_variable cv;
        std::map<uint64_t, Callback> callbacks;
        uint64_t next_id = 0;
        std::unique_ptr<Registration> parent_link;  // 子作用域挂在父作用域上的回调
    };

    std::shared_ptr<State> state_;
};

} // namespace ai_gateway
