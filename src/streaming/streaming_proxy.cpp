#include "ai_gateway/streaming/streaming_proxy.hpp"
#include "ai_gateway/core/errors.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace ai_gateway {

namespace {

constexpr size_t kMaxErrorBody = 64 * 1024;

bool is_success(int status) {
    return status >= 200 && status < 300;
}

} // namespace

const char* proxy_state_name(ProxyState state) {
    switch (state) {
        case ProxyState::Pending:  return "pending";
        case ProxyState::Opened:   return "opened";
        case ProxyState::Emitting: return "emitting";
        case ProxyState::Closed:   return "closed";
    }
    return "closed";
}

StreamingProxy::StreamingProxy(std::shared_ptr<UpstreamClient> client,
                               UpstreamCall call,
                               std::unique_ptr<StreamDecoder> decoder,
                               CancelScope scope,
                               size_t buffer_capacity)
    : client_(std::move(client))
    , call_(std::move(call))
    , decoder_(std::move(decoder))
    , scope_(std::move(scope))
    , channel_(buffer_capacity)
{
    call_.stream = true;
}

StreamingProxy::~StreamingProxy() {
    if (state() != ProxyState::Closed) {
        cancel();
    }
    join_reader();
}

// ============ 生命周期 ============

void StreamingProxy::start() {
    reader_ = std::thread(&StreamingProxy::run, this);
}

void StreamingProxy::wait_opened() {
    std::unique_lock<std::mutex> lock(state_mutex_);
    state_cv_.wait(lock, [this] { return state_ != ProxyState::Pending; });
    if (open_error_) {
        throw *open_error_;
    }
}

std::optional<StreamEvent> StreamingProxy::next(std::chrono::milliseconds wait) {
    return channel_.wait_pop_for(wait);
}

void StreamingProxy::cancel() {
    cancel_requested_ = true;
    channel_.disconnect();
    scope_.cancel();
    join_reader();
}

void StreamingProxy::join_reader() {
    std::lock_guard<std::mutex> lock(join_mutex_);
    if (reader_.joinable() && reader_.get_id() != std::this_thread::get_id()) {
        reader_.join();
    }
}

ProxyState StreamingProxy::state() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_;
}

// ============ 读取线程 ============

void StreamingProxy::run() {
    std::optional<GatewayError> transport_error;
    try {
        client_->stream(call_,
            [this](int status) {
                upstream_status_ = status;
                return true;
            },
            [this](const char* data, size_t len) {
                return handle_bytes(data, len);
            },
            scope_);
    } catch (const GatewayError& e) {
        transport_error = e;
    } catch (const std::exception& e) {
        spdlog::error("upstream stream to {} failed: {}", call_.url, e.what());
        transport_error = GatewayError::internal(e.what());
    }

    if (state() == ProxyState::Pending) {
        if (cancel_requested_.load() || scope_.cancelled()) {
            fail_before_open(GatewayError(ErrorKind::Cancelled, "request cancelled"));
            return;
        }
        if (upstream_status_ != 0 && !is_success(upstream_status_)) {
            fail_before_open(GatewayError::upstream(describe_upstream_failure(upstream_status_, error_body_)));
            return;
        }
        if (transport_error) {
            fail_before_open(*transport_error);
            return;
        }
        if (scope_.expired()) {
            fail_before_open(GatewayError(ErrorKind::Timeout, "upstream did not respond before the deadline"));
            return;
        }
        // 2xx 但 body 为空
        open();
    }

    if (cancel_requested_.load()) {
        close(std::nullopt, false);
        return;
    }

    // 末尾未以空行结束的事件
    if (!upstream_done_ && !forward(parser_.finish())) {
        close(std::nullopt, !cancel_requested_.load());
        return;
    }

    const bool completed = upstream_done_ || decoder_->completed();
    if (!completed && scope_.expired()) {
        close(StreamEvent::Error(ErrorKind::Timeout, "upstream stream timed out"), true);
    } else if (!completed && transport_error) {
        close(StreamEvent::Interrupted(transport_error->what()), true);
    } else if (!completed && scope_.cancelled()) {
        close(std::nullopt, false);
    } else {
        close(std::nullopt, true);
    }
}

bool StreamingProxy::handle_bytes(const char* data, size_t len) {
    if (cancel_requested_.load() || scope_.expired()) {
        return false;
    }

    if (!is_success(upstream_status_)) {
        if (error_body_.size() < kMaxErrorBody) {
            error_body_.append(data, std::min(len, kMaxErrorBody - error_body_.size()));
        }
        return true;
    }

    if (state() == ProxyState::Pending) {
        open();
    }
    return forward(parser_.feed(data, len));
}

bool StreamingProxy::forward(const std::vector<SseEvent>& events) {
    for (const auto& sse : events) {
        for (auto& event : decoder_->decode(sse)) {
            if (!emit(std::move(event))) {
                return false;
            }
        }
        if (sse.done) {
            // 上游已结束，停止读取并释放连接
            upstream_done_ = true;
            return false;
        }
    }
    return true;
}

bool StreamingProxy::emit(StreamEvent event) {
    if (!channel_.push(std::move(event))) {
        return false;
    }
    emitted_++;
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (state_ == ProxyState::Opened) {
        state_ = ProxyState::Emitting;
    }
    return true;
}

void StreamingProxy::open() {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        state_ = ProxyState::Opened;
    }
    state_cv_.notify_all();
    spdlog::debug("upstream stream {} opened", call_.url);
}

void StreamingProxy::fail_before_open(const GatewayError& error) {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        open_error_ = error;
        state_ = ProxyState::Closed;
    }
    channel_.close();
    state_cv_.notify_all();
    spdlog::warn("upstream stream {} failed before opening: {}", call_.url, error.what());
}

void StreamingProxy::close(std::optional<StreamEvent> terminal, bool send_done) {
    if (terminal) {
        spdlog::warn("upstream stream {} closing with {}: {}", call_.url,
                     stream_event_type_name(terminal->type), terminal->error_message);
        emit(std::move(*terminal));
    }
    if (send_done && !done_sent_) {
        done_sent_ = true;
        channel_.push(StreamEvent::DoneMarker());
    }
    channel_.close();
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        state_ = ProxyState::Closed;
    }
    state_cv_.notify_all();
    spdlog::debug("upstream stream {} closed after {} event(s)", call_.url, emitted_.load());
}

} // namespace ai_gateway
