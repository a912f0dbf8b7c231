#include "ai_gateway/core/cancellation.hpp"
#include "ai_gateway/core/errors.hpp"
#include "ai_gateway/core/event_channel.hpp"
#include "ai_gateway/core/logging.hpp"
#include "ai_gateway/core/utf8.hpp"

#include <spdlog/sinks/ostream_sink.h>

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <sstream>
#include <thread>

using namespace ai_gateway;

// ============ ErrorEncoder ============

void test_error_envelope() {
    std::cout << "Test: error_envelope... " << std::flush;

    auto j = ErrorEncoder::to_json(GatewayError::not_found("gpt-x"));
    assert(j["error"]["message"] == "model not found: gpt-x");
    assert(j["error"]["type"] == "invalid_request_error");
    assert(j["error"]["code"] == "model_not_found");
    assert(j["error"]["param"] == "model");

    auto bad = nlohmann::json::parse(ErrorEncoder::invalid_request("Missing 'model' field"));
    assert(bad["error"]["type"] == "invalid_request_error");
    assert(bad["error"]["param"].is_null());

    std::cout << "PASSED" << std::endl;
}

void test_error_status_mapping() {
    std::cout << "Test: error_status_mapping... " << std::flush;

    assert(http_status(ErrorKind::BadRequest) == 400);
    assert(http_status(ErrorKind::Unauthorized) == 401);
    assert(http_status(ErrorKind::NotFound) == 404);
    assert(http_status(ErrorKind::RateLimited) == 429);
    assert(http_status(ErrorKind::Cancelled) == 499);
    assert(http_status(ErrorKind::Internal) == 500);
    assert(http_status(ErrorKind::UpstreamError) == 502);
    assert(http_status(ErrorKind::UpstreamInterrupted) == 502);
    assert(http_status(ErrorKind::Timeout) == 504);

    assert(std::string(error_type(ErrorKind::RateLimited)) == "rate_limit_error");
    assert(std::string(error_code(ErrorKind::Timeout)) == "timeout");

    std::cout << "PASSED" << std::endl;
}

void test_internal_error_hides_detail() {
    std::cout << "Test: internal_error_hides_detail... " << std::flush;

    auto error = GatewayError::internal("null pointer in route table");
    assert(error.status() == 500);
    assert(error.detail() == "null pointer in route table");

    auto j = ErrorEncoder::to_json(error);
    assert(j["error"]["message"] == "Internal server error");
    assert(j["error"]["type"] == "server_error");

    std::cout << "PASSED" << std::endl;
}

void test_batch_error_range() {
    std::cout << "Test: batch_error_range... " << std::flush;

    BatchError error(ErrorKind::UpstreamError, "upstream returned HTTP 500", 10, 20);
    assert(error.begin() == 10);
    assert(error.end() == 20);
    assert(error.status() == 502);
    assert(std::string(error.what()).find("[10, 20)") != std::string::npos);
    assert(error.param() == "input");

    std::cout << "PASSED" << std::endl;
}

// ============ EventChannel ============

void test_channel_basic() {
    std::cout << "Test: channel_basic... " << std::flush;

    EventChannel channel(8);
    assert(channel.push(StreamEvent::Started()));
    assert(channel.push(StreamEvent::TextDelta("Hello")));
    assert(channel.size() == 2);

    auto first = channel.pop();
    assert(first.has_value());
    assert(first->type == StreamEventType::Started);

    auto second = channel.wait_pop();
    assert(second.has_value());
    assert(second->text == "Hello");

    channel.close();
    assert(channel.is_ended());
    assert(!channel.push(StreamEvent::TextDelta("late")));
    assert(!channel.wait_pop().has_value());

    std::cout << "PASSED" << std::endl;
}

void test_channel_drains_after_close() {
    std::cout << "Test: channel_drains_after_close... " << std::flush;

    EventChannel channel(8);
    channel.push(StreamEvent::TextDelta("a"));
    channel.push(StreamEvent::DoneMarker());
    channel.close();

    assert(!channel.is_ended());
    assert(channel.wait_pop()->text == "a");
    assert(channel.wait_pop()->is_done());
    assert(channel.is_ended());

    std::cout << "PASSED" << std::endl;
}

void test_channel_backpressure() {
    std::cout << "Test: channel_backpressure... " << std::flush;

    EventChannel channel(2);
    std::atomic<int> pushed{0};

    std::thread producer([&]() {
        for (int i = 0; i < 5; ++i) {
            if (!channel.push(StreamEvent::TextDelta(std::to_string(i)))) {
                break;
            }
            pushed++;
        }
        channel.close();
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    assert(pushed.load() == 2);  // 队列满，生产者阻塞

    std::string received;
    while (auto event = channel.wait_pop_for(std::chrono::milliseconds(1000))) {
        received += event->text;
    }
    producer.join();

    assert(received == "01234");

    std::cout << "PASSED" << std::endl;
}

void test_channel_disconnect_unblocks_producer() {
    std::cout << "Test: channel_disconnect_unblocks_producer... " << std::flush;

    EventChannel channel(1);
    channel.push(StreamEvent::TextDelta("fill"));

    std::atomic<bool> result{true};
    std::thread producer([&]() {
        result = channel.push(StreamEvent::TextDelta("blocked"));
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    channel.disconnect();
    producer.join();

    assert(!result.load());
    assert(channel.is_disconnected());
    assert(channel.empty());

    std::cout << "PASSED" << std::endl;
}

void test_channel_timeout() {
    std::cout << "Test: channel_timeout... " << std::flush;

    EventChannel channel;
    auto start = std::chrono::steady_clock::now();
    auto event = channel.wait_pop_for(std::chrono::milliseconds(30));
    auto elapsed = std::chrono::steady_clock::now() - start;

    assert(!event.has_value());
    assert(elapsed >= std::chrono::milliseconds(25));
    assert(!channel.is_ended());

    std::cout << "PASSED" << std::endl;
}

// ============ CancelScope ============

void test_cancel_scope_shared_state() {
    std::cout << "Test: cancel_scope_shared_state... " << std::flush;

    CancelScope scope;
    CancelScope copy = scope;
    assert(!copy.cancelled());

    int fired = 0;
    {
        auto registration = copy.on_cancel([&fired]() { fired++; });
        scope.cancel();
        scope.cancel();
    }
    assert(fired == 1);
    assert(copy.cancelled());
    assert(copy.stopped());

    // 已取消时注册立即执行
    auto late = copy.on_cancel([&fired]() { fired++; });
    assert(fired == 2);

    bool threw = false;
    try {
        copy.throw_if_stopped();
    } catch (const GatewayError& e) {
        threw = e.kind() == ErrorKind::Cancelled;
    }
    assert(threw);

    std::cout << "PASSED" << std::endl;
}

void test_cancel_scope_registration_unregisters() {
    std::cout << "Test: cancel_scope_registration_unregisters... " << std::flush;

    CancelScope scope;
    int fired = 0;
    {
        auto registration = scope.on_cancel([&fired]() { fired++; });
    }
    scope.cancel();
    assert(fired == 0);

    std::cout << "PASSED" << std::endl;
}

void test_cancel_scope_child() {
    std::cout << "Test: cancel_scope_child... " << std::flush;

    CancelScope parent(std::chrono::milliseconds(60000));
    CancelScope first = parent.child();
    CancelScope second = parent.child();
    assert(!first.stopped());
    assert(first.remaining() <= std::chrono::milliseconds(60000));

    // 子作用域的取消不影响父作用域与兄弟
    first.cancel();
    assert(first.cancelled());
    assert(!parent.cancelled());
    assert(!second.cancelled());

    // 父作用域取消传到子作用域，并打断其等待
    std::thread canceller([&parent]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        parent.cancel();
    });
    auto start = std::chrono::steady_clock::now();
    assert(second.wait_for(std::chrono::seconds(5)));
    assert(std::chrono::steady_clock::now() - start < std::chrono::seconds(2));
    canceller.join();
    assert(second.cancelled());

    // 父作用域已取消时派生的子作用域直接处于取消状态
    assert(parent.child().cancelled());

    std::cout << "PASSED" << std::endl;
}

void test_utf8_helpers() {
    std::cout << "Test: utf8_helpers... " << std::flush;

    std::string text = "XY";
    for (int i = 0; i < 100; ++i) {
        text += "\xe9\x94\x99";  // 错
    }
    // 256 落在多字节字符中间，回退到字符边界
    std::string cut = truncate_utf8(text, 256);
    assert(cut.size() == 254);
    assert(truncate_utf8(text, 5) == "XY\xe9\x94\x99");
    assert(truncate_utf8("short", 256) == "short");

    assert(sanitize_utf8("ok \xe9\x94\x99") == "ok \xe9\x94\x99");
    std::string cleaned = sanitize_utf8("a\xff\xfe" "b");
    assert(cleaned == "a\xef\xbf\xbd\xef\xbf\xbd" "b");

    nlohmann::json j = {{"message", std::string("bad \xff")}};
    std::string dumped = dump_json(j);
    assert(nlohmann::json::parse(dumped)["message"] == "bad \xef\xbf\xbd");

    std::cout << "PASSED" << std::endl;
}

void test_cancel_scope_deadline() {
    std::cout << "Test: cancel_scope_deadline... " << std::flush;

    CancelScope scope(std::chrono::milliseconds(30));
    assert(!scope.expired());
    assert(scope.remaining() <= std::chrono::milliseconds(30));

    assert(scope.wait_for(std::chrono::milliseconds(100)));
    assert(scope.expired());
    assert(!scope.cancelled());
    assert(scope.remaining() == std::chrono::milliseconds(0));

    bool threw = false;
    try {
        scope.throw_if_stopped();
    } catch (const GatewayError& e) {
        threw = e.kind() == ErrorKind::Timeout;
    }
    assert(threw);

    CancelScope unlimited;
    assert(unlimited.remaining(std::chrono::milliseconds(1234)) == std::chrono::milliseconds(1234));

    std::cout << "PASSED" << std::endl;
}

void test_cancel_interrupts_wait() {
    std::cout << "Test: cancel_interrupts_wait... " << std::flush;

    CancelScope scope;
    std::thread canceller([scope]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        scope.cancel();
    });

    auto start = std::chrono::steady_clock::now();
    assert(scope.wait_for(std::chrono::milliseconds(5000)));
    assert(std::chrono::steady_clock::now() - start < std::chrono::milliseconds(2000));
    canceller.join();

    std::cout << "PASSED" << std::endl;
}

// ============ logging ============

void test_logging_levels() {
    std::cout << "Test: logging_levels... " << std::flush;

    assert(logging::parse_level("DEBUG") == spdlog::level::debug);
    assert(logging::parse_level("warning") == spdlog::level::warn);
    assert(logging::parse_level("error") == spdlog::level::err);
    assert(logging::parse_level("bogus") == spdlog::level::info);

    std::ostringstream out;
    auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(out);
    logging::init("warn", "%l %v", "", {sink});
    spdlog::info("hidden");
    spdlog::warn("shown");
    spdlog::default_logger()->flush();

    assert(out.str().find("hidden") == std::string::npos);
    assert(out.str().find("warning shown") != std::string::npos);

    std::cout << "PASSED" << std::endl;
}

int main() {
    std::cout << "=== Core Tests ===" << std::endl;

    test_error_envelope();
    test_error_status_mapping();
    test_internal_error_hides_detail();
    test_batch_error_range();

    test_channel_basic();
    test_channel_drains_after_close();
    test_channel_backpressure();
    test_channel_disconnect_unblocks_producer();
    test_channel_timeout();

    test_cancel_scope_shared_state();
    test_cancel_scope_registration_unregisters();
    test_cancel_scope_child();
    test_cancel_scope_deadline();
    test_cancel_interrupts_wait();

    test_utf8_helpers();
    test_logging_levels();

    std::cout << "\nAll tests PASSED!" << std::endl;
    return 0;
}
