#include "ai_gateway/upstream/sse_parser.hpp"
#include "ai_gateway/upstream/upstream_client.hpp"

#include <cassert>
#include <iostream>

using namespace ai_gateway;

void test_single_event() {
    std::cout << "Test: single_event... " << std::flush;

    SseParser parser;
    auto events = parser.feed("data: {\"a\":1}\n\n");
    assert(events.size() == 1);
    assert(events[0].data == "{\"a\":1}");
    assert(events[0].event.empty());
    assert(!events[0].done);
    assert(!parser.has_pending());

    std::cout << "PASSED" << std::endl;
}

void test_named_events_and_done() {
    std::cout << "Test: named_events_and_done... " << std::flush;

    SseParser parser;
    auto events = parser.feed(
        "event: response.created\n"
        "data: {\"type\":\"response.created\"}\n"
        "\n"
        "data: [DONE]\n"
        "\n");
    assert(events.size() == 2);
    assert(events[0].event == "response.created");
    assert(events[1].event.empty());
    assert(events[1].done);

    std::cout << "PASSED" << std::endl;
}

void test_split_across_chunks() {
    std::cout << "Test: split_across_chunks... " << std::flush;

    const std::string stream = "data: hello\r\n\r\ndata: world\r\n\r\n";
    // 每个字节单独喂入，包括被切开的 \r\n
    SseParser parser;
    std::vector<SseEvent> events;
    for (char c : stream) {
        for (auto& event : parser.feed(&c, 1)) {
            events.push_back(event);
        }
    }
    assert(events.size() == 2);
    assert(events[0].data == "hello");
    assert(events[1].data == "world");

    std::cout << "PASSED" << std::endl;
}

void test_multiline_data_and_comments() {
    std::cout << "Test: multiline_data_and_comments... " << std::flush;

    SseParser parser;
    auto events = parser.feed(
        ": keep-alive\n"
        "id: 7\n"
        "data: line one\n"
        "data:line two\n"
        "retry: 1000\n"
        "\n");
    assert(events.size() == 1);
    assert(events[0].data == "line one\nline two");
    assert(events[0].id == "7");

    std::cout << "PASSED" << std::endl;
}

void test_lone_cr_line_endings() {
    std::cout << "Test: lone_cr_line_endings... " << std::flush;

    SseParser parser;
    auto events = parser.feed("data: a\r\rdata: b\r\r");
    assert(events.size() == 2);
    assert(events[0].data == "a");
    assert(events[1].data == "b");

    std::cout << "PASSED" << std::endl;
}

void test_finish_flushes_trailing_event() {
    std::cout << "Test: finish_flushes_trailing_event... " << std::flush;

    SseParser parser;
    auto events = parser.feed("data: partial");
    assert(events.empty());
    assert(parser.has_pending());

    events = parser.finish();
    assert(events.size() == 1);
    assert(events[0].data == "partial");
    assert(!parser.has_pending());

    // 只有 event 字段、没有 data 的块不产生事件
    parser.feed("event: ping\n\n");
    assert(parser.finish().empty());

    std::cout << "PASSED" << std::endl;
}

// ============ URL / 上游错误描述 ============

void test_split_url() {
    std::cout << "Test: split_url... " << std::flush;

    auto parts = HttpUpstreamClient::split_url("https://api.openai.com/v1/chat/completions");
    assert(parts.first == "https://api.openai.com");
    assert(parts.second == "/v1/chat/completions");

    parts = HttpUpstreamClient::split_url("http://127.0.0.1:9000/embeddings");
    assert(parts.first == "http://127.0.0.1:9000");
    assert(parts.second == "/embeddings");

    std::cout << "PASSED" << std::endl;
}

void test_describe_upstream_failure() {
    std::cout << "Test: describe_upstream_failure... " << std::flush;

    std::string message = describe_upstream_failure(
        500, R"({"error":{"message":"overloaded","type":"server_error"}})");
    assert(message.find("500") != std::string::npos);
    assert(message.find("overloaded") != std::string::npos);

    message = describe_upstream_failure(503, "");
    assert(message.find("503") != std::string::npos);

    std::cout << "PASSED" << std::endl;
}

int main() {
    std::cout << "=== SSE Parser Tests ===" << std::endl;

    test_single_event();
    test_named_events_and_done();
    test_split_across_chunks();
    test_multiline_data_and_comments();
    test_lone_cr_line_endings();
    test_finish_flushes_trailing_event();
    test_split_url();
    test_describe_upstream_failure();

    std::cout << "\nAll tests PASSED!" << std::endl;
    return 0;
}
