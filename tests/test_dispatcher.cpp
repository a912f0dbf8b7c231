#include "ai_gateway/dispatcher.hpp"
#include "ai_gateway/core/errors.hpp"
#include "fake_upstream.hpp"

#include <algorithm>
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <vector>

using namespace ai_gateway;
using namespace ai_gateway::testing;
using json = nlohmann::json;

struct Fixture {
    std::shared_ptr<ModelRegistry> registry = std::make_shared<ModelRegistry>();
    std::shared_ptr<FakeUpstream> upstream = std::make_shared<FakeUpstream>();
    std::shared_ptr<Dispatcher> dispatcher;

    Fixture() {
        ModelRoute chat;
        chat.model_name = "chat-model";
        chat.provider_id = "openai";
        chat.provider_dialect = Dialect::ChatCompletions;
        chat.endpoint_url = "http://openai.local/v1/";
        chat.upstream_model = "gpt-4o-mini";
        chat.api_key = "sk-upstream";
        registry->registerRoute(chat);

        ModelRoute responses;
        responses.model_name = "resp-model";
        responses.provider_id = "openai";
        responses.provider_dialect = Dialect::Responses;
        responses.endpoint_url = "http://openai.local/v1";
        registry->registerRoute(responses);

        ModelRoute embed;
        embed.model_name = "embed-model";
        embed.provider_id = "openai";
        embed.provider_dialect = Dialect::Embeddings;
        embed.endpoint_url = "http://openai.local/v1";
        embed.embedding_chunk_size = 10;
        registry->registerRoute(embed);

        DispatchOptions options;
        options.batching.max_concurrency = 2;
        dispatcher = std::make_shared<Dispatcher>(registry, upstream, options);
    }

    DispatchResult call(const std::string& body, Dialect dialect, CancelScope scope = CancelScope()) {
        return dispatcher->handle(body, dialect, scope);
    }
};

std::string drain_frames(ClientStream& stream) {
    std::string all;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (!stream.finished() && std::chrono::steady_clock::now() < deadline) {
        if (auto frame = stream.next_frame(std::chrono::milliseconds(20))) {
            all += *frame;
        }
    }
    return all;
}

// chat SSE 中所有 delta.content 拼接
std::string chat_stream_text(const std::string& frames) {
    std::string text;
    SseParser parser;
    for (const auto& event : parser.feed(frames)) {
        if (event.done) {
            continue;
        }
        auto j = json::parse(event.data);
        if (j.contains("choices") && !j["choices"].empty()) {
            const auto& delta = j["choices"][0]["delta"];
            if (delta.contains("content") && delta["content"].is_string()) {
                text += delta["content"].get<std::string>();
            }
        }
    }
    return text;
}

std::string responses_stream_text(const std::string& frames) {
    std::string text;
    SseParser parser;
    for (const auto& event : parser.feed(frames)) {
        if (event.event == "response.output_text.delta") {
            text += json::parse(event.data)["delta"].get<std::string>();
        }
    }
    return text;
}

StreamScript count_to_five_stream() {
    StreamScript script;
    script.chunks = {
        chat_chunk("1"), chat_chunk(", 2"), chat_chunk(", 3"), chat_chunk(", 4"), chat_chunk(", 5"),
        chat_chunk("", "stop"), "data: [DONE]\n\n"
    };
    return script;
}

const char* kCountChat = R"({"model": "chat-model", "messages": [{"role": "user", "content": "Count to 5"}]})";
const char* kCountChatStream =
    R"({"model": "chat-model", "messages": [{"role": "user", "content": "Count to 5"}], "stream": true})";

// ============ 错误路径 ============

void test_unknown_model_never_reaches_upstream() {
    std::cout << "Test: unknown_model_never_reaches_upstream... " << std::flush;

    Fixture f;
    auto result = f.call(R"({"model": "nope", "messages": [{"role": "user", "content": "hi"}]})",
                         Dialect::ChatCompletions);
    assert(result.status == 404);
    assert(!result.is_stream());
    auto j = json::parse(result.body);
    assert(j["error"]["code"] == "model_not_found");
    assert(j["error"]["message"] == "model not found: nope");
    assert(f.upstream->callCount() == 0);

    std::cout << "PASSED" << std::endl;
}

void test_bad_requests() {
    std::cout << "Test: bad_requests... " << std::flush;

    Fixture f;
    auto invalid_json = f.call("{not json", Dialect::ChatCompletions);
    assert(invalid_json.status == 400);
    assert(json::parse(invalid_json.body)["error"]["type"] == "invalid_request_error");

    auto missing_model = f.call(R"({"messages": [{"role": "user", "content": "hi"}]})", Dialect::ChatCompletions);
    assert(missing_model.status == 400);
    assert(json::parse(missing_model.body)["error"]["param"] == "model");

    // chat 请求不能路由到 embeddings 上游
    auto wrong_dialect = f.call(R"({"model": "embed-model", "messages": [{"role": "user", "content": "hi"}]})",
                                Dialect::ChatCompletions);
    assert(wrong_dialect.status == 400);

    auto embed_stream = f.call(R"({"model": "embed-model", "input": "x", "stream": true})", Dialect::Embeddings);
    assert(embed_stream.status == 400);

    assert(f.upstream->callCount() == 0);

    std::cout << "PASSED" << std::endl;
}

void test_cancelled_before_dispatch() {
    std::cout << "Test: cancelled_before_dispatch... " << std::flush;

    Fixture f;
    CancelScope scope;
    scope.cancel();
    auto result = f.call(kCountChat, Dialect::ChatCompletions, scope);
    assert(result.status == 499);
    assert(f.upstream->callCount() == 0);

    std::cout << "PASSED" << std::endl;
}

// ============ 非流式 ============

void test_chat_to_chat_upstream() {
    std::cout << "Test: chat_to_chat_upstream... " << std::flush;

    Fixture f;
    f.upstream->onPost([](const UpstreamCall&) {
        return UpstreamReply{200, chat_completion_body("1, 2, 3, 4, 5")};
    });

    auto result = f.call(kCountChat, Dialect::ChatCompletions);
    assert(result.status == 200);
    auto j = json::parse(result.body);
    assert(j["object"] == "chat.completion");
    assert(j["model"] == "chat-model");  // 客户端看到的是自己请求的模型名
    assert(j["choices"][0]["message"]["content"] == "1, 2, 3, 4, 5");
    assert(j["usage"]["total_tokens"] == 12);

    auto calls = f.upstream->calls();
    assert(calls.size() == 1);
    assert(calls[0].url == "http://openai.local/v1/chat/completions");
    assert(calls[0].api_key == "sk-upstream");
    assert(calls[0].body["model"] == "gpt-4o-mini");
    assert(calls[0].body["stream"] == false);
    assert(!calls[0].stream);

    std::cout << "PASSED" << std::endl;
}

void test_responses_client_to_chat_upstream() {
    std::cout << "Test: responses_client_to_chat_upstream... " << std::flush;

    Fixture f;
    f.upstream->onPost([](const UpstreamCall&) {
        return UpstreamReply{200, chat_completion_body("Hello from chat")};
    });

    auto result = f.call(R"({"model": "chat-model", "input": "Say hello", "instructions": "Be nice"})",
                         Dialect::Responses);
    assert(result.status == 200);
    auto j = json::parse(result.body);
    assert(j["object"] == "response");
    assert(j["status"] == "completed");
    assert(j["model"] == "chat-model");
    assert(j["output"][0]["content"][0]["text"] == "Hello from chat");
    assert(j["usage"]["input_tokens"] == 5);

    auto calls = f.upstream->calls();
    assert(calls[0].body["messages"].size() == 2);
    assert(calls[0].body["messages"][0]["role"] == "system");

    std::cout << "PASSED" << std::endl;
}

void test_chat_client_to_responses_upstream() {
    std::cout << "Test: chat_client_to_responses_upstream... " << std::flush;

    Fixture f;
    f.upstream->onPost([](const UpstreamCall& call) {
        assert(call.url == "http://openai.local/v1/responses");
        json body = {
            {"id", "resp_up"},
            {"object", "response"},
            {"status", "completed"},
            {"output", json::array({
                {{"type", "message"}, {"role", "assistant"},
                 {"content", json::array({{{"type", "output_text"}, {"text", "via responses"}}})}}
            })},
            {"usage", {{"input_tokens", 3}, {"output_tokens", 2}, {"total_tokens", 5}}}
        };
        return UpstreamReply{200, body.dump()};
    });

    auto result = f.call(R"({"model": "resp-model", "messages": [{"role": "user", "content": "hi"}]})",
                         Dialect::ChatCompletions);
    assert(result.status == 200);
    auto j = json::parse(result.body);
    assert(j["choices"][0]["message"]["content"] == "via responses");
    assert(j["usage"]["prompt_tokens"] == 3);
    assert(j["usage"]["completion_tokens"] == 2);

    std::cout << "PASSED" << std::endl;
}

void test_upstream_failures_map_to_502() {
    std::cout << "Test: upstream_failures_map_to_502... " << std::flush;

    Fixture f;
    f.upstream->onPost([](const UpstreamCall&) {
        return UpstreamReply{500, R"({"error":{"message":"overloaded"}})"};
    });
    auto failed = f.call(kCountChat, Dialect::ChatCompletions);
    assert(failed.status == 502);
    auto j = json::parse(failed.body);
    assert(j["error"]["type"] == "api_error");
    assert(j["error"]["message"].get<std::string>().find("overloaded") != std::string::npos);

    f.upstream->onPost([](const UpstreamCall&) {
        return UpstreamReply{200, "<html>bad gateway</html>"};
    });
    auto garbage = f.call(kCountChat, Dialect::ChatCompletions);
    assert(garbage.status == 502);

    f.upstream->onPost([](const UpstreamCall&) -> UpstreamReply {
        throw GatewayError::upstream("upstream request failed: Connection");
    });
    auto refused = f.call(kCountChat, Dialect::ChatCompletions);
    assert(refused.status == 502);

    std::cout << "PASSED" << std::endl;
}

void test_handler_exception_is_internal() {
    std::cout << "Test: handler_exception_is_internal... " << std::flush;

    Fixture f;
    f.upstream->onPost([](const UpstreamCall&) -> UpstreamReply {
        throw std::runtime_error("secret stack detail");
    });
    auto result = f.call(kCountChat, Dialect::ChatCompletions);
    assert(result.status == 500);
    auto j = json::parse(result.body);
    assert(j["error"]["message"] == "Internal server error");
    assert(result.body.find("secret") == std::string::npos);

    std::cout << "PASSED" << std::endl;
}

void test_upstream_error_body_cut_inside_multibyte_char() {
    std::cout << "Test: upstream_error_body_cut_inside_multibyte_char... " << std::flush;

    // 截断位置落在三字节字符中间
    std::string body = "XY";
    for (int i = 0; i < 100; ++i) {
        body += "\xe9\x94\x99";
    }

    Fixture f;
    f.upstream->onPost([body](const UpstreamCall&) { return UpstreamReply{503, body}; });

    auto chat = f.call(kCountChat, Dialect::ChatCompletions);
    assert(chat.status == 502);
    auto chat_error = json::parse(chat.body)["error"];
    assert(chat_error["type"] == "api_error");
    std::string chat_message = chat_error["message"].get<std::string>();
    assert(chat_message.find("HTTP 503: XY\xe9\x94\x99") != std::string::npos);
    assert(chat_message.find("\xef\xbf\xbd") == std::string::npos);

    json request = {{"model", "embed-model"}, {"input", numbered_inputs(2)}};
    auto embed = f.call(request.dump(), Dialect::Embeddings);
    assert(embed.status == 502);
    auto embed_error = json::parse(embed.body)["error"];
    assert(embed_error["param"] == "input");
    assert(embed_error["message"].get<std::string>().find("(inputs [0, 2))") != std::string::npos);

    std::cout << "PASSED" << std::endl;
}

// ============ Embeddings ============

void test_embeddings_batched_in_order() {
    std::cout << "Test: embeddings_batched_in_order... " << std::flush;

    Fixture f;
    f.upstream->onPost([](const UpstreamCall& call) { return embedding_reply(call); });

    json request = {{"model", "embed-model"}, {"input", numbered_inputs(25)}};
    auto result = f.call(request.dump(), Dialect::Embeddings);
    assert(result.status == 200);

    auto j = json::parse(result.body);
    assert(j["object"] == "list");
    assert(j["model"] == "embed-model");
    assert(j["data"].size() == 25);
    for (size_t i = 0; i < 25; ++i) {
        assert(j["data"][i]["index"] == i);
        assert(j["data"][i]["embedding"][0].get<float>() == static_cast<float>(i));
    }
    assert(j["usage"]["prompt_tokens"] == 25);

    auto calls = f.upstream->calls();
    assert(calls.size() == 3);
    std::vector<size_t> sizes;
    for (const auto& call : calls) {
        assert(call.url == "http://openai.local/v1/embeddings");
        sizes.push_back(call.body["input"].size());
    }
    std::sort(sizes.begin(), sizes.end());
    assert(sizes[0] == 5 && sizes[1] == 10 && sizes[2] == 10);

    std::cout << "PASSED" << std::endl;
}

void test_embeddings_chunk_failure() {
    std::cout << "Test: embeddings_chunk_failure... " << std::flush;

    Fixture f;
    f.upstream->onPost([](const UpstreamCall& call) {
        if (call.body["input"][0] == "text-10") {
            return UpstreamReply{500, R"({"error":{"message":"chunk exploded"}})"};
        }
        return embedding_reply(call);
    });

    json request = {{"model", "embed-model"}, {"input", numbered_inputs(30)}};
    auto result = f.call(request.dump(), Dialect::Embeddings);
    assert(result.status == 502);
    auto message = json::parse(result.body)["error"]["message"].get<std::string>();
    assert(message.find("[10, 20)") != std::string::npos);
    assert(message.find("chunk exploded") != std::string::npos);

    std::cout << "PASSED" << std::endl;
}

void test_embeddings_base64() {
    std::cout << "Test: embeddings_base64... " << std::flush;

    Fixture f;
    f.upstream->onPost([](const UpstreamCall& call) { return embedding_reply(call); });

    auto result = f.call(R"({"model": "embed-model", "input": "text-1", "encoding_format": "base64"})",
                         Dialect::Embeddings);
    assert(result.status == 200);
    auto j = json::parse(result.body);
    // [1.0, 6.0] → 00 00 80 3F 00 00 C0 40
    assert(j["data"][0]["embedding"] == "AACAPwAAwEA=");
    assert(f.upstream->calls()[0].body["encoding_format"] == "float");

    std::cout << "PASSED" << std::endl;
}

// ============ 流式 ============

void test_stream_matches_non_stream_text() {
    std::cout << "Test: stream_matches_non_stream_text... " << std::flush;

    Fixture f;
    f.upstream->onPost([](const UpstreamCall&) {
        return UpstreamReply{200, chat_completion_body("1, 2, 3, 4, 5")};
    });
    f.upstream->scriptStream(count_to_five_stream());

    auto plain = f.call(kCountChat, Dialect::ChatCompletions);
    std::string plain_text = json::parse(plain.body)["choices"][0]["message"]["content"].get<std::string>();

    auto streamed = f.call(kCountChatStream, Dialect::ChatCompletions);
    assert(streamed.status == 200);
    assert(streamed.is_stream());
    assert(streamed.content_type == "text/event-stream");

    std::string frames = drain_frames(*streamed.stream);
    assert(chat_stream_text(frames) == plain_text);

    // 恰好一个 [DONE]，且在最后
    assert(frames.find("data: [DONE]") == frames.rfind("data: [DONE]"));
    assert(frames.size() >= 14 && frames.substr(frames.size() - 14) == "data: [DONE]\n\n");

    auto calls = f.upstream->calls();
    assert(calls.back().stream);
    assert(calls.back().body["stream"] == true);

    std::cout << "PASSED" << std::endl;
}

void test_responses_stream_from_chat_upstream() {
    std::cout << "Test: responses_stream_from_chat_upstream... " << std::flush;

    Fixture f;
    f.upstream->scriptStream(count_to_five_stream());

    auto streamed = f.call(R"({"model": "chat-model", "input": "Count to 5", "stream": true})",
                           Dialect::Responses);
    assert(streamed.is_stream());

    std::string frames = drain_frames(*streamed.stream);
    assert(responses_stream_text(frames) == "1, 2, 3, 4, 5");
    assert(frames.find("event: response.created") != std::string::npos);
    assert(frames.find("event: response.completed") != std::string::npos);
    assert(frames.find("event: response.created") < frames.find("event: response.output_text.delta"));

    std::cout << "PASSED" << std::endl;
}

void test_stream_upstream_error_is_plain_response() {
    std::cout << "Test: stream_upstream_error_is_plain_response... " << std::flush;

    Fixture f;
    StreamScript script;
    script.status = 503;
    script.error_body = R"({"error":{"message":"no capacity"}})";
    f.upstream->scriptStream(script);

    auto result = f.call(kCountChatStream, Dialect::ChatCompletions);
    assert(!result.is_stream());
    assert(result.status == 502);
    assert(result.body.find("no capacity") != std::string::npos);

    std::cout << "PASSED" << std::endl;
}

void test_stream_interrupted_frame() {
    std::cout << "Test: stream_interrupted_frame... " << std::flush;

    Fixture f;
    StreamScript script;
    script.chunks = {chat_chunk("partial")};
    script.drop_after_chunks = true;
    f.upstream->scriptStream(script);

    auto result = f.call(kCountChatStream, Dialect::ChatCompletions);
    assert(result.is_stream());
    std::string frames = drain_frames(*result.stream);

    assert(chat_stream_text(frames) == "partial");
    auto error_pos = frames.find("upstream_interrupted");
    assert(error_pos != std::string::npos);
    assert(error_pos < frames.find("data: [DONE]"));

    std::cout << "PASSED" << std::endl;
}

void test_stream_frame_with_invalid_bytes() {
    std::cout << "Test: stream_frame_with_invalid_bytes... " << std::flush;

    for (Dialect dialect : {Dialect::ChatCompletions, Dialect::Responses}) {
        Fixture f;
        StreamScript script;
        script.chunks = {chat_chunk("hi"), "data: \xff\xfe garbage\n\n", "data: [DONE]\n\n"};
        f.upstream->scriptStream(script);

        auto result = dialect == Dialect::ChatCompletions
            ? f.call(R"({"model": "chat-model", "messages": [{"role": "user", "content": "hi"}], "stream": true})",
                     dialect)
            : f.call(R"({"model": "chat-model", "input": "hi", "stream": true})", dialect);
        assert(result.is_stream());

        std::string frames = drain_frames(*result.stream);
        assert(frames.find("data: [DONE]") != std::string::npos);
        assert(frames.find("data: [DONE]") == frames.rfind("data: [DONE]"));
        assert(frames.find("garbage") != std::string::npos);
        if (dialect == Dialect::ChatCompletions) {
            assert(chat_stream_text(frames) == "hi");
        } else {
            assert(responses_stream_text(frames) == "hi");
        }
    }

    std::cout << "PASSED" << std::endl;
}

void test_client_stream_cancel() {
    std::cout << "Test: client_stream_cancel... " << std::flush;

    Fixture f;
    StreamScript script;
    for (int i = 0; i < 200; ++i) {
        script.chunks.push_back(chat_chunk("x"));
    }
    script.chunk_delay = std::chrono::milliseconds(5);
    f.upstream->scriptStream(script);

    auto result = f.call(kCountChatStream, Dialect::ChatCompletions);
    assert(result.is_stream());

    int frames = 0;
    while (frames < 2) {
        if (result.stream->next_frame(std::chrono::milliseconds(500))) {
            frames++;
        }
    }
    result.stream->cancel();

    assert(result.stream->finished());
    assert(result.stream->proxy().state() == ProxyState::Closed);
    assert(f.upstream->chunksDelivered() < 200);

    std::cout << "PASSED" << std::endl;
}

// ============ 钩子 ============

class RecordingHook : public RequestHook {
public:
    std::string name() const override { return "recording"; }

    void before_request(CanonicalRequest& request, const ModelRoute& route) override {
        std::lock_guard<std::mutex> lock(mutex);
        providers.push_back(route.provider_id);
        for (const auto& message : request.messages) {
            if (message.content == "forbidden") {
                throw GatewayError::bad_request("request blocked by policy", "messages");
            }
        }
        request.temperature = 0.25;
    }

    void after_response(const CanonicalRequest&, CanonicalResponse& response) override {
        for (auto& block : response.output) {
            block.text += " [checked]";
        }
    }

    void on_stream_event(const CanonicalRequest&, StreamEvent& event) override {
        if (event.type == StreamEventType::TextDelta) {
            event.text = "<" + event.text + ">";
        }
    }

    void on_error(Dialect, const GatewayError& error) override {
        std::lock_guard<std::mutex> lock(mutex);
        errors.push_back(error.kind());
    }

    std::mutex mutex;
    std::vector<std::string> providers;
    std::vector<ErrorKind> errors;
};

// on_error 抛异常不影响错误响应
class ThrowingErrorHook : public RequestHook {
public:
    std::string name() const override { return "throwing"; }

    void on_error(Dialect, const GatewayError&) override {
        throw std::runtime_error("hook failure");
    }
};

void test_request_hooks() {
    std::cout << "Test: request_hooks... " << std::flush;

    Fixture f;
    auto hook = std::make_shared<RecordingHook>();
    f.dispatcher->addHook(std::make_shared<ThrowingErrorHook>());
    f.dispatcher->addHook(hook);
    assert(f.dispatcher->hooks().size() == 2);

    f.upstream->onPost([](const UpstreamCall&) {
        return UpstreamReply{200, chat_completion_body("1, 2, 3, 4, 5")};
    });

    // before_request 改写发往上游的请求，after_response 改写响应
    auto result = f.call(kCountChat, Dialect::ChatCompletions);
    assert(result.status == 200);
    auto j = json::parse(result.body);
    assert(j["choices"][0]["message"]["content"] == "1, 2, 3, 4, 5 [checked]");
    assert(f.upstream->calls().back().body["temperature"] == 0.25);
    assert(hook->providers.back() == "openai");

    // before_request 拒绝的请求不会触达上游
    size_t calls_before = f.upstream->callCount();
    auto blocked = f.call(R"({"model": "chat-model", "messages": [{"role": "user", "content": "forbidden"}]})",
                          Dialect::ChatCompletions);
    assert(blocked.status == 400);
    assert(json::parse(blocked.body)["error"]["message"] == "request blocked by policy");
    assert(f.upstream->callCount() == calls_before);

    // 每个错误通知一次
    auto missing = f.call(R"({"model": "nope", "messages": [{"role": "user", "content": "hi"}]})",
                          Dialect::ChatCompletions);
    assert(missing.status == 404);
    auto invalid = f.call("not json", Dialect::ChatCompletions);
    assert(invalid.status == 400);
    assert((hook->errors == std::vector<ErrorKind>{ErrorKind::BadRequest, ErrorKind::NotFound,
                                                  ErrorKind::BadRequest}));

    // 流式事件经过 on_stream_event
    f.upstream->scriptStream(count_to_five_stream());
    auto streamed = f.call(kCountChatStream, Dialect::ChatCompletions);
    assert(streamed.is_stream());
    std::string frames = drain_frames(*streamed.stream);
    assert(chat_stream_text(frames) == "<1><, 2><, 3><, 4><, 5>");
    assert(frames.find("data: [DONE]") == frames.rfind("data: [DONE]"));

    bool threw = false;
    try {
        f.dispatcher->addHook(nullptr);
    } catch (const GatewayError& e) {
        threw = e.kind() == ErrorKind::BadRequest;
    }
    assert(threw);

    std::cout << "PASSED" << std::endl;
}

void test_load_balanced_model() {
    std::cout << "Test: load_balanced_model... " << std::flush;

    Fixture f;
    ModelRoute second = f.registry->backends("chat-model").front();
    second.provider_id = "backup";
    second.endpoint_url = "http://backup.local/v1";
    f.registry->addRoute(second);

    f.upstream->onPost([](const UpstreamCall&) {
        return UpstreamReply{200, chat_completion_body("ok")};
    });
    for (int i = 0; i < 4; ++i) {
        auto result = f.call(kCountChat, Dialect::ChatCompletions);
        assert(result.status == 200);
        // 客户端看到的模型名与选中的上游无关
        assert(json::parse(result.body)["model"] == "chat-model");
    }

    auto calls = f.upstream->calls();
    assert(calls.size() == 4);
    assert(calls[0].url == "http://openai.local/v1/chat/completions");
    assert(calls[1].url == "http://backup.local/v1/chat/completions");
    assert(calls[2].url == "http://openai.local/v1/chat/completions");
    assert(calls[3].url == "http://backup.local/v1/chat/completions");

    std::cout << "PASSED" << std::endl;
}

int main() {
    std::cout << "=== Dispatcher Tests ===" << std::endl;

    test_unknown_model_never_reaches_upstream();
    test_bad_requests();
    test_cancelled_before_dispatch();

    test_chat_to_chat_upstream();
    test_responses_client_to_chat_upstream();
    test_chat_client_to_responses_upstream();
    test_upstream_failures_map_to_502();
    test_handler_exception_is_internal();
    test_upstream_error_body_cut_inside_multibyte_char();

    test_embeddings_batched_in_order();
    test_embeddings_chunk_failure();
    test_embeddings_base64();

    test_stream_matches_non_stream_text();
    test_responses_stream_from_chat_upstream();
    test_stream_upstream_error_is_plain_response();
    test_stream_interrupted_frame();
    test_stream_frame_with_invalid_bytes();
    test_client_stream_cancel();

    test_request_hooks();
    test_load_balanced_model();

    std::cout << "\nAll tests PASSED!" << std::endl;
    return 0;
}
