#include "ai_gateway/dialect/chat_completions.hpp"
#include "ai_gateway/core/errors.hpp"
#include "ai_gateway/core/utf8.hpp"

#include <set>

namespace ai_gateway {

namespace {

const std::set<std::string> kChatCoreFields = {"model", "messages", "temperature", "stream"};

} // namespace

// ============ 客户端方向 ============

CanonicalRequest ChatCompletionsAdapter::decode(const nlohmann::json& payload) const {
    detail::require_object(payload);

    CanonicalRequest request;
    request.dialect = Dialect::ChatCompletions;
    request.model = detail::require_model(payload);

    auto messages = payload.find("messages");
    if (messages == payload.end() || !messages->is_array()) {
        throw GatewayError::bad_request("'messages' must be an array of messages", "messages");
    }
    if (messages->empty()) {
        throw GatewayError::bad_request("'messages' must contain at least one message", "messages");
    }

    for (size_t i = 0; i < messages->size(); ++i) {
        const auto& message = (*messages)[i];
        const std::string where = "messages[" + std::to_string(i) + "]";
        if (!message.is_object()) {
            throw GatewayError::bad_request(where + " must be an object", "messages");
        }
        auto role = message.find("role");
        if (role == message.end() || !role->is_string()) {
            throw GatewayError::bad_request(where + ".role must be a string", "messages");
        }

        ChatMessage canonical;
        canonical.role = role->get<std::string>();
        auto content = message.find("content");
        if (content != message.end()) {
            canonical.content = detail::content_text(*content, where + ".content");
        }
        request.messages.push_back(std::move(canonical));
    }

    request.temperature = detail::read_temperature(payload);
    request.stream = detail::read_stream(payload);

    for (const auto& item : payload.items()) {
        if (kChatCoreFields.count(item.key()) == 0) {
            request.extra_options[item.key()] = item.value();
        }
    }
    return request;
}

nlohmann::json ChatCompletionsAdapter::encode(const CanonicalRequest& request,
                                              const CanonicalResponse& response) const {
    nlohmann::json j;
    j["id"] = response.id.empty() ? detail::generate_id("chatcmpl") : response.id;
    j["object"] = "chat.completion";
    j["created"] = response.created ? response.created : detail::now_seconds();
    j["model"] = response.model.empty() ? request.model : response.model;

    j["choices"] = nlohmann::json::array();
    for (size_t i = 0; i < response.output.size(); ++i) {
        const auto& block = response.output[i];
        nlohmann::json choice;
        choice["index"] = i;
        choice["message"]["role"] = block.role.empty() ? "assistant" : block.role;
        choice["message"]["content"] = block.text;
        choice["logprobs"] = nullptr;
        choice["finish_reason"] = block.finish_reason.empty() ? "stop" : block.finish_reason;
        j["choices"].push_back(choice);
    }
    if (j["choices"].empty()) {
        nlohmann::json choice;
        choice["index"] = 0;
        choice["message"]["role"] = "assistant";
        choice["message"]["content"] = "";
        choice["logprobs"] = nullptr;
        choice["finish_reason"] = "stop";
        j["choices"].push_back(choice);
    }

    if (response.usage) {
        j["usage"] = detail::chat_usage_json(*response.usage);
    }
    return j;
}

std::unique_ptr<StreamEncoder> ChatCompletionsAdapter::stream_encoder(const CanonicalRequest& request) const {
    return std::make_unique<ChatCompletionsStreamEncoder>(request.model);
}

// ============ 上游方向 ============

nlohmann::json ChatCompletionsAdapter::encode_request(const CanonicalRequest& request,
                                                      const std::string& upstream_model) const {
    nlohmann::json body;
    body["model"] = upstream_model;
    body["messages"] = nlohmann::json::array();
    for (const auto& message : request.messages) {
        body["messages"].push_back({{"role", message.role}, {"content", message.content}});
    }
    if (request.temperature) {
        body["temperature"] = *request.temperature;
    }
    body["stream"] = request.stream;

    if (request.dialect == Dialect::ChatCompletions) {
        for (const auto& item : request.extra_options.items()) {
            if (item.key() == "stream_options" && !request.stream) {
                continue;
            }
            body[item.key()] = item.value();
        }
        return body;
    }

    // 其他方言的请求只透传 chat 认识的参数
    detail::copy_options(request.extra_options, body,
                         {"top_p", "stop", "presence_penalty", "frequency_penalty",
                          "seed", "user", "tools", "tool_choice", "parallel_tool_calls",
                          "metadata"});
    if (request.extra_options.contains("max_output_tokens")) {
        body["max_tokens"] = request.extra_options["max_output_tokens"];
    }
    return body;
}

CanonicalResponse ChatCompletionsAdapter::decode_response(const nlohmann::json& payload) const {
    if (!payload.is_object()) {
        throw GatewayError::upstream("upstream returned a malformed chat completion");
    }
    auto choices = payload.find("choices");
    if (choices == payload.end() || !choices->is_array()) {
        throw GatewayError::upstream("upstream chat completion has no 'choices'",
                                     truncate_utf8(dump_json(payload), 512));
    }

    try {
        CanonicalResponse response;
        response.id = payload.value("id", "");
        response.model = payload.value("model", "");
        response.created = payload.value("created", int64_t(0));
        response.status = ResponseStatus::Completed;

        for (size_t i = 0; i < choices->size(); ++i) {
            const auto& choice = (*choices)[i];
            if (!choice.is_object()) {
                throw GatewayError::upstream("upstream chat completion has a malformed choice");
            }
            ContentBlock block;
            block.index = choice.value("index", i);
            auto message = choice.find("message");
            if (message != choice.end() && message->is_object()) {
                block.role = message->value("role", "assistant");
                auto content = message->find("content");
                if (content != message->end()) {
                    block.text = detail::content_text(*content, "choices.message.content");
                }
            }
            auto finish = choice.find("finish_reason");
            if (finish != choice.end() && finish->is_string()) {
                block.finish_reason = finish->get<std::string>();
            }
            response.output.push_back(std::move(block));
        }

        auto usage = payload.find("usage");
        if (usage != payload.end()) {
            response.usage = detail::read_usage(*usage);
        }
        return response;
    } catch (const nlohmann::json::exception& e) {
        throw GatewayError::upstream("upstream returned a malformed chat completion", e.what());
    } catch (const GatewayError& e) {
        if (e.kind() == ErrorKind::BadRequest) {
            throw GatewayError::upstream("upstream returned malformed message content", e.what());
        }
        throw;
    }
}

std::unique_ptr<StreamDecoder> ChatCompletionsAdapter::stream_decoder() const {
    return std::make_unique<ChatCompletionsStreamDecoder>();
}

// ============ ChatCompletionsStreamEncoder ============

ChatCompletionsStreamEncoder::ChatCompletionsStreamEncoder(std::string model)
    : id_(detail::generate_id("chatcmpl"))
    , model_(std::move(model))
    , created_(detail::now_seconds())
{}

nlohmann::json ChatCompletionsStreamEncoder::make_chunk(const nlohmann::json& delta,
                                                        const nlohmann::json& finish_reason) const {
    nlohmann::json j;
    j["id"] = id_;
    j["object"] = "chat.completion.chunk";
    j["created"] = created_;
    j["model"] = model_;

    nlohmann::json choice;
    choice["index"] = 0;
    choice["delta"] = delta;
    choice["logprobs"] = nullptr;
    choice["finish_reason"] = finish_reason;
    j["choices"] = nlohmann::json::array({choice});
    return j;
}

std::string ChatCompletionsStreamEncoder::encode(const StreamEvent& event) {
    switch (event.type) {
        case StreamEventType::Started: {
            role_sent_ = true;
            nlohmann::json delta = {{"role", "assistant"}, {"content", ""}};
            return detail::sse_data(make_chunk(delta, nullptr));
        }
        case StreamEventType::TextDelta: {
            nlohmann::json delta = {{"content", event.text}};
            if (!role_sent_) {
                delta["role"] = "assistant";
                role_sent_ = true;
            }
            return detail::sse_data(make_chunk(delta, nullptr));
        }
        case StreamEventType::Finished: {
            if (event.finish_reason.empty()) {
                if (!event.usage) {
                    return "";
                }
                // include_usage 的末尾 chunk：choices 为空
                nlohmann::json j = make_chunk(nlohmann::json::object(), nullptr);
                j["choices"] = nlohmann::json::array();
                j["usage"] = detail::chat_usage_json(*event.usage);
                return detail::sse_data(j);
            }
            nlohmann::json j = make_chunk(nlohmann::json::object(), event.finish_reason);
            if (event.usage) {
                j["usage"] = detail::chat_usage_json(*event.usage);
            }
            return detail::sse_data(j);
        }
        case StreamEventType::Error:
        case StreamEventType::Interrupted:
            return detail::sse_data(ErrorEncoder::to_json(event.error_kind, event.error_message));
        case StreamEventType::Unknown: {
            nlohmann::json j;
            j["type"] = "unknown";
            j["event"] = event.name;
            j["data"] = event.payload;
            return detail::sse_data(j);
        }
        case StreamEventType::Done:
            return "data: [DONE]\n\n";
    }
    return "";
}

// ============ ChatCompletionsStreamDecoder ============

std::vector<StreamEvent> ChatCompletionsStreamDecoder::decode(const SseEvent& sse) {
    std::vector<StreamEvent> out;
    if (sse.done) {
        completed_ = true;
        return out;
    }

    const std::string name = sse.event.empty() ? "message" : sanitize_utf8(sse.event);
    auto j = nlohmann::json::parse(sse.data, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        // 原样透传，非法字节替换掉
        out.push_back(StreamEvent::Unknown(name, sanitize_utf8(sse.data)));
        return out;
    }

    // 部分上游在正常分片里带 "error": null
    auto error = j.find("error");
    if (error != j.end() && !error->is_null()) {
        out.push_back(StreamEvent::Error(ErrorKind::UpstreamError, detail::upstream_error_message(j)));
        completed_ = true;
        return out;
    }

    auto choices = j.find("choices");
    auto usage_it = j.find("usage");
    std::optional<Usage> usage;
    if (usage_it != j.end()) {
        usage = detail::read_usage(*usage_it);
    }
    bool has_choices = choices != j.end() && choices->is_array() && !choices->empty();

    if (!has_choices && !usage) {
        out.push_back(StreamEvent::Unknown(name, j));
        return out;
    }

    if (!started_) {
        started_ = true;
        out.push_back(StreamEvent::Started());
    }

    if (has_choices) {
        const auto& choice = (*choices)[0];
        auto delta = choice.find("delta");
        if (delta != choice.end() && delta->is_object()) {
            auto content = delta->find("content");
            if (content != delta->end() && content->is_string() &&
                !content->get<std::string>().empty()) {
                out.push_back(StreamEvent::TextDelta(content->get<std::string>()));
            }
        }
        auto finish = choice.find("finish_reason");
        if (finish != choice.end() && finish->is_string()) {
            out.push_back(StreamEvent::Finished(finish->get<std::string>(), usage));
            completed_ = true;
            return out;
        }
    }

    if (usage && !has_choices) {
        out.push_back(StreamEvent::Finished("", usage));
    }
    return out;
}

} // namespace ai_gateway
