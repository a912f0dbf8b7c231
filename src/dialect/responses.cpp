#include "ai_gateway/dialect/responses.hpp"
#include "ai_gateway/core/errors.hpp"
#include "ai_gateway/core/utf8.hpp"

#include <set>

namespace ai_gateway {

namespace {

const std::set<std::string> kResponsesCoreFields = {
    "model", "input", "instructions", "temperature", "stream"
};

// 网关自己合成的生命周期事件，上游的同名事件直接丢弃
const std::set<std::string> kSynthesizedEvents = {
    "response.in_progress",
    "response.output_item.added",
    "response.content_part.added",
    "response.output_text.done",
    "response.content_part.done",
    "response.output_item.done"
};

bool has_prefix(const std::string& value, const std::string& prefix) {
    return value.compare(0, prefix.size(), prefix) == 0;
}

// finish_reason → incomplete_details.reason，正常结束返回空串
std::string incomplete_reason_for(const std::string& finish_reason) {
    if (finish_reason == "length") {
        return "max_output_tokens";
    }
    if (finish_reason == "content_filter") {
        return "content_filter";
    }
    return "";
}

std::string incomplete_reason_for(const CanonicalResponse& response) {
    for (const auto& block : response.output) {
        std::string reason = incomplete_reason_for(block.finish_reason);
        if (!reason.empty()) {
            return reason;
        }
    }
    return response.status == ResponseStatus::Incomplete ? "max_output_tokens" : "";
}

// 未完成的 response 对象 → finish_reason
std::string finish_reason_for(const nlohmann::json& response) {
    auto details = response.find("incomplete_details");
    if (details != response.end() && details->is_object()) {
        auto reason = details->find("reason");
        if (reason != details->end() && reason->is_string() && reason->get<std::string>() == "content_filter") {
            return "content_filter";
        }
    }
    return "length";
}

ChatMessage decode_input_item(const nlohmann::json& item, size_t index) {
    const std::string where = "input[" + std::to_string(index) + "]";
    if (item.is_string()) {
        return ChatMessage{"user", item.get<std::string>()};
    }
    if (!item.is_object()) {
        throw GatewayError::bad_request(where + " must be an object", "input");
    }

    std::string type = item.value("type", "message");
    if (type != "message") {
        throw GatewayError::bad_request(where + " has unsupported item type: " + type, "input");
    }
    auto role = item.find("role");
    if (role == item.end() || !role->is_string()) {
        throw GatewayError::bad_request(where + ".role must be a string", "input");
    }

    ChatMessage message;
    message.role = role->get<std::string>();
    auto content = item.find("content");
    if (content != item.end()) {
        message.content = detail::content_text(*content, where + ".content");
    }
    return message;
}

} // namespace

// ============ 客户端方向 ============

CanonicalRequest ResponsesAdapter::decode(const nlohmann::json& payload) const {
    detail::require_object(payload);

    CanonicalRequest request;
    request.dialect = Dialect::Responses;
    request.model = detail::require_model(payload);

    auto instructions = payload.find("instructions");
    if (instructions != payload.end() && !instructions->is_null()) {
        if (!instructions->is_string()) {
            throw GatewayError::bad_request("'instructions' must be a string", "instructions");
        }
        if (!instructions->get<std::string>().empty()) {
            request.messages.push_back({"system", instructions->get<std::string>()});
        }
    }

    auto input = payload.find("input");
    if (input == payload.end() || input->is_null()) {
        throw GatewayError::bad_request("Missing 'input' field", "input");
    }
    if (input->is_string()) {
        request.messages.push_back({"user", input->get<std::string>()});
    } else if (input->is_array()) {
        if (input->empty()) {
            throw GatewayError::bad_request("'input' must not be empty", "input");
        }
        for (size_t i = 0; i < input->size(); ++i) {
            request.messages.push_back(decode_input_item((*input)[i], i));
        }
    } else {
        throw GatewayError::bad_request("'input' must be a string or an array of input items", "input");
    }

    request.temperature = detail::read_temperature(payload);
    request.stream = detail::read_stream(payload);

    for (const auto& item : payload.items()) {
        if (kResponsesCoreFields.count(item.key()) == 0) {
            request.extra_options[item.key()] = item.value();
        }
    }
    if (!request.extra_options.contains("truncation")) {
        request.extra_options["truncation"] = "auto";
    }
    return request;
}

nlohmann::json ResponsesAdapter::encode(const CanonicalRequest& request,
                                        const CanonicalResponse& response) const {
    const std::string id = has_prefix(response.id, "resp_")
        ? response.id : detail::generate_id("resp", "_");
    const int64_t created = response.created ? response.created : detail::now_seconds();

    const std::string incomplete = incomplete_reason_for(response);
    const ResponseStatus status = incomplete.empty() ? response.status : ResponseStatus::Incomplete;

    nlohmann::json j;
    j["id"] = id;
    j["object"] = "response";
    j["created_at"] = created;
    j["status"] = response_status_name(status);
    j["completed_at"] = status == ResponseStatus::Completed
        ? nlohmann::json(detail::now_seconds()) : nlohmann::json(nullptr);
    j["error"] = nullptr;
    j["incomplete_details"] = incomplete.empty()
        ? nlohmann::json(nullptr) : nlohmann::json{{"reason", incomplete}};
    j["model"] = response.model.empty() ? request.model : response.model;

    j["output"] = nlohmann::json::array();
    for (size_t i = 0; i < response.output.size(); ++i) {
        const auto& block = response.output[i];
        nlohmann::json part;
        part["type"] = "output_text";
        part["text"] = block.text;
        part["annotations"] = nlohmann::json::array();

        nlohmann::json item;
        item["id"] = "msg_" + id.substr(5) + "_" + std::to_string(i);
        item["type"] = "message";
        item["status"] = incomplete_reason_for(block.finish_reason).empty() ? "completed" : "incomplete";
        item["role"] = block.role.empty() ? "assistant" : block.role;
        item["content"] = nlohmann::json::array({part});
        j["output"].push_back(item);
    }

    if (request.temperature) {
        j["temperature"] = *request.temperature;
    }
    j["usage"] = response.usage
        ? detail::responses_usage_json(*response.usage) : nlohmann::json(nullptr);
    return j;
}

std::unique_ptr<StreamEncoder> ResponsesAdapter::stream_encoder(const CanonicalRequest& request) const {
    return std::make_unique<ResponsesStreamEncoder>(request.model);
}

// ============ 上游方向 ============

nlohmann::json ResponsesAdapter::encode_request(const CanonicalRequest& request,
                                                const std::string& upstream_model) const {
    nlohmann::json body;
    body["model"] = upstream_model;
    body["input"] = nlohmann::json::array();
    for (const auto& message : request.messages) {
        body["input"].push_back({
            {"type", "message"},
            {"role", message.role},
            {"content", message.content}
        });
    }
    if (request.temperature) {
        body["temperature"] = *request.temperature;
    }
    body["stream"] = request.stream;

    if (request.dialect == Dialect::Responses) {
        for (const auto& item : request.extra_options.items()) {
            body[item.key()] = item.value();
        }
        return body;
    }

    detail::copy_options(request.extra_options, body,
                         {"top_p", "user", "tools", "tool_choice", "parallel_tool_calls",
                          "metadata"});
    if (request.extra_options.contains("max_completion_tokens")) {
        body["max_output_tokens"] = request.extra_options["max_completion_tokens"];
    } else if (request.extra_options.contains("max_tokens")) {
        body["max_output_tokens"] = request.extra_options["max_tokens"];
    }
    return body;
}

CanonicalResponse ResponsesAdapter::decode_response(const nlohmann::json& payload) const {
    if (!payload.is_object()) {
        throw GatewayError::upstream("upstream returned a malformed response object");
    }
    auto output = payload.find("output");
    if (output == payload.end() || !output->is_array()) {
        throw GatewayError::upstream("upstream response has no 'output'",
                                     truncate_utf8(dump_json(payload), 512));
    }

    try {
        const std::string status = payload.value("status", "completed");
        if (status == "failed" || status == "cancelled") {
            auto error = payload.find("error");
            std::string message = "upstream response " + status;
            if (error != payload.end() && error->is_object()) {
                message += ": " + error->value("message", "");
            }
            throw GatewayError::upstream(message);
        }

        CanonicalResponse response;
        response.id = payload.value("id", "");
        response.model = payload.value("model", "");
        response.created = payload.value("created_at", int64_t(0));
        if (status == "in_progress" || status == "queued") {
            response.status = ResponseStatus::InProgress;
        } else if (status == "incomplete") {
            response.status = ResponseStatus::Incomplete;
        } else {
            response.status = ResponseStatus::Completed;
        }
        const std::string finish_reason = status == "incomplete"
            ? finish_reason_for(payload) : "stop";

        for (const auto& item : *output) {
            if (!item.is_object() || item.value("type", "") != "message") {
                continue;  // reasoning / tool call 等条目不映射为文本
            }
            ContentBlock block;
            block.role = item.value("role", "assistant");
            block.finish_reason = finish_reason;
            block.index = response.output.size();
            auto content = item.find("content");
            if (content != item.end() && content->is_array()) {
                for (const auto& part : *content) {
                    if (part.is_object() && part.value("type", "") == "output_text") {
                        block.text += part.value("text", "");
                    }
                }
            }
            response.output.push_back(std::move(block));
        }

        auto usage = payload.find("usage");
        if (usage != payload.end()) {
            response.usage = detail::read_usage(*usage);
        }
        return response;
    } catch (const nlohmann::json::exception& e) {
        throw GatewayError::upstream("upstream returned a malformed response object", e.what());
    }
}

std::unique_ptr<StreamDecoder> ResponsesAdapter::stream_decoder() const {
    return std::make_unique<ResponsesStreamDecoder>();
}

// ============ ResponsesStreamEncoder ============

ResponsesStreamEncoder::ResponsesStreamEncoder(std::string model)
    : response_id_(detail::generate_id("resp", "_"))
    , item_id_(detail::generate_id("msg", "_"))
    , model_(std::move(model))
    , created_at_(detail::now_seconds())
{}

std::string ResponsesStreamEncoder::emit(const std::string& type, nlohmann::json body) {
    body["type"] = type;
    body["sequence_number"] = ++sequence_;
    return detail::sse_event(type, body);
}

nlohmann::json ResponsesStreamEncoder::text_part() const {
    nlohmann::json part;
    part["type"] = "output_text";
    part["text"] = text_;
    part["annotations"] = nlohmann::json::array();
    return part;
}

nlohmann::json ResponsesStreamEncoder::message_item(const char* status) const {
    nlohmann::json item;
    item["id"] = item_id_;
    item["type"] = "message";
    item["status"] = status;
    item["role"] = "assistant";
    item["content"] = nlohmann::json::array();
    return item;
}

nlohmann::json ResponsesStreamEncoder::response_object(const char* status) const {
    nlohmann::json r;
    r["id"] = response_id_;
    r["object"] = "response";
    r["created_at"] = created_at_;
    r["status"] = status;
    r["model"] = model_;
    r["output"] = nlohmann::json::array();
    r["usage"] = nullptr;
    return r;
}

std::string ResponsesStreamEncoder::open_frames() {
    if (opened_) {
        return "";
    }
    opened_ = true;

    std::string frames;
    frames += emit("response.created", {{"response", response_object("in_progress")}});
    frames += emit("response.in_progress", {{"response", response_object("in_progress")}});
    frames += emit("response.output_item.added", {
        {"output_index", 0},
        {"item", message_item("in_progress")}
    });
    frames += emit("response.content_part.added", {
        {"item_id", item_id_},
        {"output_index", 0},
        {"content_index", 0},
        {"part", text_part()}
    });
    return frames;
}

std::string ResponsesStreamEncoder::completion_frames() {
    std::string frames = open_frames();

    frames += emit("response.output_text.done", {
        {"item_id", item_id_},
        {"output_index", 0},
        {"content_index", 0},
        {"text", text_},
        {"logprobs", nlohmann::json::array()}
    });
    frames += emit("response.content_part.done", {
        {"item_id", item_id_},
        {"output_index", 0},
        {"content_index", 0},
        {"part", text_part()}
    });

    const bool incomplete = !incomplete_reason_.empty();
    const char* status = incomplete ? "incomplete" : "completed";

    nlohmann::json item = message_item(status);
    item["content"] = nlohmann::json::array({text_part()});
    frames += emit("response.output_item.done", {
        {"output_index", 0},
        {"item", item}
    });

    nlohmann::json response = response_object(status);
    if (incomplete) {
        response["completed_at"] = nullptr;
        response["incomplete_details"] = {{"reason", incomplete_reason_}};
    } else {
        response["completed_at"] = detail::now_seconds();
    }
    response["output"] = nlohmann::json::array({item});
    if (usage_) {
        response["usage"] = detail::responses_usage_json(*usage_);
    }
    frames += emit(incomplete ? "response.incomplete" : "response.completed", {{"response", response}});
    return frames;
}

std::string ResponsesStreamEncoder::encode(const StreamEvent& event) {
    switch (event.type) {
        case StreamEventType::Started:
            return open_frames();
        case StreamEventType::TextDelta: {
            std::string frames = open_frames();
            text_ += event.text;
            frames += emit("response.output_text.delta", {
                {"item_id", item_id_},
                {"output_index", 0},
                {"content_index", 0},
                {"delta", event.text},
                {"logprobs", nlohmann::json::array()}
            });
            return frames;
        }
        case StreamEventType::Finished:
            // 完成帧推迟到 Done，chat 上游的 usage 可能在 finish_reason 之后才到
            if (event.usage) {
                usage_ = event.usage;
            }
            if (!event.finish_reason.empty()) {
                incomplete_reason_ = incomplete_reason_for(event.finish_reason);
            }
            return "";
        case StreamEventType::Error:
        case StreamEventType::Interrupted: {
            failed_ = true;
            return emit("error", {
                {"code", error_code(event.error_kind)},
                {"message", event.error_message},
                {"param", nullptr}
            });
        }
        case StreamEventType::Unknown:
            return emit("unknown", {{"event", event.name}, {"data", event.payload}});
        case StreamEventType::Done: {
            std::string frames = failed_ ? std::string() : completion_frames();
            return frames + "data: [DONE]\n\n";
        }
    }
    return "";
}

// ============ ResponsesStreamDecoder ============

std::vector<StreamEvent> ResponsesStreamDecoder::decode(const SseEvent& sse) {
    std::vector<StreamEvent> out;
    if (sse.done) {
        completed_ = true;
        return out;
    }

    auto j = nlohmann::json::parse(sse.data, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        out.push_back(StreamEvent::Unknown(sse.event.empty() ? "message" : sanitize_utf8(sse.event),
                                           sanitize_utf8(sse.data)));
        return out;
    }

    std::string type = sanitize_utf8(sse.event);
    auto type_it = j.find("type");
    if (type_it != j.end() && type_it->is_string()) {
        type = type_it->get<std::string>();
    }

    auto ensure_started = [this, &out]() {
        if (!started_) {
            started_ = true;
            out.push_back(StreamEvent::Started());
        }
    };

    if (type == "response.created") {
        ensure_started();
    } else if (kSynthesizedEvents.count(type) > 0) {
        // 丢弃
    } else if (type == "response.output_text.delta") {
        ensure_started();
        auto delta = j.find("delta");
        if (delta != j.end() && delta->is_string() && !delta->get<std::string>().empty()) {
            out.push_back(StreamEvent::TextDelta(delta->get<std::string>()));
        }
    } else if (type == "response.completed" || type == "response.incomplete") {
        ensure_started();
        std::optional<Usage> usage;
        std::string finish_reason = "stop";
        auto response = j.find("response");
        if (response != j.end() && response->is_object()) {
            if (response->contains("usage")) {
                usage = detail::read_usage((*response)["usage"]);
            }
            if (type == "response.incomplete") {
                finish_reason = finish_reason_for(*response);
            }
        } else if (type == "response.incomplete") {
            finish_reason = "length";
        }
        out.push_back(StreamEvent::Finished(finish_reason, usage));
        completed_ = true;
    } else if (type == "response.failed" || type == "error") {
        std::string message = "upstream response failed";
        auto response = j.find("response");
        if (response != j.end() && response->is_object()) {
            message = detail::upstream_error_message(*response);
        } else if (j.contains("message") && j["message"].is_string()) {
            message = j["message"].get<std::string>();
        } else if (j.contains("error")) {
            message = detail::upstream_error_message(j);
        }
        out.push_back(StreamEvent::Error(ErrorKind::UpstreamError, message));
        completed_ = true;
    } else {
        out.push_back(StreamEvent::Unknown(type.empty() ? "message" : type, j));
    }
    return out;
}

} // namespace ai_gateway
