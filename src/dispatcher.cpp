#include "ai_gateway/dispatcher.hpp"
#include "ai_gateway/core/utf8.hpp"

#include <spdlog/spdlog.h>

namespace ai_gateway {

// ============ ClientStream ============

ClientStream::ClientStream(std::shared_ptr<StreamingProxy> proxy, std::unique_ptr<StreamEncoder> encoder,
                           EventFilter filter)
    : proxy_(std::move(proxy))
    , encoder_(std::move(encoder))
    , filter_(std::move(filter))
{}

std::optional<std::string> ClientStream::next_frame(std::chrono::milliseconds wait) {
    if (done_) {
        return std::nullopt;
    }
    auto event = proxy_->next(wait);
    if (!event) {
        return std::nullopt;
    }
    if (event->is_done()) {
        done_ = true;
    }
    try {
        if (filter_ && !event->is_done()) {
            filter_(*event);
        }
        return encoder_->encode(*event);
    } catch (const std::exception& e) {
        // 单个事件出错只丢弃该事件，终止标记必须写出
        spdlog::error("stream event {} dropped: {}", stream_event_type_name(event->type), e.what());
        if (event->is_done()) {
            return std::string("data: [DONE]\n\n");
        }
        return std::string();
    }
}

// ============ Dispatcher ============

Dispatcher::Dispatcher(std::shared_ptr<ModelRegistry> registry,
                       std::shared_ptr<UpstreamClient> upstream,
                       DispatchOptions options)
    : registry_(std::move(registry))
    , upstream_(std::move(upstream))
    , options_(options)
    , batcher_(options.batching)
{}

void Dispatcher::addHook(std::shared_ptr<RequestHook> hook) {
    if (!hook) {
        throw GatewayError::bad_request("hook must not be null");
    }
    spdlog::info("registered request hook: {}", hook->name());
    hooks_.push_back(std::move(hook));
}

DispatchResult Dispatcher::failed(Dialect dialect, const GatewayError& error) const {
    for (const auto& hook : hooks_) {
        try {
            hook->on_error(dialect, error);
        } catch (const std::exception& e) {
            spdlog::warn("hook {} on_error failed: {}", hook->name(), e.what());
        }
    }
    return errorResult(error);
}

DispatchResult Dispatcher::errorResult(const GatewayError& error) {
    DispatchResult result;
    result.status = error.status();
    result.body = ErrorEncoder::encode(error);
    return result;
}

DispatchResult Dispatcher::handle(const std::string& body, Dialect dialect, const CancelScope& scope) {
    nlohmann::json payload;
    try {
        payload = nlohmann::json::parse(body);
    } catch (const nlohmann::json::parse_error& e) {
        spdlog::warn("{} request rejected: invalid JSON", dialect_name(dialect));
        return failed(dialect, GatewayError::bad_request("Invalid JSON: " + std::string(e.what())));
    }
    return handle(payload, dialect, scope);
}

DispatchResult Dispatcher::handle(const nlohmann::json& payload, Dialect dialect, const CancelScope& scope) {
    try {
        return dispatch(payload, dialect, scope);
    } catch (const GatewayError& e) {
        if (e.status() >= 500) {
            spdlog::error("{} request failed ({}): {}{}", dialect_name(dialect), error_kind_name(e.kind()),
                          e.what(), e.detail().empty() ? "" : " [" + e.detail() + "]");
        } else {
            spdlog::warn("{} request rejected ({}): {}", dialect_name(dialect),
                         error_kind_name(e.kind()), e.what());
        }
        return failed(dialect, e);
    } catch (const std::exception& e) {
        spdlog::error("{} request hit an internal error: {}", dialect_name(dialect), e.what());
        return failed(dialect, GatewayError::internal(e.what()));
    }
}

DispatchResult Dispatcher::dispatch(const nlohmann::json& payload, Dialect dialect, const CancelScope& scope) {
    const DialectAdapter& client_adapter = adapter_for(dialect);

    CanonicalRequest request;
    try {
        request = client_adapter.decode(payload);
    } catch (const nlohmann::json::exception& e) {
        throw GatewayError::bad_request("malformed request: " + std::string(e.what()));
    }

    // 未注册的模型在这里失败，不会触达上游
    const ModelRoute route = registry_->resolve(request.model);
    if (!dialects_compatible(dialect, route.provider_dialect)) {
        throw GatewayError::bad_request("model '" + request.model + "' does not support " +
                                        dialect_name(dialect) + " requests", "model");
    }

    spdlog::info("dispatch {} model={} provider={} upstream={}:{} stream={}",
                 dialect_name(dialect), request.model, route.provider_id,
                 dialect_name(route.provider_dialect), route.target_model(), request.stream);

    for (const auto& hook : hooks_) {
        hook->before_request(request, route);
    }

    scope.throw_if_stopped();

    if (request.stream) {
        return openStream(route, request, scope);
    }

    CanonicalResponse response = request.is_embedding()
        ? callEmbeddings(route, request, scope)
        : callOnce(route, request, scope);
    // 客户端看到的是它请求的模型名，而不是上游改写后的名字
    response.model = request.model;

    for (const auto& hook : hooks_) {
        hook->after_response(request, response);
    }

    DispatchResult result;
    result.body = dump_json(client_adapter.encode(request, response));
    return result;
}

// ============ 上游调用 ============

UpstreamCall Dispatcher::makeCall(const ModelRoute& route, const CanonicalRequest& request) const {
    const DialectAdapter& upstream_adapter = adapter_for(route.provider_dialect);

    std::string base = route.endpoint_url;
    while (!base.empty() && base.back() == '/') {
        base.pop_back();
    }

    UpstreamCall call;
    call.url = base + upstream_adapter.upstream_path();
    call.api_key = route.api_key;
    call.body = upstream_adapter.encode_request(request, route.target_model());
    call.stream = request.stream;
    return call;
}

CanonicalResponse Dispatcher::callOnce(const ModelRoute& route, const CanonicalRequest& request,
                                       const CancelScope& scope) {
    const DialectAdapter& upstream_adapter = adapter_for(route.provider_dialect);
    UpstreamCall call = makeCall(route, request);

    UpstreamReply reply = upstream_->post(call, scope);
    if (!reply.ok()) {
        throw GatewayError::upstream(describe_upstream_failure(reply.status, reply.body), call.url);
    }

    auto payload = nlohmann::json::parse(reply.body, nullptr, false);
    if (payload.is_discarded()) {
        throw GatewayError::upstream("upstream returned invalid JSON", truncate_utf8(reply.body, 256));
    }
    return upstream_adapter.decode_response(payload);
}

CanonicalResponse Dispatcher::callEmbeddings(const ModelRoute& route, const CanonicalRequest& request,
                                             const CancelScope& scope) {
    EmbedFn embed = [&](const std::vector<std::string>& chunk, size_t offset, const CancelScope& chunk_scope) {
        CanonicalRequest sub = request;
        sub.inputs = chunk;
        CanonicalResponse part = callOnce(route, sub, chunk_scope);

        EmbeddingChunkResult result;
        result.vectors.reserve(part.output.size());
        for (auto& block : part.output) {
            result.vectors.push_back(std::move(block.embedding));
        }
        result.usage = part.usage.value_or(Usage{});
        spdlog::debug("embedding chunk at offset {} returned {} vector(s)", offset, result.vectors.size());
        return result;
    };

    EmbeddingBatchResult batch = batcher_.embed_batch(request.inputs, route.embedding_chunk_size, embed, scope);
    if (batch.chunk_calls > 1) {
        spdlog::info("embedding batch of {} input(s) split into {} call(s)",
                     request.inputs.size(), batch.chunk_calls);
    }

    CanonicalResponse response;
    response.created = detail::now_seconds();
    response.status = ResponseStatus::Completed;
    response.usage = batch.usage;
    response.output.reserve(batch.vectors.size());
    for (size_t i = 0; i < batch.vectors.size(); ++i) {
        ContentBlock block;
        block.type = "embedding";
        block.role.clear();
        block.index = i;
        block.embedding = std::move(batch.vectors[i]);
        response.output.push_back(std::move(block));
    }
    return response;
}

DispatchResult Dispatcher::openStream(const ModelRoute& route, const CanonicalRequest& request,
                                      const CancelScope& scope) {
    auto encoder = adapter_for(request.dialect).stream_encoder(request);
    auto proxy = std::make_shared<StreamingProxy>(upstream_,
                                                  makeCall(route, request),
                                                  adapter_for(route.provider_dialect).stream_decoder(),
                                                  scope,
                                                  options_.stream_buffer);
    proxy->start();
    // 首字节前的失败以普通 HTTP 错误返回
    proxy->wait_opened();

    ClientStream::EventFilter filter;
    if (!hooks_.empty()) {
        HookList hooks = hooks_;
        filter = [hooks, request](StreamEvent& event) {
            for (const auto& hook : hooks) {
                hook->on_stream_event(request, event);
            }
        };
    }

    DispatchResult result;
    result.content_type = "text/event-stream";
    result.stream = std::make_shared<ClientStream>(proxy, std::move(encoder), std::move(filter));
    return result;
}

} // namespace ai_gateway
