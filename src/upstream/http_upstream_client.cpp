#include "ai_gateway/upstream/upstream_client.hpp"
#include "ai_gateway/core/errors.hpp"
#include "ai_gateway/core/utf8.hpp"

#include <httplib.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <memory>

namespace ai_gateway {

namespace {

httplib::Headers make_headers(const UpstreamCall& call) {
    httplib::Headers headers;
    if (!call.api_key.empty()) {
        headers.emplace("Authorization", "Bearer " + call.api_key);
    }
    headers.emplace("Accept", call.stream ? "text/event-stream" : "application/json");
    return headers;
}

void configure(httplib::Client& client, const HttpClientOptions& options, const CancelScope& scope) {
    auto read_timeout = scope.remaining(
        std::chrono::duration_cast<std::chrono::milliseconds>(options.read_timeout));
    client.set_connection_timeout(options.connect_timeout);
    client.set_read_timeout(std::max(read_timeout, std::chrono::milliseconds(1)));
    client.set_keep_alive(false);
}

} // namespace

std::string describe_upstream_failure(int status, const std::string& body) {
    std::string message = "upstream returned HTTP " + std::to_string(status);
    auto j = nlohmann::json::parse(body, nullptr, false);
    if (!j.is_discarded() && j.is_object()) {
        auto error = j.find("error");
        if (error != j.end() && error->is_object()) {
            auto msg = error->find("message");
            if (msg != error->end() && msg->is_string()) {
                return message + ": " + msg->get<std::string>();
            }
        }
    }
    if (!body.empty()) {
        message += ": " + truncate_utf8(body, 256);
    }
    return message;
}

HttpUpstreamClient::HttpUpstreamClient(HttpClientOptions options)
    : options_(options)
{}

std::pair<std::string, std::string> HttpUpstreamClient::split_url(const std::string& url) {
    auto scheme_end = url.find("://");
    if (scheme_end == std::string::npos) {
        throw GatewayError::internal("upstream url has no scheme: " + url);
    }
    auto path_begin = url.find('/', scheme_end + 3);
    if (path_begin == std::string::npos) {
        return {url, "/"};
    }
    return {url.substr(0, path_begin), url.substr(path_begin)};
}

// ============ 非流式 ============

UpstreamReply HttpUpstreamClient::post(const UpstreamCall& call, const CancelScope& scope) {
    scope.throw_if_stopped();

    auto [origin, path] = split_url(call.url);
    auto client = std::make_shared<httplib::Client>(origin);
    configure(*client, options_, scope);

    // 取消时关闭 socket，打断阻塞中的读取
    auto registration = scope.on_cancel([client]() { client->stop(); });

    auto res = client->Post(path, make_headers(call), dump_json(call.body), "application/json");
    if (!res) {
        scope.throw_if_stopped();
        throw GatewayError::upstream("upstream request failed: " + httplib::to_string(res.error()),
                                     call.url);
    }

    UpstreamReply reply;
    reply.status = res->status;
    reply.body = std::move(res->body);
    return reply;
}

// ============ 流式 ============

void HttpUpstreamClient::stream(const UpstreamCall& call,
                                const StatusHandler& on_status,
                                const ChunkHandler& on_chunk,
                                const CancelScope& scope) {
    if (scope.stopped()) {
        return;
    }

    auto [origin, path] = split_url(call.url);
    auto client = std::make_shared<httplib::Client>(origin);
    configure(*client, options_, scope);

    auto registration = scope.on_cancel([client]() { client->stop(); });

    bool handler_aborted = false;
    size_t bytes_received = 0;

    httplib::Request req;
    req.method = "POST";
    req.path = path;
    req.headers = make_headers(call);
    req.body = dump_json(call.body);
    req.set_header("Content-Type", "application/json");

    req.response_handler = [&](const httplib::Response& response) {
        if (!on_status(response.status)) {
            handler_aborted = true;
            return false;
        }
        return true;
    };
    req.content_receiver = [&](const char* data, size_t len, uint64_t, uint64_t) {
        bytes_received += len;
        if (!on_chunk(data, len)) {
            handler_aborted = true;
            return false;
        }
        return true;
    };

    httplib::Response res;
    httplib::Error error = httplib::Error::Success;
    bool ok = client->send(req, res, error);
    if (ok || handler_aborted || scope.stopped()) {
        return;
    }

    const std::string reason = httplib::to_string(error);
    if (bytes_received == 0) {
        spdlog::warn("upstream stream to {} failed before first byte: {}", call.url, reason);
        throw GatewayError::upstream("upstream request failed: " + reason, call.url);
    }
    spdlog::warn("upstream stream to {} interrupted after {} bytes: {}", call.url, bytes_received, reason);
    throw GatewayError(ErrorKind::UpstreamInterrupted,
                       "upstream connection interrupted: " + reason, "", call.url);
}

} // namespace ai_gateway
