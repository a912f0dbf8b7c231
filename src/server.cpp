#include "ai_gateway/server.hpp"
#include "ai_gateway/core/errors.hpp"
#include "ai_gateway/core/utf8.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <ctime>

namespace ai_gateway {

// ============ 构造函数/析构函数 ============

Server::Server(std::shared_ptr<ModelRegistry> registry,
               std::shared_ptr<Dispatcher> dispatcher,
               ServerOptions options)
    : options_(std::move(options))
    , registry_(std::move(registry))
    , dispatcher_(std::move(dispatcher))
{
    setupRoutes();
}

Server::~Server() {
    if (running_.load()) {
        stop();
    }
}

// ============ 配置 ============

void Server::setMaxConcurrency(int max) {
    options_.max_concurrency = max;
}

void Server::setTimeout(std::chrono::milliseconds timeout) {
    options_.request_timeout = timeout;
}

void Server::setApiKeys(const std::vector<std::string>& api_keys) {
    options_.api_keys = api_keys;
}

void Server::setAuthenticator(Authenticator authenticator) {
    authenticator_ = std::move(authenticator);
}

// ============ 运行控制 ============

void Server::run() {
    running_ = true;
    spdlog::info("AI Gateway listening on http://{}:{}", options_.host, options_.port);
    spdlog::info("max concurrency: {}, request timeout: {} ms, models: {}",
                 options_.max_concurrency, options_.request_timeout.count(), registry_->size());

    if (!http_server_.listen(options_.host, options_.port)) {
        spdlog::error("failed to listen on {}:{}", options_.host, options_.port);
    }
    running_ = false;
}

std::thread Server::runAsync() {
    return std::thread([this]() { run(); });
}

int Server::bindToAnyPort(const std::string& host) {
    options_.host = host;
    options_.port = http_server_.bind_to_any_port(host);
    return options_.port;
}

bool Server::listenAfterBind() {
    running_ = true;
    bool ok = http_server_.listen_after_bind();
    running_ = false;
    return ok;
}

void Server::waitUntilReady() const {
    http_server_.wait_until_ready();
}

void Server::stop() {
    running_ = false;
    http_server_.stop();
}

bool Server::isRunning() const {
    return running_.load();
}

// ============ 并发控制 ============

bool Server::acquireSlot() {
    std::unique_lock<std::mutex> lock(slot_mutex_);
    bool acquired = slot_cv_.wait_for(lock, options_.wait_timeout, [this] {
        return current_concurrency_.load() < options_.max_concurrency;
    });
    if (acquired) {
        current_concurrency_++;
    }
    return acquired;
}

void Server::releaseSlot() {
    {
        std::lock_guard<std::mutex> lock(slot_mutex_);
        current_concurrency_--;
    }
    slot_cv_.notify_one();
}

// ============ 认证 ============

bool Server::authenticate(const httplib::Request& req) const {
    if (!authenticator_ && options_.api_keys.empty()) {
        return true;
    }

    std::string credential = req.get_header_value("Authorization");
    const std::string bearer_prefix = "Bearer ";
    if (credential.compare(0, bearer_prefix.length(), bearer_prefix) == 0) {
        credential = credential.substr(bearer_prefix.length());
    }
    if (credential.empty()) {
        return false;
    }

    if (authenticator_) {
        return authenticator_(credential);
    }
    return std::find(options_.api_keys.begin(), options_.api_keys.end(), credential) !=
           options_.api_keys.end();
}

// ============ 路由设置 ============

void Server::setupRoutes() {
    // Health
    http_server_.Get("/health", [this](const httplib::Request& req, httplib::Response& res) {
        handleHealth(req, res);
    });

    // Models (支持 /v1/models 和 /models)
    http_server_.Get("/v1/models", [this](const httplib::Request& req, httplib::Response& res) {
        handleModels(req, res);
    });
    http_server_.Get("/models", [this](const httplib::Request& req, httplib::Response& res) {
        handleModels(req, res);
    });

    // Chat Completions
    http_server_.Post("/v1/chat/completions", [this](const httplib::Request& req, httplib::Response& res) {
        handleDispatch(req, res, Dialect::ChatCompletions);
    });
    http_server_.Post("/chat/completions", [this](const httplib::Request& req, httplib::Response& res) {
        handleDispatch(req, res, Dialect::ChatCompletions);
    });

    // Responses
    http_server_.Post("/v1/responses", [this](const httplib::Request& req, httplib::Response& res) {
        handleDispatch(req, res, Dialect::Responses);
    });
    http_server_.Post("/responses", [this](const httplib::Request& req, httplib::Response& res) {
        handleDispatch(req, res, Dialect::Responses);
    });

    // Embeddings
    http_server_.Post("/v1/embeddings", [this](const httplib::Request& req, httplib::Response& res) {
        handleDispatch(req, res, Dialect::Embeddings);
    });
    http_server_.Post("/embeddings", [this](const httplib::Request& req, httplib::Response& res) {
        handleDispatch(req, res, Dialect::Embeddings);
    });

    // CORS
    http_server_.Options("/.*", [](const httplib::Request&, httplib::Response& res) {
        res.set_header("Access-Control-Allow-Origin", "*");
        res.set_header("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
        res.set_header("Access-Control-Allow-Headers", "Content-Type, Authorization");
        res.status = 204;
    });
}

// ============ 端点处理 ============

void Server::handleHealth(const httplib::Request&, httplib::Response& res) {
    nlohmann::json j;
    j["status"] = "ok";
    j["concurrency"] = current_concurrency_.load();
    j["max_concurrency"] = options_.max_concurrency;
    res.set_content(dump_json(j), "application/json");
}

void Server::handleModels(const httplib::Request& req, httplib::Response& res) {
    if (!authenticate(req)) {
        res.status = 401;
        res.set_content(ErrorEncoder::unauthorized(), "application/json");
        return;
    }

    nlohmann::json j;
    j["object"] = "list";
    j["data"] = nlohmann::json::array();

    auto now = std::time(nullptr);
    for (const auto& route : registry_->listRoutes()) {
        nlohmann::json model_j;
        model_j["id"] = route.model_name;
        model_j["object"] = "model";
        model_j["created"] = now;
        model_j["owned_by"] = route.provider_id.empty() ? options_.owner : route.provider_id;
        j["data"].push_back(model_j);
    }

    res.set_content(dump_json(j), "application/json");
}

void Server::handleDispatch(const httplib::Request& req, httplib::Response& res, Dialect dialect) {
    res.set_header("Access-Control-Allow-Origin", "*");

    // 认证
    if (!authenticate(req)) {
        res.status = 401;
        res.set_content(ErrorEncoder::unauthorized(), "application/json");
        return;
    }

    // 并发控制
    if (!acquireSlot()) {
        res.status = 429;
        res.set_content(ErrorEncoder::rate_limit(), "application/json");
        return;
    }
    struct SlotGuard {
        Server* s;
        ~SlotGuard() { s->releaseSlot(); }
    };
    auto slot = std::make_shared<SlotGuard>(SlotGuard{this});

    CancelScope scope(options_.request_timeout);
    DispatchResult result = dispatcher_->handle(req.body, dialect, scope);

    if (!result.is_stream()) {
        res.status = result.status;
        res.set_content(result.body, result.content_type);
        return;
    }

    // 流式响应 - chunked 传输，槽位保持到流结束
    res.status = 200;
    res.set_header("Cache-Control", "no-cache");
    res.set_header("Connection", "keep-alive");

    auto stream = result.stream;
    auto poll = options_.stream_poll_interval;
    res.set_chunked_content_provider("text/event-stream",
        [stream, poll](size_t, httplib::DataSink& sink) -> bool {
            auto frame = stream->next_frame(poll);
            if (frame && !frame->empty()) {
                if (!sink.write(frame->data(), frame->size())) {
                    return false;  // 客户端已断开
                }
            }
            if (stream->finished()) {
                sink.done();  // 关闭连接让 SDK 知道结束
            }
            return true;
        },
        [stream, slot](bool success) {
            if (!success) {
                spdlog::info("client disconnected, cancelling upstream stream");
            }
            stream->cancel();
        });
}

} // namespace ai_gateway
