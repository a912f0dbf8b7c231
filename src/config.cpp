#include "ai_gateway/config.hpp"
#include "ai_gateway/core/errors.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>

namespace ai_gateway {

namespace {

GatewayError config_error(const std::string& message) {
    return GatewayError::bad_request("config: " + message);
}

const nlohmann::json& require_section(const nlohmann::json& j, const char* key) {
    static const nlohmann::json empty = nlohmann::json::object();
    if (!j.contains(key)) {
        return empty;
    }
    if (!j[key].is_object()) {
        throw config_error(std::string(key) + " must be an object");
    }
    return j[key];
}

std::string read_string(const nlohmann::json& j, const char* key, const std::string& where,
                        bool required, const std::string& fallback = "") {
    if (!j.contains(key)) {
        if (required) {
            throw config_error(where + "." + key + " is required");
        }
        return fallback;
    }
    if (!j[key].is_string()) {
        throw config_error(where + "." + key + " must be a string");
    }
    std::string value = j[key].get<std::string>();
    if (required && value.empty()) {
        throw config_error(where + "." + key + " must not be empty");
    }
    return value;
}

int64_t read_positive(const nlohmann::json& j, const char* key, const std::string& where,
                      int64_t fallback) {
    if (!j.contains(key)) {
        return fallback;
    }
    const auto& value = j[key];
    if (!value.is_number_integer() || value.get<int64_t>() <= 0) {
        throw config_error(where + "." + key + " must be a positive integer");
    }
    return value.get<int64_t>();
}

Dialect read_dialect(const nlohmann::json& j, const std::string& where) {
    std::string name = read_string(j, "dialect", where, true);
    auto dialect = parse_dialect(name);
    if (!dialect) {
        throw config_error(where + ".dialect: unknown dialect '" + name + "'");
    }
    return *dialect;
}

} // namespace

// ============ 解析 ============

GatewayConfig GatewayConfig::fromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw config_error("top level must be an object");
    }

    GatewayConfig config;

    // server
    const auto& server = require_section(j, "server");
    config.server.host = read_string(server, "host", "server", false, config.server.host);
    config.server.port = static_cast<int>(read_positive(server, "port", "server", config.server.port));
    if (config.server.port > 65535) {
        throw config_error("server.port must be at most 65535");
    }
    config.server.max_concurrency = static_cast<int>(
        read_positive(server, "max_concurrency", "server", config.server.max_concurrency));
    config.server.request_timeout = std::chrono::milliseconds(
        read_positive(server, "request_timeout_ms", "server", config.server.request_timeout.count()));
    config.server.wait_timeout = std::chrono::milliseconds(
        read_positive(server, "wait_timeout_ms", "server", config.server.wait_timeout.count()));
    config.dispatch.stream_buffer = static_cast<size_t>(
        read_positive(server, "stream_buffer", "server", static_cast<int64_t>(config.dispatch.stream_buffer)));
    if (server.contains("api_keys")) {
        if (!server["api_keys"].is_array()) {
            throw config_error("server.api_keys must be an array of strings");
        }
        for (const auto& key : server["api_keys"]) {
            if (!key.is_string() || key.get<std::string>().empty()) {
                throw config_error("server.api_keys must be an array of non-empty strings");
            }
            config.server.api_keys.push_back(key.get<std::string>());
        }
    }

    // embeddings
    const auto& embeddings = require_section(j, "embeddings");
    config.dispatch.batching.chunk_size = static_cast<size_t>(read_positive(
        embeddings, "chunk_size", "embeddings", static_cast<int64_t>(config.dispatch.batching.chunk_size)));
    config.dispatch.batching.max_concurrency = static_cast<size_t>(read_positive(
        embeddings, "max_concurrency", "embeddings",
        static_cast<int64_t>(config.dispatch.batching.max_concurrency)));

    // logging
    config.log_level = read_string(j, "log_level", "config", false, config.log_level);
    config.log_file = read_string(j, "log_file", "config", false);

    // providers
    const auto& providers = require_section(j, "providers");
    for (auto it = providers.begin(); it != providers.end(); ++it) {
        const std::string where = "providers." + it.key();
        if (!it.value().is_object()) {
            throw config_error(where + " must be an object");
        }
        ProviderConfig provider;
        provider.name = it.key();
        provider.base_url = read_string(it.value(), "base_url", where, true);
        provider.api_key = read_string(it.value(), "api_key", where, false);
        provider.api_key_env = read_string(it.value(), "api_key_env", where, false);
        provider.dialect = read_dialect(it.value(), where);
        config.providers[provider.name] = provider;
    }

    // models
    if (j.contains("models")) {
        if (!j["models"].is_array()) {
            throw config_error("models must be an array");
        }
        for (size_t i = 0; i < j["models"].size(); ++i) {
            const auto& entry = j["models"][i];
            const std::string where = "models[" + std::to_string(i) + "]";
            if (!entry.is_object()) {
                throw config_error(where + " must be an object");
            }

            ModelConfig model;
            model.name = read_string(entry, "name", where, true);
            model.provider = read_string(entry, "provider", where, true);
            if (config.providers.find(model.provider) == config.providers.end()) {
                throw config_error(where + ": unknown provider '" + model.provider + "'");
            }
            if (entry.contains("dialect")) {
                model.dialect = read_dialect(entry, where);
            }
            model.upstream_model = read_string(entry, "upstream_model", where, false);
            model.embedding_chunk_size = static_cast<size_t>(
                read_positive(entry, "embedding_chunk_size", where, 0));
            model.weight = static_cast<int>(read_positive(entry, "weight", where, 1));
            config.models.push_back(model);
        }
    }

    return config;
}

GatewayConfig GatewayConfig::loadFile(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw config_error("cannot open " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    auto j = nlohmann::json::parse(buffer.str(), nullptr, false);
    if (j.is_discarded()) {
        throw config_error(path + " is not valid JSON");
    }
    return fromJson(j);
}

// ============ 路由 ============

std::vector<ModelRoute> GatewayConfig::toRoutes() const {
    std::vector<ModelRoute> routes;
    routes.reserve(models.size());

    for (const auto& model : models) {
        auto it = providers.find(model.provider);
        if (it == providers.end()) {
            throw config_error("model '" + model.name + "' references unknown provider '" +
                               model.provider + "'");
        }
        const ProviderConfig& provider = it->second;

        ModelRoute route;
        route.model_name = model.name;
        route.provider_id = provider.name;
        route.provider_dialect = model.dialect.value_or(provider.dialect);
        route.endpoint_url = provider.base_url;
        route.upstream_model = model.upstream_model;
        route.embedding_chunk_size = model.embedding_chunk_size;
        route.weight = model.weight;
        route.api_key = provider.api_key;
        if (route.api_key.empty() && !provider.api_key_env.empty()) {
            if (const char* env = std::getenv(provider.api_key_env.c_str())) {
                route.api_key = env;
            }
        }
        routes.push_back(route);
    }
    return routes;
}

} // namespace ai_gateway
