#include "ai_gateway/registry.hpp"
#include "ai_gateway/core/errors.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>

namespace ai_gateway {

ModelRegistry::ModelRegistry()
    : table_(std::make_shared<const RouteTable>())
{}

ModelRegistry::ModelRegistry(const std::vector<ModelRoute>& routes)
    : table_(std::make_shared<const RouteTable>())
{
    reload(routes);
}

// ============ 快照 ============

std::shared_ptr<const ModelRegistry::RouteTable> ModelRegistry::snapshot() const {
    return std::atomic_load(&table_);
}

void ModelRegistry::publish(std::shared_ptr<const RouteTable> table) {
    std::atomic_store(&table_, std::move(table));
}

void ModelRegistry::validate(const ModelRoute& route) {
    if (route.model_name.empty()) {
        throw GatewayError::bad_request("route is missing a model name");
    }
    if (route.endpoint_url.empty()) {
        throw GatewayError::bad_request("route '" + route.model_name + "' is missing an endpoint url");
    }
    if (route.weight <= 0) {
        throw GatewayError::bad_request("route '" + route.model_name + "' must have a positive weight");
    }
}

void ModelRegistry::append(RouteGroup& group, const ModelRoute& route) {
    // 同一模型的上游必须说同一种方言，否则兼容性检查随轮询结果变化
    if (!group.backends.empty() && group.backends.front().provider_dialect != route.provider_dialect) {
        throw GatewayError::bad_request("route '" + route.model_name + "' mixes " +
                                        dialect_name(group.backends.front().provider_dialect) + " and " +
                                        dialect_name(route.provider_dialect) + " upstreams");
    }
    group.backends.push_back(route);
    group.total_weight += route.weight;
}

// ============ RouteGroup ============

const ModelRoute& ModelRegistry::RouteGroup::pick() const {
    if (backends.size() == 1) {
        return backends.front();
    }
    uint64_t slot = cursor->fetch_add(1) % static_cast<uint64_t>(total_weight);
    for (const auto& route : backends) {
        if (slot < static_cast<uint64_t>(route.weight)) {
            return route;
        }
        slot -= static_cast<uint64_t>(route.weight);
    }
    return backends.back();
}

// ============ 查询 ============

ModelRoute ModelRegistry::resolve(const std::string& model_name) const {
    auto table = snapshot();
    auto it = table->find(model_name);
    if (it == table->end()) {
        throw GatewayError::not_found(model_name);
    }
    return it->second.pick();
}

std::optional<ModelRoute> ModelRegistry::find(const std::string& model_name) const {
    auto table = snapshot();
    auto it = table->find(model_name);
    if (it == table->end()) {
        return std::nullopt;
    }
    return it->second.backends.front();
}

std::vector<ModelRoute> ModelRegistry::backends(const std::string& model_name) const {
    auto table = snapshot();
    auto it = table->find(model_name);
    if (it == table->end()) {
        return {};
    }
    return it->second.backends;
}

bool ModelRegistry::contains(const std::string& model_name) const {
    auto table = snapshot();
    return table->count(model_name) > 0;
}

std::vector<std::string> ModelRegistry::listModels() const {
    auto table = snapshot();
    std::vector<std::string> names;
    names.reserve(table->size());
    for (const auto& [name, group] : *table) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

std::vector<ModelRoute> ModelRegistry::listRoutes() const {
    auto table = snapshot();
    std::vector<ModelRoute> routes;
    routes.reserve(table->size());
    for (const auto& [name, group] : *table) {
        routes.push_back(group.backends.front());
    }
    std::sort(routes.begin(), routes.end(), [](const ModelRoute& a, const ModelRoute& b) {
        return a.model_name < b.model_name;
    });
    return routes;
}

size_t ModelRegistry::size() const {
    return snapshot()->size();
}

// ============ 修改 ============

void ModelRegistry::registerRoute(const ModelRoute& route) {
    validate(route);

    std::lock_guard<std::mutex> lock(write_mutex_);
    auto next = std::make_shared<RouteTable>(*snapshot());
    RouteGroup group;
    append(group, route);
    (*next)[route.model_name] = std::move(group);
    publish(std::move(next));

    spdlog::info("registered model '{}' -> provider '{}' ({}, upstream model '{}')",
                 route.model_name, route.provider_id,
                 dialect_name(route.provider_dialect), route.target_model());
}

void ModelRegistry::addRoute(const ModelRoute& route) {
    validate(route);

    std::lock_guard<std::mutex> lock(write_mutex_);
    auto next = std::make_shared<RouteTable>(*snapshot());
    RouteGroup& group = (*next)[route.model_name];
    append(group, route);
    const size_t count = group.backends.size();
    publish(std::move(next));

    spdlog::info("added upstream for model '{}' -> provider '{}' (weight {}, {} upstream(s))",
                 route.model_name, route.provider_id, route.weight, count);
}

bool ModelRegistry::unregisterRoute(const std::string& model_name) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    auto current = snapshot();
    if (current->count(model_name) == 0) {
        return false;
    }
    auto next = std::make_shared<RouteTable>(*current);
    next->erase(model_name);
    publish(std::move(next));
    spdlog::info("unregistered model '{}'", model_name);
    return true;
}

void ModelRegistry::reload(const std::vector<ModelRoute>& routes) {
    auto next = std::make_shared<RouteTable>();
    for (const auto& route : routes) {
        validate(route);
        append((*next)[route.model_name], route);
    }
    const size_t models = next->size();

    std::lock_guard<std::mutex> lock(write_mutex_);
    publish(std::move(next));
    spdlog::info("model registry loaded with {} model(s), {} route(s)", models, routes.size());
}

} // namespace ai_gateway
