/**
 * AI Gateway - Standalone executable
 *
 * 读取 JSON 配置，注册模型路由，启动 OpenAI 兼容网关
 */

#include <ai_gateway/config.hpp>
#include <ai_gateway/core/errors.hpp>
#include <ai_gateway/core/logging.hpp>
#include <ai_gateway/server.hpp>
#include <ai_gateway/upstream/upstream_client.hpp>

#include <spdlog/spdlog.h>

#include <csignal>
#include <iostream>
#include <memory>

using namespace ai_gateway;

std::unique_ptr<Server> g_server;

void signal_handler(int sig) {
    std::cout << "\nReceived signal " << sig << ", shutting down..." << std::endl;
    if (g_server) {
        g_server->stop();
    }
}

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " --config <file> [options]" << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  --config <file>     JSON config with providers and models" << std::endl;
    std::cout << "  --host <host>       Listen address (overrides config)" << std::endl;
    std::cout << "  --port <port>       Listen port (overrides config)" << std::endl;
    std::cout << "  --api-key <key>     Accept this API key (may be repeated)" << std::endl;
    std::cout << "  --log-level <lvl>   trace/debug/info/warn/error/off" << std::endl;
    std::cout << "  -h, --help          Show this help message" << std::endl;
    std::cout << std::endl;
    std::cout << "Examples:" << std::endl;
    std::cout << "  " << program << " --config gateway.json" << std::endl;
    std::cout << "  " << program << " --config gateway.json --port 9000 --api-key my-key" << std::endl;
}

int main(int argc, char* argv[]) {
    // 解析命令行参数
    std::string config_path;
    std::string host;
    std::string log_level;
    std::vector<std::string> api_keys;
    int port = 0;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        }
        else if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        }
        else if (arg == "--host" && i + 1 < argc) {
            host = argv[++i];
        }
        else if (arg == "--port" && i + 1 < argc) {
            std::string value = argv[++i];
            try {
                port = std::stoi(value);
            } catch (const std::exception&) {
                port = -1;
            }
            if (port <= 0 || port > 65535) {
                std::cerr << "Error: Invalid port: " << value << std::endl;
                return 1;
            }
        }
        else if (arg == "--api-key" && i + 1 < argc) {
            api_keys.push_back(argv[++i]);
        }
        else if (arg == "--log-level" && i + 1 < argc) {
            log_level = argv[++i];
        }
        else {
            std::cerr << "Error: Unknown argument: " << arg << std::endl;
            print_usage(argv[0]);
            return 1;
        }
    }

    if (config_path.empty()) {
        std::cerr << "Error: --config is required" << std::endl;
        print_usage(argv[0]);
        return 1;
    }

    // 加载配置，命令行优先
    GatewayConfig config;
    try {
        config = GatewayConfig::loadFile(config_path);
    } catch (const GatewayError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    if (!host.empty()) config.server.host = host;
    if (port > 0) config.server.port = port;
    if (!api_keys.empty()) config.server.api_keys = api_keys;
    if (!log_level.empty()) config.log_level = log_level;

    logging::init(config.log_level, "[%Y-%m-%d %T.%e] [%l] %v", config.log_file);

    // 设置信号处理
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    // 注册模型
    auto registry = std::make_shared<ModelRegistry>();
    try {
        registry->reload(config.toRoutes());
    } catch (const GatewayError& e) {
        spdlog::critical("invalid model routes: {}", e.what());
        return 1;
    }
    if (registry->size() == 0) {
        spdlog::warn("no models configured, every request will return model_not_found");
    }

    auto upstream = std::make_shared<HttpUpstreamClient>();
    auto dispatcher = std::make_shared<Dispatcher>(registry, upstream, config.dispatch);
    g_server = std::make_unique<Server>(registry, dispatcher, config.server);

    std::cout << "AI Gateway" << std::endl;
    std::cout << "==========" << std::endl;
    std::cout << "Listen: " << config.server.host << ":" << config.server.port << std::endl;
    std::cout << "Max Concurrency: " << config.server.max_concurrency << std::endl;
    std::cout << "API Key: " << (config.server.api_keys.empty() ? "disabled" : "enabled") << std::endl;
    std::cout << "Models:" << std::endl;
    for (const auto& route : registry->listRoutes()) {
        std::cout << "  - " << route.model_name << " -> ";
        auto upstreams = registry->backends(route.model_name);
        for (size_t i = 0; i < upstreams.size(); ++i) {
            std::cout << (i > 0 ? ", " : "") << upstreams[i].provider_id;
            if (upstreams.size() > 1) {
                std::cout << " (weight " << upstreams[i].weight << ")";
            }
        }
        std::cout << " [" << dialect_name(route.provider_dialect) << "]" << std::endl;
    }
    std::cout << std::endl;
    std::cout << "Press Ctrl+C to stop" << std::endl;
    std::cout << std::endl;

    g_server->run();
    return 0;
}
