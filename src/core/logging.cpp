#include "ai_gateway/core/logging.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <memory>

namespace ai_gateway {
namespace logging {

namespace {
constexpr const char* kLogLevelEnv = "AI_GATEWAY_LOG_LEVEL";
}

spdlog::level::level_enum parse_level(const std::string& level_text) {
    std::string lower = level_text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "trace") return spdlog::level::trace;
    if (lower == "debug") return spdlog::level::debug;
    if (lower == "info") return spdlog::level::info;
    if (lower == "warn" || lower == "warning") return spdlog::level::warn;
    if (lower == "error") return spdlog::level::err;
    if (lower == "critical" || lower == "fatal") return spdlog::level::critical;
    if (lower == "off") return spdlog::level::off;
    return spdlog::level::info;
}

void init(const std::string& level,
          const std::string& pattern,
          const std::string& file_path,
          std::vector<spdlog::sink_ptr> extra_sinks) {
    std::vector<spdlog::sink_ptr> sinks = std::move(extra_sinks);
    if (sinks.empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    }
    if (!file_path.empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(file_path, false));
    }

    auto logger = std::make_shared<spdlog::logger>("ai_gateway", sinks.begin(), sinks.end());
    spdlog::set_default_logger(logger);

    if (!pattern.empty()) {
        spdlog::set_pattern(pattern);
    }

    std::string effective = level;
    if (const char* env = std::getenv(kLogLevelEnv)) {
        effective = env;
    }
    spdlog::set_level(parse_level(effective));
    spdlog::flush_on(spdlog::level::warn);
}

} // namespace logging
} // namespace ai_gateway
