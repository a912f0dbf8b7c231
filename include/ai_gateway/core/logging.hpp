#pragma once

#include "ai_gateway/core/api_export.hpp"

#include <spdlog/spdlog.h>

#include <string>
#include <vector>

namespace ai_gateway {
namespace logging {

/**
 * 文本日志级别转换（不区分大小写），未知级别返回 info
 */
AI_GATEWAY_API spdlog::level::level_enum parse_level(const std::string& level_text);

/**
 * 初始化默认 logger
 * @param level 日志级别，环境变量 AI_GATEWAY_LOG_LEVEL 优先
 * @param pattern spdlog 输出格式
 * @param file_path 非空时额外写入文件
 * @param extra_sinks 主要用于测试注入
 */
AI_GATEWAY_API void init(const std::string& level = "info",
                         const std::string& pattern = "[%Y-%m-%d %T.%e] [%l] %v",
                         const std::string& file_path = "",
                         std::vector<spdlog::sink_ptr> extra_sinks = {});

} // namespace logging
} // namespace ai_gateway
