#pragma once

#include "ai_gateway/core/api_export.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace ai_gateway {

/**
 * 截断到最多 max_bytes 字节，不切断多字节 UTF-8 字符
 */
AI_GATEWAY_API std::string truncate_utf8(const std::string& text, size_t max_bytes);

/**
 * 非法 UTF-8 序列替换为 U+FFFD
 */
AI_GATEWAY_API std::string sanitize_utf8(const std::string& text);

/**
 * 面向客户端的紧凑序列化，非法 UTF-8 替换而不抛异常
 */
AI_GATEWAY_API std::string dump_json(const nlohmann::json& j);

} // namespace ai_gateway
