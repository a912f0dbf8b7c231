#include "ai_gateway/core/utf8.hpp"

namespace ai_gateway {

std::string truncate_utf8(const std::string& text, size_t max_bytes) {
    if (text.size() <= max_bytes) {
        return text;
    }
    size_t cut = max_bytes;
    // 回退到字符起始字节，最多 3 个延续字节
    for (int i = 0; i < 3 && cut > 0; ++i) {
        auto byte = static_cast<unsigned char>(text[cut]);
        if ((byte & 0xC0) != 0x80) {
            break;
        }
        --cut;
    }
    return text.substr(0, cut);
}

std::string sanitize_utf8(const std::string& text) {
    auto escaped = nlohmann::json(text).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    return nlohmann::json::parse(escaped).get<std::string>();
}

std::string dump_json(const nlohmann::json& j) {
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace ai_gateway
