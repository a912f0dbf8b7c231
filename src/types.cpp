#include "ai_gateway/types.hpp"

#include <algorithm>
#include <cctype>

namespace ai_gateway {

const char* dialect_name(Dialect dialect) {
    switch (dialect) {
        case Dialect::ChatCompletions: return "chat_completions";
        case Dialect::Responses:       return "responses";
        case Dialect::Embeddings:      return "embeddings";
    }
    return "unknown";
}

std::optional<Dialect> parse_dialect(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    std::replace(lower.begin(), lower.end(), '-', '_');

    if (lower == "chat_completions" || lower == "chat" || lower == "chat/completions") {
        return Dialect::ChatCompletions;
    }
    if (lower == "responses") {
        return Dialect::Responses;
    }
    if (lower == "embeddings") {
        return Dialect::Embeddings;
    }
    return std::nullopt;
}

const char* response_status_name(ResponseStatus status) {
    switch (status) {
        case ResponseStatus::Completed:  return "completed";
        case ResponseStatus::InProgress: return "in_progress";
        case ResponseStatus::Incomplete: return "incomplete";
        case ResponseStatus::Failed:     return "failed";
    }
    return "failed";
}

std::string CanonicalResponse::text() const {
    std::string result;
    for (const auto& block : output) {
        result += block.text;
    }
    return result;
}

} // namespace ai_gateway
