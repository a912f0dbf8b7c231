#include "ai_gateway/dialect/embeddings.hpp"
#include "ai_gateway/core/errors.hpp"
#include "ai_gateway/core/utf8.hpp"

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <set>

namespace ai_gateway {

namespace {

const std::set<std::string> kEmbeddingsCoreFields = {"model", "input", "stream", "encoding_format"};

std::string base64_encode(const std::vector<uint8_t>& data) {
    static const char* kChars =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
    std::string encoded;
    encoded.reserve(((data.size() + 2) / 3) * 4);

    size_t i = 0;
    while (i + 2 < data.size()) {
        const uint32_t n = (static_cast<uint32_t>(data[i]) << 16) |
                           (static_cast<uint32_t>(data[i + 1]) << 8) |
                           static_cast<uint32_t>(data[i + 2]);
        encoded.push_back(kChars[(n >> 18) & 0x3F]);
        encoded.push_back(kChars[(n >> 12) & 0x3F]);
        encoded.push_back(kChars[(n >> 6) & 0x3F]);
        encoded.push_back(kChars[n & 0x3F]);
        i += 3;
    }

    const size_t rem = data.size() - i;
    if (rem == 1) {
        const uint32_t n = static_cast<uint32_t>(data[i]) << 16;
        encoded.push_back(kChars[(n >> 18) & 0x3F]);
        encoded.push_back(kChars[(n >> 12) & 0x3F]);
        encoded.append("==");
    } else if (rem == 2) {
        const uint32_t n = (static_cast<uint32_t>(data[i]) << 16) |
                           (static_cast<uint32_t>(data[i + 1]) << 8);
        encoded.push_back(kChars[(n >> 18) & 0x3F]);
        encoded.push_back(kChars[(n >> 12) & 0x3F]);
        encoded.push_back(kChars[(n >> 6) & 0x3F]);
        encoded.push_back('=');
    }
    return encoded;
}

} // namespace

std::string EmbeddingsAdapter::encode_base64(const std::vector<float>& embedding) {
    std::vector<uint8_t> bytes(embedding.size() * sizeof(float));
    // OpenAI 客户端按小端 float32 解码
    for (size_t i = 0; i < embedding.size(); ++i) {
        uint32_t bits = 0;
        std::memcpy(&bits, &embedding[i], sizeof(float));
        bytes[i * 4 + 0] = static_cast<uint8_t>(bits & 0xFF);
        bytes[i * 4 + 1] = static_cast<uint8_t>((bits >> 8) & 0xFF);
        bytes[i * 4 + 2] = static_cast<uint8_t>((bits >> 16) & 0xFF);
        bytes[i * 4 + 3] = static_cast<uint8_t>((bits >> 24) & 0xFF);
    }
    return base64_encode(bytes);
}

// ============ 客户端方向 ============

CanonicalRequest EmbeddingsAdapter::decode(const nlohmann::json& payload) const {
    detail::require_object(payload);

    CanonicalRequest request;
    request.dialect = Dialect::Embeddings;
    request.model = detail::require_model(payload);

    auto input = payload.find("input");
    if (input == payload.end() || input->is_null()) {
        throw GatewayError::bad_request("Missing 'input' field", "input");
    }
    if (input->is_string()) {
        request.inputs.push_back(input->get<std::string>());
    } else if (input->is_array()) {
        for (const auto& item : *input) {
            if (!item.is_string()) {
                throw GatewayError::bad_request("'input' must be a string or an array of strings", "input");
            }
            request.inputs.push_back(item.get<std::string>());
        }
    } else {
        throw GatewayError::bad_request("'input' must be a string or an array of strings", "input");
    }
    if (request.inputs.empty()) {
        throw GatewayError::bad_request("'input' must not be empty", "input");
    }
    for (const auto& text : request.inputs) {
        if (text.empty()) {
            throw GatewayError::bad_request("'input' must not contain empty strings", "input");
        }
    }

    auto dimensions = payload.find("dimensions");
    if (dimensions != payload.end() && !dimensions->is_null()) {
        if (!dimensions->is_number_integer() || dimensions->get<int64_t>() <= 0) {
            throw GatewayError::bad_request("'dimensions' must be a positive integer", "dimensions");
        }
    }

    std::string format = "float";
    auto encoding = payload.find("encoding_format");
    if (encoding != payload.end() && !encoding->is_null()) {
        if (!encoding->is_string()) {
            throw GatewayError::bad_request("'encoding_format' must be a string", "encoding_format");
        }
        format = encoding->get<std::string>();
        if (format != "float" && format != "base64") {
            throw GatewayError::bad_request("'encoding_format' must be 'float' or 'base64'", "encoding_format");
        }
    }

    if (detail::read_stream(payload)) {
        throw GatewayError::bad_request("embeddings do not support streaming", "stream");
    }

    for (const auto& item : payload.items()) {
        if (kEmbeddingsCoreFields.count(item.key()) == 0) {
            request.extra_options[item.key()] = item.value();
        }
    }
    request.extra_options["encoding_format"] = format;
    return request;
}

nlohmann::json EmbeddingsAdapter::encode(const CanonicalRequest& request,
                                         const CanonicalResponse& response) const {
    const bool base64 = request.extra_options.value("encoding_format", "float") == "base64";

    nlohmann::json j;
    j["object"] = "list";
    j["data"] = nlohmann::json::array();
    for (const auto& block : response.output) {
        nlohmann::json item;
        item["object"] = "embedding";
        item["index"] = block.index;
        if (base64) {
            item["embedding"] = encode_base64(block.embedding);
        } else {
            item["embedding"] = block.embedding;
        }
        j["data"].push_back(item);
    }
    j["model"] = response.model.empty() ? request.model : response.model;

    Usage usage = response.usage.value_or(Usage{});
    j["usage"]["prompt_tokens"] = usage.prompt_tokens;
    j["usage"]["total_tokens"] = usage.total_tokens;
    return j;
}

std::unique_ptr<StreamEncoder> EmbeddingsAdapter::stream_encoder(const CanonicalRequest&) const {
    throw GatewayError::bad_request("embeddings do not support streaming", "stream");
}

// ============ 上游方向 ============

nlohmann::json EmbeddingsAdapter::encode_request(const CanonicalRequest& request,
                                                 const std::string& upstream_model) const {
    nlohmann::json body;
    body["model"] = upstream_model;
    body["input"] = request.inputs;
    // 上游始终返回 float，base64 由网关自己编码
    body["encoding_format"] = "float";
    detail::copy_options(request.extra_options, body, {"dimensions", "user"});
    return body;
}

CanonicalResponse EmbeddingsAdapter::decode_response(const nlohmann::json& payload) const {
    if (!payload.is_object()) {
        throw GatewayError::upstream("upstream returned a malformed embedding list");
    }
    auto data = payload.find("data");
    if (data == payload.end() || !data->is_array()) {
        throw GatewayError::upstream("upstream embedding list has no 'data'",
                                     truncate_utf8(dump_json(payload), 512));
    }

    try {
        CanonicalResponse response;
        response.model = payload.value("model", "");
        response.created = detail::now_seconds();

        for (size_t i = 0; i < data->size(); ++i) {
            const auto& item = (*data)[i];
            auto embedding = item.find("embedding");
            if (!item.is_object() || embedding == item.end() || !embedding->is_array()) {
                throw GatewayError::upstream("upstream embedding item " + std::to_string(i) + " is malformed");
            }
            ContentBlock block;
            block.type = "embedding";
            block.role.clear();
            block.index = item.value("index", i);
            block.embedding = embedding->get<std::vector<float>>();
            response.output.push_back(std::move(block));
        }
        std::sort(response.output.begin(), response.output.end(),
                  [](const ContentBlock& a, const ContentBlock& b) { return a.index < b.index; });

        auto usage = payload.find("usage");
        if (usage != payload.end()) {
            response.usage = detail::read_usage(*usage);
        }
        return response;
    } catch (const nlohmann::json::exception& e) {
        throw GatewayError::upstream("upstream returned a malformed embedding list", e.what());
    }
}

std::unique_ptr<StreamDecoder> EmbeddingsAdapter::stream_decoder() const {
    throw GatewayError::bad_request("embeddings do not support streaming", "stream");
}

} // namespace ai_gateway
