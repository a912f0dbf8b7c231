#pragma once

#include "ai_gateway/core/api_export.hpp"
#include "ai_gateway/core/cancellation.hpp"
#include "ai_gateway/types.hpp"

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace ai_gateway {

struct BatchOptions {
    size_t chunk_size = 16;       // 每次上游调用的最大输入条数
    size_t max_concurrency = 4;   // 同时进行的分片调用数
};

/**
 * 单个分片的上游结果
 */
struct EmbeddingChunkResult {
    std::vector<std::vector<float>> vectors;
    Usage usage;
};

struct EmbeddingBatchResult {
    std::vector<std::vector<float>> vectors;  // 与输入逐条对齐
    Usage usage;                              // 所有分片之和
    size_t chunk_calls = 0;
};

/**
 * 发起一次分片调用
 * @param chunk 分片输入
 * @param offset 分片在原始输入中的起始下标
 * @param scope 本批次的取消作用域，任一分片失败后被取消
 */
using EmbedFn = std::function<EmbeddingChunkResult(const std::vector<std::string>& chunk, size_t offset,
                                                   const CancelScope& scope)>;

/**
 * BatchCoordinator - 大批量 embedding 的切分与重组
 *
 * 1. 输入按 chunk_size 切成连续分片
 * 2. 分片并发调用，并发数不超过 max_concurrency
 * 3. 结果按原始偏移写回，输出顺序与输入一致
 * 4. 任一分片失败则整批失败，尚未开始的分片不再发出，进行中的分片被取消
 */
class AI_GATEWAY_API BatchCoordinator {
public:
    explicit BatchCoordinator(BatchOptions options = BatchOptions());

    /**
     * @param chunk_size 0 表示使用 options().chunk_size
     * @throws BatchError 分片失败，携带失败区间 [begin, end)
     * @throws GatewayError Cancelled / Timeout
     */
    EmbeddingBatchResult embed_batch(const std::vector<std::string>& inputs,
                                     size_t chunk_size,
                                     const EmbedFn& embed,
                                     const CancelScope& scope) const;

    EmbeddingBatchResult embed_batch(const std::vector<std::string>& inputs,
                                     const EmbedFn& embed,
                                     const CancelScope& scope) const {
        return embed_batch(inputs, 0, embed, scope);
    }

    size_t chunk_count(size_t input_count, size_t chunk_size = 0) const;

    const BatchOptions& options() const { return options_; }

private:
    BatchOptions options_;
};

} // namespace ai_gateway
