#include "ai_gateway/batching/batch_coordinator.hpp"
#include "ai_gateway/core/errors.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <mutex>
#include <optional>
#include <thread>

namespace ai_gateway {

namespace {

struct ChunkFailure {
    size_t begin = 0;
    size_t end = 0;
    ErrorKind kind = ErrorKind::Internal;
    std::string message;
};

} // namespace

BatchCoordinator::BatchCoordinator(BatchOptions options)
    : options_(options)
{
    if (options_.chunk_size == 0) {
        throw GatewayError::bad_request("embedding chunk_size must be positive");
    }
    if (options_.max_concurrency == 0) {
        throw GatewayError::bad_request("embedding max_concurrency must be positive");
    }
}

size_t BatchCoordinator::chunk_count(size_t input_count, size_t chunk_size) const {
    size_t size = chunk_size == 0 ? options_.chunk_size : chunk_size;
    return (input_count + size - 1) / size;
}

EmbeddingBatchResult BatchCoordinator::embed_batch(const std::vector<std::string>& inputs,
                                                   size_t chunk_size,
                                                   const EmbedFn& embed,
                                                   const CancelScope& scope) const {
    const size_t size = chunk_size == 0 ? options_.chunk_size : chunk_size;
    const size_t total = inputs.size();

    EmbeddingBatchResult result;
    if (total == 0) {
        return result;
    }
    scope.throw_if_stopped();

    const size_t chunks = chunk_count(total, size);
    const size_t workers = std::min(options_.max_concurrency, chunks);

    result.vectors.resize(total);
    std::atomic<size_t> next_chunk{0};
    std::atomic<size_t> issued{0};
    std::atomic<bool> failed{false};
    std::mutex mutex;
    std::optional<ChunkFailure> failure;
    // 失败时取消同批次仍在进行的分片
    const CancelScope batch_scope = scope.child();

    auto record_failure = [&](size_t begin, size_t end, ErrorKind kind, const std::string& message) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            // 多个分片同时失败时报告偏移最小的那个
            if (!failure || begin < failure->begin) {
                failure = ChunkFailure{begin, end, kind, message};
            }
            failed = true;
        }
        batch_scope.cancel();
    };

    auto worker = [&]() {
        while (!failed.load() && !batch_scope.stopped()) {
            size_t index = next_chunk.fetch_add(1);
            if (index >= chunks) {
                return;
            }
            const size_t begin = index * size;
            const size_t end = std::min(begin + size, total);
            std::vector<std::string> slice(inputs.begin() + begin, inputs.begin() + end);
            issued++;

            try {
                EmbeddingChunkResult chunk = embed(slice, begin, batch_scope);
                if (chunk.vectors.size() != end - begin) {
                    record_failure(begin, end, ErrorKind::UpstreamError,
                                   "upstream returned " + std::to_string(chunk.vectors.size()) +
                                   " embeddings for " + std::to_string(end - begin) + " inputs");
                    return;
                }
                std::lock_guard<std::mutex> lock(mutex);
                for (size_t i = 0; i < chunk.vectors.size(); ++i) {
                    result.vectors[begin + i] = std::move(chunk.vectors[i]);
                }
                result.usage += chunk.usage;
            } catch (const GatewayError& e) {
                // 被其他分片的失败连带取消，不覆盖真正的失败原因
                if (e.kind() == ErrorKind::Cancelled && (failed.load() || scope.stopped())) {
                    return;
                }
                if (!e.detail().empty()) {
                    spdlog::debug("embedding chunk [{}, {}) detail: {}", begin, end, e.detail());
                }
                record_failure(begin, end, e.kind(), e.public_message());
                return;
            } catch (const std::exception& e) {
                spdlog::error("embedding chunk [{}, {}) failed: {}", begin, end, e.what());
                record_failure(begin, end, ErrorKind::Internal, "Internal server error");
                return;
            }
        }
    };

    std::vector<std::thread> threads;
    threads.reserve(workers - 1);
    for (size_t i = 1; i < workers; ++i) {
        threads.emplace_back(worker);
    }
    worker();
    for (auto& t : threads) {
        t.join();
    }

    result.chunk_calls = issued.load();

    if (failure) {
        spdlog::warn("embedding batch failed at inputs [{}, {}): {}",
                     failure->begin, failure->end, failure->message);
        throw BatchError(failure->kind, failure->message, failure->begin, failure->end);
    }
    scope.throw_if_stopped();
    return result;
}

} // namespace ai_gateway
