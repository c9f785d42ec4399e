#include "lucid/pipeline/session_pipeline.hpp"
#include "lucid/core/format.hpp"
#include "lucid/debug/pipeline_logger.hpp"

#include <algorithm>

namespace lucid::pipeline {
using models::ChunkDescriptor;
using models::EncryptedChunk;
using models::RawChunk;

namespace {
    constexpr const char* COMPONENT = "pipeline";
}

// ============================================================================
// Construction
// ============================================================================

Result<std::unique_ptr<SessionPipeline>, PipelineFailure> SessionPipeline::Start(
    const SessionId& session_id,
    const configuration::SessionConfig& config,
    interfaces::IChunkStore& chunks,
    interfaces::IMasterSecretProvider& secrets,
    const configuration::PipelineOptions& options) {

    auto chunker_result = Chunker::Create(config);
    if (chunker_result.IsErr()) {
        return Result<std::unique_ptr<SessionPipeline>, PipelineFailure>::Err(
            std::move(chunker_result).UnwrapErr());
    }
    auto encryptor_result = Encryptor::Create(session_id, secrets);
    if (encryptor_result.IsErr()) {
        return Result<std::unique_ptr<SessionPipeline>, PipelineFailure>::Err(
            std::move(encryptor_result).UnwrapErr());
    }

    std::unique_ptr<SessionPipeline> pipeline(new SessionPipeline(
        session_id,
        std::move(chunker_result).Unwrap(),
        std::move(encryptor_result).Unwrap(),
        chunks,
        options));
    pipeline->Launch();
    return Result<std::unique_ptr<SessionPipeline>, PipelineFailure>::Ok(std::move(pipeline));
}

SessionPipeline::SessionPipeline(
    const SessionId& session_id,
    Chunker chunker,
    Encryptor encryptor,
    interfaces::IChunkStore& chunks,
    const configuration::PipelineOptions& options)
    : session_id_(session_id)
    , chunker_(std::move(chunker))
    , encryptor_(std::move(encryptor))
    , chunks_(chunks)
    , storage_retry_(options.storage_retry)
    , sleeper_(options.sleeper)
    , encrypt_queue_(options.queue_depth)
    , store_queue_(options.queue_depth)
    , merkle_queue_(options.queue_depth) {
}

SessionPipeline::~SessionPipeline() {
    Cancel(PipelineFailure::Cancelled("Pipeline destroyed"));
}

void SessionPipeline::Launch() {
    encrypt_thread_ = std::thread([this] { RunEncryptStage(); });
    store_thread_ = std::thread([this] { RunStoreStage(); });
    merkle_thread_ = std::thread([this] { RunMerkleStage(); });
}

// ============================================================================
// Caller side
// ============================================================================

Result<Unit, PipelineFailure> SessionPipeline::Submit(const std::span<const uint8_t> data) {
    if (cancelled_.load()) {
        return Result<Unit, PipelineFailure>::Err(
            CurrentFailureOr(PipelineFailure::Cancelled("Pipeline stopped")));
    }
    bytes_in_.fetch_add(data.size());
    auto appended = chunker_.Append(data, [this](RawChunk&& chunk) {
        chunks_emitted_.fetch_add(1);
        if (!encrypt_queue_.Push(std::move(chunk))) {
            return Result<Unit, PipelineFailure>::Err(
                CurrentFailureOr(PipelineFailure::Cancelled("Pipeline stopped")));
        }
        return Result<Unit, PipelineFailure>::Ok(unit);
    });
    if (appended.IsErr()) {
        Fail(appended.UnwrapErr());
        return Result<Unit, PipelineFailure>::Err(CurrentFailureOr(appended.UnwrapErr()));
    }
    return Result<Unit, PipelineFailure>::Ok(unit);
}

Result<PipelineSummary, PipelineFailure> SessionPipeline::Finish() {
    {
        std::lock_guard guard(state_lock_);
        if (finished_) {
            return Result<PipelineSummary, PipelineFailure>::Err(
                PipelineFailure::InputError(std::string(ErrorMessages::SESSION_ALREADY_SEALED)));
        }
        finished_ = true;
    }

    if (!cancelled_.load()) {
        auto flushed = chunker_.Finish([this](RawChunk&& chunk) {
            chunks_emitted_.fetch_add(1);
            if (!encrypt_queue_.Push(std::move(chunk))) {
                return Result<Unit, PipelineFailure>::Err(
                    CurrentFailureOr(PipelineFailure::Cancelled("Pipeline stopped")));
            }
            return Result<Unit, PipelineFailure>::Ok(unit);
        });
        if (flushed.IsErr()) {
            Fail(flushed.UnwrapErr());
        }
    }
    encrypt_queue_.Close();
    JoinStages();
    encryptor_.Wipe();

    if (auto failure = GetFailure(); failure.has_value()) {
        return Result<PipelineSummary, PipelineFailure>::Err(std::move(*failure));
    }

    const uint64_t chunk_count = chunker_.NextIndex();
    auto root = merkle_.Finalize(chunk_count);
    if (root.IsErr()) {
        Fail(root.UnwrapErr());
        return Result<PipelineSummary, PipelineFailure>::Err(std::move(root).UnwrapErr());
    }

    PipelineSummary summary;
    summary.chunk_count = chunk_count;
    summary.merkle_root = root.Unwrap();
    {
        std::lock_guard guard(state_lock_);
        summary.chunks = descriptors_;
    }
    if (summary.chunks.size() != chunk_count || chunks_stored_.load() != chunk_count) {
        auto failure = PipelineFailure::MerkleStateError(
            compat::format("Drained {} encrypted and {} stored chunks, expected {}",
                summary.chunks.size(), chunks_stored_.load(), chunk_count));
        Fail(failure);
        return Result<PipelineSummary, PipelineFailure>::Err(std::move(failure));
    }
    for (const auto& descriptor : summary.chunks) {
        summary.total_plaintext_size += descriptor.plaintext_size;
        summary.total_ciphertext_size += descriptor.ciphertext_size;
    }
    summary.statistics = GetStatistics();
    LUCID_LOG_DEBUG(COMPONENT, "session {}: drained {} chunk(s), {} -> {} bytes",
                    session_id_.ToHex(), chunk_count,
                    summary.total_plaintext_size, summary.total_ciphertext_size);
    return Result<PipelineSummary, PipelineFailure>::Ok(std::move(summary));
}

void SessionPipeline::Cancel(const PipelineFailure& reason) {
    Fail(reason);
    JoinStages();
    encryptor_.Wipe();
}

PipelineStatistics SessionPipeline::GetStatistics() const {
    PipelineStatistics stats;
    stats.bytes_in = bytes_in_.load();
    stats.chunks_emitted = chunks_emitted_.load();
    stats.chunks_stored = chunks_stored_.load();
    stats.compressed_bytes = compressed_bytes_.load();
    stats.ciphertext_bytes = ciphertext_bytes_.load();
    stats.storage_retries = storage_retries_.load();
    return stats;
}

std::optional<PipelineFailure> SessionPipeline::GetFailure() const {
    std::lock_guard guard(state_lock_);
    return failure_;
}

// ============================================================================
// Stages
// ============================================================================

void SessionPipeline::RunEncryptStage() {
    while (auto raw = encrypt_queue_.Pop()) {
        const uint64_t compressed_size = raw->payload.size();
        auto encrypted = encryptor_.Encrypt(std::move(*raw));
        if (encrypted.IsErr()) {
            Fail(encrypted.UnwrapErr());
            break;
        }
        auto chunk = std::make_shared<const EncryptedChunk>(std::move(encrypted).Unwrap());

        ChunkDescriptor descriptor;
        descriptor.index = chunk->index;
        descriptor.plaintext_size = chunk->plaintext_size;
        descriptor.compressed_size = compressed_size;
        descriptor.ciphertext_size = chunk->ciphertext.size();
        descriptor.plaintext_hash = chunk->plaintext_hash;
        descriptor.ciphertext_hash = chunk->ciphertext_hash;
        {
            std::lock_guard guard(state_lock_);
            descriptors_.push_back(descriptor);
        }
        compressed_bytes_.fetch_add(compressed_size);
        ciphertext_bytes_.fetch_add(descriptor.ciphertext_size);

        if (!store_queue_.Push(chunk) || !merkle_queue_.Push(chunk)) {
            break;
        }
    }
    store_queue_.Close();
    merkle_queue_.Close();
}

void SessionPipeline::RunStoreStage() {
    while (auto chunk = store_queue_.Pop()) {
        auto stored = PutWithRetry(**chunk);
        if (stored.IsErr()) {
            const auto& failure = stored.UnwrapErr();
            LUCID_LOG_ERROR(COMPONENT, "session {}: chunk {} not stored ({}: {})",
                            session_id_.ToHex(), (*chunk)->index, ToString(failure.type), failure.message);
            Fail(PipelineFailure::StorageWriteError(
                compat::format("Chunk {}: {} ({})", (*chunk)->index, failure.message, ToString(failure.type))));
            break;
        }
        chunks_stored_.fetch_add(1);
    }
}

void SessionPipeline::RunMerkleStage() {
    while (auto chunk = merkle_queue_.Pop()) {
        auto added = merkle_.AddLeaf((*chunk)->index, (*chunk)->ciphertext_hash);
        if (added.IsErr()) {
            Fail(added.UnwrapErr());
            break;
        }
    }
}

Result<Unit, StoreFailure> SessionPipeline::PutWithRetry(const EncryptedChunk& chunk) {
    const uint32_t attempts = std::max<uint32_t>(storage_retry_.max_attempts, 1);
    for (uint32_t attempt = 1;; ++attempt) {
        auto put = chunks_.Put(session_id_, chunk.index, chunk.ciphertext, chunk.nonce, chunk.tag);
        if (put.IsOk()) {
            return put;
        }
        const auto& failure = put.UnwrapErr();
        if (!failure.IsRetryable() || attempt >= attempts || cancelled_.load()) {
            return put;
        }
        storage_retries_.fetch_add(1);
        const auto delay = storage_retry_.BackoffAfter(attempt);
        LUCID_LOG_WARN(COMPONENT, "session {}: chunk {} put attempt {}/{} failed ({}), retrying in {} ms",
                       session_id_.ToHex(), chunk.index, attempt, attempts, failure.message, delay.count());
        sleeper_(delay);
    }
}

// ============================================================================
// Failure propagation
// ============================================================================

void SessionPipeline::Fail(const PipelineFailure& failure) {
    {
        std::lock_guard guard(state_lock_);
        if (!failure_.has_value()) {
            failure_ = failure;
        }
    }
    cancelled_.store(true);
    encrypt_queue_.Cancel();
    store_queue_.Cancel();
    merkle_queue_.Cancel();
}

PipelineFailure SessionPipeline::CurrentFailureOr(const PipelineFailure& fallback) const {
    std::lock_guard guard(state_lock_);
    return failure_.value_or(fallback);
}

void SessionPipeline::JoinStages() {
    std::lock_guard guard(join_lock_);
    for (auto* stage : {&encrypt_thread_, &store_thread_, &merkle_thread_}) {
        if (stage->joinable()) {
            stage->join();
        }
    }
}

}
