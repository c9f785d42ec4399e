#pragma once

#include "lucid/configuration/pipeline_options.hpp"
#include "lucid/configuration/session_config.hpp"
#include "lucid/core/result.hpp"
#include "lucid/core/failures.hpp"
#include "lucid/core/types.hpp"
#include "lucid/interfaces/i_chunk_store.hpp"
#include "lucid/interfaces/i_master_secret_provider.hpp"
#include "lucid/models/chunk.hpp"
#include "lucid/pipeline/bounded_queue.hpp"
#include "lucid/pipeline/chunker.hpp"
#include "lucid/pipeline/encryptor.hpp"
#include "lucid/pipeline/merkle_builder.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <thread>
#include <vector>

namespace lucid::pipeline {

struct PipelineStatistics {
    uint64_t bytes_in = 0;
    uint64_t chunks_emitted = 0;
    uint64_t chunks_stored = 0;
    uint64_t compressed_bytes = 0;
    uint64_t ciphertext_bytes = 0;
    uint64_t storage_retries = 0;
};

/// What a drained pipeline hands to the manifest builder.
struct PipelineSummary {
    uint64_t chunk_count = 0;
    uint64_t total_plaintext_size = 0;
    uint64_t total_ciphertext_size = 0;
    Hash256 merkle_root{};
    std::vector<models::ChunkDescriptor> chunks;
    PipelineStatistics statistics;
};

/**
 * @brief The four stages of one session, wired with bounded queues
 *
 * ```
 * Submit() [caller]  -> Chunker -> encrypt queue -> Encryptor thread
 *                                                     |-> store queue  -> writer thread (IChunkStore::Put)
 *                                                     '-> merkle queue -> merkle thread (MerkleBuilder)
 * ```
 *
 * Chunking runs on the submitting thread; a full encrypt queue blocks it.
 * The first failure in any stage is kept and every queue is cancelled, so
 * the remaining stages stop promptly. Finish() is the drain barrier: it
 * flushes the chunker, lets the stages empty their queues, joins them and
 * finalizes the Merkle root. The session key is wiped as soon as the
 * stages have stopped, whether by Finish() or Cancel().
 *
 * Submit() and Finish() must not be called concurrently with each other;
 * Cancel() may be called from any thread at any time.
 */
class SessionPipeline {
public:
    static Result<std::unique_ptr<SessionPipeline>, PipelineFailure> Start(
        const SessionId& session_id,
        const configuration::SessionConfig& config,
        interfaces::IChunkStore& chunks,
        interfaces::IMasterSecretProvider& secrets,
        const configuration::PipelineOptions& options);

    Result<Unit, PipelineFailure> Submit(std::span<const uint8_t> data);

    Result<PipelineSummary, PipelineFailure> Finish();

    /// Drops queued work, stops every stage and wipes the key. The first
    /// call records @p reason unless a stage already failed.
    void Cancel(const PipelineFailure& reason);

    [[nodiscard]] PipelineStatistics GetStatistics() const;

    [[nodiscard]] std::optional<PipelineFailure> GetFailure() const;

    SessionPipeline(const SessionPipeline&) = delete;
    SessionPipeline& operator=(const SessionPipeline&) = delete;
    SessionPipeline(SessionPipeline&&) = delete;
    SessionPipeline& operator=(SessionPipeline&&) = delete;
    ~SessionPipeline();

private:
    using SharedChunk = std::shared_ptr<const models::EncryptedChunk>;

    SessionPipeline(
        const SessionId& session_id,
        Chunker chunker,
        Encryptor encryptor,
        interfaces::IChunkStore& chunks,
        const configuration::PipelineOptions& options);

    void Launch();
    void RunEncryptStage();
    void RunStoreStage();
    void RunMerkleStage();
    Result<Unit, StoreFailure> PutWithRetry(const models::EncryptedChunk& chunk);

    void Fail(const PipelineFailure& failure);
    PipelineFailure CurrentFailureOr(const PipelineFailure& fallback) const;
    void JoinStages();

    SessionId session_id_;
    Chunker chunker_;
    Encryptor encryptor_;
    interfaces::IChunkStore& chunks_;
    configuration::RetryPolicy storage_retry_;
    configuration::Sleeper sleeper_;

    BoundedQueue<models::RawChunk> encrypt_queue_;
    BoundedQueue<SharedChunk> store_queue_;
    BoundedQueue<SharedChunk> merkle_queue_;
    MerkleBuilder merkle_;

    std::thread encrypt_thread_;
    std::thread store_thread_;
    std::thread merkle_thread_;
    std::mutex join_lock_;

    mutable std::mutex state_lock_;
    std::optional<PipelineFailure> failure_;
    std::vector<models::ChunkDescriptor> descriptors_;
    bool finished_ = false;

    std::atomic<bool> cancelled_{false};
    std::atomic<uint64_t> bytes_in_{0};
    std::atomic<uint64_t> chunks_emitted_{0};
    std::atomic<uint64_t> chunks_stored_{0};
    std::atomic<uint64_t> compressed_bytes_{0};
    std::atomic<uint64_t> ciphertext_bytes_{0};
    std::atomic<uint64_t> storage_retries_{0};
};

}
