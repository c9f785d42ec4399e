#pragma once

#include "lucid/configuration/pipeline_options.hpp"
#include "lucid/configuration/session_config.hpp"
#include "lucid/core/result.hpp"
#include "lucid/core/failures.hpp"
#include "lucid/core/types.hpp"
#include "lucid/interfaces/i_anchor_chain.hpp"
#include "lucid/interfaces/i_chunk_store.hpp"
#include "lucid/interfaces/i_manifest_store.hpp"
#include "lucid/interfaces/i_master_secret_provider.hpp"
#include "lucid/models/anchor_record.hpp"
#include "lucid/anchor/stop_signal.hpp"
#include "lucid/models/session_manifest.hpp"
#include "lucid/pipeline/merkle_builder.hpp"
#include "lucid/pipeline/session_pipeline.hpp"
#include "lucid/pipeline/session_verifier.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <thread>
#include <vector>

namespace lucid::pipeline {

/// Snapshot of one session for operators and tests.
struct SessionInfo {
    SessionId session_id;
    std::string owner;
    SessionState state = SessionState::Created;
    Timestamp created_at{};
    Timestamp deadline{};
    configuration::SessionConfig config;
    PipelineStatistics statistics;
    uint32_t anchor_attempts = 0;
    std::optional<PipelineFailure> last_error;
    std::optional<models::SessionManifest> manifest;
    std::optional<models::AnchorRecord> anchor;
};

/**
 * @brief Owns every live session and drives it through its lifecycle
 *
 * ```
 * CREATED -> RECORDING -> SEALING -> ANCHOR_PENDING -> ANCHORED
 *     \          \            \             \
 *      '----------'------------'-------------'--> FAILED | EXPIRED
 * ```
 *
 * **Sessions**:
 * Each session has its own SessionPipeline and, once sealed, its own
 * anchoring thread. Sessions share nothing but the chunk store and the
 * manifest store; the context map is keyed by SessionId and owned here.
 *
 * **Sealing**:
 * EndStream() drains the pipeline, builds and hashes the manifest, signs it
 * when a signer is configured and saves the sealed record before any chain
 * call. Only then does the session become ANCHOR_PENDING.
 *
 * **Anchoring**:
 * With PipelineOptions::auto_anchor the manifest is anchored on a
 * background thread right after sealing. A session whose anchoring runs out
 * of retries stays ANCHOR_PENDING; RetryPendingAnchors() picks it up again,
 * and RecoverFromStore() reloads pending records after a restart.
 *
 * **Termination**:
 * FAILED and EXPIRED are terminal. Entering either stops the pipeline,
 * discards queued work and wipes the session key.
 *
 * All public methods are thread-safe.
 */
class SessionOrchestrator {
public:
    static Result<std::unique_ptr<SessionOrchestrator>, PipelineFailure> Create(
        interfaces::IChunkStore& chunks,
        interfaces::IManifestStore& records,
        interfaces::IAnchorChain& chain,
        interfaces::IMasterSecretProvider& secrets,
        configuration::PipelineOptions options = configuration::PipelineOptions::Default());

    [[nodiscard]] Result<SessionId, PipelineFailure> CreateSession(
        const std::string& owner,
        const configuration::SessionConfig& config = configuration::SessionConfig::Default());

    /// Blocks while the session's pipeline is full. Empty input is accepted
    /// and changes nothing.
    [[nodiscard]] Result<Unit, PipelineFailure> SubmitBytes(
        const SessionId& session_id,
        std::span<const uint8_t> data);

    [[nodiscard]] Result<Unit, PipelineFailure> EndStream(const SessionId& session_id);

    [[nodiscard]] Result<SessionState, PipelineFailure> GetStatus(const SessionId& session_id);

    [[nodiscard]] Result<SessionInfo, PipelineFailure> GetSessionInfo(const SessionId& session_id);

    /// Operator cancel: FAILED with category Cancelled.
    [[nodiscard]] Result<Unit, PipelineFailure> AbortSession(const SessionId& session_id);

    /// Moves every overdue, not yet anchored session to EXPIRED. Returns how
    /// many sessions expired.
    size_t SweepExpired();

    /// Runs anchoring on the calling thread for every ANCHOR_PENDING session
    /// that is not already being anchored. Returns how many became ANCHORED.
    size_t RetryPendingAnchors();

    /// Loads sealed records that have no live context (after a restart).
    /// Confirmed ones come back ANCHORED, the rest ANCHOR_PENDING.
    [[nodiscard]] Result<size_t, PipelineFailure> RecoverFromStore();

    /// Deletes chunks and records of terminal sessions whose retention period
    /// has passed and forgets them.
    [[nodiscard]] Result<size_t, PipelineFailure> PurgeExpiredRetention();

    /// Re-reads, authenticates and decrypts the sealed session, streaming
    /// the plaintext to @p sink in chunk order.
    [[nodiscard]] Result<VerificationReport, PipelineFailure> VerifySession(
        const SessionId& session_id,
        const PlaintextSink& sink = {});

    /// Inclusion proof of chunk @p index under the sealed manifest root.
    [[nodiscard]] Result<std::vector<HashStep>, PipelineFailure> ChunkProof(
        const SessionId& session_id,
        uint64_t index);

    /// Blocks until no anchoring thread is running for the session.
    [[nodiscard]] Result<SessionState, PipelineFailure> WaitForAnchoring(const SessionId& session_id);

    [[nodiscard]] size_t SessionCount() const;

    SessionOrchestrator(const SessionOrchestrator&) = delete;
    SessionOrchestrator& operator=(const SessionOrchestrator&) = delete;
    SessionOrchestrator(SessionOrchestrator&&) = delete;
    SessionOrchestrator& operator=(SessionOrchestrator&&) = delete;
    ~SessionOrchestrator();

private:
    struct SessionContext {
        SessionId id;
        std::string owner;
        configuration::SessionConfig config;
        Timestamp created_at{};
        Timestamp deadline{};

        std::mutex submit_lock;

        std::mutex lock;
        std::condition_variable anchoring_done;
        SessionState state = SessionState::Created;
        std::optional<PipelineFailure> last_error;
        std::unique_ptr<SessionPipeline> pipeline;
        std::optional<models::SealedRecord> record;
        std::optional<models::AnchorRecord> anchor;
        bool anchoring = false;
        std::thread anchor_thread;
        anchor::StopSignal stop_anchoring;
    };

    using ContextPtr = std::shared_ptr<SessionContext>;

    SessionOrchestrator(
        interfaces::IChunkStore& chunks,
        interfaces::IManifestStore& records,
        interfaces::IAnchorChain& chain,
        interfaces::IMasterSecretProvider& secrets,
        configuration::PipelineOptions options);

    [[nodiscard]] Result<ContextPtr, PipelineFailure> Find(const SessionId& session_id) const;
    [[nodiscard]] std::vector<ContextPtr> Snapshot() const;

    Result<models::SealedRecord, PipelineFailure> Seal(const ContextPtr& context, PipelineSummary summary);

    /// Moves a non-terminal session to @p terminal and stops its work.
    /// Returns false when the session already ended.
    bool Terminate(const ContextPtr& context, SessionState terminal, const PipelineFailure& reason);
    bool ExpireIfOverdue(const ContextPtr& context);

    void StartAnchoring(const ContextPtr& context);
    bool RunAnchoring(const ContextPtr& context);

    Result<models::SealedRecord, PipelineFailure> SealedRecordOf(const ContextPtr& context);

    interfaces::IChunkStore& chunks_;
    interfaces::IManifestStore& records_;
    interfaces::IAnchorChain& chain_;
    interfaces::IMasterSecretProvider& secrets_;
    configuration::PipelineOptions options_;

    mutable std::mutex sessions_lock_;
    std::map<SessionId, ContextPtr> sessions_;
};

}
