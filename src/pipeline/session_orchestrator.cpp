#include "lucid/pipeline/session_orchestrator.hpp"
#include "lucid/anchor/anchor_client.hpp"
#include "lucid/crypto/manifest_signer.hpp"
#include "lucid/crypto/sodium_interop.hpp"
#include "lucid/core/format.hpp"
#include "lucid/debug/pipeline_logger.hpp"

#include <algorithm>

namespace lucid::pipeline {
using crypto::SodiumInterop;
using models::AnchorRecord;
using models::SealedRecord;

namespace {
    constexpr const char* COMPONENT = "orchestrator";

    Timestamp TruncateToMillis(const Timestamp ts) {
        return encoding::FromUnixMillis(encoding::ToUnixMillis(ts));
    }

    std::chrono::hours RetentionPeriod(const uint32_t days) {
        return std::chrono::hours(24) * days;
    }

    PipelineFailure NotSealed(const SessionState state) {
        return PipelineFailure::InputError(
            compat::format("Session is not sealed (state {})", ToString(state)));
    }
}

// ============================================================================
// Construction
// ============================================================================

Result<std::unique_ptr<SessionOrchestrator>, PipelineFailure> SessionOrchestrator::Create(
    interfaces::IChunkStore& chunks,
    interfaces::IManifestStore& records,
    interfaces::IAnchorChain& chain,
    interfaces::IMasterSecretProvider& secrets,
    configuration::PipelineOptions options) {

    if (auto init = SodiumInterop::Initialize(); init.IsErr()) {
        return Result<std::unique_ptr<SessionOrchestrator>, PipelineFailure>::Err(
            PipelineFailure::FromSodiumFailure(init.UnwrapErr()));
    }
    if (!options.clock || !options.sleeper || !options.session_ids) {
        return Result<std::unique_ptr<SessionOrchestrator>, PipelineFailure>::Err(
            PipelineFailure::InputError("PipelineOptions needs a clock, a sleeper and a session id source"));
    }
    return Result<std::unique_ptr<SessionOrchestrator>, PipelineFailure>::Ok(
        std::unique_ptr<SessionOrchestrator>(
            new SessionOrchestrator(chunks, records, chain, secrets, std::move(options))));
}

SessionOrchestrator::SessionOrchestrator(
    interfaces::IChunkStore& chunks,
    interfaces::IManifestStore& records,
    interfaces::IAnchorChain& chain,
    interfaces::IMasterSecretProvider& secrets,
    configuration::PipelineOptions options)
    : chunks_(chunks)
    , records_(records)
    , chain_(chain)
    , secrets_(secrets)
    , options_(std::move(options)) {
}

SessionOrchestrator::~SessionOrchestrator() {
    for (const auto& context : Snapshot()) {
        std::thread anchor_thread;
        {
            std::lock_guard guard(context->lock);
            context->stop_anchoring.Request();
            anchor_thread = std::move(context->anchor_thread);
        }
        if (context->pipeline) {
            context->pipeline->Cancel(PipelineFailure::Cancelled("Orchestrator shutting down"));
        }
        if (anchor_thread.joinable()) {
            anchor_thread.join();
        }
    }
}

// ============================================================================
// Session lifecycle
// ============================================================================

Result<SessionId, PipelineFailure> SessionOrchestrator::CreateSession(
    const std::string& owner,
    const configuration::SessionConfig& config) {

    if (auto valid = config.Validate(); valid.IsErr()) {
        return Result<SessionId, PipelineFailure>::Err(std::move(valid).UnwrapErr());
    }

    auto context = std::make_shared<SessionContext>();
    context->id = options_.session_ids();
    {
        std::lock_guard guard(sessions_lock_);
        if (sessions_.contains(context->id)) {
            return Result<SessionId, PipelineFailure>::Err(
                PipelineFailure::InputError(
                    compat::format("Session {} already exists", context->id.ToHex())));
        }
    }
    context->owner = owner;
    context->config = config;
    context->created_at = TruncateToMillis(options_.clock());
    context->deadline = context->created_at + config.session_ttl;

    auto pipeline = SessionPipeline::Start(context->id, config, chunks_, secrets_, options_);
    if (pipeline.IsErr()) {
        LUCID_LOG_ERROR(COMPONENT, "session {}: pipeline start failed: {}",
                        context->id.ToHex(), pipeline.UnwrapErr().message);
        return Result<SessionId, PipelineFailure>::Err(std::move(pipeline).UnwrapErr());
    }
    context->pipeline = std::move(pipeline).Unwrap();

    const SessionId id = context->id;
    {
        std::lock_guard guard(sessions_lock_);
        sessions_.emplace(id, std::move(context));
    }
    LUCID_LOG_INFO(COMPONENT, "session {}: created for '{}' (chunks {}..{} bytes, zstd level {})",
                   id.ToHex(), owner, config.chunk_min, config.chunk_max, config.compression_level);
    return Result<SessionId, PipelineFailure>::Ok(id);
}

Result<Unit, PipelineFailure> SessionOrchestrator::SubmitBytes(
    const SessionId& session_id,
    const std::span<const uint8_t> data) {

    if (data.size() > options_.max_submission_bytes) {
        return Result<Unit, PipelineFailure>::Err(
            PipelineFailure::InputError(
                compat::format("{} ({} > {} bytes)", ErrorMessages::SUBMISSION_TOO_LARGE,
                    data.size(), options_.max_submission_bytes)));
    }
    auto found = Find(session_id);
    if (found.IsErr()) {
        return Result<Unit, PipelineFailure>::Err(std::move(found).UnwrapErr());
    }
    const ContextPtr context = std::move(found).Unwrap();

    std::lock_guard submit_guard(context->submit_lock);
    ExpireIfOverdue(context);

    SessionPipeline* pipeline = nullptr;
    {
        std::lock_guard guard(context->lock);
        if (!AcceptsInput(context->state)) {
            return Result<Unit, PipelineFailure>::Err(
                PipelineFailure::InputError(
                    compat::format("{} {}", ErrorMessages::SESSION_NOT_ACCEPTING_INPUT, ToString(context->state))));
        }
        if (data.empty()) {
            return Result<Unit, PipelineFailure>::Ok(unit);
        }
        if (context->state == SessionState::Created) {
            context->state = SessionState::Recording;
            LUCID_LOG_DEBUG(COMPONENT, "session {}: recording", session_id.ToHex());
        }
        pipeline = context->pipeline.get();
    }

    auto submitted = pipeline->Submit(data);
    if (submitted.IsErr()) {
        Terminate(context, SessionState::Failed, submitted.UnwrapErr());
        return submitted;
    }
    return Result<Unit, PipelineFailure>::Ok(unit);
}

Result<Unit, PipelineFailure> SessionOrchestrator::EndStream(const SessionId& session_id) {
    auto found = Find(session_id);
    if (found.IsErr()) {
        return Result<Unit, PipelineFailure>::Err(std::move(found).UnwrapErr());
    }
    const ContextPtr context = std::move(found).Unwrap();

    std::lock_guard submit_guard(context->submit_lock);
    ExpireIfOverdue(context);

    SessionPipeline* pipeline = nullptr;
    {
        std::lock_guard guard(context->lock);
        switch (context->state) {
            case SessionState::Sealing:
            case SessionState::AnchorPending:
            case SessionState::Anchored:
                return Result<Unit, PipelineFailure>::Err(
                    PipelineFailure::InputError(std::string(ErrorMessages::SESSION_ALREADY_SEALED)));
            case SessionState::Failed:
            case SessionState::Expired:
                return Result<Unit, PipelineFailure>::Err(
                    PipelineFailure::InputError(
                        compat::format("Session already ended in state {}", ToString(context->state))));
            case SessionState::Created:
            case SessionState::Recording:
                break;
        }
        context->state = SessionState::Sealing;
        pipeline = context->pipeline.get();
    }
    LUCID_LOG_DEBUG(COMPONENT, "session {}: sealing", session_id.ToHex());

    auto drained = pipeline->Finish();
    if (drained.IsErr()) {
        Terminate(context, SessionState::Failed, drained.UnwrapErr());
        return Result<Unit, PipelineFailure>::Err(std::move(drained).UnwrapErr());
    }
    auto sealed = Seal(context, std::move(drained).Unwrap());
    if (sealed.IsErr()) {
        Terminate(context, SessionState::Failed, sealed.UnwrapErr());
        return Result<Unit, PipelineFailure>::Err(std::move(sealed).UnwrapErr());
    }

    {
        std::lock_guard guard(context->lock);
        if (context->state != SessionState::Sealing) {
            return Result<Unit, PipelineFailure>::Err(
                context->last_error.value_or(PipelineFailure::Cancelled("Session ended while sealing")));
        }
        context->record = std::move(sealed).Unwrap();
        context->state = SessionState::AnchorPending;
        LUCID_LOG_INFO(COMPONENT, "session {}: sealed, {} chunk(s), {} plaintext bytes, root {}",
                       session_id.ToHex(), context->record->manifest.chunk_count,
                       context->record->manifest.total_plaintext_size,
                       encoding::ToHex(context->record->manifest.merkle_root));
    }

    if (options_.auto_anchor) {
        StartAnchoring(context);
    }
    return Result<Unit, PipelineFailure>::Ok(unit);
}

Result<SealedRecord, PipelineFailure> SessionOrchestrator::Seal(
    const ContextPtr& context,
    PipelineSummary summary) {

    SealedRecord record;
    auto& manifest = record.manifest;
    manifest.session_id = context->id;
    manifest.chunk_count = summary.chunk_count;
    manifest.total_plaintext_size = summary.total_plaintext_size;
    manifest.total_ciphertext_size = summary.total_ciphertext_size;
    manifest.merkle_root = summary.merkle_root;
    manifest.started_at = context->created_at;
    manifest.ended_at = TruncateToMillis(options_.clock());
    manifest.compression_enabled = context->config.CompressionEnabled();
    manifest.Seal();

    record.owner = context->owner;
    record.created_at = context->created_at;
    record.expires_at = context->deadline;
    record.retention_days = context->config.retention_days;
    record.anchor_retry_limit = context->config.anchor_retry_limit;
    record.chunks = std::move(summary.chunks);

    if (options_.signer) {
        auto signature = options_.signer->Sign(manifest.manifest_hash);
        if (signature.IsErr()) {
            return Result<SealedRecord, PipelineFailure>::Err(
                PipelineFailure::FromSodiumFailure(signature.UnwrapErr()));
        }
        record.signature = signature.Unwrap();
        record.signer_public_key = options_.signer->PublicKey();
    }

    const uint32_t attempts = std::max<uint32_t>(options_.storage_retry.max_attempts, 1);
    for (uint32_t attempt = 1;; ++attempt) {
        auto saved = records_.SaveRecord(record);
        if (saved.IsOk()) {
            break;
        }
        const auto& failure = saved.UnwrapErr();
        if (!failure.IsRetryable() || attempt >= attempts) {
            return Result<SealedRecord, PipelineFailure>::Err(
                PipelineFailure::StorageWriteError("Saving sealed record failed: " + failure.message));
        }
        options_.sleeper(options_.storage_retry.BackoffAfter(attempt));
    }
    return Result<SealedRecord, PipelineFailure>::Ok(std::move(record));
}

Result<SessionState, PipelineFailure> SessionOrchestrator::GetStatus(const SessionId& session_id) {
    auto found = Find(session_id);
    if (found.IsErr()) {
        return Result<SessionState, PipelineFailure>::Err(std::move(found).UnwrapErr());
    }
    const ContextPtr context = std::move(found).Unwrap();
    ExpireIfOverdue(context);
    std::lock_guard guard(context->lock);
    return Result<SessionState, PipelineFailure>::Ok(context->state);
}

Result<SessionInfo, PipelineFailure> SessionOrchestrator::GetSessionInfo(const SessionId& session_id) {
    auto found = Find(session_id);
    if (found.IsErr()) {
        return Result<SessionInfo, PipelineFailure>::Err(std::move(found).UnwrapErr());
    }
    const ContextPtr context = std::move(found).Unwrap();
    ExpireIfOverdue(context);

    SessionInfo info;
    info.session_id = context->id;
    info.owner = context->owner;
    info.created_at = context->created_at;
    info.deadline = context->deadline;
    info.config = context->config;

    std::lock_guard guard(context->lock);
    info.state = context->state;
    info.last_error = context->last_error;
    if (context->pipeline) {
        info.statistics = context->pipeline->GetStatistics();
    }
    if (context->record) {
        info.manifest = context->record->manifest;
    }
    if (context->anchor) {
        info.anchor = context->anchor;
        info.anchor_attempts = context->anchor->submit_attempts;
    }
    return Result<SessionInfo, PipelineFailure>::Ok(std::move(info));
}

Result<Unit, PipelineFailure> SessionOrchestrator::AbortSession(const SessionId& session_id) {
    auto found = Find(session_id);
    if (found.IsErr()) {
        return Result<Unit, PipelineFailure>::Err(std::move(found).UnwrapErr());
    }
    const ContextPtr context = std::move(found).Unwrap();
    if (!Terminate(context, SessionState::Failed, PipelineFailure::Cancelled("Aborted by operator"))) {
        std::lock_guard guard(context->lock);
        return Result<Unit, PipelineFailure>::Err(
            PipelineFailure::InputError(
                compat::format("Session already ended in state {}", ToString(context->state))));
    }
    return Result<Unit, PipelineFailure>::Ok(unit);
}

bool SessionOrchestrator::Terminate(
    const ContextPtr& context,
    const SessionState terminal,
    const PipelineFailure& reason) {

    SessionPipeline* pipeline = nullptr;
    SessionState previous = SessionState::Created;
    {
        std::lock_guard guard(context->lock);
        if (IsTerminal(context->state)) {
            return false;
        }
        previous = context->state;
        context->state = terminal;
        context->last_error = reason;
        context->stop_anchoring.Request();
        pipeline = context->pipeline.get();
    }
    if (pipeline != nullptr) {
        pipeline->Cancel(reason);
    }
    LUCID_LOG_WARN(COMPONENT, "session {}: {} -> {} ({}: {})",
                   context->id.ToHex(), ToString(previous), ToString(terminal),
                   ToString(reason.type), reason.message);
    return true;
}

bool SessionOrchestrator::ExpireIfOverdue(const ContextPtr& context) {
    const Timestamp now = options_.clock();
    {
        std::lock_guard guard(context->lock);
        if (IsTerminal(context->state) || now < context->deadline) {
            return false;
        }
    }
    return Terminate(context, SessionState::Expired,
                     PipelineFailure::Expired("Session deadline passed before anchoring"));
}

size_t SessionOrchestrator::SweepExpired() {
    size_t expired = 0;
    for (const auto& context : Snapshot()) {
        if (ExpireIfOverdue(context)) {
            ++expired;
        }
    }
    if (expired > 0) {
        LUCID_LOG_INFO(COMPONENT, "expired {} session(s)", expired);
    }
    return expired;
}

// ============================================================================
// Anchoring
// ============================================================================

void SessionOrchestrator::StartAnchoring(const ContextPtr& context) {
    std::thread previous;
    {
        std::lock_guard guard(context->lock);
        if (context->anchoring || context->state != SessionState::AnchorPending) {
            return;
        }
        context->anchoring = true;
        previous = std::move(context->anchor_thread);
        context->anchor_thread = std::thread([this, context] { RunAnchoring(context); });
    }
    if (previous.joinable()) {
        previous.join();
    }
}

bool SessionOrchestrator::RunAnchoring(const ContextPtr& context) {
    models::SessionManifest manifest;
    uint32_t round_limit = 0;
    {
        std::lock_guard guard(context->lock);
        if (!context->record) {
            context->anchoring = false;
            context->anchoring_done.notify_all();
            return false;
        }
        manifest = context->record->manifest;
        round_limit = std::max<uint32_t>(context->record->anchor_retry_limit, 1);
    }

    const anchor::AnchorClient client(chain_, records_, options_);
    auto outcome = client.Anchor(manifest, round_limit, &context->stop_anchoring);

    std::optional<AnchorRecord> latest;
    if (outcome.IsOk()) {
        latest = outcome.Unwrap();
    } else if (auto loaded = records_.LoadAnchorRecord(manifest.session_id); loaded.IsOk()) {
        latest = std::move(loaded).Unwrap();
    }

    bool anchored = false;
    bool mismatch = false;
    {
        std::lock_guard guard(context->lock);
        if (latest) {
            context->anchor = std::move(latest);
        }
        if (context->state == SessionState::AnchorPending) {
            if (outcome.IsOk()) {
                context->state = SessionState::Anchored;
                context->last_error.reset();
                anchored = true;
            } else {
                context->last_error = PipelineFailure::FromAnchorFailure(outcome.UnwrapErr());
                mismatch = outcome.UnwrapErr().type == AnchorFailureType::ManifestMismatch;
            }
        }
        context->anchoring = false;
    }
    context->anchoring_done.notify_all();

    if (anchored) {
        LUCID_LOG_INFO(COMPONENT, "session {}: anchored in {}",
                       manifest.session_id.ToHex(), outcome.Unwrap().tx_ref);
    } else if (mismatch) {
        Terminate(context, SessionState::Failed,
                  PipelineFailure::IntegrityError("Anchoring refused: " + outcome.UnwrapErr().message));
    } else if (outcome.IsErr()) {
        LUCID_LOG_WARN(COMPONENT, "session {}: still anchor-pending ({}: {})",
                       manifest.session_id.ToHex(), ToString(outcome.UnwrapErr().type),
                       outcome.UnwrapErr().message);
    }
    return anchored;
}

size_t SessionOrchestrator::RetryPendingAnchors() {
    size_t anchored = 0;
    for (const auto& context : Snapshot()) {
        ExpireIfOverdue(context);
        {
            std::lock_guard guard(context->lock);
            if (context->state != SessionState::AnchorPending || context->anchoring) {
                continue;
            }
            context->anchoring = true;
        }
        if (RunAnchoring(context)) {
            ++anchored;
        }
    }
    return anchored;
}

Result<SessionState, PipelineFailure> SessionOrchestrator::WaitForAnchoring(const SessionId& session_id) {
    auto found = Find(session_id);
    if (found.IsErr()) {
        return Result<SessionState, PipelineFailure>::Err(std::move(found).UnwrapErr());
    }
    const ContextPtr context = std::move(found).Unwrap();
    std::unique_lock lock(context->lock);
    context->anchoring_done.wait(lock, [&context] { return !context->anchoring; });
    return Result<SessionState, PipelineFailure>::Ok(context->state);
}

// ============================================================================
// Recovery and retention
// ============================================================================

Result<size_t, PipelineFailure> SessionOrchestrator::RecoverFromStore() {
    auto listed = records_.ListSessions();
    if (listed.IsErr()) {
        return Result<size_t, PipelineFailure>::Err(
            PipelineFailure::StorageReadError("Listing sealed records failed: " + listed.UnwrapErr().message));
    }

    size_t recovered = 0;
    for (const auto& session_id : listed.Unwrap()) {
        {
            std::lock_guard guard(sessions_lock_);
            if (sessions_.contains(session_id)) {
                continue;
            }
        }
        auto loaded = records_.LoadRecord(session_id);
        if (loaded.IsErr()) {
            LUCID_LOG_WARN(COMPONENT, "session {}: sealed record not recoverable: {}",
                           session_id.ToHex(), loaded.UnwrapErr().message);
            continue;
        }
        SealedRecord record = std::move(loaded).Unwrap();

        auto context = std::make_shared<SessionContext>();
        context->id = session_id;
        context->owner = record.owner;
        context->created_at = record.created_at;
        context->deadline = record.expires_at;
        context->config.retention_days = record.retention_days;
        context->config.anchor_retry_limit = record.anchor_retry_limit;
        if (!record.manifest.compression_enabled) {
            context->config.compression_level = ChunkConstants::COMPRESSION_DISABLED;
        }
        context->state = SessionState::AnchorPending;

        auto anchor_record = records_.LoadAnchorRecord(session_id);
        if (anchor_record.IsOk()) {
            context->anchor = std::move(anchor_record).Unwrap();
            if (context->anchor->IsConfirmed()) {
                context->state = SessionState::Anchored;
            }
        } else if (anchor_record.UnwrapErr().type != StoreFailureType::NotFound) {
            LUCID_LOG_WARN(COMPONENT, "session {}: anchor record unreadable, treating as pending: {}",
                           session_id.ToHex(), anchor_record.UnwrapErr().message);
        }
        context->record = std::move(record);

        const SessionState state = context->state;
        {
            std::lock_guard guard(sessions_lock_);
            if (!sessions_.emplace(session_id, std::move(context)).second) {
                continue;
            }
        }
        LUCID_LOG_INFO(COMPONENT, "session {}: recovered as {}", session_id.ToHex(), ToString(state));
        ++recovered;
    }
    return Result<size_t, PipelineFailure>::Ok(recovered);
}

Result<size_t, PipelineFailure> SessionOrchestrator::PurgeExpiredRetention() {
    const Timestamp now = options_.clock();
    size_t purged = 0;
    for (const auto& context : Snapshot()) {
        std::thread anchor_thread;
        {
            std::lock_guard guard(context->lock);
            if (!IsTerminal(context->state) || context->anchoring) {
                continue;
            }
            Timestamp retained_since = context->created_at;
            if (context->state == SessionState::Anchored) {
                if (context->anchor && context->anchor->confirmed_at) {
                    retained_since = *context->anchor->confirmed_at;
                } else if (context->record) {
                    retained_since = context->record->manifest.ended_at;
                }
            }
            if (now < retained_since + RetentionPeriod(context->config.retention_days)) {
                continue;
            }
            anchor_thread = std::move(context->anchor_thread);
        }
        if (anchor_thread.joinable()) {
            anchor_thread.join();
        }

        if (auto removed = chunks_.DeleteSession(context->id); removed.IsErr()) {
            return Result<size_t, PipelineFailure>::Err(
                PipelineFailure::StorageWriteError(
                    compat::format("Deleting chunks of {} failed: {}", context->id.ToHex(),
                        removed.UnwrapErr().message)));
        }
        if (auto removed = records_.DeleteSession(context->id); removed.IsErr()) {
            return Result<size_t, PipelineFailure>::Err(
                PipelineFailure::StorageWriteError(
                    compat::format("Deleting records of {} failed: {}", context->id.ToHex(),
                        removed.UnwrapErr().message)));
        }
        {
            std::lock_guard guard(sessions_lock_);
            sessions_.erase(context->id);
        }
        LUCID_LOG_INFO(COMPONENT, "session {}: retention over, purged", context->id.ToHex());
        ++purged;
    }
    return Result<size_t, PipelineFailure>::Ok(purged);
}

// ============================================================================
// Verification
// ============================================================================

Result<SealedRecord, PipelineFailure> SessionOrchestrator::SealedRecordOf(const ContextPtr& context) {
    std::lock_guard guard(context->lock);
    if (context->state != SessionState::AnchorPending && context->state != SessionState::Anchored) {
        return Result<SealedRecord, PipelineFailure>::Err(NotSealed(context->state));
    }
    if (!context->record) {
        return Result<SealedRecord, PipelineFailure>::Err(
            PipelineFailure::StorageReadError("Sealed record missing for " + context->id.ToHex()));
    }
    return Result<SealedRecord, PipelineFailure>::Ok(*context->record);
}

Result<VerificationReport, PipelineFailure> SessionOrchestrator::VerifySession(
    const SessionId& session_id,
    const PlaintextSink& sink) {

    auto found = Find(session_id);
    if (found.IsErr()) {
        return Result<VerificationReport, PipelineFailure>::Err(std::move(found).UnwrapErr());
    }
    auto record = SealedRecordOf(found.Unwrap());
    if (record.IsErr()) {
        return Result<VerificationReport, PipelineFailure>::Err(std::move(record).UnwrapErr());
    }
    const SessionVerifier verifier(chunks_);
    auto report = verifier.Verify(record.Unwrap(), secrets_, sink);
    if (report.IsErr()) {
        LUCID_LOG_ERROR(COMPONENT, "session {}: verification failed ({}: {})",
                        session_id.ToHex(), ToString(report.UnwrapErr().type), report.UnwrapErr().message);
    }
    return report;
}

Result<std::vector<HashStep>, PipelineFailure> SessionOrchestrator::ChunkProof(
    const SessionId& session_id,
    const uint64_t index) {

    auto found = Find(session_id);
    if (found.IsErr()) {
        return Result<std::vector<HashStep>, PipelineFailure>::Err(std::move(found).UnwrapErr());
    }
    auto loaded = SealedRecordOf(found.Unwrap());
    if (loaded.IsErr()) {
        return Result<std::vector<HashStep>, PipelineFailure>::Err(std::move(loaded).UnwrapErr());
    }
    const SealedRecord& record = loaded.Unwrap();
    if (record.chunks.size() != record.manifest.chunk_count) {
        return Result<std::vector<HashStep>, PipelineFailure>::Err(
            PipelineFailure::IntegrityError("Chunk index does not cover every chunk"));
    }

    std::vector<Hash256> leaves;
    leaves.reserve(record.chunks.size());
    for (const auto& descriptor : record.chunks) {
        if (descriptor.index != leaves.size()) {
            return Result<std::vector<HashStep>, PipelineFailure>::Err(
                PipelineFailure::IntegrityError(
                    compat::format("Chunk index entry {} is out of order", descriptor.index)));
        }
        leaves.push_back(descriptor.ciphertext_hash);
    }
    if (!SodiumInterop::ConstantTimeEquals(MerkleBuilder::ComputeRoot(leaves), record.manifest.merkle_root)) {
        return Result<std::vector<HashStep>, PipelineFailure>::Err(
            PipelineFailure::IntegrityError(std::string(ErrorMessages::ROOT_MISMATCH)));
    }
    return MerkleBuilder::ProofFor(leaves, index);
}

// ============================================================================
// Lookup
// ============================================================================

Result<SessionOrchestrator::ContextPtr, PipelineFailure> SessionOrchestrator::Find(
    const SessionId& session_id) const {

    std::lock_guard guard(sessions_lock_);
    const auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return Result<ContextPtr, PipelineFailure>::Err(
            PipelineFailure::InputError(
                compat::format("{} {}", ErrorMessages::UNKNOWN_SESSION, session_id.ToHex())));
    }
    return Result<ContextPtr, PipelineFailure>::Ok(it->second);
}

std::vector<SessionOrchestrator::ContextPtr> SessionOrchestrator::Snapshot() const {
    std::lock_guard guard(sessions_lock_);
    std::vector<ContextPtr> contexts;
    contexts.reserve(sessions_.size());
    for (const auto& [id, context] : sessions_) {
        contexts.push_back(context);
    }
    return contexts;
}

size_t SessionOrchestrator::SessionCount() const {
    std::lock_guard guard(sessions_lock_);
    return sessions_.size();
}

}
