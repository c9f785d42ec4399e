#include "lucid/anchor/anchor_client.hpp"
#include "lucid/crypto/sodium_interop.hpp"
#include "lucid/debug/pipeline_logger.hpp"

namespace lucid::anchor {
using crypto::SodiumInterop;
using models::AnchorRecord;
using models::ConfirmationStatus;

namespace {
    constexpr const char* COMPONENT = "anchor";

    bool ShouldStop(const StopSignal* stop) {
        return stop != nullptr && stop->Requested();
    }
}

AnchorClient::AnchorClient(
    interfaces::IAnchorChain& chain,
    interfaces::IManifestStore& records,
    const configuration::PipelineOptions& options)
    : chain_(chain)
    , records_(records)
    , backoff_(options.anchor_backoff)
    , confirmation_poll_limit_(options.confirmation_poll_limit)
    , confirmation_interval_(options.confirmation_interval)
    , clock_(options.clock)
    , sleeper_(options.sleeper) {
}

Result<Unit, AnchorFailure> AnchorClient::Persist(const AnchorRecord& record) const {
    auto saved = records_.SaveAnchorRecord(record);
    if (saved.IsErr()) {
        return Result<Unit, AnchorFailure>::Err(
            AnchorFailure::Persistence("Saving anchor record failed: " + saved.UnwrapErr().message));
    }
    return Result<Unit, AnchorFailure>::Ok(unit);
}

Result<AnchorRecord, AnchorFailure> AnchorClient::Anchor(
    const models::SessionManifest& manifest,
    const uint32_t round_limit,
    const StopSignal* stop) const {

    const std::string session_hex = manifest.session_id.ToHex();
    if (!manifest.HasValidHash()) {
        LUCID_LOG_ERROR(COMPONENT, "session {}: manifest hash does not match its contents", session_hex);
        return Result<AnchorRecord, AnchorFailure>::Err(
            AnchorFailure::ManifestMismatch("Manifest hash does not match manifest contents"));
    }

    AnchorRecord record;
    auto existing = records_.LoadAnchorRecord(manifest.session_id);
    if (existing.IsOk()) {
        record = std::move(existing).Unwrap();
        if (!SodiumInterop::ConstantTimeEquals(record.manifest_hash, manifest.manifest_hash)) {
            return Result<AnchorRecord, AnchorFailure>::Err(
                AnchorFailure::ManifestMismatch("Stored anchor record belongs to a different manifest"));
        }
        if (record.IsConfirmed()) {
            LUCID_LOG_DEBUG(COMPONENT, "session {}: already anchored in {}", session_hex, record.tx_ref);
            return Result<AnchorRecord, AnchorFailure>::Ok(std::move(record));
        }
    } else if (existing.UnwrapErr().type == StoreFailureType::NotFound) {
        record.session_id = manifest.session_id;
        record.manifest_hash = manifest.manifest_hash;
    } else {
        return Result<AnchorRecord, AnchorFailure>::Err(
            AnchorFailure::Persistence("Loading anchor record failed: " + existing.UnwrapErr().message));
    }

    for (uint32_t round = 1; round <= round_limit; ++round) {
        if (ShouldStop(stop)) {
            return Result<AnchorRecord, AnchorFailure>::Err(
                AnchorFailure::Interrupted("Anchoring stopped for session " + session_hex));
        }
        auto outcome = RunRound(manifest, record, stop);
        if (outcome.IsErr()) {
            return Result<AnchorRecord, AnchorFailure>::Err(std::move(outcome).UnwrapErr());
        }
        if (outcome.Unwrap() == RoundOutcome::Confirmed) {
            LUCID_LOG_INFO(COMPONENT, "session {}: anchored in {} after {} round(s)",
                           session_hex, record.tx_ref, round);
            return Result<AnchorRecord, AnchorFailure>::Ok(record);
        }
        if (round < round_limit) {
            const auto delay = backoff_.BackoffAfter(round);
            LUCID_LOG_WARN(COMPONENT, "session {}: round {} of {} unconfirmed, retrying in {} ms",
                           session_hex, round, round_limit, delay.count());
            if (!Pause(delay, stop)) {
                return Result<AnchorRecord, AnchorFailure>::Err(
                    AnchorFailure::Interrupted("Anchoring stopped during backoff for session " + session_hex));
            }
        }
    }

    LUCID_LOG_WARN(COMPONENT, "session {}: anchoring still pending after {} round(s)", session_hex, round_limit);
    return Result<AnchorRecord, AnchorFailure>::Err(
        AnchorFailure::RetriesExhausted(
            "No confirmation for session " + session_hex + " after " +
            std::to_string(round_limit) + " round(s)"));
}

bool AnchorClient::Pause(const std::chrono::milliseconds delay, const StopSignal* stop) const {
    if (stop == nullptr) {
        sleeper_(delay);
        return true;
    }
    return !stop->WaitFor(delay);
}

Result<AnchorClient::RoundOutcome, AnchorFailure> AnchorClient::RunRound(
    const models::SessionManifest& manifest,
    AnchorRecord& record,
    const StopSignal* stop) const {

    const bool needs_submit = record.tx_ref.empty() || record.status == ConfirmationStatus::Failed;
    if (needs_submit) {
        ++record.submit_attempts;
        auto submitted = chain_.SubmitAnchor(
            manifest.session_id, manifest.merkle_root, manifest.chunk_count, manifest.manifest_hash);
        if (submitted.IsErr()) {
            const auto& failure = submitted.UnwrapErr();
            LUCID_LOG_WARN(COMPONENT, "session {}: submit attempt {} failed ({}: {})",
                           manifest.session_id.ToHex(), record.submit_attempts,
                           ToString(failure.type), failure.message);
            if (auto saved = Persist(record); saved.IsErr()) {
                return Result<RoundOutcome, AnchorFailure>::Err(std::move(saved).UnwrapErr());
            }
            return Result<RoundOutcome, AnchorFailure>::Ok(RoundOutcome::SubmitFailed);
        }
        record.tx_ref = std::move(submitted).Unwrap();
        record.status = ConfirmationStatus::Pending;
        record.submitted_at = clock_();
        record.confirmed_at.reset();
        if (auto saved = Persist(record); saved.IsErr()) {
            return Result<RoundOutcome, AnchorFailure>::Err(std::move(saved).UnwrapErr());
        }
        LUCID_LOG_DEBUG(COMPONENT, "session {}: submitted as {}", manifest.session_id.ToHex(), record.tx_ref);
    }

    for (uint32_t poll = 0; poll < confirmation_poll_limit_; ++poll) {
        if (ShouldStop(stop)) {
            return Result<RoundOutcome, AnchorFailure>::Err(
                AnchorFailure::Interrupted("Anchoring stopped while polling " + record.tx_ref));
        }
        auto status = chain_.GetConfirmation(record.tx_ref);
        if (status.IsOk()) {
            switch (status.Unwrap()) {
                case ConfirmationStatus::Confirmed: {
                    record.status = ConfirmationStatus::Confirmed;
                    record.confirmed_at = clock_();
                    if (auto saved = Persist(record); saved.IsErr()) {
                        return Result<RoundOutcome, AnchorFailure>::Err(std::move(saved).UnwrapErr());
                    }
                    return Result<RoundOutcome, AnchorFailure>::Ok(RoundOutcome::Confirmed);
                }
                case ConfirmationStatus::Failed: {
                    LUCID_LOG_WARN(COMPONENT, "session {}: transaction {} failed on chain",
                                   manifest.session_id.ToHex(), record.tx_ref);
                    record.status = ConfirmationStatus::Failed;
                    if (auto saved = Persist(record); saved.IsErr()) {
                        return Result<RoundOutcome, AnchorFailure>::Err(std::move(saved).UnwrapErr());
                    }
                    return Result<RoundOutcome, AnchorFailure>::Ok(RoundOutcome::ChainFailed);
                }
                case ConfirmationStatus::Pending:
                    break;
            }
        } else {
            LUCID_LOG_DEBUG(COMPONENT, "session {}: confirmation query failed: {}",
                            manifest.session_id.ToHex(), status.UnwrapErr().message);
        }
        if (poll + 1 < confirmation_poll_limit_ && !Pause(confirmation_interval_, stop)) {
            return Result<RoundOutcome, AnchorFailure>::Err(
                AnchorFailure::Interrupted("Anchoring stopped while polling " + record.tx_ref));
        }
    }
    return Result<RoundOutcome, AnchorFailure>::Ok(RoundOutcome::StillPending);
}

}
