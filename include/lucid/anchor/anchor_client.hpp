#pragma once

#include "lucid/configuration/pipeline_options.hpp"
#include "lucid/core/result.hpp"
#include "lucid/core/failures.hpp"
#include "lucid/interfaces/i_anchor_chain.hpp"
#include "lucid/interfaces/i_manifest_store.hpp"
#include "lucid/models/anchor_record.hpp"
#include "lucid/models/session_manifest.hpp"
#include "lucid/anchor/stop_signal.hpp"

#include <chrono>
#include <cstdint>

namespace lucid::anchor {

/**
 * @brief Submits sealed manifests to the anchoring chain
 *
 * Every call first recomputes the manifest hash and refuses a manifest
 * whose stored hash disagrees. The persisted AnchorRecord decides what
 * happens next:
 * - Confirmed: returned as is, the chain is not contacted.
 * - Pending with a transaction: that transaction is polled, not resubmitted.
 * - Failed on chain, or no record: a new submission is made.
 *
 * Work proceeds in rounds (submit if needed, then poll up to
 * confirmation_poll_limit times). A round that ends without confirmation
 * backs off and the next round starts, up to @p round_limit rounds. Running
 * out of rounds returns RetriesExhausted; the record stays Pending on disk
 * so a later call resumes where this one stopped.
 *
 * With a @p stop signal attached, backoff and polling waits block on the
 * signal and anchoring returns Interrupted as soon as it is raised. Without
 * one, waits go through the configured sleeper.
 */
class AnchorClient {
public:
    AnchorClient(
        interfaces::IAnchorChain& chain,
        interfaces::IManifestStore& records,
        const configuration::PipelineOptions& options);

    [[nodiscard]] Result<models::AnchorRecord, AnchorFailure> Anchor(
        const models::SessionManifest& manifest,
        uint32_t round_limit,
        const StopSignal* stop = nullptr) const;

private:
    enum class RoundOutcome {
        Confirmed,
        ChainFailed,
        StillPending,
        SubmitFailed
    };

    Result<RoundOutcome, AnchorFailure> RunRound(
        const models::SessionManifest& manifest,
        models::AnchorRecord& record,
        const StopSignal* stop) const;

    /// False when @p stop was raised before @p delay elapsed.
    bool Pause(std::chrono::milliseconds delay, const StopSignal* stop) const;

    Result<Unit, AnchorFailure> Persist(const models::AnchorRecord& record) const;

    interfaces::IAnchorChain& chain_;
    interfaces::IManifestStore& records_;
    configuration::RetryPolicy backoff_;
    uint32_t confirmation_poll_limit_;
    std::chrono::milliseconds confirmation_interval_;
    configuration::Clock clock_;
    configuration::Sleeper sleeper_;
};

}
