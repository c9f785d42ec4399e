#pragma once

#include "lucid/core/constants.hpp"
#include "lucid/core/types.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <thread>

namespace lucid::crypto {
class ManifestSigner;
}

namespace lucid::configuration {

/// Exponential backoff: attempt n (1-based) waits
/// min(initial_backoff * multiplier^(n-1), max_backoff) before retrying.
struct RetryPolicy {
    uint32_t max_attempts = PipelineConstants::DEFAULT_STORAGE_RETRY_LIMIT;
    std::chrono::milliseconds initial_backoff = PipelineConstants::DEFAULT_INITIAL_BACKOFF;
    std::chrono::milliseconds max_backoff = PipelineConstants::DEFAULT_MAX_BACKOFF;
    double multiplier = PipelineConstants::DEFAULT_BACKOFF_MULTIPLIER;

    [[nodiscard]] std::chrono::milliseconds BackoffAfter(const uint32_t attempt) const noexcept {
        double delay = static_cast<double>(initial_backoff.count());
        for (uint32_t i = 1; i < attempt; ++i) {
            delay *= multiplier;
            if (delay >= static_cast<double>(max_backoff.count())) {
                return max_backoff;
            }
        }
        return std::min(std::chrono::milliseconds(static_cast<int64_t>(delay)), max_backoff);
    }

    [[nodiscard]] static RetryPolicy NoDelay(const uint32_t attempts) noexcept {
        RetryPolicy policy;
        policy.max_attempts = attempts;
        policy.initial_backoff = std::chrono::milliseconds(0);
        policy.max_backoff = std::chrono::milliseconds(0);
        return policy;
    }
};

using Clock = std::function<Timestamp()>;
using Sleeper = std::function<void(std::chrono::milliseconds)>;
using SessionIdSource = std::function<SessionId()>;

/**
 * @brief Orchestrator-wide settings shared by every session
 *
 * Clock and sleeper are injectable so expiry, retention and backoff can be
 * driven by tests without real waiting.
 */
struct PipelineOptions {
    size_t queue_depth = PipelineConstants::DEFAULT_QUEUE_DEPTH;
    size_t max_submission_bytes = PipelineConstants::MAX_SUBMISSION_BYTES;
    RetryPolicy storage_retry{};
    /// max_attempts is taken from SessionConfig::anchor_retry_limit.
    RetryPolicy anchor_backoff{};
    uint32_t confirmation_poll_limit = PipelineConstants::DEFAULT_CONFIRMATION_POLLS;
    std::chrono::milliseconds confirmation_interval = PipelineConstants::DEFAULT_CONFIRMATION_INTERVAL;
    /// Start anchoring on a background thread as soon as a session is sealed.
    bool auto_anchor = true;
    std::shared_ptr<const crypto::ManifestSigner> signer;
    /// Ids handed out by CreateSession; random unless a caller pins them.
    SessionIdSource session_ids = [] { return SessionId::Generate(); };
    Clock clock = [] { return std::chrono::system_clock::now(); };
    Sleeper sleeper = [](const std::chrono::milliseconds delay) {
        if (delay.count() > 0) {
            std::this_thread::sleep_for(delay);
        }
    };

    [[nodiscard]] static PipelineOptions Default() {
        return PipelineOptions{};
    }
};

}
