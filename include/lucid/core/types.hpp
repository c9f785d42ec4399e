#pragma once
#include "lucid/core/constants.hpp"
#include "lucid/core/result.hpp"
#include "lucid/core/failures.hpp"
#include <array>
#include <chrono>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace lucid {

using Hash256 = std::array<uint8_t, Constants::HASH_SIZE>;
using Timestamp = std::chrono::system_clock::time_point;

/**
 * @brief 128-bit random session identifier
 *
 * Sessions, chunks and manifests refer to each other only through this
 * value; no object holds a pointer into another session's state.
 */
struct SessionId {
    std::array<uint8_t, Constants::SESSION_ID_SIZE> bytes{};

    [[nodiscard]] static SessionId Generate();
    [[nodiscard]] static Result<SessionId, PipelineFailure> FromHex(std::string_view hex);
    [[nodiscard]] static Result<SessionId, PipelineFailure> FromBytes(std::span<const uint8_t> raw);

    [[nodiscard]] std::string ToHex() const;
    [[nodiscard]] std::span<const uint8_t> AsSpan() const noexcept { return bytes; }

    bool operator==(const SessionId& other) const noexcept { return bytes == other.bytes; }
    bool operator!=(const SessionId& other) const noexcept { return bytes != other.bytes; }
    bool operator<(const SessionId& other) const noexcept { return bytes < other.bytes; }

    struct Hash {
        size_t operator()(const SessionId& id) const noexcept;
    };
};

enum class SessionState : uint8_t {
    Created,
    Recording,
    Sealing,
    AnchorPending,
    Anchored,
    Failed,
    Expired
};

[[nodiscard]] constexpr std::string_view ToString(const SessionState state) noexcept {
    switch (state) {
        case SessionState::Created: return "CREATED";
        case SessionState::Recording: return "RECORDING";
        case SessionState::Sealing: return "SEALING";
        case SessionState::AnchorPending: return "ANCHOR_PENDING";
        case SessionState::Anchored: return "ANCHORED";
        case SessionState::Failed: return "FAILED";
        case SessionState::Expired: return "EXPIRED";
    }
    return "UNKNOWN";
}

[[nodiscard]] constexpr bool IsTerminal(const SessionState state) noexcept {
    return state == SessionState::Anchored ||
           state == SessionState::Failed ||
           state == SessionState::Expired;
}

[[nodiscard]] constexpr bool AcceptsInput(const SessionState state) noexcept {
    return state == SessionState::Created || state == SessionState::Recording;
}

namespace encoding {

std::string ToHex(std::span<const uint8_t> data);

Result<std::vector<uint8_t>, PipelineFailure> FromHex(std::string_view hex);

void AppendUint64LE(std::vector<uint8_t>& out, uint64_t value);

void AppendInt64LE(std::vector<uint8_t>& out, int64_t value);

[[nodiscard]] uint64_t ReadUint64LE(std::span<const uint8_t> in);

void AppendUint32LE(std::vector<uint8_t>& out, uint32_t value);

[[nodiscard]] uint32_t ReadUint32LE(std::span<const uint8_t> in);

[[nodiscard]] int64_t ToUnixMillis(Timestamp ts) noexcept;

[[nodiscard]] Timestamp FromUnixMillis(int64_t millis) noexcept;

}

}
