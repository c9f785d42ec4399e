#pragma once
#include "lucid/core/result.hpp"
#include "lucid/core/failures.hpp"
#include "lucid/core/types.hpp"
#include "lucid/models/chunk.hpp"
#include <cstdint>
#include <span>
#include <vector>
namespace lucid::interfaces {

/**
 * @brief Content store for encrypted chunks, addressed by (session id, index)
 *
 * Shared by all sessions; implementations must be safe for concurrent use.
 * Put is idempotent: writing byte-identical data to an existing address
 * succeeds, writing different data fails with StoreFailureType::Conflict.
 * Unavailable and IoError are treated as transient by the pipeline.
 */
class IChunkStore {
public:
    virtual ~IChunkStore() = default;

    [[nodiscard]] virtual Result<Unit, StoreFailure> Put(
        const SessionId& session_id,
        uint64_t index,
        std::span<const uint8_t> ciphertext,
        const crypto::Nonce192& nonce,
        const crypto::Tag128& tag) = 0;

    [[nodiscard]] virtual Result<models::StoredChunk, StoreFailure> Get(
        const SessionId& session_id,
        uint64_t index) = 0;

    /// Indices present for the session, ascending.
    [[nodiscard]] virtual Result<std::vector<uint64_t>, StoreFailure> ListIndices(
        const SessionId& session_id) = 0;

    /// Removes every chunk of the session. Unknown sessions are not an error.
    [[nodiscard]] virtual Result<Unit, StoreFailure> DeleteSession(const SessionId& session_id) = 0;
};

}
