#pragma once
#include "lucid/interfaces/i_chunk_store.hpp"
#include <map>
#include <mutex>
#include <unordered_map>
namespace lucid::storage {

class InMemoryChunkStore final : public interfaces::IChunkStore {
public:
    InMemoryChunkStore() = default;
    ~InMemoryChunkStore() override = default;

    [[nodiscard]] Result<Unit, StoreFailure> Put(
        const SessionId& session_id,
        uint64_t index,
        std::span<const uint8_t> ciphertext,
        const crypto::Nonce192& nonce,
        const crypto::Tag128& tag) override;

    [[nodiscard]] Result<models::StoredChunk, StoreFailure> Get(
        const SessionId& session_id,
        uint64_t index) override;

    [[nodiscard]] Result<std::vector<uint64_t>, StoreFailure> ListIndices(const SessionId& session_id) override;

    [[nodiscard]] Result<Unit, StoreFailure> DeleteSession(const SessionId& session_id) override;

    [[nodiscard]] size_t ChunkCount() const;

private:
    mutable std::mutex lock_;
    std::unordered_map<SessionId, std::map<uint64_t, models::StoredChunk>, SessionId::Hash> chunks_;
};
}
