#include "lucid/storage/in_memory_chunk_store.hpp"
#include "lucid/core/format.hpp"
#include <algorithm>
namespace lucid::storage {

Result<Unit, StoreFailure> InMemoryChunkStore::Put(
    const SessionId& session_id,
    const uint64_t index,
    std::span<const uint8_t> ciphertext,
    const crypto::Nonce192& nonce,
    const crypto::Tag128& tag) {
    std::lock_guard guard(lock_);
    auto& session = chunks_[session_id];
    const auto existing = session.find(index);
    if (existing != session.end()) {
        const auto& stored = existing->second;
        const bool identical = stored.nonce == nonce && stored.tag == tag &&
            std::equal(stored.ciphertext.begin(), stored.ciphertext.end(),
                       ciphertext.begin(), ciphertext.end());
        if (!identical) {
            return Result<Unit, StoreFailure>::Err(
                StoreFailure::Conflict(
                    compat::format("Chunk {}/{} already stored with different content",
                        session_id.ToHex(), index)));
        }
        return Result<Unit, StoreFailure>::Ok(unit);
    }
    session.emplace(index, models::StoredChunk{
        std::vector<uint8_t>(ciphertext.begin(), ciphertext.end()), nonce, tag});
    return Result<Unit, StoreFailure>::Ok(unit);
}

Result<models::StoredChunk, StoreFailure> InMemoryChunkStore::Get(
    const SessionId& session_id,
    const uint64_t index) {
    std::lock_guard guard(lock_);
    const auto session = chunks_.find(session_id);
    if (session != chunks_.end()) {
        const auto chunk = session->second.find(index);
        if (chunk != session->second.end()) {
            return Result<models::StoredChunk, StoreFailure>::Ok(chunk->second);
        }
    }
    return Result<models::StoredChunk, StoreFailure>::Err(
        StoreFailure::NotFound(compat::format("Chunk {}/{} not found", session_id.ToHex(), index)));
}

Result<std::vector<uint64_t>, StoreFailure> InMemoryChunkStore::ListIndices(const SessionId& session_id) {
    std::lock_guard guard(lock_);
    std::vector<uint64_t> indices;
    const auto session = chunks_.find(session_id);
    if (session != chunks_.end()) {
        indices.reserve(session->second.size());
        for (const auto& [index, chunk] : session->second) {
            indices.push_back(index);
        }
    }
    return Result<std::vector<uint64_t>, StoreFailure>::Ok(std::move(indices));
}

Result<Unit, StoreFailure> InMemoryChunkStore::DeleteSession(const SessionId& session_id) {
    std::lock_guard guard(lock_);
    chunks_.erase(session_id);
    return Result<Unit, StoreFailure>::Ok(unit);
}

size_t InMemoryChunkStore::ChunkCount() const {
    std::lock_guard guard(lock_);
    size_t total = 0;
    for (const auto& [id, session] : chunks_) {
        total += session.size();
    }
    return total;
}

}
