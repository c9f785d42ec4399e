#include "lucid/storage/in_memory_manifest_store.hpp"
namespace lucid::storage {

Result<Unit, StoreFailure> InMemoryManifestStore::SaveRecord(const models::SealedRecord& record) {
    std::lock_guard guard(lock_);
    records_.insert_or_assign(record.manifest.session_id, record);
    return Result<Unit, StoreFailure>::Ok(unit);
}

Result<models::SealedRecord, StoreFailure> InMemoryManifestStore::LoadRecord(const SessionId& session_id) {
    std::lock_guard guard(lock_);
    const auto it = records_.find(session_id);
    if (it == records_.end()) {
        return Result<models::SealedRecord, StoreFailure>::Err(
            StoreFailure::NotFound("No sealed record for session " + session_id.ToHex()));
    }
    return Result<models::SealedRecord, StoreFailure>::Ok(it->second);
}

Result<Unit, StoreFailure> InMemoryManifestStore::SaveAnchorRecord(const models::AnchorRecord& record) {
    std::lock_guard guard(lock_);
    anchors_.insert_or_assign(record.session_id, record);
    return Result<Unit, StoreFailure>::Ok(unit);
}

Result<models::AnchorRecord, StoreFailure> InMemoryManifestStore::LoadAnchorRecord(const SessionId& session_id) {
    std::lock_guard guard(lock_);
    const auto it = anchors_.find(session_id);
    if (it == anchors_.end()) {
        return Result<models::AnchorRecord, StoreFailure>::Err(
            StoreFailure::NotFound("No anchor record for session " + session_id.ToHex()));
    }
    return Result<models::AnchorRecord, StoreFailure>::Ok(it->second);
}

Result<std::vector<SessionId>, StoreFailure> InMemoryManifestStore::ListSessions() {
    std::lock_guard guard(lock_);
    std::vector<SessionId> ids;
    ids.reserve(records_.size());
    for (const auto& [id, record] : records_) {
        ids.push_back(id);
    }
    return Result<std::vector<SessionId>, StoreFailure>::Ok(std::move(ids));
}

Result<Unit, StoreFailure> InMemoryManifestStore::DeleteSession(const SessionId& session_id) {
    std::lock_guard guard(lock_);
    records_.erase(session_id);
    anchors_.erase(session_id);
    return Result<Unit, StoreFailure>::Ok(unit);
}
}
