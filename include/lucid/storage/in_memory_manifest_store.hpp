#pragma once
#include "lucid/interfaces/i_manifest_store.hpp"
#include <map>
#include <mutex>
namespace lucid::storage {
class InMemoryManifestStore final : public interfaces::IManifestStore {
public:
    InMemoryManifestStore() = default;
    ~InMemoryManifestStore() override = default;

    [[nodiscard]] Result<Unit, StoreFailure> SaveRecord(const models::SealedRecord& record) override;
    [[nodiscard]] Result<models::SealedRecord, StoreFailure> LoadRecord(const SessionId& session_id) override;
    [[nodiscard]] Result<Unit, StoreFailure> SaveAnchorRecord(const models::AnchorRecord& record) override;
    [[nodiscard]] Result<models::AnchorRecord, StoreFailure> LoadAnchorRecord(const SessionId& session_id) override;
    [[nodiscard]] Result<std::vector<SessionId>, StoreFailure> ListSessions() override;
    [[nodiscard]] Result<Unit, StoreFailure> DeleteSession(const SessionId& session_id) override;

private:
    mutable std::mutex lock_;
    std::map<SessionId, models::SealedRecord> records_;
    std::map<SessionId, models::AnchorRecord> anchors_;
};
}
