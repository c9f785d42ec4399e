#pragma once
#include "lucid/core/result.hpp"
#include "lucid/core/failures.hpp"
#include "lucid/core/types.hpp"
#include "lucid/models/session_manifest.hpp"
#include "lucid/models/anchor_record.hpp"
#include <vector>
namespace lucid::interfaces {

/// Durable home of sealed records and anchor records. A record is saved
/// before any chain call so a restart can resume anchoring.
class IManifestStore {
public:
    virtual ~IManifestStore() = default;

    [[nodiscard]] virtual Result<Unit, StoreFailure> SaveRecord(const models::SealedRecord& record) = 0;

    [[nodiscard]] virtual Result<models::SealedRecord, StoreFailure> LoadRecord(
        const SessionId& session_id) = 0;

    [[nodiscard]] virtual Result<Unit, StoreFailure> SaveAnchorRecord(const models::AnchorRecord& record) = 0;

    /// NotFound when the session was never submitted.
    [[nodiscard]] virtual Result<models::AnchorRecord, StoreFailure> LoadAnchorRecord(
        const SessionId& session_id) = 0;

    [[nodiscard]] virtual Result<std::vector<SessionId>, StoreFailure> ListSessions() = 0;

    [[nodiscard]] virtual Result<Unit, StoreFailure> DeleteSession(const SessionId& session_id) = 0;
};

}
