#pragma once
#include "lucid/core/result.hpp"
#include "lucid/core/failures.hpp"
#include "lucid/core/types.hpp"
#include "lucid/models/anchor_record.hpp"
#include <cstdint>
namespace lucid::interfaces {
class IAnchorChain {
public:
    virtual ~IAnchorChain() = default;
    [[nodiscard]] virtual Result<models::TxRef, AnchorFailure> SubmitAnchor(
        const SessionId& session_id,
        const Hash256& merkle_root,
        uint64_t chunk_count,
        const Hash256& manifest_hash) = 0;
    [[nodiscard]] virtual Result<models::ConfirmationStatus, AnchorFailure> GetConfirmation(
        const models::TxRef& tx_ref) = 0;
};
}
