#pragma once
#include "lucid/core/result.hpp"
#include "lucid/core/failures.hpp"
#include "lucid/models/session_manifest.hpp"
#include "lucid/models/anchor_record.hpp"
#include <cstdint>
#include <span>
#include <vector>
namespace lucid::storage {

/// Protobuf encodings of the persisted records (proto/storage/manifest_record.proto).
/// Serialization is deterministic so equal records produce equal bytes.
Result<std::vector<uint8_t>, StoreFailure> EncodeSealedRecord(const models::SealedRecord& record);

Result<models::SealedRecord, StoreFailure> DecodeSealedRecord(std::span<const uint8_t> bytes);

Result<std::vector<uint8_t>, StoreFailure> EncodeAnchorRecord(const models::AnchorRecord& record);

Result<models::AnchorRecord, StoreFailure> DecodeAnchorRecord(std::span<const uint8_t> bytes);

}
