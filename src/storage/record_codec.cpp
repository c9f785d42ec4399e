#include "lucid/storage/record_codec.hpp"
#include "storage/manifest_record.pb.h"
#include <google/protobuf/io/coded_stream.h>
#include <google/protobuf/io/zero_copy_stream_impl_lite.h>
#include <algorithm>
#include <array>
#include <string>
namespace lucid::storage {

namespace {
    constexpr uint32_t RECORD_FORMAT_VERSION = 1;

    Result<std::vector<uint8_t>, StoreFailure> SerializeDeterministic(
        const google::protobuf::MessageLite& message) {
        std::string output;
        {
            google::protobuf::io::StringOutputStream stream(&output);
            google::protobuf::io::CodedOutputStream coded_out(&stream);
            coded_out.SetSerializationDeterministic(true);
            if (!message.SerializeToCodedStream(&coded_out) || coded_out.HadError()) {
                return Result<std::vector<uint8_t>, StoreFailure>::Err(
                    StoreFailure::IoError("Failed to serialize record"));
            }
        }
        return Result<std::vector<uint8_t>, StoreFailure>::Ok(
            std::vector<uint8_t>(output.begin(), output.end()));
    }

    std::string ToBytes(std::span<const uint8_t> data) {
        return std::string(reinterpret_cast<const char*>(data.data()), data.size());
    }

    template<size_t N>
    bool CopyFixed(const std::string& source, std::array<uint8_t, N>& target) {
        if (source.size() != N) {
            return false;
        }
        std::copy(source.begin(), source.end(), target.begin());
        return true;
    }

    bool CopySessionId(const std::string& source, SessionId& target) {
        return CopyFixed(source, target.bytes);
    }

    StoreFailure Malformed(const std::string& what) {
        return StoreFailure::Corrupt("Malformed record: " + what);
    }
}

Result<std::vector<uint8_t>, StoreFailure> EncodeSealedRecord(const models::SealedRecord& record) {
    proto::storage::SealedRecord message;
    message.set_format_version(RECORD_FORMAT_VERSION);

    const auto& manifest = record.manifest;
    auto* pm = message.mutable_manifest();
    pm->set_session_id(ToBytes(manifest.session_id.bytes));
    pm->set_chunk_count(manifest.chunk_count);
    pm->set_total_plaintext_size(manifest.total_plaintext_size);
    pm->set_total_ciphertext_size(manifest.total_ciphertext_size);
    pm->set_merkle_root(ToBytes(manifest.merkle_root));
    pm->set_started_at_ms(encoding::ToUnixMillis(manifest.started_at));
    pm->set_ended_at_ms(encoding::ToUnixMillis(manifest.ended_at));
    pm->set_compression_enabled(manifest.compression_enabled);
    pm->set_manifest_hash(ToBytes(manifest.manifest_hash));

    message.set_owner(record.owner);
    message.set_created_at_ms(encoding::ToUnixMillis(record.created_at));
    message.set_expires_at_ms(encoding::ToUnixMillis(record.expires_at));
    message.set_retention_days(record.retention_days);
    message.set_anchor_retry_limit(record.anchor_retry_limit);
    for (const auto& chunk : record.chunks) {
        auto* pc = message.add_chunks();
        pc->set_index(chunk.index);
        pc->set_plaintext_size(chunk.plaintext_size);
        pc->set_compressed_size(chunk.compressed_size);
        pc->set_ciphertext_size(chunk.ciphertext_size);
        pc->set_plaintext_hash(ToBytes(chunk.plaintext_hash));
        pc->set_ciphertext_hash(ToBytes(chunk.ciphertext_hash));
    }
    if (record.signature.has_value()) {
        message.set_signature(ToBytes(*record.signature));
    }
    if (record.signer_public_key.has_value()) {
        message.set_signer_public_key(ToBytes(*record.signer_public_key));
    }
    return SerializeDeterministic(message);
}

Result<models::SealedRecord, StoreFailure> DecodeSealedRecord(std::span<const uint8_t> bytes) {
    proto::storage::SealedRecord message;
    if (!message.ParseFromArray(bytes.data(), static_cast<int>(bytes.size()))) {
        return Result<models::SealedRecord, StoreFailure>::Err(Malformed("not a SealedRecord"));
    }
    if (message.format_version() != RECORD_FORMAT_VERSION) {
        return Result<models::SealedRecord, StoreFailure>::Err(
            Malformed("unsupported format version " + std::to_string(message.format_version())));
    }

    models::SealedRecord record;
    const auto& pm = message.manifest();
    auto& manifest = record.manifest;
    if (!CopySessionId(pm.session_id(), manifest.session_id) ||
        !CopyFixed(pm.merkle_root(), manifest.merkle_root) ||
        !CopyFixed(pm.manifest_hash(), manifest.manifest_hash)) {
        return Result<models::SealedRecord, StoreFailure>::Err(Malformed("manifest field sizes"));
    }
    manifest.chunk_count = pm.chunk_count();
    manifest.total_plaintext_size = pm.total_plaintext_size();
    manifest.total_ciphertext_size = pm.total_ciphertext_size();
    manifest.started_at = encoding::FromUnixMillis(pm.started_at_ms());
    manifest.ended_at = encoding::FromUnixMillis(pm.ended_at_ms());
    manifest.compression_enabled = pm.compression_enabled();

    record.owner = message.owner();
    record.created_at = encoding::FromUnixMillis(message.created_at_ms());
    record.expires_at = encoding::FromUnixMillis(message.expires_at_ms());
    record.retention_days = message.retention_days();
    record.anchor_retry_limit = message.anchor_retry_limit();
    record.chunks.reserve(static_cast<size_t>(message.chunks_size()));
    for (const auto& pc : message.chunks()) {
        models::ChunkDescriptor chunk;
        chunk.index = pc.index();
        chunk.plaintext_size = pc.plaintext_size();
        chunk.compressed_size = pc.compressed_size();
        chunk.ciphertext_size = pc.ciphertext_size();
        if (!CopyFixed(pc.plaintext_hash(), chunk.plaintext_hash) ||
            !CopyFixed(pc.ciphertext_hash(), chunk.ciphertext_hash)) {
            return Result<models::SealedRecord, StoreFailure>::Err(
                Malformed("chunk descriptor " + std::to_string(pc.index())));
        }
        record.chunks.push_back(chunk);
    }
    if (!message.signature().empty()) {
        crypto::Ed25519Signature signature{};
        if (!CopyFixed(message.signature(), signature)) {
            return Result<models::SealedRecord, StoreFailure>::Err(Malformed("signature size"));
        }
        record.signature = signature;
    }
    if (!message.signer_public_key().empty()) {
        crypto::Ed25519PublicKey public_key{};
        if (!CopyFixed(message.signer_public_key(), public_key)) {
            return Result<models::SealedRecord, StoreFailure>::Err(Malformed("signer key size"));
        }
        record.signer_public_key = public_key;
    }
    return Result<models::SealedRecord, StoreFailure>::Ok(std::move(record));
}

Result<std::vector<uint8_t>, StoreFailure> EncodeAnchorRecord(const models::AnchorRecord& record) {
    proto::storage::AnchorRecord message;
    message.set_session_id(ToBytes(record.session_id.bytes));
    message.set_manifest_hash(ToBytes(record.manifest_hash));
    message.set_tx_ref(record.tx_ref);
    message.set_submitted_at_ms(encoding::ToUnixMillis(record.submitted_at));
    if (record.confirmed_at.has_value()) {
        message.set_confirmed_at_ms(encoding::ToUnixMillis(*record.confirmed_at));
    }
    switch (record.status) {
        case models::ConfirmationStatus::Pending:
            message.set_status(proto::storage::CONFIRMATION_STATUS_PENDING);
            break;
        case models::ConfirmationStatus::Confirmed:
            message.set_status(proto::storage::CONFIRMATION_STATUS_CONFIRMED);
            break;
        case models::ConfirmationStatus::Failed:
            message.set_status(proto::storage::CONFIRMATION_STATUS_FAILED);
            break;
    }
    message.set_submit_attempts(record.submit_attempts);
    return SerializeDeterministic(message);
}

Result<models::AnchorRecord, StoreFailure> DecodeAnchorRecord(std::span<const uint8_t> bytes) {
    proto::storage::AnchorRecord message;
    if (!message.ParseFromArray(bytes.data(), static_cast<int>(bytes.size()))) {
        return Result<models::AnchorRecord, StoreFailure>::Err(Malformed("not an AnchorRecord"));
    }
    models::AnchorRecord record;
    if (!CopySessionId(message.session_id(), record.session_id) ||
        !CopyFixed(message.manifest_hash(), record.manifest_hash)) {
        return Result<models::AnchorRecord, StoreFailure>::Err(Malformed("anchor field sizes"));
    }
    record.tx_ref = message.tx_ref();
    record.submitted_at = encoding::FromUnixMillis(message.submitted_at_ms());
    if (message.has_confirmed_at_ms()) {
        record.confirmed_at = encoding::FromUnixMillis(message.confirmed_at_ms());
    }
    switch (message.status()) {
        case proto::storage::CONFIRMATION_STATUS_CONFIRMED:
            record.status = models::ConfirmationStatus::Confirmed;
            break;
        case proto::storage::CONFIRMATION_STATUS_FAILED:
            record.status = models::ConfirmationStatus::Failed;
            break;
        default:
            record.status = models::ConfirmationStatus::Pending;
            break;
    }
    record.submit_attempts = message.submit_attempts();
    return Result<models::AnchorRecord, StoreFailure>::Ok(std::move(record));
}

}
