#include "lucid/pipeline/session_verifier.hpp"
#include "lucid/pipeline/chunker.hpp"
#include "lucid/pipeline/encryptor.hpp"
#include "lucid/pipeline/merkle_builder.hpp"
#include "lucid/crypto/sodium_interop.hpp"
#include "lucid/core/format.hpp"
#include "lucid/debug/pipeline_logger.hpp"

namespace lucid::pipeline {
using crypto::SodiumInterop;

namespace {
    constexpr const char* COMPONENT = "verifier";

    PipelineFailure ReadFailure(const SessionId& id, const uint64_t index, const StoreFailure& failure) {
        return PipelineFailure::StorageReadError(
            compat::format("Chunk {}/{}: {} ({})", id.ToHex(), index, failure.message, ToString(failure.type)));
    }
}

Result<VerificationReport, PipelineFailure> SessionVerifier::VerifyStructure(
    const models::SealedRecord& record) const {

    const auto& manifest = record.manifest;
    if (!manifest.HasValidHash()) {
        return Result<VerificationReport, PipelineFailure>::Err(
            PipelineFailure::IntegrityError("Manifest hash does not match manifest contents"));
    }
    if (!record.VerifySignature()) {
        return Result<VerificationReport, PipelineFailure>::Err(
            PipelineFailure::IntegrityError("Manifest signature does not verify"));
    }

    auto listed = chunks_.ListIndices(manifest.session_id);
    if (listed.IsErr()) {
        return Result<VerificationReport, PipelineFailure>::Err(
            PipelineFailure::StorageReadError("Listing chunks failed: " + listed.UnwrapErr().message));
    }
    if (listed.Unwrap().size() != manifest.chunk_count) {
        return Result<VerificationReport, PipelineFailure>::Err(
            PipelineFailure::IntegrityError(
                compat::format("Store holds {} chunks, manifest lists {}",
                    listed.Unwrap().size(), manifest.chunk_count)));
    }

    VerificationReport report;
    report.signature_present = record.signature.has_value();
    std::vector<Hash256> leaves;
    leaves.reserve(static_cast<size_t>(manifest.chunk_count));
    MerkleBuilder builder;
    for (uint64_t index = 0; index < manifest.chunk_count; ++index) {
        auto stored = chunks_.Get(manifest.session_id, index);
        if (stored.IsErr()) {
            return Result<VerificationReport, PipelineFailure>::Err(
                ReadFailure(manifest.session_id, index, stored.UnwrapErr()));
        }
        const auto& chunk = stored.Unwrap();
        const Hash256 leaf = SodiumInterop::Hash(chunk.ciphertext);
        if (auto added = builder.AddLeaf(index, leaf); added.IsErr()) {
            return Result<VerificationReport, PipelineFailure>::Err(std::move(added).UnwrapErr());
        }
        leaves.push_back(leaf);
        report.ciphertext_bytes += chunk.ciphertext.size();
    }

    auto root = builder.Finalize(manifest.chunk_count);
    if (root.IsErr()) {
        return Result<VerificationReport, PipelineFailure>::Err(std::move(root).UnwrapErr());
    }
    report.merkle_root = root.Unwrap();
    report.chunk_count = manifest.chunk_count;
    if (!SodiumInterop::ConstantTimeEquals(report.merkle_root, manifest.merkle_root)) {
        LUCID_LOG_ERROR(COMPONENT, "session {}: recomputed root differs from manifest",
                        manifest.session_id.ToHex());
        return Result<VerificationReport, PipelineFailure>::Err(
            PipelineFailure::IntegrityError(std::string(ErrorMessages::ROOT_MISMATCH)));
    }
    if (report.ciphertext_bytes != manifest.total_ciphertext_size) {
        return Result<VerificationReport, PipelineFailure>::Err(
            PipelineFailure::IntegrityError(
                compat::format("Stored ciphertext totals {} bytes, manifest says {}",
                    report.ciphertext_bytes, manifest.total_ciphertext_size)));
    }
    if (!record.chunks.empty()) {
        if (record.chunks.size() != manifest.chunk_count) {
            return Result<VerificationReport, PipelineFailure>::Err(
                PipelineFailure::IntegrityError("Chunk index does not cover every chunk"));
        }
        uint64_t described_plaintext = 0;
        for (uint64_t index = 0; index < manifest.chunk_count; ++index) {
            const auto& descriptor = record.chunks[static_cast<size_t>(index)];
            if (descriptor.plaintext_size > manifest.total_plaintext_size - described_plaintext) {
                return Result<VerificationReport, PipelineFailure>::Err(
                    PipelineFailure::IntegrityError(
                        compat::format("Chunk index entry {} claims more plaintext than the manifest holds", index)));
            }
            described_plaintext += descriptor.plaintext_size;
            if (descriptor.index != index ||
                !SodiumInterop::ConstantTimeEquals(descriptor.ciphertext_hash, leaves[static_cast<size_t>(index)])) {
                return Result<VerificationReport, PipelineFailure>::Err(
                    PipelineFailure::IntegrityError(
                        compat::format("Chunk index entry {} does not match the stored chunk", index)));
            }
        }
        if (described_plaintext != manifest.total_plaintext_size) {
            return Result<VerificationReport, PipelineFailure>::Err(
                PipelineFailure::IntegrityError(
                    compat::format("Chunk index describes {} plaintext bytes, manifest says {}",
                        described_plaintext, manifest.total_plaintext_size)));
        }
    }
    return Result<VerificationReport, PipelineFailure>::Ok(report);
}

Result<VerificationReport, PipelineFailure> SessionVerifier::Verify(
    const models::SealedRecord& record,
    interfaces::IMasterSecretProvider& secrets,
    const PlaintextSink& sink) const {

    auto structure = VerifyStructure(record);
    if (structure.IsErr()) {
        return structure;
    }
    VerificationReport report = structure.Unwrap();
    const auto& manifest = record.manifest;
    if (record.chunks.size() != manifest.chunk_count) {
        return Result<VerificationReport, PipelineFailure>::Err(
            PipelineFailure::IntegrityError("Plaintext check needs the chunk index"));
    }

    auto encryptor_result = Encryptor::Create(manifest.session_id, secrets);
    if (encryptor_result.IsErr()) {
        return Result<VerificationReport, PipelineFailure>::Err(std::move(encryptor_result).UnwrapErr());
    }
    const Encryptor encryptor = std::move(encryptor_result).Unwrap();

    for (uint64_t index = 0; index < manifest.chunk_count; ++index) {
        const auto& descriptor = record.chunks[static_cast<size_t>(index)];
        auto stored = chunks_.Get(manifest.session_id, index);
        if (stored.IsErr()) {
            return Result<VerificationReport, PipelineFailure>::Err(
                ReadFailure(manifest.session_id, index, stored.UnwrapErr()));
        }
        auto opened = encryptor.Decrypt(index, stored.Unwrap());
        if (opened.IsErr()) {
            return Result<VerificationReport, PipelineFailure>::Err(
                PipelineFailure(opened.UnwrapErr().type,
                    compat::format("Chunk {}: {}", index, opened.UnwrapErr().message)));
        }
        std::vector<uint8_t> plaintext = std::move(opened).Unwrap();
        if (manifest.compression_enabled) {
            auto inflated = DecompressChunk(plaintext, descriptor.plaintext_size);
            if (inflated.IsErr()) {
                return Result<VerificationReport, PipelineFailure>::Err(std::move(inflated).UnwrapErr());
            }
            plaintext = std::move(inflated).Unwrap();
        }
        if (plaintext.size() != descriptor.plaintext_size ||
            !SodiumInterop::ConstantTimeEquals(SodiumInterop::Hash(plaintext), descriptor.plaintext_hash)) {
            return Result<VerificationReport, PipelineFailure>::Err(
                PipelineFailure::IntegrityError(
                    compat::format("Plaintext of chunk {} does not match its recorded hash", index)));
        }
        report.plaintext_bytes += plaintext.size();
        if (sink) {
            if (auto delivered = sink(index, plaintext); delivered.IsErr()) {
                return Result<VerificationReport, PipelineFailure>::Err(std::move(delivered).UnwrapErr());
            }
        }
    }

    if (report.plaintext_bytes != manifest.total_plaintext_size) {
        return Result<VerificationReport, PipelineFailure>::Err(
            PipelineFailure::IntegrityError(
                compat::format("Recovered {} plaintext bytes, manifest says {}",
                    report.plaintext_bytes, manifest.total_plaintext_size)));
    }
    report.plaintext_checked = true;
    return Result<VerificationReport, PipelineFailure>::Ok(report);
}

}
