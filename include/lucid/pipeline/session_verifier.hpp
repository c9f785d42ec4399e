#pragma once

#include "lucid/core/result.hpp"
#include "lucid/core/failures.hpp"
#include "lucid/interfaces/i_chunk_store.hpp"
#include "lucid/interfaces/i_master_secret_provider.hpp"
#include "lucid/models/session_manifest.hpp"

#include <cstdint>
#include <functional>
#include <span>

namespace lucid::pipeline {

using PlaintextSink = std::function<Result<Unit, PipelineFailure>(uint64_t index, std::span<const uint8_t>)>;

struct VerificationReport {
    uint64_t chunk_count = 0;
    uint64_t ciphertext_bytes = 0;
    uint64_t plaintext_bytes = 0;
    Hash256 merkle_root{};
    bool signature_present = false;
    bool plaintext_checked = false;
};

/**
 * @brief Independent check of a sealed session against the chunk store
 *
 * VerifyStructure needs no key material: it re-reads every ciphertext,
 * rebuilds the Merkle root and compares it, the manifest hash and the
 * optional signature. Verify additionally re-derives the session key from
 * the master secret, authenticates and decrypts every chunk, decompresses
 * it, checks the plaintext hash and hands the plaintext to @p sink in
 * index order (playback).
 */
class SessionVerifier {
public:
    explicit SessionVerifier(interfaces::IChunkStore& chunks)
        : chunks_(chunks) {}

    [[nodiscard]] Result<VerificationReport, PipelineFailure> VerifyStructure(
        const models::SealedRecord& record) const;

    [[nodiscard]] Result<VerificationReport, PipelineFailure> Verify(
        const models::SealedRecord& record,
        interfaces::IMasterSecretProvider& secrets,
        const PlaintextSink& sink = {}) const;

private:
    interfaces::IChunkStore& chunks_;
};

}
