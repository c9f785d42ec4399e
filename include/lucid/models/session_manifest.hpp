#pragma once
#include "lucid/core/types.hpp"
#include "lucid/crypto/manifest_signer.hpp"
#include "lucid/models/chunk.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
namespace lucid::models {

/**
 * @brief Sealed summary of one recording
 *
 * manifest_hash covers every other field through CanonicalBytes(), a fixed
 * little-endian layout prefixed with a version label. It is the value
 * anchored on chain and the message a ManifestSigner signs.
 */
struct SessionManifest {
    SessionId session_id;
    uint64_t chunk_count = 0;
    uint64_t total_plaintext_size = 0;
    uint64_t total_ciphertext_size = 0;
    Hash256 merkle_root{};
    Timestamp started_at{};
    Timestamp ended_at{};
    bool compression_enabled = false;
    Hash256 manifest_hash{};

    [[nodiscard]] std::vector<uint8_t> CanonicalBytes() const;

    [[nodiscard]] Hash256 ComputeHash() const;

    /// Constant-time check of manifest_hash against a fresh ComputeHash().
    [[nodiscard]] bool HasValidHash() const;

    /// Fills manifest_hash; called once at seal time.
    void Seal();
};

/// Everything persisted for a sealed session besides the chunks.
struct SealedRecord {
    SessionManifest manifest;
    std::string owner;
    Timestamp created_at{};
    Timestamp expires_at{};
    uint32_t retention_days = 0;
    uint32_t anchor_retry_limit = 0;
    std::vector<ChunkDescriptor> chunks;
    std::optional<crypto::Ed25519Signature> signature;
    std::optional<crypto::Ed25519PublicKey> signer_public_key;

    /// True when no signature is attached or the attached one verifies.
    [[nodiscard]] bool VerifySignature() const;
};

}
