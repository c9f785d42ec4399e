#pragma once

#include "lucid/core/result.hpp"
#include "lucid/core/failures.hpp"
#include "lucid/core/constants.hpp"
#include "lucid/crypto/sodium_secure_memory_handle.hpp"

#include <array>
#include <cstdint>
#include <span>
#include <vector>

namespace lucid::crypto {

using Ed25519PublicKey = std::array<uint8_t, Constants::ED_25519_PUBLIC_KEY_SIZE>;
using Ed25519Signature = std::array<uint8_t, Constants::ED_25519_SIGNATURE_SIZE>;

/**
 * @brief Ed25519 signer for sealed manifests
 *
 * Signs the manifest hash (not the manifest encoding), so the signature can
 * be checked against the value anchored on chain. The secret key lives in
 * a SecureMemoryHandle for the signer's lifetime.
 */
class ManifestSigner {
public:
    static Result<ManifestSigner, SodiumFailure> Generate();

    /// Deterministic key pair from a 32-byte seed.
    static Result<ManifestSigner, SodiumFailure> FromSeed(std::span<const uint8_t> seed);

    [[nodiscard]] Result<Ed25519Signature, SodiumFailure> Sign(std::span<const uint8_t> message) const;

    [[nodiscard]] const Ed25519PublicKey& PublicKey() const noexcept { return public_key_; }

    [[nodiscard]] static bool Verify(
        std::span<const uint8_t> public_key,
        std::span<const uint8_t> message,
        std::span<const uint8_t> signature) noexcept;

    ManifestSigner(ManifestSigner&&) noexcept = default;
    ManifestSigner& operator=(ManifestSigner&&) noexcept = default;
    ManifestSigner(const ManifestSigner&) = delete;
    ManifestSigner& operator=(const ManifestSigner&) = delete;

private:
    ManifestSigner(SecureMemoryHandle secret_key, const Ed25519PublicKey& public_key)
        : secret_key_(std::move(secret_key)), public_key_(public_key) {}

    SecureMemoryHandle secret_key_;
    Ed25519PublicKey public_key_{};
};

}
