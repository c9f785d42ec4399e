#include "lucid/crypto/manifest_signer.hpp"
#include "lucid/crypto/sodium_interop.hpp"

#include <sodium.h>
#include <string>

namespace lucid::crypto {

Result<ManifestSigner, SodiumFailure> ManifestSigner::Generate() {
    auto seed = SodiumInterop::GetRandomBytes(Constants::ED_25519_SEED_SIZE);
    auto signer = FromSeed(seed);
    auto wipe = SodiumInterop::SecureWipe(std::span<uint8_t>(seed));
    if (wipe.IsErr()) {
        return Result<ManifestSigner, SodiumFailure>::Err(std::move(wipe).UnwrapErr());
    }
    return signer;
}

Result<ManifestSigner, SodiumFailure> ManifestSigner::FromSeed(std::span<const uint8_t> seed) {
    if (seed.size() != Constants::ED_25519_SEED_SIZE) {
        return Result<ManifestSigner, SodiumFailure>::Err(
            SodiumFailure::InvalidOperation(
                "Ed25519 seed must be " + std::to_string(Constants::ED_25519_SEED_SIZE) +
                " bytes, got " + std::to_string(seed.size())));
    }

    auto handle_result = SecureMemoryHandle::Allocate(Constants::ED_25519_SECRET_KEY_SIZE);
    if (handle_result.IsErr()) {
        return Result<ManifestSigner, SodiumFailure>::Err(std::move(handle_result).UnwrapErr());
    }
    SecureMemoryHandle secret_key = std::move(handle_result).Unwrap();

    Ed25519PublicKey public_key{};
    auto keypair = secret_key.WithWriteAccess([&](std::span<uint8_t> sk) {
        return crypto_sign_seed_keypair(public_key.data(), sk.data(), seed.data());
    });
    if (keypair.IsErr()) {
        return Result<ManifestSigner, SodiumFailure>::Err(std::move(keypair).UnwrapErr());
    }
    if (keypair.Unwrap() != SodiumConstants::SUCCESS) {
        return Result<ManifestSigner, SodiumFailure>::Err(
            SodiumFailure::InvalidOperation("Failed to derive Ed25519 key pair from seed"));
    }
    return Result<ManifestSigner, SodiumFailure>::Ok(
        ManifestSigner(std::move(secret_key), public_key));
}

Result<Ed25519Signature, SodiumFailure> ManifestSigner::Sign(std::span<const uint8_t> message) const {
    Ed25519Signature signature{};
    auto status = secret_key_.WithReadAccess([&](std::span<const uint8_t> sk) {
        return crypto_sign_detached(signature.data(), nullptr,
                                    message.data(), message.size(), sk.data());
    });
    if (status.IsErr()) {
        return Result<Ed25519Signature, SodiumFailure>::Err(std::move(status).UnwrapErr());
    }
    if (status.Unwrap() != SodiumConstants::SUCCESS) {
        return Result<Ed25519Signature, SodiumFailure>::Err(
            SodiumFailure::InvalidOperation("Ed25519 signing failed"));
    }
    return Result<Ed25519Signature, SodiumFailure>::Ok(signature);
}

bool ManifestSigner::Verify(
    std::span<const uint8_t> public_key,
    std::span<const uint8_t> message,
    std::span<const uint8_t> signature) noexcept {
    if (public_key.size() != Constants::ED_25519_PUBLIC_KEY_SIZE ||
        signature.size() != Constants::ED_25519_SIGNATURE_SIZE) {
        return false;
    }
    return crypto_sign_verify_detached(signature.data(), message.data(), message.size(),
                                       public_key.data()) == SodiumConstants::SUCCESS;
}

}
