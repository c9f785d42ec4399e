#include "lucid/crypto/xchacha20_poly1305.hpp"
#include "lucid/crypto/sodium_interop.hpp"
#include "lucid/core/format.hpp"
#include <sodium.h>
namespace lucid::crypto {
namespace {
    Result<Unit, PipelineFailure> CheckKeyAndNonce(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce) {
        if (key.size() != crypto_aead_xchacha20poly1305_ietf_KEYBYTES) {
            return Result<Unit, PipelineFailure>::Err(
                PipelineFailure::EncryptionError(
                    compat::format("XChaCha20-Poly1305 key must be {} bytes, got {}",
                        crypto_aead_xchacha20poly1305_ietf_KEYBYTES, key.size())));
        }
        if (nonce.size() != crypto_aead_xchacha20poly1305_ietf_NPUBBYTES) {
            return Result<Unit, PipelineFailure>::Err(
                PipelineFailure::EncryptionError(
                    compat::format("XChaCha20-Poly1305 nonce must be {} bytes, got {}",
                        crypto_aead_xchacha20poly1305_ietf_NPUBBYTES, nonce.size())));
        }
        return Result<Unit, PipelineFailure>::Ok(unit);
    }
}
static_assert(crypto_aead_xchacha20poly1305_ietf_NPUBBYTES == Constants::XCHACHA20_NONCE_SIZE);
static_assert(crypto_aead_xchacha20poly1305_ietf_ABYTES == Constants::POLY1305_TAG_SIZE);
static_assert(crypto_aead_xchacha20poly1305_ietf_KEYBYTES == Constants::SESSION_KEY_SIZE);

Result<SealedBox, PipelineFailure>
XChaCha20Poly1305::Seal(
    std::span<const uint8_t> key,
    std::span<const uint8_t> nonce,
    std::span<const uint8_t> plaintext,
    std::span<const uint8_t> associated_data) {
    if (auto check = CheckKeyAndNonce(key, nonce); check.IsErr()) {
        return Result<SealedBox, PipelineFailure>::Err(std::move(check).UnwrapErr());
    }
    SealedBox box;
    box.ciphertext.resize(plaintext.size());
    unsigned long long tag_len = 0;
    if (crypto_aead_xchacha20poly1305_ietf_encrypt_detached(
            box.ciphertext.data(),
            box.tag.data(), &tag_len,
            plaintext.data(), plaintext.size(),
            associated_data.empty() ? nullptr : associated_data.data(),
            associated_data.size(),
            nullptr,
            nonce.data(), key.data()) != SodiumConstants::SUCCESS) {
        return Result<SealedBox, PipelineFailure>::Err(
            PipelineFailure::EncryptionError(
                compat::format("XChaCha20-Poly1305 encryption of {} bytes failed", plaintext.size())));
    }
    return Result<SealedBox, PipelineFailure>::Ok(std::move(box));
}

Result<std::vector<uint8_t>, PipelineFailure>
XChaCha20Poly1305::Open(
    std::span<const uint8_t> key,
    std::span<const uint8_t> nonce,
    std::span<const uint8_t> ciphertext,
    std::span<const uint8_t> tag,
    std::span<const uint8_t> associated_data) {
    if (auto check = CheckKeyAndNonce(key, nonce); check.IsErr()) {
        return Result<std::vector<uint8_t>, PipelineFailure>::Err(std::move(check).UnwrapErr());
    }
    if (tag.size() != Constants::POLY1305_TAG_SIZE) {
        return Result<std::vector<uint8_t>, PipelineFailure>::Err(
            PipelineFailure::IntegrityError(
                compat::format("Poly1305 tag must be {} bytes, got {}",
                    Constants::POLY1305_TAG_SIZE, tag.size())));
    }
    std::vector<uint8_t> output(ciphertext.size());
    if (crypto_aead_xchacha20poly1305_ietf_decrypt_detached(
            output.data(),
            nullptr,
            ciphertext.data(), ciphertext.size(),
            tag.data(),
            associated_data.empty() ? nullptr : associated_data.data(),
            associated_data.size(),
            nonce.data(), key.data()) != SodiumConstants::SUCCESS) {
        { auto wipe = SodiumInterop::SecureWipe(std::span<uint8_t>(output)); (void)wipe; }
        return Result<std::vector<uint8_t>, PipelineFailure>::Err(
            PipelineFailure::IntegrityError(std::string(ErrorMessages::TAG_MISMATCH)));
    }
    return Result<std::vector<uint8_t>, PipelineFailure>::Ok(std::move(output));
}
}
