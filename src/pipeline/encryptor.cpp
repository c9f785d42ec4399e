#include "lucid/pipeline/encryptor.hpp"
#include "lucid/crypto/hkdf.hpp"
#include "lucid/crypto/sodium_interop.hpp"
#include "lucid/core/constants.hpp"

#include <algorithm>

namespace lucid::pipeline {
using crypto::Hkdf;
using crypto::SecureMemoryHandle;
using crypto::SodiumInterop;
using crypto::XChaCha20Poly1305;

namespace {
    void WriteIndexLE(uint8_t* out, const uint64_t index) {
        for (size_t i = 0; i < Constants::CHUNK_INDEX_ENCODED_SIZE; ++i) {
            out[i] = static_cast<uint8_t>((index >> (i * 8)) & 0xFF);
        }
    }
}

Result<Encryptor, PipelineFailure> Encryptor::Create(
    const SessionId& session_id,
    interfaces::IMasterSecretProvider& secrets) {

    auto handle_result = SecureMemoryHandle::Allocate(Constants::SESSION_KEY_SIZE);
    if (handle_result.IsErr()) {
        return Result<Encryptor, PipelineFailure>::Err(
            PipelineFailure::FromSodiumFailure(handle_result.UnwrapErr()));
    }
    SecureMemoryHandle key = std::move(handle_result).Unwrap();

    const auto& info = PipelineConstants::SESSION_KEY_INFO;
    auto derived = secrets.ExecuteWithSecret([&](std::span<const uint8_t> master) {
        auto written = key.WithWriteAccess([&](std::span<uint8_t> out) {
            return Hkdf::DeriveKey(
                master, out, session_id.AsSpan(),
                std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(info.data()), info.size()));
        });
        if (written.IsErr()) {
            return Result<Unit, PipelineFailure>::Err(
                PipelineFailure::FromSodiumFailure(written.UnwrapErr()));
        }
        return std::move(written).Unwrap();
    });
    if (derived.IsErr()) {
        return Result<Encryptor, PipelineFailure>::Err(std::move(derived).UnwrapErr());
    }
    return Result<Encryptor, PipelineFailure>::Ok(Encryptor(session_id, std::move(key)));
}

Encryptor::Encryptor(Encryptor&& other) noexcept
    : session_id_(other.session_id_) {
    std::lock_guard guard(other.key_lock_);
    key_ = std::move(other.key_);
}

crypto::Nonce192 Encryptor::NonceFor(const SessionId& session_id, const uint64_t index) {
    crypto::Nonce192 nonce{};
    std::copy(session_id.bytes.begin(), session_id.bytes.end(), nonce.begin());
    WriteIndexLE(nonce.data() + Constants::SESSION_ID_SIZE, index);
    return nonce;
}

std::array<uint8_t, Constants::SESSION_ID_SIZE + Constants::CHUNK_INDEX_ENCODED_SIZE>
Encryptor::AssociatedDataFor(const SessionId& session_id, const uint64_t index) {
    std::array<uint8_t, Constants::SESSION_ID_SIZE + Constants::CHUNK_INDEX_ENCODED_SIZE> aad{};
    std::copy(session_id.bytes.begin(), session_id.bytes.end(), aad.begin());
    WriteIndexLE(aad.data() + Constants::SESSION_ID_SIZE, index);
    return aad;
}

Result<models::EncryptedChunk, PipelineFailure> Encryptor::Encrypt(models::RawChunk&& chunk) const {
    const auto nonce = NonceFor(session_id_, chunk.index);
    const auto aad = AssociatedDataFor(session_id_, chunk.index);

    std::lock_guard guard(key_lock_);
    auto sealed = key_.WithReadAccess([&](std::span<const uint8_t> key) {
        return XChaCha20Poly1305::Seal(key, nonce, chunk.payload, aad);
    });
    if (sealed.IsErr()) {
        return Result<models::EncryptedChunk, PipelineFailure>::Err(
            PipelineFailure::EncryptionError("Session key unavailable: " + sealed.UnwrapErr().message));
    }
    auto box_result = std::move(sealed).Unwrap();
    if (box_result.IsErr()) {
        return Result<models::EncryptedChunk, PipelineFailure>::Err(std::move(box_result).UnwrapErr());
    }
    auto box = std::move(box_result).Unwrap();

    models::EncryptedChunk out;
    out.session_id = session_id_;
    out.index = chunk.index;
    out.ciphertext_hash = SodiumInterop::Hash(box.ciphertext);
    out.ciphertext = std::move(box.ciphertext);
    out.nonce = nonce;
    out.tag = box.tag;
    out.plaintext_size = chunk.plaintext_size;
    out.plaintext_hash = chunk.plaintext_hash;
    return Result<models::EncryptedChunk, PipelineFailure>::Ok(std::move(out));
}

Result<std::vector<uint8_t>, PipelineFailure> Encryptor::Decrypt(
    const uint64_t index,
    const models::StoredChunk& stored) const {

    const auto expected_nonce = NonceFor(session_id_, index);
    if (!SodiumInterop::ConstantTimeEquals(expected_nonce, stored.nonce)) {
        return Result<std::vector<uint8_t>, PipelineFailure>::Err(
            PipelineFailure::IntegrityError(
                "Stored nonce for chunk " + std::to_string(index) + " does not match its position"));
    }
    const auto aad = AssociatedDataFor(session_id_, index);

    std::lock_guard guard(key_lock_);
    auto opened = key_.WithReadAccess([&](std::span<const uint8_t> key) {
        return XChaCha20Poly1305::Open(key, stored.nonce, stored.ciphertext, stored.tag, aad);
    });
    if (opened.IsErr()) {
        return Result<std::vector<uint8_t>, PipelineFailure>::Err(
            PipelineFailure::EncryptionError("Session key unavailable: " + opened.UnwrapErr().message));
    }
    return std::move(opened).Unwrap();
}

void Encryptor::Wipe() noexcept {
    std::lock_guard guard(key_lock_);
    key_.Wipe();
}

bool Encryptor::IsWiped() const {
    std::lock_guard guard(key_lock_);
    return key_.IsInvalid();
}

}
