#pragma once

#include "lucid/core/result.hpp"
#include "lucid/core/failures.hpp"
#include "lucid/core/types.hpp"
#include "lucid/crypto/sodium_secure_memory_handle.hpp"
#include "lucid/crypto/xchacha20_poly1305.hpp"
#include "lucid/interfaces/i_master_secret_provider.hpp"
#include "lucid/models/chunk.hpp"

#include <array>
#include <cstdint>
#include <mutex>
#include <vector>

namespace lucid::pipeline {

/**
 * @brief Per-session authenticated encryption of chunks
 *
 * The session key is HKDF-SHA256(master secret, salt = session id,
 * info = "lucid-session-key-v1"), derived once and held in secure memory
 * until Wipe(). Nonce and associated data both bind the chunk to its
 * session and index, so a chunk replayed under another index or session
 * fails authentication.
 */
class Encryptor {
public:
    static Result<Encryptor, PipelineFailure> Create(
        const SessionId& session_id,
        interfaces::IMasterSecretProvider& secrets);

    [[nodiscard]] Result<models::EncryptedChunk, PipelineFailure> Encrypt(models::RawChunk&& chunk) const;

    /// IntegrityError on tag mismatch.
    [[nodiscard]] Result<std::vector<uint8_t>, PipelineFailure> Decrypt(
        uint64_t index,
        const models::StoredChunk& stored) const;

    /// Drops the session key; later Encrypt/Decrypt calls fail.
    void Wipe() noexcept;

    [[nodiscard]] bool IsWiped() const;

    [[nodiscard]] const SessionId& GetSessionId() const noexcept { return session_id_; }

    [[nodiscard]] static crypto::Nonce192 NonceFor(const SessionId& session_id, uint64_t index);

    [[nodiscard]] static std::array<uint8_t, Constants::SESSION_ID_SIZE + Constants::CHUNK_INDEX_ENCODED_SIZE>
    AssociatedDataFor(const SessionId& session_id, uint64_t index);

    Encryptor(Encryptor&& other) noexcept;
    Encryptor& operator=(Encryptor&&) = delete;
    Encryptor(const Encryptor&) = delete;
    Encryptor& operator=(const Encryptor&) = delete;
    ~Encryptor() = default;

private:
    Encryptor(const SessionId& session_id, crypto::SecureMemoryHandle key)
        : session_id_(session_id), key_(std::move(key)) {}

    SessionId session_id_;
    mutable std::mutex key_lock_;
    crypto::SecureMemoryHandle key_;
};

}
