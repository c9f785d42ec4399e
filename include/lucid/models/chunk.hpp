#pragma once
#include "lucid/core/types.hpp"
#include "lucid/crypto/xchacha20_poly1305.hpp"
#include <cstdint>
#include <vector>
namespace lucid::models {

/// Chunker output: payload is Zstd frame bytes, or raw plaintext when the
/// session runs without compression.
struct RawChunk {
    uint64_t index = 0;
    std::vector<uint8_t> payload;
    uint64_t plaintext_size = 0;
    Hash256 plaintext_hash{};
};

struct EncryptedChunk {
    SessionId session_id;
    uint64_t index = 0;
    std::vector<uint8_t> ciphertext;
    crypto::Nonce192 nonce{};
    crypto::Tag128 tag{};
    Hash256 ciphertext_hash{};
    uint64_t plaintext_size = 0;
    Hash256 plaintext_hash{};
};

/// What a chunk store hands back for (session_id, index).
struct StoredChunk {
    std::vector<uint8_t> ciphertext;
    crypto::Nonce192 nonce{};
    crypto::Tag128 tag{};
};

/// Per-chunk entry of the sealed record, kept beside the manifest.
struct ChunkDescriptor {
    uint64_t index = 0;
    uint64_t plaintext_size = 0;
    uint64_t compressed_size = 0;
    uint64_t ciphertext_size = 0;
    Hash256 plaintext_hash{};
    Hash256 ciphertext_hash{};

    [[nodiscard]] double CompressionRatio() const noexcept {
        if (compressed_size == 0) {
            return 0.0;
        }
        return static_cast<double>(plaintext_size) / static_cast<double>(compressed_size);
    }

    bool operator==(const ChunkDescriptor&) const = default;
};

}
