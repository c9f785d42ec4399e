#pragma once
#include "lucid/core/result.hpp"
#include "lucid/core/failures.hpp"
#include "lucid/core/constants.hpp"
#include <array>
#include <cstdint>
#include <span>
#include <vector>
namespace lucid::crypto {

using Nonce192 = std::array<uint8_t, Constants::XCHACHA20_NONCE_SIZE>;
using Tag128 = std::array<uint8_t, Constants::POLY1305_TAG_SIZE>;

struct SealedBox {
    std::vector<uint8_t> ciphertext;
    Tag128 tag{};
};

/**
 * XChaCha20-Poly1305 AEAD with a detached tag.
 *
 * Stateless primitive. The caller owns nonce uniqueness: the pipeline
 * derives the nonce from (session id, chunk index), and every session has
 * its own key, so a (key, nonce) pair is used for exactly one chunk.
 * Open() returning Err means the tag did not verify; no plaintext is
 * released in that case.
 */
class XChaCha20Poly1305 {
public:
    [[nodiscard]] static Result<SealedBox, PipelineFailure>
    Seal(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce,
        std::span<const uint8_t> plaintext,
        std::span<const uint8_t> associated_data = {});
    [[nodiscard]] static Result<std::vector<uint8_t>, PipelineFailure>
    Open(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce,
        std::span<const uint8_t> ciphertext,
        std::span<const uint8_t> tag,
        std::span<const uint8_t> associated_data = {});
private:
    XChaCha20Poly1305() = delete;
};
}
