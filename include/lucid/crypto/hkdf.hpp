#pragma once

#include "lucid/core/result.hpp"
#include "lucid/core/failures.hpp"

#include <cstdint>
#include <span>
#include <vector>

namespace lucid::crypto {

/**
 * @brief HKDF-SHA256 (RFC 5869) over OpenSSL's EVP_KDF
 *
 * Extract and expand run as one derivation. Session keys are derived with
 * the master secret as input key material, the session id as salt and a
 * versioned label as info.
 */
class Hkdf {
public:
    /**
     * @brief Fill @p output with key material
     *
     * @param ikm Input key material, must not be empty
     * @param output Destination, at most MAX_OUTPUT_LEN bytes
     * @param salt Optional salt
     * @param info Optional context label
     */
    static Result<Unit, PipelineFailure> DeriveKey(
        std::span<const uint8_t> ikm,
        std::span<uint8_t> output,
        std::span<const uint8_t> salt = {},
        std::span<const uint8_t> info = {});

    static Result<std::vector<uint8_t>, PipelineFailure> DeriveKeyBytes(
        std::span<const uint8_t> ikm,
        size_t output_size,
        std::span<const uint8_t> salt = {},
        std::span<const uint8_t> info = {});

    static constexpr size_t HASH_LEN = 32;
    static constexpr size_t MAX_OUTPUT_LEN = 255 * HASH_LEN;

private:
    Hkdf() = delete;
};

}
