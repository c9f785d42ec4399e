#pragma once

#include "lucid/core/result.hpp"
#include "lucid/core/failures.hpp"
#include "lucid/core/constants.hpp"
#include "lucid/core/types.hpp"

#include <sodium.h>
#include <atomic>
#include <cstddef>
#include <mutex>
#include <span>
#include <vector>

namespace lucid::crypto {

class SecureMemoryHandle;

/**
 * @brief Interop layer for libsodium
 *
 * Static facade over the libsodium calls the pipeline needs: library
 * initialization, secure wiping, constant-time comparison, random bytes,
 * BLAKE2b-256 hashing and guarded allocation.
 */
class SodiumInterop {
public:
    // ========================================================================
    // Initialization
    // ========================================================================

    /**
     * @brief Initialize libsodium
     *
     * Thread-safe and idempotent. Every other call in this class (and
     * SecureMemoryHandle::Allocate) requires it to have succeeded.
     */
    static Result<Unit, SodiumFailure> Initialize();

    static bool IsInitialized() noexcept;

    // ========================================================================
    // Secure Memory Operations
    // ========================================================================

    /**
     * @brief Securely wipe a buffer
     *
     * Buffers up to Constants::SMALL_BUFFER_THRESHOLD are cleared through a
     * volatile loop, larger ones with sodium_memzero.
     */
    static Result<Unit, SodiumFailure> SecureWipe(std::span<uint8_t> buffer);

    /**
     * @brief Constant-time comparison of two buffers
     *
     * Buffers of different length compare unequal without touching the data.
     */
    static bool ConstantTimeEquals(
        std::span<const uint8_t> a,
        std::span<const uint8_t> b) noexcept;

    // ========================================================================
    // Hashing
    // ========================================================================

    /// BLAKE2b with a 256-bit digest, unkeyed.
    static Hash256 Hash(std::span<const uint8_t> data);

    /// Digest of the concatenation of two 256-bit values (Merkle inner node).
    static Hash256 HashPair(const Hash256& left, const Hash256& right);

    // ========================================================================
    // Random Number Generation
    // ========================================================================

    static std::vector<uint8_t> GetRandomBytes(size_t size);

    // ========================================================================
    // Memory Allocation (Internal)
    // ========================================================================

    /**
     * @brief Allocate guarded memory with sodium_malloc
     *
     * Returns nullptr if libsodium is not initialized or the allocation
     * fails. Pages are locked and zeroed when freed.
     */
    static void* AllocateSecure(size_t size) noexcept;

    static void FreeSecure(void* ptr) noexcept;

    static constexpr size_t MAX_BUFFER_SIZE = 1'000'000'000;

private:
    static inline std::atomic<bool> initialized_{false};
    static inline std::once_flag init_flag_;

    static Result<Unit, SodiumFailure> WipeSmallBuffer(std::span<uint8_t> buffer);
    static Result<Unit, SodiumFailure> WipeLargeBuffer(std::span<uint8_t> buffer);

    SodiumInterop() = delete;
    ~SodiumInterop() = delete;
    SodiumInterop(const SodiumInterop&) = delete;
    SodiumInterop& operator=(const SodiumInterop&) = delete;
};

/**
 * @brief Incremental BLAKE2b-256
 *
 * Used where the input arrives in pieces, e.g. the chunker hashing
 * plaintext slices before the chunk boundary is known.
 */
class HashState {
public:
    HashState();

    void Update(std::span<const uint8_t> data);

    /// Produces the digest and resets the state for the next message.
    Hash256 FinalizeAndReset();

private:
    void Reset();

    crypto_generichash_state state_{};
};

}
