#pragma once

#include "lucid/core/constants.hpp"
#include "lucid/core/result.hpp"
#include "lucid/core/failures.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace lucid::configuration {

/**
 * @brief Per-session pipeline parameters, fixed at CreateSession
 *
 * **Chunk bounds**:
 * Every non-final chunk carries a compressed payload in
 * [chunk_min, chunk_max]. With compression disabled the payload is the
 * plaintext itself and chunks are cut at exactly chunk_max.
 *
 * **Compression**:
 * Zstd level 1..22; 0 disables compression. With compression enabled the
 * chunker seals a chunk once one more slice could overflow chunk_max, so
 * the window [chunk_min, chunk_max] must be at least
 * ChunkConstants::MIN_COMPRESSED_WINDOW wide.
 *
 * **Usage Example**:
 * ```cpp
 * auto config = SessionConfig::Default();
 * config.compression_level = 9;
 * auto id = orchestrator.CreateSession("alice", config);
 * ```
 */
struct SessionConfig {
    size_t chunk_min = ChunkConstants::DEFAULT_CHUNK_MIN;
    size_t chunk_max = ChunkConstants::DEFAULT_CHUNK_MAX;
    int compression_level = ChunkConstants::DEFAULT_COMPRESSION_LEVEL;
    uint32_t retention_days = PipelineConstants::DEFAULT_RETENTION_DAYS;
    uint32_t anchor_retry_limit = PipelineConstants::DEFAULT_ANCHOR_RETRY_LIMIT;
    std::chrono::milliseconds session_ttl = PipelineConstants::DEFAULT_SESSION_TTL;

    [[nodiscard]] static SessionConfig Default() noexcept {
        return SessionConfig{};
    }

    /// Raw chunks of exactly @p chunk_size bytes, no compression.
    [[nodiscard]] static SessionConfig Uncompressed(const size_t chunk_size) noexcept {
        SessionConfig config;
        config.chunk_min = chunk_size;
        config.chunk_max = chunk_size;
        config.compression_level = ChunkConstants::COMPRESSION_DISABLED;
        return config;
    }

    [[nodiscard]] bool CompressionEnabled() const noexcept {
        return compression_level != ChunkConstants::COMPRESSION_DISABLED;
    }

    [[nodiscard]] Result<Unit, PipelineFailure> Validate() const {
        if (chunk_min == 0) {
            return Result<Unit, PipelineFailure>::Err(
                PipelineFailure::InputError("chunk_min must be greater than zero"));
        }
        if (chunk_min > chunk_max) {
            return Result<Unit, PipelineFailure>::Err(
                PipelineFailure::InputError(
                    "chunk_min (" + std::to_string(chunk_min) +
                    ") exceeds chunk_max (" + std::to_string(chunk_max) + ")"));
        }
        if (chunk_max > ChunkConstants::MAX_CHUNK_BYTES) {
            return Result<Unit, PipelineFailure>::Err(
                PipelineFailure::InputError(
                    "chunk_max exceeds " + std::to_string(ChunkConstants::MAX_CHUNK_BYTES) + " bytes"));
        }
        if (compression_level < ChunkConstants::COMPRESSION_DISABLED ||
            compression_level > ChunkConstants::MAX_COMPRESSION_LEVEL) {
            return Result<Unit, PipelineFailure>::Err(
                PipelineFailure::InputError(
                    "compression_level must be in [0, " +
                    std::to_string(ChunkConstants::MAX_COMPRESSION_LEVEL) + "], got " +
                    std::to_string(compression_level)));
        }
        if (CompressionEnabled() && chunk_max - chunk_min < ChunkConstants::MIN_COMPRESSED_WINDOW) {
            return Result<Unit, PipelineFailure>::Err(
                PipelineFailure::InputError(
                    "chunk_max - chunk_min must be at least " +
                    std::to_string(ChunkConstants::MIN_COMPRESSED_WINDOW) +
                    " bytes when compression is enabled"));
        }
        if (anchor_retry_limit == 0) {
            return Result<Unit, PipelineFailure>::Err(
                PipelineFailure::InputError("anchor_retry_limit must be at least 1"));
        }
        if (session_ttl.count() <= 0) {
            return Result<Unit, PipelineFailure>::Err(
                PipelineFailure::InputError("session_ttl must be positive"));
        }
        return Result<Unit, PipelineFailure>::Ok(unit);
    }
};

}
