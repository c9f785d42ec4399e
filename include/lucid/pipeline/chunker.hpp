#pragma once

#include "lucid/configuration/session_config.hpp"
#include "lucid/core/result.hpp"
#include "lucid/core/failures.hpp"
#include "lucid/crypto/sodium_interop.hpp"
#include "lucid/models/chunk.hpp"

#include <zstd.h>

#include <cstdint>
#include <functional>
#include <memory>
#include <span>
#include <vector>

namespace lucid::pipeline {

using ChunkSink = std::function<Result<Unit, PipelineFailure>(models::RawChunk&&)>;

/**
 * @brief Splits a session's byte stream into sealed chunks
 *
 * **Uncompressed** (compression_level == 0): plaintext accumulates in a
 * rolling buffer and a chunk is cut at exactly chunk_max bytes.
 *
 * **Compressed**: plaintext is fed to one Zstd frame per chunk in fixed
 * slices, each flushed so the frame size is known after every slice. The
 * frame is closed as soon as one more slice might push it past chunk_max,
 * which keeps every non-final frame within [chunk_min, chunk_max]
 * (SessionConfig::Validate guarantees the window is wide enough).
 *
 * Chunk boundaries depend only on the concatenated input, never on how it
 * was split across Append() calls. Finish() turns the remainder into the
 * final chunk unless nothing is left.
 *
 * Not thread-safe; each session owns one Chunker on the submitter thread.
 */
class Chunker {
public:
    static Result<Chunker, PipelineFailure> Create(const configuration::SessionConfig& config);

    Result<Unit, PipelineFailure> Append(std::span<const uint8_t> data, const ChunkSink& sink);

    Result<Unit, PipelineFailure> Finish(const ChunkSink& sink);

    [[nodiscard]] uint64_t NextIndex() const noexcept { return next_index_; }
    [[nodiscard]] uint64_t BytesIn() const noexcept { return bytes_in_; }
    [[nodiscard]] size_t SliceSize() const noexcept { return slice_size_; }
    [[nodiscard]] bool Finished() const noexcept { return finished_; }

    /// Slice fed to Zstd per flush for the given bounds.
    [[nodiscard]] static size_t SliceSizeFor(const configuration::SessionConfig& config) noexcept;

    Chunker(Chunker&&) noexcept = default;
    Chunker& operator=(Chunker&&) noexcept = default;
    Chunker(const Chunker&) = delete;
    Chunker& operator=(const Chunker&) = delete;
    ~Chunker() = default;

private:
    struct CCtxDeleter {
        void operator()(ZSTD_CCtx* ctx) const noexcept { ZSTD_freeCCtx(ctx); }
    };

    Chunker(const configuration::SessionConfig& config, std::unique_ptr<ZSTD_CCtx, CCtxDeleter> cctx);

    Result<Unit, PipelineFailure> AppendRaw(std::span<const uint8_t> data, const ChunkSink& sink);
    Result<Unit, PipelineFailure> AppendCompressed(std::span<const uint8_t> data, const ChunkSink& sink);
    Result<Unit, PipelineFailure> FeedSlice(std::span<const uint8_t> slice);
    Result<Unit, PipelineFailure> Drive(std::span<const uint8_t> input, ZSTD_EndDirective directive);
    Result<Unit, PipelineFailure> SealCurrent(const ChunkSink& sink);
    [[nodiscard]] bool FrameNearlyFull() const noexcept;

    configuration::SessionConfig config_;
    std::unique_ptr<ZSTD_CCtx, CCtxDeleter> cctx_;
    size_t slice_size_ = 0;
    std::vector<uint8_t> pending_;
    std::vector<uint8_t> current_payload_;
    uint64_t current_plaintext_ = 0;
    crypto::HashState plaintext_hash_;
    uint64_t next_index_ = 0;
    uint64_t bytes_in_ = 0;
    bool finished_ = false;
};

/// Inverse of the chunker's compression step. Fails unless @p frame is a
/// complete Zstd frame of exactly @p expected_size plaintext bytes. Sizes
/// the frame could not possibly hold, or that contradict the size the frame
/// header declares, are rejected before any output is allocated.
Result<std::vector<uint8_t>, PipelineFailure> DecompressChunk(
    std::span<const uint8_t> frame,
    uint64_t expected_size);

}
