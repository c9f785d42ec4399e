#include "lucid/pipeline/chunker.hpp"
#include "lucid/core/format.hpp"
#include "lucid/debug/pipeline_logger.hpp"

#include <algorithm>

namespace lucid::pipeline {
using configuration::SessionConfig;

namespace {
    constexpr const char* COMPONENT = "chunker";

    struct DCtxDeleter {
        void operator()(ZSTD_DCtx* ctx) const noexcept { ZSTD_freeDCtx(ctx); }
    };

    PipelineFailure ZstdFailure(const char* stage, const size_t code) {
        return PipelineFailure::CompressionError(
            compat::format("Zstd {} failed: {}", stage, ZSTD_getErrorName(code)));
    }
}

size_t Chunker::SliceSizeFor(const SessionConfig& config) noexcept {
    if (!config.CompressionEnabled()) {
        return config.chunk_max;
    }
    const size_t window = config.chunk_max - config.chunk_min;
    return std::max<size_t>(1, std::min(ChunkConstants::MAX_COMPRESSION_SLICE, window / 4));
}

Result<Chunker, PipelineFailure> Chunker::Create(const SessionConfig& config) {
    if (auto valid = config.Validate(); valid.IsErr()) {
        return Result<Chunker, PipelineFailure>::Err(std::move(valid).UnwrapErr());
    }
    std::unique_ptr<ZSTD_CCtx, CCtxDeleter> cctx;
    if (config.CompressionEnabled()) {
        cctx.reset(ZSTD_createCCtx());
        if (!cctx) {
            return Result<Chunker, PipelineFailure>::Err(
                PipelineFailure::CompressionError("Failed to create Zstd compression context"));
        }
        size_t rc = ZSTD_CCtx_setParameter(cctx.get(), ZSTD_c_compressionLevel, config.compression_level);
        if (ZSTD_isError(rc)) {
            return Result<Chunker, PipelineFailure>::Err(ZstdFailure("set level", rc));
        }
        rc = ZSTD_CCtx_setParameter(cctx.get(), ZSTD_c_checksumFlag, 1);
        if (ZSTD_isError(rc)) {
            return Result<Chunker, PipelineFailure>::Err(ZstdFailure("enable checksum", rc));
        }
    }
    return Result<Chunker, PipelineFailure>::Ok(Chunker(config, std::move(cctx)));
}

Chunker::Chunker(const SessionConfig& config, std::unique_ptr<ZSTD_CCtx, CCtxDeleter> cctx)
    : config_(config)
    , cctx_(std::move(cctx))
    , slice_size_(SliceSizeFor(config)) {
}

Result<Unit, PipelineFailure> Chunker::Append(std::span<const uint8_t> data, const ChunkSink& sink) {
    if (finished_) {
        return Result<Unit, PipelineFailure>::Err(
            PipelineFailure::InputError("Chunker already finished"));
    }
    if (data.empty()) {
        return Result<Unit, PipelineFailure>::Ok(unit);
    }
    bytes_in_ += data.size();
    if (!config_.CompressionEnabled()) {
        return AppendRaw(data, sink);
    }
    return AppendCompressed(data, sink);
}

Result<Unit, PipelineFailure> Chunker::AppendRaw(std::span<const uint8_t> data, const ChunkSink& sink) {
    while (!data.empty()) {
        const size_t room = config_.chunk_max - current_payload_.size();
        const size_t take = std::min(room, data.size());
        const auto piece = data.first(take);
        current_payload_.insert(current_payload_.end(), piece.begin(), piece.end());
        plaintext_hash_.Update(piece);
        current_plaintext_ += take;
        data = data.subspan(take);
        if (current_payload_.size() == config_.chunk_max) {
            if (auto sealed = SealCurrent(sink); sealed.IsErr()) {
                return sealed;
            }
        }
    }
    return Result<Unit, PipelineFailure>::Ok(unit);
}

Result<Unit, PipelineFailure> Chunker::AppendCompressed(std::span<const uint8_t> data, const ChunkSink& sink) {
    // Top up a partial slice left over from the previous call first.
    if (!pending_.empty()) {
        const size_t take = std::min(slice_size_ - pending_.size(), data.size());
        pending_.insert(pending_.end(), data.begin(), data.begin() + static_cast<std::ptrdiff_t>(take));
        data = data.subspan(take);
        if (pending_.size() < slice_size_) {
            return Result<Unit, PipelineFailure>::Ok(unit);
        }
        std::vector<uint8_t> slice;
        slice.swap(pending_);
        if (auto fed = FeedSlice(slice); fed.IsErr()) {
            return fed;
        }
        if (FrameNearlyFull()) {
            if (auto sealed = SealCurrent(sink); sealed.IsErr()) {
                return sealed;
            }
        }
    }

    while (data.size() >= slice_size_) {
        if (auto fed = FeedSlice(data.first(slice_size_)); fed.IsErr()) {
            return fed;
        }
        data = data.subspan(slice_size_);
        if (FrameNearlyFull()) {
            if (auto sealed = SealCurrent(sink); sealed.IsErr()) {
                return sealed;
            }
        }
    }
    pending_.assign(data.begin(), data.end());
    return Result<Unit, PipelineFailure>::Ok(unit);
}

Result<Unit, PipelineFailure> Chunker::FeedSlice(std::span<const uint8_t> slice) {
    plaintext_hash_.Update(slice);
    current_plaintext_ += slice.size();
    return Drive(slice, ZSTD_e_flush);
}

Result<Unit, PipelineFailure> Chunker::Drive(std::span<const uint8_t> input, const ZSTD_EndDirective directive) {
    ZSTD_inBuffer in{input.data(), input.size(), 0};
    const size_t out_step = ZSTD_CStreamOutSize();
    size_t remaining = 0;
    do {
        const size_t used = current_payload_.size();
        current_payload_.resize(used + out_step);
        ZSTD_outBuffer out{current_payload_.data() + used, out_step, 0};
        remaining = ZSTD_compressStream2(cctx_.get(), &out, &in, directive);
        current_payload_.resize(used + out.pos);
        if (ZSTD_isError(remaining)) {
            return Result<Unit, PipelineFailure>::Err(ZstdFailure("compression", remaining));
        }
    } while (remaining != 0 || in.pos < in.size);
    return Result<Unit, PipelineFailure>::Ok(unit);
}

bool Chunker::FrameNearlyFull() const noexcept {
    return current_payload_.size() + ZSTD_compressBound(slice_size_) +
           ChunkConstants::FRAME_EPILOGUE_RESERVE > config_.chunk_max;
}

Result<Unit, PipelineFailure> Chunker::SealCurrent(const ChunkSink& sink) {
    if (config_.CompressionEnabled()) {
        if (auto ended = Drive({}, ZSTD_e_end); ended.IsErr()) {
            return ended;
        }
    }
    if (current_payload_.size() > config_.chunk_max) {
        return Result<Unit, PipelineFailure>::Err(
            PipelineFailure::CompressionError(
                compat::format("Chunk {} payload of {} bytes exceeds chunk_max {}",
                    next_index_, current_payload_.size(), config_.chunk_max)));
    }

    models::RawChunk chunk;
    chunk.index = next_index_;
    chunk.payload = std::move(current_payload_);
    chunk.plaintext_size = current_plaintext_;
    chunk.plaintext_hash = plaintext_hash_.FinalizeAndReset();
    current_payload_.clear();
    current_plaintext_ = 0;
    ++next_index_;

    LUCID_LOG_DEBUG(COMPONENT, "sealed chunk {} ({} plaintext bytes, {} payload bytes)",
                    chunk.index, chunk.plaintext_size, chunk.payload.size());
    return sink(std::move(chunk));
}

Result<Unit, PipelineFailure> Chunker::Finish(const ChunkSink& sink) {
    if (finished_) {
        return Result<Unit, PipelineFailure>::Err(
            PipelineFailure::InputError("Chunker already finished"));
    }
    finished_ = true;
    if (!pending_.empty()) {
        std::vector<uint8_t> tail;
        tail.swap(pending_);
        if (auto fed = FeedSlice(tail); fed.IsErr()) {
            return fed;
        }
    }
    if (current_plaintext_ == 0) {
        return Result<Unit, PipelineFailure>::Ok(unit);
    }
    return SealCurrent(sink);
}

Result<std::vector<uint8_t>, PipelineFailure> DecompressChunk(
    std::span<const uint8_t> frame,
    const uint64_t expected_size) {

    if (frame.empty() || expected_size / ChunkConstants::MAX_DECOMPRESSION_RATIO > frame.size()) {
        return Result<std::vector<uint8_t>, PipelineFailure>::Err(
            PipelineFailure::CompressionError(
                compat::format("A {}-byte Zstd frame cannot hold the recorded {} bytes",
                    frame.size(), expected_size)));
    }
    const unsigned long long declared = ZSTD_getFrameContentSize(frame.data(), frame.size());
    if (declared == ZSTD_CONTENTSIZE_ERROR) {
        return Result<std::vector<uint8_t>, PipelineFailure>::Err(
            PipelineFailure::CompressionError("Chunk payload is not a Zstd frame"));
    }
    if (declared != ZSTD_CONTENTSIZE_UNKNOWN && declared != expected_size) {
        return Result<std::vector<uint8_t>, PipelineFailure>::Err(
            PipelineFailure::CompressionError(
                compat::format("Zstd frame declares {} bytes, expected {}", declared, expected_size)));
    }

    std::unique_ptr<ZSTD_DCtx, DCtxDeleter> dctx(ZSTD_createDCtx());
    if (!dctx) {
        return Result<std::vector<uint8_t>, PipelineFailure>::Err(
            PipelineFailure::CompressionError("Failed to create Zstd decompression context"));
    }

    std::vector<uint8_t> output(static_cast<size_t>(expected_size));
    ZSTD_inBuffer in{frame.data(), frame.size(), 0};
    ZSTD_outBuffer out{output.data(), output.size(), 0};
    size_t hint = 1;
    while (in.pos < in.size) {
        const size_t before_in = in.pos;
        const size_t before_out = out.pos;
        hint = ZSTD_decompressStream(dctx.get(), &out, &in);
        if (ZSTD_isError(hint)) {
            return Result<std::vector<uint8_t>, PipelineFailure>::Err(ZstdFailure("decompression", hint));
        }
        if (hint == 0) {
            break;
        }
        if (in.pos == before_in && out.pos == before_out) {
            // Output is full but the frame wants to keep going.
            return Result<std::vector<uint8_t>, PipelineFailure>::Err(
                PipelineFailure::CompressionError(
                    compat::format("Zstd frame expands beyond the recorded {} bytes", expected_size)));
        }
    }
    if (hint != 0 || in.pos != in.size) {
        return Result<std::vector<uint8_t>, PipelineFailure>::Err(
            PipelineFailure::CompressionError("Zstd frame is truncated or followed by trailing data"));
    }
    if (out.pos != output.size()) {
        return Result<std::vector<uint8_t>, PipelineFailure>::Err(
            PipelineFailure::CompressionError(
                compat::format("Zstd frame decoded to {} bytes, expected {}", out.pos, expected_size)));
    }
    return Result<std::vector<uint8_t>, PipelineFailure>::Ok(std::move(output));
}

}
