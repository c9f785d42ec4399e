#include <catch2/catch_test_macros.hpp>
#include "lucid/pipeline/chunker.hpp"
#include "helpers/pipeline_doubles.hpp"
#include <algorithm>
using namespace lucid;
using namespace lucid::pipeline;
using namespace lucid::test_helpers;
using configuration::SessionConfig;

namespace {

struct Collected {
    std::vector<models::RawChunk> chunks;

    ChunkSink Sink() {
        return [this](models::RawChunk&& chunk) {
            chunks.push_back(std::move(chunk));
            return Result<Unit, PipelineFailure>::Ok(unit);
        };
    }
};

SessionConfig SmallCompressed() {
    SessionConfig config;
    config.chunk_min = 16 * 1024;
    config.chunk_max = 32 * 1024;
    return config;
}

std::vector<models::RawChunk> ChunkAll(
    const SessionConfig& config,
    const std::vector<uint8_t>& data,
    const size_t submission) {
    auto chunker = Chunker::Create(config).Unwrap();
    Collected collected;
    auto sink = collected.Sink();
    for (size_t offset = 0; offset < data.size(); offset += submission) {
        const size_t length = std::min(submission, data.size() - offset);
        REQUIRE(chunker.Append(std::span<const uint8_t>(data).subspan(offset, length), sink).IsOk());
    }
    REQUIRE(chunker.Finish(sink).IsOk());
    REQUIRE(chunker.BytesIn() == data.size());
    REQUIRE(chunker.NextIndex() == collected.chunks.size());
    return std::move(collected.chunks);
}

std::vector<uint8_t> Reassemble(const SessionConfig& config, const std::vector<models::RawChunk>& chunks) {
    std::vector<uint8_t> out;
    for (const auto& chunk : chunks) {
        if (config.CompressionEnabled()) {
            auto plaintext = DecompressChunk(chunk.payload, chunk.plaintext_size);
            REQUIRE(plaintext.IsOk());
            out.insert(out.end(), plaintext.Unwrap().begin(), plaintext.Unwrap().end());
        } else {
            out.insert(out.end(), chunk.payload.begin(), chunk.payload.end());
        }
    }
    return out;
}

}

TEST_CASE("Chunker - Creation", "[pipeline][chunker]") {
    EnsureSodium();
    SECTION("Invalid config is rejected") {
        SessionConfig config;
        config.chunk_min = 0;
        auto result = Chunker::Create(config);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == PipelineFailureType::InputError);
    }
    SECTION("Slice size follows the compressed window") {
        REQUIRE(Chunker::SliceSizeFor(SmallCompressed()) == 4 * 1024);
        REQUIRE(Chunker::SliceSizeFor(SessionConfig::Default()) == ChunkConstants::MAX_COMPRESSION_SLICE);
        REQUIRE(Chunker::SliceSizeFor(SessionConfig::Uncompressed(1000)) == 1000);
    }
}

TEST_CASE("Chunker - Uncompressed Boundaries", "[pipeline][chunker]") {
    EnsureSodium();
    const auto config = SessionConfig::Uncompressed(1000);
    const auto data = NoiseBytes(4500);
    const auto chunks = ChunkAll(config, data, 333);

    REQUIRE(chunks.size() == 5);
    for (size_t i = 0; i < chunks.size(); ++i) {
        REQUIRE(chunks[i].index == i);
        REQUIRE(chunks[i].plaintext_size == chunks[i].payload.size());
        REQUIRE(chunks[i].plaintext_hash == crypto::SodiumInterop::Hash(chunks[i].payload));
    }
    REQUIRE(chunks.back().plaintext_size == 500);
    REQUIRE(Reassemble(config, chunks) == data);
}

TEST_CASE("Chunker - Compressed Boundaries", "[pipeline][chunker]") {
    EnsureSodium();
    const auto config = SmallCompressed();
    const auto data = NoiseBytes(300 * 1024);
    const auto chunks = ChunkAll(config, data, 10 * 1024);

    REQUIRE(chunks.size() >= 2);
    uint64_t plaintext_total = 0;
    for (size_t i = 0; i < chunks.size(); ++i) {
        REQUIRE(chunks[i].index == i);
        REQUIRE(chunks[i].payload.size() <= config.chunk_max);
        if (i + 1 < chunks.size()) {
            REQUIRE(chunks[i].payload.size() >= config.chunk_min);
        }
        plaintext_total += chunks[i].plaintext_size;
    }
    REQUIRE(plaintext_total == data.size());
    REQUIRE(Reassemble(config, chunks) == data);
}

TEST_CASE("Chunker - Compressible Input", "[pipeline][chunker]") {
    EnsureSodium();
    const auto config = SmallCompressed();
    const auto data = TextBytes(512 * 1024);
    const auto chunks = ChunkAll(config, data, 64 * 1024);

    uint64_t payload_total = 0;
    for (const auto& chunk : chunks) {
        payload_total += chunk.payload.size();
        REQUIRE(chunk.payload.size() <= config.chunk_max);
    }
    REQUIRE(payload_total < data.size() / 4);
    REQUIRE(Reassemble(config, chunks) == data);
}

TEST_CASE("Chunker - Boundaries Do Not Depend On Submission Sizes", "[pipeline][chunker]") {
    EnsureSodium();
    const auto data = NoiseBytes(200 * 1024, 7);
    SECTION("Compressed") {
        const auto config = SmallCompressed();
        const auto whole = ChunkAll(config, data, data.size());
        const auto split = ChunkAll(config, data, 1237);
        REQUIRE(whole.size() == split.size());
        for (size_t i = 0; i < whole.size(); ++i) {
            REQUIRE(whole[i].payload == split[i].payload);
            REQUIRE(whole[i].plaintext_hash == split[i].plaintext_hash);
        }
    }
    SECTION("Uncompressed") {
        const auto config = SessionConfig::Uncompressed(4096);
        const auto whole = ChunkAll(config, data, data.size());
        const auto split = ChunkAll(config, data, 17);
        REQUIRE(whole.size() == split.size());
        for (size_t i = 0; i < whole.size(); ++i) {
            REQUIRE(whole[i].payload == split[i].payload);
        }
    }
}

TEST_CASE("Chunker - Edge Cases", "[pipeline][chunker]") {
    EnsureSodium();
    SECTION("No input produces no chunks") {
        auto chunker = Chunker::Create(SmallCompressed()).Unwrap();
        Collected collected;
        REQUIRE(chunker.Finish(collected.Sink()).IsOk());
        REQUIRE(collected.chunks.empty());
        REQUIRE(chunker.Finished());
    }
    SECTION("Empty append is a no-op") {
        auto chunker = Chunker::Create(SmallCompressed()).Unwrap();
        Collected collected;
        REQUIRE(chunker.Append({}, collected.Sink()).IsOk());
        REQUIRE(chunker.BytesIn() == 0);
    }
    SECTION("Tiny input becomes one final chunk") {
        const std::vector<uint8_t> data = {'h', 'i'};
        const auto chunks = ChunkAll(SmallCompressed(), data, data.size());
        REQUIRE(chunks.size() == 1);
        REQUIRE(chunks[0].plaintext_size == 2);
        REQUIRE(DecompressChunk(chunks[0].payload, 2).Unwrap() == data);
    }
    SECTION("Append after finish fails") {
        auto chunker = Chunker::Create(SmallCompressed()).Unwrap();
        Collected collected;
        REQUIRE(chunker.Finish(collected.Sink()).IsOk());
        const std::vector<uint8_t> data(10, 1);
        REQUIRE(chunker.Append(data, collected.Sink()).IsErr());
        REQUIRE(chunker.Finish(collected.Sink()).IsErr());
    }
    SECTION("Sink failure propagates") {
        auto chunker = Chunker::Create(SessionConfig::Uncompressed(100)).Unwrap();
        ChunkSink failing = [](models::RawChunk&&) {
            return Result<Unit, PipelineFailure>::Err(PipelineFailure::Cancelled("stopped"));
        };
        auto result = chunker.Append(NoiseBytes(250), failing);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == PipelineFailureType::Cancelled);
    }
}

TEST_CASE("Chunker - DecompressChunk Rejects Bad Frames", "[pipeline][chunker]") {
    EnsureSodium();
    const auto data = TextBytes(8 * 1024);
    const auto chunks = ChunkAll(SmallCompressed(), data, data.size());
    REQUIRE(chunks.size() == 1);
    const auto& frame = chunks[0].payload;

    SECTION("Wrong expected size") {
        auto result = DecompressChunk(frame, data.size() - 1);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == PipelineFailureType::CompressionError);
        REQUIRE(DecompressChunk(frame, data.size() + 1).IsErr());
    }
    SECTION("Truncated frame") {
        const std::span<const uint8_t> truncated(frame.data(), frame.size() - 4);
        REQUIRE(DecompressChunk(truncated, data.size()).IsErr());
    }
    SECTION("Trailing bytes") {
        auto padded = frame;
        padded.push_back(0x00);
        REQUIRE(DecompressChunk(padded, data.size()).IsErr());
    }
    SECTION("Not a frame") {
        REQUIRE(DecompressChunk(NoiseBytes(64), data.size()).IsErr());
    }
    SECTION("Size the frame cannot hold is refused up front") {
        auto huge = DecompressChunk(frame, uint64_t{1} << 62);
        REQUIRE(huge.IsErr());
        REQUIRE(huge.UnwrapErr().type == PipelineFailureType::CompressionError);
        const uint64_t beyond_ratio = (frame.size() + 1) * ChunkConstants::MAX_DECOMPRESSION_RATIO;
        REQUIRE(DecompressChunk(frame, beyond_ratio).IsErr());
        REQUIRE(DecompressChunk({}, 0).IsErr());
    }
}
