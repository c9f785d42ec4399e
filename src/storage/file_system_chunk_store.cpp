#include "lucid/storage/file_system_chunk_store.hpp"
#include "lucid/core/constants.hpp"
#include "lucid/core/format.hpp"
#include "lucid/debug/pipeline_logger.hpp"
#include "durable_file.hpp"
#include <algorithm>
#include <charconv>
#include <system_error>
namespace lucid::storage {
namespace fs = std::filesystem;

namespace {
    constexpr const char* COMPONENT = "chunk-store";
    constexpr size_t HEADER_SIZE = 4 + 4 + Constants::XCHACHA20_NONCE_SIZE + Constants::POLY1305_TAG_SIZE + 8;

    std::vector<uint8_t> EncodeChunkFile(
        std::span<const uint8_t> ciphertext,
        const crypto::Nonce192& nonce,
        const crypto::Tag128& tag) {
        std::vector<uint8_t> out;
        out.reserve(HEADER_SIZE + ciphertext.size());
        encoding::AppendUint32LE(out, PipelineConstants::CHUNK_FILE_MAGIC);
        encoding::AppendUint32LE(out, PipelineConstants::CHUNK_FILE_VERSION);
        out.insert(out.end(), nonce.begin(), nonce.end());
        out.insert(out.end(), tag.begin(), tag.end());
        encoding::AppendUint64LE(out, ciphertext.size());
        out.insert(out.end(), ciphertext.begin(), ciphertext.end());
        return out;
    }
}

Result<FileSystemChunkStore, StoreFailure> FileSystemChunkStore::Open(fs::path root) {
    std::error_code ec;
    fs::create_directories(root, ec);
    if (ec) {
        return Result<FileSystemChunkStore, StoreFailure>::Err(
            StoreFailure::Unavailable("Cannot create chunk root " + root.string() + ": " + ec.message()));
    }
    return Result<FileSystemChunkStore, StoreFailure>::Ok(FileSystemChunkStore(std::move(root)));
}

fs::path FileSystemChunkStore::ChunkPath(const SessionId& session_id, const uint64_t index) const {
    return root_ / session_id.ToHex() /
           (std::to_string(index) + std::string(PipelineConstants::CHUNK_FILE_EXTENSION));
}

Result<Unit, StoreFailure> FileSystemChunkStore::Put(
    const SessionId& session_id,
    const uint64_t index,
    std::span<const uint8_t> ciphertext,
    const crypto::Nonce192& nonce,
    const crypto::Tag128& tag) {
    const fs::path path = ChunkPath(session_id, index);
    const fs::path session_dir = path.parent_path();

    std::error_code ec;
    const bool created_dir = fs::create_directory(session_dir, ec);
    if (ec) {
        return Result<Unit, StoreFailure>::Err(
            StoreFailure::IoError("Cannot create " + session_dir.string() + ": " + ec.message()));
    }
    if (created_dir) {
        if (auto synced = internal::SyncDirectory(root_); synced.IsErr()) {
            return synced;
        }
    }

    const auto encoded = EncodeChunkFile(ciphertext, nonce, tag);
    auto written = internal::WriteDurably(path, encoded, internal::WriteMode::NoClobber);
    if (written.IsErr()) {
        return Result<Unit, StoreFailure>::Err(std::move(written).UnwrapErr());
    }
    if (written.Unwrap() == internal::WriteOutcome::Written) {
        LUCID_LOG_DEBUG(COMPONENT, "stored {} ({} bytes)", path.string(), encoded.size());
        return Result<Unit, StoreFailure>::Ok(unit);
    }

    auto existing = ReadChunkFile(path);
    if (existing.IsErr()) {
        return Result<Unit, StoreFailure>::Err(std::move(existing).UnwrapErr());
    }
    const auto& stored = existing.Unwrap();
    const bool identical = stored.nonce == nonce && stored.tag == tag &&
        std::equal(stored.ciphertext.begin(), stored.ciphertext.end(),
                   ciphertext.begin(), ciphertext.end());
    if (!identical) {
        return Result<Unit, StoreFailure>::Err(
            StoreFailure::Conflict("Chunk file " + path.string() + " exists with different content"));
    }
    return Result<Unit, StoreFailure>::Ok(unit);
}

Result<models::StoredChunk, StoreFailure> FileSystemChunkStore::Get(
    const SessionId& session_id,
    const uint64_t index) {
    const fs::path path = ChunkPath(session_id, index);
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return Result<models::StoredChunk, StoreFailure>::Err(
            StoreFailure::NotFound("No chunk file " + path.string()));
    }
    return ReadChunkFile(path);
}

Result<models::StoredChunk, StoreFailure> FileSystemChunkStore::ReadChunkFile(const fs::path& path) const {
    auto read = internal::ReadWholeFile(path);
    if (read.IsErr()) {
        return Result<models::StoredChunk, StoreFailure>::Err(std::move(read).UnwrapErr());
    }
    const auto bytes = std::move(read).Unwrap();
    const std::span<const uint8_t> view(bytes);
    if (view.size() < HEADER_SIZE) {
        return Result<models::StoredChunk, StoreFailure>::Err(
            StoreFailure::Corrupt(compat::format("{} is shorter than the chunk header", path.string())));
    }
    if (encoding::ReadUint32LE(view.subspan(0, 4)) != PipelineConstants::CHUNK_FILE_MAGIC ||
        encoding::ReadUint32LE(view.subspan(4, 4)) != PipelineConstants::CHUNK_FILE_VERSION) {
        return Result<models::StoredChunk, StoreFailure>::Err(
            StoreFailure::Corrupt(compat::format("{} has an unknown magic or version", path.string())));
    }

    models::StoredChunk chunk;
    size_t offset = 8;
    std::copy_n(view.begin() + static_cast<std::ptrdiff_t>(offset), chunk.nonce.size(), chunk.nonce.begin());
    offset += chunk.nonce.size();
    std::copy_n(view.begin() + static_cast<std::ptrdiff_t>(offset), chunk.tag.size(), chunk.tag.begin());
    offset += chunk.tag.size();
    const uint64_t length = encoding::ReadUint64LE(view.subspan(offset, 8));
    offset += 8;
    if (length != view.size() - offset) {
        return Result<models::StoredChunk, StoreFailure>::Err(
            StoreFailure::Corrupt(
                compat::format("{} declares {} ciphertext bytes but holds {}",
                    path.string(), length, view.size() - offset)));
    }
    chunk.ciphertext.assign(view.begin() + static_cast<std::ptrdiff_t>(offset), view.end());
    return Result<models::StoredChunk, StoreFailure>::Ok(std::move(chunk));
}

Result<std::vector<uint64_t>, StoreFailure> FileSystemChunkStore::ListIndices(const SessionId& session_id) {
    std::vector<uint64_t> indices;
    const fs::path dir = root_ / session_id.ToHex();
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        return Result<std::vector<uint64_t>, StoreFailure>::Ok(std::move(indices));
    }
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        const auto& path = it->path();
        if (path.extension().string() != PipelineConstants::CHUNK_FILE_EXTENSION) {
            continue;
        }
        const std::string stem = path.stem().string();
        uint64_t index = 0;
        const char* first = stem.data();
        const char* last = stem.data() + stem.size();
        const auto [ptr, parse_ec] = std::from_chars(first, last, index);
        if (stem.empty() || parse_ec != std::errc() || ptr != last) {
            continue;
        }
        indices.push_back(index);
    }
    if (ec) {
        return Result<std::vector<uint64_t>, StoreFailure>::Err(
            StoreFailure::IoError("Cannot list " + dir.string() + ": " + ec.message()));
    }
    std::sort(indices.begin(), indices.end());
    return Result<std::vector<uint64_t>, StoreFailure>::Ok(std::move(indices));
}

Result<Unit, StoreFailure> FileSystemChunkStore::DeleteSession(const SessionId& session_id) {
    std::error_code ec;
    fs::remove_all(root_ / session_id.ToHex(), ec);
    if (ec) {
        return Result<Unit, StoreFailure>::Err(
            StoreFailure::IoError("Cannot delete session " + session_id.ToHex() + ": " + ec.message()));
    }
    return Result<Unit, StoreFailure>::Ok(unit);
}
}
