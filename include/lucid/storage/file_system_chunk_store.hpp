#pragma once
#include "lucid/interfaces/i_chunk_store.hpp"
#include <filesystem>
namespace lucid::storage {

/**
 * @brief Chunk store on a local directory tree
 *
 * Layout: `<root>/<session id hex>/<index>.chunk`. Each file holds
 *
 *     u32le magic | u32le version | nonce (24) | tag (16) | u64le length | ciphertext
 *
 * Each write goes to a uniquely named temporary file, is fsynced, and is
 * hard-linked into place together with a directory fsync. The link fails
 * when the chunk already exists, so concurrent writers never take a shared
 * lock and an existing chunk is never rewritten. Names that are not a
 * valid index are ignored when listing.
 */
class FileSystemChunkStore final : public interfaces::IChunkStore {
public:
    static Result<FileSystemChunkStore, StoreFailure> Open(std::filesystem::path root);

    [[nodiscard]] Result<Unit, StoreFailure> Put(
        const SessionId& session_id,
        uint64_t index,
        std::span<const uint8_t> ciphertext,
        const crypto::Nonce192& nonce,
        const crypto::Tag128& tag) override;

    [[nodiscard]] Result<models::StoredChunk, StoreFailure> Get(
        const SessionId& session_id,
        uint64_t index) override;

    [[nodiscard]] Result<std::vector<uint64_t>, StoreFailure> ListIndices(const SessionId& session_id) override;

    [[nodiscard]] Result<Unit, StoreFailure> DeleteSession(const SessionId& session_id) override;

    [[nodiscard]] std::filesystem::path ChunkPath(const SessionId& session_id, uint64_t index) const;

    [[nodiscard]] const std::filesystem::path& Root() const noexcept { return root_; }

    FileSystemChunkStore(FileSystemChunkStore&&) noexcept = default;
    FileSystemChunkStore& operator=(FileSystemChunkStore&&) = delete;
    ~FileSystemChunkStore() override = default;

private:
    explicit FileSystemChunkStore(std::filesystem::path root)
        : root_(std::move(root)) {}

    Result<models::StoredChunk, StoreFailure> ReadChunkFile(const std::filesystem::path& path) const;

    std::filesystem::path root_;
};
}
