#pragma once
#include "lucid/interfaces/i_manifest_store.hpp"
#include <filesystem>
namespace lucid::storage {

/// Sealed records as `<root>/<session hex>.manifest` and anchor records as
/// `<root>/<session hex>.anchor`, protobuf-encoded. A save writes and fsyncs a
/// uniquely named temporary file, renames it over the record and fsyncs the
/// directory; the temporary file never outlives a failed save.
class FileManifestStore final : public interfaces::IManifestStore {
public:
    static Result<FileManifestStore, StoreFailure> Open(std::filesystem::path root);

    [[nodiscard]] Result<Unit, StoreFailure> SaveRecord(const models::SealedRecord& record) override;
    [[nodiscard]] Result<models::SealedRecord, StoreFailure> LoadRecord(const SessionId& session_id) override;
    [[nodiscard]] Result<Unit, StoreFailure> SaveAnchorRecord(const models::AnchorRecord& record) override;
    [[nodiscard]] Result<models::AnchorRecord, StoreFailure> LoadAnchorRecord(const SessionId& session_id) override;
    [[nodiscard]] Result<std::vector<SessionId>, StoreFailure> ListSessions() override;
    [[nodiscard]] Result<Unit, StoreFailure> DeleteSession(const SessionId& session_id) override;

    FileManifestStore(FileManifestStore&&) noexcept = default;
    FileManifestStore& operator=(FileManifestStore&&) = delete;
    ~FileManifestStore() override = default;

private:
    explicit FileManifestStore(std::filesystem::path root)
        : root_(std::move(root)) {}

    [[nodiscard]] std::filesystem::path PathFor(const SessionId& session_id, std::string_view extension) const;
    Result<Unit, StoreFailure> Replace(const std::filesystem::path& target, std::span<const uint8_t> bytes);

    std::filesystem::path root_;
};
}
