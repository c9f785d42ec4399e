#include "lucid/storage/file_manifest_store.hpp"
#include "lucid/storage/record_codec.hpp"
#include "lucid/core/constants.hpp"
#include "durable_file.hpp"
#include <algorithm>
#include <system_error>
namespace lucid::storage {
namespace fs = std::filesystem;

Result<FileManifestStore, StoreFailure> FileManifestStore::Open(fs::path root) {
    std::error_code ec;
    fs::create_directories(root, ec);
    if (ec) {
        return Result<FileManifestStore, StoreFailure>::Err(
            StoreFailure::Unavailable("Cannot create manifest root " + root.string() + ": " + ec.message()));
    }
    return Result<FileManifestStore, StoreFailure>::Ok(FileManifestStore(std::move(root)));
}

fs::path FileManifestStore::PathFor(const SessionId& session_id, const std::string_view extension) const {
    return root_ / (session_id.ToHex() + std::string(extension));
}

Result<Unit, StoreFailure> FileManifestStore::Replace(const fs::path& target, std::span<const uint8_t> bytes) {
    auto written = internal::WriteDurably(target, bytes, internal::WriteMode::Replace);
    if (written.IsErr()) {
        return Result<Unit, StoreFailure>::Err(std::move(written).UnwrapErr());
    }
    return Result<Unit, StoreFailure>::Ok(unit);
}

Result<Unit, StoreFailure> FileManifestStore::SaveRecord(const models::SealedRecord& record) {
    auto encoded = EncodeSealedRecord(record);
    if (encoded.IsErr()) {
        return Result<Unit, StoreFailure>::Err(std::move(encoded).UnwrapErr());
    }
    return Replace(PathFor(record.manifest.session_id, PipelineConstants::MANIFEST_FILE_EXTENSION), encoded.Unwrap());
}

Result<models::SealedRecord, StoreFailure> FileManifestStore::LoadRecord(const SessionId& session_id) {
    auto bytes = internal::ReadWholeFile(PathFor(session_id, PipelineConstants::MANIFEST_FILE_EXTENSION));
    if (bytes.IsErr()) {
        return Result<models::SealedRecord, StoreFailure>::Err(std::move(bytes).UnwrapErr());
    }
    return DecodeSealedRecord(bytes.Unwrap());
}

Result<Unit, StoreFailure> FileManifestStore::SaveAnchorRecord(const models::AnchorRecord& record) {
    auto encoded = EncodeAnchorRecord(record);
    if (encoded.IsErr()) {
        return Result<Unit, StoreFailure>::Err(std::move(encoded).UnwrapErr());
    }
    return Replace(PathFor(record.session_id, PipelineConstants::ANCHOR_FILE_EXTENSION), encoded.Unwrap());
}

Result<models::AnchorRecord, StoreFailure> FileManifestStore::LoadAnchorRecord(const SessionId& session_id) {
    auto bytes = internal::ReadWholeFile(PathFor(session_id, PipelineConstants::ANCHOR_FILE_EXTENSION));
    if (bytes.IsErr()) {
        return Result<models::AnchorRecord, StoreFailure>::Err(std::move(bytes).UnwrapErr());
    }
    return DecodeAnchorRecord(bytes.Unwrap());
}

Result<std::vector<SessionId>, StoreFailure> FileManifestStore::ListSessions() {
    std::vector<SessionId> ids;
    std::error_code ec;
    for (fs::directory_iterator it(root_, ec), end; !ec && it != end; it.increment(ec)) {
        const auto& path = it->path();
        if (path.extension().string() != PipelineConstants::MANIFEST_FILE_EXTENSION) {
            continue;
        }
        auto id = SessionId::FromHex(path.stem().string());
        if (id.IsOk()) {
            ids.push_back(id.Unwrap());
        }
    }
    if (ec) {
        return Result<std::vector<SessionId>, StoreFailure>::Err(
            StoreFailure::IoError("Cannot list " + root_.string() + ": " + ec.message()));
    }
    std::sort(ids.begin(), ids.end());
    return Result<std::vector<SessionId>, StoreFailure>::Ok(std::move(ids));
}

Result<Unit, StoreFailure> FileManifestStore::DeleteSession(const SessionId& session_id) {
    std::error_code ec;
    fs::remove(PathFor(session_id, PipelineConstants::MANIFEST_FILE_EXTENSION), ec);
    if (!ec) {
        fs::remove(PathFor(session_id, PipelineConstants::ANCHOR_FILE_EXTENSION), ec);
    }
    if (ec) {
        return Result<Unit, StoreFailure>::Err(
            StoreFailure::IoError("Cannot delete records of " + session_id.ToHex() + ": " + ec.message()));
    }
    return Result<Unit, StoreFailure>::Ok(unit);
}
}
