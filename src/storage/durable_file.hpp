#pragma once
#include "lucid/core/result.hpp"
#include "lucid/core/failures.hpp"
#include <cstdint>
#include <filesystem>
#include <span>
#include <vector>
namespace lucid::storage::internal {

enum class WriteMode : uint8_t {
    Replace,
    NoClobber
};

enum class WriteOutcome : uint8_t {
    Written,
    TargetExists
};

/**
 * Writes @p bytes to a uniquely named temporary file beside @p target,
 * fsyncs it, moves it into place and fsyncs the directory.
 *
 * Replace renames over an existing target. NoClobber links the temporary
 * file to the target and reports TargetExists, leaving the target as it
 * was, when another file already holds the name. The temporary file is
 * removed on every path.
 */
Result<WriteOutcome, StoreFailure> WriteDurably(
    const std::filesystem::path& target,
    std::span<const uint8_t> bytes,
    WriteMode mode);

/// fsync of a directory, making entries created or renamed in it durable.
Result<Unit, StoreFailure> SyncDirectory(const std::filesystem::path& dir);

/// NotFound when @p path does not exist.
Result<std::vector<uint8_t>, StoreFailure> ReadWholeFile(const std::filesystem::path& path);

}
