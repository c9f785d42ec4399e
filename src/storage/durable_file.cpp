#include "durable_file.hpp"
#include "lucid/core/types.hpp"
#include <cerrno>
#include <fstream>
#include <iterator>
#include <string>
#include <system_error>
#include <utility>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
namespace lucid::storage::internal {
namespace fs = std::filesystem;

namespace {
    std::string Describe(const int err) {
        return std::system_category().message(err);
    }

    StoreFailure IoFailure(const std::string& what, const fs::path& path, const int err) {
        return StoreFailure::IoError(what + " " + path.string() + ": " + Describe(err));
    }

    /// Removes the temporary file unless released.
    class TempFileGuard {
    public:
        explicit TempFileGuard(fs::path path)
            : path_(std::move(path)) {}

        ~TempFileGuard() {
            if (!path_.empty()) {
                ::unlink(path_.c_str());
            }
        }

        TempFileGuard(const TempFileGuard&) = delete;
        TempFileGuard& operator=(const TempFileGuard&) = delete;

        void Release() noexcept { path_.clear(); }

    private:
        fs::path path_;
    };

    Result<Unit, StoreFailure> WriteAll(const int fd, std::span<const uint8_t> bytes, const fs::path& path) {
        size_t written = 0;
        while (written < bytes.size()) {
            const ssize_t n = ::write(fd, bytes.data() + written, bytes.size() - written);
            if (n < 0) {
                if (errno == EINTR) {
                    continue;
                }
                return Result<Unit, StoreFailure>::Err(IoFailure("Write failed for", path, errno));
            }
            written += static_cast<size_t>(n);
        }
        return Result<Unit, StoreFailure>::Ok(unit);
    }

    Result<Unit, StoreFailure> SyncDescriptor(const int fd, const fs::path& path) {
        while (::fsync(fd) != 0) {
            if (errno != EINTR) {
                return Result<Unit, StoreFailure>::Err(IoFailure("fsync failed for", path, errno));
            }
        }
        return Result<Unit, StoreFailure>::Ok(unit);
    }

    Result<Unit, StoreFailure> WriteTempFile(const fs::path& temp, std::span<const uint8_t> bytes) {
        const int fd = ::open(temp.c_str(), O_CREAT | O_EXCL | O_WRONLY | O_CLOEXEC, 0600);
        if (fd < 0) {
            return Result<Unit, StoreFailure>::Err(IoFailure("Cannot create", temp, errno));
        }
        auto written = WriteAll(fd, bytes, temp);
        if (written.IsOk()) {
            written = SyncDescriptor(fd, temp);
        }
        if (::close(fd) != 0 && written.IsOk()) {
            return Result<Unit, StoreFailure>::Err(IoFailure("Close failed for", temp, errno));
        }
        return written;
    }
}

Result<WriteOutcome, StoreFailure> WriteDurably(
    const fs::path& target,
    std::span<const uint8_t> bytes,
    const WriteMode mode) {

    fs::path temp = target;
    temp += ".tmp-" + SessionId::Generate().ToHex();
    TempFileGuard guard(temp);

    if (auto written = WriteTempFile(temp, bytes); written.IsErr()) {
        return Result<WriteOutcome, StoreFailure>::Err(std::move(written).UnwrapErr());
    }

    if (mode == WriteMode::Replace) {
        if (::rename(temp.c_str(), target.c_str()) != 0) {
            return Result<WriteOutcome, StoreFailure>::Err(IoFailure("Rename failed for", target, errno));
        }
        guard.Release();
    } else if (::link(temp.c_str(), target.c_str()) != 0) {
        if (errno == EEXIST) {
            return Result<WriteOutcome, StoreFailure>::Ok(WriteOutcome::TargetExists);
        }
        return Result<WriteOutcome, StoreFailure>::Err(IoFailure("Link failed for", target, errno));
    }

    if (auto synced = SyncDirectory(target.parent_path()); synced.IsErr()) {
        return Result<WriteOutcome, StoreFailure>::Err(std::move(synced).UnwrapErr());
    }
    return Result<WriteOutcome, StoreFailure>::Ok(WriteOutcome::Written);
}

Result<Unit, StoreFailure> SyncDirectory(const fs::path& dir) {
    const int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (fd < 0) {
        return Result<Unit, StoreFailure>::Err(IoFailure("Cannot open directory", dir, errno));
    }
    auto synced = SyncDescriptor(fd, dir);
    ::close(fd);
    return synced;
}

Result<std::vector<uint8_t>, StoreFailure> ReadWholeFile(const fs::path& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return Result<std::vector<uint8_t>, StoreFailure>::Err(
            StoreFailure::NotFound("No file " + path.string()));
    }
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Result<std::vector<uint8_t>, StoreFailure>::Err(
            StoreFailure::IoError("Cannot open " + path.string()));
    }
    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        return Result<std::vector<uint8_t>, StoreFailure>::Err(
            StoreFailure::IoError("Read failed for " + path.string()));
    }
    return Result<std::vector<uint8_t>, StoreFailure>::Ok(std::move(bytes));
}

}
