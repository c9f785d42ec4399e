#pragma once
#include <string>
#include <string_view>
#include <utility>
namespace lucid {
enum class SodiumFailureType {
    InitializationFailed,
    BufferTooSmall,
    BufferTooLarge,
    SecureWipeFailed,
    AllocationFailed,
    WriteOperationFailed,
    ReadOperationFailed,
    InvalidOperation
};
/// Failure categories reported by the session pipeline.
///
/// The category of the last failure is kept on a FAILED session so an
/// operator can tell a data-integrity fault (Compression, Encryption,
/// MerkleState, Integrity) from an infrastructure fault (StorageWrite,
/// StorageRead, Anchor).
enum class PipelineFailureType {
    InputError,
    CompressionError,
    EncryptionError,
    StorageWriteError,
    StorageReadError,
    MerkleStateError,
    AnchorError,
    IntegrityError,
    Cancelled,
    Expired
};
enum class StoreFailureType {
    NotFound,
    Conflict,
    Unavailable,
    IoError,
    Corrupt
};
enum class AnchorFailureType {
    Network,
    Rejected,
    ManifestMismatch,
    RetriesExhausted,
    Persistence,
    Interrupted
};

[[nodiscard]] constexpr std::string_view ToString(const PipelineFailureType type) noexcept {
    switch (type) {
        case PipelineFailureType::InputError: return "InputError";
        case PipelineFailureType::CompressionError: return "CompressionError";
        case PipelineFailureType::EncryptionError: return "EncryptionError";
        case PipelineFailureType::StorageWriteError: return "StorageWriteError";
        case PipelineFailureType::StorageReadError: return "StorageReadError";
        case PipelineFailureType::MerkleStateError: return "MerkleStateError";
        case PipelineFailureType::AnchorError: return "AnchorError";
        case PipelineFailureType::IntegrityError: return "IntegrityError";
        case PipelineFailureType::Cancelled: return "Cancelled";
        case PipelineFailureType::Expired: return "Expired";
    }
    return "Unknown";
}

[[nodiscard]] constexpr std::string_view ToString(const StoreFailureType type) noexcept {
    switch (type) {
        case StoreFailureType::NotFound: return "NotFound";
        case StoreFailureType::Conflict: return "Conflict";
        case StoreFailureType::Unavailable: return "Unavailable";
        case StoreFailureType::IoError: return "IoError";
        case StoreFailureType::Corrupt: return "Corrupt";
    }
    return "Unknown";
}

[[nodiscard]] constexpr std::string_view ToString(const AnchorFailureType type) noexcept {
    switch (type) {
        case AnchorFailureType::Network: return "Network";
        case AnchorFailureType::Rejected: return "Rejected";
        case AnchorFailureType::ManifestMismatch: return "ManifestMismatch";
        case AnchorFailureType::RetriesExhausted: return "RetriesExhausted";
        case AnchorFailureType::Persistence: return "Persistence";
        case AnchorFailureType::Interrupted: return "Interrupted";
    }
    return "Unknown";
}

class SodiumFailure {
public:
    SodiumFailureType type;
    std::string message;
    SodiumFailure(const SodiumFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static SodiumFailure InitializationFailed(std::string msg) {
        return {SodiumFailureType::InitializationFailed, std::move(msg)};
    }
    static SodiumFailure BufferTooSmall(std::string msg) {
        return {SodiumFailureType::BufferTooSmall, std::move(msg)};
    }
    static SodiumFailure BufferTooLarge(std::string msg) {
        return {SodiumFailureType::BufferTooLarge, std::move(msg)};
    }
    static SodiumFailure SecureWipeFailed(std::string msg) {
        return {SodiumFailureType::SecureWipeFailed, std::move(msg)};
    }
    static SodiumFailure AllocationFailed(std::string msg) {
        return {SodiumFailureType::AllocationFailed, std::move(msg)};
    }
    static SodiumFailure WriteOperationFailed(std::string msg) {
        return {SodiumFailureType::WriteOperationFailed, std::move(msg)};
    }
    static SodiumFailure ReadOperationFailed(std::string msg) {
        return {SodiumFailureType::ReadOperationFailed, std::move(msg)};
    }
    static SodiumFailure InvalidOperation(std::string msg) {
        return {SodiumFailureType::InvalidOperation, std::move(msg)};
    }
};
class StoreFailure {
public:
    StoreFailureType type;
    std::string message;
    StoreFailure(const StoreFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static StoreFailure NotFound(std::string msg) {
        return {StoreFailureType::NotFound, std::move(msg)};
    }
    static StoreFailure Conflict(std::string msg) {
        return {StoreFailureType::Conflict, std::move(msg)};
    }
    static StoreFailure Unavailable(std::string msg) {
        return {StoreFailureType::Unavailable, std::move(msg)};
    }
    static StoreFailure IoError(std::string msg) {
        return {StoreFailureType::IoError, std::move(msg)};
    }
    static StoreFailure Corrupt(std::string msg) {
        return {StoreFailureType::Corrupt, std::move(msg)};
    }
    /// Conflict and Corrupt describe the stored data itself; retrying the same
    /// write cannot change them.
    [[nodiscard]] bool IsRetryable() const noexcept {
        return type == StoreFailureType::Unavailable || type == StoreFailureType::IoError;
    }
};
class AnchorFailure {
public:
    AnchorFailureType type;
    std::string message;
    AnchorFailure(const AnchorFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static AnchorFailure Network(std::string msg) {
        return {AnchorFailureType::Network, std::move(msg)};
    }
    static AnchorFailure Rejected(std::string msg) {
        return {AnchorFailureType::Rejected, std::move(msg)};
    }
    static AnchorFailure ManifestMismatch(std::string msg) {
        return {AnchorFailureType::ManifestMismatch, std::move(msg)};
    }
    static AnchorFailure RetriesExhausted(std::string msg) {
        return {AnchorFailureType::RetriesExhausted, std::move(msg)};
    }
    static AnchorFailure Persistence(std::string msg) {
        return {AnchorFailureType::Persistence, std::move(msg)};
    }
    static AnchorFailure Interrupted(std::string msg) {
        return {AnchorFailureType::Interrupted, std::move(msg)};
    }
};
class PipelineFailure {
public:
    PipelineFailureType type;
    std::string message;
    PipelineFailure(const PipelineFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static PipelineFailure InputError(std::string msg) {
        return {PipelineFailureType::InputError, std::move(msg)};
    }
    static PipelineFailure CompressionError(std::string msg) {
        return {PipelineFailureType::CompressionError, std::move(msg)};
    }
    static PipelineFailure EncryptionError(std::string msg) {
        return {PipelineFailureType::EncryptionError, std::move(msg)};
    }
    static PipelineFailure StorageWriteError(std::string msg) {
        return {PipelineFailureType::StorageWriteError, std::move(msg)};
    }
    static PipelineFailure StorageReadError(std::string msg) {
        return {PipelineFailureType::StorageReadError, std::move(msg)};
    }
    static PipelineFailure MerkleStateError(std::string msg) {
        return {PipelineFailureType::MerkleStateError, std::move(msg)};
    }
    static PipelineFailure AnchorError(std::string msg) {
        return {PipelineFailureType::AnchorError, std::move(msg)};
    }
    static PipelineFailure IntegrityError(std::string msg) {
        return {PipelineFailureType::IntegrityError, std::move(msg)};
    }
    static PipelineFailure Cancelled(std::string msg) {
        return {PipelineFailureType::Cancelled, std::move(msg)};
    }
    static PipelineFailure Expired(std::string msg) {
        return {PipelineFailureType::Expired, std::move(msg)};
    }
    static PipelineFailure FromSodiumFailure(const SodiumFailure& sf) {
        return EncryptionError(sf.message);
    }
    static PipelineFailure FromAnchorFailure(const AnchorFailure& af) {
        return AnchorError(std::string(ToString(af.type)) + ": " + af.message);
    }
};
}
