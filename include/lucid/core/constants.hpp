#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <chrono>
namespace lucid {
struct Constants {
    static constexpr size_t SESSION_ID_SIZE = 16;
    static constexpr size_t HASH_SIZE = 32;
    static constexpr size_t SESSION_KEY_SIZE = 32;
    static constexpr size_t XCHACHA20_NONCE_SIZE = 24;
    static constexpr size_t POLY1305_TAG_SIZE = 16;
    static constexpr size_t CHUNK_INDEX_ENCODED_SIZE = 8;
    static constexpr size_t MASTER_SECRET_MIN_SIZE = 32;
    static constexpr size_t ED_25519_PUBLIC_KEY_SIZE = 32;
    static constexpr size_t ED_25519_SECRET_KEY_SIZE = 64;
    static constexpr size_t ED_25519_SEED_SIZE = 32;
    static constexpr size_t ED_25519_SIGNATURE_SIZE = 64;
    static constexpr size_t SMALL_BUFFER_THRESHOLD = 1024;
    static constexpr size_t OPENSSL_ERROR_BUFFER_SIZE = 256;
};
struct OpenSSLConstants {
    static constexpr int SUCCESS = 1;
    static constexpr unsigned long NO_ERROR = 0;
    static constexpr std::string_view UNKNOWN_ERROR_MESSAGE = "Unknown OpenSSL error";
};
struct SodiumConstants {
    static constexpr int SUCCESS = 0;
    static constexpr int FAILURE = -1;
};
struct ChunkConstants {
    static constexpr size_t MEBIBYTE = 1024 * 1024;
    static constexpr size_t DEFAULT_CHUNK_MIN = 8 * MEBIBYTE;
    static constexpr size_t DEFAULT_CHUNK_MAX = 16 * MEBIBYTE;
    static constexpr size_t MAX_CHUNK_BYTES = 64 * MEBIBYTE;
    static constexpr size_t MIN_COMPRESSED_WINDOW = 1024;
    static constexpr size_t MAX_COMPRESSION_SLICE = 128 * 1024;
    static constexpr size_t FRAME_EPILOGUE_RESERVE = 32;
    // A raw or RLE Zstd block holds at most 128 KiB behind a 4-byte minimum.
    static constexpr uint64_t MAX_DECOMPRESSION_RATIO = 32 * 1024;
    static constexpr int DEFAULT_COMPRESSION_LEVEL = 3;
    static constexpr int COMPRESSION_DISABLED = 0;
    static constexpr int MAX_COMPRESSION_LEVEL = 22;
};
struct PipelineConstants {
    static constexpr uint32_t DEFAULT_RETENTION_DAYS = 30;
    static constexpr uint32_t DEFAULT_ANCHOR_RETRY_LIMIT = 5;
    static constexpr std::chrono::hours DEFAULT_SESSION_TTL{24};
    static constexpr size_t DEFAULT_QUEUE_DEPTH = 2;
    static constexpr size_t MAX_SUBMISSION_BYTES = 64 * ChunkConstants::MEBIBYTE;
    static constexpr uint32_t DEFAULT_STORAGE_RETRY_LIMIT = 5;
    static constexpr std::chrono::milliseconds DEFAULT_INITIAL_BACKOFF{100};
    static constexpr std::chrono::milliseconds DEFAULT_MAX_BACKOFF{5000};
    static constexpr double DEFAULT_BACKOFF_MULTIPLIER = 2.0;
    static constexpr uint32_t DEFAULT_CONFIRMATION_POLLS = 10;
    static constexpr std::chrono::milliseconds DEFAULT_CONFIRMATION_INTERVAL{500};
    static constexpr std::string_view SESSION_KEY_INFO = "lucid-session-key-v1";
    static constexpr std::string_view MANIFEST_HASH_DOMAIN = "lucid-manifest-v1";
    static constexpr std::string_view CHUNK_FILE_EXTENSION = ".chunk";
    static constexpr std::string_view MANIFEST_FILE_EXTENSION = ".manifest";
    static constexpr std::string_view ANCHOR_FILE_EXTENSION = ".anchor";
    static constexpr uint32_t CHUNK_FILE_MAGIC = 0x4B434C4C;  // "LLCK"
    static constexpr uint32_t CHUNK_FILE_VERSION = 1;
};
struct ErrorMessages {
    static constexpr std::string_view SODIUM_INIT_FAILED = "Failed to initialize libsodium";
    static constexpr std::string_view NOT_INITIALIZED = "Libsodium not initialized";
    static constexpr std::string_view HANDLE_DISPOSED = "Handle disposed";
    static constexpr std::string_view FAILED_TO_ALLOCATE_SECURE_MEMORY = "Failed to allocate secure memory: ";
    static constexpr std::string_view FAILED_TO_READ_SECURE_MEMORY = "Failed to read secure memory: ";
    static constexpr std::string_view DATA_EXCEEDS_BUFFER = "Data size exceeds buffer size";
    static constexpr std::string_view UNKNOWN_SESSION = "Unknown session";
    static constexpr std::string_view SESSION_NOT_ACCEPTING_INPUT = "Session does not accept input in state";
    static constexpr std::string_view SESSION_ALREADY_SEALED = "Session already sealed";
    static constexpr std::string_view SUBMISSION_TOO_LARGE = "Submission exceeds maximum size";
    static constexpr std::string_view TAG_MISMATCH = "Authentication tag mismatch";
    static constexpr std::string_view ROOT_MISMATCH = "Recomputed Merkle root does not match manifest";
};
}
