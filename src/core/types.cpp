#include "lucid/core/types.hpp"
#include "lucid/crypto/sodium_interop.hpp"
#include <algorithm>

namespace lucid {
    using crypto::SodiumInterop;

    namespace {
        int HexValue(const char c) {
            if (c >= '0' && c <= '9') {
                return c - '0';
            }
            if (c >= 'a' && c <= 'f') {
                return c - 'a' + 10;
            }
            if (c >= 'A' && c <= 'F') {
                return c - 'A' + 10;
            }
            return -1;
        }
    }

    SessionId SessionId::Generate() {
        SessionId id;
        const auto random = SodiumInterop::GetRandomBytes(Constants::SESSION_ID_SIZE);
        std::copy(random.begin(), random.end(), id.bytes.begin());
        return id;
    }

    Result<SessionId, PipelineFailure> SessionId::FromHex(const std::string_view hex) {
        auto decoded = encoding::FromHex(hex);
        if (decoded.IsErr()) {
            return Result<SessionId, PipelineFailure>::Err(decoded.UnwrapErr());
        }
        return FromBytes(decoded.Unwrap());
    }

    Result<SessionId, PipelineFailure> SessionId::FromBytes(const std::span<const uint8_t> raw) {
        if (raw.size() != Constants::SESSION_ID_SIZE) {
            return Result<SessionId, PipelineFailure>::Err(
                PipelineFailure::InputError(
                    "Session id must be " + std::to_string(Constants::SESSION_ID_SIZE) +
                    " bytes, got " + std::to_string(raw.size())));
        }
        SessionId id;
        std::copy(raw.begin(), raw.end(), id.bytes.begin());
        return Result<SessionId, PipelineFailure>::Ok(id);
    }

    std::string SessionId::ToHex() const {
        return encoding::ToHex(bytes);
    }

    size_t SessionId::Hash::operator()(const SessionId &id) const noexcept {
        // Ids are uniformly random; the leading word is already a good hash.
        uint64_t value = 0;
        for (size_t i = 0; i < sizeof(value); ++i) {
            value |= static_cast<uint64_t>(id.bytes[i]) << (i * 8);
        }
        return static_cast<size_t>(value);
    }

    namespace encoding {
        std::string ToHex(const std::span<const uint8_t> data) {
            static constexpr char hex_chars[] = "0123456789abcdef";
            std::string result;
            result.reserve(data.size() * 2);
            for (const auto byte: data) {
                result.push_back(hex_chars[(byte >> 4) & 0x0F]);
                result.push_back(hex_chars[byte & 0x0F]);
            }
            return result;
        }

        Result<std::vector<uint8_t>, PipelineFailure> FromHex(const std::string_view hex) {
            if (hex.size() % 2 != 0) {
                return Result<std::vector<uint8_t>, PipelineFailure>::Err(
                    PipelineFailure::InputError("Hex string has odd length"));
            }
            std::vector<uint8_t> out;
            out.reserve(hex.size() / 2);
            for (size_t i = 0; i < hex.size(); i += 2) {
                const int hi = HexValue(hex[i]);
                const int lo = HexValue(hex[i + 1]);
                if (hi < 0 || lo < 0) {
                    return Result<std::vector<uint8_t>, PipelineFailure>::Err(
                        PipelineFailure::InputError("Hex string contains a non-hex character"));
                }
                out.push_back(static_cast<uint8_t>((hi << 4) | lo));
            }
            return Result<std::vector<uint8_t>, PipelineFailure>::Ok(std::move(out));
        }

        void AppendUint64LE(std::vector<uint8_t> &out, const uint64_t value) {
            for (size_t i = 0; i < 8; ++i) {
                out.push_back(static_cast<uint8_t>((value >> (i * 8)) & 0xFF));
            }
        }

        void AppendInt64LE(std::vector<uint8_t> &out, const int64_t value) {
            AppendUint64LE(out, static_cast<uint64_t>(value));
        }

        uint64_t ReadUint64LE(const std::span<const uint8_t> in) {
            uint64_t value = 0;
            for (size_t i = 0; i < 8 && i < in.size(); ++i) {
                value |= static_cast<uint64_t>(in[i]) << (i * 8);
            }
            return value;
        }

        void AppendUint32LE(std::vector<uint8_t> &out, const uint32_t value) {
            out.push_back(static_cast<uint8_t>(value & 0xFF));
            out.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
            out.push_back(static_cast<uint8_t>((value >> 16) & 0xFF));
            out.push_back(static_cast<uint8_t>((value >> 24) & 0xFF));
        }

        uint32_t ReadUint32LE(const std::span<const uint8_t> in) {
            uint32_t value = 0;
            for (size_t i = 0; i < 4 && i < in.size(); ++i) {
                value |= static_cast<uint32_t>(in[i]) << (i * 8);
            }
            return value;
        }

        int64_t ToUnixMillis(const Timestamp ts) noexcept {
            return std::chrono::duration_cast<std::chrono::milliseconds>(
                ts.time_since_epoch()).count();
        }

        Timestamp FromUnixMillis(const int64_t millis) noexcept {
            return Timestamp(std::chrono::duration_cast<Timestamp::duration>(
                std::chrono::milliseconds(millis)));
        }
    }
}
