#pragma once
#include "lucid/interfaces/i_master_secret_provider.hpp"
#include "lucid/crypto/sodium_secure_memory_handle.hpp"
#include <mutex>
#include <span>
namespace lucid::crypto {

/// Master secret held in guarded memory for the life of the process.
class SecureMasterSecret final : public interfaces::IMasterSecretProvider {
public:
    /// Copies @p secret into secure memory. Needs at least
    /// Constants::MASTER_SECRET_MIN_SIZE bytes.
    static Result<SecureMasterSecret, PipelineFailure> FromBytes(std::span<const uint8_t> secret);

    static Result<SecureMasterSecret, PipelineFailure> Generate();

    [[nodiscard]] Result<Unit, PipelineFailure> ExecuteWithSecret(
        std::function<Result<Unit, PipelineFailure>(std::span<const uint8_t>)> operation) override;

    SecureMasterSecret(SecureMasterSecret&& other) noexcept
        : secret_(std::move(other.secret_)) {}
    SecureMasterSecret& operator=(SecureMasterSecret&&) = delete;
    SecureMasterSecret(const SecureMasterSecret&) = delete;
    SecureMasterSecret& operator=(const SecureMasterSecret&) = delete;
    ~SecureMasterSecret() override = default;

private:
    explicit SecureMasterSecret(SecureMemoryHandle secret)
        : secret_(std::move(secret)) {}

    SecureMemoryHandle secret_;
};
}
