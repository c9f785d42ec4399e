#include "lucid/crypto/secure_master_secret.hpp"
#include "lucid/crypto/sodium_interop.hpp"
#include "lucid/core/constants.hpp"
#include <string>
namespace lucid::crypto {

Result<SecureMasterSecret, PipelineFailure> SecureMasterSecret::FromBytes(std::span<const uint8_t> secret) {
    if (secret.size() < Constants::MASTER_SECRET_MIN_SIZE) {
        return Result<SecureMasterSecret, PipelineFailure>::Err(
            PipelineFailure::InputError(
                "Master secret must be at least " + std::to_string(Constants::MASTER_SECRET_MIN_SIZE) +
                " bytes, got " + std::to_string(secret.size())));
    }
    auto handle_result = SecureMemoryHandle::Allocate(secret.size());
    if (handle_result.IsErr()) {
        return Result<SecureMasterSecret, PipelineFailure>::Err(
            PipelineFailure::FromSodiumFailure(handle_result.UnwrapErr()));
    }
    auto handle = std::move(handle_result).Unwrap();
    if (auto write = handle.Write(secret); write.IsErr()) {
        return Result<SecureMasterSecret, PipelineFailure>::Err(
            PipelineFailure::FromSodiumFailure(write.UnwrapErr()));
    }
    return Result<SecureMasterSecret, PipelineFailure>::Ok(SecureMasterSecret(std::move(handle)));
}

Result<SecureMasterSecret, PipelineFailure> SecureMasterSecret::Generate() {
    auto bytes = SodiumInterop::GetRandomBytes(Constants::MASTER_SECRET_MIN_SIZE);
    auto result = FromBytes(bytes);
    auto wipe = SodiumInterop::SecureWipe(std::span<uint8_t>(bytes));
    if (wipe.IsErr()) {
        return Result<SecureMasterSecret, PipelineFailure>::Err(
            PipelineFailure::FromSodiumFailure(wipe.UnwrapErr()));
    }
    return result;
}

Result<Unit, PipelineFailure> SecureMasterSecret::ExecuteWithSecret(
    std::function<Result<Unit, PipelineFailure>(std::span<const uint8_t>)> operation) {
    auto access = secret_.WithReadAccess([&](std::span<const uint8_t> secret) {
        return operation(secret);
    });
    if (access.IsErr()) {
        return Result<Unit, PipelineFailure>::Err(
            PipelineFailure::FromSodiumFailure(access.UnwrapErr()));
    }
    return std::move(access).Unwrap();
}
}
