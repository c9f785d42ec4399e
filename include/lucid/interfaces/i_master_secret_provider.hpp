#pragma once
#include "lucid/core/result.hpp"
#include "lucid/core/failures.hpp"
#include <cstdint>
#include <functional>
#include <span>
namespace lucid::interfaces {

/// Lends the deployment master secret to a callback without handing out a
/// copy. Session keys are derived inside the callback.
class IMasterSecretProvider {
public:
    virtual ~IMasterSecretProvider() = default;
    [[nodiscard]] virtual Result<Unit, PipelineFailure> ExecuteWithSecret(
        std::function<Result<Unit, PipelineFailure>(std::span<const uint8_t>)> operation) = 0;
};
}
