#pragma once
#include "lucid/core/types.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
namespace lucid::models {

using TxRef = std::string;

enum class ConfirmationStatus : uint8_t {
    Pending,
    Confirmed,
    Failed
};

[[nodiscard]] constexpr std::string_view ToString(const ConfirmationStatus status) noexcept {
    switch (status) {
        case ConfirmationStatus::Pending: return "Pending";
        case ConfirmationStatus::Confirmed: return "Confirmed";
        case ConfirmationStatus::Failed: return "Failed";
    }
    return "Unknown";
}

struct AnchorRecord {
    SessionId session_id;
    Hash256 manifest_hash{};
    TxRef tx_ref;
    Timestamp submitted_at{};
    std::optional<Timestamp> confirmed_at;
    ConfirmationStatus status = ConfirmationStatus::Pending;
    uint32_t submit_attempts = 0;

    [[nodiscard]] bool IsConfirmed() const noexcept {
        return status == ConfirmationStatus::Confirmed;
    }
};

}
