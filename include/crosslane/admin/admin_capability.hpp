#pragma once
#include "crosslane/core/result.hpp"
#include "crosslane/core/failures.hpp"
#include "crosslane/core/constants.hpp"
#include <array>
#include <cstdint>
#include <span>
#include <string>

namespace crosslane::relay::admin {
    // Opaque bearer token proving administrator rights on one node. Whoever
    // holds a granted value may administer the node; there is no ambient owner.
    class AdminCapability {
    public:
        [[nodiscard]] static Result<AdminCapability, RelayFailure> Generate();

        [[nodiscard]] static Result<AdminCapability, RelayFailure> FromBytes(std::span<const uint8_t> bytes);

        [[nodiscard]] std::span<const uint8_t> Bytes() const noexcept { return token_; }

        // Short, non-secret prefix for log lines.
        [[nodiscard]] std::string Fingerprint() const;

    private:
        AdminCapability() = default;

        std::array<uint8_t, RelayConstants::ADMIN_CAPABILITY_SIZE> token_{};
    };
}
