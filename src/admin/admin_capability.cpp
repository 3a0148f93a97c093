#include "crosslane/admin/admin_capability.hpp"
#include "crosslane/core/format.hpp"
#include "crosslane/crypto/sodium_interop.hpp"
#include <algorithm>

namespace crosslane::relay::admin {
    using crypto::SodiumInterop;

    namespace {
        constexpr size_t FINGERPRINT_BYTES = 4;
    }

    Result<AdminCapability, RelayFailure> AdminCapability::Generate() {
        if (auto init = SodiumInterop::Initialize(); init.IsErr()) {
            return Result<AdminCapability, RelayFailure>::Err(RelayFailure::FromSodiumFailure(init.UnwrapErr()));
        }
        const auto random = SodiumInterop::GetRandomBytes(RelayConstants::ADMIN_CAPABILITY_SIZE);
        return FromBytes(random);
    }

    Result<AdminCapability, RelayFailure> AdminCapability::FromBytes(std::span<const uint8_t> bytes) {
        if (bytes.size() != RelayConstants::ADMIN_CAPABILITY_SIZE) {
            return Result<AdminCapability, RelayFailure>::Err(
                RelayFailure::InvalidInput(
                    compat::format("Admin capability must be {} bytes, got {}",
                                   RelayConstants::ADMIN_CAPABILITY_SIZE, bytes.size())));
        }
        AdminCapability capability;
        std::copy(bytes.begin(), bytes.end(), capability.token_.begin());
        return Result<AdminCapability, RelayFailure>::Ok(capability);
    }

    std::string AdminCapability::Fingerprint() const {
        std::string hex(FINGERPRINT_BYTES * 2 + 1, '\0');
        sodium_bin2hex(hex.data(), hex.size(), token_.data(), FINGERPRINT_BYTES);
        hex.pop_back();
        return hex;
    }
}
