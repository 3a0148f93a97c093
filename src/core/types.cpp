#include "crosslane/core/types.hpp"
#include "crosslane/core/format.hpp"
#include <sodium.h>
#include <algorithm>

namespace crosslane::relay {
    Result<MessageId, RelayFailure> MessageId::FromBytes(std::span<const uint8_t> bytes) {
        if (bytes.size() != RelayConstants::MESSAGE_ID_SIZE) {
            return Result<MessageId, RelayFailure>::Err(
                RelayFailure::InvalidInput(
                    compat::format("Message id must be {} bytes, got {}",
                                   RelayConstants::MESSAGE_ID_SIZE, bytes.size())));
        }
        MessageId id;
        std::copy(bytes.begin(), bytes.end(), id.bytes_.begin());
        return Result<MessageId, RelayFailure>::Ok(id);
    }

    bool MessageId::IsZero() const noexcept {
        return sodium_is_zero(bytes_.data(), bytes_.size()) == 1;
    }

    std::string MessageId::ToHex() const {
        std::string hex(bytes_.size() * 2 + 1, '\0');
        sodium_bin2hex(hex.data(), hex.size(), bytes_.data(), bytes_.size());
        hex.pop_back();
        return hex;
    }

    size_t MessageId::Hash::operator()(const MessageId &id) const noexcept {
        size_t hash = 0;
        const auto bytes = id.Bytes();
        for (size_t i = 0; i < sizeof(size_t) && i < bytes.size(); ++i) {
            hash = (hash << 8) | bytes[i];
        }
        return hash;
    }

    std::string_view ToString(const FeeSettlement settlement) noexcept {
        switch (settlement) {
            case FeeSettlement::PrefundedReserve: return "PrefundedReserve";
            case FeeSettlement::CallerAttachedPayment: return "CallerAttachedPayment";
        }
        return "Unknown";
    }
}
