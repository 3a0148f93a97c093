#pragma once
#include "crosslane/core/result.hpp"
#include "crosslane/core/failures.hpp"
#include "crosslane/core/constants.hpp"
#include <array>
#include <compare>
#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace crosslane::relay {
    using Amount = uint64_t;

    [[nodiscard]] constexpr std::optional<Amount> CheckedAdd(const Amount a, const Amount b) noexcept {
        if (a > UINT64_MAX - b) {
            return std::nullopt;
        }
        return a + b;
    }

    struct NetworkId {
        uint64_t value = 0;

        constexpr auto operator<=>(const NetworkId &) const = default;

        struct Hash {
            size_t operator()(const NetworkId &id) const noexcept {
                return std::hash<uint64_t>{}(id.value);
            }
        };
    };

    struct Address {
        std::string value;

        [[nodiscard]] bool IsNull() const noexcept { return value.empty(); }

        auto operator<=>(const Address &) const = default;

        struct Hash {
            size_t operator()(const Address &address) const noexcept {
                return std::hash<std::string>{}(address.value);
            }
        };
    };

    struct AssetType {
        std::string value;

        [[nodiscard]] bool IsNull() const noexcept { return value.empty(); }

        auto operator<=>(const AssetType &) const = default;

        struct Hash {
            size_t operator()(const AssetType &asset) const noexcept {
                return std::hash<std::string>{}(asset.value);
            }
        };
    };

    class MessageId {
    public:
        MessageId() = default;

        [[nodiscard]] static Result<MessageId, RelayFailure> FromBytes(std::span<const uint8_t> bytes);

        [[nodiscard]] std::span<const uint8_t> Bytes() const noexcept { return bytes_; }

        [[nodiscard]] bool IsZero() const noexcept;

        [[nodiscard]] std::string ToHex() const;

        auto operator<=>(const MessageId &) const = default;

        struct Hash {
            size_t operator()(const MessageId &id) const noexcept;
        };

    private:
        std::array<uint8_t, RelayConstants::MESSAGE_ID_SIZE> bytes_{};
    };

    enum class FeeSettlement : uint8_t {
        PrefundedReserve = 0,
        CallerAttachedPayment = 1
    };

    [[nodiscard]] std::string_view ToString(FeeSettlement settlement) noexcept;

    struct AssetAmount {
        AssetType asset;
        Amount amount = 0;

        bool operator==(const AssetAmount &) const = default;
    };

    struct Message {
        MessageId id;
        NetworkId source_network;
        NetworkId destination_network;
        Address sender;
        Address receiver;
        std::vector<uint8_t> payload;
        std::vector<AssetAmount> asset_transfers;
        FeeSettlement fee_settlement = FeeSettlement::PrefundedReserve;
        AssetType fee_asset;
    };

    // What the transport may pull from the dispatching node for one message.
    struct FeeAuthorization {
        Address payer;
        AssetType fee_asset;
        Amount fee_amount = 0;
        std::vector<AssetAmount> asset_allowances;
    };
}
