#pragma once

#include "crosslane/core/constants.hpp"
#include "crosslane/core/types.hpp"

#include <cstddef>
#include <cstdint>

namespace crosslane::relay::configuration {

/// Protocol variant selected for a relay node
///
/// The relay historically shipped as three near-duplicate deployments. They are
/// expressed here as presets of a single configuration:
/// - Full: payload data, sender allowlist, both fee settlement modes
/// - TokenOnly: asset transfer only, no payload data, prefunded reserve only
/// - OpenSenders: payload data, any sender accepted from an allowlisted source
enum class RelayVariant : uint8_t {
    Full = 0,
    TokenOnly = 1,
    OpenSenders = 2
};

/// Bit set of fee settlement modes a node accepts
struct SettlementModes {
    static constexpr uint8_t NONE = 0;
    static constexpr uint8_t PREFUNDED_RESERVE = 1u << 0;
    static constexpr uint8_t CALLER_ATTACHED_PAYMENT = 1u << 1;
    static constexpr uint8_t ALL = PREFUNDED_RESERVE | CALLER_ATTACHED_PAYMENT;
};

/// Configuration of the relay protocol variant
///
/// Value type built from factory methods and refined with `With...` modifiers:
///
/// @example
/// ```cpp
/// // Treasury-funded relay carrying payload data
/// auto config = RelayConfig::Full();
///
/// // Token bridge without payloads, fees paid per call
/// auto config = RelayConfig::TokenOnly()
///     .WithSettlementModes(SettlementModes::CALLER_ATTACHED_PAYMENT);
///
/// // Shared reserve with per-caller accounting
/// auto config = RelayConfig::Full().WithFeeEscrow(true);
/// ```
///
/// Replay protection is part of every variant and cannot be switched off:
/// an already processed message id is always rejected.
class RelayConfig {
public:
    // =========================================================================
    // Factory Methods
    // =========================================================================

    /// Payload data, sender allowlist enforcement, both settlement modes
    [[nodiscard]] static constexpr RelayConfig Full() noexcept {
        return RelayConfig(RelayVariant::Full, true, true, SettlementModes::ALL);
    }

    /// Asset transfer only
    ///
    /// Sends carrying payload data are rejected with PayloadNotSupported.
    /// Fees come from the prefunded reserve unless modes are widened.
    [[nodiscard]] static constexpr RelayConfig TokenOnly() noexcept {
        return RelayConfig(RelayVariant::TokenOnly, false, true, SettlementModes::PREFUNDED_RESERVE);
    }

    /// Payload data without sender allowlist checks on delivery
    ///
    /// Only the source network allowlist guards inbound messages.
    [[nodiscard]] static constexpr RelayConfig OpenSenders() noexcept {
        return RelayConfig(RelayVariant::OpenSenders, true, false, SettlementModes::ALL);
    }

    [[nodiscard]] static constexpr RelayConfig Default() noexcept {
        return Full();
    }

    // =========================================================================
    // Modifiers
    // =========================================================================

    [[nodiscard]] constexpr RelayConfig WithSettlementModes(const uint8_t modes) const noexcept {
        RelayConfig copy = *this;
        copy.settlement_modes_ = static_cast<uint8_t>(modes & SettlementModes::ALL);
        return copy;
    }

    /// Enable per-caller fee escrow on top of the shared prefunded reserve
    ///
    /// Off by default: the reserve is a single pool any caller's dispatch may
    /// draw from. When on, a caller may only consume fee credit it deposited.
    [[nodiscard]] constexpr RelayConfig WithFeeEscrow(const bool enabled) const noexcept {
        RelayConfig copy = *this;
        copy.fee_escrow_ = enabled;
        return copy;
    }

    [[nodiscard]] constexpr RelayConfig WithMaxPayloadSize(const size_t bytes) const noexcept {
        RelayConfig copy = *this;
        copy.max_payload_size_ = bytes;
        return copy;
    }

    // =========================================================================
    // Feature Queries
    // =========================================================================

    [[nodiscard]] constexpr bool IncludesPayload() const noexcept {
        return includes_payload_;
    }

    [[nodiscard]] constexpr bool EnforcesSenderAllowlist() const noexcept {
        return enforce_sender_allowlist_;
    }

    [[nodiscard]] constexpr bool IncludesReplayProtection() const noexcept {
        return true;
    }

    [[nodiscard]] constexpr bool SupportsSettlement(const FeeSettlement settlement) const noexcept {
        switch (settlement) {
            case FeeSettlement::PrefundedReserve:
                return (settlement_modes_ & SettlementModes::PREFUNDED_RESERVE) != 0;
            case FeeSettlement::CallerAttachedPayment:
                return (settlement_modes_ & SettlementModes::CALLER_ATTACHED_PAYMENT) != 0;
        }
        return false;
    }

    [[nodiscard]] constexpr uint8_t GetSettlementModes() const noexcept {
        return settlement_modes_;
    }

    [[nodiscard]] constexpr bool IsFeeEscrowEnabled() const noexcept {
        return fee_escrow_;
    }

    [[nodiscard]] constexpr size_t GetMaxPayloadSize() const noexcept {
        return max_payload_size_;
    }

    [[nodiscard]] constexpr RelayVariant GetVariant() const noexcept {
        return variant_;
    }

    /// A node needs at least one settlement mode and a bounded payload size
    [[nodiscard]] constexpr bool IsValid() const noexcept {
        return settlement_modes_ != SettlementModes::NONE &&
               max_payload_size_ > 0 &&
               max_payload_size_ <= RelayConstants::MAX_PAYLOAD_SIZE_LIMIT;
    }

    [[nodiscard]] constexpr bool operator==(const RelayConfig &other) const noexcept = default;

private:
    constexpr RelayConfig(const RelayVariant variant,
                          const bool includes_payload,
                          const bool enforce_sender_allowlist,
                          const uint8_t settlement_modes) noexcept
        : variant_(variant)
        , includes_payload_(includes_payload)
        , enforce_sender_allowlist_(enforce_sender_allowlist)
        , settlement_modes_(settlement_modes) {}

    RelayVariant variant_;
    bool includes_payload_;
    bool enforce_sender_allowlist_;
    uint8_t settlement_modes_;
    bool fee_escrow_ = false;
    size_t max_payload_size_ = RelayConstants::DEFAULT_MAX_PAYLOAD_SIZE;
};

/// Identity and assets of one relay node on its own network
struct RelaySettings {
    /// Address the node holds custody under, as seen by the asset ledger and transport
    Address node_address;
    /// Network this node lives on; stamped as the source of every outbound message
    NetworkId network;
    /// Asset the prefunded reserve is denominated in (reconfigurable by an administrator)
    AssetType fee_asset;
    /// Asset attached to a call under CallerAttachedPayment
    AssetType native_asset;
};

} // namespace crosslane::relay::configuration
