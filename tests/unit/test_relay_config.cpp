#include <catch2/catch_test_macros.hpp>
#include "crosslane/configuration/relay_config.hpp"

using namespace crosslane::relay;
using namespace crosslane::relay::configuration;

TEST_CASE("RelayConfig - Factory Methods", "[config]") {
    SECTION("Full carries payload and enforces senders") {
        constexpr auto config = RelayConfig::Full();
        REQUIRE(config.GetVariant() == RelayVariant::Full);
        REQUIRE(config.IncludesPayload());
        REQUIRE(config.EnforcesSenderAllowlist());
        REQUIRE(config.SupportsSettlement(FeeSettlement::PrefundedReserve));
        REQUIRE(config.SupportsSettlement(FeeSettlement::CallerAttachedPayment));
        REQUIRE_FALSE(config.IsFeeEscrowEnabled());
    }

    SECTION("TokenOnly drops payload and pays from the reserve") {
        constexpr auto config = RelayConfig::TokenOnly();
        REQUIRE(config.GetVariant() == RelayVariant::TokenOnly);
        REQUIRE_FALSE(config.IncludesPayload());
        REQUIRE(config.EnforcesSenderAllowlist());
        REQUIRE(config.SupportsSettlement(FeeSettlement::PrefundedReserve));
        REQUIRE_FALSE(config.SupportsSettlement(FeeSettlement::CallerAttachedPayment));
    }

    SECTION("OpenSenders skips the sender allowlist") {
        constexpr auto config = RelayConfig::OpenSenders();
        REQUIRE(config.IncludesPayload());
        REQUIRE_FALSE(config.EnforcesSenderAllowlist());
    }

    SECTION("Default is Full") {
        REQUIRE(RelayConfig::Default() == RelayConfig::Full());
    }
}

TEST_CASE("RelayConfig - Replay protection cannot be disabled", "[config][security]") {
    REQUIRE(RelayConfig::Full().IncludesReplayProtection());
    REQUIRE(RelayConfig::TokenOnly().IncludesReplayProtection());
    REQUIRE(RelayConfig::OpenSenders().IncludesReplayProtection());
    REQUIRE(RelayConfig::OpenSenders().WithFeeEscrow(true).IncludesReplayProtection());
}

TEST_CASE("RelayConfig - Modifiers", "[config]") {
    SECTION("WithSettlementModes narrows the accepted modes") {
        const auto config = RelayConfig::Full().WithSettlementModes(SettlementModes::CALLER_ATTACHED_PAYMENT);
        REQUIRE_FALSE(config.SupportsSettlement(FeeSettlement::PrefundedReserve));
        REQUIRE(config.SupportsSettlement(FeeSettlement::CallerAttachedPayment));
        REQUIRE(config.IsValid());
    }

    SECTION("Unknown mode bits are dropped") {
        const auto config = RelayConfig::Full().WithSettlementModes(0xF0);
        REQUIRE(config.GetSettlementModes() == SettlementModes::NONE);
        REQUIRE_FALSE(config.IsValid());
    }

    SECTION("WithFeeEscrow leaves the variant untouched") {
        const auto config = RelayConfig::TokenOnly().WithFeeEscrow(true);
        REQUIRE(config.IsFeeEscrowEnabled());
        REQUIRE(config.GetVariant() == RelayVariant::TokenOnly);
        REQUIRE_FALSE(config == RelayConfig::TokenOnly());
    }

    SECTION("Payload limit must be positive and bounded") {
        REQUIRE(RelayConfig::Full().GetMaxPayloadSize() == RelayConstants::DEFAULT_MAX_PAYLOAD_SIZE);
        REQUIRE_FALSE(RelayConfig::Full().WithMaxPayloadSize(0).IsValid());
        REQUIRE_FALSE(RelayConfig::Full().WithMaxPayloadSize(RelayConstants::MAX_PAYLOAD_SIZE_LIMIT + 1).IsValid());
        REQUIRE(RelayConfig::Full().WithMaxPayloadSize(16).IsValid());
    }
}
