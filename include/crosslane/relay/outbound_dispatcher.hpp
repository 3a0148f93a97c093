#pragma once
#include "crosslane/core/result.hpp"
#include "crosslane/core/failures.hpp"
#include "crosslane/core/types.hpp"
#include "crosslane/configuration/relay_config.hpp"
#include "crosslane/custody/custody.hpp"
#include "crosslane/fees/fee_quoter.hpp"
#include "crosslane/interfaces/i_transport.hpp"
#include "crosslane/registry/allowlist_registry.hpp"
#include "crosslane/state/operation_journal.hpp"
#include <vector>

namespace crosslane::relay {
    using configuration::RelayConfig;
    using configuration::RelaySettings;
    using custody::Custody;
    using fees::FeeQuoter;
    using interfaces::ITransport;
    using registry::AllowlistRegistry;
    using state::OperationJournal;

    struct SendRequest {
        Address caller;
        NetworkId destination;
        Address receiver;
        std::vector<uint8_t> payload;
        AssetType asset;
        Amount amount = 0;
        FeeSettlement settlement = FeeSettlement::PrefundedReserve;
        // Native value attached to the call; only meaningful under CallerAttachedPayment.
        Amount attached_payment = 0;
    };

    class OutboundDispatcher {
    public:
        OutboundDispatcher(const RelayConfig &config,
                           const RelaySettings &settings,
                           const AllowlistRegistry &registry,
                           const FeeQuoter &quoter,
                           Custody &custody);

        OutboundDispatcher(const OutboundDispatcher &) = delete;

        OutboundDispatcher &operator=(const OutboundDispatcher &) = delete;

        // Fire-and-forget: the returned id is the only handle on the eventual delivery.
        [[nodiscard]] Result<MessageId, RelayFailure> Send(
            const SendRequest &request, ITransport &transport, OperationJournal &journal) const;

    private:
        [[nodiscard]] Result<Unit, RelayFailure> Validate(const SendRequest &request) const;

        [[nodiscard]] Result<Message, RelayFailure> BuildMessage(const SendRequest &request) const;

        [[nodiscard]] Result<FeeAuthorization, RelayFailure> AuthorizeTransport(
            const SendRequest &request, const fees::FeeQuote &quote,
            const ITransport &transport, OperationJournal &journal) const;

        const RelayConfig &config_;
        const RelaySettings &settings_;
        const AllowlistRegistry &registry_;
        const FeeQuoter &quoter_;
        Custody &custody_;
    };
}
