#pragma once
#include "crosslane/core/result.hpp"
#include "crosslane/core/failures.hpp"
#include "crosslane/core/types.hpp"
#include "crosslane/configuration/relay_config.hpp"
#include "crosslane/custody/custody.hpp"
#include "crosslane/fees/fee_escrow.hpp"
#include "crosslane/interfaces/i_transport.hpp"
#include "crosslane/state/operation_journal.hpp"

namespace crosslane::relay::fees {
    using configuration::RelayConfig;
    using custody::Custody;
    using interfaces::ITransport;
    using state::OperationJournal;

    // Valid only within the operation that obtained it.
    struct FeeQuote {
        AssetType fee_asset;
        Amount amount = 0;
    };

    struct FeeCoverageRequest {
        FeeSettlement settlement = FeeSettlement::PrefundedReserve;
        Address caller;
        // Value the caller attached, already held in custody.
        Amount attached_payment = 0;
        // Custody of the fee asset that belongs to the message being sent, not to the reserve.
        Amount in_flight = 0;
    };

    class FeeQuoter {
    public:
        FeeQuoter(const RelayConfig &config, Custody &custody, FeeEscrow &escrow);

        [[nodiscard]] Result<FeeQuote, RelayFailure> Quote(
            const ITransport &transport, NetworkId destination, const Message &message) const;

        /**
         * PrefundedReserve: the shared reserve (and, with escrow, the caller's
         * credit, which is debited) must cover the quote.
         * CallerAttachedPayment: the attached value must cover the quote; the
         * excess goes back to the caller in the same operation.
         */
        [[nodiscard]] Result<Unit, RelayFailure> EnsureFeeCoverage(
            const FeeQuote &quote, const FeeCoverageRequest &request, OperationJournal &journal) const;

    private:
        [[nodiscard]] Result<Unit, RelayFailure> CoverFromReserve(
            const FeeQuote &quote, const FeeCoverageRequest &request, OperationJournal &journal) const;

        [[nodiscard]] Result<Unit, RelayFailure> CoverFromAttached(
            const FeeQuote &quote, const FeeCoverageRequest &request, OperationJournal &journal) const;

        const RelayConfig &config_;
        Custody &custody_;
        FeeEscrow &escrow_;
    };
}
