#include "crosslane/fees/fee_quoter.hpp"
#include "crosslane/core/format.hpp"

namespace crosslane::relay::fees {
    FeeQuoter::FeeQuoter(const RelayConfig &config, Custody &custody, FeeEscrow &escrow)
        : config_(config)
          , custody_(custody)
          , escrow_(escrow) {
    }

    Result<FeeQuote, RelayFailure> FeeQuoter::Quote(const ITransport &transport, const NetworkId destination,
                                                    const Message &message) const {
        auto quoted = transport.Quote(destination, message);
        if (quoted.IsErr()) {
            return Result<FeeQuote, RelayFailure>::Err(
                RelayFailure::TransportFailed(
                    compat::format("Fee quote for network {} failed: {}",
                                   destination.value, quoted.UnwrapErr().message)));
        }
        return Result<FeeQuote, RelayFailure>::Ok(FeeQuote{message.fee_asset, quoted.Unwrap()});
    }

    Result<Unit, RelayFailure> FeeQuoter::EnsureFeeCoverage(const FeeQuote &quote,
                                                            const FeeCoverageRequest &request,
                                                            OperationJournal &journal) const {
        switch (request.settlement) {
            case FeeSettlement::PrefundedReserve:
                return CoverFromReserve(quote, request, journal);
            case FeeSettlement::CallerAttachedPayment:
                return CoverFromAttached(quote, request, journal);
        }
        return Result<Unit, RelayFailure>::Err(
            RelayFailure::UnsupportedSettlement("Unknown fee settlement mode"));
    }

    Result<Unit, RelayFailure> FeeQuoter::CoverFromReserve(const FeeQuote &quote,
                                                           const FeeCoverageRequest &request,
                                                           OperationJournal &journal) const {
        const Amount held = custody_.BalanceOf(quote.fee_asset);
        const Amount reserve = held > request.in_flight ? held - request.in_flight : 0;
        if (reserve < quote.amount) {
            return Result<Unit, RelayFailure>::Err(
                RelayFailure::InsufficientFeeBalance(
                    compat::format("Fee reserve holds {} {}, quote is {}",
                                   reserve, quote.fee_asset.value, quote.amount)));
        }
        if (config_.IsFeeEscrowEnabled()) {
            return escrow_.Debit(request.caller, quote.fee_asset, quote.amount, journal);
        }
        return Result<Unit, RelayFailure>::Ok(unit);
    }

    Result<Unit, RelayFailure> FeeQuoter::CoverFromAttached(const FeeQuote &quote,
                                                            const FeeCoverageRequest &request,
                                                            OperationJournal &journal) const {
        if (request.attached_payment < quote.amount) {
            return Result<Unit, RelayFailure>::Err(
                RelayFailure::InsufficientFeeBalance(
                    compat::format("Attached payment of {} {} is below quote {}",
                                   request.attached_payment, quote.fee_asset.value, quote.amount)));
        }
        const Amount excess = request.attached_payment - quote.amount;
        if (excess == RelayConstants::ZERO_AMOUNT) {
            return Result<Unit, RelayFailure>::Ok(unit);
        }
        return custody_.TransferOut(quote.fee_asset, request.caller, excess, journal);
    }
}
