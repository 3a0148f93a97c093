#include "crosslane/relay/outbound_dispatcher.hpp"
#include "crosslane/codec/payload_codec.hpp"
#include "crosslane/core/constants.hpp"
#include "crosslane/core/format.hpp"
#include "crosslane/observability/logging.hpp"

namespace crosslane::relay {
    using codec::PayloadCodec;
    using codec::RelayPayload;
    using fees::FeeCoverageRequest;
    using fees::FeeQuote;
    using observability::StringField;
    using observability::UIntField;

    OutboundDispatcher::OutboundDispatcher(const RelayConfig &config,
                                           const RelaySettings &settings,
                                           const AllowlistRegistry &registry,
                                           const FeeQuoter &quoter,
                                           Custody &custody)
        : config_(config)
          , settings_(settings)
          , registry_(registry)
          , quoter_(quoter)
          , custody_(custody) {
    }

    Result<MessageId, RelayFailure> OutboundDispatcher::Send(const SendRequest &request, ITransport &transport,
                                                             OperationJournal &journal) const {
        CROSSLANE_TRY(Validate(request));

        CROSSLANE_TRY(custody_.TransferIn(request.asset, request.caller, request.amount, journal));
        const bool attached = request.settlement == FeeSettlement::CallerAttachedPayment;
        if (attached && request.attached_payment > RelayConstants::ZERO_AMOUNT) {
            CROSSLANE_TRY(custody_.AcceptAttached(settings_.native_asset, request.caller,
                                                  request.attached_payment, journal));
        }

        auto message_result = BuildMessage(request);
        if (message_result.IsErr()) {
            return Result<MessageId, RelayFailure>::Err(std::move(message_result).UnwrapErr());
        }
        const Message message = std::move(message_result).Unwrap();

        auto quote_result = quoter_.Quote(transport, request.destination, message);
        if (quote_result.IsErr()) {
            return Result<MessageId, RelayFailure>::Err(std::move(quote_result).UnwrapErr());
        }
        const FeeQuote quote = std::move(quote_result).Unwrap();
        const FeeCoverageRequest coverage{
            .settlement = request.settlement,
            .caller = request.caller,
            .attached_payment = attached ? request.attached_payment : RelayConstants::ZERO_AMOUNT,
            .in_flight = request.asset == quote.fee_asset ? request.amount : RelayConstants::ZERO_AMOUNT
        };
        CROSSLANE_TRY(quoter_.EnsureFeeCoverage(quote, coverage, journal));

        auto authorization = AuthorizeTransport(request, quote, transport, journal);
        if (authorization.IsErr()) {
            return Result<MessageId, RelayFailure>::Err(std::move(authorization).UnwrapErr());
        }

        auto dispatched = transport.Dispatch(request.destination, message, authorization.Unwrap());
        if (dispatched.IsErr()) {
            CROSSLANE_LOG_WARN("Dispatch rejected by transport", {
                UIntField("destination", request.destination.value),
                StringField("error", dispatched.UnwrapErr().message)
            });
            return Result<MessageId, RelayFailure>::Err(
                RelayFailure::TransportFailed(
                    compat::format("Dispatch to network {} failed: {}",
                                   request.destination.value, dispatched.UnwrapErr().message)));
        }
        const MessageId id = dispatched.Unwrap();

        journal.Defer([event = MessageSentEvent{
            id, request.destination, request.asset, request.amount, quote.fee_asset, quote.amount
        }](IRelayEventHandler &handler) {
            handler.OnMessageSent(event);
        });
        CROSSLANE_LOG_INFO("Message dispatched", {
            StringField("id", id.ToHex()),
            UIntField("destination", request.destination.value),
            StringField("asset", request.asset.value),
            UIntField("amount", request.amount),
            StringField("fee_asset", quote.fee_asset.value),
            UIntField("fee", quote.amount),
            StringField("settlement", ToString(request.settlement))
        });
        return Result<MessageId, RelayFailure>::Ok(id);
    }

    Result<Unit, RelayFailure> OutboundDispatcher::Validate(const SendRequest &request) const {
        if (!config_.SupportsSettlement(request.settlement)) {
            return Result<Unit, RelayFailure>::Err(
                RelayFailure::UnsupportedSettlement(
                    compat::format("Settlement mode {} is not enabled", ToString(request.settlement))));
        }
        if (!config_.IncludesPayload() && !request.payload.empty()) {
            return Result<Unit, RelayFailure>::Err(
                RelayFailure::PayloadNotSupported("This relay transfers assets only"));
        }
        if (request.payload.size() > config_.GetMaxPayloadSize()) {
            return Result<Unit, RelayFailure>::Err(
                RelayFailure::InvalidInput(
                    compat::format("Payload size ({} bytes) exceeds maximum allowed ({} bytes)",
                                   request.payload.size(), config_.GetMaxPayloadSize())));
        }
        if (!registry_.IsDestinationAllowed(request.destination)) {
            return Result<Unit, RelayFailure>::Err(
                RelayFailure::ChainNotAllowed(
                    compat::format("{}: {}", ErrorMessages::DESTINATION_NOT_ALLOWED, request.destination.value)));
        }
        if (!registry_.IsAssetAllowed(request.asset)) {
            return Result<Unit, RelayFailure>::Err(
                RelayFailure::TokenNotAllowed(
                    compat::format("{}: {}", ErrorMessages::ASSET_NOT_ALLOWED, request.asset.value)));
        }
        if (request.receiver.IsNull()) {
            return Result<Unit, RelayFailure>::Err(
                RelayFailure::InvalidReceiver(std::string(ErrorMessages::NULL_RECEIVER)));
        }
        if (request.amount == RelayConstants::ZERO_AMOUNT) {
            return Result<Unit, RelayFailure>::Err(
                RelayFailure::InvalidAmount(std::string(ErrorMessages::ZERO_AMOUNT)));
        }
        return Result<Unit, RelayFailure>::Ok(unit);
    }

    Result<Message, RelayFailure> OutboundDispatcher::BuildMessage(const SendRequest &request) const {
        auto encoded = PayloadCodec::Encode(RelayPayload{
            .recipient = request.receiver,
            .asset = request.asset,
            .amount = request.amount,
            .data = request.payload
        });
        if (encoded.IsErr()) {
            return Result<Message, RelayFailure>::Err(std::move(encoded).UnwrapErr());
        }
        Message message;
        message.source_network = settings_.network;
        message.destination_network = request.destination;
        message.sender = settings_.node_address;
        message.receiver = request.receiver;
        message.payload = std::move(encoded).Unwrap();
        message.asset_transfers.push_back(AssetAmount{request.asset, request.amount});
        message.fee_settlement = request.settlement;
        message.fee_asset = request.settlement == FeeSettlement::CallerAttachedPayment
                                ? settings_.native_asset
                                : settings_.fee_asset;
        return Result<Message, RelayFailure>::Ok(std::move(message));
    }

    Result<FeeAuthorization, RelayFailure> OutboundDispatcher::AuthorizeTransport(
        const SendRequest &request, const FeeQuote &quote, const ITransport &transport,
        OperationJournal &journal) const {
        auto collector = transport.GetCollectorAddress(settings_.network);
        if (collector.IsErr()) {
            return Result<FeeAuthorization, RelayFailure>::Err(
                RelayFailure::TransportFailed(collector.UnwrapErr().message));
        }
        const Address spender = collector.Unwrap();

        FeeAuthorization authorization;
        authorization.payer = settings_.node_address;
        authorization.fee_asset = quote.fee_asset;
        authorization.fee_amount = quote.amount;
        authorization.asset_allowances.push_back(AssetAmount{request.asset, request.amount});

        // One allowance per asset; fee and transfer share it when denominated alike.
        Amount transfer_allowance = request.amount;
        if (request.asset == quote.fee_asset) {
            const auto combined = CheckedAdd(request.amount, quote.amount);
            if (!combined.has_value()) {
                return Result<FeeAuthorization, RelayFailure>::Err(
                    RelayFailure::InvalidAmount(std::string(ErrorMessages::AMOUNT_OVERFLOW)));
            }
            transfer_allowance = *combined;
        } else if (quote.amount > RelayConstants::ZERO_AMOUNT) {
            auto fee_allowance = custody_.Authorize(quote.fee_asset, spender, quote.amount, journal);
            if (fee_allowance.IsErr()) {
                return Result<FeeAuthorization, RelayFailure>::Err(std::move(fee_allowance).UnwrapErr());
            }
        }
        auto asset_allowance = custody_.Authorize(request.asset, spender, transfer_allowance, journal);
        if (asset_allowance.IsErr()) {
            return Result<FeeAuthorization, RelayFailure>::Err(std::move(asset_allowance).UnwrapErr());
        }
        return Result<FeeAuthorization, RelayFailure>::Ok(std::move(authorization));
    }
}
