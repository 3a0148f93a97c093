#include "crosslane/relay/inbound_receiver.hpp"
#include "crosslane/core/constants.hpp"
#include "crosslane/core/format.hpp"
#include "crosslane/observability/logging.hpp"

namespace crosslane::relay {
    using codec::PayloadCodec;
    using codec::RelayPayload;
    using observability::StringField;
    using observability::UIntField;

    InboundReceiver::InboundReceiver(const RelayConfig &config,
                                     const AllowlistRegistry &registry,
                                     ProcessedMessageLedger &processed,
                                     Custody &custody)
        : config_(config)
          , registry_(registry)
          , processed_(processed)
          , custody_(custody) {
    }

    Result<Unit, RelayFailure> InboundReceiver::Deliver(const Message &message, OperationJournal &journal) {
        CROSSLANE_TRY(Authenticate(message));
        if (auto marked = processed_.CheckAndMark(message.id, journal); marked.IsErr()) {
            CROSSLANE_LOG_WARN("Replayed message rejected", {
                StringField("id", message.id.ToHex()),
                UIntField("source", message.source_network.value)
            });
            return marked;
        }

        auto opened = Open(message);
        if (opened.IsErr()) {
            return Reject(message.id, std::move(opened).UnwrapErr(), journal);
        }
        RelayPayload payload = std::move(opened).Unwrap();

        if (auto released = custody_.TransferOut(payload.asset, payload.recipient, payload.amount, journal);
            released.IsErr()) {
            CROSSLANE_LOG_ERROR("Custody release failed", {
                StringField("id", message.id.ToHex()),
                StringField("asset", payload.asset.value),
                UIntField("amount", payload.amount),
                StringField("error", released.UnwrapErr().message)
            });
            return released;
        }

        if (!config_.IncludesPayload()) {
            payload.data.clear();
        }
        RecordSnapshot(ReceivedSnapshot{message.id, payload.data, payload.asset, payload.amount}, journal);

        journal.Defer([event = MessageReceivedEvent{
            message.id, message.source_network, message.sender, payload.data, payload.asset, payload.amount
        }](IRelayEventHandler &handler) {
            handler.OnMessageReceived(event);
        });
        CROSSLANE_LOG_INFO("Message delivered", {
            StringField("id", message.id.ToHex()),
            UIntField("source", message.source_network.value),
            StringField("recipient", payload.recipient.value),
            StringField("asset", payload.asset.value),
            UIntField("amount", payload.amount)
        });
        return Result<Unit, RelayFailure>::Ok(unit);
    }

    const std::optional<ReceivedSnapshot> &InboundReceiver::LastReceived() const noexcept {
        return last_received_;
    }

    Result<Unit, RelayFailure> InboundReceiver::Authenticate(const Message &message) const {
        if (!registry_.IsSourceAllowed(message.source_network)) {
            CROSSLANE_LOG_WARN("Delivery from unlisted network rejected", {
                StringField("id", message.id.ToHex()),
                UIntField("source", message.source_network.value)
            });
            return Result<Unit, RelayFailure>::Err(
                RelayFailure::ChainNotAllowed(
                    compat::format("{}: {}", ErrorMessages::SOURCE_NOT_ALLOWED, message.source_network.value)));
        }
        if (config_.EnforcesSenderAllowlist() && !registry_.IsSenderAllowed(message.sender)) {
            CROSSLANE_LOG_WARN("Delivery from unlisted sender rejected", {
                StringField("id", message.id.ToHex()),
                StringField("sender", message.sender.value)
            });
            return Result<Unit, RelayFailure>::Err(
                RelayFailure::SenderNotAllowed(
                    compat::format("{}: {}", ErrorMessages::SENDER_NOT_ALLOWED, message.sender.value)));
        }
        return Result<Unit, RelayFailure>::Ok(unit);
    }

    Result<RelayPayload, RelayFailure> InboundReceiver::Open(const Message &message) const {
        auto decoded = PayloadCodec::Decode(message.payload);
        if (decoded.IsErr()) {
            return decoded;
        }
        RelayPayload payload = std::move(decoded).Unwrap();
        if (!registry_.IsAssetAllowed(payload.asset)) {
            return Result<RelayPayload, RelayFailure>::Err(
                RelayFailure::TokenNotAllowed(
                    compat::format("{}: {}", ErrorMessages::ASSET_NOT_ALLOWED, payload.asset.value)));
        }
        return Result<RelayPayload, RelayFailure>::Ok(std::move(payload));
    }

    Result<Unit, RelayFailure> InboundReceiver::Reject(const MessageId &id, RelayFailure failure,
                                                       OperationJournal &journal) const {
        journal.KeepEffectsOnFailure();
        journal.Defer([event = MessageRejectedEvent{id, failure.type, failure.message}](IRelayEventHandler &handler) {
            handler.OnMessageRejected(event);
        });
        CROSSLANE_LOG_WARN("Message consumed without release", {
            StringField("id", id.ToHex()),
            StringField("reason", ToString(failure.type)),
            StringField("detail", failure.message)
        });
        return Result<Unit, RelayFailure>::Err(std::move(failure));
    }

    void InboundReceiver::RecordSnapshot(ReceivedSnapshot snapshot, OperationJournal &journal) {
        journal.Record("last received", [this, previous = last_received_]() -> Result<Unit, RelayFailure> {
            last_received_ = previous;
            return Result<Unit, RelayFailure>::Ok(unit);
        });
        last_received_ = std::move(snapshot);
    }
}
