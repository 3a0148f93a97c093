#include "crosslane/codec/payload_codec.hpp"
#include "crosslane/core/constants.hpp"
#include "crosslane/core/format.hpp"
#include "relay/relay_message.pb.h"

namespace crosslane::relay::codec {
    namespace {
        template<typename ProtoMessage>
        Result<std::vector<uint8_t>, RelayFailure> Serialize(const ProtoMessage &message) {
            std::vector<uint8_t> bytes(message.ByteSizeLong());
            if (!message.SerializeToArray(bytes.data(), static_cast<int>(bytes.size()))) {
                return Result<std::vector<uint8_t>, RelayFailure>::Err(
                    RelayFailure::InvalidInput(std::string(ErrorMessages::PAYLOAD_ENCODE_FAILED)));
            }
            return Result<std::vector<uint8_t>, RelayFailure>::Ok(std::move(bytes));
        }
    }

    Result<std::vector<uint8_t>, RelayFailure> PayloadCodec::Encode(const RelayPayload &payload) {
        proto::relay::RelayPayload message;
        message.set_recipient(payload.recipient.value);
        message.set_asset(payload.asset.value);
        message.set_amount(payload.amount);
        message.set_data(payload.data.data(), payload.data.size());
        return Serialize(message);
    }

    Result<RelayPayload, RelayFailure> PayloadCodec::Decode(std::span<const uint8_t> bytes) {
        proto::relay::RelayPayload message;
        if (!message.ParseFromArray(bytes.data(), static_cast<int>(bytes.size()))) {
            return Result<RelayPayload, RelayFailure>::Err(
                RelayFailure::DecodeFailed(std::string(ErrorMessages::PAYLOAD_DECODE_FAILED)));
        }
        if (message.recipient().empty() || message.asset().empty()) {
            return Result<RelayPayload, RelayFailure>::Err(
                RelayFailure::DecodeFailed(
                    compat::format("{}: recipient and asset are required",
                                   ErrorMessages::PAYLOAD_DECODE_FAILED)));
        }
        RelayPayload payload;
        payload.recipient = Address{message.recipient()};
        payload.asset = AssetType{message.asset()};
        payload.amount = message.amount();
        payload.data.assign(message.data().begin(), message.data().end());
        return Result<RelayPayload, RelayFailure>::Ok(std::move(payload));
    }

    Result<std::vector<uint8_t>, RelayFailure> PayloadCodec::EncodeEnvelope(const Message &message,
                                                                            const uint64_t sequence) {
        if (message.payload.size() > RelayConstants::MAX_PAYLOAD_SIZE_LIMIT) {
            return Result<std::vector<uint8_t>, RelayFailure>::Err(
                RelayFailure::InvalidInput(
                    compat::format("Envelope payload of {} bytes exceeds the {} byte limit",
                                   message.payload.size(), RelayConstants::MAX_PAYLOAD_SIZE_LIMIT)));
        }
        proto::relay::RelayEnvelope envelope;
        envelope.set_source_network(message.source_network.value);
        envelope.set_destination_network(message.destination_network.value);
        envelope.set_sender(message.sender.value);
        envelope.set_receiver(message.receiver.value);
        envelope.set_payload(message.payload.data(), message.payload.size());
        for (const auto &[asset, amount]: message.asset_transfers) {
            auto *transfer = envelope.add_asset_transfers();
            transfer->set_asset(asset.value);
            transfer->set_amount(amount);
        }
        envelope.set_fee_settlement(message.fee_settlement == FeeSettlement::CallerAttachedPayment
                                        ? proto::relay::CALLER_ATTACHED_PAYMENT
                                        : proto::relay::PREFUNDED_RESERVE);
        envelope.set_fee_asset(message.fee_asset.value);
        envelope.set_sequence(sequence);
        return Serialize(envelope);
    }
}
