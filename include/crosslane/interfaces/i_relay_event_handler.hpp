#pragma once
#include "crosslane/core/failures.hpp"
#include "crosslane/core/types.hpp"
#include <cstdint>
#include <string>
#include <vector>
namespace crosslane::relay {
enum class AllowlistKind : uint8_t {
    DestinationNetwork,
    SourceNetwork,
    Asset,
    Sender
};
[[nodiscard]] std::string_view ToString(AllowlistKind kind) noexcept;
struct AllowlistChangedEvent {
    AllowlistKind kind;
    std::string identifier;
    bool allowed;
};
struct MessageSentEvent {
    MessageId id;
    NetworkId destination;
    AssetType asset;
    Amount amount;
    AssetType fee_asset;
    Amount fee_amount;
};
struct MessageReceivedEvent {
    MessageId id;
    NetworkId source;
    Address sender;
    std::vector<uint8_t> data;
    AssetType asset;
    Amount amount;
};
struct MessageRejectedEvent {
    MessageId id;
    RelayFailureType reason;
    std::string detail;
};
struct WithdrawalEvent {
    AssetType asset;
    Address to;
    Amount amount;
};
struct FeeReserveDepositedEvent {
    Address depositor;
    AssetType asset;
    Amount amount;
};
// Receives events of committed operations only. Events of one operation arrive
// in order, after the node has been released.
class IRelayEventHandler {
public:
    virtual ~IRelayEventHandler() = default;
    virtual void OnAllowlistChanged(const AllowlistChangedEvent& event) = 0;
    virtual void OnFeeAssetChanged(const AssetType& previous, const AssetType& current) = 0;
    virtual void OnTransportChanged() = 0;
    virtual void OnMessageSent(const MessageSentEvent& event) = 0;
    virtual void OnMessageReceived(const MessageReceivedEvent& event) = 0;
    virtual void OnMessageRejected(const MessageRejectedEvent& event) = 0;
    virtual void OnWithdrawal(const WithdrawalEvent& event) = 0;
    virtual void OnFeeReserveDeposited(const FeeReserveDepositedEvent& event) = 0;
};
}
