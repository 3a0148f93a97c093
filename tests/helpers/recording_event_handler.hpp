#pragma once
#include "crosslane/interfaces/i_relay_event_handler.hpp"
#include <utility>
#include <vector>

namespace crosslane::relay::test_helpers {

class RecordingEventHandler : public IRelayEventHandler {
public:
    void OnAllowlistChanged(const AllowlistChangedEvent& event) override {
        allowlist_changes.push_back(event);
    }

    void OnFeeAssetChanged(const AssetType& previous, const AssetType& current) override {
        fee_asset_changes.emplace_back(previous, current);
    }

    void OnTransportChanged() override {
        ++transport_changes;
    }

    void OnMessageSent(const MessageSentEvent& event) override {
        sent.push_back(event);
    }

    void OnMessageReceived(const MessageReceivedEvent& event) override {
        received.push_back(event);
    }

    void OnMessageRejected(const MessageRejectedEvent& event) override {
        rejected.push_back(event);
    }

    void OnWithdrawal(const WithdrawalEvent& event) override {
        withdrawals.push_back(event);
    }

    void OnFeeReserveDeposited(const FeeReserveDepositedEvent& event) override {
        deposits.push_back(event);
    }

    [[nodiscard]] size_t TotalEvents() const {
        return allowlist_changes.size() + fee_asset_changes.size() + static_cast<size_t>(transport_changes) +
               sent.size() + received.size() + rejected.size() + withdrawals.size() + deposits.size();
    }

    std::vector<AllowlistChangedEvent> allowlist_changes;
    std::vector<std::pair<AssetType, AssetType>> fee_asset_changes;
    int transport_changes = 0;
    std::vector<MessageSentEvent> sent;
    std::vector<MessageReceivedEvent> received;
    std::vector<MessageRejectedEvent> rejected;
    std::vector<WithdrawalEvent> withdrawals;
    std::vector<FeeReserveDepositedEvent> deposits;
};

} // namespace crosslane::relay::test_helpers
