#pragma once
#include "crosslane/core/result.hpp"
#include "crosslane/core/failures.hpp"
#include "crosslane/core/types.hpp"
#include "crosslane/core/constants.hpp"
#include "crosslane/interfaces/i_asset_ledger.hpp"
#include "crosslane/interfaces/i_transport.hpp"
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

namespace crosslane::relay::transport {
    using interfaces::IAssetLedger;
    using interfaces::IRelayEndpoint;
    using interfaces::ITransport;

    struct FeeSchedule {
        Amount base_fee = TransportConstants::DEFAULT_BASE_FEE;
        Amount fee_per_byte = TransportConstants::DEFAULT_FEE_PER_BYTE;
        Amount fee_per_transfer = TransportConstants::DEFAULT_FEE_PER_TRANSFER;
    };

    struct DeliveryOutcome {
        MessageId id;
        Result<Unit, RelayFailure> result;
    };

    /**
     * @brief Loopback transport between relay nodes of simulated networks
     *
     * Each network has an asset ledger and a collector account on it. Dispatch
     * pulls the authorized fee and assets from the source node into the source
     * collector and queues the message. Delivery credits the destination node
     * from the destination collector's pool, then hands the message to the
     * destination endpoint; if the endpoint reports failure the credit is
     * taken back.
     *
     * Endpoints are held weakly and invoked without the transport lock held.
     */
    class LocalTransport final : public ITransport {
    public:
        explicit LocalTransport(FeeSchedule schedule = {});

        LocalTransport(const LocalTransport &) = delete;

        LocalTransport &operator=(const LocalTransport &) = delete;

        [[nodiscard]] Result<Unit, RelayFailure> RegisterNetwork(
            NetworkId network, std::shared_ptr<IAssetLedger> ledger, Address collector);

        [[nodiscard]] Result<Unit, RelayFailure> RegisterEndpoint(
            NetworkId network, std::weak_ptr<IRelayEndpoint> endpoint, Address node_address);

        void SetFeeSchedule(FeeSchedule schedule);

        // The next Dispatch fails TransportFailed without side effects.
        void FailNextDispatch();

        [[nodiscard]] Result<Amount, RelayFailure> Quote(
            NetworkId destination, const Message &message) const override;

        [[nodiscard]] Result<MessageId, RelayFailure> Dispatch(
            NetworkId destination, const Message &message, const FeeAuthorization &authorization) override;

        [[nodiscard]] Result<Address, RelayFailure> GetCollectorAddress(NetworkId network) const override;

        [[nodiscard]] std::optional<DeliveryOutcome> DeliverNext();

        [[nodiscard]] std::vector<DeliveryOutcome> DeliverAll();

        // Hands an already delivered message to its endpoint again.
        [[nodiscard]] Result<Unit, RelayFailure> Redeliver(const MessageId &id);

        [[nodiscard]] size_t PendingCount() const;

        [[nodiscard]] std::optional<Message> FindDispatched(const MessageId &id) const;

    private:
        struct Route {
            std::shared_ptr<IAssetLedger> ledger;
            Address collector;
            std::weak_ptr<IRelayEndpoint> endpoint;
            Address node_address;
        };

        [[nodiscard]] Result<Amount, RelayFailure> QuoteLocked(NetworkId destination, const Message &message) const;

        [[nodiscard]] Result<Unit, RelayFailure> Collect(
            const Route &source, const FeeAuthorization &authorization, const Message &message);

        [[nodiscard]] Result<MessageId, RelayFailure> DeriveId(const Message &message, uint64_t sequence) const;

        [[nodiscard]] Result<Unit, RelayFailure> Handover(const Message &message);

        mutable std::mutex lock_;
        FeeSchedule schedule_;
        std::unordered_map<NetworkId, Route, NetworkId::Hash> routes_;
        std::deque<Message> pending_;
        std::unordered_map<MessageId, Message, MessageId::Hash> dispatched_;
        uint64_t sequence_ = TransportConstants::INITIAL_SEQUENCE;
        bool fail_next_dispatch_ = false;
    };
}
