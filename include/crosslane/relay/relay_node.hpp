#pragma once
#include "crosslane/core/result.hpp"
#include "crosslane/core/failures.hpp"
#include "crosslane/core/types.hpp"
#include "crosslane/admin/admin_capability.hpp"
#include "crosslane/admin/admin_control.hpp"
#include "crosslane/configuration/relay_config.hpp"
#include "crosslane/custody/custody.hpp"
#include "crosslane/fees/fee_escrow.hpp"
#include "crosslane/fees/fee_quoter.hpp"
#include "crosslane/interfaces/i_asset_ledger.hpp"
#include "crosslane/interfaces/i_relay_event_handler.hpp"
#include "crosslane/interfaces/i_transport.hpp"
#include "crosslane/registry/allowlist_registry.hpp"
#include "crosslane/relay/inbound_receiver.hpp"
#include "crosslane/relay/outbound_dispatcher.hpp"
#include "crosslane/security/processed_message_ledger.hpp"
#include "crosslane/state/operation_gate.hpp"
#include <memory>
#include <optional>

namespace crosslane::relay {
    using admin::AdminCapability;
    using admin::AdminControl;
    using interfaces::IAssetLedger;
    using interfaces::IRelayEndpoint;

    class RelayNode;

    struct CreatedRelayNode {
        std::shared_ptr<RelayNode> node;
        AdminCapability admin;
    };

    /**
     * @brief One relay node on one network
     *
     * Owns the allowlists, the processed message ledger, custody and fee
     * handling, and runs every public operation as a single serialized unit
     * that either commits completely or leaves no trace. Deliver is the only
     * entry point a transport uses.
     */
    class RelayNode final : public IRelayEndpoint {
    public:
        [[nodiscard]] static Result<CreatedRelayNode, RelayFailure> Create(
            RelaySettings settings,
            RelayConfig config,
            std::shared_ptr<IAssetLedger> ledger,
            std::shared_ptr<ITransport> transport);

        RelayNode(const RelayNode &) = delete;

        RelayNode &operator=(const RelayNode &) = delete;

        [[nodiscard]] Result<MessageId, RelayFailure> Send(const SendRequest &request);

        [[nodiscard]] Result<Unit, RelayFailure> Deliver(const Message &message) override;

        // Tops up the shared fee reserve from `caller`'s allowance.
        [[nodiscard]] Result<Unit, RelayFailure> DepositFeeReserve(const Address &caller, Amount amount);

        [[nodiscard]] AdminControl &Admin() noexcept;

        void SetEventHandler(std::shared_ptr<IRelayEventHandler> handler);

        [[nodiscard]] bool HasProcessed(const MessageId &id) const;

        [[nodiscard]] size_t ProcessedCount() const;

        [[nodiscard]] bool IsDestinationAllowed(NetworkId network) const;

        [[nodiscard]] bool IsSourceAllowed(NetworkId network) const;

        [[nodiscard]] bool IsAssetAllowed(const AssetType &asset) const;

        [[nodiscard]] bool IsSenderAllowed(const Address &sender) const;

        [[nodiscard]] std::optional<ReceivedSnapshot> GetLastReceived() const;

        [[nodiscard]] Amount FeeReserveBalance() const;

        [[nodiscard]] Amount CustodyBalance(const AssetType &asset) const;

        [[nodiscard]] Amount FeeEscrowCredit(const Address &caller) const;

        [[nodiscard]] AssetType GetFeeAsset() const;

        [[nodiscard]] const RelayConfig &GetConfig() const noexcept;

        [[nodiscard]] const Address &GetAddress() const noexcept;

        [[nodiscard]] NetworkId GetNetwork() const noexcept;

    private:
        RelayNode(RelaySettings settings,
                  RelayConfig config,
                  std::shared_ptr<IAssetLedger> ledger,
                  std::shared_ptr<ITransport> transport,
                  AdminCapability initial_admin);

        [[nodiscard]] static Result<Unit, RelayFailure> ValidateSettings(
            const RelaySettings &settings, const RelayConfig &config,
            const std::shared_ptr<IAssetLedger> &ledger, const std::shared_ptr<ITransport> &transport);

        RelaySettings settings_;
        const RelayConfig config_;
        std::shared_ptr<ITransport> transport_;
        state::OperationGate gate_;
        AllowlistRegistry registry_;
        ProcessedMessageLedger processed_;
        Custody custody_;
        fees::FeeEscrow escrow_;
        FeeQuoter quoter_;
        OutboundDispatcher outbound_;
        InboundReceiver inbound_;
        AdminControl admin_;
    };
}
