#include "crosslane/relay/relay_node.hpp"
#include "crosslane/core/constants.hpp"
#include "crosslane/crypto/sodium_interop.hpp"
#include "crosslane/observability/logging.hpp"

namespace crosslane::relay {
    using crypto::SodiumInterop;
    using observability::BoolField;
    using observability::StringField;
    using observability::UIntField;

    Result<CreatedRelayNode, RelayFailure> RelayNode::Create(RelaySettings settings,
                                                             RelayConfig config,
                                                             std::shared_ptr<IAssetLedger> ledger,
                                                             std::shared_ptr<ITransport> transport) {
        if (auto init = SodiumInterop::Initialize(); init.IsErr()) {
            return Result<CreatedRelayNode, RelayFailure>::Err(RelayFailure::FromSodiumFailure(init.UnwrapErr()));
        }
        CROSSLANE_TRY(ValidateSettings(settings, config, ledger, transport));
        auto capability = AdminCapability::Generate();
        if (capability.IsErr()) {
            return Result<CreatedRelayNode, RelayFailure>::Err(std::move(capability).UnwrapErr());
        }
        const AdminCapability admin = capability.Unwrap();
        auto node = std::shared_ptr<RelayNode>(
            new RelayNode(std::move(settings), config, std::move(ledger), std::move(transport), admin));
        CROSSLANE_LOG_INFO("Relay node created", {
            StringField("address", node->settings_.node_address.value),
            UIntField("network", node->settings_.network.value),
            StringField("fee_asset", node->settings_.fee_asset.value),
            BoolField("payload", config.IncludesPayload()),
            BoolField("sender_allowlist", config.EnforcesSenderAllowlist()),
            BoolField("fee_escrow", config.IsFeeEscrowEnabled())
        });
        return Result<CreatedRelayNode, RelayFailure>::Ok(CreatedRelayNode{std::move(node), admin});
    }

    RelayNode::RelayNode(RelaySettings settings,
                         const RelayConfig config,
                         std::shared_ptr<IAssetLedger> ledger,
                         std::shared_ptr<ITransport> transport,
                         AdminCapability initial_admin)
        : settings_(std::move(settings))
          , config_(config)
          , transport_(std::move(transport))
          , custody_(std::move(ledger), settings_.node_address)
          , quoter_(config_, custody_, escrow_)
          , outbound_(config_, settings_, registry_, quoter_, custody_)
          , inbound_(config_, registry_, processed_, custody_)
          , admin_(gate_, registry_, custody_, escrow_, settings_, transport_, std::move(initial_admin)) {
    }

    Result<Unit, RelayFailure> RelayNode::ValidateSettings(const RelaySettings &settings,
                                                           const RelayConfig &config,
                                                           const std::shared_ptr<IAssetLedger> &ledger,
                                                           const std::shared_ptr<ITransport> &transport) {
        if (!ledger || !transport) {
            return Result<Unit, RelayFailure>::Err(
                RelayFailure::InvalidConfiguration("Relay node requires an asset ledger and a transport"));
        }
        if (settings.node_address.IsNull()) {
            return Result<Unit, RelayFailure>::Err(
                RelayFailure::InvalidConfiguration("Relay node address cannot be empty"));
        }
        if (settings.fee_asset.IsNull() || settings.native_asset.IsNull()) {
            return Result<Unit, RelayFailure>::Err(
                RelayFailure::InvalidConfiguration("Fee asset and native asset must be set"));
        }
        if (!config.IsValid()) {
            return Result<Unit, RelayFailure>::Err(
                RelayFailure::InvalidConfiguration(
                    "Configuration needs a settlement mode and a payload limit within bounds"));
        }
        return Result<Unit, RelayFailure>::Ok(unit);
    }

    Result<MessageId, RelayFailure> RelayNode::Send(const SendRequest &request) {
        auto result = gate_.Run<MessageId>("send", [&](OperationJournal &journal) {
            return outbound_.Send(request, *transport_, journal);
        });
        if (result.IsErr()) {
            CROSSLANE_LOG_WARN("Send rejected", {
                StringField("caller", request.caller.value),
                UIntField("destination", request.destination.value),
                StringField("reason", ToString(result.UnwrapErr().type)),
                StringField("detail", result.UnwrapErr().message)
            });
        }
        return result;
    }

    Result<Unit, RelayFailure> RelayNode::Deliver(const Message &message) {
        auto result = gate_.Run<Unit>("deliver", [&](OperationJournal &journal) {
            return inbound_.Deliver(message, journal);
        });
        if (result.IsErr()) {
            CROSSLANE_LOG_WARN("Delivery rejected", {
                StringField("id", message.id.ToHex()),
                StringField("reason", ToString(result.UnwrapErr().type)),
                StringField("detail", result.UnwrapErr().message)
            });
        }
        return result;
    }

    Result<Unit, RelayFailure> RelayNode::DepositFeeReserve(const Address &caller, const Amount amount) {
        return gate_.Run<Unit>("deposit_fee_reserve", [&](OperationJournal &journal) -> Result<Unit, RelayFailure> {
            if (caller.IsNull()) {
                return Result<Unit, RelayFailure>::Err(RelayFailure::InvalidInput("Depositor cannot be empty"));
            }
            if (amount == RelayConstants::ZERO_AMOUNT) {
                return Result<Unit, RelayFailure>::Err(
                    RelayFailure::InvalidAmount(std::string(ErrorMessages::ZERO_AMOUNT)));
            }
            const AssetType fee_asset = settings_.fee_asset;
            CROSSLANE_TRY(custody_.TransferIn(fee_asset, caller, amount, journal));
            if (config_.IsFeeEscrowEnabled()) {
                CROSSLANE_TRY(escrow_.Credit(caller, fee_asset, amount, journal));
            }
            journal.Defer([event = FeeReserveDepositedEvent{caller, fee_asset, amount}](IRelayEventHandler &handler) {
                handler.OnFeeReserveDeposited(event);
            });
            CROSSLANE_LOG_INFO("Fee reserve topped up", {
                StringField("depositor", caller.value),
                StringField("asset", fee_asset.value),
                UIntField("amount", amount)
            });
            return Result<Unit, RelayFailure>::Ok(unit);
        });
    }

    AdminControl &RelayNode::Admin() noexcept {
        return admin_;
    }

    void RelayNode::SetEventHandler(std::shared_ptr<IRelayEventHandler> handler) {
        gate_.SetEventHandler(std::move(handler));
    }

    bool RelayNode::HasProcessed(const MessageId &id) const {
        return gate_.Read([&] { return processed_.HasProcessed(id); });
    }

    size_t RelayNode::ProcessedCount() const {
        return gate_.Read([this] { return processed_.Size(); });
    }

    bool RelayNode::IsDestinationAllowed(const NetworkId network) const {
        return gate_.Read([&] { return registry_.IsDestinationAllowed(network); });
    }

    bool RelayNode::IsSourceAllowed(const NetworkId network) const {
        return gate_.Read([&] { return registry_.IsSourceAllowed(network); });
    }

    bool RelayNode::IsAssetAllowed(const AssetType &asset) const {
        return gate_.Read([&] { return registry_.IsAssetAllowed(asset); });
    }

    bool RelayNode::IsSenderAllowed(const Address &sender) const {
        return gate_.Read([&] { return registry_.IsSenderAllowed(sender); });
    }

    std::optional<ReceivedSnapshot> RelayNode::GetLastReceived() const {
        return gate_.Read([this] { return inbound_.LastReceived(); });
    }

    Amount RelayNode::FeeReserveBalance() const {
        return gate_.Read([this] { return custody_.BalanceOf(settings_.fee_asset); });
    }

    Amount RelayNode::CustodyBalance(const AssetType &asset) const {
        return gate_.Read([&] { return custody_.BalanceOf(asset); });
    }

    Amount RelayNode::FeeEscrowCredit(const Address &caller) const {
        return gate_.Read([&] { return escrow_.CreditOf(caller, settings_.fee_asset); });
    }

    AssetType RelayNode::GetFeeAsset() const {
        return gate_.Read([this] { return settings_.fee_asset; });
    }

    const RelayConfig &RelayNode::GetConfig() const noexcept {
        return config_;
    }

    const Address &RelayNode::GetAddress() const noexcept {
        return settings_.node_address;
    }

    NetworkId RelayNode::GetNetwork() const noexcept {
        return settings_.network;
    }
}
