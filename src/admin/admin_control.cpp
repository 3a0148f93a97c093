#include "crosslane/admin/admin_control.hpp"
#include "crosslane/core/constants.hpp"
#include "crosslane/core/format.hpp"
#include "crosslane/crypto/sodium_interop.hpp"
#include "crosslane/observability/logging.hpp"
#include <algorithm>

namespace crosslane::relay::admin {
    using crypto::SodiumInterop;
    using observability::BoolField;
    using observability::StringField;
    using observability::UIntField;

    AdminControl::AdminControl(OperationGate &gate,
                               AllowlistRegistry &registry,
                               Custody &custody,
                               FeeEscrow &escrow,
                               RelaySettings &settings,
                               std::shared_ptr<ITransport> &transport,
                               AdminCapability initial)
        : gate_(gate)
          , registry_(registry)
          , custody_(custody)
          , escrow_(escrow)
          , settings_(settings)
          , transport_(transport) {
        granted_.push_back(std::move(initial));
    }

    template<typename T, typename Body>
    Result<T, RelayFailure> AdminControl::Guarded(const std::string_view operation,
                                                  const AdminCapability &capability,
                                                  Body &&body) {
        return gate_.Run<T>(operation, [&](OperationJournal &journal) -> Result<T, RelayFailure> {
            if (Find(capability) == granted_.end()) {
                CROSSLANE_LOG_WARN("Administrative call refused", {
                    StringField("operation", operation),
                    StringField("capability", capability.Fingerprint())
                });
                return Result<T, RelayFailure>::Err(
                    RelayFailure::Unauthorized(std::string(ErrorMessages::NOT_AUTHORIZED)));
            }
            return std::forward<Body>(body)(journal);
        });
    }

    Result<Unit, RelayFailure> AdminControl::SetDestinationAllowed(const AdminCapability &capability,
                                                                   const NetworkId network, const bool allowed) {
        return Guarded<Unit>("set_destination_allowed", capability, [&](OperationJournal &journal) {
            registry_.SetDestinationAllowed(network, allowed, journal);
            CROSSLANE_LOG_INFO("Destination allowlist updated", {
                UIntField("network", network.value), BoolField("allowed", allowed)
            });
            return Result<Unit, RelayFailure>::Ok(unit);
        });
    }

    Result<Unit, RelayFailure> AdminControl::SetSourceAllowed(const AdminCapability &capability,
                                                              const NetworkId network, const bool allowed) {
        return Guarded<Unit>("set_source_allowed", capability, [&](OperationJournal &journal) {
            registry_.SetSourceAllowed(network, allowed, journal);
            CROSSLANE_LOG_INFO("Source allowlist updated", {
                UIntField("network", network.value), BoolField("allowed", allowed)
            });
            return Result<Unit, RelayFailure>::Ok(unit);
        });
    }

    Result<Unit, RelayFailure> AdminControl::SetAssetAllowed(const AdminCapability &capability,
                                                             const AssetType &asset, const bool allowed) {
        return Guarded<Unit>("set_asset_allowed", capability, [&](OperationJournal &journal) {
            if (asset.IsNull()) {
                return Result<Unit, RelayFailure>::Err(RelayFailure::InvalidInput("Asset type cannot be empty"));
            }
            registry_.SetAssetAllowed(asset, allowed, journal);
            CROSSLANE_LOG_INFO("Asset allowlist updated", {
                StringField("asset", asset.value), BoolField("allowed", allowed)
            });
            return Result<Unit, RelayFailure>::Ok(unit);
        });
    }

    Result<Unit, RelayFailure> AdminControl::SetSenderAllowed(const AdminCapability &capability,
                                                              const Address &sender, const bool allowed) {
        return Guarded<Unit>("set_sender_allowed", capability, [&](OperationJournal &journal) {
            if (sender.IsNull()) {
                return Result<Unit, RelayFailure>::Err(RelayFailure::InvalidInput("Sender cannot be empty"));
            }
            registry_.SetSenderAllowed(sender, allowed, journal);
            CROSSLANE_LOG_INFO("Sender allowlist updated", {
                StringField("sender", sender.value), BoolField("allowed", allowed)
            });
            return Result<Unit, RelayFailure>::Ok(unit);
        });
    }

    Result<Unit, RelayFailure> AdminControl::SetFeeAsset(const AdminCapability &capability, const AssetType &asset) {
        return Guarded<Unit>("set_fee_asset", capability, [&](OperationJournal &journal) {
            if (asset.IsNull()) {
                return Result<Unit, RelayFailure>::Err(RelayFailure::InvalidInput("Fee asset cannot be empty"));
            }
            AssetType previous = settings_.fee_asset;
            settings_.fee_asset = asset;
            journal.Record("fee asset", [this, previous]() -> Result<Unit, RelayFailure> {
                settings_.fee_asset = previous;
                return Result<Unit, RelayFailure>::Ok(unit);
            });
            journal.Defer([previous, asset](IRelayEventHandler &handler) {
                handler.OnFeeAssetChanged(previous, asset);
            });
            CROSSLANE_LOG_INFO("Fee asset changed", {
                StringField("previous", previous.value), StringField("current", asset.value)
            });
            return Result<Unit, RelayFailure>::Ok(unit);
        });
    }

    Result<Unit, RelayFailure> AdminControl::SetTransport(const AdminCapability &capability,
                                                          std::shared_ptr<ITransport> transport) {
        return Guarded<Unit>("set_transport", capability, [&](OperationJournal &journal) {
            if (!transport) {
                return Result<Unit, RelayFailure>::Err(RelayFailure::InvalidInput("Transport cannot be null"));
            }
            journal.Record("transport", [this, previous = transport_]() -> Result<Unit, RelayFailure> {
                transport_ = previous;
                return Result<Unit, RelayFailure>::Ok(unit);
            });
            transport_ = std::move(transport);
            journal.Defer([](IRelayEventHandler &handler) {
                handler.OnTransportChanged();
            });
            CROSSLANE_LOG_INFO("Transport replaced");
            return Result<Unit, RelayFailure>::Ok(unit);
        });
    }

    Result<Amount, RelayFailure> AdminControl::WithdrawFeeAsset(const AdminCapability &capability,
                                                                const Address &to) {
        // The gate is recursive: the fee asset cannot change between lookup and transfer.
        return gate_.Read([&] {
            const AssetType fee_asset = settings_.fee_asset;
            return Withdraw(capability, "withdraw_fee_asset", fee_asset, to);
        });
    }

    Result<Amount, RelayFailure> AdminControl::WithdrawAsset(const AdminCapability &capability,
                                                             const AssetType &asset, const Address &to) {
        return Withdraw(capability, "withdraw_asset", asset, to);
    }

    Result<Amount, RelayFailure> AdminControl::Withdraw(const AdminCapability &capability,
                                                        const std::string_view operation,
                                                        const AssetType &asset, const Address &to) {
        return Guarded<Amount>(operation, capability, [&](OperationJournal &journal) -> Result<Amount, RelayFailure> {
            if (to.IsNull()) {
                return Result<Amount, RelayFailure>::Err(
                    RelayFailure::InvalidReceiver(std::string(ErrorMessages::NULL_RECEIVER)));
            }
            const Amount balance = custody_.BalanceOf(asset);
            if (balance == RelayConstants::ZERO_AMOUNT) {
                return Result<Amount, RelayFailure>::Err(
                    RelayFailure::NothingToWithdraw(
                        compat::format("{}: no {} in custody", ErrorMessages::NOTHING_TO_WITHDRAW, asset.value)));
            }
            CROSSLANE_TRY(custody_.TransferOut(asset, to, balance, journal));
            escrow_.Forfeit(asset, journal);
            journal.Defer([event = WithdrawalEvent{asset, to, balance}](IRelayEventHandler &handler) {
                handler.OnWithdrawal(event);
            });
            CROSSLANE_LOG_INFO("Custody withdrawn", {
                StringField("asset", asset.value), StringField("to", to.value), UIntField("amount", balance)
            });
            return Result<Amount, RelayFailure>::Ok(balance);
        });
    }

    Result<AdminCapability, RelayFailure> AdminControl::IssueCapability(const AdminCapability &capability) {
        return Guarded<AdminCapability>("issue_capability", capability,
                                        [&](OperationJournal &journal) -> Result<AdminCapability, RelayFailure> {
                                            auto generated = AdminCapability::Generate();
                                            if (generated.IsErr()) {
                                                return generated;
                                            }
                                            const AdminCapability issued = generated.Unwrap();
                                            granted_.push_back(issued);
                                            journal.Record("issue capability", [this]() -> Result<Unit, RelayFailure> {
                                                granted_.pop_back();
                                                return Result<Unit, RelayFailure>::Ok(unit);
                                            });
                                            CROSSLANE_LOG_INFO("Administrator capability issued", {
                                                StringField("capability", issued.Fingerprint()),
                                                UIntField("granted", granted_.size())
                                            });
                                            return Result<AdminCapability, RelayFailure>::Ok(issued);
                                        });
    }

    Result<Unit, RelayFailure> AdminControl::RevokeCapability(const AdminCapability &capability,
                                                              const AdminCapability &target) {
        return Guarded<Unit>("revoke_capability", capability, [&](OperationJournal &journal) {
            const auto found = Find(target);
            if (found == granted_.end()) {
                return Result<Unit, RelayFailure>::Err(
                    RelayFailure::InvalidInput("Capability to revoke is not granted"));
            }
            if (granted_.size() <= RelayConstants::MIN_ADMIN_CAPABILITIES) {
                return Result<Unit, RelayFailure>::Err(
                    RelayFailure::InvalidInput("Cannot revoke the last administrator capability"));
            }
            const auto position = static_cast<size_t>(found - granted_.cbegin());
            AdminCapability revoked = *found;
            granted_.erase(found);
            journal.Record("revoke capability", [this, position, revoked]() -> Result<Unit, RelayFailure> {
                granted_.insert(granted_.begin() + static_cast<std::ptrdiff_t>(position), revoked);
                return Result<Unit, RelayFailure>::Ok(unit);
            });
            CROSSLANE_LOG_INFO("Administrator capability revoked", {
                StringField("capability", revoked.Fingerprint()),
                UIntField("granted", granted_.size())
            });
            return Result<Unit, RelayFailure>::Ok(unit);
        });
    }

    bool AdminControl::IsAuthorized(const AdminCapability &capability) const {
        return gate_.Read([&] { return Find(capability) != granted_.end(); });
    }

    size_t AdminControl::CapabilityCount() const {
        return gate_.Read([this] { return granted_.size(); });
    }

    std::vector<AdminCapability>::const_iterator AdminControl::Find(const AdminCapability &capability) const {
        return std::find_if(granted_.cbegin(), granted_.cend(), [&capability](const AdminCapability &granted) {
            auto equal = SodiumInterop::ConstantTimeEquals(granted.Bytes(), capability.Bytes());
            if (equal.IsErr()) {
                CROSSLANE_LOG_ERROR("Capability comparison failed", {
                    StringField("error", equal.UnwrapErr().message)
                });
                return false;
            }
            return equal.Unwrap();
        });
    }
}
