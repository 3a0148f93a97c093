#pragma once
#include "crosslane/core/result.hpp"
#include "crosslane/core/failures.hpp"
#include "crosslane/core/types.hpp"
#include "crosslane/admin/admin_capability.hpp"
#include "crosslane/configuration/relay_config.hpp"
#include "crosslane/custody/custody.hpp"
#include "crosslane/fees/fee_escrow.hpp"
#include "crosslane/interfaces/i_transport.hpp"
#include "crosslane/registry/allowlist_registry.hpp"
#include "crosslane/state/operation_gate.hpp"
#include <memory>
#include <vector>

namespace crosslane::relay::admin {
    using configuration::RelaySettings;
    using custody::Custody;
    using fees::FeeEscrow;
    using interfaces::ITransport;
    using registry::AllowlistRegistry;
    using state::OperationGate;
    using state::OperationJournal;

    /**
     * @brief Sole mutator of the allowlists and sole operator of fund recovery
     *
     * Every call presents an AdminCapability and fails Unauthorized unless it
     * is currently granted. Each call is one operation of the owning node:
     * serialized with sends and deliveries, and all-or-nothing.
     */
    class AdminControl {
    public:
        AdminControl(OperationGate &gate,
                     AllowlistRegistry &registry,
                     Custody &custody,
                     FeeEscrow &escrow,
                     RelaySettings &settings,
                     std::shared_ptr<ITransport> &transport,
                     AdminCapability initial);

        AdminControl(const AdminControl &) = delete;

        AdminControl &operator=(const AdminControl &) = delete;

        [[nodiscard]] Result<Unit, RelayFailure> SetDestinationAllowed(
            const AdminCapability &capability, NetworkId network, bool allowed);

        [[nodiscard]] Result<Unit, RelayFailure> SetSourceAllowed(
            const AdminCapability &capability, NetworkId network, bool allowed);

        [[nodiscard]] Result<Unit, RelayFailure> SetAssetAllowed(
            const AdminCapability &capability, const AssetType &asset, bool allowed);

        [[nodiscard]] Result<Unit, RelayFailure> SetSenderAllowed(
            const AdminCapability &capability, const Address &sender, bool allowed);

        // Reprices the prefunded reserve; custody of the previous fee asset stays put,
        // and escrow credit keeps the asset it was deposited in.
        [[nodiscard]] Result<Unit, RelayFailure> SetFeeAsset(
            const AdminCapability &capability, const AssetType &asset);

        [[nodiscard]] Result<Unit, RelayFailure> SetTransport(
            const AdminCapability &capability, std::shared_ptr<ITransport> transport);

        // Sends the whole fee asset balance to `to`. Returns the amount moved.
        // Escrow credit in the withdrawn asset is forfeited along with it.
        [[nodiscard]] Result<Amount, RelayFailure> WithdrawFeeAsset(
            const AdminCapability &capability, const Address &to);

        [[nodiscard]] Result<Amount, RelayFailure> WithdrawAsset(
            const AdminCapability &capability, const AssetType &asset, const Address &to);

        [[nodiscard]] Result<AdminCapability, RelayFailure> IssueCapability(const AdminCapability &capability);

        // The last granted capability cannot be revoked.
        [[nodiscard]] Result<Unit, RelayFailure> RevokeCapability(
            const AdminCapability &capability, const AdminCapability &target);

        [[nodiscard]] bool IsAuthorized(const AdminCapability &capability) const;

        [[nodiscard]] size_t CapabilityCount() const;

    private:
        template<typename T, typename Body>
        [[nodiscard]] Result<T, RelayFailure> Guarded(std::string_view operation,
                                                      const AdminCapability &capability,
                                                      Body &&body);

        [[nodiscard]] Result<Amount, RelayFailure> Withdraw(
            const AdminCapability &capability, std::string_view operation,
            const AssetType &asset, const Address &to);

        [[nodiscard]] std::vector<AdminCapability>::const_iterator Find(const AdminCapability &capability) const;

        OperationGate &gate_;
        AllowlistRegistry &registry_;
        Custody &custody_;
        FeeEscrow &escrow_;
        RelaySettings &settings_;
        std::shared_ptr<ITransport> &transport_;
        std::vector<AdminCapability> granted_;
    };
}
