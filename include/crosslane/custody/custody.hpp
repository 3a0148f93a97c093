#pragma once
#include "crosslane/core/result.hpp"
#include "crosslane/core/failures.hpp"
#include "crosslane/core/types.hpp"
#include "crosslane/interfaces/i_asset_ledger.hpp"
#include "crosslane/state/operation_journal.hpp"
#include <memory>

namespace crosslane::relay::custody {
    using interfaces::IAssetLedger;
    using state::OperationJournal;

    // Balances held under the node's own address. Every movement goes through
    // the ledger's explicit success/failure result and journals its reversal.
    class Custody {
    public:
        Custody(std::shared_ptr<IAssetLedger> ledger, Address holder);

        Custody(const Custody &) = delete;

        Custody &operator=(const Custody &) = delete;

        // Pulls `amount` from `from` against the allowance it granted the holder.
        [[nodiscard]] Result<Unit, RelayFailure> TransferIn(
            const AssetType &asset, const Address &from, Amount amount, OperationJournal &journal);

        // Takes value the caller attached to the call itself.
        [[nodiscard]] Result<Unit, RelayFailure> AcceptAttached(
            const AssetType &asset, const Address &from, Amount amount, OperationJournal &journal);

        [[nodiscard]] Result<Unit, RelayFailure> TransferOut(
            const AssetType &asset, const Address &to, Amount amount, OperationJournal &journal);

        // Sets the allowance `spender` may pull from the holder.
        [[nodiscard]] Result<Unit, RelayFailure> Authorize(
            const AssetType &asset, const Address &spender, Amount amount, OperationJournal &journal);

        [[nodiscard]] Amount BalanceOf(const AssetType &asset) const;

        [[nodiscard]] const Address &Holder() const noexcept;

        [[nodiscard]] IAssetLedger &Ledger() const noexcept;

    private:
        [[nodiscard]] Result<Unit, RelayFailure> Move(
            const AssetType &asset, const Address &from, const Address &to, Amount amount,
            std::string_view step, OperationJournal &journal);

        std::shared_ptr<IAssetLedger> ledger_;
        Address holder_;
    };
}
