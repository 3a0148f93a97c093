#pragma once
#include "crosslane/core/result.hpp"
#include "crosslane/core/failures.hpp"
#include "crosslane/core/types.hpp"
#include "crosslane/interfaces/i_asset_ledger.hpp"
#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <tuple>

namespace crosslane::relay::ledger {
    using interfaces::IAssetLedger;

    struct TransferRecord {
        AssetType asset;
        Address from;
        Address to;
        Amount amount = 0;
    };

    /**
     * @brief In-process fungible asset ledger for one simulated network
     *
     * Balances and allowances keyed by (asset, holder). Every mutation is
     * overflow-checked and either applies completely or reports failure.
     *
     * The transfer hook runs after a successful transfer with the ledger lock
     * released, so it may call back into anything holding custody here.
     */
    class InMemoryAssetLedger final : public IAssetLedger {
    public:
        using TransferHook = std::function<void(const TransferRecord &)>;

        InMemoryAssetLedger() = default;

        InMemoryAssetLedger(const InMemoryAssetLedger &) = delete;

        InMemoryAssetLedger &operator=(const InMemoryAssetLedger &) = delete;

        [[nodiscard]] Result<Unit, RelayFailure> Mint(const AssetType &asset, const Address &to, Amount amount);

        [[nodiscard]] Amount BalanceOf(const AssetType &asset, const Address &holder) const override;

        [[nodiscard]] Amount Allowance(
            const AssetType &asset, const Address &owner, const Address &spender) const override;

        [[nodiscard]] Result<Unit, RelayFailure> Transfer(
            const AssetType &asset, const Address &from, const Address &to, Amount amount) override;

        [[nodiscard]] Result<Unit, RelayFailure> TransferFrom(
            const AssetType &asset, const Address &spender, const Address &from, const Address &to,
            Amount amount) override;

        [[nodiscard]] Result<Unit, RelayFailure> Approve(
            const AssetType &asset, const Address &owner, const Address &spender, Amount amount) override;

        [[nodiscard]] Amount TotalSupply(const AssetType &asset) const;

        // Makes every transfer of `asset` report failure until cleared.
        void FailTransfersOf(const AssetType &asset, bool fail = true);

        void SetTransferHook(TransferHook hook);

    private:
        using HolderKey = std::tuple<std::string, std::string>;
        using AllowanceKey = std::tuple<std::string, std::string, std::string>;

        [[nodiscard]] Result<Unit, RelayFailure> MoveLocked(
            const AssetType &asset, const Address &from, const Address &to, Amount amount);

        void Notify(const TransferRecord &record) const;

        mutable std::mutex lock_;
        std::map<HolderKey, Amount> balances_;
        std::map<AllowanceKey, Amount> allowances_;
        std::map<std::string, Amount> supply_;
        std::set<std::string> failing_assets_;
        TransferHook hook_;
    };
}
