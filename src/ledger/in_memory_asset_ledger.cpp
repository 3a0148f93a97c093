#include "crosslane/ledger/in_memory_asset_ledger.hpp"
#include "crosslane/core/constants.hpp"
#include "crosslane/core/format.hpp"

namespace crosslane::relay::ledger {
    Result<Unit, RelayFailure> InMemoryAssetLedger::Mint(const AssetType &asset, const Address &to,
                                                         const Amount amount) {
        if (asset.IsNull() || to.IsNull()) {
            return Result<Unit, RelayFailure>::Err(
                RelayFailure::InvalidInput("Mint requires an asset and a holder"));
        }
        std::lock_guard guard(lock_);
        Amount &balance = balances_[{asset.value, to.value}];
        Amount &supply = supply_[asset.value];
        const auto new_balance = CheckedAdd(balance, amount);
        const auto new_supply = CheckedAdd(supply, amount);
        if (!new_balance.has_value() || !new_supply.has_value()) {
            return Result<Unit, RelayFailure>::Err(
                RelayFailure::TransferFailed(
                    compat::format("{}: minting {} {}", ErrorMessages::AMOUNT_OVERFLOW, amount, asset.value)));
        }
        balance = *new_balance;
        supply = *new_supply;
        return Result<Unit, RelayFailure>::Ok(unit);
    }

    Amount InMemoryAssetLedger::BalanceOf(const AssetType &asset, const Address &holder) const {
        std::lock_guard guard(lock_);
        const auto it = balances_.find({asset.value, holder.value});
        return it == balances_.end() ? RelayConstants::ZERO_AMOUNT : it->second;
    }

    Amount InMemoryAssetLedger::Allowance(const AssetType &asset, const Address &owner,
                                          const Address &spender) const {
        std::lock_guard guard(lock_);
        const auto it = allowances_.find({asset.value, owner.value, spender.value});
        return it == allowances_.end() ? RelayConstants::ZERO_AMOUNT : it->second;
    }

    Result<Unit, RelayFailure> InMemoryAssetLedger::Transfer(const AssetType &asset, const Address &from,
                                                             const Address &to, const Amount amount) {
        {
            std::lock_guard guard(lock_);
            CROSSLANE_TRY(MoveLocked(asset, from, to, amount));
        }
        Notify(TransferRecord{asset, from, to, amount});
        return Result<Unit, RelayFailure>::Ok(unit);
    }

    Result<Unit, RelayFailure> InMemoryAssetLedger::TransferFrom(const AssetType &asset, const Address &spender,
                                                                 const Address &from, const Address &to,
                                                                 const Amount amount) {
        {
            std::lock_guard guard(lock_);
            const auto key = AllowanceKey{asset.value, from.value, spender.value};
            const auto it = allowances_.find(key);
            const Amount allowed = it == allowances_.end() ? RelayConstants::ZERO_AMOUNT : it->second;
            if (allowed < amount) {
                return Result<Unit, RelayFailure>::Err(
                    RelayFailure::TransferFailed(
                        compat::format("Allowance of {} for {} on {} {} is below {}",
                                       spender.value, from.value, allowed, asset.value, amount)));
            }
            CROSSLANE_TRY(MoveLocked(asset, from, to, amount));
            allowances_[key] = allowed - amount;
        }
        Notify(TransferRecord{asset, from, to, amount});
        return Result<Unit, RelayFailure>::Ok(unit);
    }

    Result<Unit, RelayFailure> InMemoryAssetLedger::Approve(const AssetType &asset, const Address &owner,
                                                            const Address &spender, const Amount amount) {
        if (asset.IsNull() || owner.IsNull() || spender.IsNull()) {
            return Result<Unit, RelayFailure>::Err(
                RelayFailure::InvalidInput("Approve requires an asset, an owner and a spender"));
        }
        std::lock_guard guard(lock_);
        allowances_[{asset.value, owner.value, spender.value}] = amount;
        return Result<Unit, RelayFailure>::Ok(unit);
    }

    Amount InMemoryAssetLedger::TotalSupply(const AssetType &asset) const {
        std::lock_guard guard(lock_);
        const auto it = supply_.find(asset.value);
        return it == supply_.end() ? RelayConstants::ZERO_AMOUNT : it->second;
    }

    void InMemoryAssetLedger::FailTransfersOf(const AssetType &asset, const bool fail) {
        std::lock_guard guard(lock_);
        if (fail) {
            failing_assets_.insert(asset.value);
        } else {
            failing_assets_.erase(asset.value);
        }
    }

    void InMemoryAssetLedger::SetTransferHook(TransferHook hook) {
        std::lock_guard guard(lock_);
        hook_ = std::move(hook);
    }

    Result<Unit, RelayFailure> InMemoryAssetLedger::MoveLocked(const AssetType &asset, const Address &from,
                                                               const Address &to, const Amount amount) {
        if (asset.IsNull() || from.IsNull() || to.IsNull()) {
            return Result<Unit, RelayFailure>::Err(
                RelayFailure::TransferFailed("Transfer requires an asset, a sender and a recipient"));
        }
        if (failing_assets_.contains(asset.value)) {
            return Result<Unit, RelayFailure>::Err(
                RelayFailure::TransferFailed(compat::format("Transfers of {} are halted", asset.value)));
        }
        const Amount from_balance = balances_[{asset.value, from.value}];
        if (from_balance < amount) {
            return Result<Unit, RelayFailure>::Err(
                RelayFailure::TransferFailed(
                    compat::format("{} holds {} {}, cannot move {}",
                                   from.value, from_balance, asset.value, amount)));
        }
        if (from == to) {
            return Result<Unit, RelayFailure>::Ok(unit);
        }
        const auto to_balance = CheckedAdd(balances_[{asset.value, to.value}], amount);
        if (!to_balance.has_value()) {
            return Result<Unit, RelayFailure>::Err(
                RelayFailure::TransferFailed(
                    compat::format("{}: crediting {} {} to {}",
                                   ErrorMessages::AMOUNT_OVERFLOW, amount, asset.value, to.value)));
        }
        balances_[{asset.value, from.value}] = from_balance - amount;
        balances_[{asset.value, to.value}] = *to_balance;
        return Result<Unit, RelayFailure>::Ok(unit);
    }

    void InMemoryAssetLedger::Notify(const TransferRecord &record) const {
        TransferHook hook;
        {
            std::lock_guard guard(lock_);
            hook = hook_;
        }
        if (hook) {
            hook(record);
        }
    }
}
