#include "crosslane/custody/custody.hpp"
#include "crosslane/core/format.hpp"

namespace crosslane::relay::custody {
    Custody::Custody(std::shared_ptr<IAssetLedger> ledger, Address holder)
        : ledger_(std::move(ledger))
          , holder_(std::move(holder)) {
    }

    Result<Unit, RelayFailure> Custody::TransferIn(const AssetType &asset, const Address &from,
                                                   const Amount amount, OperationJournal &journal) {
        const Amount previous_allowance = ledger_->Allowance(asset, from, holder_);
        if (auto pulled = ledger_->TransferFrom(asset, holder_, from, holder_, amount); pulled.IsErr()) {
            return Result<Unit, RelayFailure>::Err(
                RelayFailure::TransferFailed(
                    compat::format("Transfer-in of {} {} from {} failed: {}",
                                   amount, asset.value, from.value, pulled.UnwrapErr().message)));
        }
        journal.Record("custody transfer-in", [ledger = ledger_, asset, from, holder = holder_, amount,
                           previous_allowance]() -> Result<Unit, RelayFailure> {
            if (auto back = ledger->Transfer(asset, holder, from, amount); back.IsErr()) {
                return back;
            }
            return ledger->Approve(asset, from, holder, previous_allowance);
        });
        return Result<Unit, RelayFailure>::Ok(unit);
    }

    Result<Unit, RelayFailure> Custody::AcceptAttached(const AssetType &asset, const Address &from,
                                                       const Amount amount, OperationJournal &journal) {
        return Move(asset, from, holder_, amount, "attached payment", journal);
    }

    Result<Unit, RelayFailure> Custody::TransferOut(const AssetType &asset, const Address &to,
                                                    const Amount amount, OperationJournal &journal) {
        return Move(asset, holder_, to, amount, "custody transfer-out", journal);
    }

    Result<Unit, RelayFailure> Custody::Authorize(const AssetType &asset, const Address &spender,
                                                  const Amount amount, OperationJournal &journal) {
        const Amount previous = ledger_->Allowance(asset, holder_, spender);
        if (auto approved = ledger_->Approve(asset, holder_, spender, amount); approved.IsErr()) {
            return approved;
        }
        journal.Record("authorize", [ledger = ledger_, asset, holder = holder_, spender, previous]() {
            return ledger->Approve(asset, holder, spender, previous);
        });
        return Result<Unit, RelayFailure>::Ok(unit);
    }

    Amount Custody::BalanceOf(const AssetType &asset) const {
        return ledger_->BalanceOf(asset, holder_);
    }

    const Address &Custody::Holder() const noexcept {
        return holder_;
    }

    IAssetLedger &Custody::Ledger() const noexcept {
        return *ledger_;
    }

    Result<Unit, RelayFailure> Custody::Move(const AssetType &asset, const Address &from, const Address &to,
                                             const Amount amount, const std::string_view step,
                                             OperationJournal &journal) {
        if (auto moved = ledger_->Transfer(asset, from, to, amount); moved.IsErr()) {
            return Result<Unit, RelayFailure>::Err(
                RelayFailure::TransferFailed(
                    compat::format("{} of {} {} from {} to {} failed: {}",
                                   step, amount, asset.value, from.value, to.value,
                                   moved.UnwrapErr().message)));
        }
        journal.Record(step, [ledger = ledger_, asset, from, to, amount]() {
            return ledger->Transfer(asset, to, from, amount);
        });
        return Result<Unit, RelayFailure>::Ok(unit);
    }
}
