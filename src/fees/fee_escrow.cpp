#include "crosslane/fees/fee_escrow.hpp"
#include "crosslane/core/constants.hpp"
#include "crosslane/core/format.hpp"

namespace crosslane::relay::fees {
    Result<Unit, RelayFailure> FeeEscrow::Credit(const Address &caller, const AssetType &asset,
                                                 const Amount amount, OperationJournal &journal) {
        const Amount previous = CreditOf(caller, asset);
        const auto updated = CheckedAdd(previous, amount);
        if (!updated.has_value()) {
            return Result<Unit, RelayFailure>::Err(
                RelayFailure::InvalidAmount(std::string(ErrorMessages::AMOUNT_OVERFLOW)));
        }
        Key key{caller.value, asset.value};
        credits_[key] = *updated;
        journal.Record("escrow credit", [this, key, previous]() {
            Restore(key, previous);
            return Result<Unit, RelayFailure>::Ok(unit);
        });
        return Result<Unit, RelayFailure>::Ok(unit);
    }

    Result<Unit, RelayFailure> FeeEscrow::Debit(const Address &caller, const AssetType &asset,
                                                const Amount amount, OperationJournal &journal) {
        const Amount previous = CreditOf(caller, asset);
        if (previous < amount) {
            return Result<Unit, RelayFailure>::Err(
                RelayFailure::InsufficientFeeBalance(
                    compat::format("Fee escrow of {} holds {} {}, quote is {}",
                                   caller.value, previous, asset.value, amount)));
        }
        Key key{caller.value, asset.value};
        credits_[key] = previous - amount;
        journal.Record("escrow debit", [this, key, previous]() {
            Restore(key, previous);
            return Result<Unit, RelayFailure>::Ok(unit);
        });
        return Result<Unit, RelayFailure>::Ok(unit);
    }

    void FeeEscrow::Forfeit(const AssetType &asset, OperationJournal &journal) {
        std::map<Key, Amount> forfeited;
        for (auto it = credits_.begin(); it != credits_.end();) {
            if (it->first.second == asset.value) {
                forfeited.insert(*it);
                it = credits_.erase(it);
            } else {
                ++it;
            }
        }
        if (forfeited.empty()) {
            return;
        }
        journal.Record("escrow forfeit", [this, forfeited = std::move(forfeited)]() {
            credits_.insert(forfeited.begin(), forfeited.end());
            return Result<Unit, RelayFailure>::Ok(unit);
        });
    }

    Amount FeeEscrow::CreditOf(const Address &caller, const AssetType &asset) const {
        const auto it = credits_.find(Key{caller.value, asset.value});
        return it == credits_.end() ? RelayConstants::ZERO_AMOUNT : it->second;
    }

    void FeeEscrow::Restore(const Key &key, const Amount previous) {
        if (previous == RelayConstants::ZERO_AMOUNT) {
            credits_.erase(key);
        } else {
            credits_[key] = previous;
        }
    }
}
