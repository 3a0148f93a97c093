#pragma once
#include "crosslane/core/result.hpp"
#include "crosslane/core/failures.hpp"
#include "crosslane/core/types.hpp"
namespace crosslane::relay::interfaces {
using relay::Result;
using relay::Unit;
using relay::RelayFailure;
// Fungible asset ledger of one network. Every mutation reports success or
// failure explicitly; a failed call leaves balances and allowances unchanged.
class IAssetLedger {
public:
    virtual ~IAssetLedger() = default;
    [[nodiscard]] virtual Amount BalanceOf(const AssetType& asset, const Address& holder) const = 0;
    [[nodiscard]] virtual Amount Allowance(
        const AssetType& asset, const Address& owner, const Address& spender) const = 0;
    [[nodiscard]] virtual Result<Unit, RelayFailure> Transfer(
        const AssetType& asset, const Address& from, const Address& to, Amount amount) = 0;
    [[nodiscard]] virtual Result<Unit, RelayFailure> TransferFrom(
        const AssetType& asset, const Address& spender, const Address& from, const Address& to, Amount amount) = 0;
    [[nodiscard]] virtual Result<Unit, RelayFailure> Approve(
        const AssetType& asset, const Address& owner, const Address& spender, Amount amount) = 0;
};
}
