#pragma once
#include "crosslane/core/result.hpp"
#include "crosslane/core/failures.hpp"
#include "crosslane/core/types.hpp"
#include "crosslane/state/operation_journal.hpp"
#include <map>
#include <utility>

namespace crosslane::relay::fees {
    using state::OperationJournal;

    // Per-caller accounting of contributions to the prefunded reserve, kept
    // per fee asset. Only consulted when the node is configured with fee escrow.
    class FeeEscrow {
    public:
        FeeEscrow() = default;

        FeeEscrow(const FeeEscrow &) = delete;

        FeeEscrow &operator=(const FeeEscrow &) = delete;

        [[nodiscard]] Result<Unit, RelayFailure> Credit(
            const Address &caller, const AssetType &asset, Amount amount, OperationJournal &journal);

        [[nodiscard]] Result<Unit, RelayFailure> Debit(
            const Address &caller, const AssetType &asset, Amount amount, OperationJournal &journal);

        // Drops every credit denominated in `asset`; the reserve backing them is gone.
        void Forfeit(const AssetType &asset, OperationJournal &journal);

        [[nodiscard]] Amount CreditOf(const Address &caller, const AssetType &asset) const;

    private:
        using Key = std::pair<std::string, std::string>;

        void Restore(const Key &key, Amount previous);

        std::map<Key, Amount> credits_;
    };
}
