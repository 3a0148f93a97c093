#include "crosslane/security/processed_message_ledger.hpp"
#include "crosslane/core/constants.hpp"
#include "crosslane/core/format.hpp"

namespace crosslane::relay::security {
    bool ProcessedMessageLedger::HasProcessed(const MessageId &id) const {
        std::lock_guard guard(lock_);
        return processed_.contains(id);
    }

    void ProcessedMessageLedger::MarkProcessed(const MessageId &id, OperationJournal &journal) {
        {
            std::lock_guard guard(lock_);
            if (const auto [it, inserted] = processed_.insert(id); !inserted) {
                return;
            }
        }
        journal.Record("mark processed", [this, id]() {
            Withdraw(id);
            return Result<Unit, RelayFailure>::Ok(unit);
        });
    }

    Result<Unit, RelayFailure> ProcessedMessageLedger::CheckAndMark(const MessageId &id, OperationJournal &journal) {
        if (HasProcessed(id)) {
            return Result<Unit, RelayFailure>::Err(
                RelayFailure::ReplayedMessage(
                    compat::format("{}: {}", ErrorMessages::ALREADY_PROCESSED, id.ToHex())));
        }
        MarkProcessed(id, journal);
        return Result<Unit, RelayFailure>::Ok(unit);
    }

    size_t ProcessedMessageLedger::Size() const {
        std::lock_guard guard(lock_);
        return processed_.size();
    }

    void ProcessedMessageLedger::Withdraw(const MessageId &id) {
        std::lock_guard guard(lock_);
        processed_.erase(id);
    }
}
