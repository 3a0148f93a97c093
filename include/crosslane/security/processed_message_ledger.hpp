#pragma once
#include "crosslane/core/result.hpp"
#include "crosslane/core/failures.hpp"
#include "crosslane/core/types.hpp"
#include "crosslane/state/operation_journal.hpp"
#include <mutex>
#include <unordered_set>

namespace crosslane::relay::security {
    using state::OperationJournal;

    /**
     * @brief Append-only set of delivered message ids
     *
     * Sole replay protection of the inbound path. There is no expiry or
     * eviction: storage grows with all-time inbound volume. A mark made by an
     * operation that later rolls back was never committed and is withdrawn
     * with it; a committed mark is permanent.
     */
    class ProcessedMessageLedger {
    public:
        ProcessedMessageLedger() = default;

        ProcessedMessageLedger(const ProcessedMessageLedger &) = delete;

        ProcessedMessageLedger &operator=(const ProcessedMessageLedger &) = delete;

        ProcessedMessageLedger(ProcessedMessageLedger &&) = delete;

        ProcessedMessageLedger &operator=(ProcessedMessageLedger &&) = delete;

        ~ProcessedMessageLedger() = default;

        [[nodiscard]] bool HasProcessed(const MessageId &id) const;

        // No-op when already present.
        void MarkProcessed(const MessageId &id, OperationJournal &journal);

        // Fails ReplayedMessage without touching state when already present.
        [[nodiscard]] Result<Unit, RelayFailure> CheckAndMark(const MessageId &id, OperationJournal &journal);

        [[nodiscard]] size_t Size() const;

    private:
        void Withdraw(const MessageId &id);

        mutable std::mutex lock_;
        std::unordered_set<MessageId, MessageId::Hash> processed_;
    };
}
