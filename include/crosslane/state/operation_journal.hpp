#pragma once
#include "crosslane/core/result.hpp"
#include "crosslane/core/failures.hpp"
#include "crosslane/interfaces/i_relay_event_handler.hpp"
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace crosslane::relay::state {
    using relay::Result;
    using relay::Unit;
    using relay::RelayFailure;

    /**
     * @brief Undo log and deferred event queue of one public operation
     *
     * Every state change made on behalf of an operation records a
     * compensation. Rollback runs the compensations newest first and drops the
     * queued events; Commit forgets the compensations and releases the events.
     * A journal destroyed while still open rolls back.
     */
    class OperationJournal {
    public:
        using Compensation = std::function<Result<Unit, RelayFailure>()>;
        using DeferredEvent = std::function<void(IRelayEventHandler &)>;

        explicit OperationJournal(std::string_view operation);

        OperationJournal(const OperationJournal &) = delete;

        OperationJournal &operator=(const OperationJournal &) = delete;

        OperationJournal(OperationJournal &&) = delete;

        OperationJournal &operator=(OperationJournal &&) = delete;

        ~OperationJournal();

        void Record(std::string_view description, Compensation compensation);

        void Defer(DeferredEvent event);

        // Effects recorded so far survive even if the operation reports failure.
        void KeepEffectsOnFailure() noexcept;

        [[nodiscard]] bool KeepsEffectsOnFailure() const noexcept;

        // Closes the journal and returns the queued events without delivering them.
        [[nodiscard]] std::vector<DeferredEvent> Commit();

        void Commit(IRelayEventHandler *handler);

        /**
         * Every compensation runs even after one fails. The first failure in
         * rollback order is returned as TransferFailed naming its step.
         */
        [[nodiscard]] Result<Unit, RelayFailure> Rollback();

        static void Publish(const std::vector<DeferredEvent> &events, IRelayEventHandler *handler);

        [[nodiscard]] bool IsOpen() const noexcept;

        [[nodiscard]] size_t PendingCompensations() const noexcept;

        [[nodiscard]] const std::string &Operation() const noexcept;

    private:
        struct Entry {
            std::string description;
            Compensation compensation;
        };

        std::string operation_;
        std::vector<Entry> entries_;
        std::vector<DeferredEvent> events_;
        bool keep_effects_on_failure_ = false;
        bool open_ = true;
    };
}
