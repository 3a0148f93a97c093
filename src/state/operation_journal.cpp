#include "crosslane/state/operation_journal.hpp"
#include "crosslane/observability/logging.hpp"
#include "crosslane/core/format.hpp"
#include <optional>

namespace crosslane::relay::state {
    using observability::StringField;

    OperationJournal::OperationJournal(const std::string_view operation)
        : operation_(operation) {
    }

    OperationJournal::~OperationJournal() {
        if (open_) {
            // Failed steps are logged by Rollback.
            static_cast<void>(Rollback());
        }
    }

    void OperationJournal::Record(const std::string_view description, Compensation compensation) {
        entries_.push_back(Entry{std::string(description), std::move(compensation)});
    }

    void OperationJournal::Defer(DeferredEvent event) {
        events_.push_back(std::move(event));
    }

    void OperationJournal::KeepEffectsOnFailure() noexcept {
        keep_effects_on_failure_ = true;
    }

    bool OperationJournal::KeepsEffectsOnFailure() const noexcept {
        return keep_effects_on_failure_;
    }

    std::vector<OperationJournal::DeferredEvent> OperationJournal::Commit() {
        if (!open_) {
            return {};
        }
        open_ = false;
        entries_.clear();
        auto events = std::move(events_);
        events_.clear();
        return events;
    }

    void OperationJournal::Commit(IRelayEventHandler *handler) {
        Publish(Commit(), handler);
    }

    void OperationJournal::Publish(const std::vector<DeferredEvent> &events, IRelayEventHandler *handler) {
        if (handler == nullptr) {
            return;
        }
        for (const auto &event: events) {
            event(*handler);
        }
    }

    Result<Unit, RelayFailure> OperationJournal::Rollback() {
        if (!open_) {
            return Result<Unit, RelayFailure>::Ok(unit);
        }
        open_ = false;
        events_.clear();
        std::optional<RelayFailure> first_failure;
        for (auto it = entries_.rbegin(); it != entries_.rend(); ++it) {
            if (auto undo = it->compensation(); undo.IsErr()) {
                CROSSLANE_LOG_ERROR("Compensation failed during rollback", {
                    StringField("operation", operation_),
                    StringField("step", it->description),
                    StringField("error", undo.UnwrapErr().message)
                });
                if (!first_failure) {
                    first_failure = RelayFailure::TransferFailed(compat::format(
                        "Rollback of {} could not undo {}: {}", operation_, it->description,
                        undo.UnwrapErr().message));
                }
            }
        }
        entries_.clear();
        if (first_failure) {
            return Result<Unit, RelayFailure>::Err(std::move(*first_failure));
        }
        return Result<Unit, RelayFailure>::Ok(unit);
    }

    bool OperationJournal::IsOpen() const noexcept {
        return open_;
    }

    size_t OperationJournal::PendingCompensations() const noexcept {
        return entries_.size();
    }

    const std::string &OperationJournal::Operation() const noexcept {
        return operation_;
    }
}
