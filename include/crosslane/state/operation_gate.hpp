#pragma once
#include "crosslane/core/result.hpp"
#include "crosslane/core/failures.hpp"
#include "crosslane/core/format.hpp"
#include "crosslane/state/operation_journal.hpp"
#include "crosslane/interfaces/i_relay_event_handler.hpp"
#include <memory>
#include <mutex>
#include <string_view>
#include <utility>

namespace crosslane::relay::state {
    // Runs each public operation of a node as one serialized, all-or-nothing
    // unit. The mutex is recursive so a call re-entering the node from inside
    // an asset transfer runs as its own nested operation. Events of a committed
    // operation reach the handler after the gate is released, so a handler may
    // call back into the node from any thread.
    class OperationGate {
    public:
        OperationGate() = default;

        OperationGate(const OperationGate &) = delete;

        OperationGate &operator=(const OperationGate &) = delete;

        void SetEventHandler(std::shared_ptr<IRelayEventHandler> handler) {
            std::lock_guard guard(mutex_);
            event_handler_ = std::move(handler);
        }

        template<typename T, typename Body>
        [[nodiscard]] Result<T, RelayFailure> Run(const std::string_view operation, Body &&body) {
            std::unique_lock guard(mutex_);
            OperationJournal journal(operation);
            Result<T, RelayFailure> result = std::forward<Body>(body)(journal);
            if (result.IsOk() || journal.KeepsEffectsOnFailure()) {
                const auto events = journal.Commit();
                const auto handler = event_handler_;
                guard.unlock();
                OperationJournal::Publish(events, handler.get());
                return result;
            }
            if (auto undone = journal.Rollback(); undone.IsErr()) {
                return Result<T, RelayFailure>::Err(RelayFailure::TransferFailed(compat::format(
                    "{} (operation failed with: {})", undone.UnwrapErr().message, result.UnwrapErr().message)));
            }
            return result;
        }

        template<typename Reader>
        [[nodiscard]] auto Read(Reader &&reader) const {
            std::lock_guard guard(mutex_);
            return std::forward<Reader>(reader)();
        }

    private:
        mutable std::recursive_mutex mutex_;
        std::shared_ptr<IRelayEventHandler> event_handler_;
    };
}
