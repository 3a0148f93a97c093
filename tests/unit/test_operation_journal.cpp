#include <catch2/catch_test_macros.hpp>
#include "crosslane/state/operation_gate.hpp"
#include "crosslane/state/operation_journal.hpp"
#include "helpers/recording_event_handler.hpp"
#include <functional>
#include <future>
#include <memory>
#include <string>
#include <vector>

using namespace crosslane::relay;
using namespace crosslane::relay::state;
using crosslane::relay::test_helpers::RecordingEventHandler;

namespace {
OperationJournal::DeferredEvent TransportChanged() {
    return [](IRelayEventHandler& handler) { handler.OnTransportChanged(); };
}

class CallbackEventHandler final : public RecordingEventHandler {
public:
    explicit CallbackEventHandler(std::function<int()> on_transport_changed)
        : on_transport_changed_(std::move(on_transport_changed)) {
    }

    void OnTransportChanged() override {
        RecordingEventHandler::OnTransportChanged();
        observed.push_back(on_transport_changed_());
    }

    std::vector<int> observed;

private:
    std::function<int()> on_transport_changed_;
};
}

TEST_CASE("OperationJournal - Rollback", "[journal][state]") {
    SECTION("Compensations run newest first") {
        std::vector<std::string> order;
        OperationJournal journal("test");
        journal.Record("first", [&order]() {
            order.emplace_back("first");
            return Result<Unit, RelayFailure>::Ok(unit);
        });
        journal.Record("second", [&order]() {
            order.emplace_back("second");
            return Result<Unit, RelayFailure>::Ok(unit);
        });
        REQUIRE(journal.PendingCompensations() == 2);
        REQUIRE(journal.Rollback().IsOk());
        REQUIRE(order == std::vector<std::string>{"second", "first"});
        REQUIRE_FALSE(journal.IsOpen());
    }

    SECTION("Queued events are dropped on rollback") {
        RecordingEventHandler handler;
        OperationJournal journal("test");
        journal.Defer(TransportChanged());
        REQUIRE(journal.Rollback().IsOk());
        journal.Commit(&handler);
        REQUIRE(handler.transport_changes == 0);
    }

    SECTION("A failing compensation does not stop the others") {
        int undone = 0;
        OperationJournal journal("test");
        journal.Record("ok", [&undone]() {
            ++undone;
            return Result<Unit, RelayFailure>::Ok(unit);
        });
        journal.Record("broken", []() {
            return Result<Unit, RelayFailure>::Err(RelayFailure::TransferFailed("stuck"));
        });
        auto rollback = journal.Rollback();
        REQUIRE(undone == 1);
        REQUIRE(rollback.IsErr());
        REQUIRE(rollback.UnwrapErr().Is(RelayFailureType::TransferFailed));
        REQUIRE(rollback.UnwrapErr().message.find("broken") != std::string::npos);
        REQUIRE(rollback.UnwrapErr().message.find("stuck") != std::string::npos);
        REQUIRE_FALSE(journal.IsOpen());
    }

    SECTION("The first step that could not be undone is reported") {
        OperationJournal journal("test");
        journal.Record("older", []() {
            return Result<Unit, RelayFailure>::Err(RelayFailure::TransferFailed("older stuck"));
        });
        journal.Record("newer", []() {
            return Result<Unit, RelayFailure>::Err(RelayFailure::TransferFailed("newer stuck"));
        });
        auto rollback = journal.Rollback();
        REQUIRE(rollback.IsErr());
        REQUIRE(rollback.UnwrapErr().message.find("newer stuck") != std::string::npos);
        REQUIRE(rollback.UnwrapErr().message.find("older stuck") == std::string::npos);
    }

    SECTION("Rolling back a closed journal does nothing") {
        int undone = 0;
        OperationJournal journal("test");
        journal.Record("count", [&undone]() {
            ++undone;
            return Result<Unit, RelayFailure>::Ok(unit);
        });
        REQUIRE(journal.Rollback().IsOk());
        REQUIRE(journal.Rollback().IsOk());
        REQUIRE(undone == 1);
    }

    SECTION("Destroying an open journal rolls back") {
        bool undone = false;
        {
            OperationJournal journal("test");
            journal.Record("flag", [&undone]() {
                undone = true;
                return Result<Unit, RelayFailure>::Ok(unit);
            });
        }
        REQUIRE(undone);
    }
}

TEST_CASE("OperationJournal - Commit", "[journal][state]") {
    SECTION("Commit delivers events in order and forgets compensations") {
        RecordingEventHandler handler;
        bool undone = false;
        {
            OperationJournal journal("test");
            journal.Record("flag", [&undone]() {
                undone = true;
                return Result<Unit, RelayFailure>::Ok(unit);
            });
            journal.Defer([](IRelayEventHandler& h) { h.OnFeeAssetChanged(AssetType{"A"}, AssetType{"B"}); });
            journal.Defer([](IRelayEventHandler& h) { h.OnFeeAssetChanged(AssetType{"B"}, AssetType{"C"}); });
            journal.Commit(&handler);
            REQUIRE(journal.PendingCompensations() == 0);
        }
        REQUIRE_FALSE(undone);
        REQUIRE(handler.fee_asset_changes.size() == 2);
        REQUIRE(handler.fee_asset_changes[0].second.value == "B");
        REQUIRE(handler.fee_asset_changes[1].second.value == "C");
    }

    SECTION("Commit can hand the events back undelivered") {
        RecordingEventHandler handler;
        OperationJournal journal("test");
        journal.Defer(TransportChanged());
        journal.Defer(TransportChanged());
        const auto events = journal.Commit();
        REQUIRE_FALSE(journal.IsOpen());
        REQUIRE(events.size() == 2);
        REQUIRE(handler.transport_changes == 0);
        OperationJournal::Publish(events, &handler);
        REQUIRE(handler.transport_changes == 2);
    }

    SECTION("Commit without a handler is allowed") {
        OperationJournal journal("test");
        journal.Defer(TransportChanged());
        journal.Commit(nullptr);
        REQUIRE_FALSE(journal.IsOpen());
    }
}

TEST_CASE("OperationGate - All-or-nothing operations", "[journal][state]") {
    OperationGate gate;
    auto handler = std::make_shared<RecordingEventHandler>();
    gate.SetEventHandler(handler);
    int value = 0;

    auto set_value = [&value](OperationJournal& journal, const int next) {
        const int previous = value;
        value = next;
        journal.Record("value", [&value, previous]() {
            value = previous;
            return Result<Unit, RelayFailure>::Ok(unit);
        });
        journal.Defer(TransportChanged());
    };

    SECTION("Ok commits state and events") {
        auto result = gate.Run<int>("op", [&](OperationJournal& journal) {
            set_value(journal, 5);
            return Result<int, RelayFailure>::Ok(value);
        });
        REQUIRE(result.Unwrap() == 5);
        REQUIRE(value == 5);
        REQUIRE(handler->transport_changes == 1);
    }

    SECTION("Err rolls back state and drops events") {
        auto result = gate.Run<int>("op", [&](OperationJournal& journal) {
            set_value(journal, 5);
            return Result<int, RelayFailure>::Err(RelayFailure::InvalidInput("no"));
        });
        REQUIRE(result.IsErr());
        REQUIRE(value == 0);
        REQUIRE(handler->transport_changes == 0);
    }

    SECTION("Err with kept effects commits state and events") {
        auto result = gate.Run<Unit>("op", [&](OperationJournal& journal) {
            set_value(journal, 7);
            journal.KeepEffectsOnFailure();
            return Result<Unit, RelayFailure>::Err(RelayFailure::DecodeFailed("bad"));
        });
        REQUIRE(result.IsErr());
        REQUIRE(value == 7);
        REQUIRE(handler->transport_changes == 1);
    }

    SECTION("Failed rollback is reported with the step it could not undo") {
        auto result = gate.Run<Unit>("op", [&](OperationJournal& journal) {
            set_value(journal, 3);
            journal.Record("ledger refund", []() {
                return Result<Unit, RelayFailure>::Err(RelayFailure::TransferFailed("asset halted"));
            });
            return Result<Unit, RelayFailure>::Err(RelayFailure::InvalidInput("no"));
        });
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().Is(RelayFailureType::TransferFailed));
        REQUIRE(result.UnwrapErr().message.find("ledger refund") != std::string::npos);
        REQUIRE(result.UnwrapErr().message.find("asset halted") != std::string::npos);
        REQUIRE(result.UnwrapErr().message.find("no") != std::string::npos);
        REQUIRE(value == 0);
        REQUIRE(handler->transport_changes == 0);
    }

    SECTION("Events are delivered after the gate is released") {
        auto other_thread_reader = std::make_shared<CallbackEventHandler>([&gate, &value]() {
            return std::async(std::launch::async, [&gate, &value]() {
                return gate.Read([&value]() { return value; });
            }).get();
        });
        gate.SetEventHandler(other_thread_reader);
        auto result = gate.Run<Unit>("op", [&](OperationJournal& journal) {
            set_value(journal, 9);
            return Result<Unit, RelayFailure>::Ok(unit);
        });
        REQUIRE(result.IsOk());
        REQUIRE(other_thread_reader->observed == std::vector<int>{9});
    }

    SECTION("Nested operations commit independently") {
        auto outer = gate.Run<Unit>("outer", [&](OperationJournal& journal) {
            set_value(journal, 1);
            auto inner = gate.Run<Unit>("inner", [&](OperationJournal& nested) {
                set_value(nested, 2);
                return Result<Unit, RelayFailure>::Ok(unit);
            });
            REQUIRE(inner.IsOk());
            return Result<Unit, RelayFailure>::Err(RelayFailure::InvalidInput("outer fails"));
        });
        REQUIRE(outer.IsErr());
        REQUIRE(value == 0);
        REQUIRE(handler->transport_changes == 1);
    }
}
