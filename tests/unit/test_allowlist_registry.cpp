#include <catch2/catch_test_macros.hpp>
#include "crosslane/registry/allowlist_registry.hpp"
#include "helpers/recording_event_handler.hpp"

using namespace crosslane::relay;
using namespace crosslane::relay::registry;
using crosslane::relay::state::OperationJournal;
using crosslane::relay::test_helpers::RecordingEventHandler;

TEST_CASE("AllowlistRegistry - Default deny", "[allowlist][security]") {
    AllowlistRegistry registry;
    REQUIRE_FALSE(registry.IsDestinationAllowed(NetworkId{1}));
    REQUIRE_FALSE(registry.IsSourceAllowed(NetworkId{1}));
    REQUIRE_FALSE(registry.IsAssetAllowed(AssetType{"USDC"}));
    REQUIRE_FALSE(registry.IsSenderAllowed(Address{"relay-a"}));
    REQUIRE(registry.Size(AllowlistKind::Asset) == 0);
}

TEST_CASE("AllowlistRegistry - Mutations", "[allowlist]") {
    AllowlistRegistry registry;
    RecordingEventHandler handler;

    SECTION("The four sets are independent") {
        OperationJournal journal("allow");
        registry.SetDestinationAllowed(NetworkId{7}, true, journal);
        journal.Commit(&handler);
        REQUIRE(registry.IsDestinationAllowed(NetworkId{7}));
        REQUIRE_FALSE(registry.IsSourceAllowed(NetworkId{7}));
    }

    SECTION("Committed change emits one event per call") {
        OperationJournal journal("allow");
        registry.SetAssetAllowed(AssetType{"USDC"}, true, journal);
        registry.SetAssetAllowed(AssetType{"USDC"}, true, journal);
        journal.Commit(&handler);
        REQUIRE(registry.Size(AllowlistKind::Asset) == 1);
        REQUIRE(handler.allowlist_changes.size() == 2);
        REQUIRE(handler.allowlist_changes[0].kind == AllowlistKind::Asset);
        REQUIRE(handler.allowlist_changes[0].identifier == "USDC");
        REQUIRE(handler.allowlist_changes[0].allowed);
    }

    SECTION("Disallowing removes membership") {
        {
            OperationJournal journal("allow");
            registry.SetSenderAllowed(Address{"relay-a"}, true, journal);
            journal.Commit(&handler);
        }
        OperationJournal journal("deny");
        registry.SetSenderAllowed(Address{"relay-a"}, false, journal);
        journal.Commit(&handler);
        REQUIRE_FALSE(registry.IsSenderAllowed(Address{"relay-a"}));
        REQUIRE(handler.allowlist_changes.back().allowed == false);
    }

    SECTION("Rolled back change restores prior membership") {
        {
            OperationJournal journal("allow");
            registry.SetSourceAllowed(NetworkId{3}, true, journal);
            journal.Commit(&handler);
        }
        OperationJournal journal("deny");
        registry.SetSourceAllowed(NetworkId{3}, false, journal);
        registry.SetSourceAllowed(NetworkId{4}, true, journal);
        REQUIRE(journal.Rollback().IsOk());
        REQUIRE(registry.IsSourceAllowed(NetworkId{3}));
        REQUIRE_FALSE(registry.IsSourceAllowed(NetworkId{4}));
        REQUIRE(handler.allowlist_changes.size() == 1);
    }
}
