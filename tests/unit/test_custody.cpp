#include <catch2/catch_test_macros.hpp>
#include "crosslane/custody/custody.hpp"
#include "crosslane/ledger/in_memory_asset_ledger.hpp"
#include <memory>

using namespace crosslane::relay;
using namespace crosslane::relay::custody;
using crosslane::relay::ledger::InMemoryAssetLedger;
using crosslane::relay::state::OperationJournal;

namespace {
const AssetType USDC{"USDC"};
const Address NODE{"relay"};
const Address ALICE{"alice"};
const Address BOB{"bob"};
const Address SPENDER{"collector"};
}

TEST_CASE("Custody - Transfer in", "[custody]") {
    auto ledger = std::make_shared<InMemoryAssetLedger>();
    REQUIRE(ledger->Mint(USDC, ALICE, 1000).IsOk());
    Custody custody(ledger, NODE);

    SECTION("Pulls against the granted allowance") {
        REQUIRE(ledger->Approve(USDC, ALICE, NODE, 300).IsOk());
        OperationJournal journal("in");
        REQUIRE(custody.TransferIn(USDC, ALICE, 200, journal).IsOk());
        journal.Commit(nullptr);
        REQUIRE(custody.BalanceOf(USDC) == 200);
        REQUIRE(ledger->BalanceOf(USDC, ALICE) == 800);
        REQUIRE(ledger->Allowance(USDC, ALICE, NODE) == 100);
    }

    SECTION("Without allowance the transfer fails and nothing moves") {
        OperationJournal journal("in");
        auto result = custody.TransferIn(USDC, ALICE, 200, journal);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().Is(RelayFailureType::TransferFailed));
        REQUIRE(journal.PendingCompensations() == 0);
        REQUIRE(custody.BalanceOf(USDC) == 0);
    }

    SECTION("Rollback returns funds and restores the allowance") {
        REQUIRE(ledger->Approve(USDC, ALICE, NODE, 300).IsOk());
        OperationJournal journal("in");
        REQUIRE(custody.TransferIn(USDC, ALICE, 300, journal).IsOk());
        REQUIRE(journal.Rollback().IsOk());
        REQUIRE(ledger->BalanceOf(USDC, ALICE) == 1000);
        REQUIRE(ledger->Allowance(USDC, ALICE, NODE) == 300);
        REQUIRE(custody.BalanceOf(USDC) == 0);
    }
}

TEST_CASE("Custody - Transfer out and authorize", "[custody]") {
    auto ledger = std::make_shared<InMemoryAssetLedger>();
    REQUIRE(ledger->Mint(USDC, NODE, 500).IsOk());
    Custody custody(ledger, NODE);

    SECTION("Releases to the recipient") {
        OperationJournal journal("out");
        REQUIRE(custody.TransferOut(USDC, BOB, 120, journal).IsOk());
        journal.Commit(nullptr);
        REQUIRE(ledger->BalanceOf(USDC, BOB) == 120);
        REQUIRE(custody.BalanceOf(USDC) == 380);
    }

    SECTION("Releasing more than held fails") {
        OperationJournal journal("out");
        auto result = custody.TransferOut(USDC, BOB, 501, journal);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().Is(RelayFailureType::TransferFailed));
    }

    SECTION("Halted asset reports failure") {
        ledger->FailTransfersOf(USDC);
        OperationJournal journal("out");
        REQUIRE(custody.TransferOut(USDC, BOB, 1, journal).IsErr());
        REQUIRE(custody.BalanceOf(USDC) == 500);
    }

    SECTION("Authorize is undone on rollback") {
        REQUIRE(ledger->Approve(USDC, NODE, SPENDER, 10).IsOk());
        OperationJournal journal("authorize");
        REQUIRE(custody.Authorize(USDC, SPENDER, 90, journal).IsOk());
        REQUIRE(ledger->Allowance(USDC, NODE, SPENDER) == 90);
        REQUIRE(journal.Rollback().IsOk());
        REQUIRE(ledger->Allowance(USDC, NODE, SPENDER) == 10);
    }
}
