#include <catch2/catch_test_macros.hpp>
#include "crosslane/ledger/in_memory_asset_ledger.hpp"
#include <cstdint>
#include <vector>

using namespace crosslane::relay;
using namespace crosslane::relay::ledger;

namespace {
const AssetType USDC{"USDC"};
const Address ALICE{"alice"};
const Address BOB{"bob"};
const Address SPENDER{"spender"};
}

TEST_CASE("InMemoryAssetLedger - Balances", "[ledger]") {
    InMemoryAssetLedger ledger;
    REQUIRE(ledger.Mint(USDC, ALICE, 100).IsOk());

    SECTION("Transfer moves value") {
        REQUIRE(ledger.Transfer(USDC, ALICE, BOB, 40).IsOk());
        REQUIRE(ledger.BalanceOf(USDC, ALICE) == 60);
        REQUIRE(ledger.BalanceOf(USDC, BOB) == 40);
        REQUIRE(ledger.TotalSupply(USDC) == 100);
    }

    SECTION("Overdraft fails and changes nothing") {
        auto result = ledger.Transfer(USDC, ALICE, BOB, 101);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().Is(RelayFailureType::TransferFailed));
        REQUIRE(ledger.BalanceOf(USDC, ALICE) == 100);
        REQUIRE(ledger.BalanceOf(USDC, BOB) == 0);
    }

    SECTION("Crediting past the maximum fails") {
        REQUIRE(ledger.Mint(USDC, BOB, UINT64_MAX - 100).IsOk());
        REQUIRE(ledger.Mint(USDC, BOB, 1).IsErr());
        REQUIRE(ledger.BalanceOf(USDC, BOB) == UINT64_MAX - 100);
    }

    SECTION("Halted asset fails until cleared") {
        ledger.FailTransfersOf(USDC);
        REQUIRE(ledger.Transfer(USDC, ALICE, BOB, 1).IsErr());
        ledger.FailTransfersOf(USDC, false);
        REQUIRE(ledger.Transfer(USDC, ALICE, BOB, 1).IsOk());
    }
}

TEST_CASE("InMemoryAssetLedger - Allowances", "[ledger]") {
    InMemoryAssetLedger ledger;
    REQUIRE(ledger.Mint(USDC, ALICE, 100).IsOk());

    SECTION("TransferFrom consumes the allowance") {
        REQUIRE(ledger.Approve(USDC, ALICE, SPENDER, 70).IsOk());
        REQUIRE(ledger.TransferFrom(USDC, SPENDER, ALICE, BOB, 50).IsOk());
        REQUIRE(ledger.Allowance(USDC, ALICE, SPENDER) == 20);
        REQUIRE(ledger.TransferFrom(USDC, SPENDER, ALICE, BOB, 21).IsErr());
        REQUIRE(ledger.BalanceOf(USDC, BOB) == 50);
    }

    SECTION("Approve overwrites") {
        REQUIRE(ledger.Approve(USDC, ALICE, SPENDER, 70).IsOk());
        REQUIRE(ledger.Approve(USDC, ALICE, SPENDER, 5).IsOk());
        REQUIRE(ledger.Allowance(USDC, ALICE, SPENDER) == 5);
    }
}

TEST_CASE("InMemoryAssetLedger - Transfer hook", "[ledger]") {
    InMemoryAssetLedger ledger;
    REQUIRE(ledger.Mint(USDC, ALICE, 100).IsOk());
    std::vector<TransferRecord> seen;
    ledger.SetTransferHook([&seen, &ledger](const TransferRecord& record) {
        seen.push_back(record);
        // The ledger is unlocked while the hook runs.
        REQUIRE(ledger.BalanceOf(record.asset, record.to) >= record.amount);
    });

    REQUIRE(ledger.Transfer(USDC, ALICE, BOB, 10).IsOk());
    REQUIRE(ledger.Transfer(USDC, ALICE, BOB, 1000).IsErr());
    REQUIRE(seen.size() == 1);
    REQUIRE(seen[0].to == BOB);
    REQUIRE(seen[0].amount == 10);
}
