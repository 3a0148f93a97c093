/**
 * @file relay_demo.cpp
 * @brief Two relay nodes on two simulated networks moving USDC with a note
 */

#include "crosslane/relay/relay_node.hpp"
#include "crosslane/ledger/in_memory_asset_ledger.hpp"
#include "crosslane/transport/local_transport.hpp"
#include "crosslane/observability/logging.hpp"

#include <iostream>
#include <memory>
#include <string>

using namespace crosslane::relay;
using crosslane::relay::ledger::InMemoryAssetLedger;
using crosslane::relay::transport::LocalTransport;

namespace {
const NetworkId SOURCE{1};
const NetworkId DESTINATION{2};
const Address RELAY_SOURCE{"relay-source"};
const Address RELAY_DESTINATION{"relay-destination"};
const Address ALICE{"alice"};
const Address BOB{"bob"};
const AssetType USDC{"USDC"};
const AssetType FEE{"LINK"};
const AssetType NATIVE{"ETH"};

bool Check(const Result<Unit, RelayFailure>& result, const std::string& step) {
    if (result.IsErr()) {
        std::cerr << step << " failed: " << ToString(result.UnwrapErr().type)
                  << " (" << result.UnwrapErr().message << ")" << std::endl;
        return false;
    }
    return true;
}
}

int main() {
    crosslane::observability::InitializeLogging({});

    std::cout << "=== Crosslane - Relay Demo ===" << std::endl;
    std::cout << std::endl;

    auto source_ledger = std::make_shared<InMemoryAssetLedger>();
    auto destination_ledger = std::make_shared<InMemoryAssetLedger>();
    auto transport = std::make_shared<LocalTransport>();

    auto source = RelayNode::Create(RelaySettings{RELAY_SOURCE, SOURCE, FEE, NATIVE},
                                    RelayConfig::Full(), source_ledger, transport);
    auto destination = RelayNode::Create(RelaySettings{RELAY_DESTINATION, DESTINATION, FEE, NATIVE},
                                         RelayConfig::Full(), destination_ledger, transport);
    if (source.IsErr() || destination.IsErr()) {
        std::cerr << "Failed to create relay nodes" << std::endl;
        return 1;
    }
    const CreatedRelayNode a = std::move(source).Unwrap();
    const CreatedRelayNode b = std::move(destination).Unwrap();
    std::cout << "1. Created nodes, admin fingerprints " << a.admin.Fingerprint()
              << " / " << b.admin.Fingerprint() << std::endl;

    if (!Check(transport->RegisterNetwork(SOURCE, source_ledger, Address{"transport-source"}), "register") ||
        !Check(transport->RegisterNetwork(DESTINATION, destination_ledger, Address{"transport-destination"}),
               "register") ||
        !Check(transport->RegisterEndpoint(SOURCE, a.node, RELAY_SOURCE), "endpoint") ||
        !Check(transport->RegisterEndpoint(DESTINATION, b.node, RELAY_DESTINATION), "endpoint")) {
        return 1;
    }

    if (!Check(source_ledger->Mint(USDC, ALICE, 1'000), "mint") ||
        !Check(source_ledger->Mint(FEE, RELAY_SOURCE, 10'000), "mint") ||
        !Check(destination_ledger->Mint(USDC, Address{"transport-destination"}, 1'000'000), "mint") ||
        !Check(source_ledger->Approve(USDC, ALICE, RELAY_SOURCE, 250), "approve")) {
        return 1;
    }

    if (!Check(a.node->Admin().SetDestinationAllowed(a.admin, DESTINATION, true), "allowlist") ||
        !Check(a.node->Admin().SetAssetAllowed(a.admin, USDC, true), "allowlist") ||
        !Check(b.node->Admin().SetSourceAllowed(b.admin, SOURCE, true), "allowlist") ||
        !Check(b.node->Admin().SetSenderAllowed(b.admin, RELAY_SOURCE, true), "allowlist") ||
        !Check(b.node->Admin().SetAssetAllowed(b.admin, USDC, true), "allowlist")) {
        return 1;
    }
    std::cout << "2. Allowlists configured" << std::endl;

    const std::string note = "invoice #42";
    SendRequest request;
    request.caller = ALICE;
    request.destination = DESTINATION;
    request.receiver = BOB;
    request.payload.assign(note.begin(), note.end());
    request.asset = USDC;
    request.amount = 250;

    auto sent = a.node->Send(request);
    if (sent.IsErr()) {
        std::cerr << "Send failed: " << sent.UnwrapErr().message << std::endl;
        return 1;
    }
    const MessageId id = sent.Unwrap();
    std::cout << "3. Sent message " << id.ToHex() << std::endl;
    std::cout << "   Fee reserve left: " << a.node->FeeReserveBalance() << " " << FEE.value << std::endl;

    for (const auto& outcome : transport->DeliverAll()) {
        if (!Check(outcome.result, "delivery of " + outcome.id.ToHex())) {
            return 1;
        }
    }
    std::cout << "4. Delivered, bob holds " << destination_ledger->BalanceOf(USDC, BOB)
              << " " << USDC.value << std::endl;
    if (const auto last = b.node->GetLastReceived()) {
        std::cout << "   Note: " << std::string(last->data.begin(), last->data.end()) << std::endl;
    }

    const auto replay = transport->Redeliver(id);
    std::cout << "5. Replay attempt: "
              << (replay.IsErr() ? ToString(replay.UnwrapErr().type) : std::string_view("accepted"))
              << std::endl;

    crosslane::observability::ShutdownLogging();
    return replay.IsErr() ? 0 : 1;
}
