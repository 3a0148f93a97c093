#pragma once
#include "crosslane/relay/relay_node.hpp"
#include "crosslane/ledger/in_memory_asset_ledger.hpp"
#include "crosslane/transport/local_transport.hpp"
#include "helpers/recording_event_handler.hpp"
#include <catch2/catch_test_macros.hpp>
#include <memory>
#include <string>
#include <vector>

namespace crosslane::relay::test_helpers {

using ledger::InMemoryAssetLedger;
using transport::LocalTransport;

inline const NetworkId NETWORK_A{16015286601757825753ULL};
inline const NetworkId NETWORK_B{14767482510784806043ULL};
inline const NetworkId NETWORK_UNKNOWN{42};

inline const Address RELAY_A{"relay-a"};
inline const Address RELAY_B{"relay-b"};
inline const Address COLLECTOR_A{"transport-a"};
inline const Address COLLECTOR_B{"transport-b"};
inline const Address ALICE{"alice"};
inline const Address BOB{"bob"};
inline const Address TREASURY{"treasury"};

inline const AssetType USDC{"USDC"};
inline const AssetType EURC{"EURC"};
inline const AssetType FEE{"LINK"};
inline const AssetType NATIVE{"ETH"};

constexpr Amount POOL_SIZE = 1'000'000;
constexpr Amount ALICE_FUNDS = 100'000;

inline void RequireOk(const Result<Unit, RelayFailure>& result) {
    INFO((result.IsErr() ? result.UnwrapErr().message : std::string("ok")));
    REQUIRE(result.IsOk());
}

inline RelaySettings SettingsFor(const Address& node, const NetworkId network) {
    return RelaySettings{node, network, FEE, NATIVE};
}

inline std::vector<uint8_t> Bytes(const std::string& text) {
    return {text.begin(), text.end()};
}

/**
 * Two relay nodes on two simulated networks joined by one LocalTransport.
 *
 * Node A may send USDC to network B; node B accepts USDC from node A.
 * Alice holds USDC, fee asset and native asset on network A; the transport's
 * collector on network B holds a pool of USDC to fund deliveries.
 */
class RelayFixture {
public:
    explicit RelayFixture(const RelayConfig config_a = RelayConfig::Full(),
                          const RelayConfig config_b = RelayConfig::Full())
        : ledger_a(std::make_shared<InMemoryAssetLedger>())
        , ledger_b(std::make_shared<InMemoryAssetLedger>())
        , transport(std::make_shared<LocalTransport>())
        , a(MakeNode(SettingsFor(RELAY_A, NETWORK_A), config_a, ledger_a, transport))
        , b(MakeNode(SettingsFor(RELAY_B, NETWORK_B), config_b, ledger_b, transport))
        , events_a(std::make_shared<RecordingEventHandler>())
        , events_b(std::make_shared<RecordingEventHandler>()) {
        RequireOk(transport->RegisterNetwork(NETWORK_A, ledger_a, COLLECTOR_A));
        RequireOk(transport->RegisterNetwork(NETWORK_B, ledger_b, COLLECTOR_B));
        RequireOk(transport->RegisterEndpoint(NETWORK_A, a.node, RELAY_A));
        RequireOk(transport->RegisterEndpoint(NETWORK_B, b.node, RELAY_B));

        RequireOk(ledger_a->Mint(USDC, ALICE, ALICE_FUNDS));
        RequireOk(ledger_a->Mint(FEE, ALICE, ALICE_FUNDS));
        RequireOk(ledger_a->Mint(NATIVE, ALICE, ALICE_FUNDS));
        RequireOk(ledger_b->Mint(USDC, COLLECTOR_B, POOL_SIZE));
        RequireOk(ledger_b->Mint(EURC, COLLECTOR_B, POOL_SIZE));

        RequireOk(a.node->Admin().SetDestinationAllowed(a.admin, NETWORK_B, true));
        RequireOk(a.node->Admin().SetAssetAllowed(a.admin, USDC, true));
        RequireOk(b.node->Admin().SetSourceAllowed(b.admin, NETWORK_A, true));
        RequireOk(b.node->Admin().SetSenderAllowed(b.admin, RELAY_A, true));
        RequireOk(b.node->Admin().SetAssetAllowed(b.admin, USDC, true));

        a.node->SetEventHandler(events_a);
        b.node->SetEventHandler(events_b);
    }

    static CreatedRelayNode MakeNode(RelaySettings settings, const RelayConfig config,
                                     std::shared_ptr<InMemoryAssetLedger> ledger,
                                     std::shared_ptr<LocalTransport> transport) {
        auto created = RelayNode::Create(std::move(settings), config, std::move(ledger), std::move(transport));
        INFO((created.IsErr() ? created.UnwrapErr().message : std::string("ok")));
        REQUIRE(created.IsOk());
        return std::move(created).Unwrap();
    }

    // Fee reserve on node A funded by the treasury.
    void FundReserve(const Amount amount) {
        RequireOk(ledger_a->Mint(FEE, RELAY_A, amount));
    }

    void AliceApproves(const AssetType& asset, const Amount amount) {
        RequireOk(ledger_a->Approve(asset, ALICE, RELAY_A, amount));
    }

    [[nodiscard]] SendRequest AliceSends(const Amount amount, std::string text = "hello",
                                         const FeeSettlement settlement = FeeSettlement::PrefundedReserve,
                                         const Amount attached = 0) const {
        SendRequest request;
        request.caller = ALICE;
        request.destination = NETWORK_B;
        request.receiver = BOB;
        request.payload = Bytes(text);
        request.asset = USDC;
        request.amount = amount;
        request.settlement = settlement;
        request.attached_payment = attached;
        return request;
    }

    // Quote the transport would give for `request` as dispatched by node A.
    [[nodiscard]] Amount QuoteFor(const SendRequest& request) const {
        const auto payload = codec::PayloadCodec::Encode(codec::RelayPayload{
            request.receiver, request.asset, request.amount, request.payload});
        REQUIRE(payload.IsOk());
        Message message;
        message.payload = payload.Unwrap();
        message.asset_transfers.push_back(AssetAmount{request.asset, request.amount});
        const auto quote = transport->Quote(request.destination, message);
        REQUIRE(quote.IsOk());
        return quote.Unwrap();
    }

    std::shared_ptr<InMemoryAssetLedger> ledger_a;
    std::shared_ptr<InMemoryAssetLedger> ledger_b;
    std::shared_ptr<LocalTransport> transport;
    CreatedRelayNode a;
    CreatedRelayNode b;
    std::shared_ptr<RecordingEventHandler> events_a;
    std::shared_ptr<RecordingEventHandler> events_b;
};

} // namespace crosslane::relay::test_helpers
