#pragma once
#include "crosslane/core/result.hpp"
#include "crosslane/core/failures.hpp"
#include "crosslane/core/types.hpp"
namespace crosslane::relay::interfaces {
using relay::Result;
using relay::Unit;
using relay::RelayFailure;
// External message transport. Quote is a pure query valid only for the current
// transport state; Dispatch queues the message for delivery and returns the id
// the eventual delivery will carry.
class ITransport {
public:
    virtual ~ITransport() = default;
    [[nodiscard]] virtual Result<Amount, RelayFailure> Quote(
        NetworkId destination, const Message& message) const = 0;
    [[nodiscard]] virtual Result<MessageId, RelayFailure> Dispatch(
        NetworkId destination, const Message& message, const FeeAuthorization& authorization) = 0;
    // Account on the source network that pulls fees and transferred assets.
    [[nodiscard]] virtual Result<Address, RelayFailure> GetCollectorAddress(NetworkId network) const = 0;
};
// The single inbound entry point a transport invokes on a relay node.
class IRelayEndpoint {
public:
    virtual ~IRelayEndpoint() = default;
    [[nodiscard]] virtual Result<Unit, RelayFailure> Deliver(const Message& message) = 0;
};
}
