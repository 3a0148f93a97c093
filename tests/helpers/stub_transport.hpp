#pragma once
#include "crosslane/interfaces/i_transport.hpp"
#include "crosslane/core/result.hpp"
#include "crosslane/core/failures.hpp"
#include <array>
#include <optional>
#include <vector>

namespace crosslane::relay::test_helpers {

using interfaces::ITransport;

// Fixed-price transport that records dispatches without moving any funds.
class StubTransport : public ITransport {
public:
    explicit StubTransport(const Amount fee = 50)
        : fee_(fee) {}

    [[nodiscard]] Result<Amount, RelayFailure> Quote(NetworkId, const Message&) const override {
        ++quote_calls;
        if (fail_quotes) {
            return Result<Amount, RelayFailure>::Err(RelayFailure::TransportFailed("quote unavailable"));
        }
        return Result<Amount, RelayFailure>::Ok(fee_);
    }

    [[nodiscard]] Result<MessageId, RelayFailure> Dispatch(
        const NetworkId destination, const Message& message, const FeeAuthorization& authorization) override {
        if (fail_dispatch) {
            return Result<MessageId, RelayFailure>::Err(RelayFailure::TransportFailed("link down"));
        }
        std::array<uint8_t, RelayConstants::MESSAGE_ID_SIZE> bytes{};
        bytes[0] = static_cast<uint8_t>(dispatched.size() + 1);
        auto id = MessageId::FromBytes(bytes);
        Message recorded = message;
        recorded.id = id.Unwrap();
        dispatched.push_back(recorded);
        destinations.push_back(destination);
        authorizations.push_back(authorization);
        return id;
    }

    [[nodiscard]] Result<Address, RelayFailure> GetCollectorAddress(NetworkId) const override {
        return Result<Address, RelayFailure>::Ok(collector);
    }

    void SetFee(const Amount fee) { fee_ = fee; }

    Address collector{"stub-collector"};
    bool fail_quotes = false;
    bool fail_dispatch = false;
    mutable int quote_calls = 0;
    std::vector<Message> dispatched;
    std::vector<NetworkId> destinations;
    std::vector<FeeAuthorization> authorizations;

private:
    Amount fee_;
};

} // namespace crosslane::relay::test_helpers
