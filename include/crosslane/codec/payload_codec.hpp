#pragma once
#include "crosslane/core/result.hpp"
#include "crosslane/core/failures.hpp"
#include "crosslane/core/types.hpp"
#include <cstdint>
#include <span>
#include <vector>
namespace crosslane::relay::codec {
using relay::Result;
using relay::RelayFailure;
struct RelayPayload {
    Address recipient;
    AssetType asset;
    Amount amount = 0;
    std::vector<uint8_t> data;
};
class PayloadCodec {
public:
    [[nodiscard]] static Result<std::vector<uint8_t>, RelayFailure>
    Encode(const RelayPayload& payload);
    // Fails DecodeFailed on malformed bytes or a payload without recipient or asset.
    [[nodiscard]] static Result<RelayPayload, RelayFailure>
    Decode(std::span<const uint8_t> bytes);
    // Fails InvalidInput for a payload above RelayConstants::MAX_PAYLOAD_SIZE_LIMIT.
    [[nodiscard]] static Result<std::vector<uint8_t>, RelayFailure>
    EncodeEnvelope(const Message& message, uint64_t sequence);
private:
    PayloadCodec() = delete;
};
}
