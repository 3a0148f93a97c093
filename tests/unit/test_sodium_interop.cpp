#include <catch2/catch_test_macros.hpp>
#include "crosslane/crypto/sodium_interop.hpp"
#include "crosslane/admin/admin_capability.hpp"
#include "crosslane/core/types.hpp"
#include <array>
#include <string>
using namespace crosslane::relay;
using namespace crosslane::relay::crypto;

namespace {
std::span<const uint8_t> AsBytes(const std::string& text) {
    return {reinterpret_cast<const uint8_t*>(text.data()), text.size()};
}
}

TEST_CASE("SodiumInterop - Initialization", "[sodium][crypto]") {
    SECTION("Initialize succeeds") {
        auto result = SodiumInterop::Initialize();
        REQUIRE(result.IsOk());
        REQUIRE(SodiumInterop::IsInitialized());
    }
    SECTION("Multiple Initialize calls are safe") {
        REQUIRE(SodiumInterop::Initialize().IsOk());
        REQUIRE(SodiumInterop::Initialize().IsOk());
    }
}

TEST_CASE("SodiumInterop - Constant Time Comparison", "[sodium][crypto][security]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("Equal buffers return true") {
        std::vector<uint8_t> a = {1, 2, 3, 4, 5};
        std::vector<uint8_t> b = {1, 2, 3, 4, 5};
        auto result = SodiumInterop::ConstantTimeEquals(a, b);
        REQUIRE(result.IsOk());
        REQUIRE(result.Unwrap());
    }
    SECTION("Different buffers return false") {
        std::vector<uint8_t> a = {1, 2, 3, 4, 5};
        std::vector<uint8_t> b = {1, 2, 3, 4, 6};
        REQUIRE_FALSE(SodiumInterop::ConstantTimeEquals(a, b).Unwrap());
    }
    SECTION("Different sizes return false") {
        std::vector<uint8_t> a = {1, 2, 3};
        std::vector<uint8_t> b = {1, 2, 3, 4};
        REQUIRE_FALSE(SodiumInterop::ConstantTimeEquals(a, b).Unwrap());
    }
}

TEST_CASE("SodiumInterop - Generic Hash", "[sodium][crypto]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const std::string domain = "crosslane-message-id-v1";
    const std::string body = "envelope";

    SECTION("Split input hashes like the concatenation") {
        const std::array<std::span<const uint8_t>, 2> split = {AsBytes(domain), AsBytes(body)};
        const std::string joined = domain + body;
        const std::array<std::span<const uint8_t>, 1> whole = {AsBytes(joined)};
        auto a = SodiumInterop::GenericHash(split, RelayConstants::MESSAGE_ID_SIZE);
        auto b = SodiumInterop::GenericHash(whole, RelayConstants::MESSAGE_ID_SIZE);
        REQUIRE(a.IsOk());
        REQUIRE(a.Unwrap().size() == RelayConstants::MESSAGE_ID_SIZE);
        REQUIRE(a.Unwrap() == b.Unwrap());
    }
    SECTION("Digest size outside the BLAKE2b range is rejected") {
        const std::array<std::span<const uint8_t>, 1> parts = {AsBytes(body)};
        auto result = SodiumInterop::GenericHash(parts, 8);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == SodiumFailureType::InvalidOperation);
    }
    SECTION("Digest becomes a message id") {
        const std::array<std::span<const uint8_t>, 1> parts = {AsBytes(body)};
        auto digest = SodiumInterop::GenericHash(parts, RelayConstants::MESSAGE_ID_SIZE);
        auto id = MessageId::FromBytes(digest.Unwrap());
        REQUIRE(id.IsOk());
        REQUIRE_FALSE(id.Unwrap().IsZero());
        REQUIRE(id.Unwrap().ToHex().size() == RelayConstants::MESSAGE_ID_SIZE * 2);
    }
}

TEST_CASE("AdminCapability - Generation", "[sodium][admin][security]") {
    SECTION("Two generated capabilities differ") {
        auto first = crosslane::relay::admin::AdminCapability::Generate();
        auto second = crosslane::relay::admin::AdminCapability::Generate();
        REQUIRE(first.IsOk());
        REQUIRE(second.IsOk());
        REQUIRE_FALSE(SodiumInterop::ConstantTimeEquals(first.Unwrap().Bytes(), second.Unwrap().Bytes()).Unwrap());
        REQUIRE(first.Unwrap().Fingerprint().size() == 8);
    }
    SECTION("Wrong length is rejected") {
        std::vector<uint8_t> short_token(16, 0x01);
        auto result = crosslane::relay::admin::AdminCapability::FromBytes(short_token);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().Is(RelayFailureType::InvalidInput));
    }
}
