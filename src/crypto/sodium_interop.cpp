#include "crosslane/crypto/sodium_interop.hpp"
#include "crosslane/core/format.hpp"

#include <string>

namespace crosslane::relay::crypto {

// ============================================================================
// Initialization
// ============================================================================

Result<Unit, SodiumFailure> SodiumInterop::Initialize() {
    std::call_once(init_flag_, []() {
        if (sodium_init() < 0) {
            initialized_.store(false, std::memory_order_release);
        } else {
            initialized_.store(true, std::memory_order_release);
        }
    });

    if (!initialized_.load(std::memory_order_acquire)) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::InitializationFailed(
                std::string(ErrorMessages::SODIUM_INIT_FAILED)));
    }

    return Result<Unit, SodiumFailure>::Ok(unit);
}

bool SodiumInterop::IsInitialized() noexcept {
    return initialized_.load(std::memory_order_acquire);
}

// ============================================================================
// Comparison
// ============================================================================

Result<bool, SodiumFailure> SodiumInterop::ConstantTimeEquals(
    std::span<const uint8_t> a,
    std::span<const uint8_t> b) {

    if (!IsInitialized()) {
        return Result<bool, SodiumFailure>::Err(
            SodiumFailure::InitializationFailed(
                std::string(ErrorMessages::NOT_INITIALIZED)));
    }

    // Different sizes are never equal
    if (a.size() != b.size()) {
        return Result<bool, SodiumFailure>::Ok(false);
    }

    if (a.empty()) {
        return Result<bool, SodiumFailure>::Ok(true);
    }

    const int result = sodium_memcmp(a.data(), b.data(), a.size());
    return Result<bool, SodiumFailure>::Ok(result == 0);
}

// ============================================================================
// Hashing
// ============================================================================

Result<std::vector<uint8_t>, SodiumFailure> SodiumInterop::GenericHash(
    std::span<const std::span<const uint8_t>> parts,
    const size_t output_size) {

    if (!IsInitialized()) {
        return Result<std::vector<uint8_t>, SodiumFailure>::Err(
            SodiumFailure::InitializationFailed(
                std::string(ErrorMessages::NOT_INITIALIZED)));
    }

    if (output_size < crypto_generichash_BYTES_MIN || output_size > crypto_generichash_BYTES_MAX) {
        return Result<std::vector<uint8_t>, SodiumFailure>::Err(
            SodiumFailure::InvalidOperation(
                compat::format("Digest size {} outside [{}, {}]",
                               output_size, crypto_generichash_BYTES_MIN, crypto_generichash_BYTES_MAX)));
    }

    crypto_generichash_state state;
    if (crypto_generichash_init(&state, nullptr, 0, output_size) != 0) {
        return Result<std::vector<uint8_t>, SodiumFailure>::Err(
            SodiumFailure::HashFailed("crypto_generichash_init failed"));
    }
    for (const auto part : parts) {
        if (part.size() > MAX_BUFFER_SIZE) {
            return Result<std::vector<uint8_t>, SodiumFailure>::Err(
                SodiumFailure::BufferTooLarge(
                    "Buffer size " + std::to_string(part.size()) +
                    " exceeds maximum " + std::to_string(MAX_BUFFER_SIZE)));
        }
        if (crypto_generichash_update(&state, part.data(), part.size()) != 0) {
            return Result<std::vector<uint8_t>, SodiumFailure>::Err(
                SodiumFailure::HashFailed("crypto_generichash_update failed"));
        }
    }
    std::vector<uint8_t> digest(output_size);
    if (crypto_generichash_final(&state, digest.data(), digest.size()) != 0) {
        return Result<std::vector<uint8_t>, SodiumFailure>::Err(
            SodiumFailure::HashFailed("crypto_generichash_final failed"));
    }
    return Result<std::vector<uint8_t>, SodiumFailure>::Ok(std::move(digest));
}

// ============================================================================
// Random Number Generation
// ============================================================================

std::vector<uint8_t> SodiumInterop::GetRandomBytes(const size_t size) {
    std::vector<uint8_t> buffer(size);
    if (size > 0) {
        randombytes_buf(buffer.data(), size);
    }
    return buffer;
}

} // namespace crosslane::relay::crypto
