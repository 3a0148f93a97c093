#pragma once

#include "crosslane/core/result.hpp"
#include "crosslane/core/failures.hpp"
#include "crosslane/core/constants.hpp"

#include <sodium.h>
#include <atomic>
#include <cstddef>
#include <mutex>
#include <span>
#include <vector>

namespace crosslane::relay::crypto {

/**
 * @brief Interop layer for the libsodium primitives the relay relies on
 *
 * Message id derivation (BLAKE2b), administrator capability tokens (CSPRNG)
 * and capability checks (constant-time comparison).
 */
class SodiumInterop {
public:
    /**
     * @brief Initialize libsodium
     *
     * Thread-safe and idempotent. Must succeed before any other call.
     */
    static Result<Unit, SodiumFailure> Initialize();

    static bool IsInitialized() noexcept;

    /**
     * @brief Constant-time comparison of two buffers
     *
     * @return Ok(true) if equal, Ok(false) if different, Err on failure
     */
    static Result<bool, SodiumFailure> ConstantTimeEquals(
        std::span<const uint8_t> a,
        std::span<const uint8_t> b);

    /**
     * @brief BLAKE2b digest of the concatenation of the given parts
     *
     * @param output_size Digest length, between crypto_generichash_BYTES_MIN and _MAX
     */
    static Result<std::vector<uint8_t>, SodiumFailure> GenericHash(
        std::span<const std::span<const uint8_t>> parts,
        size_t output_size);

    static std::vector<uint8_t> GetRandomBytes(size_t size);

    static constexpr size_t MAX_BUFFER_SIZE = 1'000'000'000;

private:
    static inline std::atomic<bool> initialized_{false};
    static inline std::once_flag init_flag_;

    SodiumInterop() = delete;
    ~SodiumInterop() = delete;
    SodiumInterop(const SodiumInterop&) = delete;
    SodiumInterop& operator=(const SodiumInterop&) = delete;
};

} // namespace crosslane::relay::crypto
