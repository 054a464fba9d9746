#pragma once

#include "hookseal/core/result.hpp"
#include "hookseal/core/failures.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <span>
#include <string>
#include <vector>

namespace hookseal::protocol::crypto {

/**
 * @brief Interop layer for libsodium operations
 *
 * Wraps the handful of libsodium primitives the callback protocol needs:
 * CSPRNG output, constant-time comparison, wiping and guarded allocation.
 */
class SodiumInterop {
public:
    // ========================================================================
    // Initialization
    // ========================================================================

    /**
     * @brief Initialize libsodium
     *
     * Thread-safe and idempotent. Must succeed before secure allocation.
     */
    static Result<Unit, SodiumFailure> Initialize();

    static bool IsInitialized() noexcept;

    // ========================================================================
    // Memory and comparison
    // ========================================================================

    /// Zeroes the buffer in a way the optimizer cannot elide.
    static void SecureWipe(std::span<uint8_t> buffer) noexcept;

    /**
     * @brief Constant-time comparison of two buffers
     *
     * Runs in time dependent only on the length. Buffers of different length
     * compare unequal without touching their contents.
     */
    [[nodiscard]] static bool ConstantTimeEquals(
        std::span<const uint8_t> a,
        std::span<const uint8_t> b) noexcept;

    // ========================================================================
    // Random Number Generation
    // ========================================================================

    static std::vector<uint8_t> GetRandomBytes(size_t size);

    /// Uniform value in [0, upper_bound).
    static uint32_t RandomUniform(uint32_t upper_bound);

    // ========================================================================
    // Encoding
    // ========================================================================

    /// Lowercase hexadecimal rendering.
    static std::string ToHex(std::span<const uint8_t> data);

    // ========================================================================
    // Memory Allocation (Internal)
    // ========================================================================

    /**
     * @brief Allocate guard-paged, mlock'ed memory with sodium_malloc
     *
     * @return Pointer to secure memory, or nullptr when libsodium is not
     *         initialized or the allocation fails
     */
    static void* AllocateSecure(size_t size) noexcept;

    static void FreeSecure(void* ptr) noexcept;

private:
    static inline std::atomic<bool> initialized_{false};
    static inline std::once_flag init_flag_;

    SodiumInterop() = delete;
    ~SodiumInterop() = delete;
    SodiumInterop(const SodiumInterop&) = delete;
    SodiumInterop& operator=(const SodiumInterop&) = delete;
};

} // namespace hookseal::protocol::crypto
