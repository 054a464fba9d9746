#include "hookseal/crypto/sodium_interop.hpp"
#include "hookseal/core/constants.hpp"

#include <sodium.h>

namespace hookseal::protocol::crypto {

// ============================================================================
// Initialization
// ============================================================================

Result<Unit, SodiumFailure> SodiumInterop::Initialize() {
    std::call_once(init_flag_, []() {
        // sodium_init() returns 1 when another component already initialized it
        initialized_.store(sodium_init() >= 0, std::memory_order_release);
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
// Memory and comparison
// ============================================================================

void SodiumInterop::SecureWipe(std::span<uint8_t> buffer) noexcept {
    if (buffer.empty()) {
        return;
    }
    sodium_memzero(buffer.data(), buffer.size());
}

bool SodiumInterop::ConstantTimeEquals(
    std::span<const uint8_t> a,
    std::span<const uint8_t> b) noexcept {

    if (a.size() != b.size()) {
        return false;
    }
    if (a.empty()) {
        return true;
    }
    return sodium_memcmp(a.data(), b.data(), a.size()) == 0;
}

// ============================================================================
// Random Number Generation
// ============================================================================

std::vector<uint8_t> SodiumInterop::GetRandomBytes(size_t size) {
    std::vector<uint8_t> buffer(size);
    if (size > 0) {
        randombytes_buf(buffer.data(), size);
    }
    return buffer;
}

uint32_t SodiumInterop::RandomUniform(uint32_t upper_bound) {
    return randombytes_uniform(upper_bound);
}

// ============================================================================
// Encoding
// ============================================================================

std::string SodiumInterop::ToHex(std::span<const uint8_t> data) {
    std::string hex(data.size() * 2 + 1, '\0');
    sodium_bin2hex(hex.data(), hex.size(), data.data(), data.size());
    hex.pop_back();
    return hex;
}

// ============================================================================
// Memory Allocation
// ============================================================================

void* SodiumInterop::AllocateSecure(size_t size) noexcept {
    if (!IsInitialized()) {
        return nullptr;
    }
    return sodium_malloc(size);
}

void SodiumInterop::FreeSecure(void* ptr) noexcept {
    if (ptr != nullptr) {
        sodium_free(ptr);
    }
}

} // namespace hookseal::protocol::crypto
