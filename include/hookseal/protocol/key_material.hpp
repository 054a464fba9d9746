#pragma once
#include "hookseal/core/result.hpp"
#include "hookseal/core/failures.hpp"
#include "hookseal/core/constants.hpp"
#include "hookseal/crypto/sodium_secure_memory_handle.hpp"
#include <cstdint>
#include <span>
#include <string_view>
#include <type_traits>
namespace hookseal::protocol {

/**
 * @brief AES-256 key and IV derived from a 43-character encoded key.
 *
 * The IV is not independent: it is always the first 16 bytes of the key.
 * Counterparties derive it the same way, so this cannot change.
 *
 * The 32 key bytes live in libsodium guarded memory and are written exactly
 * once, in Derive(). After that the object is read-only and may be shared
 * between threads without synchronisation.
 */
class KeyMaterial {
public:
    /**
     * @brief Decode `encoded_key` + "=" and require exactly 32 bytes.
     *
     * @return ConfigError when the input is not 43 base64-alphabet characters
     *         or does not decode to 32 bytes
     */
    [[nodiscard]] static Result<KeyMaterial, CallbackFailure> Derive(std::string_view encoded_key);

    KeyMaterial(KeyMaterial&&) noexcept = default;
    KeyMaterial& operator=(KeyMaterial&&) noexcept = default;
    KeyMaterial(const KeyMaterial&) = delete;
    KeyMaterial& operator=(const KeyMaterial&) = delete;

    /// Calls func(key, iv). Neither span may outlive the call.
    template<typename F>
    auto WithKeyAndIv(F&& func) const
        -> Result<std::invoke_result_t<F, std::span<const uint8_t>, std::span<const uint8_t>>, CallbackFailure> {
        using T = std::invoke_result_t<F, std::span<const uint8_t>, std::span<const uint8_t>>;
        return key_.WithReadAccess([&func](std::span<const uint8_t> key) -> T {
                return std::forward<F>(func)(key, key.first(Constants::AES_IV_SIZE));
            })
            .MapErr([](SodiumFailure failure) {
                return CallbackFailure::FromSodiumFailure(failure);
            });
    }

private:
    explicit KeyMaterial(crypto::SecureMemoryHandle key) noexcept
        : key_(std::move(key)) {}

    crypto::SecureMemoryHandle key_;
};
}
