#pragma once
#include "hookseal/core/result.hpp"
#include "hookseal/core/failures.hpp"
#include <vector>
#include <cstdint>
#include <span>
namespace hookseal::protocol::crypto {

/**
 * AES-256-CBC block transform with caller-managed padding.
 *
 * OpenSSL padding is disabled: the callback frame uses PKCS#7 with a strict
 * validation rule that the codec applies itself, so both directions here take
 * and return whole 16-byte blocks only. Input that is not block aligned is
 * rejected with PaddingError before any cipher context is created.
 *
 * CBC without a MAC is malleable. Authenticity of callback bodies comes from
 * the request signature, which must be verified before calling Decrypt.
 */
class AesCbc {
public:
    [[nodiscard]] static Result<std::vector<uint8_t>, CallbackFailure>
    Encrypt(
        std::span<const uint8_t> key,
        std::span<const uint8_t> iv,
        std::span<const uint8_t> padded_plaintext);
    [[nodiscard]] static Result<std::vector<uint8_t>, CallbackFailure>
    Decrypt(
        std::span<const uint8_t> key,
        std::span<const uint8_t> iv,
        std::span<const uint8_t> ciphertext);
private:
    AesCbc() = delete;
};
}
