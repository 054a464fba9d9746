#pragma once
#include "hookseal/core/result.hpp"
#include "hookseal/core/failures.hpp"
#include "hookseal/protocol/key_material.hpp"
#include "hookseal/protocol/messages.hpp"
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>
namespace hookseal::protocol {

/**
 * AES-256-CBC envelope of the callback protocol.
 *
 * Plaintext frame, before PKCS#7 padding to a 16-byte boundary:
 *
 *   [0..16)       random prefix, ignored on decrypt
 *   [16..20)      payload length L, big-endian uint32
 *   [20..20+L)    payload
 *   [20+L..end)   receiver id
 *
 * The whole frame is base64 encoded after encryption.
 */
class MessageCodec {
public:
    /**
     * @brief Decode, decrypt and unframe `cipher_base64`.
     *
     * Failure kinds:
     * - PaddingError: not base64, not a positive multiple of 16 bytes (checked
     *   before the cipher runs), or invalid PKCS#7 bytes
     * - FrameError: fewer than 20 plaintext bytes or L past the end
     * - ReceiverMismatch: `expected_receiver_id` set and different
     */
    [[nodiscard]] static Result<DecryptedMessage, CallbackFailure> Decrypt(
        const KeyMaterial& keys,
        std::string_view cipher_base64,
        const std::optional<std::string>& expected_receiver_id = std::nullopt);

    /// Frames `payload` behind 16 fresh CSPRNG bytes, pads, encrypts, encodes.
    [[nodiscard]] static Result<std::string, CallbackFailure> Encrypt(
        const KeyMaterial& keys,
        std::span<const uint8_t> payload,
        std::string_view receiver_id);

    [[nodiscard]] static Result<std::string, CallbackFailure> Encrypt(
        const KeyMaterial& keys,
        std::string_view payload,
        std::string_view receiver_id);

    /// Deterministic variant of Encrypt with a caller-chosen 16-byte prefix.
    [[nodiscard]] static Result<std::string, CallbackFailure> EncryptWithPrefix(
        const KeyMaterial& keys,
        std::span<const uint8_t> random_prefix,
        std::span<const uint8_t> payload,
        std::string_view receiver_id);

    /// Appends 1..16 bytes of value N so the size becomes a multiple of 16.
    static void ApplyPkcs7Padding(std::vector<uint8_t>& buffer);

    /// Length of `padded` without its PKCS#7 padding, or PaddingError.
    [[nodiscard]] static Result<size_t, CallbackFailure> UnpaddedLength(
        std::span<const uint8_t> padded);
private:
    MessageCodec() = delete;
};
}
