#include "hookseal/protocol/message_codec.hpp"
#include "hookseal/crypto/aes_cbc.hpp"
#include "hookseal/crypto/sodium_interop.hpp"
#include "hookseal/encoding/base64.hpp"
#include "hookseal/core/constants.hpp"
#include <fmt/core.h>
#include <limits>
namespace hookseal::protocol {
using crypto::AesCbc;
using crypto::SodiumInterop;
using encoding::Base64;
namespace {
    using Bytes = std::vector<uint8_t>;

    void AppendBigEndian32(Bytes& out, const uint32_t value) {
        out.push_back(static_cast<uint8_t>(value >> 24));
        out.push_back(static_cast<uint8_t>(value >> 16));
        out.push_back(static_cast<uint8_t>(value >> 8));
        out.push_back(static_cast<uint8_t>(value));
    }

    uint32_t ReadBigEndian32(std::span<const uint8_t> in) {
        return (static_cast<uint32_t>(in[0]) << 24) |
               (static_cast<uint32_t>(in[1]) << 16) |
               (static_cast<uint32_t>(in[2]) << 8) |
               static_cast<uint32_t>(in[3]);
    }

    std::span<const uint8_t> AsBytes(std::string_view text) {
        return {reinterpret_cast<const uint8_t*>(text.data()), text.size()};
    }

    Result<Bytes, CallbackFailure> RunCipher(
        const KeyMaterial& keys,
        std::span<const uint8_t> input,
        const bool encrypt) {
        return keys.WithKeyAndIv(
                [&](std::span<const uint8_t> key, std::span<const uint8_t> iv) {
                    return encrypt ? AesCbc::Encrypt(key, iv, input)
                                   : AesCbc::Decrypt(key, iv, input);
                })
            .Bind([](Result<Bytes, CallbackFailure> inner) { return inner; });
    }
}

void MessageCodec::ApplyPkcs7Padding(std::vector<uint8_t>& buffer) {
    const size_t pad = Constants::AES_BLOCK_SIZE - buffer.size() % Constants::AES_BLOCK_SIZE;
    buffer.insert(buffer.end(), pad, static_cast<uint8_t>(pad));
}

Result<size_t, CallbackFailure> MessageCodec::UnpaddedLength(std::span<const uint8_t> padded) {
    if (padded.empty() || padded.size() % Constants::AES_BLOCK_SIZE != 0) {
        return Result<size_t, CallbackFailure>::Err(
            CallbackFailure::PaddingError(std::string(ErrorMessages::CIPHERTEXT_NOT_BLOCK_ALIGNED)));
    }
    const uint8_t pad = padded.back();
    if (pad < Constants::MIN_PKCS7_PAD || pad > Constants::MAX_PKCS7_PAD) {
        return Result<size_t, CallbackFailure>::Err(
            CallbackFailure::PaddingError(
                fmt::format("{}: pad byte {} out of range", ErrorMessages::INVALID_PKCS7_PADDING, pad)));
    }
    // Inspect the whole last block so timing does not depend on pad
    const auto last_block = padded.last(Constants::AES_BLOCK_SIZE);
    uint8_t mismatch = 0;
    for (size_t i = 0; i < Constants::AES_BLOCK_SIZE; ++i) {
        const uint8_t in_pad = static_cast<uint8_t>(0 - static_cast<uint8_t>(Constants::AES_BLOCK_SIZE - i <= pad));
        mismatch |= static_cast<uint8_t>(in_pad & (last_block[i] ^ pad));
    }
    if (mismatch != 0) {
        return Result<size_t, CallbackFailure>::Err(
            CallbackFailure::PaddingError(
                fmt::format("{}: pad bytes inconsistent", ErrorMessages::INVALID_PKCS7_PADDING)));
    }
    return Result<size_t, CallbackFailure>::Ok(padded.size() - pad);
}

Result<DecryptedMessage, CallbackFailure> MessageCodec::Decrypt(
    const KeyMaterial& keys,
    std::string_view cipher_base64,
    const std::optional<std::string>& expected_receiver_id) {
    auto decoded_result = Base64::Decode(cipher_base64);
    if (decoded_result.IsErr()) {
        return Result<DecryptedMessage, CallbackFailure>::Err(std::move(decoded_result).UnwrapErr());
    }
    const Bytes ciphertext = std::move(decoded_result).Unwrap();
    if (ciphertext.empty() || ciphertext.size() % Constants::AES_BLOCK_SIZE != 0) {
        return Result<DecryptedMessage, CallbackFailure>::Err(
            CallbackFailure::PaddingError(
                fmt::format("{} ({} bytes)",
                    ErrorMessages::CIPHERTEXT_NOT_BLOCK_ALIGNED, ciphertext.size())));
    }

    auto plain_result = RunCipher(keys, ciphertext, false);
    if (plain_result.IsErr()) {
        return Result<DecryptedMessage, CallbackFailure>::Err(std::move(plain_result).UnwrapErr());
    }
    Bytes plaintext = std::move(plain_result).Unwrap();

    auto unpadded_result = UnpaddedLength(plaintext);
    if (unpadded_result.IsErr()) {
        SodiumInterop::SecureWipe(plaintext);
        return Result<DecryptedMessage, CallbackFailure>::Err(std::move(unpadded_result).UnwrapErr());
    }
    const size_t frame_length = unpadded_result.Unwrap();
    if (frame_length < Constants::FRAME_HEADER_SIZE) {
        SodiumInterop::SecureWipe(plaintext);
        return Result<DecryptedMessage, CallbackFailure>::Err(
            CallbackFailure::FrameError(
                fmt::format("{}: {} < {}",
                    ErrorMessages::FRAME_TOO_SHORT, frame_length, Constants::FRAME_HEADER_SIZE)));
    }

    const std::span<const uint8_t> frame(plaintext.data(), frame_length);
    const uint32_t payload_length = ReadBigEndian32(
        frame.subspan(Constants::RANDOM_PREFIX_SIZE, Constants::LENGTH_FIELD_SIZE));
    const size_t available = frame_length - Constants::FRAME_HEADER_SIZE;
    if (payload_length > available) {
        SodiumInterop::SecureWipe(plaintext);
        return Result<DecryptedMessage, CallbackFailure>::Err(
            CallbackFailure::FrameError(
                fmt::format("{}: {} > {}",
                    ErrorMessages::FRAME_LENGTH_OVERFLOW, payload_length, available)));
    }

    const auto payload = frame.subspan(Constants::FRAME_HEADER_SIZE, payload_length);
    const auto receiver = frame.subspan(Constants::FRAME_HEADER_SIZE + payload_length);

    DecryptedMessage message;
    message.payload.assign(payload.begin(), payload.end());
    message.receiver_id.assign(receiver.begin(), receiver.end());
    SodiumInterop::SecureWipe(plaintext);

    if (expected_receiver_id.has_value() && message.receiver_id != *expected_receiver_id) {
        SodiumInterop::SecureWipe(message.payload);
        return Result<DecryptedMessage, CallbackFailure>::Err(
            CallbackFailure::ReceiverMismatch(std::string(ErrorMessages::RECEIVER_MISMATCH)));
    }
    return Result<DecryptedMessage, CallbackFailure>::Ok(std::move(message));
}

Result<std::string, CallbackFailure> MessageCodec::Encrypt(
    const KeyMaterial& keys,
    std::span<const uint8_t> payload,
    std::string_view receiver_id) {
    Bytes prefix = SodiumInterop::GetRandomBytes(Constants::RANDOM_PREFIX_SIZE);
    return EncryptWithPrefix(keys, prefix, payload, receiver_id);
}

Result<std::string, CallbackFailure> MessageCodec::Encrypt(
    const KeyMaterial& keys,
    std::string_view payload,
    std::string_view receiver_id) {
    return Encrypt(keys, AsBytes(payload), receiver_id);
}

Result<std::string, CallbackFailure> MessageCodec::EncryptWithPrefix(
    const KeyMaterial& keys,
    std::span<const uint8_t> random_prefix,
    std::span<const uint8_t> payload,
    std::string_view receiver_id) {
    if (random_prefix.size() != Constants::RANDOM_PREFIX_SIZE) {
        return Result<std::string, CallbackFailure>::Err(
            CallbackFailure::FrameError(
                fmt::format("Random prefix must be {} bytes, got {}",
                    Constants::RANDOM_PREFIX_SIZE, random_prefix.size())));
    }
    if (payload.size() > std::numeric_limits<uint32_t>::max()) {
        return Result<std::string, CallbackFailure>::Err(
            CallbackFailure::FrameError(
                fmt::format("Payload of {} bytes does not fit the length field", payload.size())));
    }

    Bytes frame;
    frame.reserve(Constants::FRAME_HEADER_SIZE + payload.size() + receiver_id.size() +
                  Constants::AES_BLOCK_SIZE);
    frame.insert(frame.end(), random_prefix.begin(), random_prefix.end());
    AppendBigEndian32(frame, static_cast<uint32_t>(payload.size()));
    frame.insert(frame.end(), payload.begin(), payload.end());
    const auto receiver = AsBytes(receiver_id);
    frame.insert(frame.end(), receiver.begin(), receiver.end());
    ApplyPkcs7Padding(frame);

    auto cipher_result = RunCipher(keys, frame, true);
    SodiumInterop::SecureWipe(frame);
    if (cipher_result.IsErr()) {
        return Result<std::string, CallbackFailure>::Err(std::move(cipher_result).UnwrapErr());
    }
    return Result<std::string, CallbackFailure>::Ok(Base64::Encode(cipher_result.Unwrap()));
}
}
