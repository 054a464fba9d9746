#include "hookseal/encoding/base64.hpp"
#include "hookseal/core/constants.hpp"
#include <openssl/evp.h>
#include <fmt/core.h>
#include <limits>
namespace hookseal::protocol::encoding {
namespace {
    Result<std::vector<uint8_t>, CallbackFailure> Malformed(std::string_view reason) {
        return Result<std::vector<uint8_t>, CallbackFailure>::Err(
            CallbackFailure::PaddingError(
                fmt::format("{}: {}", ErrorMessages::INVALID_BASE64, reason)));
    }
}

bool Base64::IsAlphabetChar(const char c) noexcept {
    return (c >= 'A' && c <= 'Z') ||
           (c >= 'a' && c <= 'z') ||
           (c >= '0' && c <= '9') ||
           c == '+' || c == '/';
}

std::string Base64::Encode(std::span<const uint8_t> data) {
    if (data.empty()) {
        return {};
    }
    const size_t quanta = (data.size() + Base64Constants::QUANTUM_BYTES - 1) / Base64Constants::QUANTUM_BYTES;
    std::string encoded(quanta * Base64Constants::QUANTUM_CHARS + 1, '\0');
    const int written = EVP_EncodeBlock(
        reinterpret_cast<unsigned char*>(encoded.data()),
        data.data(),
        static_cast<int>(data.size()));
    encoded.resize(static_cast<size_t>(written));
    return encoded;
}

Result<std::vector<uint8_t>, CallbackFailure> Base64::Decode(std::string_view encoded) {
    if (encoded.empty()) {
        return Result<std::vector<uint8_t>, CallbackFailure>::Ok({});
    }
    if (encoded.size() % Base64Constants::QUANTUM_CHARS != 0) {
        return Malformed(fmt::format("length {} is not a multiple of 4", encoded.size()));
    }
    if (encoded.size() > static_cast<size_t>(std::numeric_limits<int>::max())) {
        return Malformed("input too large");
    }

    size_t padding = 0;
    while (padding < encoded.size() &&
           encoded[encoded.size() - 1 - padding] == Base64Constants::PAD) {
        ++padding;
    }
    if (padding > Base64Constants::MAX_PADDING) {
        return Malformed("too many padding characters");
    }
    for (size_t i = 0; i < encoded.size() - padding; ++i) {
        if (!IsAlphabetChar(encoded[i])) {
            return Malformed(fmt::format("unexpected character at offset {}", i));
        }
    }

    std::vector<uint8_t> decoded(encoded.size() / Base64Constants::QUANTUM_CHARS * Base64Constants::QUANTUM_BYTES);
    const int written = EVP_DecodeBlock(
        decoded.data(),
        reinterpret_cast<const unsigned char*>(encoded.data()),
        static_cast<int>(encoded.size()));
    if (written < 0 || static_cast<size_t>(written) != decoded.size()) {
        return Malformed("decoder rejected input");
    }
    // EVP_DecodeBlock decodes '=' as zero bits and keeps the resulting bytes
    decoded.resize(decoded.size() - padding);
    return Result<std::vector<uint8_t>, CallbackFailure>::Ok(std::move(decoded));
}
}
