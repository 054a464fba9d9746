#include "hookseal/protocol/signature_verifier.hpp"
#include "hookseal/crypto/sha1.hpp"
#include "hookseal/crypto/sodium_interop.hpp"
#include <algorithm>
#include <array>
#include <cstdint>
#include <exception>
#include <span>
namespace hookseal::protocol {
using crypto::Sha1;
using crypto::SodiumInterop;
namespace {
    std::span<const uint8_t> AsBytes(std::string_view text) {
        return {reinterpret_cast<const uint8_t*>(text.data()), text.size()};
    }
}

Result<std::string, CallbackFailure> SignatureVerifier::ComputeSignature(
    std::string_view token,
    std::string_view timestamp,
    std::string_view nonce,
    std::string_view cipher_body) {
    std::array<std::string_view, 4> parts = {token, timestamp, nonce, cipher_body};
    // char_traits<char> orders as unsigned char, i.e. by UTF-8 byte value
    std::sort(parts.begin(), parts.end());

    std::string joined;
    joined.reserve(token.size() + timestamp.size() + nonce.size() + cipher_body.size());
    for (const auto part : parts) {
        joined.append(part);
    }

    return Sha1::Digest(AsBytes(joined)).Map([](const crypto::Sha1Digest& digest) {
        return SodiumInterop::ToHex(digest);
    });
}

bool SignatureVerifier::Verify(
    std::string_view candidate_signature,
    std::string_view token,
    std::string_view timestamp,
    std::string_view nonce,
    std::string_view cipher_body) noexcept {
    try {
        auto expected = ComputeSignature(token, timestamp, nonce, cipher_body);
        if (expected.IsErr()) {
            return false;
        }
        return SodiumInterop::ConstantTimeEquals(
            AsBytes(candidate_signature), AsBytes(expected.Unwrap()));
    } catch (const std::exception&) {
        // allocation failure while joining the inputs
        return false;
    }
}
}
