#include <catch2/catch_test_macros.hpp>
#include "hookseal/protocol/credential_set.hpp"
#include "hookseal/protocol/handshake_service.hpp"
#include "hookseal/protocol/message_codec.hpp"
#include "hookseal/protocol/signature_verifier.hpp"
#include "hookseal/crypto/aes_cbc.hpp"
#include "hookseal/crypto/sodium_interop.hpp"
#include "hookseal/encoding/base64.hpp"
#include "hookseal/utilities/json_envelope.hpp"
#include "helpers/test_vectors.hpp"
#include <string>
#include <vector>

using namespace hookseal::protocol;
using namespace hookseal::protocol::crypto;
using namespace hookseal::test;

namespace {

struct DeterministicVector {
    std::string_view payload;
    std::string_view receiver;
    std::string_view expected_cipher;
};

// Produced by an independent implementation of the same frame with the
// sample key and the fixed prefix "0123456789abcdef".
const std::vector<DeterministicVector>& DeterministicVectors() {
    static const std::vector<DeterministicVector> vectors = {
        {"hello", kSampleReceiverId,
         "sKqRbbiSUnDhFHOvPjtUMd2aKGsnO1wGUhhgmucZyOrq6RdMvc9lEyNY/NQrmmdb"},
        {R"({"msgtype":"text"})", kSampleReceiverId,
         "sKqRbbiSUnDhFHOvPjtUMXwcNQzHVFNeLGShu75XAxnXOX2OXGZ6CB0ByUvKFUx7vUfu2VcOMSZPFqHSjXC40A=="},
        {"twelve bytes", kSampleReceiverId,
         "sKqRbbiSUnDhFHOvPjtUMXXUClxpH/MOXLcmGkTAj/66jQGfvu3tnmpETC/x/MTetdMd79yfnUWhTqLxkMTOWQ=="},
        {"twelve bytes", "",
         "sKqRbbiSUnDhFHOvPjtUMXXUClxpH/MOXLcmGkTAj/5CEv9gyrbQ2/rRWzb7XURl"},
    };
    return vectors;
}

KeyMaterial SampleKeys() {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    return KeyMaterial::Derive(kSampleEncodedKey).Unwrap();
}

}

TEST_CASE("Interop - Published URL verification sample", "[interop][vectors]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());

    SECTION("Signature over token, timestamp, nonce and echostr") {
        REQUIRE(SignatureVerifier::ComputeSignature(
            kSampleToken, kSampleTimestamp, kSampleNonce, kSampleEchostr).Unwrap() == kSampleSignature);
    }

    SECTION("Raw plaintext layout") {
        const auto keys = SampleKeys();
        const auto cipher = encoding::Base64::Decode(kSampleEchostr).Unwrap();
        REQUIRE(cipher.size() == 64);
        const auto plain = keys.WithKeyAndIv([&](std::span<const uint8_t> key, std::span<const uint8_t> iv) {
            return AesCbc::Decrypt(key, iv, cipher);
        }).Unwrap().Unwrap();

        REQUIRE(std::string(plain.begin(), plain.begin() + 16) == "c41b64491c2468d0");
        REQUIRE(std::vector<uint8_t>(plain.begin() + 16, plain.begin() + 20) ==
                std::vector<uint8_t>{0x00, 0x00, 0x00, 0x13});
        REQUIRE(plain.back() == 7);
    }

    SECTION("Codec output") {
        const auto keys = SampleKeys();
        auto message = MessageCodec::Decrypt(keys, kSampleEchostr, std::string(kSampleReceiverId));
        REQUIRE(message.IsOk());
        REQUIRE(message.Unwrap().PayloadView() == kSampleEchoPayload);
        REQUIRE(message.Unwrap().receiver_id == kSampleReceiverId);
    }

    SECTION("End to end through the service") {
        auto credentials = CredentialSet::Create(
            std::string(kSampleToken), kSampleEncodedKey, std::string(kSampleReceiverId)).Unwrap();
        HandshakeService service(std::move(credentials));
        auto body = service.HandleVerificationChallenge({
            std::string(kSampleSignature),
            std::string(kSampleTimestamp),
            std::string(kSampleNonce),
            std::string(kSampleEchostr)});
        REQUIRE(body.IsOk());
        REQUIRE(body.Unwrap() == Bytes(kSampleEchoPayload));
    }
}

TEST_CASE("Interop - Deterministic frames", "[interop][vectors]") {
    const auto keys = SampleKeys();
    for (const auto& vector : DeterministicVectors()) {
        auto cipher = MessageCodec::EncryptWithPrefix(
            keys, AsBytes(kFixedPrefix), AsBytes(vector.payload), vector.receiver);
        REQUIRE(cipher.IsOk());
        REQUIRE(cipher.Unwrap() == vector.expected_cipher);

        auto message = MessageCodec::Decrypt(keys, vector.expected_cipher);
        REQUIRE(message.IsOk());
        REQUIRE(message.Unwrap().PayloadView() == vector.payload);
        REQUIRE(message.Unwrap().receiver_id == vector.receiver);
    }
}

TEST_CASE("Interop - Passive reply signature", "[interop][vectors][reply]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const std::string_view cipher = DeterministicVectors().front().expected_cipher;
    auto signature = SignatureVerifier::ComputeSignature(kSampleToken, "1700000000", "1234567890", cipher);
    REQUIRE(signature.Unwrap() == "64a7537cf5682fe1f6fc71f5cb42b25e496a5ccb");

    auto json = utilities::JsonEnvelope::RenderReply(
        EncryptedReply{std::string(cipher), signature.Unwrap(), "1700000000", "1234567890"});
    REQUIRE(json.IsOk());
    REQUIRE(json.Unwrap().find(R"("msgsignature":"64a7537cf5682fe1f6fc71f5cb42b25e496a5ccb")") != std::string::npos);
    REQUIRE(json.Unwrap().find(R"("timestamp":"1700000000")") != std::string::npos);
    REQUIRE(utilities::JsonEnvelope::ParseCallbackBody(json.Unwrap()).Unwrap() == cipher);
}
