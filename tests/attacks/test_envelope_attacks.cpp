#include <catch2/catch_test_macros.hpp>
#include "hookseal/protocol/handshake_service.hpp"
#include "hookseal/protocol/message_codec.hpp"
#include "hookseal/protocol/signature_verifier.hpp"
#include "hookseal/crypto/sodium_interop.hpp"
#include "hookseal/encoding/base64.hpp"
#include "helpers/mock_event_handler.hpp"
#include "helpers/test_vectors.hpp"
#include <string>
#include <vector>

using namespace hookseal::protocol;
using namespace hookseal::protocol::crypto;
using namespace hookseal::protocol::encoding;
using namespace hookseal::test;
using hookseal::protocol::test_helpers::MockEventHandler;

struct AttackTestContext {
    std::shared_ptr<MockEventHandler> handler;
    std::unique_ptr<HandshakeService> service;
    EventCallback event;

    static AttackTestContext Create() {
        REQUIRE(SodiumInterop::Initialize().IsOk());
        AttackTestContext ctx;
        ctx.handler = std::make_shared<MockEventHandler>("ack");
        ctx.service = std::make_unique<HandshakeService>(
            CredentialSet::Create(std::string(kSampleToken), kSampleEncodedKey,
                                  std::string(kSampleReceiverId)).Unwrap(),
            ctx.handler);
        const auto& credentials = ctx.service->Credentials();
        ctx.event.timestamp = "1700000000";
        ctx.event.nonce = "1234567890";
        ctx.event.cipher_body = MessageCodec::Encrypt(
            credentials.Keys(), R"({"msgtype":"text","text":{"content":"transfer"}})",
            kSampleReceiverId).Unwrap();
        ctx.event.signature = SignatureVerifier::ComputeSignature(
            credentials.Token(), ctx.event.timestamp, ctx.event.nonce, ctx.event.cipher_body).Unwrap();
        return ctx;
    }
};

static char FlipBase64Char(char c) {
    return c == 'A' ? 'B' : 'A';
}

TEST_CASE("Attacks - Tampered requests fail authentication", "[attacks][signature]") {
    auto ctx = AttackTestContext::Create();
    REQUIRE(ctx.service->HandleEventCallback(ctx.event).IsOk());
    REQUIRE(ctx.handler->Calls() == 1);

    SECTION("Every single-character change in the body") {
        // Padding characters are skipped: changing them breaks base64 first
        const size_t editable = ctx.event.cipher_body.find('=');
        const size_t limit = editable == std::string::npos ? ctx.event.cipher_body.size() : editable;
        for (size_t i = 0; i < limit; ++i) {
            auto tampered = ctx.event;
            tampered.cipher_body[i] = FlipBase64Char(tampered.cipher_body[i]);
            auto outcome = ctx.service->HandleEventCallback(tampered);
            REQUIRE(outcome.IsErr());
            REQUIRE(outcome.UnwrapErr().type == CallbackFailureType::SignatureMismatch);
        }
        REQUIRE(ctx.handler->Calls() == 1);
    }
    SECTION("Bit flips in timestamp and nonce") {
        for (size_t i = 0; i < ctx.event.timestamp.size(); ++i) {
            for (int bit = 0; bit < 7; ++bit) {
                auto tampered = ctx.event;
                tampered.timestamp[i] = static_cast<char>(tampered.timestamp[i] ^ (1 << bit));
                REQUIRE(ctx.service->HandleEventCallback(tampered).IsErr());
            }
        }
        for (size_t i = 0; i < ctx.event.nonce.size(); ++i) {
            auto tampered = ctx.event;
            tampered.nonce[i] = static_cast<char>(tampered.nonce[i] ^ 0x01);
            REQUIRE(ctx.service->HandleEventCallback(tampered).IsErr());
        }
        REQUIRE(ctx.handler->Calls() == 1);
    }
    SECTION("Signature forged with a different token") {
        auto forged = ctx.event;
        forged.signature = SignatureVerifier::ComputeSignature(
            "guessed", forged.timestamp, forged.nonce, forged.cipher_body).Unwrap();
        REQUIRE(ctx.service->HandleEventCallback(forged).UnwrapErr().type ==
                CallbackFailureType::SignatureMismatch);
    }
    SECTION("Rejection message reveals nothing about the expected signature") {
        auto tampered = ctx.event;
        tampered.nonce = "0";
        auto outcome = ctx.service->HandleEventCallback(tampered);
        const auto& failure = outcome.UnwrapErr();
        const auto expected = SignatureVerifier::ComputeSignature(
            kSampleToken, tampered.timestamp, tampered.nonce, tampered.cipher_body).Unwrap();
        REQUIRE(failure.message.find(expected) == std::string::npos);
        REQUIRE(failure.message.find(ctx.event.signature) == std::string::npos);
        REQUIRE(failure.PublicMessage() == "invalid signature");
    }
}

TEST_CASE("Attacks - CBC malleability is caught by frame checks", "[attacks][codec]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const auto keys = KeyMaterial::Derive(kSampleEncodedKey).Unwrap();

    SECTION("Flipping the high bit of the length field through the previous block") {
        const auto cipher = MessageCodec::EncryptWithPrefix(
            keys, AsBytes(kFixedPrefix), AsBytes("hello"), kSampleReceiverId).Unwrap();
        auto raw = Base64::Decode(cipher).Unwrap();
        // Byte 0 of block 0 XORs into byte 16 of the plaintext: the length MSB
        raw[0] ^= 0x80;
        auto message = MessageCodec::Decrypt(keys, Base64::Encode(raw));
        REQUIRE(message.IsErr());
        REQUIRE(message.UnwrapErr().type == CallbackFailureType::FrameError);
    }
    SECTION("Dropping the trailing pad block") {
        const auto cipher = MessageCodec::EncryptWithPrefix(
            keys, AsBytes(kFixedPrefix), AsBytes("twelve bytes"), "").Unwrap();
        auto raw = Base64::Decode(cipher).Unwrap();
        REQUIRE(raw.size() == 48);
        raw.resize(32);
        auto message = MessageCodec::Decrypt(keys, Base64::Encode(raw));
        REQUIRE(message.IsErr());
        REQUIRE(message.UnwrapErr().type == CallbackFailureType::PaddingError);
    }
    SECTION("Redirecting a message to another receiver") {
        const auto cipher = MessageCodec::Encrypt(keys, "x", "tenant-a").Unwrap();
        REQUIRE(MessageCodec::Decrypt(keys, cipher, std::string("tenant-b")).UnwrapErr().type ==
                CallbackFailureType::ReceiverMismatch);
    }
}

TEST_CASE("Attacks - Garbage ciphertext never crashes", "[attacks][codec][fuzzing]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const auto keys = KeyMaterial::Derive(kSampleEncodedKey).Unwrap();

    for (size_t blocks = 1; blocks <= 8; ++blocks) {
        for (int round = 0; round < 32; ++round) {
            const auto noise = SodiumInterop::GetRandomBytes(blocks * 16);
            Result<DecryptedMessage, CallbackFailure> result = Result<DecryptedMessage, CallbackFailure>::Err(
                CallbackFailure::InvalidRequest("unset"));
            REQUIRE_NOTHROW(result = MessageCodec::Decrypt(keys, Base64::Encode(noise)));
            if (result.IsErr()) {
                REQUIRE(result.UnwrapErr().IsRequestRejection());
            }
        }
    }
}
