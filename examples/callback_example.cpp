/**
 * @file callback_example.cpp
 * @brief Walk through URL verification and one encrypted event round trip
 */

#include "hookseal/configuration/callback_config.hpp"
#include "hookseal/protocol/credential_set.hpp"
#include "hookseal/protocol/handshake_service.hpp"
#include "hookseal/protocol/message_codec.hpp"
#include "hookseal/protocol/signature_verifier.hpp"
#include "hookseal/utilities/json_envelope.hpp"

#include <iostream>
#include <memory>
#include <string>

using namespace hookseal::protocol;
using hookseal::protocol::configuration::CallbackConfig;
using hookseal::protocol::utilities::JsonEnvelope;

namespace {

class EchoHandler final : public ICallbackEventHandler {
public:
    std::optional<std::vector<uint8_t>> OnEvent(const DecryptedMessage& message) override {
        std::cout << "   Event payload: " << message.PayloadView() << std::endl;
        const std::string reply = R"({"msgtype":"text","text":{"content":"received"}})";
        return std::vector<uint8_t>(reply.begin(), reply.end());
    }
};

void print_failure(const std::string& step, const CallbackFailure& failure) {
    std::cerr << step << " failed: " << CallbackFailure::TypeName(failure.type)
              << " (HTTP " << failure.HttpStatus() << ", " << failure.PublicMessage() << ")"
              << std::endl;
}

}

int main() {
    std::cout << "=== hookseal - Callback Example ===" << std::endl;
    std::cout << std::endl;

    std::cout << "1. Loading settings..." << std::endl;
    auto config = CallbackConfig::FromJson(R"({
        "token": "QDG6eK",
        "encoding_aes_key": "jWmYm7qr5nMoAUwZRjGtBxmz3KA1tkAj3ykkR6q2B2C",
        "receive_id": "wx5823bf96d3bd56c7"
    })");
    if (config.IsErr()) {
        print_failure("Settings", config.UnwrapErr());
        return 1;
    }
    auto credentials = CredentialSet::Create(config.Unwrap());
    if (credentials.IsErr()) {
        print_failure("Credentials", credentials.UnwrapErr());
        return 1;
    }
    HandshakeService service(std::move(credentials).Unwrap(), std::make_shared<EchoHandler>());
    std::cout << "   ✓ Credentials validated" << std::endl;
    std::cout << std::endl;

    std::cout << "2. Answering URL verification..." << std::endl;
    const VerificationChallenge challenge{
        "5c45ff5e21c57e6ad56bac8758b79b1d9ac89fd3",
        "1409659589",
        "263014780",
        "P9nAzCzyDtyTWESHep1vC5X9xho/qYX3Zpb4yKa9SKld1DsH3Iyt3tP3zNdtp+4RPcs8TgAE7OaBO+FZXvnaqQ=="};
    auto echo = service.HandleVerificationChallenge(challenge);
    if (echo.IsErr()) {
        print_failure("Verification", echo.UnwrapErr());
        return 1;
    }
    const auto& body = echo.Unwrap();
    std::cout << "   ✓ Response body: " << std::string(body.begin(), body.end()) << std::endl;
    std::cout << std::endl;

    std::cout << "3. Simulating an event delivery..." << std::endl;
    const auto& creds = service.Credentials();
    auto cipher = MessageCodec::Encrypt(
        creds.Keys(), R"({"msgtype":"text","text":{"content":"hello"}})", *creds.ExpectedReceiverId());
    if (cipher.IsErr()) {
        print_failure("Sender encryption", cipher.UnwrapErr());
        return 1;
    }
    EventCallback event{"", "1700000000", "1234567890", cipher.Unwrap()};
    auto signature = SignatureVerifier::ComputeSignature(
        creds.Token(), event.timestamp, event.nonce, event.cipher_body);
    if (signature.IsErr()) {
        print_failure("Sender signature", signature.UnwrapErr());
        return 1;
    }
    event.signature = signature.Unwrap();

    auto outcome = service.HandleEventCallback(event);
    if (outcome.IsErr()) {
        print_failure("Event", outcome.UnwrapErr());
        return 1;
    }
    std::cout << "   ✓ Receiver: " << outcome.Unwrap().message.receiver_id << std::endl;
    std::cout << std::endl;

    std::cout << "4. Rendering the passive reply..." << std::endl;
    if (!outcome.Unwrap().reply.has_value()) {
        std::cerr << "Handler produced no reply" << std::endl;
        return 1;
    }
    auto reply_json = JsonEnvelope::RenderReply(*outcome.Unwrap().reply);
    if (reply_json.IsErr()) {
        print_failure("Reply", reply_json.UnwrapErr());
        return 1;
    }
    std::cout << "   ✓ " << reply_json.Unwrap() << std::endl;
    std::cout << std::endl;

    std::cout << "5. Rejecting a tampered request..." << std::endl;
    event.nonce = "1234567891";
    auto rejected = service.HandleEventCallback(event);
    if (rejected.IsOk()) {
        std::cerr << "Tampered request was accepted" << std::endl;
        return 1;
    }
    std::cout << "   ✓ Rejected with " << CallbackFailure::TypeName(rejected.UnwrapErr().type)
              << std::endl;

    return 0;
}
