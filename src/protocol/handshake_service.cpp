#include "hookseal/protocol/handshake_service.hpp"
#include "hookseal/protocol/message_codec.hpp"
#include "hookseal/protocol/signature_verifier.hpp"
#include "hookseal/crypto/sodium_interop.hpp"
#include "hookseal/core/constants.hpp"
#include "hookseal/debug/callback_logger.hpp"
#include <fmt/core.h>
#include <chrono>
#include <initializer_list>
#include <utility>
namespace hookseal::protocol {
using crypto::SodiumInterop;
using debug::Stage;
namespace {
    struct RequiredField {
        std::string_view name;
        std::string_view value;
    };

    Result<Unit, CallbackFailure> RequireFields(
        std::string_view kind,
        std::initializer_list<RequiredField> fields) {
        for (const auto& field : fields) {
            if (field.value.empty()) {
                return Result<Unit, CallbackFailure>::Err(
                    CallbackFailure::InvalidRequest(
                        fmt::format("{}: missing {}", kind, field.name)));
            }
        }
        return Result<Unit, CallbackFailure>::Ok(unit);
    }

    std::string CurrentUnixSeconds() {
        const auto now = std::chrono::system_clock::now().time_since_epoch();
        return std::to_string(std::chrono::duration_cast<std::chrono::seconds>(now).count());
    }

    std::string RandomDecimalNonce() {
        std::string nonce;
        nonce.reserve(Constants::REPLY_NONCE_DIGITS);
        for (size_t i = 0; i < Constants::REPLY_NONCE_DIGITS; ++i) {
            nonce.push_back(static_cast<char>('0' + SodiumInterop::RandomUniform(10)));
        }
        return nonce;
    }

    void LogRejection(std::string_view kind, const CallbackFailure& failure) {
        const std::string line = fmt::format("{} {}", kind, CallbackFailure::TypeName(failure.type));
        HKS_LOG_WARN(Stage::Rejected, line);
    }
}

HandshakeService::HandshakeService(
    CredentialSet credentials,
    std::shared_ptr<ICallbackEventHandler> handler)
    : credentials_(std::move(credentials))
    , handler_(std::move(handler)) {}

Result<DecryptedMessage, CallbackFailure> HandshakeService::AuthenticateAndDecode(
    std::string_view kind,
    std::string_view signature,
    std::string_view timestamp,
    std::string_view nonce,
    std::string_view cipher_body,
    const std::optional<std::string>& expected_receiver_id) const {
    HKS_LOG_INFO(Stage::Received, kind);

    if (!SignatureVerifier::Verify(signature, credentials_.Token(), timestamp, nonce, cipher_body)) {
        auto failure = CallbackFailure::SignatureMismatch(
            fmt::format("{}: {}", kind, ErrorMessages::SIGNATURE_MISMATCH));
        LogRejection(kind, failure);
        return Result<DecryptedMessage, CallbackFailure>::Err(std::move(failure));
    }
    HKS_LOG_INFO(Stage::Authenticated, kind);

    auto decoded = MessageCodec::Decrypt(
        credentials_.Keys(), cipher_body, expected_receiver_id);
    decoded.InspectErr([kind](const CallbackFailure& failure) {
        LogRejection(kind, failure);
    });
    if (decoded.IsOk()) {
        HKS_LOG_INFO(Stage::Decoded, kind);
    }
    return decoded;
}

Result<std::vector<uint8_t>, CallbackFailure> HandshakeService::HandleVerificationChallenge(
    const VerificationChallenge& challenge) const {
    constexpr std::string_view kind = "verification";
    auto required = RequireFields(kind, {
        {"msg_signature", challenge.signature},
        {"timestamp", challenge.timestamp},
        {"nonce", challenge.nonce},
        {"echostr", challenge.echostr},
    });
    if (required.IsErr()) {
        LogRejection(kind, required.UnwrapErr());
        return Result<std::vector<uint8_t>, CallbackFailure>::Err(std::move(required).UnwrapErr());
    }

    // The URL probe is answered regardless of the receiver id it carries.
    auto decoded = AuthenticateAndDecode(
        kind, challenge.signature, challenge.timestamp, challenge.nonce, challenge.echostr,
        std::nullopt);
    if (decoded.IsErr()) {
        return Result<std::vector<uint8_t>, CallbackFailure>::Err(std::move(decoded).UnwrapErr());
    }
    HKS_LOG_INFO(Stage::Responded, kind);
    return Result<std::vector<uint8_t>, CallbackFailure>::Ok(
        std::move(decoded).Unwrap().payload);
}

Result<CallbackOutcome, CallbackFailure> HandshakeService::HandleEventCallback(
    const EventCallback& callback) const {
    constexpr std::string_view kind = "event";
    auto required = RequireFields(kind, {
        {"msg_signature", callback.signature},
        {"timestamp", callback.timestamp},
        {"nonce", callback.nonce},
        {"encrypt", callback.cipher_body},
    });
    if (required.IsErr()) {
        LogRejection(kind, required.UnwrapErr());
        return Result<CallbackOutcome, CallbackFailure>::Err(std::move(required).UnwrapErr());
    }

    auto decoded = AuthenticateAndDecode(
        kind, callback.signature, callback.timestamp, callback.nonce, callback.cipher_body,
        credentials_.ExpectedReceiverId());
    if (decoded.IsErr()) {
        return Result<CallbackOutcome, CallbackFailure>::Err(std::move(decoded).UnwrapErr());
    }

    CallbackOutcome outcome{std::move(decoded).Unwrap(), std::nullopt};
    if (handler_) {
        auto reply_payload = handler_->OnEvent(outcome.message);
        if (reply_payload.has_value()) {
            auto reply = EncryptReply(*reply_payload);
            SodiumInterop::SecureWipe(*reply_payload);
            if (reply.IsErr()) {
                LogRejection(kind, reply.UnwrapErr());
                return Result<CallbackOutcome, CallbackFailure>::Err(std::move(reply).UnwrapErr());
            }
            outcome.reply = std::move(reply).Unwrap();
        }
    }
    HKS_LOG_INFO(Stage::Responded, outcome.reply.has_value() ? "event with reply" : "event");
    return Result<CallbackOutcome, CallbackFailure>::Ok(std::move(outcome));
}

Result<EncryptedReply, CallbackFailure> HandshakeService::EncryptReply(
    std::span<const uint8_t> payload) const {
    return EncryptReply(payload, CurrentUnixSeconds(), RandomDecimalNonce());
}

Result<EncryptedReply, CallbackFailure> HandshakeService::EncryptReply(
    std::span<const uint8_t> payload,
    std::string timestamp,
    std::string nonce) const {
    if (timestamp.empty() || nonce.empty()) {
        return Result<EncryptedReply, CallbackFailure>::Err(
            CallbackFailure::InvalidRequest("reply: timestamp and nonce must be non-empty"));
    }
    const std::string receiver = credentials_.ExpectedReceiverId().value_or(std::string());
    auto encrypted = MessageCodec::Encrypt(credentials_.Keys(), payload, receiver);
    if (encrypted.IsErr()) {
        return Result<EncryptedReply, CallbackFailure>::Err(std::move(encrypted).UnwrapErr());
    }
    std::string cipher = std::move(encrypted).Unwrap();

    return SignatureVerifier::ComputeSignature(credentials_.Token(), timestamp, nonce, cipher)
        .Map([&](std::string signature) {
            return EncryptedReply{
                std::move(cipher),
                std::move(signature),
                std::move(timestamp),
                std::move(nonce)};
        });
}
}
