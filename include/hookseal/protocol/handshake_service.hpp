#pragma once
#include "hookseal/core/result.hpp"
#include "hookseal/core/failures.hpp"
#include "hookseal/interfaces/i_callback_event_handler.hpp"
#include "hookseal/protocol/credential_set.hpp"
#include "hookseal/protocol/messages.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>
namespace hookseal::protocol {

/**
 * @brief Entry point for the two inbound request types of a callback URL.
 *
 * Every request runs the same pipeline: require fields, verify the
 * signature, decrypt, then respond. The service holds nothing mutable, so
 * one instance may serve concurrent requests as long as the event handler
 * tolerates concurrent OnEvent calls.
 */
class HandshakeService {
public:
    /// `handler` may be null, in which case events are decrypted and never answered.
    explicit HandshakeService(
        CredentialSet credentials,
        std::shared_ptr<ICallbackEventHandler> handler = nullptr);

    /**
     * @brief Answer the setup-time URL probe.
     *
     * @return The decrypted echostr payload, to be written verbatim as the
     *         response body
     */
    [[nodiscard]] Result<std::vector<uint8_t>, CallbackFailure> HandleVerificationChallenge(
        const VerificationChallenge& challenge) const;

    /// Verify, decrypt and dispatch one event. A reply is present only when
    /// the handler produced one.
    [[nodiscard]] Result<CallbackOutcome, CallbackFailure> HandleEventCallback(
        const EventCallback& callback) const;

    /// Encrypt a passive reply with a fresh timestamp and random nonce.
    [[nodiscard]] Result<EncryptedReply, CallbackFailure> EncryptReply(
        std::span<const uint8_t> payload) const;

    [[nodiscard]] Result<EncryptedReply, CallbackFailure> EncryptReply(
        std::span<const uint8_t> payload,
        std::string timestamp,
        std::string nonce) const;

    [[nodiscard]] const CredentialSet& Credentials() const noexcept { return credentials_; }

private:
    [[nodiscard]] Result<DecryptedMessage, CallbackFailure> AuthenticateAndDecode(
        std::string_view kind,
        std::string_view signature,
        std::string_view timestamp,
        std::string_view nonce,
        std::string_view cipher_body,
        const std::optional<std::string>& expected_receiver_id) const;

    CredentialSet credentials_;
    std::shared_ptr<ICallbackEventHandler> handler_;
};
}
