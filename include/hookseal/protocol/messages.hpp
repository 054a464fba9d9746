#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
namespace hookseal::protocol {

/// Setup-time probe: query parameters of the URL verification request.
struct VerificationChallenge {
    std::string signature;
    std::string timestamp;
    std::string nonce;
    std::string echostr;
};

/// Event delivery: query parameters plus the base64 ciphertext already
/// extracted from the request body.
struct EventCallback {
    std::string signature;
    std::string timestamp;
    std::string nonce;
    std::string cipher_body;
};

struct DecryptedMessage {
    std::vector<uint8_t> payload;
    std::string receiver_id;

    [[nodiscard]] std::string_view PayloadView() const noexcept {
        return {reinterpret_cast<const char*>(payload.data()), payload.size()};
    }
};

/// Encrypted passive reply plus the signature triple the caller checks.
struct EncryptedReply {
    std::string encrypt;
    std::string msg_signature;
    std::string timestamp;
    std::string nonce;
};

struct CallbackOutcome {
    DecryptedMessage message;
    std::optional<EncryptedReply> reply;
};
}
