#pragma once
#include "hookseal/core/result.hpp"
#include "hookseal/core/failures.hpp"
#include "hookseal/protocol/messages.hpp"
#include <string>
#include <string_view>
namespace hookseal::protocol::utilities {

/// JSON bodies exchanged with the callback sender.
class JsonEnvelope {
public:
    /// Extract `encrypt` from `{"encrypt": "..."}`. Unknown fields are ignored.
    /// Malformed JSON or a missing/empty field is an InvalidRequest.
    [[nodiscard]] static Result<std::string, CallbackFailure> ParseCallbackBody(std::string_view json);

    /// Render `{"encrypt","msgsignature","timestamp","nonce"}`.
    [[nodiscard]] static Result<std::string, CallbackFailure> RenderReply(const EncryptedReply& reply);
private:
    JsonEnvelope() = delete;
};
}
