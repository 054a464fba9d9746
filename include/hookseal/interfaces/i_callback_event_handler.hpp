#pragma once
#include "hookseal/protocol/messages.hpp"
#include <cstdint>
#include <optional>
#include <vector>
namespace hookseal::protocol {
class ICallbackEventHandler {
public:
    virtual ~ICallbackEventHandler() = default;
    /// Returns the plaintext of a passive reply, or nullopt for no reply.
    virtual std::optional<std::vector<uint8_t>> OnEvent(const DecryptedMessage& message) = 0;
};
}
