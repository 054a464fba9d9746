#pragma once
#include "hookseal/core/result.hpp"
#include "hookseal/core/failures.hpp"
#include "hookseal/core/constants.hpp"
#include <array>
#include <cstdint>
#include <span>
namespace hookseal::protocol::crypto {
using Sha1Digest = std::array<uint8_t, Constants::SHA1_DIGEST_SIZE>;

/// SHA-1 is mandated by the callback signature format; do not use it for
/// anything new.
class Sha1 {
public:
    [[nodiscard]] static Result<Sha1Digest, CallbackFailure>
    Digest(std::span<const uint8_t> data);
private:
    Sha1() = delete;
};
}
