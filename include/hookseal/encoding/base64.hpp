#pragma once
#include "hookseal/core/result.hpp"
#include "hookseal/core/failures.hpp"
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>
namespace hookseal::protocol::encoding {

/**
 * Standard-alphabet (RFC 4648 section 4) base64 with mandatory padding.
 *
 * Decode is strict about structure: the length must be a multiple of four,
 * only `A-Z a-z 0-9 + /` may appear before the padding, and at most two `=`
 * may appear, only at the end. Whitespace is rejected. Non-zero trailing bits
 * in the last quantum are accepted, as every counterparty implementation of
 * the callback protocol does.
 */
class Base64 {
public:
    [[nodiscard]] static std::string Encode(std::span<const uint8_t> data);

    /// Fails with PaddingError on malformed input.
    [[nodiscard]] static Result<std::vector<uint8_t>, CallbackFailure>
    Decode(std::string_view encoded);

    [[nodiscard]] static bool IsAlphabetChar(char c) noexcept;
private:
    Base64() = delete;
};
}
