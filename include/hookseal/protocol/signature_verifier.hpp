#pragma once
#include "hookseal/core/result.hpp"
#include "hookseal/core/failures.hpp"
#include <string>
#include <string_view>
namespace hookseal::protocol {

/**
 * Request signature: lowercase hex SHA-1 of the four inputs sorted
 * byte-wise ascending and concatenated without separator.
 */
class SignatureVerifier {
public:
    [[nodiscard]] static Result<std::string, CallbackFailure> ComputeSignature(
        std::string_view token,
        std::string_view timestamp,
        std::string_view nonce,
        std::string_view cipher_body);

    /// Constant-time check of `candidate_signature`. Returns false on any
    /// mismatch or backend failure; the caller decides how to reject.
    [[nodiscard]] static bool Verify(
        std::string_view candidate_signature,
        std::string_view token,
        std::string_view timestamp,
        std::string_view nonce,
        std::string_view cipher_body) noexcept;
private:
    SignatureVerifier() = delete;
};
}
