#include "hookseal/protocol/credential_set.hpp"
#include "hookseal/core/constants.hpp"
#include <fmt/core.h>
namespace hookseal::protocol {
namespace {
    Result<Unit, CallbackFailure> ValidateToken(std::string_view token) {
        if (token.empty()) {
            return Result<Unit, CallbackFailure>::Err(
                CallbackFailure::ConfigError("Token must not be empty"));
        }
        if (token.size() > Constants::MAX_TOKEN_LENGTH) {
            return Result<Unit, CallbackFailure>::Err(
                CallbackFailure::ConfigError(
                    fmt::format("Token must be at most {} characters, got {}",
                        Constants::MAX_TOKEN_LENGTH, token.size())));
        }
        for (const char c : token) {
            // printable ASCII, no space
            if (c < '!' || c > '~') {
                return Result<Unit, CallbackFailure>::Err(
                    CallbackFailure::ConfigError(
                        "Token must contain only printable ASCII characters without whitespace"));
            }
        }
        return Result<Unit, CallbackFailure>::Ok(unit);
    }
}

Result<CredentialSet, CallbackFailure> CredentialSet::Create(
    std::string token,
    std::string_view encoded_key,
    std::optional<std::string> expected_receiver_id) {
    auto token_check = ValidateToken(token);
    if (token_check.IsErr()) {
        return Result<CredentialSet, CallbackFailure>::Err(std::move(token_check).UnwrapErr());
    }
    if (expected_receiver_id.has_value() && expected_receiver_id->empty()) {
        return Result<CredentialSet, CallbackFailure>::Err(
            CallbackFailure::ConfigError("Receiver id, when configured, must not be empty"));
    }
    auto key_result = KeyMaterial::Derive(encoded_key);
    if (key_result.IsErr()) {
        return Result<CredentialSet, CallbackFailure>::Err(std::move(key_result).UnwrapErr());
    }
    std::shared_ptr<const KeyMaterial> key_material =
        std::make_shared<KeyMaterial>(std::move(key_result).Unwrap());
    return Result<CredentialSet, CallbackFailure>::Ok(
        CredentialSet(std::move(token), std::move(key_material), std::move(expected_receiver_id)));
}

Result<CredentialSet, CallbackFailure> CredentialSet::Create(
    const configuration::CallbackConfig& config) {
    return Create(config.token, config.encoding_aes_key, config.receive_id);
}
}
