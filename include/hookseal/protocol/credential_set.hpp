#pragma once
#include "hookseal/core/result.hpp"
#include "hookseal/core/failures.hpp"
#include "hookseal/configuration/callback_config.hpp"
#include "hookseal/protocol/key_material.hpp"
#include <memory>
#include <optional>
#include <string>
#include <string_view>
namespace hookseal::protocol {

/**
 * @brief Validated, immutable credentials of one callback integration.
 *
 * Everything is checked in Create(): a CredentialSet that exists is usable
 * for every request. Copies share the same KeyMaterial.
 */
class CredentialSet {
public:
    [[nodiscard]] static Result<CredentialSet, CallbackFailure> Create(
        std::string token,
        std::string_view encoded_key,
        std::optional<std::string> expected_receiver_id = std::nullopt);

    [[nodiscard]] static Result<CredentialSet, CallbackFailure> Create(
        const configuration::CallbackConfig& config);

    [[nodiscard]] const std::string& Token() const noexcept { return token_; }
    [[nodiscard]] const KeyMaterial& Keys() const noexcept { return *key_material_; }
    [[nodiscard]] const std::optional<std::string>& ExpectedReceiverId() const noexcept {
        return expected_receiver_id_;
    }

private:
    CredentialSet(
        std::string token,
        std::shared_ptr<const KeyMaterial> key_material,
        std::optional<std::string> expected_receiver_id)
        : token_(std::move(token))
        , key_material_(std::move(key_material))
        , expected_receiver_id_(std::move(expected_receiver_id)) {}

    std::string token_;
    std::shared_ptr<const KeyMaterial> key_material_;
    std::optional<std::string> expected_receiver_id_;
};
}
