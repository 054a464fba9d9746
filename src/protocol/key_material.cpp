#include "hookseal/protocol/key_material.hpp"
#include "hookseal/crypto/sodium_interop.hpp"
#include "hookseal/encoding/base64.hpp"
#include <fmt/core.h>
#include <string>
namespace hookseal::protocol {
using crypto::SodiumInterop;
using crypto::SecureMemoryHandle;
using encoding::Base64;

Result<KeyMaterial, CallbackFailure> KeyMaterial::Derive(std::string_view encoded_key) {
    if (encoded_key.size() != Constants::ENCODED_KEY_LENGTH) {
        return Result<KeyMaterial, CallbackFailure>::Err(
            CallbackFailure::ConfigError(
                fmt::format("Encoded AES key must be {} characters, got {}",
                    Constants::ENCODED_KEY_LENGTH, encoded_key.size())));
    }
    for (const char c : encoded_key) {
        if (!Base64::IsAlphabetChar(c)) {
            return Result<KeyMaterial, CallbackFailure>::Err(
                CallbackFailure::ConfigError(
                    "Encoded AES key contains characters outside the base64 alphabet"));
        }
    }

    std::string padded(encoded_key);
    padded.push_back('=');
    auto decoded_result = Base64::Decode(padded);
    if (decoded_result.IsErr()) {
        return Result<KeyMaterial, CallbackFailure>::Err(
            CallbackFailure::ConfigError(
                fmt::format("Encoded AES key is not valid base64: {}",
                    decoded_result.UnwrapErr().message)));
    }
    auto key_bytes = std::move(decoded_result).Unwrap();
    if (key_bytes.size() != Constants::AES_KEY_SIZE) {
        const size_t actual = key_bytes.size();
        SodiumInterop::SecureWipe(key_bytes);
        return Result<KeyMaterial, CallbackFailure>::Err(
            CallbackFailure::ConfigError(
                fmt::format("Encoded AES key must decode to {} bytes, got {}",
                    Constants::AES_KEY_SIZE, actual)));
    }

    auto init_result = SodiumInterop::Initialize();
    if (init_result.IsErr()) {
        SodiumInterop::SecureWipe(key_bytes);
        return Result<KeyMaterial, CallbackFailure>::Err(
            CallbackFailure::FromSodiumFailure(init_result.UnwrapErr()));
    }
    auto handle_result = SecureMemoryHandle::Allocate(Constants::AES_KEY_SIZE);
    if (handle_result.IsErr()) {
        SodiumInterop::SecureWipe(key_bytes);
        return Result<KeyMaterial, CallbackFailure>::Err(
            CallbackFailure::FromSodiumFailure(handle_result.UnwrapErr()));
    }
    SecureMemoryHandle handle = std::move(handle_result).Unwrap();
    auto write_result = handle.Write(key_bytes);
    SodiumInterop::SecureWipe(key_bytes);
    if (write_result.IsErr()) {
        return Result<KeyMaterial, CallbackFailure>::Err(
            CallbackFailure::FromSodiumFailure(write_result.UnwrapErr()));
    }
    return Result<KeyMaterial, CallbackFailure>::Ok(KeyMaterial(std::move(handle)));
}
}
