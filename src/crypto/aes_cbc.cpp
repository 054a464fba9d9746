#include "hookseal/crypto/aes_cbc.hpp"
#include "hookseal/crypto/sodium_interop.hpp"
#include "hookseal/core/constants.hpp"
#include <openssl/evp.h>
#include <openssl/err.h>
#include <fmt/core.h>
#include <limits>
#include <memory>
#include <string>
namespace hookseal::protocol::crypto {
using OpenSSL = OpenSSLConstants;
namespace {
    struct EVP_CIPHER_CTX_Deleter {
        void operator()(EVP_CIPHER_CTX* ctx) const {
            if (ctx) {
                EVP_CIPHER_CTX_free(ctx);
            }
        }
    };
    using EVP_CIPHER_CTX_ptr = std::unique_ptr<EVP_CIPHER_CTX, EVP_CIPHER_CTX_Deleter>;
    std::string GetOpenSSLError() {
        const unsigned long err = ERR_get_error();
        if (err == OpenSSL::NO_ERROR) {
            return std::string(OpenSSL::UNKNOWN_ERROR_MESSAGE);
        }
        char buffer[Constants::OPENSSL_ERROR_BUFFER_SIZE];
        ERR_error_string_n(err, buffer, sizeof(buffer));
        return std::string(buffer);
    }
    Result<Unit, CallbackFailure> ValidateParameters(
        std::span<const uint8_t> key,
        std::span<const uint8_t> iv,
        std::span<const uint8_t> input) {
        if (key.size() != Constants::AES_KEY_SIZE) {
            return Result<Unit, CallbackFailure>::Err(
                CallbackFailure::CryptoBackend(
                    fmt::format("AES-256-CBC key must be {} bytes, got {}",
                        Constants::AES_KEY_SIZE, key.size())));
        }
        if (iv.size() != Constants::AES_IV_SIZE) {
            return Result<Unit, CallbackFailure>::Err(
                CallbackFailure::CryptoBackend(
                    fmt::format("AES-CBC IV must be {} bytes, got {}",
                        Constants::AES_IV_SIZE, iv.size())));
        }
        if (input.empty() || input.size() % Constants::AES_BLOCK_SIZE != 0) {
            return Result<Unit, CallbackFailure>::Err(
                CallbackFailure::PaddingError(
                    fmt::format("{} ({} bytes)",
                        ErrorMessages::CIPHERTEXT_NOT_BLOCK_ALIGNED, input.size())));
        }
        if (input.size() > static_cast<size_t>(std::numeric_limits<int>::max())) {
            return Result<Unit, CallbackFailure>::Err(
                CallbackFailure::CryptoBackend(
                    fmt::format("AES-CBC input too large: {} bytes", input.size())));
        }
        return Result<Unit, CallbackFailure>::Ok(unit);
    }
}
Result<std::vector<uint8_t>, CallbackFailure>
AesCbc::Encrypt(
    std::span<const uint8_t> key,
    std::span<const uint8_t> iv,
    std::span<const uint8_t> padded_plaintext) {
    auto validation = ValidateParameters(key, iv, padded_plaintext);
    if (validation.IsErr()) {
        return Result<std::vector<uint8_t>, CallbackFailure>::Err(
            std::move(validation).UnwrapErr());
    }
    EVP_CIPHER_CTX_ptr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        return Result<std::vector<uint8_t>, CallbackFailure>::Err(
            CallbackFailure::CryptoBackend(
                fmt::format("Failed to create cipher context: {}", GetOpenSSLError())));
    }
    if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_cbc(), nullptr, key.data(), iv.data()) != OpenSSL::SUCCESS) {
        return Result<std::vector<uint8_t>, CallbackFailure>::Err(
            CallbackFailure::CryptoBackend(
                fmt::format("Failed to initialize AES-256-CBC: {}", GetOpenSSLError())));
    }
    if (EVP_CIPHER_CTX_set_padding(ctx.get(), 0) != OpenSSL::SUCCESS) {
        return Result<std::vector<uint8_t>, CallbackFailure>::Err(
            CallbackFailure::CryptoBackend(
                fmt::format("Failed to disable cipher padding: {}", GetOpenSSLError())));
    }
    std::vector<uint8_t> output(padded_plaintext.size());
    int ciphertext_len = 0;
    if (EVP_EncryptUpdate(ctx.get(), output.data(), &ciphertext_len,
                         padded_plaintext.data(),
                         static_cast<int>(padded_plaintext.size())) != OpenSSL::SUCCESS) {
        return Result<std::vector<uint8_t>, CallbackFailure>::Err(
            CallbackFailure::CryptoBackend(
                fmt::format("Encryption failed: {}", GetOpenSSLError())));
    }
    int final_len = 0;
    if (EVP_EncryptFinal_ex(ctx.get(), output.data() + ciphertext_len, &final_len) != OpenSSL::SUCCESS) {
        return Result<std::vector<uint8_t>, CallbackFailure>::Err(
            CallbackFailure::CryptoBackend(
                fmt::format("Encryption finalization failed: {}", GetOpenSSLError())));
    }
    output.resize(static_cast<size_t>(ciphertext_len + final_len));
    return Result<std::vector<uint8_t>, CallbackFailure>::Ok(std::move(output));
}
Result<std::vector<uint8_t>, CallbackFailure>
AesCbc::Decrypt(
    std::span<const uint8_t> key,
    std::span<const uint8_t> iv,
    std::span<const uint8_t> ciphertext) {
    auto validation = ValidateParameters(key, iv, ciphertext);
    if (validation.IsErr()) {
        return Result<std::vector<uint8_t>, CallbackFailure>::Err(
            std::move(validation).UnwrapErr());
    }
    EVP_CIPHER_CTX_ptr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        return Result<std::vector<uint8_t>, CallbackFailure>::Err(
            CallbackFailure::CryptoBackend(
                fmt::format("Failed to create cipher context: {}", GetOpenSSLError())));
    }
    if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_cbc(), nullptr, key.data(), iv.data()) != OpenSSL::SUCCESS) {
        return Result<std::vector<uint8_t>, CallbackFailure>::Err(
            CallbackFailure::CryptoBackend(
                fmt::format("Failed to initialize AES-256-CBC: {}", GetOpenSSLError())));
    }
    if (EVP_CIPHER_CTX_set_padding(ctx.get(), 0) != OpenSSL::SUCCESS) {
        return Result<std::vector<uint8_t>, CallbackFailure>::Err(
            CallbackFailure::CryptoBackend(
                fmt::format("Failed to disable cipher padding: {}", GetOpenSSLError())));
    }
    std::vector<uint8_t> output(ciphertext.size());
    int plaintext_len = 0;
    if (EVP_DecryptUpdate(ctx.get(), output.data(), &plaintext_len,
                         ciphertext.data(),
                         static_cast<int>(ciphertext.size())) != OpenSSL::SUCCESS) {
        SodiumInterop::SecureWipe(output);
        return Result<std::vector<uint8_t>, CallbackFailure>::Err(
            CallbackFailure::CryptoBackend(
                fmt::format("Decryption failed: {}", GetOpenSSLError())));
    }
    int final_len = 0;
    if (EVP_DecryptFinal_ex(ctx.get(), output.data() + plaintext_len, &final_len) != OpenSSL::SUCCESS) {
        SodiumInterop::SecureWipe(output);
        return Result<std::vector<uint8_t>, CallbackFailure>::Err(
            CallbackFailure::CryptoBackend(
                fmt::format("Decryption finalization failed: {}", GetOpenSSLError())));
    }
    output.resize(static_cast<size_t>(plaintext_len + final_len));
    return Result<std::vector<uint8_t>, CallbackFailure>::Ok(std::move(output));
}
}
