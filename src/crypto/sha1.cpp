#include "hookseal/crypto/sha1.hpp"
#include <openssl/evp.h>
#include <openssl/err.h>
#include <fmt/core.h>
namespace hookseal::protocol::crypto {
Result<Sha1Digest, CallbackFailure> Sha1::Digest(std::span<const uint8_t> data) {
    Sha1Digest digest{};
    unsigned int digest_len = 0;
    if (EVP_Digest(data.data(), data.size(), digest.data(), &digest_len,
                   EVP_sha1(), nullptr) != OpenSSLConstants::SUCCESS) {
        return Result<Sha1Digest, CallbackFailure>::Err(
            CallbackFailure::CryptoBackend(
                fmt::format("SHA-1 digest failed: error {}", ERR_get_error())));
    }
    if (digest_len != digest.size()) {
        return Result<Sha1Digest, CallbackFailure>::Err(
            CallbackFailure::CryptoBackend(
                fmt::format("SHA-1 digest has unexpected length {}", digest_len)));
    }
    return Result<Sha1Digest, CallbackFailure>::Ok(digest);
}
}
