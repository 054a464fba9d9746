#include <catch2/catch_test_macros.hpp>
#include "hookseal/crypto/aes_cbc.hpp"
#include "hookseal/crypto/sodium_interop.hpp"
#include "hookseal/core/constants.hpp"
#include "helpers/test_vectors.hpp"
using namespace hookseal::protocol;
using namespace hookseal::protocol::crypto;
using hookseal::test::FromHex;

namespace {
// NIST SP 800-38A F.2.5 (CBC-AES256.Encrypt), first two blocks
const auto kKey = FromHex("603deb1015ca71be2b73aef0857d77811f352c073b6108d72d9810a30914dff4");
const auto kIv = FromHex("000102030405060708090a0b0c0d0e0f");
const auto kPlain = FromHex("6bc1bee22e409f96e93d7e117393172aae2d8a571e03ac9c9eb76fac45af8e51");
const auto kCipher = FromHex("f58c4c04d6e5f1ba779eabfb5f7bfbd69cfc4e967edb808d679f777bc6702c7d");
}

TEST_CASE("AesCbc - NIST SP 800-38A vectors", "[aes_cbc][crypto]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("Encrypt matches the published ciphertext") {
        auto result = AesCbc::Encrypt(kKey, kIv, kPlain);
        REQUIRE(result.IsOk());
        REQUIRE(result.Unwrap() == kCipher);
    }
    SECTION("Decrypt matches the published plaintext") {
        auto result = AesCbc::Decrypt(kKey, kIv, kCipher);
        REQUIRE(result.IsOk());
        REQUIRE(result.Unwrap() == kPlain);
    }
    SECTION("No padding block is added or removed") {
        REQUIRE(AesCbc::Encrypt(kKey, kIv, kPlain).Unwrap().size() == kPlain.size());
    }
}

TEST_CASE("AesCbc - Parameter Validation", "[aes_cbc][crypto][validation]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("Wrong key size") {
        std::vector<uint8_t> short_key(16, 0x01);
        auto result = AesCbc::Encrypt(short_key, kIv, kPlain);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == CallbackFailureType::CryptoBackend);
    }
    SECTION("Wrong IV size") {
        std::vector<uint8_t> iv(12, 0x00);
        REQUIRE(AesCbc::Decrypt(kKey, iv, kCipher).IsErr());
    }
    SECTION("Empty input is a padding error") {
        auto result = AesCbc::Decrypt(kKey, kIv, std::vector<uint8_t>{});
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == CallbackFailureType::PaddingError);
    }
    SECTION("Unaligned input is a padding error") {
        std::vector<uint8_t> unaligned(kCipher.begin(), kCipher.begin() + 17);
        auto result = AesCbc::Decrypt(kKey, kIv, unaligned);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == CallbackFailureType::PaddingError);
    }
}
