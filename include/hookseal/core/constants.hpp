#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>
namespace hookseal::protocol {
struct Constants {
    static constexpr size_t ENCODED_KEY_LENGTH = 43;
    static constexpr size_t AES_KEY_SIZE = 32;
    static constexpr size_t AES_BLOCK_SIZE = 16;
    static constexpr size_t AES_IV_SIZE = 16;
    static constexpr size_t RANDOM_PREFIX_SIZE = 16;
    static constexpr size_t LENGTH_FIELD_SIZE = 4;
    static constexpr size_t FRAME_HEADER_SIZE = RANDOM_PREFIX_SIZE + LENGTH_FIELD_SIZE;
    static constexpr size_t SHA1_DIGEST_SIZE = 20;
    static constexpr size_t SIGNATURE_HEX_LENGTH = SHA1_DIGEST_SIZE * 2;
    static constexpr size_t MAX_TOKEN_LENGTH = 128;
    static constexpr size_t REPLY_NONCE_DIGITS = 10;
    static constexpr size_t OPENSSL_ERROR_BUFFER_SIZE = 256;
    static constexpr uint8_t MIN_PKCS7_PAD = 1;
    static constexpr uint8_t MAX_PKCS7_PAD = 16;
};
struct OpenSSLConstants {
    static constexpr int SUCCESS = 1;
    static constexpr unsigned long NO_ERROR = 0;
    static constexpr std::string_view UNKNOWN_ERROR_MESSAGE = "Unknown OpenSSL error";
};
struct Base64Constants {
    static constexpr size_t QUANTUM_CHARS = 4;
    static constexpr size_t QUANTUM_BYTES = 3;
    static constexpr size_t MAX_PADDING = 2;
    static constexpr char PAD = '=';
};
struct ErrorMessages {
    static constexpr std::string_view SODIUM_INIT_FAILED = "Failed to initialize libsodium";
    static constexpr std::string_view NOT_INITIALIZED = "Libsodium not initialized";
    static constexpr std::string_view HANDLE_DISPOSED = "Handle disposed";
    static constexpr std::string_view FAILED_TO_ALLOCATE_SECURE_MEMORY = "Failed to allocate secure memory: ";
    static constexpr std::string_view DATA_EXCEEDS_BUFFER = "Data size exceeds buffer size";
    static constexpr std::string_view INVALID_BASE64 = "Ciphertext is not valid base64";
    static constexpr std::string_view CIPHERTEXT_NOT_BLOCK_ALIGNED = "Ciphertext length is not a positive multiple of the AES block size";
    static constexpr std::string_view INVALID_PKCS7_PADDING = "Invalid PKCS#7 padding";
    static constexpr std::string_view FRAME_TOO_SHORT = "Decrypted frame shorter than header";
    static constexpr std::string_view FRAME_LENGTH_OVERFLOW = "Declared payload length exceeds frame";
    static constexpr std::string_view RECEIVER_MISMATCH = "Receiver id does not match configuration";
    static constexpr std::string_view SIGNATURE_MISMATCH = "Request signature does not match";
};
}
