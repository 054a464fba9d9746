#pragma once

#include "hookseal/c_api/hks_export.h"

#ifdef __cplusplus
extern "C" {
#endif

#include <stdint.h>
#include <stddef.h>
#include <stdbool.h>

#define HKS_API_VERSION_MAJOR 1
#define HKS_API_VERSION_MINOR 0
#define HKS_API_VERSION_PATCH 0

typedef enum {
    HKS_SUCCESS = 0,
    HKS_ERROR_CONFIG = 1,
    HKS_ERROR_SIGNATURE_MISMATCH = 2,
    HKS_ERROR_PADDING = 3,
    HKS_ERROR_FRAME = 4,
    HKS_ERROR_RECEIVER_MISMATCH = 5,
    HKS_ERROR_INVALID_REQUEST = 6,
    HKS_ERROR_CRYPTO_BACKEND = 7,
    HKS_ERROR_NULL_POINTER = 8,
    HKS_ERROR_OUT_OF_MEMORY = 9
} HksErrorCode;

typedef struct HksCredentialsHandle HksCredentialsHandle;

// Library-allocated bytes. Release with hks_buffer_free.
typedef struct HksBuffer {
    uint8_t* data;
    size_t length;
} HksBuffer;

// `message` is a generic description safe to return to a remote caller.
// Release with hks_error_free.
typedef struct HksError {
    HksErrorCode code;
    char* message;
} HksError;

HKS_API const char* hks_version(void);

HKS_API HksErrorCode hks_init(void);

// All string arguments are NUL-terminated. `receive_id` may be NULL, in which
// case decrypted messages are accepted for any receiver.
HKS_API HksErrorCode hks_credentials_create(
    const char* token,
    const char* encoding_aes_key,
    const char* receive_id,
    HksCredentialsHandle** out_handle,
    HksError* out_error);

// Settings document: {"token": ..., "encoding_aes_key": ..., "receive_id": ...}
HKS_API HksErrorCode hks_credentials_create_from_json(
    const char* json,
    size_t json_length,
    HksCredentialsHandle** out_handle,
    HksError* out_error);

HKS_API void hks_credentials_destroy(HksCredentialsHandle* handle);

// Writes the 40 lowercase hex characters of the signature (no terminator).
HKS_API HksErrorCode hks_compute_signature(
    const HksCredentialsHandle* handle,
    const char* timestamp,
    const char* nonce,
    const char* cipher_body,
    HksBuffer* out_signature,
    HksError* out_error);

// Returns HKS_SUCCESS and sets *out_valid whether or not the signature matches.
HKS_API HksErrorCode hks_verify_signature(
    const HksCredentialsHandle* handle,
    const char* signature,
    const char* timestamp,
    const char* nonce,
    const char* cipher_body,
    bool* out_valid,
    HksError* out_error);

// Full URL verification: on success `out_payload` is the response body.
HKS_API HksErrorCode hks_verify_challenge(
    const HksCredentialsHandle* handle,
    const char* msg_signature,
    const char* timestamp,
    const char* nonce,
    const char* echostr,
    HksBuffer* out_payload,
    HksError* out_error);

// `body_json` is the raw request body, {"encrypt": "..."}.
// `out_receiver_id` may be NULL.
HKS_API HksErrorCode hks_decrypt_event(
    const HksCredentialsHandle* handle,
    const char* msg_signature,
    const char* timestamp,
    const char* nonce,
    const char* body_json,
    size_t body_json_length,
    HksBuffer* out_payload,
    HksBuffer* out_receiver_id,
    HksError* out_error);

// Produces the JSON reply body {"encrypt","msgsignature","timestamp","nonce"}
// with a fresh timestamp and nonce.
HKS_API HksErrorCode hks_encrypt_reply(
    const HksCredentialsHandle* handle,
    const uint8_t* payload,
    size_t payload_length,
    HksBuffer* out_json,
    HksError* out_error);

// Wipes and frees buffer->data, then resets the struct. The struct itself
// stays owned by the caller.
HKS_API void hks_buffer_free(HksBuffer* buffer);

HKS_API void hks_error_free(HksError* error);

HKS_API const char* hks_error_string(HksErrorCode code);

#ifdef __cplusplus
}
#endif
