/**
 * @file hks_api.cpp
 * @brief C ABI over CredentialSet, SignatureVerifier and HandshakeService
 */

#include "hookseal/c_api/hks_api.h"
#include "hks_internal.hpp"
#include "hookseal/configuration/callback_config.hpp"
#include "hookseal/crypto/sodium_interop.hpp"
#include "hookseal/protocol/credential_set.hpp"
#include "hookseal/protocol/handshake_service.hpp"
#include "hookseal/protocol/signature_verifier.hpp"
#include "hookseal/utilities/json_envelope.hpp"
#include <atomic>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <mutex>
#include <new>
#include <optional>
#include <string>

using namespace hookseal::protocol;
using namespace hookseal::protocol::crypto;
using hookseal::protocol::configuration::CallbackConfig;
using hookseal::protocol::utilities::JsonEnvelope;

// ============================================================================
// Internal Helper Implementations
// ============================================================================

namespace hks::internal {

HksErrorCode EnsureInitialized() {
    static std::once_flag init_flag;
    static std::atomic init_success{false};

    std::call_once(init_flag, [] {
        const auto result = SodiumInterop::Initialize();
        init_success.store(result.IsOk(), std::memory_order_release);
    });

    return init_success.load(std::memory_order_acquire)
               ? HKS_SUCCESS
               : HKS_ERROR_CRYPTO_BACKEND;
}

void fill_error(HksError* out_error, const HksErrorCode code, const std::string& message) {
    if (out_error) {
        out_error->code = code;
#ifdef _WIN32
        out_error->message = _strdup(message.c_str());
#else
        out_error->message = strdup(message.c_str());
#endif
    }
}

HksErrorCode fill_error_from_failure(HksError* out_error, const CallbackFailure& failure) {
    HksErrorCode code = HKS_ERROR_CRYPTO_BACKEND;

    switch (failure.type) {
        case CallbackFailureType::ConfigError:
            code = HKS_ERROR_CONFIG;
            break;
        case CallbackFailureType::SignatureMismatch:
            code = HKS_ERROR_SIGNATURE_MISMATCH;
            break;
        case CallbackFailureType::PaddingError:
            code = HKS_ERROR_PADDING;
            break;
        case CallbackFailureType::FrameError:
            code = HKS_ERROR_FRAME;
            break;
        case CallbackFailureType::ReceiverMismatch:
            code = HKS_ERROR_RECEIVER_MISMATCH;
            break;
        case CallbackFailureType::InvalidRequest:
            code = HKS_ERROR_INVALID_REQUEST;
            break;
        case CallbackFailureType::CryptoBackend:
            code = HKS_ERROR_CRYPTO_BACKEND;
            break;
    }

    fill_error(out_error, code, std::string(failure.PublicMessage()));
    return code;
}

bool validate_string_param(const char* value, const char* name, HksError* out_error) {
    if (!value) {
        fill_error(out_error, HKS_ERROR_NULL_POINTER, std::string(name) + " is null");
        return false;
    }
    return true;
}

bool validate_output(const void* out, HksError* out_error) {
    if (!out) {
        fill_error(out_error, HKS_ERROR_NULL_POINTER, "Output pointer is null");
        return false;
    }
    return true;
}

bool copy_to_buffer(const std::span<const uint8_t> input, HksBuffer* out_buffer, HksError* out_error) {
    if (!out_buffer) {
        fill_error(out_error, HKS_ERROR_NULL_POINTER, "Output buffer is null");
        return false;
    }
    out_buffer->data = nullptr;
    out_buffer->length = 0;
    if (input.empty()) {
        return true;
    }

    auto* data = new(std::nothrow) uint8_t[input.size()];
    if (!data) {
        fill_error(out_error, HKS_ERROR_OUT_OF_MEMORY, "Failed to allocate output buffer");
        return false;
    }
    std::memcpy(data, input.data(), input.size());
    out_buffer->data = data;
    out_buffer->length = input.size();
    return true;
}

bool copy_to_buffer(const std::string_view input, HksBuffer* out_buffer, HksError* out_error) {
    return copy_to_buffer(
        std::span(reinterpret_cast<const uint8_t*>(input.data()), input.size()),
        out_buffer, out_error);
}

} // namespace hks::internal

using namespace hks::internal;

namespace {

HksErrorCode make_handle(
    Result<CredentialSet, CallbackFailure> credentials,
    HksCredentialsHandle** out_handle,
    HksError* out_error) {
    if (credentials.IsErr()) {
        return fill_error_from_failure(out_error, credentials.UnwrapErr());
    }
    auto* handle = new(std::nothrow) HksCredentialsHandle{};
    if (!handle) {
        fill_error(out_error, HKS_ERROR_OUT_OF_MEMORY, "Failed to allocate credentials handle");
        return HKS_ERROR_OUT_OF_MEMORY;
    }
    handle->service = std::make_unique<HandshakeService>(std::move(credentials).Unwrap());
    *out_handle = handle;
    return HKS_SUCCESS;
}

bool validate_handle(const HksCredentialsHandle* handle, HksError* out_error) {
    if (!handle || !handle->service) {
        fill_error(out_error, HKS_ERROR_NULL_POINTER, "Credentials handle is null");
        return false;
    }
    return true;
}

} // namespace

extern "C" {

// ----------------------------------------------------------------------------
// Version & Initialization
// ----------------------------------------------------------------------------

const char* hks_version(void) {
    return "1.0.0";
}

HksErrorCode hks_init(void) {
    return EnsureInitialized();
}

// ----------------------------------------------------------------------------
// Credentials
// ----------------------------------------------------------------------------

HksErrorCode hks_credentials_create(
    const char* token,
    const char* encoding_aes_key,
    const char* receive_id,
    HksCredentialsHandle** out_handle,
    HksError* out_error) {
    if (!validate_output(out_handle, out_error) ||
        !validate_string_param(token, "token", out_error) ||
        !validate_string_param(encoding_aes_key, "encoding_aes_key", out_error)) {
        return HKS_ERROR_NULL_POINTER;
    }
    *out_handle = nullptr;
    if (const auto err = EnsureInitialized(); err != HKS_SUCCESS) {
        fill_error(out_error, err, "Failed to initialize libsodium");
        return err;
    }
    std::optional<std::string> receiver;
    if (receive_id) {
        receiver = std::string(receive_id);
    }
    return make_handle(
        CredentialSet::Create(std::string(token), encoding_aes_key, std::move(receiver)),
        out_handle, out_error);
}

HksErrorCode hks_credentials_create_from_json(
    const char* json,
    const size_t json_length,
    HksCredentialsHandle** out_handle,
    HksError* out_error) {
    if (!validate_output(out_handle, out_error)) {
        return HKS_ERROR_NULL_POINTER;
    }
    *out_handle = nullptr;
    if (!json && json_length > 0) {
        fill_error(out_error, HKS_ERROR_NULL_POINTER, "Settings JSON is null but length is non-zero");
        return HKS_ERROR_NULL_POINTER;
    }
    if (const auto err = EnsureInitialized(); err != HKS_SUCCESS) {
        fill_error(out_error, err, "Failed to initialize libsodium");
        return err;
    }
    auto config = CallbackConfig::FromJson(std::string_view(json ? json : "", json_length));
    if (config.IsErr()) {
        return fill_error_from_failure(out_error, config.UnwrapErr());
    }
    return make_handle(CredentialSet::Create(config.Unwrap()), out_handle, out_error);
}

void hks_credentials_destroy(HksCredentialsHandle* handle) {
    delete handle;
}

// ----------------------------------------------------------------------------
// Signatures
// ----------------------------------------------------------------------------

HksErrorCode hks_compute_signature(
    const HksCredentialsHandle* handle,
    const char* timestamp,
    const char* nonce,
    const char* cipher_body,
    HksBuffer* out_signature,
    HksError* out_error) {
    if (!validate_handle(handle, out_error) ||
        !validate_string_param(timestamp, "timestamp", out_error) ||
        !validate_string_param(nonce, "nonce", out_error) ||
        !validate_string_param(cipher_body, "cipher_body", out_error) ||
        !validate_output(out_signature, out_error)) {
        return HKS_ERROR_NULL_POINTER;
    }
    auto signature = SignatureVerifier::ComputeSignature(
        handle->service->Credentials().Token(), timestamp, nonce, cipher_body);
    if (signature.IsErr()) {
        return fill_error_from_failure(out_error, signature.UnwrapErr());
    }
    if (!copy_to_buffer(std::string_view(signature.Unwrap()), out_signature, out_error)) {
        return HKS_ERROR_OUT_OF_MEMORY;
    }
    return HKS_SUCCESS;
}

HksErrorCode hks_verify_signature(
    const HksCredentialsHandle* handle,
    const char* signature,
    const char* timestamp,
    const char* nonce,
    const char* cipher_body,
    bool* out_valid,
    HksError* out_error) {
    if (!validate_handle(handle, out_error) ||
        !validate_string_param(signature, "signature", out_error) ||
        !validate_string_param(timestamp, "timestamp", out_error) ||
        !validate_string_param(nonce, "nonce", out_error) ||
        !validate_string_param(cipher_body, "cipher_body", out_error) ||
        !validate_output(out_valid, out_error)) {
        return HKS_ERROR_NULL_POINTER;
    }
    *out_valid = SignatureVerifier::Verify(
        signature, handle->service->Credentials().Token(), timestamp, nonce, cipher_body);
    return HKS_SUCCESS;
}

// ----------------------------------------------------------------------------
// Requests
// ----------------------------------------------------------------------------

HksErrorCode hks_verify_challenge(
    const HksCredentialsHandle* handle,
    const char* msg_signature,
    const char* timestamp,
    const char* nonce,
    const char* echostr,
    HksBuffer* out_payload,
    HksError* out_error) {
    if (!validate_handle(handle, out_error) || !validate_output(out_payload, out_error)) {
        return HKS_ERROR_NULL_POINTER;
    }
    // Null request fields are treated as missing, like empty query parameters
    VerificationChallenge challenge{
        msg_signature ? msg_signature : "",
        timestamp ? timestamp : "",
        nonce ? nonce : "",
        echostr ? echostr : ""};
    auto payload = handle->service->HandleVerificationChallenge(challenge);
    if (payload.IsErr()) {
        return fill_error_from_failure(out_error, payload.UnwrapErr());
    }
    const bool copied = copy_to_buffer(payload.Unwrap(), out_payload, out_error);
    SodiumInterop::SecureWipe(payload.Unwrap());
    return copied ? HKS_SUCCESS : HKS_ERROR_OUT_OF_MEMORY;
}

HksErrorCode hks_decrypt_event(
    const HksCredentialsHandle* handle,
    const char* msg_signature,
    const char* timestamp,
    const char* nonce,
    const char* body_json,
    const size_t body_json_length,
    HksBuffer* out_payload,
    HksBuffer* out_receiver_id,
    HksError* out_error) {
    if (!validate_handle(handle, out_error) || !validate_output(out_payload, out_error)) {
        return HKS_ERROR_NULL_POINTER;
    }
    if (!body_json && body_json_length > 0) {
        fill_error(out_error, HKS_ERROR_NULL_POINTER, "Body is null but length is non-zero");
        return HKS_ERROR_NULL_POINTER;
    }
    auto cipher_body = JsonEnvelope::ParseCallbackBody(
        std::string_view(body_json ? body_json : "", body_json_length));
    if (cipher_body.IsErr()) {
        return fill_error_from_failure(out_error, cipher_body.UnwrapErr());
    }

    EventCallback callback{
        msg_signature ? msg_signature : "",
        timestamp ? timestamp : "",
        nonce ? nonce : "",
        std::move(cipher_body).Unwrap()};
    auto outcome = handle->service->HandleEventCallback(callback);
    if (outcome.IsErr()) {
        return fill_error_from_failure(out_error, outcome.UnwrapErr());
    }
    DecryptedMessage& message = outcome.Unwrap().message;
    const bool copied = copy_to_buffer(message.payload, out_payload, out_error) &&
        (!out_receiver_id || copy_to_buffer(std::string_view(message.receiver_id), out_receiver_id, out_error));
    SodiumInterop::SecureWipe(message.payload);
    if (!copied) {
        hks_buffer_free(out_payload);
        return HKS_ERROR_OUT_OF_MEMORY;
    }
    return HKS_SUCCESS;
}

HksErrorCode hks_encrypt_reply(
    const HksCredentialsHandle* handle,
    const uint8_t* payload,
    const size_t payload_length,
    HksBuffer* out_json,
    HksError* out_error) {
    if (!validate_handle(handle, out_error) || !validate_output(out_json, out_error)) {
        return HKS_ERROR_NULL_POINTER;
    }
    if (!payload && payload_length > 0) {
        fill_error(out_error, HKS_ERROR_NULL_POINTER, "Payload is null but length is non-zero");
        return HKS_ERROR_NULL_POINTER;
    }
    auto body = handle->service->EncryptReply(std::span(payload, payload_length))
        .Bind([](EncryptedReply reply) {
            return JsonEnvelope::RenderReply(reply);
        });
    if (body.IsErr()) {
        return fill_error_from_failure(out_error, body.UnwrapErr());
    }
    if (!copy_to_buffer(std::string_view(body.Unwrap()), out_json, out_error)) {
        return HKS_ERROR_OUT_OF_MEMORY;
    }
    return HKS_SUCCESS;
}

// ----------------------------------------------------------------------------
// Memory
// ----------------------------------------------------------------------------

void hks_buffer_free(HksBuffer* buffer) {
    if (buffer) {
        if (buffer->data) {
            SodiumInterop::SecureWipe(std::span(buffer->data, buffer->length));
            delete[] buffer->data;
        }
        buffer->data = nullptr;
        buffer->length = 0;
    }
}

void hks_error_free(HksError* error) {
    if (error && error->message) {
        free(error->message);
        error->message = nullptr;
    }
}

const char* hks_error_string(const HksErrorCode code) {
    switch (code) {
        case HKS_SUCCESS: return "Success";
        case HKS_ERROR_CONFIG: return "Configuration error";
        case HKS_ERROR_SIGNATURE_MISMATCH: return "Signature mismatch";
        case HKS_ERROR_PADDING: return "Invalid padding";
        case HKS_ERROR_FRAME: return "Malformed frame";
        case HKS_ERROR_RECEIVER_MISMATCH: return "Receiver mismatch";
        case HKS_ERROR_INVALID_REQUEST: return "Invalid request";
        case HKS_ERROR_CRYPTO_BACKEND: return "Crypto backend failure";
        case HKS_ERROR_NULL_POINTER: return "Null pointer";
        case HKS_ERROR_OUT_OF_MEMORY: return "Out of memory";
        default: return "Unknown error";
    }
}

} // extern "C"
