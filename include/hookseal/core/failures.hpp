#pragma once
#include <string>
#include <string_view>
#include <utility>
namespace hookseal::protocol {
enum class SodiumFailureType {
    InitializationFailed,
    BufferTooSmall,
    AllocationFailed,
    InvalidOperation
};

/// Request-level and configuration-level failure kinds.
///
/// ConfigError and CryptoBackend are never caused by caller input at request
/// time; every other kind is a per-request rejection (HTTP 400 class).
enum class CallbackFailureType {
    ConfigError,
    SignatureMismatch,
    PaddingError,
    FrameError,
    ReceiverMismatch,
    InvalidRequest,
    CryptoBackend
};

class SodiumFailure {
public:
    SodiumFailureType type;
    std::string message;
    SodiumFailure(const SodiumFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static SodiumFailure InitializationFailed(std::string msg) {
        return {SodiumFailureType::InitializationFailed, std::move(msg)};
    }
    static SodiumFailure BufferTooSmall(std::string msg) {
        return {SodiumFailureType::BufferTooSmall, std::move(msg)};
    }
    static SodiumFailure AllocationFailed(std::string msg) {
        return {SodiumFailureType::AllocationFailed, std::move(msg)};
    }
    static SodiumFailure InvalidOperation(std::string msg) {
        return {SodiumFailureType::InvalidOperation, std::move(msg)};
    }
};

/**
 * @brief Failure raised by configuration, signature, codec or handshake code.
 *
 * `message` is an internal diagnostic. It names sizes and offsets but never
 * key bytes, plaintext or signature values. Text that leaves the process
 * (HTTP bodies, C API error strings) must come from PublicMessage().
 */
class CallbackFailure {
public:
    CallbackFailureType type;
    std::string message;
    CallbackFailure(const CallbackFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}

    static CallbackFailure ConfigError(std::string msg) {
        return {CallbackFailureType::ConfigError, std::move(msg)};
    }
    static CallbackFailure SignatureMismatch(std::string msg) {
        return {CallbackFailureType::SignatureMismatch, std::move(msg)};
    }
    static CallbackFailure PaddingError(std::string msg) {
        return {CallbackFailureType::PaddingError, std::move(msg)};
    }
    static CallbackFailure FrameError(std::string msg) {
        return {CallbackFailureType::FrameError, std::move(msg)};
    }
    static CallbackFailure ReceiverMismatch(std::string msg) {
        return {CallbackFailureType::ReceiverMismatch, std::move(msg)};
    }
    static CallbackFailure InvalidRequest(std::string msg) {
        return {CallbackFailureType::InvalidRequest, std::move(msg)};
    }
    static CallbackFailure CryptoBackend(std::string msg) {
        return {CallbackFailureType::CryptoBackend, std::move(msg)};
    }
    static CallbackFailure FromSodiumFailure(const SodiumFailure& sf) {
        return CryptoBackend(sf.message);
    }

    [[nodiscard]] bool IsRequestRejection() const noexcept {
        return type != CallbackFailureType::ConfigError &&
               type != CallbackFailureType::CryptoBackend;
    }

    [[nodiscard]] int HttpStatus() const noexcept {
        return IsRequestRejection() ? 400 : 500;
    }

    [[nodiscard]] std::string_view PublicMessage() const noexcept {
        return PublicMessageFor(type);
    }

    static std::string_view PublicMessageFor(const CallbackFailureType t) noexcept {
        switch (t) {
            case CallbackFailureType::ConfigError:
                return "callback integration is not configured";
            case CallbackFailureType::SignatureMismatch:
                return "invalid signature";
            case CallbackFailureType::PaddingError:
            case CallbackFailureType::FrameError:
                return "malformed message";
            case CallbackFailureType::ReceiverMismatch:
                return "message not addressed to this receiver";
            case CallbackFailureType::InvalidRequest:
                return "missing request parameters";
            case CallbackFailureType::CryptoBackend:
                return "internal error";
        }
        return "internal error";
    }

    static std::string_view TypeName(const CallbackFailureType t) noexcept {
        switch (t) {
            case CallbackFailureType::ConfigError: return "ConfigError";
            case CallbackFailureType::SignatureMismatch: return "SignatureMismatch";
            case CallbackFailureType::PaddingError: return "PaddingError";
            case CallbackFailureType::FrameError: return "FrameError";
            case CallbackFailureType::ReceiverMismatch: return "ReceiverMismatch";
            case CallbackFailureType::InvalidRequest: return "InvalidRequest";
            case CallbackFailureType::CryptoBackend: return "CryptoBackend";
        }
        return "Unknown";
    }
};
}
