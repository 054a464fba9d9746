#pragma once

/**
 * @file callback_logger.hpp
 * @brief Diagnostic logging for the callback request pipeline.
 *
 * Lines go to stderr as `[hookseal] <LEVEL> <stage>: <message>`.
 * Callers pass stage names and failure kinds only. Tokens, keys, signatures,
 * ciphertext and decrypted payloads must never reach these macros.
 *
 * Enable via CMake: -DHOOKSEAL_LOGGING=ON (default)
 */

#include <cstdio>
#include <string_view>

namespace hookseal::debug {

/// Request pipeline position. Rejected is terminal.
enum class Stage {
    Received,
    Authenticated,
    Decoded,
    Responded,
    Rejected
};

inline const char* StageToString(const Stage stage) {
    switch (stage) {
        case Stage::Received: return "received";
        case Stage::Authenticated: return "authenticated";
        case Stage::Decoded: return "decoded";
        case Stage::Responded: return "responded";
        case Stage::Rejected: return "rejected";
    }
    return "unknown";
}

#ifdef HOOKSEAL_LOGGING

#define HKS_LOG_INFO(stage, message) \
    do { \
        const std::string_view hks_msg_ = (message); \
        fprintf(stderr, "[hookseal] INFO %s: %.*s\n", \
            ::hookseal::debug::StageToString(stage), \
            static_cast<int>(hks_msg_.size()), hks_msg_.data()); \
    } while(0)

#define HKS_LOG_WARN(stage, message) \
    do { \
        const std::string_view hks_msg_ = (message); \
        fprintf(stderr, "[hookseal] WARN %s: %.*s\n", \
            ::hookseal::debug::StageToString(stage), \
            static_cast<int>(hks_msg_.size()), hks_msg_.data()); \
        fflush(stderr); \
    } while(0)

#else // !HOOKSEAL_LOGGING

#define HKS_LOG_INFO(stage, message) ((void)0)
#define HKS_LOG_WARN(stage, message) ((void)0)

#endif // HOOKSEAL_LOGGING

} // namespace hookseal::debug
