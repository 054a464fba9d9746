/**
 * @file hks_internal.hpp
 * @brief Internal handle types and helpers for the hks_* C API
 *
 * This header is NOT part of the public API.
 */

#ifndef HKS_INTERNAL_HPP
#define HKS_INTERNAL_HPP

#include "hookseal/c_api/hks_api.h"
#include "hookseal/protocol/handshake_service.hpp"
#include "hookseal/core/failures.hpp"
#include <memory>
#include <span>
#include <string>
#include <string_view>

/**
 * @brief Opaque handle wrapping one configured integration
 */
struct HksCredentialsHandle {
    std::unique_ptr<hookseal::protocol::HandshakeService> service;
};

namespace hks::internal {

using namespace hookseal::protocol;

/**
 * @brief Ensure libsodium is initialized
 * @return HKS_SUCCESS if initialized, error code otherwise
 */
HksErrorCode EnsureInitialized();

void fill_error(HksError* out_error, HksErrorCode code, const std::string& message);

/**
 * @brief Map a CallbackFailure to its error code and fill the error struct
 *        with the failure's public message
 * @return The corresponding HksErrorCode
 */
HksErrorCode fill_error_from_failure(HksError* out_error, const CallbackFailure& failure);

/**
 * @brief Reject null required string arguments
 * @return true if valid, false otherwise (fills out_error)
 */
bool validate_string_param(const char* value, const char* name, HksError* out_error);

bool validate_output(const void* out, HksError* out_error);

/**
 * @brief Copy data to an output buffer (allocates memory)
 * @return true on success, false on failure (fills out_error)
 */
bool copy_to_buffer(std::span<const uint8_t> input, HksBuffer* out_buffer, HksError* out_error);

bool copy_to_buffer(std::string_view input, HksBuffer* out_buffer, HksError* out_error);

} // namespace hks::internal

#endif // HKS_INTERNAL_HPP
