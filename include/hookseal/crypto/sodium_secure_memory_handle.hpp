#pragma once

#include "hookseal/core/result.hpp"
#include "hookseal/core/failures.hpp"

#include <span>
#include <cstddef>
#include <cstdint>
#include <type_traits>

namespace hookseal::protocol::crypto {

/**
 * @brief RAII wrapper for libsodium secure memory
 *
 * Manages memory allocated via sodium_malloc:
 * - Guard pages before/after
 * - Locked in RAM (no swap)
 * - Zeroed on free
 *
 * Move-only. Concurrent WithReadAccess calls are safe as long as nobody
 * writes; the key material that lives here is written once at derivation.
 */
class SecureMemoryHandle {
public:
    static Result<SecureMemoryHandle, SodiumFailure> Allocate(size_t size);

    ~SecureMemoryHandle();

    SecureMemoryHandle() noexcept : ptr_(nullptr), size_(0) {}

    SecureMemoryHandle(SecureMemoryHandle&& other) noexcept;
    SecureMemoryHandle& operator=(SecureMemoryHandle&& other) noexcept;

    SecureMemoryHandle(const SecureMemoryHandle&) = delete;
    SecureMemoryHandle& operator=(const SecureMemoryHandle&) = delete;

    /**
     * @brief Copy data into secure memory, zeroing any unused tail
     *
     * @return Err if the data is larger than the allocation or the handle was moved from
     */
    Result<Unit, SodiumFailure> Write(std::span<const uint8_t> data);

    /**
     * @brief Run `func` over a read-only view of the secure memory
     *
     * The view must not escape the call.
     */
    template<typename F>
    auto WithReadAccess(F&& func) const -> Result<std::invoke_result_t<F, std::span<const uint8_t>>, SodiumFailure> {
        using T = std::invoke_result_t<F, std::span<const uint8_t>>;

        if (IsInvalid()) {
            return Result<T, SodiumFailure>::Err(
                SodiumFailure::InvalidOperation("Handle has been disposed"));
        }

        std::span<const uint8_t> secure_span(
            static_cast<const uint8_t*>(ptr_),
            size_);

        return Result<T, SodiumFailure>::Ok(std::forward<F>(func)(secure_span));
    }

    [[nodiscard]] bool IsInvalid() const noexcept {
        return ptr_ == nullptr;
    }

    [[nodiscard]] size_t Size() const noexcept {
        return size_;
    }

private:
    SecureMemoryHandle(void* ptr, size_t size) noexcept
        : ptr_(ptr), size_(size) {}

    void Release() noexcept;

    void* ptr_;
    size_t size_;
};

} // namespace hookseal::protocol::crypto
