#pragma once
#include <variant>
#include <utility>
#include <type_traits>
#include <stdexcept>
#include <optional>
namespace hookseal::protocol {
struct Unit {
    constexpr bool operator==(const Unit&) const noexcept { return true; }
};
inline constexpr Unit unit{};

/// Either a value of T or a failure of E. Every fallible operation in the
/// library returns one of these; exceptions never cross the public API.
template<typename T, typename E>
class Result {
public:
    using value_type = T;
    using error_type = E;

    static Result Ok(T value) {
        return Result(std::in_place_index<0>, std::move(value));
    }
    static Result Err(E error) {
        return Result(std::in_place_index<1>, std::move(error));
    }
    static Result FromOptional(std::optional<T> opt, E error_if_none) {
        if (opt.has_value()) {
            return Ok(std::move(*opt));
        }
        return Err(std::move(error_if_none));
    }

    [[nodiscard]] bool IsOk() const noexcept { return value_.index() == 0; }
    [[nodiscard]] bool IsErr() const noexcept { return value_.index() == 1; }

    template<typename Pred>
    [[nodiscard]] bool IsErrAnd(Pred&& pred) const {
        return IsErr() && std::forward<Pred>(pred)(std::get<1>(value_));
    }

    [[nodiscard]] T& Unwrap() & {
        RequireOk();
        return std::get<0>(value_);
    }
    [[nodiscard]] const T& Unwrap() const& {
        RequireOk();
        return std::get<0>(value_);
    }
    [[nodiscard]] T&& Unwrap() && {
        RequireOk();
        return std::get<0>(std::move(value_));
    }
    [[nodiscard]] E& UnwrapErr() & {
        RequireErr();
        return std::get<1>(value_);
    }
    [[nodiscard]] const E& UnwrapErr() const& {
        RequireErr();
        return std::get<1>(value_);
    }
    [[nodiscard]] E&& UnwrapErr() && {
        RequireErr();
        return std::get<1>(std::move(value_));
    }

    [[nodiscard]] T UnwrapOr(T default_value) && {
        if (IsOk()) {
            return std::get<0>(std::move(value_));
        }
        return default_value;
    }

    template<typename F>
    [[nodiscard]] auto Map(F&& func) && -> Result<std::invoke_result_t<F, T>, E> {
        using U = std::invoke_result_t<F, T>;
        if (IsOk()) {
            return Result<U, E>::Ok(std::forward<F>(func)(std::get<0>(std::move(value_))));
        }
        return Result<U, E>::Err(std::get<1>(std::move(value_)));
    }
    template<typename F>
    [[nodiscard]] auto MapErr(F&& func) && -> Result<T, std::invoke_result_t<F, E>> {
        using U = std::invoke_result_t<F, E>;
        if (IsErr()) {
            return Result<T, U>::Err(std::forward<F>(func)(std::get<1>(std::move(value_))));
        }
        return Result<T, U>::Ok(std::get<0>(std::move(value_)));
    }
    template<typename F>
    [[nodiscard]] auto Bind(F&& func) && -> std::invoke_result_t<F, T> {
        using ResultType = std::invoke_result_t<F, T>;
        static_assert(std::is_same_v<typename ResultType::error_type, E>,
                      "Bind function must return Result with same error type");
        if (IsOk()) {
            return std::forward<F>(func)(std::get<0>(std::move(value_)));
        }
        return ResultType::Err(std::get<1>(std::move(value_)));
    }
    template<typename F>
    Result& InspectErr(F&& func) & {
        if (IsErr()) {
            std::forward<F>(func)(std::get<1>(value_));
        }
        return *this;
    }

private:
    template<std::size_t I, typename... Args>
    explicit Result(std::in_place_index_t<I> idx, Args&&... args)
        : value_(idx, std::forward<Args>(args)...) {}

    void RequireOk() const {
        if (IsErr()) {
            throw std::runtime_error("Called Unwrap() on an Err Result");
        }
    }
    void RequireErr() const {
        if (IsOk()) {
            throw std::runtime_error("Called UnwrapErr() on an Ok Result");
        }
    }

    std::variant<T, E> value_;
};

}
