#pragma once

#include <pinfold/error.hpp>

#include <type_traits>
#include <utility>
#include <variant>

namespace pinfold {

// Value-or-error return type used across the library. Accessing the wrong
// side throws std::bad_variant_access.
template<typename T>
class Result {
public:
    // Converting from an error lets PINFOLD_TRY return it from any Result<U>
    Result(PinfoldError e) : state_(std::in_place_index<1>, std::move(e)) {}

    static Result ok(T v) { return Result(std::in_place_index<0>, std::move(v)); }
    static Result err(PinfoldError e) { return Result(std::move(e)); }

    bool is_ok() const { return state_.index() == 0; }
    bool is_err() const { return state_.index() == 1; }
    explicit operator bool() const { return is_ok(); }

    T& value() & { return std::get<0>(state_); }
    const T& value() const& { return std::get<0>(state_); }
    T&& value() && { return std::get<0>(std::move(state_)); }

    PinfoldError& error() & { return std::get<1>(state_); }
    const PinfoldError& error() const& { return std::get<1>(state_); }
    PinfoldError&& error() && { return std::get<1>(std::move(state_)); }

    T value_or(T fallback) const& {
        if (is_err()) return fallback;
        return value();
    }

    // Result<U> holding f(value), or this error
    template<typename F>
    auto map(F&& f) -> Result<std::invoke_result_t<F, T&>> {
        using U = std::invoke_result_t<F, T&>;
        if (is_err()) return error();
        return Result<U>::ok(std::forward<F>(f)(value()));
    }

    // f(value) when f itself returns a Result
    template<typename F>
    auto and_then(F&& f) -> std::invoke_result_t<F, T&> {
        if (is_err()) return error();
        return std::forward<F>(f)(value());
    }

private:
    template<size_t I, typename V>
    Result(std::in_place_index_t<I> tag, V&& v) : state_(tag, std::forward<V>(v)) {}

    std::variant<T, PinfoldError> state_;
};

using Status = Result<std::monostate>;

inline Status ok_status() { return Status::ok({}); }

#define PINFOLD_JOIN_(a, b) a##b
#define PINFOLD_JOIN(a, b) PINFOLD_JOIN_(a, b)

// Returns the error of `expr` from the enclosing function
#define PINFOLD_TRY(expr)                                        \
    do {                                                         \
        auto&& pinfold_try_ = (expr);                            \
        if (pinfold_try_.is_err())                               \
            return std::move(pinfold_try_).error();              \
    } while (false)

// `decl` is initialised from the value of `expr`, or the error is returned
#define PINFOLD_TRY_ASSIGN(decl, expr)                                      \
    auto PINFOLD_JOIN(pinfold_val_, __LINE__) = (expr);                     \
    if (PINFOLD_JOIN(pinfold_val_, __LINE__).is_err())                      \
        return std::move(PINFOLD_JOIN(pinfold_val_, __LINE__)).error();     \
    decl = std::move(PINFOLD_JOIN(pinfold_val_, __LINE__)).value()

} // namespace pinfold
