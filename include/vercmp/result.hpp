#pragma once

#include <vercmp/error.hpp>
#include <utility>
#include <variant>

namespace vercmp {

// Either a value of type T or a VercmpError describing why there is none.
template<typename T>
class Result {
public:
    // Implicit so a bare VercmpError can be returned from any Result<T> function
    Result(VercmpError e) : state_(std::move(e)) {}

    static Result ok(T v) { return Result(std::in_place_index<0>, std::move(v)); }
    static Result err(VercmpError e) { return Result(std::move(e)); }

    bool is_ok() const { return state_.index() == 0; }
    bool is_err() const { return state_.index() == 1; }
    explicit operator bool() const { return is_ok(); }

    T& value() & { return std::get<0>(state_); }
    const T& value() const& { return std::get<0>(state_); }
    T&& value() && { return std::get<0>(std::move(state_)); }

    VercmpError& error() & { return std::get<1>(state_); }
    const VercmpError& error() const& { return std::get<1>(state_); }
    VercmpError&& error() && { return std::get<1>(std::move(state_)); }

    T value_or(T fallback) const& {
        return is_ok() ? value() : std::move(fallback);
    }

    template<typename F>
    auto map(F&& f) const -> Result<decltype(f(std::declval<const T&>()))> {
        using U = decltype(f(std::declval<const T&>()));
        if (is_err()) return error();
        return Result<U>::ok(f(value()));
    }

    template<typename F>
    auto and_then(F&& f) const -> decltype(f(std::declval<const T&>())) {
        if (is_err()) return error();
        return f(value());
    }

    // Recover from an error: f receives the error and returns a Result<T>
    template<typename F>
    Result or_else(F&& f) const {
        if (is_ok()) return *this;
        return f(error());
    }

private:
    template<typename... Args>
    explicit Result(std::in_place_index_t<0> tag, Args&&... args)
        : state_(tag, std::forward<Args>(args)...) {}

    std::variant<T, VercmpError> state_;
};

using Status = Result<std::monostate>;

inline Status ok_status() { return Status::ok(std::monostate{}); }

// Return early from the enclosing function if expr holds an error.
#define VERCMP_TRY(expr) \
    do { \
        auto&& _vercmp_r = (expr); \
        if (_vercmp_r.is_err()) return std::move(_vercmp_r).error(); \
    } while (0)

} // namespace vercmp
