#pragma once

#include <nixup/error.hpp>
#include <variant>
#include <functional>
#include <string>

namespace nixup {

template<typename T>
class Result {
    std::variant<T, NixupError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from NixupError so NIXUP_TRY can return errors across Result<T> types
    Result(NixupError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(NixupError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<NixupError>(data_); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    NixupError& error() & { return std::get<NixupError>(data_); }
    const NixupError& error() const& { return std::get<NixupError>(data_); }
    NixupError&& error() && { return std::get<NixupError>(std::move(data_)); }

    explicit operator bool() const { return is_ok(); }

    template<typename F>
    auto map(F&& f) -> Result<decltype(f(std::declval<T&>()))> {
        using U = decltype(f(std::declval<T&>()));
        if (is_ok()) {
            return Result<U>::ok(f(value()));
        }
        return Result<U>::err(error());
    }

    template<typename F>
    auto and_then(F&& f) -> decltype(f(std::declval<T&>())) {
        if (is_ok()) {
            return f(value());
        }
        using RetType = decltype(f(std::declval<T&>()));
        return RetType::err(error());
    }

    template<typename F>
    Result or_else(F&& f) {
        if (is_ok()) {
            return std::move(*this);
        }
        return f(error());
    }
};

using Status = Result<std::monostate>;

inline Status ok_status() {
    return Status::ok(std::monostate{});
}

// Prefix an error message with what was being attempted; Ok passes through.
template<typename T>
Result<T> with_context(Result<T> r, const std::string& what) {
    if (r.is_err()) {
        r.error().message = what + ": " + r.error().message;
    }
    return r;
}

#define NIXUP_TRY(expr) \
    do { \
        auto _nixup_result = (expr); \
        if (_nixup_result.is_err()) return std::move(_nixup_result).error(); \
    } while(0)

} // namespace nixup
