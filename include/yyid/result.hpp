#pragma once

#include <yyid/error.hpp>
#include <string>
#include <variant>
#include <utility>

namespace yyid {

template<typename T>
class Result {
    std::variant<T, YyidError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from YyidError so YYID_TRY can return errors across Result<T> types
    Result(YyidError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(YyidError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<YyidError>(data_); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    YyidError& error() & { return std::get<YyidError>(data_); }
    const YyidError& error() const& { return std::get<YyidError>(data_); }
    YyidError&& error() && { return std::get<YyidError>(std::move(data_)); }

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

    T value_or(T fallback) const& {
        return is_ok() ? value() : std::move(fallback);
    }

    // Prefix the error message with "<what>: ", leaving Ok untouched
    Result context(const std::string& what) && {
        if (is_err()) {
            error().message = what + ": " + error().message;
        }
        return std::move(*this);
    }

    template<typename F>
    Result or_else(F&& f) {
        if (is_ok()) {
            return *this;
        }
        return f(error());
    }
};

using Status = Result<std::monostate>;

inline Status ok_status() {
    return Status::ok(std::monostate{});
}

#define YYID_TRY(expr) \
    do { \
        auto _yyid_result = (expr); \
        if (_yyid_result.is_err()) return std::move(_yyid_result).error(); \
    } while(0)

} // namespace yyid
