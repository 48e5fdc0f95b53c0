#pragma once

#include <shortid/error.hpp>
#include <variant>
#include <functional>

namespace shortid {

template<typename T>
class Result {
    std::variant<T, ShortIdError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from ShortIdError so SHORTID_TRY can return errors across Result<T> types
    Result(ShortIdError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(ShortIdError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<ShortIdError>(data_); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    ShortIdError& error() & { return std::get<ShortIdError>(data_); }
    const ShortIdError& error() const& { return std::get<ShortIdError>(data_); }
    ShortIdError&& error() && { return std::get<ShortIdError>(std::move(data_)); }

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

    // Recover from an error with another fallible step
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

#define SHORTID_TRY(expr) \
    do { \
        auto _shortid_result = (expr); \
        if (_shortid_result.is_err()) return std::move(_shortid_result).error(); \
    } while(0)

} // namespace shortid
