#pragma once

#include <shortguid/error.hpp>
#include <variant>
#include <utility>

namespace shortguid {

// Value-or-error return type used by every fallible operation in the library.
// Parsing never throws; callers match on error().code.
template<typename T>
class Result {
    std::variant<T, ShortGuidError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from ShortGuidError so SHORTGUID_TRY can forward errors between Result types
    Result(ShortGuidError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(ShortGuidError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<ShortGuidError>(data_); }
    bool is_err(ShortGuidError::Code c) const { return is_err() && error().code == c; }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    T value_or(T fallback) const& {
        if (is_ok()) return value();
        return fallback;
    }

    ShortGuidError& error() & { return std::get<ShortGuidError>(data_); }
    const ShortGuidError& error() const& { return std::get<ShortGuidError>(data_); }
    ShortGuidError&& error() && { return std::get<ShortGuidError>(std::move(data_)); }

    explicit operator bool() const { return is_ok(); }

    template<typename F>
    auto map(F&& f) const& -> Result<decltype(f(std::declval<const T&>()))> {
        using U = decltype(f(std::declval<const T&>()));
        if (is_ok()) {
            return Result<U>::ok(f(value()));
        }
        return Result<U>::err(error());
    }

    template<typename F>
    auto and_then(F&& f) const& -> decltype(f(std::declval<const T&>())) {
        if (is_ok()) {
            return f(value());
        }
        using RetType = decltype(f(std::declval<const T&>()));
        return RetType::err(error());
    }

    template<typename F>
    Result or_else(F&& f) const& {
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

#define SHORTGUID_TRY(expr) \
    do { \
        auto _shortguid_result = (expr); \
        if (_shortguid_result.is_err()) return std::move(_shortguid_result).error(); \
    } while(0)

} // namespace shortguid
