#pragma once

#include <idforge/error.hpp>
#include <utility>
#include <variant>

namespace idforge {

// Either a value or the IdError explaining why there is none.
// Every fallible generator returns one of these; nothing throws.
template<typename T>
class Result {
    std::variant<T, IdError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit so a bare IdError can be returned from any Result<T> function
    Result(IdError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(IdError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<IdError>(data_); }
    explicit operator bool() const { return is_ok(); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    IdError& error() & { return std::get<IdError>(data_); }
    const IdError& error() const& { return std::get<IdError>(data_); }
    IdError&& error() && { return std::get<IdError>(std::move(data_)); }

    // Fallback for callers that do not care about the failure reason.
    T value_or(T fallback) const& {
        if (is_ok()) return value();
        return fallback;
    }

    template<typename F>
    auto map(F&& f) const -> Result<decltype(f(std::declval<const T&>()))> {
        using U = decltype(f(std::declval<const T&>()));
        if (is_ok()) {
            return Result<U>::ok(f(value()));
        }
        return Result<U>::err(error());
    }

    template<typename F>
    auto and_then(F&& f) const -> decltype(f(std::declval<const T&>())) {
        using RetType = decltype(f(std::declval<const T&>()));
        if (is_ok()) {
            return f(value());
        }
        return RetType::err(error());
    }

    // Recovery hook: f receives the error and returns a replacement Result.
    template<typename F>
    Result or_else(F&& f) const {
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

#define IDFORGE_TRY(expr) \
    do { \
        auto _idforge_result = (expr); \
        if (_idforge_result.is_err()) return std::move(_idforge_result).error(); \
    } while(0)

} // namespace idforge
