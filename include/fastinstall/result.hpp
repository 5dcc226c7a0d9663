#pragma once

#include <fastinstall/error.hpp>
#include <utility>
#include <variant>

namespace fastinstall {

template<typename T>
class Result {
    std::variant<T, FastInstallError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from an error so FASTINSTALL_TRY works across Result<T> types
    Result(FastInstallError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(FastInstallError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<FastInstallError>(data_); }
    explicit operator bool() const { return is_ok(); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    T value_or(T fallback) const& {
        return is_ok() ? std::get<T>(data_) : std::move(fallback);
    }

    FastInstallError& error() & { return std::get<FastInstallError>(data_); }
    const FastInstallError& error() const& { return std::get<FastInstallError>(data_); }
    FastInstallError&& error() && { return std::get<FastInstallError>(std::move(data_)); }

    template<typename F>
    auto map(F&& f) -> Result<decltype(f(std::declval<T&>()))> {
        using U = decltype(f(std::declval<T&>()));
        if (is_ok()) return Result<U>::ok(f(value()));
        return Result<U>::err(error());
    }
};

using Status = Result<std::monostate>;

inline Status ok_status() {
    return Status::ok(std::monostate{});
}

#define FASTINSTALL_TRY(expr) \
    do { \
        auto _fi_result = (expr); \
        if (_fi_result.is_err()) return std::move(_fi_result).error(); \
    } while(0)

} // namespace fastinstall
