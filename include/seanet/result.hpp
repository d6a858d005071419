#pragma once

#include <seanet/error.hpp>
#include <variant>
#include <functional>

namespace seanet {

template<typename T>
class Result {
    std::variant<T, SeanetError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from SeanetError so SEANET_TRY can return errors across Result<T> types
    Result(SeanetError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(SeanetError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<SeanetError>(data_); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    SeanetError& error() & { return std::get<SeanetError>(data_); }
    const SeanetError& error() const& { return std::get<SeanetError>(data_); }
    SeanetError&& error() && { return std::get<SeanetError>(std::move(data_)); }

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

#define SEANET_TRY(expr) \
    do { \
        auto _seanet_result = (expr); \
        if (_seanet_result.is_err()) return std::move(_seanet_result).error(); \
    } while(0)

#define SEANET_CONCAT_INNER(a, b) a##b
#define SEANET_CONCAT(a, b) SEANET_CONCAT_INNER(a, b)

// Evaluates expr; on error returns it from the enclosing function,
// otherwise moves the value into lhs (which may be a declaration).
#define SEANET_TRY_ASSIGN(lhs, expr) \
    auto SEANET_CONCAT(_seanet_tmp_, __LINE__) = (expr); \
    if (SEANET_CONCAT(_seanet_tmp_, __LINE__).is_err()) \
        return std::move(SEANET_CONCAT(_seanet_tmp_, __LINE__)).error(); \
    lhs = std::move(SEANET_CONCAT(_seanet_tmp_, __LINE__)).value()

} // namespace seanet
