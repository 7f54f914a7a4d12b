#pragma once
#include <optional>
#include <string>
#include <utility>
#include "core/errors.hpp"

namespace exec {

struct ExchangeError {
    ErrorKind kind{ErrorKind::TransientNetwork};
    std::string message;
};

// Tőzsdei hívás eredménye: érték vagy hiba, kivétel nélkül.
// Minden hívási pont maga dönt: újrapróbálás a következő ciklusban vagy kihagyás.
template <typename T>
class Result {
public:
    static Result success(T v){ Result r; r.value_ = std::move(v); return r; }
    static Result failure(ErrorKind k, std::string msg){
        Result r; r.error_ = ExchangeError{k, std::move(msg)}; return r;
    }
    static Result failure(ExchangeError e){ Result r; r.error_ = std::move(e); return r; }

    bool ok() const { return value_.has_value(); }
    explicit operator bool() const { return ok(); }

    const T& value() const { return *value_; }
    T& value() { return *value_; }
    const T& operator*() const { return *value_; }
    const T* operator->() const { return &*value_; }

    const ExchangeError& error() const { return error_; }

private:
    std::optional<T> value_;
    ExchangeError error_{};
};

} // namespace exec
