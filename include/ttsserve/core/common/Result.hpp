#pragma once

#include <exception>
#include <optional>
#include <string>
#include <utility>
#include "ttsserve/core/common/Error.hpp"

namespace ttsserve {
namespace core {

// ErrorInfo — типизированная ошибка, передаваемая между потоками
struct ErrorInfo {
    ErrorKind kind = ErrorKind::Internal;
    std::string message;
    std::exception_ptr cause; // Исходное исключение (может быть пустым)

    // Построить из перехваченного исключения
    static ErrorInfo fromException(std::exception_ptr error) {
        ErrorInfo info;
        info.cause = error;
        info.message = describeException(error);
        try {
            std::rethrow_exception(error);
        } catch (const Error& e) {
            info.kind = e.kind();
        } catch (...) {
            info.kind = ErrorKind::Internal;
        }
        return info;
    }

    // Пробросить исходное исключение (или Error, если исходного нет)
    [[noreturn]] void rethrow() const {
        if (cause) {
            std::rethrow_exception(cause);
        }
        throw Error(kind, message);
    }
};

// Result — значение либо ErrorInfo; используется на границах потоков и future
template<typename T>
class Result {
public:
    static Result success(T value) {
        Result r;
        r.value_ = std::move(value);
        return r;
    }
    static Result failure(ErrorInfo error) {
        Result r;
        r.error_ = std::move(error);
        return r;
    }
    static Result failure(ErrorKind kind, const std::string& message) {
        ErrorInfo info;
        info.kind = kind;
        info.message = message;
        return failure(std::move(info));
    }

    bool ok() const noexcept { return value_.has_value(); }
    explicit operator bool() const noexcept { return ok(); }

    const T& value() const {
        if (!value_) {
            error_.rethrow();
        }
        return *value_;
    }
    const ErrorInfo& error() const noexcept { return error_; }

    // Значение или исходное исключение
    const T& valueOrThrow() const { return value(); }

private:
    Result() = default;
    std::optional<T> value_;
    ErrorInfo error_;
};

} // namespace core
} // namespace ttsserve
