#pragma once

#include <stdexcept>
#include <string>
#include <exception>
#include <cstddef>
#include <optional>

namespace ttsserve {
namespace core {

// ErrorKind — классы ошибок ядра кэша и отказоустойчивости
enum class ErrorKind {
    Load,                   // Ошибка загрузчика артефакта
    CircuitOpen,            // Быстрый отказ разомкнутого breaker'а
    RetryExhausted,         // Исчерпаны попытки
    Reload,                 // Ошибка горячей перезагрузки (не фатальна)
    HealthCheckTimeout,     // Проба здоровья не уложилась в таймаут
    DegradationPassthrough, // Компонент недоступен и fallback не зарегистрирован
    Cancelled,              // Операция отменена при остановке
    Config,                 // Некорректная конфигурация
    UnknownCache,           // Кэш с таким именем не зарегистрирован
    Internal                // Прочие ошибки
};

const char* toString(ErrorKind kind); // Имя вида ошибки
std::optional<ErrorKind> errorKindFromString(const std::string& name); // Обратное к toString

// Error — базовое исключение с видом ошибки
class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}
    ErrorKind kind() const noexcept { return kind_; }
private:
    ErrorKind kind_;
};

// LoadError — отказ загрузчика; retryable задаёт, имеет ли смысл повтор
class LoadError : public Error {
public:
    explicit LoadError(const std::string& message, bool retryable = true)
        : Error(ErrorKind::Load, message), retryable_(retryable) {}
    bool retryable() const noexcept { return retryable_; }
private:
    bool retryable_;
};

class CircuitOpenError : public Error {
public:
    explicit CircuitOpenError(const std::string& breakerName)
        : Error(ErrorKind::CircuitOpen, "circuit breaker '" + breakerName + "' is open"),
          breakerName_(breakerName) {}
    const std::string& breakerName() const noexcept { return breakerName_; }
private:
    std::string breakerName_;
};

// RetryExhaustedError — оборачивает последнюю ошибку после всех попыток
class RetryExhaustedError : public Error {
public:
    RetryExhaustedError(const std::string& message, std::exception_ptr lastError, size_t attempts)
        : Error(ErrorKind::RetryExhausted, message), lastError_(std::move(lastError)), attempts_(attempts) {}
    std::exception_ptr lastError() const noexcept { return lastError_; }
    size_t attempts() const noexcept { return attempts_; }
private:
    std::exception_ptr lastError_;
    size_t attempts_;
};

class ReloadError : public Error {
public:
    explicit ReloadError(const std::string& message) : Error(ErrorKind::Reload, message) {}
};

class HealthCheckTimeout : public Error {
public:
    explicit HealthCheckTimeout(const std::string& message) : Error(ErrorKind::HealthCheckTimeout, message) {}
};

class DegradationPassthroughError : public Error {
public:
    explicit DegradationPassthroughError(const std::string& componentId)
        : Error(ErrorKind::DegradationPassthrough,
                "component '" + componentId + "' is unavailable and has no fallback"),
          componentId_(componentId) {}
    const std::string& componentId() const noexcept { return componentId_; }
private:
    std::string componentId_;
};

class CancelledError : public Error {
public:
    explicit CancelledError(const std::string& message) : Error(ErrorKind::Cancelled, message) {}
};

class ConfigError : public Error {
public:
    explicit ConfigError(const std::string& message) : Error(ErrorKind::Config, message) {}
};

class UnknownCacheError : public Error {
public:
    explicit UnknownCacheError(const std::string& cacheName)
        : Error(ErrorKind::UnknownCache, "cache '" + cacheName + "' is not registered") {}
};

// Текст исключения из exception_ptr (для логов и ErrorInfo)
std::string describeException(const std::exception_ptr& error);

} // namespace core
} // namespace ttsserve
