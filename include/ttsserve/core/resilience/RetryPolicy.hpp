#pragma once

#include <chrono>
#include <cstddef>
#include <exception>
#include <functional>
#include <memory>
#include <set>
#include <string>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include "ttsserve/core/common/Error.hpp"

namespace ttsserve {
namespace core {
namespace resilience {

// RetrySpec — неизменяемые параметры повторов
struct RetrySpec {
    size_t maxAttempts = 3;                        // Всего попыток (включая первую)
    std::chrono::milliseconds baseDelay{100};      // Задержка после первой неудачи
    std::chrono::milliseconds maxDelay{1000};      // Потолок задержки
    double jitterFraction = 0.1;                   // Разброс [1-j, 1+j]
    std::set<ErrorKind> retryableKinds{ErrorKind::Load};

    bool validate() const {
        if (maxAttempts == 0) return false;
        if (baseDelay.count() < 0 || maxDelay < baseDelay) return false;
        if (jitterFraction < 0.0 || jitterFraction > 1.0) return false;
        return true;
    }
    nlohmann::json toJson() const;
};

// RetryPolicy — повтор операции с экспоненциальной задержкой
// Без состояния; один экземпляр можно использовать из разных потоков.
// Задержка вызывается только между попытками: maxAttempts попыток дают
// maxAttempts-1 пауз. Неповторяемая ошибка пробрасывается без изменений,
// исчерпание попыток — RetryExhaustedError с последней ошибкой внутри.
class RetryPolicy {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    explicit RetryPolicy(RetrySpec spec = RetrySpec{}, Sleeper sleeper = nullptr,
                         std::string name = "retry"); // Конструктор

    template<typename Fn>
    auto execute(Fn&& fn) const -> decltype(fn());

    std::chrono::milliseconds backoffDelay(size_t attempt) const; // min(base*2^(attempt-1), max)
    std::chrono::milliseconds jitteredDelay(size_t attempt) const; // backoffDelay * jitter
    bool isRetryable(const std::exception_ptr& error) const; // Повторять ли эту ошибку
    const RetrySpec& spec() const { return spec_; }
    const std::string& name() const { return name_; }
private:
    RetrySpec spec_;
    Sleeper sleeper_;
    std::string name_;
    std::shared_ptr<spdlog::logger> logger_;
};

template<typename Fn>
auto RetryPolicy::execute(Fn&& fn) const -> decltype(fn()) {
    for (size_t attempt = 1;; ++attempt) {
        try {
            return fn();
        } catch (...) {
            auto error = std::current_exception();
            if (!isRetryable(error)) {
                throw;
            }
            if (attempt >= spec_.maxAttempts) {
                logger_->warn("RetryPolicy '{}': попытки исчерпаны ({}): {}",
                              name_, attempt, describeException(error));
                throw RetryExhaustedError("retry '" + name_ + "' exhausted after " + std::to_string(attempt) +
                                          " attempts: " + describeException(error),
                                          error, attempt);
            }
            auto delay = jitteredDelay(attempt);
            logger_->debug("RetryPolicy '{}': попытка {} неудачна ({}), пауза {} мс",
                           name_, attempt, describeException(error), delay.count());
            sleeper_(delay);
        }
    }
}

} // namespace resilience
} // namespace core
} // namespace ttsserve
