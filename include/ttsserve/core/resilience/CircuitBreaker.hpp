#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <type_traits>
#include <vector>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include "ttsserve/core/common/Error.hpp"

namespace ttsserve {
namespace core {
namespace resilience {

enum class CircuitState { Closed, Open, HalfOpen };

const char* toString(CircuitState state);

// Источник времени; подменяется в тестах
using TimeSource = std::function<std::chrono::steady_clock::time_point()>;

// CircuitBreakerConfig — пороги одного вида операций
struct CircuitBreakerConfig {
    size_t failureThreshold = 5;             // Подряд неудач до размыкания
    std::chrono::milliseconds cooldown{30000}; // Время в Open до пробного вызова
    bool validate() const {
        return failureThreshold > 0 && cooldown.count() >= 0;
    }
    nlohmann::json toJson() const {
        return {{"failureThreshold", failureThreshold}, {"cooldownMs", cooldown.count()}};
    }
};

// CircuitBreakerStats — счётчики и текущее состояние
struct CircuitBreakerStats {
    std::string name;
    CircuitState state = CircuitState::Closed;
    size_t failureCount = 0; // Текущая серия неудач
    size_t calls = 0;        // Вызовов fn
    size_t successes = 0;
    size_t failures = 0;
    size_t rejections = 0;   // Быстрых отказов
    size_t opens = 0;        // Переходов в Open
    nlohmann::json toJson() const;
};

// CircuitBreaker — автомат Closed -> Open -> HalfOpen -> Closed/Open
// В Open до истечения cooldown вызов отклоняется CircuitOpenError без вызова fn.
// В HalfOpen допускается ровно один пробный вызов, остальные отклоняются.
// CancelledError не считается неудачей.
class CircuitBreaker {
public:
    CircuitBreaker(std::string name, const CircuitBreakerConfig& config, TimeSource clock = nullptr); // Конструктор

    template<typename Fn>
    auto call(Fn&& fn) -> decltype(fn());

    CircuitState state() const; // Текущее состояние
    bool isOpen() const; // Open и cooldown ещё не истёк
    size_t failureCount() const;
    CircuitBreakerStats stats() const; // Статистика
    void reset(); // Принудительно в Closed
    const std::string& name() const { return name_; }
    const CircuitBreakerConfig& config() const { return config_; }
private:
    bool acquire(); // Разрешение на вызов; true — пробный вызов HalfOpen
    void onSuccess(bool trial);
    void onFailure(bool trial);
    void onCancelled(bool trial);
    void open(); // Под mutex_
    std::string name_;
    CircuitBreakerConfig config_;
    TimeSource clock_;
    mutable std::mutex mutex_;
    CircuitState state_ = CircuitState::Closed;
    size_t failureCount_ = 0;
    std::chrono::steady_clock::time_point cooldownUntil_{};
    bool trialInFlight_ = false;
    size_t calls_ = 0;
    size_t successes_ = 0;
    size_t failures_ = 0;
    size_t rejections_ = 0;
    size_t opens_ = 0;
    std::shared_ptr<spdlog::logger> logger_;
};

template<typename Fn>
auto CircuitBreaker::call(Fn&& fn) -> decltype(fn()) {
    bool trial = acquire();
    try {
        if constexpr (std::is_void_v<decltype(fn())>) {
            fn();
            onSuccess(trial);
        } else {
            auto result = fn();
            onSuccess(trial);
            return result;
        }
    } catch (const CancelledError&) {
        // Отмена не говорит о состоянии зависимости
        onCancelled(trial);
        throw;
    } catch (...) {
        onFailure(trial);
        throw;
    }
}

// CircuitBreakerRegistry — по одному breaker'у на вид операции, создаются лениво
class CircuitBreakerRegistry {
public:
    explicit CircuitBreakerRegistry(CircuitBreakerConfig defaults = CircuitBreakerConfig{},
                                    TimeSource clock = nullptr); // Конструктор
    void configure(const std::string& kind, const CircuitBreakerConfig& config); // Пороги до создания
    std::shared_ptr<CircuitBreaker> getOrCreate(const std::string& kind); // Получить/создать
    std::shared_ptr<CircuitBreaker> get(const std::string& kind) const; // nullptr, если нет
    std::vector<std::string> names() const;
    nlohmann::json statsJson() const;
    void resetAll();
private:
    CircuitBreakerConfig defaults_;
    TimeSource clock_;
    std::map<std::string, CircuitBreakerConfig> configs_;
    std::map<std::string, std::shared_ptr<CircuitBreaker>> breakers_;
    mutable std::mutex mutex_;
};

} // namespace resilience
} // namespace core
} // namespace ttsserve
