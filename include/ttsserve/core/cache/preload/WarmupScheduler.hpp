#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <nlohmann/json.hpp>
#include "ttsserve/core/cache/manager/CacheManager.hpp"
#include "ttsserve/core/common/Types.hpp"
#include "ttsserve/core/resilience/CircuitBreaker.hpp"
#include "ttsserve/core/resilience/RetryPolicy.hpp"

namespace ttsserve {
namespace core {
namespace cache {

// WarmupConfig — параметры фонового прогрева кэшей
struct WarmupConfig {
    size_t workers = 2;                      // Число воркеров
    size_t maxQueueSize = 100;               // Граница очереди
    std::string breakerKind = "warmup";      // Breaker по умолчанию
    bool validate() const {
        return workers > 0 && maxQueueSize > 0 && !breakerKind.empty();
    }
};

// WarmupTask — одна задача прогрева; потребляется один раз
struct WarmupTask {
    std::string cacheName;     // Целевой кэш
    std::string key;           // Ключ
    Loader loader;             // Загрузчик
    int priority = 0;          // Больше — раньше
    double estimatedCost = 0.0; // Оценка стоимости (для логов/метрик)
    std::string breakerKind;   // Пусто — WarmupConfig::breakerKind
};

// WarmupMetrics — счётчики прогрева
struct WarmupMetrics {
    size_t scheduled = 0;  // Принято в очередь
    size_t completed = 0;  // Успешно загружено
    size_t failed = 0;     // Ошибка после повторов
    size_t dropped = 0;    // Вытеснено из переполненной очереди
    size_t cancelled = 0;  // Отменено при остановке
    size_t queueSize = 0;  // Сейчас в очереди
    size_t activeTasks = 0; // Сейчас выполняются
    nlohmann::json toJson() const {
        return {
            {"scheduled", scheduled},
            {"completed", completed},
            {"failed", failed},
            {"dropped", dropped},
            {"cancelled", cancelled},
            {"queueSize", queueSize},
            {"activeTasks", activeTasks}
        };
    }
};

// Режим остановки: дообработать очередь или отменить
enum class StopMode { Drain, Cancel };

// WarmupScheduler — приоритетная очередь прогрева с фиксированным пулом воркеров
// Задача выполняется как RetryPolicy(CircuitBreaker(getOrLoad)). При переполнении
// отбрасываются задачи с наименьшим приоритетом; schedule никогда не блокирует.
class WarmupScheduler {
public:
    WarmupScheduler(const WarmupConfig& config,
                    std::shared_ptr<CacheManager> cacheManager,
                    std::shared_ptr<resilience::CircuitBreakerRegistry> breakers,
                    const resilience::RetrySpec& retrySpec = resilience::RetrySpec{}); // Конструктор
    ~WarmupScheduler(); // Деструктор
    WarmupScheduler(const WarmupScheduler&) = delete;
    WarmupScheduler& operator=(const WarmupScheduler&) = delete;
    bool start(); // Запустить воркеры
    bool schedule(WarmupTask task); // false — задача отброшена или планировщик остановлен
    bool waitIdle(std::chrono::milliseconds timeout); // Ждать пустой очереди и простоя воркеров
    void stop(StopMode mode = StopMode::Drain); // Остановить
    bool isRunning() const;
    WarmupMetrics getMetrics() const; // Метрики
    WarmupConfig getConfiguration() const;
private:
    struct Impl;
    std::unique_ptr<Impl> pImpl; // Реализация
};

} // namespace cache
} // namespace core
} // namespace ttsserve
