#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace ttsserve {
namespace core {
namespace health {

// HealthResult — итог одной пробы
struct HealthResult {
    bool healthy = false;
    std::string detail;
    std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now();
    std::chrono::milliseconds duration{0};
    bool timedOut = false;
    static HealthResult ok(std::string detail = "ok") {
        HealthResult result;
        result.healthy = true;
        result.detail = std::move(detail);
        return result;
    }
    static HealthResult failed(std::string detail) {
        HealthResult result;
        result.detail = std::move(detail);
        return result;
    }
    nlohmann::json toJson() const;
};

// Проба здоровья: может бросать исключение (считается нездоровой)
using HealthProbe = std::function<HealthResult()>;

struct HealthRegistryConfig {
    std::chrono::milliseconds probeTimeout{5000}; // Жёсткий таймаут пробы по умолчанию
    size_t maxConcurrentProbes = 4;               // Параллелизм runAll
    bool validate() const {
        return probeTimeout.count() > 0 && maxConcurrentProbes > 0;
    }
};

// HealthStatus — агрегат по последним результатам включённых проверок
struct HealthStatus {
    bool overall = true;
    std::map<std::string, HealthResult> checks;  // Последние результаты (только выполненные)
    std::map<std::string, bool> enabled;         // Все зарегистрированные проверки
    nlohmann::json toJson() const;
};

// HealthRegistry — реестр проверок с таймаутом и агрегированием
// Проба выполняется в отдельном потоке; зависшая проба по таймауту даёт
// нездоровый результат, вызывающий не блокируется дольше таймаута.
// На одну проверку одновременно работает не более одного потока пробы.
class HealthRegistry {
public:
    explicit HealthRegistry(const HealthRegistryConfig& config = HealthRegistryConfig{}); // Конструктор
    ~HealthRegistry(); // Деструктор
    HealthRegistry(const HealthRegistry&) = delete;
    HealthRegistry& operator=(const HealthRegistry&) = delete;
    bool registerCheck(const std::string& name, HealthProbe probe, bool enabled = true,
                       std::optional<std::chrono::milliseconds> timeout = std::nullopt); // Зарегистрировать
    bool unregisterCheck(const std::string& name); // Удалить
    bool enable(const std::string& name); // Включить
    bool disable(const std::string& name); // Выключить (остаётся зарегистрированной)
    HealthResult run(const std::string& name); // Выполнить одну проверку
    std::map<std::string, HealthResult> runAll(); // Выполнить все включённые
    HealthStatus status() const; // Агрегат без повторного запуска проб
    bool isHealthy() const { return status().overall; }
    std::optional<HealthResult> lastResult(const std::string& name) const;
    size_t checkCount() const;
    size_t outstandingProbes() const; // Потоки проб, ещё не вернувшиеся
    void shutdown(); // Отклонять новые запуски, дождаться зависших проб (до таймаута)
private:
    struct Impl;
    std::shared_ptr<Impl> pImpl; // Реализация (разделяется с потоками проб)
};

} // namespace health
} // namespace core
} // namespace ttsserve
