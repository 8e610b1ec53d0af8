#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include "ttsserve/core/common/Types.hpp"
#include "ttsserve/core/resilience/CircuitBreaker.hpp"

namespace ttsserve {
namespace core {
namespace health {

// Операция синтеза: основная или упрощённая (fallback)
using SynthesisFn = std::function<ArtifactBlob()>;

// ComponentHealthRecord — состояние компонента и счётчики переключений
struct ComponentHealthRecord {
    std::string componentId;
    bool healthy = true;
    bool hasFallback = false;
    std::string lastFailure;
    size_t primaryCalls = 0;
    size_t primaryFailures = 0;
    size_t fallbackCalls = 0;
    std::chrono::system_clock::time_point lastChange = std::chrono::system_clock::now();
    nlohmann::json toJson() const;
};

// DegradationController — переключение на fallback для недоступных компонентов
// Здоровый компонент: primary; если primary бросает, компонент помечается
// отказавшим и один раз вызывается fallback. Нездоровый: сразу fallback.
// Без fallback ошибка primary пробрасывается без изменений, а нездоровый
// компонент даёт DegradationPassthroughError.
class DegradationController {
public:
    DegradationController(); // Конструктор
    void registerFallback(const std::string& componentId, SynthesisFn fallback); // Зарегистрировать fallback
    void markFailed(const std::string& componentId, const std::string& reason = ""); // Пометить отказавшим
    void markHealthy(const std::string& componentId); // Пометить здоровым
    void attachBreaker(const std::string& componentId,
                       std::shared_ptr<resilience::CircuitBreaker> breaker); // Разомкнутый breaker = нездоров
    bool isHealthy(const std::string& componentId) const; // Учитывает breaker
    ArtifactBlob executeWithFallback(const std::string& componentId, const SynthesisFn& primary); // Выполнить
    std::optional<ComponentHealthRecord> record(const std::string& componentId) const;
    nlohmann::json statusJson() const;
private:
    struct Component {
        ComponentHealthRecord record;
        SynthesisFn fallback;
        std::shared_ptr<resilience::CircuitBreaker> breaker;
    };
    Component& component(const std::string& componentId); // Под mutex_
    static bool healthyLocked(const Component& component);
    std::map<std::string, Component> components_;
    mutable std::mutex mutex_;
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace health
} // namespace core
} // namespace ttsserve
