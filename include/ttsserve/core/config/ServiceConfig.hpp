#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "ttsserve/core/cache/CacheConfig.hpp"
#include "ttsserve/core/cache/preload/WarmupScheduler.hpp"
#include "ttsserve/core/health/HealthRegistry.hpp"
#include "ttsserve/core/logging/Logging.hpp"
#include "ttsserve/core/resilience/CircuitBreaker.hpp"
#include "ttsserve/core/resilience/RetryPolicy.hpp"

namespace ttsserve {
namespace core {
namespace config {

// ArtifactsConfig — расположение голосов и моделей
struct ArtifactsConfig {
    std::string voicesDir = "voices";             // Каталог эмбеддингов голосов
    std::string voiceExtension = ".bin";
    std::string modelsDir = "models";             // Каталог моделей
    std::string modelExtension = ".onnx";
    std::string modelFile = "model_q4.onnx";      // Активная модель
    std::vector<std::string> primaryVoices{"af_heart", "am_puck"}; // Прогреваются при старте
    bool preloadModel = true;                     // Прогреть модель при старте
};

// HotReloadSettings — слежение за каталогами артефактов
struct HotReloadSettings {
    bool enabled = true;
    std::chrono::milliseconds debounce{500};
};

// HealthSettings — проверки здоровья
struct HealthSettings {
    health::HealthRegistryConfig registry;
    std::chrono::seconds interval{30};    // Период runAll в сервисном цикле
    uint64_t minFreeDiskMb = 100;
    double maxMemoryFraction = 0.95;
};

// MonitorSettings — окно метрик и экспорт
struct MonitorSettings {
    size_t windowSize = 1000;
    std::string exportPath;                // Пусто — без экспорта
    std::chrono::seconds exportInterval{60};
};

// ServiceConfig — вся конфигурация процесса; читается один раз при старте
struct ServiceConfig {
    logging::LoggingConfig logging;
    cache::CacheManagerConfig caches = cache::CacheManagerConfig::defaults();
    resilience::CircuitBreakerConfig defaultBreaker;
    std::map<std::string, resilience::CircuitBreakerConfig> breakers; // По видам операций
    resilience::RetrySpec retry;
    cache::WarmupConfig warmup;
    HotReloadSettings hotReload;
    HealthSettings health;
    MonitorSettings monitor;
    ArtifactsConfig artifacts;
    std::chrono::seconds statusInterval{60}; // Период вывода статуса

    static ServiceConfig defaults() { return ServiceConfig{}; }
    static ServiceConfig fromJson(const nlohmann::json& json); // Бросает ConfigError
    static ServiceConfig loadFromFile(const std::string& path); // Бросает ConfigError
    nlohmann::json toJson() const;
    void validate() const; // Бросает ConfigError
};

} // namespace config
} // namespace core
} // namespace ttsserve
