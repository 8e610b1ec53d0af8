#pragma once

#include <memory>
#include <string>
#include <nlohmann/json.hpp>
#include "ttsserve/core/cache/loader/FileArtifactLoader.hpp"
#include "ttsserve/core/cache/manager/CacheManager.hpp"
#include "ttsserve/core/cache/preload/WarmupScheduler.hpp"
#include "ttsserve/core/config/ServiceConfig.hpp"
#include "ttsserve/core/health/DegradationController.hpp"
#include "ttsserve/core/health/HealthRegistry.hpp"
#include "ttsserve/core/monitor/PerformanceMonitor.hpp"
#include "ttsserve/core/reload/FileChangeSource.hpp"
#include "ttsserve/core/reload/HotReloadWatcher.hpp"
#include "ttsserve/core/resilience/CircuitBreaker.hpp"
#include "ttsserve/core/resilience/RetryPolicy.hpp"

namespace ttsserve {
namespace core {
namespace service {

// Виды операций с отдельными breaker'ами
namespace breakers {
constexpr const char* VOICE_LOAD = "voice_load";
constexpr const char* MODEL_LOAD = "model_load";
constexpr const char* SYNTHESIS = "synthesis";
} // namespace breakers

// ServiceContext — все компоненты ядра, созданные явно при старте процесса
// Каждый вызов create() даёт независимый набор компонентов (изоляция тестов).
class ServiceContext {
    struct ConstructionKey {
        explicit ConstructionKey() = default;
    };
public:
    // Доступен только через create(): ключ закрыт
    ServiceContext(ConstructionKey, const config::ServiceConfig& config);
    // Построить компоненты; fileSource == nullptr — inotify
    static std::unique_ptr<ServiceContext> create(const config::ServiceConfig& config,
                                                  std::shared_ptr<reload::FileChangeSource> fileSource = nullptr);
    ~ServiceContext(); // Деструктор
    ServiceContext(const ServiceContext&) = delete;
    ServiceContext& operator=(const ServiceContext&) = delete;

    bool start(); // Прогрев, слежение за файлами, первые проверки здоровья
    void stop(cache::StopMode mode = cache::StopMode::Cancel); // Остановить всё в обратном порядке
    bool isRunning() const { return running_; }
    size_t scheduleStartupWarmup(); // Поставить прогрев основных голосов и модели
    nlohmann::json statusJson() const; // Сводный статус для мониторинга

    const config::ServiceConfig& config() const { return config_; }
    std::shared_ptr<monitor::PerformanceMonitor> monitor() const { return monitor_; }
    std::shared_ptr<cache::CacheManager> cacheManager() const { return cacheManager_; }
    std::shared_ptr<resilience::CircuitBreakerRegistry> breakerRegistry() const { return breakers_; }
    std::shared_ptr<resilience::RetryPolicy> retryPolicy() const { return retry_; }
    std::shared_ptr<cache::WarmupScheduler> warmup() const { return warmup_; }
    std::shared_ptr<reload::HotReloadWatcher> hotReload() const { return hotReload_; }
    std::shared_ptr<health::HealthRegistry> healthRegistry() const { return health_; }
    std::shared_ptr<health::DegradationController> degradation() const { return degradation_; }
    const cache::FileArtifactLoader& voiceLoader() const { return voiceLoader_; }
    const cache::FileArtifactLoader& modelLoader() const { return modelLoader_; }
private:
    void registerHealthChecks();
    void registerReloadTargets();
    config::ServiceConfig config_;
    cache::FileArtifactLoader voiceLoader_;
    cache::FileArtifactLoader modelLoader_;
    std::shared_ptr<reload::FileChangeSource> fileSource_;
    std::shared_ptr<monitor::PerformanceMonitor> monitor_;
    std::shared_ptr<cache::CacheManager> cacheManager_;
    std::shared_ptr<resilience::CircuitBreakerRegistry> breakers_;
    std::shared_ptr<resilience::RetryPolicy> retry_;
    std::shared_ptr<cache::WarmupScheduler> warmup_;
    std::shared_ptr<reload::HotReloadWatcher> hotReload_;
    std::shared_ptr<health::HealthRegistry> health_;
    std::shared_ptr<health::DegradationController> degradation_;
    bool running_ = false;
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace service
} // namespace core
} // namespace ttsserve
