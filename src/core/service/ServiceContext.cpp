#include "ttsserve/core/service/ServiceContext.hpp"
#include "ttsserve/core/common/Error.hpp"
#include "ttsserve/core/health/HealthProbes.hpp"
#include "ttsserve/core/logging/Logging.hpp"
#include <filesystem>

namespace ttsserve {
namespace core {
namespace service {

namespace {

constexpr int MODEL_PRIORITY = 1000;
constexpr int VOICE_PRIORITY = 100;

cache::WarmupTask voiceTask(const cache::FileArtifactLoader& loader, const std::string& voice, int priority) {
    cache::WarmupTask task;
    task.cacheName = cache::names::VOICE_EMBEDDINGS;
    task.key = voice;
    task.loader = loader.asLoader();
    task.priority = priority;
    task.breakerKind = breakers::VOICE_LOAD;
    return task;
}

cache::WarmupTask modelTask(const cache::FileArtifactLoader& loader, const std::string& modelFile) {
    cache::WarmupTask task;
    task.cacheName = cache::names::MODELS;
    task.key = modelFile;
    task.loader = loader.asLoader();
    task.priority = MODEL_PRIORITY;
    task.breakerKind = breakers::MODEL_LOAD;
    return task;
}

} // namespace

ServiceContext::ServiceContext(ConstructionKey, const config::ServiceConfig& config)
    : config_(config),
      voiceLoader_(config.artifacts.voicesDir, config.artifacts.voiceExtension),
      modelLoader_(config.artifacts.modelsDir, config.artifacts.modelExtension),
      logger_(logging::getLogger("service")) {}

std::unique_ptr<ServiceContext> ServiceContext::create(const config::ServiceConfig& config,
                                                       std::shared_ptr<reload::FileChangeSource> fileSource) {
    config.validate();
    auto context = std::make_unique<ServiceContext>(ConstructionKey{}, config);

    context->monitor_ = std::make_shared<monitor::PerformanceMonitor>(config.monitor.windowSize);
    context->cacheManager_ = std::make_shared<cache::CacheManager>(config.caches, context->monitor_);
    if (!context->cacheManager_->initialize()) {
        throw ConfigError("cache manager initialization failed");
    }

    context->breakers_ = std::make_shared<resilience::CircuitBreakerRegistry>(config.defaultBreaker);
    for (const auto& [kind, breakerConfig] : config.breakers) {
        context->breakers_->configure(kind, breakerConfig);
    }
    context->retry_ = std::make_shared<resilience::RetryPolicy>(config.retry, nullptr, "service");
    context->warmup_ = std::make_shared<cache::WarmupScheduler>(
        config.warmup, context->cacheManager_, context->breakers_, config.retry);

    context->fileSource_ = fileSource ? std::move(fileSource)
                                      : std::make_shared<reload::InotifyFileChangeSource>();
    context->hotReload_ = std::make_shared<reload::HotReloadWatcher>(context->fileSource_, context->cacheManager_);
    context->health_ = std::make_shared<health::HealthRegistry>(config.health.registry);
    context->degradation_ = std::make_shared<health::DegradationController>();
    context->degradation_->attachBreaker(breakers::SYNTHESIS, context->breakers_->getOrCreate(breakers::SYNTHESIS));

    context->registerHealthChecks();
    if (config.hotReload.enabled) {
        context->registerReloadTargets();
    }
    context->logger_->info("ServiceContext: компоненты созданы, кэшей {}", config.caches.caches.size());
    return context;
}

ServiceContext::~ServiceContext() {
    stop(cache::StopMode::Cancel);
}

void ServiceContext::registerHealthChecks() {
    const auto& artifacts = config_.artifacts;
    auto add = [this](const std::string& name, health::HealthProbe probe) {
        if (!health_->registerCheck(name, std::move(probe))) {
            logger_->warn("ServiceContext: проверка '{}' не зарегистрирована", name);
        }
    };
    add("voices", health::probes::directoryHasFiles(artifacts.voicesDir, artifacts.voiceExtension));
    add("model", health::probes::fileExists(std::filesystem::path(artifacts.modelsDir) / artifacts.modelFile));
    add("disk_space", health::probes::diskSpace(artifacts.modelsDir, config_.health.minFreeDiskMb * 1024 * 1024));
    add("memory", health::probes::memoryUsage(config_.health.maxMemoryFraction));
    for (const auto& name : cacheManager_->cacheNames()) {
        add("cache_" + name, health::probes::cacheAvailable(cacheManager_, name));
    }
    for (const char* kind : {breakers::VOICE_LOAD, breakers::MODEL_LOAD, breakers::SYNTHESIS}) {
        add(std::string("breaker_") + kind, health::probes::breakerClosed(breakers_->getOrCreate(kind)));
    }
}

void ServiceContext::registerReloadTargets() {
    std::weak_ptr<cache::WarmupScheduler> weakWarmup = warmup_;
    auto voiceLoader = voiceLoader_;
    auto modelLoader = modelLoader_;
    auto primaryVoices = config_.artifacts.primaryVoices;

    reload::ReloadTarget voices;
    voices.name = "voices";
    voices.path = config_.artifacts.voicesDir;
    voices.cacheName = cache::names::VOICE_EMBEDDINGS;
    voices.invalidationKeys = voiceLoader_.list();
    voices.debounce = config_.hotReload.debounce;
    voices.extensions = {config_.artifacts.voiceExtension};
    voices.callback = [weakWarmup, voiceLoader, primaryVoices](const std::string&, const reload::PathState& state) {
        auto warmup = weakWarmup.lock();
        if (!warmup || !state.exists) return;
        int priority = VOICE_PRIORITY;
        for (const auto& voice : primaryVoices) {
            warmup->schedule(voiceTask(voiceLoader, voice, priority--));
        }
    };
    if (!hotReload_->registerTarget(std::move(voices))) {
        logger_->warn("ServiceContext: цель перезагрузки голосов не зарегистрирована");
    }

    reload::ReloadTarget model;
    model.name = "model";
    model.path = std::filesystem::path(config_.artifacts.modelsDir) / config_.artifacts.modelFile;
    model.cacheName = cache::names::MODELS;
    model.invalidationKeys = {config_.artifacts.modelFile};
    model.debounce = config_.hotReload.debounce;
    auto modelFile = config_.artifacts.modelFile;
    model.callback = [weakWarmup, modelLoader, modelFile](const std::string&, const reload::PathState& state) {
        auto warmup = weakWarmup.lock();
        if (!warmup || !state.exists) return;
        warmup->schedule(modelTask(modelLoader, modelFile));
    };
    if (!hotReload_->registerTarget(std::move(model))) {
        logger_->warn("ServiceContext: цель перезагрузки модели не зарегистрирована");
    }
}

size_t ServiceContext::scheduleStartupWarmup() {
    size_t scheduled = 0;
    if (config_.artifacts.preloadModel && warmup_->schedule(modelTask(modelLoader_, config_.artifacts.modelFile))) {
        ++scheduled;
    }
    int priority = VOICE_PRIORITY;
    for (const auto& voice : config_.artifacts.primaryVoices) {
        if (warmup_->schedule(voiceTask(voiceLoader_, voice, priority--))) {
            ++scheduled;
        }
    }
    logger_->info("ServiceContext: запланирован прогрев {} артефактов", scheduled);
    return scheduled;
}

bool ServiceContext::start() {
    if (running_) {
        return true;
    }
    if (config_.hotReload.enabled && !hotReload_->start()) {
        logger_->warn("ServiceContext: горячая перезагрузка запущена не для всех целей");
    }
    scheduleStartupWarmup();
    if (!warmup_->start()) {
        logger_->error("ServiceContext: не удалось запустить прогрев");
        return false;
    }
    auto results = health_->runAll();
    logger_->info("ServiceContext: запущен, проверок здоровья {}, общий статус: {}",
                  results.size(), health_->isHealthy() ? "healthy" : "degraded");
    running_ = true;
    return true;
}

void ServiceContext::stop(cache::StopMode mode) {
    if (!warmup_ || !hotReload_ || !health_) {
        return;
    }
    bool wasRunning = running_;
    running_ = false;
    warmup_->stop(mode);
    hotReload_->stop();
    health_->shutdown();
    cacheManager_->shutdown();
    if (wasRunning && !config_.monitor.exportPath.empty()) {
        monitor_->exportMetrics(config_.monitor.exportPath);
    }
    if (wasRunning) {
        logger_->info("ServiceContext: остановлен");
    }
}

nlohmann::json ServiceContext::statusJson() const {
    return {
        {"running", running_},
        {"caches", cacheManager_->statsJson()},
        {"breakers", breakers_->statsJson()},
        {"warmup", warmup_->getMetrics().toJson()},
        {"hotReload", hotReload_->status()},
        {"health", health_->status().toJson()},
        {"degradation", degradation_->statusJson()},
        {"performance", monitor_->summary().toJson()}
    };
}

} // namespace service
} // namespace core
} // namespace ttsserve
