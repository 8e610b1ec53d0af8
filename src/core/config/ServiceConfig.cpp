#include "ttsserve/core/config/ServiceConfig.hpp"
#include "ttsserve/core/common/Error.hpp"
#include <fstream>

namespace ttsserve {
namespace core {
namespace config {

namespace {

// Прочитать необязательное поле; отсутствие оставляет значение по умолчанию
template<typename T>
void readField(const nlohmann::json& section, const char* key, T& target) {
    auto it = section.find(key);
    if (it == section.end() || it->is_null()) return;
    target = it->get<T>();
}

template<typename Duration>
void readDuration(const nlohmann::json& section, const char* key, Duration& target) {
    auto it = section.find(key);
    if (it == section.end() || it->is_null()) return;
    auto value = it->get<long long>();
    if (value < 0) {
        throw ConfigError(std::string("negative duration for '") + key + "'");
    }
    target = Duration(value);
}

const nlohmann::json& section(const nlohmann::json& root, const char* name) {
    static const nlohmann::json empty = nlohmann::json::object();
    auto it = root.find(name);
    if (it == root.end() || it->is_null()) return empty;
    if (!it->is_object()) {
        throw ConfigError(std::string("section '") + name + "' must be an object");
    }
    return *it;
}

resilience::CircuitBreakerConfig readBreaker(const nlohmann::json& json, resilience::CircuitBreakerConfig base) {
    readField(json, "failure_threshold", base.failureThreshold);
    readDuration(json, "cooldown_ms", base.cooldown);
    return base;
}

nlohmann::json breakerJson(const resilience::CircuitBreakerConfig& config) {
    return {{"failure_threshold", config.failureThreshold}, {"cooldown_ms", config.cooldown.count()}};
}

} // namespace

ServiceConfig ServiceConfig::fromJson(const nlohmann::json& json) {
    if (!json.is_object()) {
        throw ConfigError("configuration root must be an object");
    }
    ServiceConfig config;
    try {
        const auto& logging = section(json, "logging");
        readField(logging, "level", config.logging.level);
        readField(logging, "file", config.logging.filePath);
        readField(logging, "max_file_size", config.logging.maxFileSize);
        readField(logging, "max_files", config.logging.maxFiles);
        readField(logging, "pattern", config.logging.pattern);

        const auto& caches = section(json, "caches");
        for (auto it = caches.begin(); it != caches.end(); ++it) {
            cache::CacheLimits limits = config.caches.caches.count(it.key())
                ? config.caches.caches[it.key()] : cache::CacheLimits{};
            readField(it.value(), "max_entries", limits.maxEntries);
            readField(it.value(), "max_bytes", limits.maxBytes);
            config.caches.caches[it.key()] = limits;
        }

        const auto& breakers = section(json, "breakers");
        if (auto it = breakers.find("default"); it != breakers.end()) {
            config.defaultBreaker = readBreaker(*it, config.defaultBreaker);
        }
        for (auto it = breakers.begin(); it != breakers.end(); ++it) {
            if (it.key() == "default") continue;
            config.breakers[it.key()] = readBreaker(it.value(), config.defaultBreaker);
        }

        const auto& retry = section(json, "retry");
        readField(retry, "max_attempts", config.retry.maxAttempts);
        readDuration(retry, "base_delay_ms", config.retry.baseDelay);
        readDuration(retry, "max_delay_ms", config.retry.maxDelay);
        readField(retry, "jitter", config.retry.jitterFraction);
        if (auto it = retry.find("retryable"); it != retry.end()) {
            config.retry.retryableKinds.clear();
            for (const auto& name : *it) {
                auto kind = errorKindFromString(name.get<std::string>());
                if (!kind) {
                    throw ConfigError("unknown error kind in retry.retryable: " + name.get<std::string>());
                }
                config.retry.retryableKinds.insert(*kind);
            }
        }

        const auto& warmup = section(json, "warmup");
        readField(warmup, "workers", config.warmup.workers);
        readField(warmup, "max_queue_size", config.warmup.maxQueueSize);
        readField(warmup, "breaker", config.warmup.breakerKind);

        const auto& hotReload = section(json, "hot_reload");
        readField(hotReload, "enabled", config.hotReload.enabled);
        readDuration(hotReload, "debounce_ms", config.hotReload.debounce);

        const auto& health = section(json, "health");
        readDuration(health, "timeout_ms", config.health.registry.probeTimeout);
        readField(health, "max_concurrent", config.health.registry.maxConcurrentProbes);
        readDuration(health, "interval_s", config.health.interval);
        readField(health, "min_free_disk_mb", config.health.minFreeDiskMb);
        readField(health, "max_memory_fraction", config.health.maxMemoryFraction);

        const auto& monitor = section(json, "monitor");
        readField(monitor, "window_size", config.monitor.windowSize);
        readField(monitor, "export_path", config.monitor.exportPath);
        readDuration(monitor, "export_interval_s", config.monitor.exportInterval);

        const auto& artifacts = section(json, "artifacts");
        readField(artifacts, "voices_dir", config.artifacts.voicesDir);
        readField(artifacts, "voice_extension", config.artifacts.voiceExtension);
        readField(artifacts, "models_dir", config.artifacts.modelsDir);
        readField(artifacts, "model_extension", config.artifacts.modelExtension);
        readField(artifacts, "model_file", config.artifacts.modelFile);
        readField(artifacts, "primary_voices", config.artifacts.primaryVoices);
        readField(artifacts, "preload_model", config.artifacts.preloadModel);

        readDuration(json, "status_interval_s", config.statusInterval);
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(std::string("invalid configuration value: ") + e.what());
    }
    config.validate();
    return config;
}

ServiceConfig ServiceConfig::loadFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw ConfigError("cannot open configuration file " + path);
    }
    nlohmann::json json;
    try {
        file >> json;
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError("cannot parse " + path + ": " + e.what());
    }
    return fromJson(json);
}

nlohmann::json ServiceConfig::toJson() const {
    nlohmann::json caches = nlohmann::json::object();
    for (const auto& [name, limits] : this->caches.caches) {
        caches[name] = {{"max_entries", limits.maxEntries}, {"max_bytes", limits.maxBytes}};
    }
    nlohmann::json breakers = {{"default", breakerJson(defaultBreaker)}};
    for (const auto& [kind, breaker] : this->breakers) {
        breakers[kind] = breakerJson(breaker);
    }
    nlohmann::json retryable = nlohmann::json::array();
    for (auto kind : retry.retryableKinds) {
        retryable.push_back(toString(kind));
    }
    return {
        {"logging", {
            {"level", logging.level},
            {"file", logging.filePath},
            {"max_file_size", logging.maxFileSize},
            {"max_files", logging.maxFiles},
            {"pattern", logging.pattern}
        }},
        {"caches", caches},
        {"breakers", breakers},
        {"retry", {
            {"max_attempts", retry.maxAttempts},
            {"base_delay_ms", retry.baseDelay.count()},
            {"max_delay_ms", retry.maxDelay.count()},
            {"jitter", retry.jitterFraction},
            {"retryable", retryable}
        }},
        {"warmup", {
            {"workers", warmup.workers},
            {"max_queue_size", warmup.maxQueueSize},
            {"breaker", warmup.breakerKind}
        }},
        {"hot_reload", {
            {"enabled", hotReload.enabled},
            {"debounce_ms", hotReload.debounce.count()}
        }},
        {"health", {
            {"timeout_ms", health.registry.probeTimeout.count()},
            {"max_concurrent", health.registry.maxConcurrentProbes},
            {"interval_s", health.interval.count()},
            {"min_free_disk_mb", health.minFreeDiskMb},
            {"max_memory_fraction", health.maxMemoryFraction}
        }},
        {"monitor", {
            {"window_size", monitor.windowSize},
            {"export_path", monitor.exportPath},
            {"export_interval_s", monitor.exportInterval.count()}
        }},
        {"artifacts", {
            {"voices_dir", artifacts.voicesDir},
            {"voice_extension", artifacts.voiceExtension},
            {"models_dir", artifacts.modelsDir},
            {"model_extension", artifacts.modelExtension},
            {"model_file", artifacts.modelFile},
            {"primary_voices", artifacts.primaryVoices},
            {"preload_model", artifacts.preloadModel}
        }},
        {"status_interval_s", statusInterval.count()}
    };
}

void ServiceConfig::validate() const {
    if (!logging.validate()) {
        throw ConfigError("invalid logging configuration (level '" + logging.level + "')");
    }
    if (!caches.validate()) {
        throw ConfigError("every cache needs a name and at least one bound");
    }
    if (!defaultBreaker.validate()) {
        throw ConfigError("invalid default breaker configuration");
    }
    for (const auto& [kind, breaker] : breakers) {
        if (!breaker.validate()) {
            throw ConfigError("invalid breaker configuration for '" + kind + "'");
        }
    }
    if (!retry.validate()) {
        throw ConfigError("invalid retry configuration");
    }
    if (!warmup.validate()) {
        throw ConfigError("invalid warm-up configuration");
    }
    if (!health.registry.validate() || health.maxMemoryFraction <= 0.0 || health.maxMemoryFraction > 1.0) {
        throw ConfigError("invalid health configuration");
    }
    if (monitor.windowSize == 0) {
        throw ConfigError("monitor.window_size must be positive");
    }
    if (statusInterval.count() == 0 || health.interval.count() == 0) {
        throw ConfigError("intervals must be positive");
    }
}

} // namespace config
} // namespace core
} // namespace ttsserve
