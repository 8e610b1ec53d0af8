#include <cassert>
#include <iostream>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>
#include <nlohmann/json.hpp>
#include "ttsserve/core/config/ServiceConfig.hpp"
#include "ttsserve/core/common/Error.hpp"

using namespace ttsserve::core;
using namespace ttsserve::core::config;

bool rejects(const nlohmann::json& json) {
    try {
        ServiceConfig::fromJson(json);
    } catch (const ConfigError&) {
        return true;
    }
    return false;
}

void testServiceConfigDefaults() {
    std::cout << "Testing ServiceConfig defaults...\n";

    auto config = ServiceConfig::defaults();
    config.validate();
    assert(config.caches.caches.size() == 4);
    assert(config.caches.caches.count(cache::names::MODELS) == 1);
    assert(config.retry.maxAttempts == 3);
    assert(config.hotReload.debounce == std::chrono::milliseconds(500));
    assert(config.artifacts.modelFile == "model_q4.onnx");

    // toJson -> fromJson сохраняет значения
    auto restored = ServiceConfig::fromJson(config.toJson());
    assert(restored.toJson() == config.toJson());

    std::cout << "[OK] ServiceConfig defaults test\n";
}

void testServiceConfigFromJson() {
    std::cout << "Testing ServiceConfig parsing...\n";

    auto json = nlohmann::json::parse(R"({
        "logging": {"level": "debug"},
        "caches": {"models": {"max_entries": 1}, "phonemes": {"max_entries": 500}},
        "breakers": {
            "default": {"failure_threshold": 4},
            "model_load": {"cooldown_ms": 1000}
        },
        "retry": {"max_attempts": 5, "base_delay_ms": 50, "retryable": ["LoadError", "InternalError"]},
        "warmup": {"workers": 3},
        "hot_reload": {"enabled": false, "debounce_ms": 250},
        "health": {"timeout_ms": 1000, "interval_s": 10},
        "artifacts": {"voices_dir": "/srv/voices", "primary_voices": ["af_bella"]},
        "status_interval_s": 5
    })");
    auto config = ServiceConfig::fromJson(json);

    assert(config.logging.level == "debug");
    assert(config.caches.caches["models"].maxEntries == 1);
    assert(config.caches.caches["models"].maxBytes == 1024ull * 1024 * 1024); // Остальное — по умолчанию
    assert(config.caches.caches["phonemes"].maxEntries == 500);
    assert(config.defaultBreaker.failureThreshold == 4);
    // Вид наследует default и переопределяет заданное
    assert(config.breakers["model_load"].failureThreshold == 4);
    assert(config.breakers["model_load"].cooldown == std::chrono::milliseconds(1000));
    assert(config.retry.maxAttempts == 5);
    assert(config.retry.retryableKinds.count(ErrorKind::Internal) == 1);
    assert(config.warmup.workers == 3);
    assert(!config.hotReload.enabled);
    assert(config.hotReload.debounce == std::chrono::milliseconds(250));
    assert(config.health.registry.probeTimeout == std::chrono::milliseconds(1000));
    assert(config.health.interval == std::chrono::seconds(10));
    assert(config.artifacts.voicesDir == "/srv/voices");
    assert(config.artifacts.primaryVoices.size() == 1);
    assert(config.statusInterval == std::chrono::seconds(5));

    std::cout << "[OK] ServiceConfig parsing test\n";
}

void testServiceConfigErrors() {
    std::cout << "Testing ServiceConfig errors...\n";

    assert(rejects(nlohmann::json::array()));
    assert(rejects({{"logging", {{"level", "verbose"}}}}));
    assert(rejects({{"retry", {{"max_attempts", 0}}}}));
    assert(rejects({{"retry", {{"retryable", nlohmann::json::array({"NoSuchError"})}}}}));
    assert(rejects({{"retry", {{"base_delay_ms", -1}}}}));
    assert(rejects({{"warmup", {{"workers", "two"}}}}));
    assert(rejects({{"caches", {{"empty", {{"max_entries", 0}}}}}}));
    assert(rejects({{"health", 5}}));

    bool missing = false;
    try {
        ServiceConfig::loadFromFile("/nonexistent/ttsserve.json");
    } catch (const ConfigError&) {
        missing = true;
    }
    assert(missing);

    auto path = std::filesystem::temp_directory_path() / ("ttsserve-config-" + std::to_string(::getpid()) + ".json");
    {
        std::ofstream out(path);
        out << "{ not json";
    }
    bool malformed = false;
    try {
        ServiceConfig::loadFromFile(path.string());
    } catch (const ConfigError&) {
        malformed = true;
    }
    assert(malformed);

    {
        std::ofstream out(path);
        out << R"({"warmup": {"max_queue_size": 7}})";
    }
    assert(ServiceConfig::loadFromFile(path.string()).warmup.maxQueueSize == 7);
    std::filesystem::remove(path);

    std::cout << "[OK] ServiceConfig errors test\n";
}

int main() {
    try {
        testServiceConfigDefaults();
        testServiceConfigFromJson();
        testServiceConfigErrors();
        std::cout << "All ServiceConfig tests passed!\n";
    } catch (const std::exception& e) {
        std::cerr << "ServiceConfig test failed with exception: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
