#include <cassert>
#include <iostream>
#include <memory>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <thread>
#include <unistd.h>
#include "ttsserve/core/health/HealthRegistry.hpp"
#include "ttsserve/core/health/HealthProbes.hpp"
#include "ttsserve/core/cache/manager/CacheManager.hpp"
#include "ttsserve/core/resilience/CircuitBreaker.hpp"

#include <spdlog/spdlog.h>

namespace fs = std::filesystem;
using namespace ttsserve::core;
using namespace ttsserve::core::health;
using std::chrono::milliseconds;

void smokeTestHealthRegistry() {
    std::cout << "Testing HealthRegistry aggregation...\n";

    HealthRegistry registry;
    assert(registry.registerCheck("model", [] { return HealthResult::ok("loaded"); }));
    assert(registry.registerCheck("voices", [] { return HealthResult::failed("no voices"); }));
    assert(registry.registerCheck("disk", [] { return HealthResult::ok(); }));
    assert(!registry.registerCheck("disk", [] { return HealthResult::ok(); }));
    assert(!registry.registerCheck("", [] { return HealthResult::ok(); }));
    assert(registry.checkCount() == 3);

    // Ни разу не выполненная проверка — нездорова
    assert(!registry.isHealthy());

    auto results = registry.runAll();
    assert(results.size() == 3);
    assert(results["model"].healthy);
    assert(!results["voices"].healthy);
    assert(!registry.isHealthy());

    // Выключенная проверка не участвует в агрегате
    assert(registry.disable("voices"));
    assert(registry.isHealthy());
    auto status = registry.status();
    assert(status.enabled["voices"] == false);
    assert(status.checks.count("voices") == 1);
    assert(status.toJson()["checks"]["voices"]["enabled"] == false);

    assert(registry.runAll().size() == 2);
    assert(registry.enable("voices"));
    assert(!registry.isHealthy());
    assert(registry.unregisterCheck("voices"));
    assert(registry.isHealthy());
    assert(!registry.enable("voices"));

    auto missing = registry.run("voices");
    assert(!missing.healthy);

    registry.shutdown();
    std::cout << "[OK] HealthRegistry aggregation test\n";
}

void testHealthRegistryTimeout() {
    std::cout << "Testing HealthRegistry probe timeout...\n";

    HealthRegistryConfig config;
    config.probeTimeout = milliseconds(2000);
    HealthRegistry registry(config);

    // Флаг в shared_ptr: поток пробы может пережить тест
    auto release = std::make_shared<std::atomic<bool>>(false);
    assert(registry.registerCheck("hung", [release] {
        while (!*release) {
            std::this_thread::sleep_for(milliseconds(5));
        }
        return HealthResult::ok();
    }, true, milliseconds(100)));
    assert(registry.registerCheck("throws", []() -> HealthResult {
        throw std::runtime_error("probe exploded");
    }));

    auto started = std::chrono::steady_clock::now();
    auto result = registry.run("hung");
    auto elapsed = std::chrono::steady_clock::now() - started;
    assert(!result.healthy);
    assert(result.timedOut);
    assert(elapsed < milliseconds(1000));
    assert(registry.lastResult("hung")->timedOut);

    auto thrown = registry.run("throws");
    assert(!thrown.healthy);
    assert(!thrown.timedOut);
    assert(thrown.detail.find("probe exploded") != std::string::npos);

    release->store(true);
    registry.shutdown();
    auto afterShutdown = registry.run("throws");
    assert(!afterShutdown.healthy);

    std::cout << "[OK] HealthRegistry timeout test\n";
}

void testHealthRegistryHungCheckBounded() {
    std::cout << "Testing HealthRegistry repeated runs of a hung check...\n";

    HealthRegistryConfig config;
    config.probeTimeout = milliseconds(20);
    HealthRegistry registry(config);

    auto release = std::make_shared<std::atomic<bool>>(false);
    auto invocations = std::make_shared<std::atomic<int>>(0);
    assert(registry.registerCheck("hung", [release, invocations] {
        ++*invocations;
        while (!*release) {
            std::this_thread::sleep_for(milliseconds(1));
        }
        return HealthResult::ok();
    }));

    for (int i = 0; i < 50; ++i) {
        auto result = registry.run("hung");
        assert(!result.healthy);
        assert(result.timedOut);
    }
    auto results = registry.runAll();
    assert(results.at("hung").timedOut);
    assert(*invocations == 1);
    assert(registry.outstandingProbes() == 1);

    // После возврата пробы следующий запуск стартует новую
    release->store(true);
    while (registry.outstandingProbes() != 0) {
        std::this_thread::sleep_for(milliseconds(1));
    }
    auto recovered = registry.run("hung");
    assert(recovered.healthy);
    assert(*invocations == 2);
    assert(registry.isHealthy());

    registry.shutdown();
    std::cout << "[OK] HealthRegistry hung check test\n";
}

void testHealthProbes() {
    std::cout << "Testing health probes...\n";

    auto dir = fs::temp_directory_path() / ("ttsserve-probes-" + std::to_string(::getpid()));
    fs::remove_all(dir);
    fs::create_directories(dir);
    {
        std::ofstream out(dir / "af_heart.bin", std::ios::binary);
        out << "voice";
    }
    std::ofstream(dir / "empty.onnx").close();

    assert(probes::fileExists(dir / "af_heart.bin")().healthy);
    assert(!probes::fileExists(dir / "empty.onnx")().healthy);
    assert(!probes::fileExists(dir / "missing.onnx")().healthy);
    assert(probes::directoryHasFiles(dir, ".bin")().healthy);
    assert(!probes::directoryHasFiles(dir, ".pt")().healthy);
    assert(!probes::directoryHasFiles(dir / "absent")().healthy);
    assert(probes::diskSpace(dir, 0)().healthy);
    assert(probes::memoryUsage(1.0)().healthy);

    cache::CacheManagerConfig cacheConfig;
    cacheConfig.caches["voices"] = cache::CacheLimits{4, 0};
    auto manager = std::make_shared<cache::CacheManager>(cacheConfig);
    assert(manager->initialize());
    assert(probes::cacheAvailable(manager, "voices")().healthy);
    assert(!probes::cacheAvailable(manager, "models")().healthy);
    manager->shutdown();
    assert(!probes::cacheAvailable(manager, "voices")().healthy);

    resilience::CircuitBreakerConfig breakerConfig;
    breakerConfig.failureThreshold = 1;
    auto breaker = std::make_shared<resilience::CircuitBreaker>("model_load", breakerConfig);
    auto breakerProbe = probes::breakerClosed(breaker);
    assert(breakerProbe().healthy);
    try {
        breaker->call([]() -> int { throw LoadError("bad model"); });
    } catch (const LoadError&) {
    }
    assert(!breakerProbe().healthy);

    fs::remove_all(dir);
    std::cout << "[OK] health probes test\n";
}

int main() {
    try {
        smokeTestHealthRegistry();
        testHealthRegistryTimeout();
        testHealthRegistryHungCheckBounded();
        testHealthProbes();
        std::cout << "All HealthRegistry tests passed!\n";
    } catch (const std::exception& e) {
        std::cerr << "HealthRegistry test failed with exception: " << e.what() << std::endl;
        return 1;
    }
    spdlog::shutdown();
    return 0;
}
