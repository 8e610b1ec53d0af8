#include <cassert>
#include <cmath>
#include <iostream>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <unistd.h>
#include <nlohmann/json.hpp>
#include "ttsserve/core/monitor/PerformanceMonitor.hpp"

#include <spdlog/spdlog.h>

using namespace ttsserve::core::monitor;

PerformanceSample sample(double latencyMs, double rtf, const std::string& voice, bool cacheHit = false) {
    PerformanceSample s;
    s.latencyMs = latencyMs;
    s.rtf = rtf;
    s.artifactId = voice;
    s.cacheHit = cacheHit;
    return s;
}

void testPerformanceMonitorSummary() {
    std::cout << "Testing PerformanceMonitor summary...\n";

    PerformanceMonitor monitor(1000);
    for (int i = 1; i <= 100; ++i) {
        monitor.record(sample(static_cast<double>(i), 0.1, "af_heart"));
    }
    monitor.record(sample(0.5, 0.0, "af_heart", true));
    monitor.record(sample(50.0, 0.3, "am_puck"));

    auto summary = monitor.summary();
    assert(summary.totalSamples == 102);
    assert(summary.cacheHitSamples == 1);
    assert(summary.latency.count == 101); // Попадания кэша не входят в задержки
    assert(summary.latency.min == 1.0);
    assert(summary.latency.max == 100.0);
    assert(summary.latency.p95 == 95.0);
    assert(summary.latency.p99 == 99.0);

    auto& heart = summary.perArtifact["af_heart"];
    assert(heart.requests == 101);
    assert(heart.cacheHits == 1);
    assert(std::fabs(heart.latency.mean - 50.5) < 1e-9);
    assert(summary.perArtifact["am_puck"].rtf.max == 0.3);

    std::cout << "[OK] PerformanceMonitor summary test\n";
}

void testPerformanceMonitorWindow() {
    std::cout << "Testing PerformanceMonitor sliding window...\n";

    PerformanceMonitor monitor(10);
    for (int i = 1; i <= 20; ++i) {
        monitor.record(sample(static_cast<double>(i), 0.2, "v"));
    }
    auto summary = monitor.summary();
    assert(summary.windowSamples == 10);
    assert(summary.totalSamples == 20);
    assert(summary.latency.p50 == 15.0); // Перцентили — только по окну 11..20
    assert(summary.latency.min == 1.0);  // Накопительные агрегаты — по всем

    assert(monitor.rtfTrend(std::chrono::minutes(5)).size() == 10);

    monitor.recordCacheAccess("voices", true);
    monitor.recordCacheAccess("voices", true);
    monitor.recordCacheAccess("voices", false);
    monitor.recordCacheAccess("models", false);
    summary = monitor.summary();
    assert(summary.cacheHits == 2);
    assert(summary.cacheMisses == 2);
    assert(summary.cacheHitRate() == 0.5);
    assert(summary.toJson()["cache"]["caches"]["voices"]["hits"] == 2);

    monitor.reset();
    assert(monitor.summary().totalSamples == 0);
    assert(monitor.summary().perCache.empty());

    std::cout << "[OK] PerformanceMonitor window test\n";
}

void testPerformanceMonitorExport() {
    std::cout << "Testing PerformanceMonitor export...\n";

    auto dir = std::filesystem::temp_directory_path() / ("ttsserve-metrics-" + std::to_string(::getpid()));
    std::filesystem::remove_all(dir);
    auto path = dir / "nested" / "metrics.json";

    PerformanceMonitor monitor;
    monitor.record(sample(12.0, 0.25, "af_heart"));
    assert(monitor.exportMetrics(path.string()));

    std::ifstream in(path);
    auto json = nlohmann::json::parse(in);
    assert(json["overall"]["totalSamples"] == 1);
    assert(json["artifacts"].contains("af_heart"));

    std::filesystem::remove_all(dir);
    std::cout << "[OK] PerformanceMonitor export test\n";
}

int main() {
    try {
        testPerformanceMonitorSummary();
        testPerformanceMonitorWindow();
        testPerformanceMonitorExport();
        std::cout << "All PerformanceMonitor tests passed!\n";
    } catch (const std::exception& e) {
        std::cerr << "PerformanceMonitor test failed with exception: " << e.what() << std::endl;
        return 1;
    }
    spdlog::shutdown();
    return 0;
}
