#pragma once

#include <chrono>
#include <cstddef>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

namespace ttsserve {
namespace core {
namespace monitor {

// PerformanceSample — одно измерение синтеза
struct PerformanceSample {
    std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now();
    double latencyMs = 0.0;   // Время генерации (мс)
    double rtf = 0.0;         // Время синтеза / длительность аудио
    bool cacheHit = false;    // Ответ из кэша
    std::string artifactId;   // Голос / модель / артефакт
};

// MetricStats — агрегаты по одной величине
struct MetricStats {
    size_t count = 0;
    double mean = 0.0;
    double min = 0.0;
    double max = 0.0;
    double p50 = 0.0; // Перцентили считаются по окну
    double p95 = 0.0;
    double p99 = 0.0;
    nlohmann::json toJson() const;
};

// ArtifactStats — агрегаты по артефакту
struct ArtifactStats {
    size_t requests = 0;
    size_t cacheHits = 0;
    MetricStats latency;
    MetricStats rtf;
    double cacheHitRate() const {
        return requests > 0 ? static_cast<double>(cacheHits) / requests : 0.0;
    }
    nlohmann::json toJson() const;
};

// CacheCounters — попадания/промахи одного кэша
struct CacheCounters {
    size_t hits = 0;
    size_t misses = 0;
    double hitRate() const {
        auto total = hits + misses;
        return total > 0 ? static_cast<double>(hits) / total : 0.0;
    }
};

// PerformanceSummary — снимок метрик для мониторинга
struct PerformanceSummary {
    size_t totalSamples = 0;  // Всего записано
    size_t windowSamples = 0; // Сейчас в окне
    size_t cacheHitSamples = 0;
    MetricStats latency;      // По некэшированным запросам
    MetricStats rtf;          // По некэшированным запросам
    std::map<std::string, ArtifactStats> perArtifact;
    std::map<std::string, CacheCounters> perCache;
    size_t cacheHits = 0;     // Сумма по кэшам
    size_t cacheMisses = 0;
    double cacheHitRate() const {
        auto total = cacheHits + cacheMisses;
        return total > 0 ? static_cast<double>(cacheHits) / total : 0.0;
    }
    nlohmann::json toJson() const;
};

// PerformanceMonitor — скользящее окно измерений и счётчики кэшей
// Окно ограничено числом записей; старые записи вытесняются.
class PerformanceMonitor {
public:
    explicit PerformanceMonitor(size_t windowSize = 1000); // Конструктор
    void record(const PerformanceSample& sample); // Записать измерение
    void recordCacheAccess(const std::string& cacheName, bool hit); // Счётчик кэша
    PerformanceSummary summary() const; // Снимок
    std::vector<std::pair<std::chrono::system_clock::time_point, double>>
        rtfTrend(std::chrono::minutes window) const; // RTF за последние N минут
    bool exportMetrics(const std::string& filePath) const; // Экспорт в JSON-файл
    void reset(); // Сбросить всё
    size_t windowSize() const { return windowSize_; }
private:
    // Накопительные агрегаты (count/sum/min/max) без хранения всех значений
    struct Running {
        size_t count = 0;
        double sum = 0.0;
        double min = 0.0;
        double max = 0.0;
        void add(double value);
    };
    struct ArtifactRunning {
        size_t requests = 0;
        size_t cacheHits = 0;
        Running latency;
        Running rtf;
    };
    static MetricStats buildStats(const Running& running, std::vector<double> window);
    size_t windowSize_;
    mutable std::mutex mutex_;
    std::deque<PerformanceSample> window_;
    size_t totalSamples_ = 0;
    size_t cacheHitSamples_ = 0;
    Running latency_;
    Running rtf_;
    std::map<std::string, ArtifactRunning> perArtifact_;
    std::map<std::string, CacheCounters> perCache_;
};

} // namespace monitor
} // namespace core
} // namespace ttsserve
