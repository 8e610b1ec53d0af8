#include "ttsserve/core/monitor/PerformanceMonitor.hpp"
#include "ttsserve/core/logging/Logging.hpp"
#include <algorithm>
#include <cmath>
#include <filesystem>
#include <fstream>

namespace ttsserve {
namespace core {
namespace monitor {

namespace {

// Перцентиль по методу ближайшего ранга; values отсортирован
double percentile(const std::vector<double>& values, double p) {
    if (values.empty()) return 0.0;
    auto rank = static_cast<size_t>(std::ceil(p / 100.0 * static_cast<double>(values.size())));
    if (rank == 0) rank = 1;
    return values[std::min(rank, values.size()) - 1];
}

double round3(double value) {
    return std::round(value * 1000.0) / 1000.0;
}

} // namespace

nlohmann::json MetricStats::toJson() const {
    return {
        {"count", count},
        {"mean", round3(mean)},
        {"min", round3(min)},
        {"max", round3(max)},
        {"p50", round3(p50)},
        {"p95", round3(p95)},
        {"p99", round3(p99)}
    };
}

nlohmann::json ArtifactStats::toJson() const {
    return {
        {"requests", requests},
        {"cacheHits", cacheHits},
        {"cacheHitRate", round3(cacheHitRate())},
        {"latencyMs", latency.toJson()},
        {"rtf", rtf.toJson()}
    };
}

nlohmann::json PerformanceSummary::toJson() const {
    nlohmann::json artifacts = nlohmann::json::object();
    for (const auto& [id, stats] : perArtifact) {
        artifacts[id] = stats.toJson();
    }
    nlohmann::json caches = nlohmann::json::object();
    for (const auto& [name, counters] : perCache) {
        caches[name] = {
            {"hits", counters.hits},
            {"misses", counters.misses},
            {"hitRate", round3(counters.hitRate())}
        };
    }
    return {
        {"overall", {
            {"totalSamples", totalSamples},
            {"windowSamples", windowSamples},
            {"cacheHitSamples", cacheHitSamples},
            {"latencyMs", latency.toJson()},
            {"rtf", rtf.toJson()}
        }},
        {"artifacts", artifacts},
        {"cache", {
            {"hits", cacheHits},
            {"misses", cacheMisses},
            {"hitRate", round3(cacheHitRate())},
            {"caches", caches}
        }}
    };
}

void PerformanceMonitor::Running::add(double value) {
    if (count == 0) {
        min = value;
        max = value;
    } else {
        min = std::min(min, value);
        max = std::max(max, value);
    }
    ++count;
    sum += value;
}

PerformanceMonitor::PerformanceMonitor(size_t windowSize)
    : windowSize_(windowSize == 0 ? 1 : windowSize) {}

void PerformanceMonitor::record(const PerformanceSample& sample) {
    std::lock_guard<std::mutex> lock(mutex_);
    window_.push_back(sample);
    while (window_.size() > windowSize_) {
        window_.pop_front();
    }
    ++totalSamples_;

    auto& artifact = perArtifact_[sample.artifactId];
    ++artifact.requests;
    if (sample.cacheHit) {
        ++cacheHitSamples_;
        ++artifact.cacheHits;
        return;
    }
    latency_.add(sample.latencyMs);
    rtf_.add(sample.rtf);
    artifact.latency.add(sample.latencyMs);
    artifact.rtf.add(sample.rtf);
}

void PerformanceMonitor::recordCacheAccess(const std::string& cacheName, bool hit) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& counters = perCache_[cacheName];
    if (hit) {
        ++counters.hits;
    } else {
        ++counters.misses;
    }
}

MetricStats PerformanceMonitor::buildStats(const Running& running, std::vector<double> window) {
    MetricStats stats;
    stats.count = running.count;
    stats.mean = running.count > 0 ? running.sum / static_cast<double>(running.count) : 0.0;
    stats.min = running.min;
    stats.max = running.max;
    std::sort(window.begin(), window.end());
    stats.p50 = percentile(window, 50.0);
    stats.p95 = percentile(window, 95.0);
    stats.p99 = percentile(window, 99.0);
    return stats;
}

PerformanceSummary PerformanceMonitor::summary() const {
    std::lock_guard<std::mutex> lock(mutex_);
    PerformanceSummary result;
    result.totalSamples = totalSamples_;
    result.windowSamples = window_.size();
    result.cacheHitSamples = cacheHitSamples_;

    std::vector<double> latencies;
    std::vector<double> rtfs;
    std::map<std::string, std::pair<std::vector<double>, std::vector<double>>> artifactWindows;
    for (const auto& sample : window_) {
        if (sample.cacheHit) continue;
        latencies.push_back(sample.latencyMs);
        rtfs.push_back(sample.rtf);
        auto& slot = artifactWindows[sample.artifactId];
        slot.first.push_back(sample.latencyMs);
        slot.second.push_back(sample.rtf);
    }
    result.latency = buildStats(latency_, std::move(latencies));
    result.rtf = buildStats(rtf_, std::move(rtfs));

    for (const auto& [id, running] : perArtifact_) {
        ArtifactStats stats;
        stats.requests = running.requests;
        stats.cacheHits = running.cacheHits;
        auto it = artifactWindows.find(id);
        if (it != artifactWindows.end()) {
            stats.latency = buildStats(running.latency, it->second.first);
            stats.rtf = buildStats(running.rtf, it->second.second);
        } else {
            stats.latency = buildStats(running.latency, {});
            stats.rtf = buildStats(running.rtf, {});
        }
        result.perArtifact[id] = stats;
    }

    result.perCache = perCache_;
    for (const auto& [name, counters] : perCache_) {
        result.cacheHits += counters.hits;
        result.cacheMisses += counters.misses;
    }
    return result;
}

std::vector<std::pair<std::chrono::system_clock::time_point, double>>
PerformanceMonitor::rtfTrend(std::chrono::minutes window) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto cutoff = std::chrono::system_clock::now() - window;
    std::vector<std::pair<std::chrono::system_clock::time_point, double>> trend;
    for (const auto& sample : window_) {
        if (!sample.cacheHit && sample.timestamp >= cutoff) {
            trend.emplace_back(sample.timestamp, sample.rtf);
        }
    }
    return trend;
}

bool PerformanceMonitor::exportMetrics(const std::string& filePath) const {
    auto logger = logging::getLogger("monitor");
    try {
        std::filesystem::path path(filePath);
        if (path.has_parent_path()) {
            std::filesystem::create_directories(path.parent_path());
        }
        std::ofstream file(path);
        if (!file) {
            logger->error("PerformanceMonitor: не удалось открыть файл {}", filePath);
            return false;
        }
        file << summary().toJson().dump(4);
        logger->info("PerformanceMonitor: метрики экспортированы в {}", filePath);
        return true;
    } catch (const std::exception& e) {
        logger->error("PerformanceMonitor: ошибка экспорта метрик: {}", e.what());
        return false;
    }
}

void PerformanceMonitor::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    window_.clear();
    totalSamples_ = 0;
    cacheHitSamples_ = 0;
    latency_ = Running{};
    rtf_ = Running{};
    perArtifact_.clear();
    perCache_.clear();
}

} // namespace monitor
} // namespace core
} // namespace ttsserve
