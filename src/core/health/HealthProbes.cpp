#include "ttsserve/core/health/HealthProbes.hpp"
#include <sstream>
#include <system_error>

#if defined(__linux__)
#include <sys/sysinfo.h>
#endif

namespace ttsserve {
namespace core {
namespace health {
namespace probes {

HealthProbe fileExists(const std::filesystem::path& path) {
    return [path] {
        std::error_code ec;
        if (!std::filesystem::is_regular_file(path, ec)) {
            return HealthResult::failed("missing: " + path.string());
        }
        auto size = std::filesystem::file_size(path, ec);
        if (ec || size == 0) {
            return HealthResult::failed("empty or unreadable: " + path.string());
        }
        return HealthResult::ok(path.string() + " (" + std::to_string(size) + " bytes)");
    };
}

HealthProbe directoryHasFiles(const std::filesystem::path& directory, const std::string& extension) {
    return [directory, extension] {
        std::error_code ec;
        if (!std::filesystem::is_directory(directory, ec)) {
            return HealthResult::failed("directory missing: " + directory.string());
        }
        size_t count = 0;
        for (const auto& entry : std::filesystem::directory_iterator(directory, ec)) {
            if (!entry.is_regular_file()) continue;
            if (!extension.empty() && entry.path().extension() != extension) continue;
            ++count;
        }
        if (ec) {
            return HealthResult::failed("cannot list " + directory.string() + ": " + ec.message());
        }
        if (count == 0) {
            return HealthResult::failed("no " + (extension.empty() ? std::string("files") : extension + " files") +
                                        " in " + directory.string());
        }
        return HealthResult::ok(std::to_string(count) + " artifacts in " + directory.string());
    };
}

HealthProbe diskSpace(const std::filesystem::path& path, uintmax_t minFreeBytes) {
    return [path, minFreeBytes] {
        std::error_code ec;
        auto info = std::filesystem::space(path, ec);
        if (ec) {
            return HealthResult::failed("cannot query space of " + path.string() + ": " + ec.message());
        }
        std::ostringstream detail;
        detail << info.available / (1024 * 1024) << " MB free";
        if (info.available < minFreeBytes) {
            return HealthResult::failed(detail.str() + ", below " + std::to_string(minFreeBytes / (1024 * 1024)) + " MB");
        }
        return HealthResult::ok(detail.str());
    };
}

HealthProbe memoryUsage(double maxUsedFraction) {
    return [maxUsedFraction] {
#if defined(__linux__)
        struct sysinfo si;
        if (sysinfo(&si) != 0) {
            return HealthResult::failed("sysinfo failed");
        }
        double total = static_cast<double>(si.totalram) * si.mem_unit;
        double available = static_cast<double>(si.freeram + si.bufferram) * si.mem_unit;
        if (total <= 0.0) {
            return HealthResult::failed("total memory unknown");
        }
        double used = 1.0 - available / total;
        std::ostringstream detail;
        detail.precision(3);
        detail << "memory used " << used * 100.0 << "%";
        if (used > maxUsedFraction) {
            return HealthResult::failed(detail.str());
        }
        return HealthResult::ok(detail.str());
#else
        (void)maxUsedFraction;
        return HealthResult::ok("memory probe not supported on this platform");
#endif
    };
}

HealthProbe cacheAvailable(std::shared_ptr<cache::CacheManager> cacheManager, const std::string& cacheName) {
    return [cacheManager, cacheName] {
        if (!cacheManager || cacheManager->isShutdown()) {
            return HealthResult::failed("cache manager is not running");
        }
        auto stats = cacheManager->stats(cacheName);
        if (!stats) {
            return HealthResult::failed("cache '" + cacheName + "' is not registered");
        }
        return HealthResult::ok(std::to_string(stats->currentCount) + " entries, " +
                                std::to_string(stats->currentSize) + " bytes");
    };
}

HealthProbe breakerClosed(std::shared_ptr<resilience::CircuitBreaker> breaker) {
    return [breaker] {
        if (!breaker) {
            return HealthResult::failed("breaker is not configured");
        }
        if (breaker->isOpen()) {
            return HealthResult::failed("breaker '" + breaker->name() + "' is open");
        }
        return HealthResult::ok(std::string("breaker '") + breaker->name() + "' is " +
                                resilience::toString(breaker->state()));
    };
}

} // namespace probes
} // namespace health
} // namespace core
} // namespace ttsserve
