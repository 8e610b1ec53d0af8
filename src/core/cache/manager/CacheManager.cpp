#include "ttsserve/core/cache/manager/CacheManager.hpp"
#include "ttsserve/core/logging/Logging.hpp"
#include <atomic>
#include <condition_variable>
#include <future>
#include <map>
#include <mutex>
#include <shared_mutex>
#include <utility>

namespace ttsserve {
namespace core {
namespace cache {

namespace {

// InflightLoad — одна выполняющаяся загрузка и её ожидающие
// Запись живёт в таблице, пока загрузчик не вернул управление, даже если
// ожидающие уже получили результат (отмена) или ключ инвалидирован.
struct InflightLoad {
    std::promise<Result<ArtifactPtr>> promise;
    std::shared_future<Result<ArtifactPtr>> future;
    bool settled = false;       // Результат уже доставлен (под inflightMutex)
    bool stale = false;         // Ключ инвалидирован во время загрузки: не кэшировать
    bool finished = false;      // Загрузчик вернул управление
    size_t cancellations = 0;   // Счётчик cancelLoad, будит ждущих перезапуска
    size_t restartWaiters = 0;  // Вызывающие, ждущие окончания старой загрузки
    InflightLoad() : future(promise.get_future().share()) {}

    bool joinable() const { return !settled && !stale; }
};

using InflightKey = std::pair<std::string, std::string>;

Result<ArtifactPtr> cancelledResult(const std::string& message) {
    return Result<ArtifactPtr>::failure(
        ErrorInfo::fromException(std::make_exception_ptr(CancelledError(message))));
}

} // namespace

struct CacheManager::Impl {
    CacheManagerConfig config;
    std::shared_ptr<monitor::PerformanceMonitor> monitor;
    std::map<std::string, std::shared_ptr<ArtifactCache>> caches;
    mutable std::shared_mutex cachesMutex;
    std::map<InflightKey, std::shared_ptr<InflightLoad>> inflight;
    mutable std::mutex inflightMutex; // Захватывается до мьютекса кэша, никогда после
    std::condition_variable inflightCv; // Завершение загрузчика / отмена / остановка
    std::atomic<bool> stopped{false};
    std::shared_ptr<spdlog::logger> logger;

    Impl(const CacheManagerConfig& cfg, std::shared_ptr<monitor::PerformanceMonitor> mon)
        : config(cfg), monitor(std::move(mon)), logger(logging::getLogger("cachemanager")) {}

    std::shared_ptr<ArtifactCache> find(const std::string& name) const {
        std::shared_lock<std::shared_mutex> lock(cachesMutex);
        auto it = caches.find(name);
        return it != caches.end() ? it->second : nullptr;
    }

    std::shared_ptr<ArtifactCache> require(const std::string& name) const {
        auto cache = find(name);
        if (!cache) {
            throw UnknownCacheError(name);
        }
        return cache;
    }

    void recordAccess(const std::string& name, bool hit) {
        if (monitor) {
            monitor->recordCacheAccess(name, hit);
        }
    }

    // Доставить результат ожидающим (под inflightMutex); запись снимает только лидер
    void settle(const std::shared_ptr<InflightLoad>& load, Result<ArtifactPtr> result) {
        if (load->settled) return;
        load->settled = true;
        load->promise.set_value(std::move(result));
    }
};

CacheManager::CacheManager(const CacheManagerConfig& config,
                           std::shared_ptr<monitor::PerformanceMonitor> monitor)
    : pImpl(std::make_unique<Impl>(config, std::move(monitor))) {}

CacheManager::~CacheManager() {
    shutdown();
}

bool CacheManager::initialize() {
    if (!pImpl->config.validate()) {
        pImpl->logger->error("CacheManager: некорректная конфигурация кэшей");
        return false;
    }
    for (const auto& [name, limits] : pImpl->config.caches) {
        if (!addCache(name, limits)) {
            return false;
        }
    }
    pImpl->logger->info("CacheManager: инициализирован, кэшей: {}", pImpl->config.caches.size());
    return true;
}

bool CacheManager::addCache(const std::string& name, const CacheLimits& limits) {
    if (name.empty() || !limits.validate()) {
        pImpl->logger->error("CacheManager: некорректные параметры кэша '{}'", name);
        return false;
    }
    std::unique_lock<std::shared_mutex> lock(pImpl->cachesMutex);
    if (pImpl->caches.count(name)) {
        pImpl->logger->warn("CacheManager: кэш '{}' уже существует", name);
        return true;
    }
    pImpl->caches.emplace(name, std::make_shared<ArtifactCache>(name, limits));
    pImpl->logger->debug("CacheManager: добавлен кэш '{}'", name);
    return true;
}

Result<ArtifactPtr> CacheManager::getOrLoad(const std::string& cacheName, const std::string& key,
                                            const Loader& loader) {
    if (pImpl->stopped) {
        return cancelledResult("cache manager is shut down");
    }
    auto cache = pImpl->find(cacheName);
    if (!cache) {
        return Result<ArtifactPtr>::failure(
            ErrorInfo::fromException(std::make_exception_ptr(UnknownCacheError(cacheName))));
    }

    if (auto hit = cache->get(key)) {
        pImpl->recordAccess(cacheName, true);
        return Result<ArtifactPtr>::success(*hit);
    }
    pImpl->recordAccess(cacheName, false);

    InflightKey inflightKey{cacheName, key};
    std::shared_ptr<InflightLoad> load;
    bool leader = false;
    {
        std::unique_lock<std::mutex> lock(pImpl->inflightMutex);
        while (true) {
            if (pImpl->stopped) {
                return cancelledResult("cache manager is shut down");
            }
            // Лидер мог успеть положить значение между промахом и захватом мьютекса
            if (auto value = cache->peek(key)) {
                return Result<ArtifactPtr>::success(*value);
            }
            auto it = pImpl->inflight.find(inflightKey);
            if (it == pImpl->inflight.end()) {
                load = std::make_shared<InflightLoad>();
                pImpl->inflight.emplace(inflightKey, load);
                leader = true;
                break;
            }
            if (it->second->joinable()) {
                load = it->second;
                break;
            }
            // Устаревшая или отменённая загрузка ещё выполняется: новый загрузчик
            // стартует только после её завершения
            auto previous = it->second;
            auto seen = previous->cancellations;
            ++previous->restartWaiters;
            pImpl->inflightCv.wait(lock, [&] {
                return pImpl->stopped || previous->finished || previous->cancellations != seen;
            });
            --previous->restartWaiters;
            if (!pImpl->stopped && !previous->finished) {
                return cancelledResult("load of '" + key + "' in '" + cacheName + "' cancelled");
            }
        }
    }

    if (!leader) {
        pImpl->logger->debug("CacheManager: '{}' ожидает загрузку ключа {}", cacheName, key);
        return load->future.get();
    }

    pImpl->logger->debug("CacheManager: '{}' загрузка ключа {}", cacheName, key);
    std::optional<Result<ArtifactPtr>> outcome;
    size_t sizeBytes = 0;
    try {
        LoadedArtifact loaded = loader(key);
        sizeBytes = loaded.sizeEstimate > 0 ? loaded.sizeEstimate : loaded.data.size();
        auto value = std::make_shared<const ArtifactBlob>(std::move(loaded.data));
        outcome = Result<ArtifactPtr>::success(value);
    } catch (...) {
        // Ошибка загрузчика доставляется всем ожидающим
        auto info = ErrorInfo::fromException(std::current_exception());
        pImpl->logger->warn("CacheManager: '{}' ошибка загрузки ключа {}: {}", cacheName, key, info.message);
        outcome = Result<ArtifactPtr>::failure(std::move(info));
    }

    {
        std::lock_guard<std::mutex> lock(pImpl->inflightMutex);
        if (load->settled) {
            pImpl->logger->debug("CacheManager: результат отменённой загрузки {} отброшен", key);
        } else {
            if (outcome->ok() && !load->stale) {
                cache->put(key, outcome->value(), sizeBytes);
            }
            pImpl->settle(load, *outcome);
        }
        load->finished = true;
        auto it = pImpl->inflight.find(inflightKey);
        if (it != pImpl->inflight.end() && it->second == load) {
            pImpl->inflight.erase(it);
        }
    }
    pImpl->inflightCv.notify_all();
    return load->future.get();
}

std::optional<ArtifactPtr> CacheManager::get(const std::string& cacheName, const std::string& key) {
    auto cache = pImpl->require(cacheName);
    auto value = cache->get(key);
    pImpl->recordAccess(cacheName, value.has_value());
    return value;
}

bool CacheManager::put(const std::string& cacheName, const std::string& key,
                       ArtifactBlob data, size_t sizeEstimate) {
    auto cache = pImpl->require(cacheName);
    size_t sizeBytes = sizeEstimate > 0 ? sizeEstimate : data.size();
    auto value = std::make_shared<const ArtifactBlob>(std::move(data));
    return cache->put(key, std::move(value), sizeBytes).inserted;
}

size_t CacheManager::invalidateCascade(const std::string& cacheName, const std::vector<std::string>& keys) {
    auto cache = pImpl->require(cacheName);
    size_t removed = 0;
    std::lock_guard<std::mutex> lock(pImpl->inflightMutex);
    for (const auto& key : keys) {
        // Загрузка, начатая до инвалидации, не должна вернуть старые данные в кэш
        auto it = pImpl->inflight.find({cacheName, key});
        if (it != pImpl->inflight.end()) {
            it->second->stale = true;
        }
        if (cache->invalidate(key)) {
            ++removed;
        }
    }
    pImpl->logger->info("CacheManager: '{}' инвалидировано {} из {} ключей", cacheName, removed, keys.size());
    return removed;
}

void CacheManager::clearCache(const std::string& cacheName) {
    auto cache = pImpl->require(cacheName);
    std::lock_guard<std::mutex> lock(pImpl->inflightMutex);
    for (auto& [inflightKey, load] : pImpl->inflight) {
        if (inflightKey.first == cacheName) {
            load->stale = true;
        }
    }
    cache->clear();
    pImpl->logger->info("CacheManager: кэш '{}' очищен", cacheName);
}

bool CacheManager::cancelLoad(const std::string& cacheName, const std::string& key) {
    bool cancelled = false;
    {
        std::lock_guard<std::mutex> lock(pImpl->inflightMutex);
        auto it = pImpl->inflight.find({cacheName, key});
        if (it == pImpl->inflight.end()) {
            return false;
        }
        auto load = it->second;
        cancelled = !load->settled || load->restartWaiters > 0;
        if (!cancelled) {
            return false;
        }
        pImpl->settle(load, cancelledResult("load of '" + key + "' in '" + cacheName + "' cancelled"));
        ++load->cancellations;
    }
    pImpl->inflightCv.notify_all();
    pImpl->logger->debug("CacheManager: загрузка {} в '{}' отменена", key, cacheName);
    return cancelled;
}

size_t CacheManager::inflightCount() const {
    std::lock_guard<std::mutex> lock(pImpl->inflightMutex);
    return pImpl->inflight.size();
}

std::optional<CacheStats> CacheManager::stats(const std::string& cacheName) const {
    auto cache = pImpl->find(cacheName);
    if (!cache) {
        return std::nullopt;
    }
    return cache->stats();
}

std::vector<CacheStats> CacheManager::allStats() const {
    std::vector<std::shared_ptr<ArtifactCache>> snapshot;
    {
        std::shared_lock<std::shared_mutex> lock(pImpl->cachesMutex);
        for (const auto& [name, cache] : pImpl->caches) {
            snapshot.push_back(cache);
        }
    }
    std::vector<CacheStats> result;
    result.reserve(snapshot.size());
    for (const auto& cache : snapshot) {
        result.push_back(cache->stats());
    }
    return result;
}

nlohmann::json CacheManager::statsJson() const {
    nlohmann::json result = nlohmann::json::object();
    for (const auto& stats : allStats()) {
        result[stats.name] = stats.toJson();
    }
    return result;
}

std::vector<std::string> CacheManager::cacheNames() const {
    std::shared_lock<std::shared_mutex> lock(pImpl->cachesMutex);
    std::vector<std::string> names;
    for (const auto& [name, cache] : pImpl->caches) {
        names.push_back(name);
    }
    return names;
}

void CacheManager::shutdown() {
    if (pImpl->stopped.exchange(true)) {
        return;
    }
    size_t cancelled = 0;
    {
        std::lock_guard<std::mutex> lock(pImpl->inflightMutex);
        for (auto& [inflightKey, load] : pImpl->inflight) {
            if (!load->settled) {
                pImpl->settle(load, cancelledResult("cache manager is shutting down"));
                ++cancelled;
            }
        }
    }
    pImpl->inflightCv.notify_all();
    pImpl->logger->info("CacheManager: завершение работы, отменено загрузок: {}", cancelled);
}

bool CacheManager::isShutdown() const {
    return pImpl->stopped;
}

} // namespace cache
} // namespace core
} // namespace ttsserve
