#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "ttsserve/core/cache/CacheConfig.hpp"
#include "ttsserve/core/cache/base/LruCache.hpp"
#include "ttsserve/core/cache/metrics/CacheMetrics.hpp"
#include "ttsserve/core/common/Result.hpp"
#include "ttsserve/core/common/Types.hpp"
#include "ttsserve/core/monitor/PerformanceMonitor.hpp"

namespace ttsserve {
namespace core {
namespace cache {

// CacheManager — владелец именованных кэшей и single-flight загрузка (cache-aside)
// На один (кэш, ключ) одновременно выполняется не более одного загрузчика;
// остальные вызывающие ждут его результат. Ошибки доставляются всем ожидающим
// и в кэш не попадают.
class CacheManager {
public:
    explicit CacheManager(const CacheManagerConfig& config,
                          std::shared_ptr<monitor::PerformanceMonitor> monitor = nullptr); // Конструктор
    ~CacheManager(); // Деструктор
    CacheManager(const CacheManager&) = delete;
    CacheManager& operator=(const CacheManager&) = delete;
    bool initialize(); // Создать кэши из конфигурации
    bool addCache(const std::string& name, const CacheLimits& limits); // Добавить кэш
    Result<ArtifactPtr> getOrLoad(const std::string& cacheName, const std::string& key,
                                  const Loader& loader); // Получить или загрузить
    std::optional<ArtifactPtr> get(const std::string& cacheName, const std::string& key); // Только кэш
    bool put(const std::string& cacheName, const std::string& key,
             ArtifactBlob data, size_t sizeEstimate = 0); // Сохранить
    size_t invalidateCascade(const std::string& cacheName, const std::vector<std::string>& keys); // Инвалидировать
    void clearCache(const std::string& cacheName); // Очистить кэш
    bool cancelLoad(const std::string& cacheName, const std::string& key); // Отменить загрузку
    size_t inflightCount() const; // Загрузки в процессе
    std::optional<CacheStats> stats(const std::string& cacheName) const; // Статистика кэша
    std::vector<CacheStats> allStats() const; // Статистика всех кэшей
    nlohmann::json statsJson() const; // Экспорт статистики
    std::vector<std::string> cacheNames() const; // Имена кэшей
    void shutdown(); // Завершение работы: отменить все загрузки
    bool isShutdown() const;
private:
    struct Impl;
    std::unique_ptr<Impl> pImpl; // Реализация
};

} // namespace cache
} // namespace core
} // namespace ttsserve
