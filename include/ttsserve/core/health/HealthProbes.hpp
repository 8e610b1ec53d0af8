#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include "ttsserve/core/cache/manager/CacheManager.hpp"
#include "ttsserve/core/health/HealthRegistry.hpp"
#include "ttsserve/core/resilience/CircuitBreaker.hpp"

namespace ttsserve {
namespace core {
namespace health {
namespace probes {

// Файл существует и не пуст
HealthProbe fileExists(const std::filesystem::path& path);

// В каталоге есть хотя бы один файл с расширением (пусто — любой файл)
HealthProbe directoryHasFiles(const std::filesystem::path& directory, const std::string& extension = "");

// Свободно не меньше minFreeBytes на разделе path
HealthProbe diskSpace(const std::filesystem::path& path, uintmax_t minFreeBytes);

// Доля занятой памяти системы не выше maxUsedFraction (sysinfo)
HealthProbe memoryUsage(double maxUsedFraction);

// Кэш зарегистрирован и менеджер не остановлен
HealthProbe cacheAvailable(std::shared_ptr<cache::CacheManager> cacheManager, const std::string& cacheName);

// Breaker не разомкнут
HealthProbe breakerClosed(std::shared_ptr<resilience::CircuitBreaker> breaker);

} // namespace probes
} // namespace health
} // namespace core
} // namespace ttsserve
