#pragma once
#include <cstddef>
#include <string>
#include <nlohmann/json.hpp>

namespace ttsserve {
namespace core {
namespace cache {

// CacheStats — снимок статистики одного кэша
struct CacheStats {
    std::string name;        // Имя кэша
    size_t hits = 0;         // Попадания
    size_t misses = 0;       // Промахи
    size_t evictions = 0;    // Вытеснения
    size_t currentSize = 0;  // Текущий размер (байт)
    size_t currentCount = 0; // Кол-во записей
    size_t maxEntries = 0;   // Граница записей (0 = нет)
    size_t maxBytes = 0;     // Граница байт (0 = нет)

    double hitRate() const {
        auto total = hits + misses;
        return total > 0 ? static_cast<double>(hits) / total : 0.0;
    }

    nlohmann::json toJson() const {
        return {
            {"name", name},
            {"hits", hits},
            {"misses", misses},
            {"evictions", evictions},
            {"size", currentSize},
            {"count", currentCount},
            {"maxEntries", maxEntries},
            {"maxBytes", maxBytes},
            {"hitRate", hitRate()}
        };
    }
};

} // namespace cache
} // namespace core
} // namespace ttsserve
