#pragma once
#include <cstddef>
#include <map>
#include <string>

namespace ttsserve {
namespace core {
namespace cache {

// CacheLimits — границы одного кэша; 0 = граница не задана
// Вытеснение идёт, пока нарушена ЛЮБАЯ из заданных границ
struct CacheLimits {
    size_t maxEntries = 0; // Макс. записи
    size_t maxBytes = 0;   // Макс. размер (байт)
    bool validate() const {
        return maxEntries > 0 || maxBytes > 0;
    }
};

// Имена кэшей по классам артефактов
namespace names {
constexpr const char* VOICE_EMBEDDINGS = "voice_embeddings";
constexpr const char* AUDIO_CHUNKS = "audio_chunks";
constexpr const char* TEXT_PROCESSING = "text_processing";
constexpr const char* MODELS = "models";
} // namespace names

// CacheManagerConfig — набор именованных кэшей
struct CacheManagerConfig {
    std::map<std::string, CacheLimits> caches;

    // Конфигурация по умолчанию: четыре класса артефактов
    static CacheManagerConfig defaults() {
        CacheManagerConfig config;
        config.caches[names::VOICE_EMBEDDINGS] = CacheLimits{64, 64 * 1024 * 1024};     // 64 голоса / 64MB
        config.caches[names::AUDIO_CHUNKS] = CacheLimits{1000, 100 * 1024 * 1024};     // 100MB
        config.caches[names::TEXT_PROCESSING] = CacheLimits{5000, 16 * 1024 * 1024};   // 16MB
        config.caches[names::MODELS] = CacheLimits{2, 1024ull * 1024 * 1024};          // 1GB
        return config;
    }

    bool validate() const {
        if (caches.empty()) return false;
        for (const auto& [name, limits] : caches) {
            if (name.empty() || !limits.validate()) return false;
        }
        return true;
    }
};

} // namespace cache
} // namespace core
} // namespace ttsserve
