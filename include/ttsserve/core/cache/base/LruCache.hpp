#pragma once

#include <string>
#include <vector>
#include <unordered_map>
#include <memory>
#include <mutex>
#include <chrono>
#include <list>
#include <optional>
#include <cstdint>
#include <spdlog/spdlog.h>
#include "ttsserve/core/cache/CacheConfig.hpp"
#include "ttsserve/core/cache/metrics/CacheMetrics.hpp"
#include "ttsserve/core/common/Types.hpp"
#include "ttsserve/core/logging/Logging.hpp"

namespace ttsserve {
namespace core {
namespace cache {

// LruCache — потокобезопасный ограниченный LRU-кэш одного класса артефактов
// Границы: число записей и/или байтовый бюджет; вытеснение с хвоста LRU-списка,
// пока нарушена любая из границ. Все операции атомарны под одним mutex.
template<typename Key, typename Value>
class LruCache {
public:
    using KeyType = Key;
    using DataType = Value;
    using Clock = std::chrono::steady_clock;
    struct Entry {
        DataType data;
        size_t sizeBytes;
        Clock::time_point lastAccess;
        uint64_t sequence; // Порядковый номер вставки
    };
    // PutResult — итог вставки: вставлено ли значение и какие ключи вытеснены
    struct PutResult {
        bool inserted = false;
        std::vector<Key> evicted;
    };
    LruCache(std::string name, const CacheLimits& limits); // Конструктор
    std::optional<Value> get(const Key& key); // Получить (обновляет LRU)
    std::optional<Value> peek(const Key& key) const; // Получить без побочных эффектов
    bool contains(const Key& key) const; // Есть ли ключ
    PutResult put(const Key& key, Value value, size_t sizeBytes); // Сохранить
    bool invalidate(const Key& key); // Удалить
    void clear(); // Очистить
    CacheStats stats() const; // Статистика
    std::vector<Key> keys() const; // Ключи от MRU к LRU
    const std::string& name() const { return name_; }
    CacheLimits limits() const { return limits_; }
private:
    using LruList = std::list<Key>;
    bool overLimits() const; // Нарушена ли граница (под mutex)
    void evictOne(std::vector<Key>& evicted); // Вытеснить хвост (под mutex)
    void eraseEntry(typename std::unordered_map<Key, std::pair<typename LruList::iterator, Entry>>::iterator it);
    std::string name_;
    CacheLimits limits_;
    std::unordered_map<Key, std::pair<typename LruList::iterator, Entry>> cache_;
    LruList lruList_; // Голова — самый свежий
    mutable std::mutex mutex_;
    size_t totalBytes_ = 0;
    uint64_t nextSequence_ = 0;
    size_t hits_ = 0;
    size_t misses_ = 0;
    size_t evictions_ = 0;
    std::shared_ptr<spdlog::logger> logger_;
};

// Кэш артефактов по строковому ключу
using ArtifactCache = LruCache<std::string, ArtifactPtr>;

template<typename Key, typename Value>
LruCache<Key, Value>::LruCache(std::string name, const CacheLimits& limits)
    : name_(std::move(name)), limits_(limits), logger_(logging::getLogger("cache")) {
    if (limits_.maxEntries > 0) {
        cache_.reserve(limits_.maxEntries);
    }
    logger_->debug("LruCache '{}': создан, maxEntries={}, maxBytes={}", name_, limits_.maxEntries, limits_.maxBytes);
}

template<typename Key, typename Value>
std::optional<Value> LruCache<Key, Value>::get(const Key& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = cache_.find(key);
    if (it == cache_.end()) {
        ++misses_;
        return std::nullopt;
    }
    // Обновляем LRU
    lruList_.splice(lruList_.begin(), lruList_, it->second.first);
    it->second.second.lastAccess = Clock::now();
    ++hits_;
    return it->second.second.data;
}

template<typename Key, typename Value>
std::optional<Value> LruCache<Key, Value>::peek(const Key& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = cache_.find(key);
    if (it == cache_.end()) {
        return std::nullopt;
    }
    return it->second.second.data;
}

template<typename Key, typename Value>
bool LruCache<Key, Value>::contains(const Key& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cache_.find(key) != cache_.end();
}

template<typename Key, typename Value>
typename LruCache<Key, Value>::PutResult LruCache<Key, Value>::put(const Key& key, Value value, size_t sizeBytes) {
    std::lock_guard<std::mutex> lock(mutex_);
    PutResult result;

    // Запись, которая одна превышает бюджет, не вставляется
    if (limits_.maxBytes > 0 && sizeBytes > limits_.maxBytes) {
        logger_->warn("LruCache '{}': запись {} байт больше бюджета {} байт, пропущена",
                      name_, sizeBytes, limits_.maxBytes);
        return result;
    }

    auto it = cache_.find(key);
    if (it != cache_.end()) {
        eraseEntry(it);
    }

    lruList_.push_front(key);
    cache_.emplace(key, std::make_pair(lruList_.begin(),
                                       Entry{std::move(value), sizeBytes, Clock::now(), nextSequence_++}));
    totalBytes_ += sizeBytes;
    result.inserted = true;

    while (overLimits() && lruList_.size() > 1) {
        evictOne(result.evicted);
    }

    if (!result.evicted.empty()) {
        logger_->debug("LruCache '{}': вытеснено {} записей, size={}, count={}",
                       name_, result.evicted.size(), totalBytes_, cache_.size());
    }
    return result;
}

template<typename Key, typename Value>
bool LruCache<Key, Value>::invalidate(const Key& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = cache_.find(key);
    if (it == cache_.end()) {
        return false;
    }
    eraseEntry(it);
    return true;
}

template<typename Key, typename Value>
void LruCache<Key, Value>::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    cache_.clear();
    lruList_.clear();
    totalBytes_ = 0;
}

template<typename Key, typename Value>
CacheStats LruCache<Key, Value>::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    CacheStats stats;
    stats.name = name_;
    stats.hits = hits_;
    stats.misses = misses_;
    stats.evictions = evictions_;
    stats.currentSize = totalBytes_;
    stats.currentCount = cache_.size();
    stats.maxEntries = limits_.maxEntries;
    stats.maxBytes = limits_.maxBytes;
    return stats;
}

template<typename Key, typename Value>
std::vector<Key> LruCache<Key, Value>::keys() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<Key>(lruList_.begin(), lruList_.end());
}

template<typename Key, typename Value>
bool LruCache<Key, Value>::overLimits() const {
    if (limits_.maxEntries > 0 && cache_.size() > limits_.maxEntries) return true;
    if (limits_.maxBytes > 0 && totalBytes_ > limits_.maxBytes) return true;
    return false;
}

template<typename Key, typename Value>
void LruCache<Key, Value>::evictOne(std::vector<Key>& evicted) {
    if (lruList_.empty()) return;
    auto it = cache_.find(lruList_.back());
    if (it == cache_.end()) {
        lruList_.pop_back();
        return;
    }
    evicted.push_back(it->first);
    eraseEntry(it);
    ++evictions_;
}

template<typename Key, typename Value>
void LruCache<Key, Value>::eraseEntry(
    typename std::unordered_map<Key, std::pair<typename LruList::iterator, Entry>>::iterator it) {
    totalBytes_ -= it->second.second.sizeBytes;
    lruList_.erase(it->second.first);
    cache_.erase(it);
}

} // namespace cache
} // namespace core
} // namespace ttsserve
