#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include "ttsserve/core/cache/base/LruCache.hpp"

#include <spdlog/spdlog.h>

using namespace ttsserve::core;
using namespace ttsserve::core::cache;

ArtifactPtr blob(size_t size, uint8_t fill = 0) {
    return std::make_shared<const ArtifactBlob>(size, fill);
}

void testLruCacheOrder() {
    std::cout << "Testing LruCache eviction order...\n";

    ArtifactCache cache("voices", CacheLimits{2, 0});
    assert(cache.put("a", blob(1), 1).inserted);
    assert(cache.put("b", blob(1), 1).inserted);

    // Обращение к "a" делает "b" самым старым
    assert(cache.get("a").has_value());
    auto result = cache.put("c", blob(1), 1);
    assert(result.inserted);
    assert(result.evicted.size() == 1);
    assert(result.evicted[0] == "b");

    assert(cache.contains("a"));
    assert(!cache.contains("b"));
    assert(cache.contains("c"));
    assert((cache.keys() == std::vector<std::string>{"c", "a"}));

    auto stats = cache.stats();
    assert(stats.currentCount == 2);
    assert(stats.evictions == 1);

    std::cout << "[OK] LruCache eviction order test\n";
}

void testLruCacheByteBudget() {
    std::cout << "Testing LruCache byte budget...\n";

    ArtifactCache cache("models", CacheLimits{0, 100});
    assert(cache.put("m1", blob(60), 60).inserted);
    auto result = cache.put("m2", blob(60), 60);
    assert(result.inserted);
    assert(result.evicted == std::vector<std::string>{"m1"});
    assert(cache.stats().currentSize == 60);

    // Запись больше всего бюджета не вставляется и ничего не вытесняет
    auto oversize = cache.put("huge", blob(101), 101);
    assert(!oversize.inserted);
    assert(oversize.evicted.empty());
    assert(cache.contains("m2"));
    assert(cache.stats().currentSize == 60);

    // Замена ключа пересчитывает размер
    assert(cache.put("m2", blob(10), 10).inserted);
    assert(cache.stats().currentSize == 10);
    assert(cache.stats().currentCount == 1);

    std::cout << "[OK] LruCache byte budget test\n";
}

void testLruCacheBothBounds() {
    std::cout << "Testing LruCache with both bounds...\n";

    ArtifactCache cache("audio", CacheLimits{3, 50});
    cache.put("a", blob(10), 10);
    cache.put("b", blob(10), 10);
    cache.put("c", blob(10), 10);
    auto result = cache.put("d", blob(10), 10); // Граница записей
    assert(result.evicted == std::vector<std::string>{"a"});

    result = cache.put("e", blob(40), 40); // Граница байт: 30 + 40 > 50
    assert(result.evicted.size() == 2);
    assert(result.evicted[0] == "b");
    assert(result.evicted[1] == "c");
    assert(cache.stats().currentSize == 50);

    std::cout << "[OK] LruCache both bounds test\n";
}

void testLruCacheHitsAndInvalidate() {
    std::cout << "Testing LruCache hits, peek and invalidate...\n";

    ArtifactCache cache("text", CacheLimits{10, 0});
    cache.put("k", blob(4, 7), 4);

    auto value = cache.get("k");
    assert(value && (**value)[0] == 7);
    assert(!cache.get("missing").has_value());

    // peek не меняет счётчики
    assert(cache.peek("k").has_value());
    auto stats = cache.stats();
    assert(stats.hits == 1);
    assert(stats.misses == 1);
    assert(stats.hitRate() == 0.5);

    assert(cache.invalidate("k"));
    assert(!cache.invalidate("k"));
    assert(cache.stats().currentSize == 0);

    cache.put("x", blob(1), 1);
    cache.clear();
    assert(cache.stats().currentCount == 0);
    assert(cache.keys().empty());

    std::cout << "[OK] LruCache hits/invalidate test\n";
}

void testLruCacheConcurrentAccess() {
    std::cout << "Testing LruCache concurrent access...\n";

    ArtifactCache cache("concurrent", CacheLimits{50, 0});
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&cache, t]() {
            for (int i = 0; i < 200; ++i) {
                auto key = "k" + std::to_string((t * 200 + i) % 80);
                cache.put(key, blob(1), 1);
                cache.get(key);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    auto stats = cache.stats();
    assert(stats.currentCount <= 50);
    assert(stats.currentSize == stats.currentCount);

    std::cout << "[OK] LruCache concurrent access test\n";
}

int main() {
    try {
        testLruCacheOrder();
        testLruCacheByteBudget();
        testLruCacheBothBounds();
        testLruCacheHitsAndInvalidate();
        testLruCacheConcurrentAccess();
        std::cout << "All LruCache tests passed!\n";
    } catch (const std::exception& e) {
        std::cerr << "LruCache test failed with exception: " << e.what() << std::endl;
        return 1;
    }
    spdlog::shutdown();
    return 0;
}
