#include <cassert>
#include <iostream>
#include <memory>
#include <atomic>
#include <chrono>
#include <thread>
#include <vector>
#include "ttsserve/core/cache/manager/CacheManager.hpp"
#include "ttsserve/core/cache/CacheConfig.hpp"
#include "ttsserve/core/common/Error.hpp"
#include "ttsserve/core/monitor/PerformanceMonitor.hpp"

#include <spdlog/spdlog.h>

using namespace ttsserve::core;
using namespace ttsserve::core::cache;

CacheManagerConfig testConfig() {
    CacheManagerConfig config;
    config.caches["voices"] = CacheLimits{8, 0};
    config.caches["models"] = CacheLimits{0, 1024};
    return config;
}

Loader bytesLoader(std::atomic<int>& calls, uint8_t fill, std::chrono::milliseconds delay = std::chrono::milliseconds(0)) {
    return [&calls, fill, delay](const std::string&) {
        calls++;
        std::this_thread::sleep_for(delay);
        return LoadedArtifact{ArtifactBlob(16, fill), 0};
    };
}

void waitForInflight(CacheManager& manager, size_t count) {
    while (manager.inflightCount() != count) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
}

void smokeTestCacheManager() {
    std::cout << "Testing CacheManager basic operations...\n";

    CacheManager manager(testConfig());
    assert(manager.initialize());
    assert(manager.cacheNames().size() == 2);
    assert(manager.stats("voices")->currentCount == 0);
    assert(!manager.stats("missing").has_value());

    assert(manager.put("voices", "af_heart", ArtifactBlob{1, 2, 3}));
    auto value = manager.get("voices", "af_heart");
    assert(value && (*value)->size() == 3);
    assert(!manager.get("voices", "am_puck").has_value());

    // Оценка размера заменяет фактический размер
    assert(manager.put("models", "m", ArtifactBlob{1}, 512));
    assert(manager.stats("models")->currentSize == 512);
    assert(!manager.put("models", "big", ArtifactBlob{1}, 4096));

    bool thrown = false;
    try {
        manager.get("missing", "k");
    } catch (const UnknownCacheError&) {
        thrown = true;
    }
    assert(thrown);

    auto json = manager.statsJson();
    assert(json.contains("voices"));
    assert(json["voices"]["count"] == 1);

    manager.shutdown();
    std::cout << "[OK] CacheManager smoke test\n";
}

void testCacheManagerSingleFlight() {
    std::cout << "Testing CacheManager single-flight loading...\n";

    auto monitor = std::make_shared<monitor::PerformanceMonitor>();
    CacheManager manager(testConfig(), monitor);
    assert(manager.initialize());

    std::atomic<int> calls{0};
    auto loader = bytesLoader(calls, 9, std::chrono::milliseconds(100));
    const int numThreads = 8;
    std::vector<ArtifactPtr> results(numThreads);
    std::vector<std::thread> threads;
    for (int i = 0; i < numThreads; ++i) {
        threads.emplace_back([&manager, &loader, &results, i]() {
            auto result = manager.getOrLoad("voices", "af_heart", loader);
            assert(result.ok());
            results[i] = result.value();
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    assert(calls == 1);
    for (const auto& result : results) {
        assert(result == results[0]); // Один и тот же объект
    }
    assert(manager.inflightCount() == 0);

    // Повторный запрос — попадание без загрузчика
    auto cached = manager.getOrLoad("voices", "af_heart", loader);
    assert(cached.ok() && cached.value() == results[0]);
    assert(calls == 1);

    auto summary = monitor->summary();
    assert(summary.perCache["voices"].hits >= 1);
    assert(summary.perCache["voices"].misses >= 1);

    std::cout << "[OK] CacheManager single-flight test\n";
}

void testCacheManagerFailuresNotCached() {
    std::cout << "Testing CacheManager failure propagation...\n";

    CacheManager manager(testConfig());
    assert(manager.initialize());

    std::atomic<int> calls{0};
    Loader failing = [&calls](const std::string& key) -> LoadedArtifact {
        calls++;
        throw LoadError("voice " + key + " unreadable", false);
    };

    auto first = manager.getOrLoad("voices", "broken", failing);
    assert(!first.ok());
    assert(first.error().kind == ErrorKind::Load);

    // Исходное исключение доступно вызывающему
    bool rethrown = false;
    try {
        first.valueOrThrow();
    } catch (const LoadError& e) {
        rethrown = !e.retryable();
    }
    assert(rethrown);

    auto second = manager.getOrLoad("voices", "broken", failing);
    assert(!second.ok());
    assert(calls == 2); // Ошибка не закэширована
    assert(!manager.get("voices", "broken").has_value());

    auto unknown = manager.getOrLoad("missing", "k", failing);
    assert(!unknown.ok());
    assert(unknown.error().kind == ErrorKind::UnknownCache);
    assert(calls == 2);

    std::cout << "[OK] CacheManager failure test\n";
}

void testCacheManagerCancelLoad() {
    std::cout << "Testing CacheManager load cancellation...\n";

    CacheManager manager(testConfig());
    assert(manager.initialize());

    std::atomic<bool> release{false};
    Loader blocking = [&release](const std::string&) {
        while (!release) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        return LoadedArtifact{ArtifactBlob(4, 1), 0};
    };

    ErrorKind leaderKind = ErrorKind::Internal;
    ErrorKind followerKind = ErrorKind::Internal;
    std::thread leader([&]() {
        auto result = manager.getOrLoad("voices", "slow", blocking);
        assert(!result.ok());
        leaderKind = result.error().kind;
    });
    waitForInflight(manager, 1);
    std::thread follower([&]() {
        auto result = manager.getOrLoad("voices", "slow", blocking);
        assert(!result.ok());
        followerKind = result.error().kind;
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));

    assert(manager.cancelLoad("voices", "slow"));
    assert(!manager.cancelLoad("voices", "slow"));
    follower.join();
    assert(followerKind == ErrorKind::Cancelled);

    release = true;
    leader.join();
    assert(leaderKind == ErrorKind::Cancelled);
    assert(!manager.get("voices", "slow").has_value()); // Результат отменённой загрузки отброшен

    std::cout << "[OK] CacheManager cancel test\n";
}

// Загрузчик, считающий одновременные вызовы; первый вызов ждёт release
struct TrackedLoader {
    std::atomic<int> calls{0};
    std::atomic<int> active{0};
    std::atomic<int> maxActive{0};
    std::atomic<bool> release{false};

    Loader loader() {
        return [this](const std::string&) {
            int now = ++active;
            int seen = maxActive.load();
            while (seen < now && !maxActive.compare_exchange_weak(seen, now)) {
            }
            int call = ++calls;
            while (call == 1 && !release) {
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
            }
            --active;
            return LoadedArtifact{ArtifactBlob(4, static_cast<uint8_t>(call)), 0};
        };
    }
};

void testCacheManagerInvalidateDuringLoad() {
    std::cout << "Testing CacheManager invalidation during load...\n";

    CacheManager manager(testConfig());
    assert(manager.initialize());
    manager.put("voices", "af_heart", ArtifactBlob{1});
    manager.put("voices", "am_puck", ArtifactBlob{2});

    TrackedLoader tracked;
    auto loader = tracked.loader();

    Result<ArtifactPtr> first = Result<ArtifactPtr>::success(nullptr);
    std::thread leader([&]() { first = manager.getOrLoad("voices", "af_bella", loader); });
    waitForInflight(manager, 1);

    auto removed = manager.invalidateCascade("voices", {"af_heart", "am_puck", "af_bella", "absent"});
    assert(removed == 2);
    assert(manager.inflightCount() == 1); // Старый загрузчик ещё выполняется

    // Повторный запрос ждёт окончания старой загрузки, а не запускает вторую
    Result<ArtifactPtr> second = Result<ArtifactPtr>::success(nullptr);
    std::thread requester([&]() { second = manager.getOrLoad("voices", "af_bella", loader); });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    assert(tracked.calls == 1);

    tracked.release = true;
    leader.join();
    requester.join();
    assert(tracked.maxActive == 1);
    assert(tracked.calls == 2);
    assert(first.ok() && (*first.value())[0] == 1);   // Вызывающий получил данные старой загрузки
    assert(second.ok() && (*second.value())[0] == 2); // Новая загрузка после инвалидации
    auto cached = manager.get("voices", "af_bella");
    assert(cached && (**cached)[0] == 2); // В кэше только свежие данные
    assert(manager.inflightCount() == 0);

    manager.put("models", "m", ArtifactBlob{1});
    manager.clearCache("models");
    assert(manager.stats("models")->currentCount == 0);

    std::cout << "[OK] CacheManager invalidation test\n";
}

void testCacheManagerRequestAfterCancel() {
    std::cout << "Testing CacheManager request after cancellation...\n";

    CacheManager manager(testConfig());
    assert(manager.initialize());

    TrackedLoader tracked;
    auto loader = tracked.loader();

    Result<ArtifactPtr> first = Result<ArtifactPtr>::success(nullptr);
    std::thread leader([&]() { first = manager.getOrLoad("voices", "k", loader); });
    waitForInflight(manager, 1);
    assert(manager.cancelLoad("voices", "k"));
    assert(manager.inflightCount() == 1);

    Result<ArtifactPtr> second = Result<ArtifactPtr>::success(nullptr);
    std::thread requester([&]() { second = manager.getOrLoad("voices", "k", loader); });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    assert(tracked.calls == 1);

    tracked.release = true;
    leader.join();
    requester.join();
    assert(!first.ok() && first.error().kind == ErrorKind::Cancelled);
    assert(second.ok() && (*second.value())[0] == 2);
    assert(tracked.maxActive == 1);
    assert(tracked.calls == 2);
    assert(manager.get("voices", "k").has_value());

    // Отмена освобождает и тех, кто ждёт окончания отменённой загрузки
    TrackedLoader hung;
    auto hungLoader = hung.loader();
    std::thread hungLeader([&]() { manager.getOrLoad("voices", "h", hungLoader); });
    waitForInflight(manager, 1);
    assert(manager.cancelLoad("voices", "h"));
    ErrorKind waiterKind = ErrorKind::Internal;
    std::thread waiter([&]() { waiterKind = manager.getOrLoad("voices", "h", hungLoader).error().kind; });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    assert(manager.cancelLoad("voices", "h"));
    waiter.join();
    assert(waiterKind == ErrorKind::Cancelled);
    assert(hung.calls == 1);
    hung.release = true;
    hungLeader.join();
    assert(manager.inflightCount() == 0);

    std::cout << "[OK] CacheManager request after cancel test\n";
}

void testCacheManagerShutdown() {
    std::cout << "Testing CacheManager shutdown...\n";

    CacheManager manager(testConfig());
    assert(manager.initialize());

    std::atomic<bool> release{false};
    Loader blocking = [&release](const std::string&) {
        while (!release) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        return LoadedArtifact{ArtifactBlob(1), 0};
    };
    ErrorKind followerKind = ErrorKind::Internal;
    std::thread leader([&]() { manager.getOrLoad("voices", "k", blocking); });
    waitForInflight(manager, 1);
    std::thread follower([&]() {
        followerKind = manager.getOrLoad("voices", "k", blocking).error().kind;
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));

    manager.shutdown();
    follower.join();
    assert(followerKind == ErrorKind::Cancelled);
    assert(manager.isShutdown());
    release = true;
    leader.join();

    std::atomic<int> calls{0};
    auto after = manager.getOrLoad("voices", "other", bytesLoader(calls, 1));
    assert(!after.ok());
    assert(after.error().kind == ErrorKind::Cancelled);
    assert(calls == 0);

    std::cout << "[OK] CacheManager shutdown test\n";
}

int main() {
    try {
        smokeTestCacheManager();
        testCacheManagerSingleFlight();
        testCacheManagerFailuresNotCached();
        testCacheManagerCancelLoad();
        testCacheManagerInvalidateDuringLoad();
        testCacheManagerRequestAfterCancel();
        testCacheManagerShutdown();
        std::cout << "All CacheManager tests passed!\n";
    } catch (const std::exception& e) {
        std::cerr << "CacheManager test failed with exception: " << e.what() << std::endl;
        return 1;
    }
    spdlog::shutdown();
    return 0;
}
