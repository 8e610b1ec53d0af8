#include "ttsserve/core/cache/preload/WarmupScheduler.hpp"
#include "ttsserve/core/logging/Logging.hpp"
#include "ttsserve/core/thread/ThreadPool.hpp"
#include <condition_variable>
#include <iterator>
#include <map>
#include <mutex>
#include <set>
#include <utility>

namespace ttsserve {
namespace core {
namespace cache {

namespace {

struct QueuedTask {
    int priority;
    uint64_t sequence;
    WarmupTask task;
};

// Сначала больший приоритет, среди равных — раньше поставленная
struct QueueOrder {
    bool operator()(const QueuedTask& a, const QueuedTask& b) const {
        if (a.priority != b.priority) return a.priority > b.priority;
        return a.sequence < b.sequence;
    }
};

} // namespace

struct WarmupScheduler::Impl {
    WarmupConfig config;
    std::shared_ptr<CacheManager> cacheManager;
    std::shared_ptr<resilience::CircuitBreakerRegistry> breakers;
    std::unique_ptr<resilience::RetryPolicy> retry;
    std::unique_ptr<thread::ThreadPool> pool;
    std::set<QueuedTask, QueueOrder> queue;
    std::map<uint64_t, std::pair<std::string, std::string>> active; // sequence -> (кэш, ключ)
    mutable std::mutex mutex;
    std::condition_variable taskCv;  // Новая задача / остановка
    std::condition_variable idleCv;  // Очередь пуста и воркеры свободны
    std::condition_variable cancelCv; // Прерывание пауз retry
    uint64_t nextSequence = 0;
    bool running = false;
    bool stopping = false;
    bool cancelling = false;
    WarmupMetrics metrics;
    std::shared_ptr<spdlog::logger> logger;

    Impl(const WarmupConfig& cfg, std::shared_ptr<CacheManager> manager,
         std::shared_ptr<resilience::CircuitBreakerRegistry> registry)
        : config(cfg), cacheManager(std::move(manager)), breakers(std::move(registry)),
          logger(logging::getLogger("warmup")) {}

    // Пауза между попытками, прерываемая отменой
    void interruptibleSleep(std::chrono::milliseconds delay) {
        std::unique_lock<std::mutex> lock(mutex);
        cancelCv.wait_for(lock, delay, [this] { return cancelling; });
        if (cancelling) {
            throw CancelledError("warm-up cancelled");
        }
    }

    void workerLoop() {
        while (true) {
            QueuedTask item{0, 0, {}};
            {
                std::unique_lock<std::mutex> lock(mutex);
                taskCv.wait(lock, [this] { return stopping || !queue.empty(); });
                if (queue.empty()) {
                    return;
                }
                auto node = queue.extract(queue.begin());
                item = std::move(node.value());
                active.emplace(item.sequence, std::make_pair(item.task.cacheName, item.task.key));
            }
            execute(item);
            {
                std::lock_guard<std::mutex> lock(mutex);
                active.erase(item.sequence);
                if (queue.empty() && active.empty()) {
                    idleCv.notify_all();
                }
            }
        }
    }

    void execute(const QueuedTask& item) {
        const auto& task = item.task;
        const auto& kind = task.breakerKind.empty() ? config.breakerKind : task.breakerKind;
        auto breaker = breakers->getOrCreate(kind);
        try {
            retry->execute([&]() -> ArtifactPtr {
                return breaker->call([&]() -> ArtifactPtr {
                    return cacheManager->getOrLoad(task.cacheName, task.key, task.loader).valueOrThrow();
                });
            });
            std::lock_guard<std::mutex> lock(mutex);
            ++metrics.completed;
            logger->debug("WarmupScheduler: прогрет {}/{} (priority={})", task.cacheName, task.key, item.priority);
        } catch (const CancelledError& e) {
            std::lock_guard<std::mutex> lock(mutex);
            ++metrics.cancelled;
            logger->debug("WarmupScheduler: {}/{} отменён: {}", task.cacheName, task.key, e.what());
        } catch (const std::exception& e) {
            std::lock_guard<std::mutex> lock(mutex);
            ++metrics.failed;
            logger->warn("WarmupScheduler: ошибка прогрева {}/{}: {}", task.cacheName, task.key, e.what());
        }
    }
};

WarmupScheduler::WarmupScheduler(const WarmupConfig& config,
                                 std::shared_ptr<CacheManager> cacheManager,
                                 std::shared_ptr<resilience::CircuitBreakerRegistry> breakers,
                                 const resilience::RetrySpec& retrySpec)
    : pImpl(std::make_unique<Impl>(config, std::move(cacheManager), std::move(breakers))) {
    if (!config.validate() || !pImpl->cacheManager || !pImpl->breakers) {
        throw ConfigError("invalid warm-up configuration");
    }
    // Быстрый отказ breaker'а и отмена не повторяются
    auto spec = retrySpec;
    spec.retryableKinds.erase(ErrorKind::CircuitOpen);
    spec.retryableKinds.erase(ErrorKind::Cancelled);
    Impl* impl = pImpl.get();
    pImpl->retry = std::make_unique<resilience::RetryPolicy>(
        spec, [impl](std::chrono::milliseconds delay) { impl->interruptibleSleep(delay); }, "warmup");
}

WarmupScheduler::~WarmupScheduler() {
    stop(StopMode::Cancel);
}

bool WarmupScheduler::start() {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    if (pImpl->running || pImpl->stopping) {
        return pImpl->running;
    }
    thread::ThreadPoolConfig poolConfig;
    poolConfig.minThreads = pImpl->config.workers;
    poolConfig.maxThreads = pImpl->config.workers;
    poolConfig.queueSize = pImpl->config.workers;
    poolConfig.name = "warmup";
    pImpl->pool = std::make_unique<thread::ThreadPool>(poolConfig);
    Impl* impl = pImpl.get();
    for (size_t i = 0; i < pImpl->config.workers; ++i) {
        if (!pImpl->pool->enqueue([impl] { impl->workerLoop(); })) {
            pImpl->logger->error("WarmupScheduler: не удалось запустить воркер {}", i);
            return false;
        }
    }
    pImpl->running = true;
    pImpl->logger->info("WarmupScheduler: запущен, воркеров {}, задач в очереди {}",
                        pImpl->config.workers, pImpl->queue.size());
    return true;
}

bool WarmupScheduler::schedule(WarmupTask task) {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    if (pImpl->stopping) {
        pImpl->logger->debug("WarmupScheduler: остановлен, задача {}/{} отклонена", task.cacheName, task.key);
        return false;
    }
    uint64_t sequence = pImpl->nextSequence++;
    int priority = task.priority;
    pImpl->queue.insert(QueuedTask{priority, sequence, std::move(task)});

    bool accepted = true;
    while (pImpl->queue.size() > pImpl->config.maxQueueSize) {
        auto lowest = std::prev(pImpl->queue.end());
        pImpl->logger->warn("WarmupScheduler: очередь переполнена, отброшена задача {}/{} (priority={})",
                            lowest->task.cacheName, lowest->task.key, lowest->priority);
        if (lowest->sequence == sequence) {
            accepted = false;
        }
        pImpl->queue.erase(lowest);
        ++pImpl->metrics.dropped;
    }
    if (accepted) {
        ++pImpl->metrics.scheduled;
        pImpl->taskCv.notify_one();
    }
    return accepted;
}

bool WarmupScheduler::waitIdle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(pImpl->mutex);
    return pImpl->idleCv.wait_for(lock, timeout, [this] {
        return pImpl->queue.empty() && pImpl->active.empty();
    });
}

void WarmupScheduler::stop(StopMode mode) {
    std::unique_ptr<thread::ThreadPool> pool;
    {
        std::unique_lock<std::mutex> lock(pImpl->mutex);
        if (pImpl->stopping && !pImpl->pool) {
            return;
        }
        pImpl->stopping = true;
        if (mode == StopMode::Cancel || !pImpl->running) {
            pImpl->cancelling = true;
            pImpl->metrics.cancelled += pImpl->queue.size();
            pImpl->queue.clear();
            for (const auto& [sequence, target] : pImpl->active) {
                pImpl->cacheManager->cancelLoad(target.first, target.second);
            }
        }
        pool = std::move(pImpl->pool);
        pImpl->running = false;
    }
    pImpl->taskCv.notify_all();
    pImpl->cancelCv.notify_all();
    if (pool) {
        pool->stop();
    }
    pImpl->idleCv.notify_all();
    pImpl->logger->info("WarmupScheduler: остановлен ({})", mode == StopMode::Drain ? "drain" : "cancel");
}

bool WarmupScheduler::isRunning() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->running;
}

WarmupMetrics WarmupScheduler::getMetrics() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    auto metrics = pImpl->metrics;
    metrics.queueSize = pImpl->queue.size();
    metrics.activeTasks = pImpl->active.size();
    return metrics;
}

WarmupConfig WarmupScheduler::getConfiguration() const {
    return pImpl->config;
}

} // namespace cache
} // namespace core
} // namespace ttsserve
