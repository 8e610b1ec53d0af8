#include "ttsserve/core/thread/ThreadPool.hpp"
#include "ttsserve/core/logging/Logging.hpp"
#include <stdexcept>

namespace ttsserve {
namespace core {
namespace thread {

struct ThreadPool::Impl {
    ThreadPoolConfig config;
    std::vector<std::thread> workers;
    std::queue<std::function<void()>> tasks;
    mutable std::mutex mutex;
    std::condition_variable taskCv;   // Появилась задача / остановка
    std::condition_variable idleCv;   // Очередь опустела и никто не работает
    size_t activeThreads = 0;
    size_t idleThreads = 0;
    size_t completedTasks = 0;
    size_t rejectedTasks = 0;
    bool stopping = false;
    std::shared_ptr<spdlog::logger> logger;

    explicit Impl(const ThreadPoolConfig& cfg) : config(cfg), logger(logging::getLogger("threadpool")) {}

    // Вызывается под mutex
    void spawnWorker() {
        size_t index = workers.size();
        workers.emplace_back([this, index] { workerLoop(index); });
    }

    void workerLoop(size_t index) {
#if defined(TTSSERVE_PLATFORM_LINUX)
        std::string threadName = (config.name + "-" + std::to_string(index)).substr(0, 15);
        pthread_setname_np(pthread_self(), threadName.c_str());
#endif
        std::unique_lock<std::mutex> lock(mutex);
        while (true) {
            ++idleThreads;
            taskCv.wait(lock, [this] { return stopping || !tasks.empty(); });
            --idleThreads;
            if (stopping) {
                break;
            }
            auto task = std::move(tasks.front());
            tasks.pop();
            ++activeThreads;
            lock.unlock();
            try {
                task();
            } catch (const std::exception& e) {
                logger->error("ThreadPool '{}': задача завершилась исключением: {}", config.name, e.what());
            }
            lock.lock();
            --activeThreads;
            ++completedTasks;
            if (tasks.empty() && activeThreads == 0) {
                idleCv.notify_all();
            }
        }
        idleCv.notify_all();
    }
};

ThreadPool::ThreadPool(const ThreadPoolConfig& config)
    : pImpl(std::make_unique<Impl>(config)) {
    if (!config.validate()) {
        throw std::invalid_argument("Некорректная конфигурация ThreadPool");
    }
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    for (size_t i = 0; i < config.minThreads; ++i) {
        pImpl->spawnWorker();
    }
    pImpl->logger->debug("ThreadPool '{}': запущено {} потоков (max={})",
                         config.name, config.minThreads, config.maxThreads);
}

ThreadPool::~ThreadPool() {
    stop();
}

bool ThreadPool::enqueue(std::function<void()> task) {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    if (pImpl->stopping) {
        ++pImpl->rejectedTasks;
        return false;
    }
    if (pImpl->tasks.size() >= pImpl->config.queueSize) {
        ++pImpl->rejectedTasks;
        pImpl->logger->warn("ThreadPool '{}': очередь переполнена ({}), задача отклонена",
                            pImpl->config.name, pImpl->tasks.size());
        return false;
    }
    pImpl->tasks.push(std::move(task));
    // Добор потока, если все заняты
    if (pImpl->idleThreads < pImpl->tasks.size() && pImpl->workers.size() < pImpl->config.maxThreads) {
        pImpl->spawnWorker();
    }
    pImpl->taskCv.notify_one();
    return true;
}

size_t ThreadPool::getActiveThreadCount() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->activeThreads;
}

size_t ThreadPool::getQueueSize() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->tasks.size();
}

bool ThreadPool::isQueueEmpty() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->tasks.empty();
}

void ThreadPool::waitForCompletion() {
    std::unique_lock<std::mutex> lock(pImpl->mutex);
    pImpl->idleCv.wait(lock, [this] {
        return (pImpl->tasks.empty() && pImpl->activeThreads == 0) || pImpl->stopping;
    });
}

void ThreadPool::stop() {
    std::vector<std::thread> workers;
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        if (pImpl->stopping && pImpl->workers.empty()) {
            return;
        }
        pImpl->stopping = true;
        size_t dropped = pImpl->tasks.size();
        std::queue<std::function<void()>>().swap(pImpl->tasks);
        if (dropped > 0) {
            pImpl->logger->info("ThreadPool '{}': остановка, отброшено {} задач", pImpl->config.name, dropped);
        }
        workers.swap(pImpl->workers);
    }
    pImpl->taskCv.notify_all();
    pImpl->idleCv.notify_all();
    for (auto& worker : workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

bool ThreadPool::isStopped() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->stopping;
}

ThreadPoolMetrics ThreadPool::getMetrics() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    ThreadPoolMetrics metrics;
    metrics.activeThreads = pImpl->activeThreads;
    metrics.queueSize = pImpl->tasks.size();
    metrics.totalThreads = pImpl->workers.size();
    metrics.completedTasks = pImpl->completedTasks;
    metrics.rejectedTasks = pImpl->rejectedTasks;
    return metrics;
}

ThreadPoolConfig ThreadPool::getConfiguration() const {
    return pImpl->config;
}

} // namespace thread
} // namespace core
} // namespace ttsserve
