#include <cassert>
#include <iostream>
#include <memory>
#include <atomic>
#include <chrono>
#include <thread>
#include <vector>
#include <stdexcept>
#include "ttsserve/core/thread/ThreadPool.hpp"

#include <spdlog/spdlog.h>

using namespace ttsserve::core::thread;

void smokeTestThreadPool() {
    std::cout << "Testing ThreadPool basic operations...\n";

    ThreadPoolConfig config;
    config.minThreads = 2;
    config.maxThreads = 8;
    config.queueSize = 100;

    ThreadPool pool(config);

    // Проверяем начальное состояние
    assert(pool.getActiveThreadCount() == 0);
    assert(pool.getQueueSize() == 0);
    assert(pool.isQueueEmpty());
    assert(!pool.isStopped());
    assert(pool.getMetrics().totalThreads == 2);

    std::cout << "[OK] ThreadPool smoke test\n";
}

void testThreadPoolTaskExecution() {
    std::cout << "Testing ThreadPool task execution...\n";

    ThreadPoolConfig config;
    config.minThreads = 2;
    config.maxThreads = 4;
    config.queueSize = 50;

    ThreadPool pool(config);
    std::atomic<int> taskCounter{0};

    for (int i = 0; i < 5; ++i) {
        assert(pool.enqueue([&taskCounter]() {
            taskCounter++;
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }));
    }

    pool.waitForCompletion();
    assert(taskCounter == 5);
    assert(pool.getMetrics().completedTasks == 5);
    assert(pool.getMetrics().totalThreads <= config.maxThreads);

    std::cout << "[OK] ThreadPool task execution test\n";
}

void testThreadPoolQueueLimit() {
    std::cout << "Testing ThreadPool queue limit...\n";

    ThreadPoolConfig config;
    config.minThreads = 1;
    config.maxThreads = 1;
    config.queueSize = 2;

    ThreadPool pool(config);
    std::atomic<bool> release{false};

    // Занимаем единственный поток
    assert(pool.enqueue([&release]() {
        while (!release) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
    }));
    while (pool.getActiveThreadCount() == 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }

    assert(pool.enqueue([]() {}));
    assert(pool.enqueue([]() {}));
    assert(!pool.enqueue([]() {})); // Очередь полна
    assert(pool.getMetrics().rejectedTasks == 1);

    release = true;
    pool.waitForCompletion();
    assert(pool.isQueueEmpty());

    std::cout << "[OK] ThreadPool queue limit test\n";
}

void testThreadPoolTaskException() {
    std::cout << "Testing ThreadPool task exception handling...\n";

    ThreadPoolConfig config;
    config.minThreads = 1;
    config.maxThreads = 1;

    ThreadPool pool(config);
    std::atomic<int> taskCounter{0};

    pool.enqueue([]() { throw std::runtime_error("task failure"); });
    pool.enqueue([&taskCounter]() { taskCounter++; });
    pool.waitForCompletion();

    // Поток пережил исключение и выполнил следующую задачу
    assert(taskCounter == 1);
    assert(pool.getMetrics().completedTasks == 2);

    std::cout << "[OK] ThreadPool task exception test\n";
}

void testThreadPoolStop() {
    std::cout << "Testing ThreadPool stop...\n";

    ThreadPoolConfig config;
    config.minThreads = 1;
    config.maxThreads = 1;
    config.queueSize = 20;

    ThreadPool pool(config);
    std::atomic<int> taskCounter{0};
    for (int i = 0; i < 10; ++i) {
        pool.enqueue([&taskCounter]() {
            taskCounter++;
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        });
    }

    pool.stop();
    assert(pool.isStopped());
    assert(taskCounter < 10); // Задачи в очереди отброшены
    assert(!pool.enqueue([]() {}));
    pool.stop(); // Повторная остановка безопасна

    std::cout << "[OK] ThreadPool stop test\n";
}

void testThreadPoolConcurrentAccess() {
    std::cout << "Testing ThreadPool concurrent access...\n";

    ThreadPoolConfig config;
    config.minThreads = 2;
    config.maxThreads = 4;
    config.queueSize = 200;

    ThreadPool pool(config);
    std::atomic<int> taskCounter{0};
    const int numThreads = 4;
    const int tasksPerThread = 25;

    std::vector<std::thread> threads;
    for (int t = 0; t < numThreads; ++t) {
        threads.emplace_back([&pool, &taskCounter, tasksPerThread]() {
            for (int i = 0; i < tasksPerThread; ++i) {
                pool.enqueue([&taskCounter]() { taskCounter++; });
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    pool.waitForCompletion();

    assert(taskCounter == numThreads * tasksPerThread);

    std::cout << "[OK] ThreadPool concurrent access test\n";
}

int main() {
    try {
        smokeTestThreadPool();
        testThreadPoolTaskExecution();
        testThreadPoolQueueLimit();
        testThreadPoolTaskException();
        testThreadPoolStop();
        testThreadPoolConcurrentAccess();
        std::cout << "All ThreadPool tests passed!\n";
    } catch (const std::exception& e) {
        std::cerr << "ThreadPool test failed with exception: " << e.what() << std::endl;
        return 1;
    }
    spdlog::shutdown();
    return 0;
}
