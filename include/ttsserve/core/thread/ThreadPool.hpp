#pragma once

#include <vector>
#include <queue>
#include <functional>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <atomic>
#include <memory>
#include <string>
#include <nlohmann/json.hpp>

// Определение платформо-зависимых макросов
#if defined(__linux__)
    #define TTSSERVE_PLATFORM_LINUX
    #include <pthread.h>
#elif defined(__APPLE__)
    #define TTSSERVE_PLATFORM_APPLE
    #include <pthread.h>
#endif

namespace ttsserve {
namespace core {
namespace thread {

// Структура для хранения метрик пула потоков
struct ThreadPoolMetrics {
    size_t activeThreads = 0;  // Потоки, выполняющие задачу
    size_t queueSize = 0;      // Размер очереди
    size_t totalThreads = 0;   // Всего потоков
    size_t completedTasks = 0; // Выполнено задач
    size_t rejectedTasks = 0;  // Отклонено (очередь полна / остановлен)
    nlohmann::json toJson() const {
        return {
            {"activeThreads", activeThreads},
            {"queueSize", queueSize},
            {"totalThreads", totalThreads},
            {"completedTasks", completedTasks},
            {"rejectedTasks", rejectedTasks}
        };
    }
};

// Структура для конфигурации пула потоков
struct ThreadPoolConfig {
    size_t minThreads = 1;      // Мин. потоки (стартуют сразу)
    size_t maxThreads = 4;      // Макс. потоки (добор при нагрузке)
    size_t queueSize = 1024;    // Макс. очередь
    std::string name = "pool";  // Префикс имени потоков

    bool validate() const {
        if (minThreads == 0) return false;
        if (minThreads > maxThreads) return false;
        if (queueSize == 0) return false;
        return true;
    }
};

// Пул потоков
class ThreadPool {
public:
    explicit ThreadPool(const ThreadPoolConfig& config); // Конструктор
    ~ThreadPool(); // Деструктор
    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;
    bool enqueue(std::function<void()> task); // Добавить задачу (false — отклонена)
    size_t getActiveThreadCount() const; // Активные потоки
    size_t getQueueSize() const; // Размер очереди
    bool isQueueEmpty() const; // Очередь пуста?
    void waitForCompletion(); // Ждать завершения
    void stop(); // Остановить пул (задачи в очереди отбрасываются)
    bool isStopped() const; // Пул остановлен?
    ThreadPoolMetrics getMetrics() const; // Метрики
    ThreadPoolConfig getConfiguration() const; // Получить конфиг
private:
    struct Impl;
    std::unique_ptr<Impl> pImpl; // Реализация
};

} // namespace thread
} // namespace core
} // namespace ttsserve
