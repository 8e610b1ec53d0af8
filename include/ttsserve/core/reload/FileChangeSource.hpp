#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <filesystem>
#include <memory>
#include <mutex>
#include <vector>

namespace ttsserve {
namespace core {
namespace reload {

// FileChangeEvent — уведомление об изменении пути
struct FileChangeEvent {
    std::filesystem::path path;
    std::chrono::system_clock::time_point timestamp;
};

// Результат ожидания следующего события
enum class NextStatus { Event, Timeout, Cancelled };

// FileChangeSubscription — отменяемая подписка на изменения одного пути
// Ресурсы ОС освобождаются в деструкторе. cancel() можно вызывать из другого потока,
// после него next() сразу возвращает Cancelled.
class FileChangeSubscription {
public:
    virtual ~FileChangeSubscription() = default;
    virtual NextStatus next(FileChangeEvent& event, std::chrono::milliseconds timeout) = 0;
    virtual void cancel() = 0;
    virtual const std::filesystem::path& path() const = 0;
};

// FileChangeSource — фабрика подписок
class FileChangeSource {
public:
    virtual ~FileChangeSource() = default;
    virtual std::unique_ptr<FileChangeSubscription> subscribe(const std::filesystem::path& path) = 0;
};

// InotifyFileChangeSource — подписки через inotify (Linux)
// Файл отслеживается через его каталог, чтобы пережить атомарную замену (rename).
class InotifyFileChangeSource : public FileChangeSource {
public:
    std::unique_ptr<FileChangeSubscription> subscribe(const std::filesystem::path& path) override;
};

// MemoryFileChangeSource — источник событий в памяти для тестов и встраивания
class MemoryFileChangeSource : public FileChangeSource {
public:
    std::unique_ptr<FileChangeSubscription> subscribe(const std::filesystem::path& path) override;
    // Доставить событие подпискам на path или на его каталог; возвращает число получателей
    size_t emit(const std::filesystem::path& path,
                std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now());
    size_t activeSubscriptions() const; // Живые подписки
    struct Channel {
        std::filesystem::path path;
        std::mutex mutex;
        std::condition_variable cv;
        std::deque<FileChangeEvent> events;
        bool cancelled = false;
    };
private:
    mutable std::mutex mutex_;
    std::vector<std::weak_ptr<Channel>> channels_;
};

} // namespace reload
} // namespace core
} // namespace ttsserve
