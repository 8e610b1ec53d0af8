#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "ttsserve/core/cache/manager/CacheManager.hpp"
#include "ttsserve/core/reload/FileChangeSource.hpp"

namespace ttsserve {
namespace core {
namespace reload {

// PathState — наблюдаемое состояние пути в момент перезагрузки
struct PathState {
    std::filesystem::path path;
    bool exists = false;
    bool isDirectory = false;
    uintmax_t size = 0;                      // Байты файла / число файлов каталога
    std::filesystem::file_time_type mtime{};
    std::string sha256;                      // Отпечаток содержимого файла (hex), пусто для каталога
    static PathState observe(const std::filesystem::path& path); // Снять состояние
    nlohmann::json toJson() const;
};

using ReloadCallback = std::function<void(const std::string& targetName, const PathState& state)>;

// ReloadTarget — отслеживаемый путь и связанные ключи кэша
struct ReloadTarget {
    std::string name;                          // Имя цели
    std::filesystem::path path;                // Файл или каталог
    std::string cacheName;                     // Кэш для инвалидации (пусто — без инвалидации)
    std::vector<std::string> invalidationKeys; // Ключи для invalidateCascade
    std::chrono::milliseconds debounce{500};   // Окно debounce
    std::vector<std::string> extensions;       // Фильтр расширений (".onnx", ".bin"); пусто — все
    ReloadCallback callback;                   // Вызывается после инвалидации
    bool validate() const {
        return !name.empty() && !path.empty() && debounce.count() >= 0;
    }
};

enum class ReloadState { Idle, Pending, Firing };

const char* toString(ReloadState state);

// HotReloadWatcher — перезагрузка артефактов по изменениям файлов
// Цель: Idle -> Pending (debounce) -> Firing -> Idle. Повторные события в Pending
// переносят единственный таймер цели. Firing: invalidateCascade, затем callback
// с итоговым состоянием пути. Исключения callback логируются, слежение продолжается.
class HotReloadWatcher {
public:
    HotReloadWatcher(std::shared_ptr<FileChangeSource> source,
                     std::shared_ptr<cache::CacheManager> cacheManager); // Конструктор
    ~HotReloadWatcher(); // Деструктор
    HotReloadWatcher(const HotReloadWatcher&) = delete;
    HotReloadWatcher& operator=(const HotReloadWatcher&) = delete;
    bool registerTarget(ReloadTarget target); // Зарегистрировать цель
    bool unregisterTarget(const std::string& name); // Снять цель и освободить подписку
    bool start(); // Запустить потоки слежения
    void stop(); // Остановить и освободить все подписки
    bool isRunning() const;
    bool manualReload(const std::string& name); // Немедленная перезагрузка без debounce
    size_t reloadAll(); // Перезагрузить все цели
    ReloadState state(const std::string& name) const; // Состояние цели
    size_t reloadCount(const std::string& name) const; // Сколько раз цель перезагружена
    std::vector<std::string> targetNames() const;
    nlohmann::json status() const; // Состояние всех целей
private:
    struct Impl;
    std::unique_ptr<Impl> pImpl; // Реализация
};

} // namespace reload
} // namespace core
} // namespace ttsserve
