#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>
#include "ttsserve/core/common/Types.hpp"

namespace ttsserve {
namespace core {
namespace cache {

// FileArtifactLoader — загрузчик артефактов из каталога (голоса *.bin, модели *.onnx)
// Ключ — имя файла относительно корня, расширение добавляется, если не указано.
// Отсутствующий файл и выход за пределы корня — LoadError без повтора,
// ошибки чтения — LoadError с повтором.
class FileArtifactLoader {
public:
    explicit FileArtifactLoader(std::filesystem::path rootDirectory, std::string extension = ""); // Конструктор
    LoadedArtifact load(const std::string& name) const; // Прочитать файл
    LoadedArtifact operator()(const std::string& name) const { return load(name); }
    std::filesystem::path resolve(const std::string& name) const; // Путь к файлу артефакта
    std::vector<std::string> list() const; // Имена доступных артефактов (без расширения)
    Loader asLoader() const; // Обёртка для CacheManager::getOrLoad
    const std::filesystem::path& rootDirectory() const { return root_; }
    const std::string& extension() const { return extension_; }
private:
    std::filesystem::path root_;
    std::string extension_;
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace cache
} // namespace core
} // namespace ttsserve
