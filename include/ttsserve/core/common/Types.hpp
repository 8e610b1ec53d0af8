#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace ttsserve {
namespace core {

using ArtifactBlob = std::vector<uint8_t>;             // Сырые байты артефакта
using ArtifactPtr = std::shared_ptr<const ArtifactBlob>; // Неизменяемый разделяемый блоб

// LoadedArtifact — результат внешнего загрузчика
struct LoadedArtifact {
    ArtifactBlob data;       // Данные
    size_t sizeEstimate = 0; // Оценка размера в байтах (0 = по data.size())
};

// Loader — внешний загрузчик: бросает LoadError при отказе
using Loader = std::function<LoadedArtifact(const std::string& key)>;

} // namespace core
} // namespace ttsserve
