#include "ttsserve/core/cache/base/LruCache.hpp"

namespace ttsserve {
namespace core {
namespace cache {

// Явная инстанциация для кэша артефактов
template class LruCache<std::string, ArtifactPtr>;

} // namespace cache
} // namespace core
} // namespace ttsserve
