#include "ttsserve/core/cache/loader/FileArtifactLoader.hpp"
#include "ttsserve/core/common/Error.hpp"
#include "ttsserve/core/logging/Logging.hpp"
#include <algorithm>
#include <fstream>
#include <iterator>

namespace ttsserve {
namespace core {
namespace cache {

FileArtifactLoader::FileArtifactLoader(std::filesystem::path rootDirectory, std::string extension)
    : root_(std::move(rootDirectory)), extension_(std::move(extension)), logger_(logging::getLogger("loader")) {
    if (!extension_.empty() && extension_.front() != '.') {
        extension_.insert(extension_.begin(), '.');
    }
}

std::filesystem::path FileArtifactLoader::resolve(const std::string& name) const {
    if (name.empty()) {
        throw LoadError("empty artifact name", false);
    }
    std::filesystem::path relative(name);
    if (relative.is_absolute()) {
        throw LoadError("artifact name must be relative: " + name, false);
    }
    for (const auto& part : relative) {
        if (part == "..") {
            throw LoadError("artifact name escapes root directory: " + name, false);
        }
    }
    if (!extension_.empty() && relative.extension() != extension_) {
        relative += extension_;
    }
    return root_ / relative;
}

LoadedArtifact FileArtifactLoader::load(const std::string& name) const {
    auto path = resolve(name);
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        if (ec && ec != std::errc::no_such_file_or_directory) {
            throw LoadError("cannot stat " + path.string() + ": " + ec.message(), true);
        }
        throw LoadError("artifact not found: " + path.string(), false);
    }
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw LoadError("cannot open " + path.string(), true);
    }
    LoadedArtifact artifact;
    artifact.data.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
    if (file.bad()) {
        throw LoadError("read error on " + path.string(), true);
    }
    artifact.sizeEstimate = artifact.data.size();
    logger_->debug("FileArtifactLoader: загружен {} ({} байт)", path.string(), artifact.sizeEstimate);
    return artifact;
}

std::vector<std::string> FileArtifactLoader::list() const {
    std::vector<std::string> names;
    std::error_code ec;
    if (!std::filesystem::is_directory(root_, ec)) {
        logger_->warn("FileArtifactLoader: каталог {} недоступен", root_.string());
        return names;
    }
    for (const auto& entry : std::filesystem::directory_iterator(root_, ec)) {
        if (!entry.is_regular_file()) continue;
        const auto& path = entry.path();
        if (!extension_.empty() && path.extension() != extension_) continue;
        names.push_back(extension_.empty() ? path.filename().string() : path.stem().string());
    }
    if (ec) {
        logger_->warn("FileArtifactLoader: ошибка обхода {}: {}", root_.string(), ec.message());
    }
    std::sort(names.begin(), names.end());
    return names;
}

Loader FileArtifactLoader::asLoader() const {
    auto self = *this;
    return [self](const std::string& name) { return self.load(name); };
}

} // namespace cache
} // namespace core
} // namespace ttsserve
