#include "ttsserve/core/reload/HotReloadWatcher.hpp"
#include "ttsserve/core/common/Error.hpp"
#include "ttsserve/core/logging/Logging.hpp"
#include <openssl/evp.h>
#include <algorithm>
#include <fstream>
#include <iomanip>
#include <map>
#include <mutex>
#include <sstream>
#include <thread>

namespace ttsserve {
namespace core {
namespace reload {

namespace {

constexpr std::chrono::milliseconds IDLE_WAIT{1000};

struct EvpContextDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

// SHA-256 содержимого файла потоково (EVP)
std::string fileSha256(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw ReloadError("cannot open " + path.string() + " for fingerprint");
    }
    std::unique_ptr<EVP_MD_CTX, EvpContextDeleter> ctx(EVP_MD_CTX_new());
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        throw ReloadError("EVP sha256 init failed");
    }
    char buffer[64 * 1024];
    while (file) {
        file.read(buffer, sizeof(buffer));
        auto count = file.gcount();
        if (count > 0 && EVP_DigestUpdate(ctx.get(), buffer, static_cast<size_t>(count)) != 1) {
            throw ReloadError("EVP sha256 update failed");
        }
    }
    if (file.bad()) {
        throw ReloadError("read error on " + path.string());
    }
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(ctx.get(), digest, &length) != 1) {
        throw ReloadError("EVP sha256 final failed");
    }
    std::stringstream ss;
    for (unsigned int i = 0; i < length; ++i) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(digest[i]);
    }
    return ss.str();
}

bool matchesExtension(const ReloadTarget& target, const std::filesystem::path& path) {
    if (target.extensions.empty()) return true;
    auto extension = path.extension().string();
    return std::find(target.extensions.begin(), target.extensions.end(), extension) != target.extensions.end();
}

} // namespace

const char* toString(ReloadState state) {
    switch (state) {
        case ReloadState::Idle: return "idle";
        case ReloadState::Pending: return "pending";
        case ReloadState::Firing: return "firing";
    }
    return "unknown";
}

PathState PathState::observe(const std::filesystem::path& path) {
    PathState state;
    state.path = path;
    std::error_code ec;
    auto status = std::filesystem::status(path, ec);
    if (ec || !std::filesystem::exists(status)) {
        return state;
    }
    state.exists = true;
    state.mtime = std::filesystem::last_write_time(path, ec);
    if (std::filesystem::is_directory(status)) {
        state.isDirectory = true;
        for (const auto& entry : std::filesystem::directory_iterator(path, ec)) {
            if (entry.is_regular_file()) ++state.size;
        }
        return state;
    }
    state.size = std::filesystem::file_size(path, ec);
    state.sha256 = fileSha256(path);
    return state;
}

nlohmann::json PathState::toJson() const {
    return {
        {"path", path.string()},
        {"exists", exists},
        {"isDirectory", isDirectory},
        {"size", size},
        {"mtime", static_cast<long long>(mtime.time_since_epoch().count())},
        {"sha256", sha256}
    };
}

namespace {

// TargetSlot — цель, её подписка и поток слежения
struct TargetSlot {
    ReloadTarget target;
    std::unique_ptr<FileChangeSubscription> subscription;
    std::thread thread;
    std::mutex stateMutex;  // pending/deadline/state
    bool pending = false;
    std::chrono::steady_clock::time_point deadline{};
    ReloadState state = ReloadState::Idle;
    std::mutex fireMutex;   // Одна перезагрузка цели за раз
    size_t events = 0;
    size_t reloads = 0;
    size_t failures = 0;
    std::string lastError;
    std::chrono::system_clock::time_point lastReload{};

    explicit TargetSlot(ReloadTarget t) : target(std::move(t)) {}
};

} // namespace

struct HotReloadWatcher::Impl {
    std::shared_ptr<FileChangeSource> source;
    std::shared_ptr<cache::CacheManager> cacheManager;
    std::map<std::string, std::shared_ptr<TargetSlot>> targets;
    mutable std::mutex mutex;
    bool running = false;
    std::shared_ptr<spdlog::logger> logger;

    Impl(std::shared_ptr<FileChangeSource> src, std::shared_ptr<cache::CacheManager> manager)
        : source(std::move(src)), cacheManager(std::move(manager)), logger(logging::getLogger("hotreload")) {}

    std::shared_ptr<TargetSlot> find(const std::string& name) const {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = targets.find(name);
        return it != targets.end() ? it->second : nullptr;
    }

    // Подписаться и запустить поток цели (под mutex)
    bool launch(const std::shared_ptr<TargetSlot>& slot) {
        try {
            slot->subscription = source->subscribe(slot->target.path);
        } catch (const std::exception& e) {
            logger->error("HotReloadWatcher: не удалось подписаться на {}: {}", slot->target.path.string(), e.what());
            std::lock_guard<std::mutex> stateLock(slot->stateMutex);
            slot->lastError = e.what();
            return false;
        }
        slot->thread = std::thread([this, slot] { watchLoop(slot); });
        return true;
    }

    // Отменить подписку, дождаться потока, освободить ресурсы
    void release(const std::shared_ptr<TargetSlot>& slot) {
        if (slot->subscription) {
            slot->subscription->cancel();
        }
        if (slot->thread.joinable()) {
            slot->thread.join();
        }
        slot->subscription.reset();
        std::lock_guard<std::mutex> stateLock(slot->stateMutex);
        slot->pending = false;
        slot->state = ReloadState::Idle;
    }

    void watchLoop(std::shared_ptr<TargetSlot> slot) {
        auto& target = slot->target;
        logger->info("HotReloadWatcher: слежение за '{}' ({})", target.name, target.path.string());
        while (true) {
            std::chrono::milliseconds timeout = IDLE_WAIT;
            {
                std::lock_guard<std::mutex> stateLock(slot->stateMutex);
                if (slot->pending) {
                    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                        slot->deadline - std::chrono::steady_clock::now());
                    timeout = std::max(remaining, std::chrono::milliseconds(0));
                }
            }

            FileChangeEvent event;
            NextStatus status;
            try {
                status = slot->subscription->next(event, timeout);
            } catch (const std::exception& e) {
                logger->error("HotReloadWatcher: ошибка подписки '{}': {}", target.name, e.what());
                std::this_thread::sleep_for(IDLE_WAIT);
                continue;
            }

            if (status == NextStatus::Cancelled) {
                break;
            }
            if (status == NextStatus::Event) {
                if (!matchesExtension(target, event.path)) {
                    continue;
                }
                std::lock_guard<std::mutex> stateLock(slot->stateMutex);
                ++slot->events;
                // Перенос единственного таймера цели
                slot->pending = true;
                slot->deadline = std::chrono::steady_clock::now() + target.debounce;
                slot->state = ReloadState::Pending;
                logger->debug("HotReloadWatcher: '{}' изменение {}, перезагрузка через {} мс",
                              target.name, event.path.string(), target.debounce.count());
                continue;
            }

            bool due = false;
            {
                std::lock_guard<std::mutex> stateLock(slot->stateMutex);
                if (slot->pending && std::chrono::steady_clock::now() >= slot->deadline) {
                    slot->pending = false;
                    due = true;
                }
            }
            if (due) {
                fire(*slot, "debounce");
            }
        }
        logger->info("HotReloadWatcher: слежение за '{}' завершено", target.name);
    }

    void fire(TargetSlot& slot, const char* reason) {
        std::lock_guard<std::mutex> fireLock(slot.fireMutex);
        const auto& target = slot.target;
        {
            std::lock_guard<std::mutex> stateLock(slot.stateMutex);
            slot.state = ReloadState::Firing;
        }
        logger->info("HotReloadWatcher: перезагрузка '{}' ({})", target.name, reason);

        std::string error;
        try {
            if (cacheManager && !target.cacheName.empty()) {
                cacheManager->invalidateCascade(target.cacheName, target.invalidationKeys);
            }
            auto state = PathState::observe(target.path);
            if (target.callback) {
                target.callback(target.name, state);
            }
        } catch (const std::exception& e) {
            error = e.what();
        } catch (...) {
            error = describeException(std::current_exception());
        }

        std::lock_guard<std::mutex> stateLock(slot.stateMutex);
        ++slot.reloads;
        slot.lastReload = std::chrono::system_clock::now();
        if (!error.empty()) {
            ++slot.failures;
            slot.lastError = error;
            logger->error("HotReloadWatcher: ошибка перезагрузки '{}': {}", target.name, error);
        }
        slot.state = slot.pending ? ReloadState::Pending : ReloadState::Idle;
    }
};

HotReloadWatcher::HotReloadWatcher(std::shared_ptr<FileChangeSource> source,
                                   std::shared_ptr<cache::CacheManager> cacheManager)
    : pImpl(std::make_unique<Impl>(std::move(source), std::move(cacheManager))) {
    if (!pImpl->source) {
        throw ConfigError("hot reload watcher requires a file change source");
    }
}

HotReloadWatcher::~HotReloadWatcher() {
    stop();
}

bool HotReloadWatcher::registerTarget(ReloadTarget target) {
    if (!target.validate()) {
        pImpl->logger->error("HotReloadWatcher: некорректная цель '{}'", target.name);
        return false;
    }
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    if (pImpl->targets.count(target.name)) {
        pImpl->logger->warn("HotReloadWatcher: цель '{}' уже зарегистрирована", target.name);
        return false;
    }
    auto name = target.name;
    auto slot = std::make_shared<TargetSlot>(std::move(target));
    pImpl->targets.emplace(name, slot);
    if (pImpl->running) {
        return pImpl->launch(slot);
    }
    return true;
}

bool HotReloadWatcher::unregisterTarget(const std::string& name) {
    std::shared_ptr<TargetSlot> slot;
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        auto it = pImpl->targets.find(name);
        if (it == pImpl->targets.end()) {
            return false;
        }
        slot = it->second;
        pImpl->targets.erase(it);
    }
    pImpl->release(slot);
    pImpl->logger->info("HotReloadWatcher: цель '{}' снята", name);
    return true;
}

bool HotReloadWatcher::start() {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    if (pImpl->running) {
        return true;
    }
    pImpl->running = true;
    bool ok = true;
    for (auto& [name, slot] : pImpl->targets) {
        if (!slot->subscription) {
            ok = pImpl->launch(slot) && ok;
        }
    }
    pImpl->logger->info("HotReloadWatcher: запущен, целей {}", pImpl->targets.size());
    return ok;
}

void HotReloadWatcher::stop() {
    std::vector<std::shared_ptr<TargetSlot>> slots;
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        if (!pImpl->running) {
            return;
        }
        pImpl->running = false;
        for (auto& [name, slot] : pImpl->targets) {
            slots.push_back(slot);
        }
    }
    for (auto& slot : slots) {
        pImpl->release(slot);
    }
    pImpl->logger->info("HotReloadWatcher: остановлен, подписки освобождены");
}

bool HotReloadWatcher::isRunning() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->running;
}

bool HotReloadWatcher::manualReload(const std::string& name) {
    auto slot = pImpl->find(name);
    if (!slot) {
        pImpl->logger->warn("HotReloadWatcher: цель '{}' не найдена", name);
        return false;
    }
    {
        std::lock_guard<std::mutex> stateLock(slot->stateMutex);
        slot->pending = false;
    }
    pImpl->fire(*slot, "manual");
    return true;
}

size_t HotReloadWatcher::reloadAll() {
    size_t count = 0;
    for (const auto& name : targetNames()) {
        if (manualReload(name)) {
            ++count;
        }
    }
    return count;
}

ReloadState HotReloadWatcher::state(const std::string& name) const {
    auto slot = pImpl->find(name);
    if (!slot) {
        return ReloadState::Idle;
    }
    std::lock_guard<std::mutex> stateLock(slot->stateMutex);
    return slot->state;
}

size_t HotReloadWatcher::reloadCount(const std::string& name) const {
    auto slot = pImpl->find(name);
    if (!slot) {
        return 0;
    }
    std::lock_guard<std::mutex> stateLock(slot->stateMutex);
    return slot->reloads;
}

std::vector<std::string> HotReloadWatcher::targetNames() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    std::vector<std::string> names;
    for (const auto& [name, slot] : pImpl->targets) {
        names.push_back(name);
    }
    return names;
}

nlohmann::json HotReloadWatcher::status() const {
    std::vector<std::shared_ptr<TargetSlot>> slots;
    bool running = false;
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        running = pImpl->running;
        for (const auto& [name, slot] : pImpl->targets) {
            slots.push_back(slot);
        }
    }
    nlohmann::json targets = nlohmann::json::object();
    for (const auto& slot : slots) {
        std::lock_guard<std::mutex> stateLock(slot->stateMutex);
        targets[slot->target.name] = {
            {"path", slot->target.path.string()},
            {"state", toString(slot->state)},
            {"debounceMs", slot->target.debounce.count()},
            {"events", slot->events},
            {"reloads", slot->reloads},
            {"failures", slot->failures},
            {"lastError", slot->lastError},
            {"lastReload", std::chrono::duration_cast<std::chrono::milliseconds>(
                               slot->lastReload.time_since_epoch()).count()}
        };
    }
    return {{"running", running}, {"targets", targets}};
}

} // namespace reload
} // namespace core
} // namespace ttsserve
