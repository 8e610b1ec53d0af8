#include "ttsserve/core/health/HealthRegistry.hpp"
#include "ttsserve/core/common/Error.hpp"
#include "ttsserve/core/logging/Logging.hpp"
#include <algorithm>
#include <condition_variable>
#include <future>
#include <mutex>
#include <thread>
#include <vector>

namespace ttsserve {
namespace core {
namespace health {

nlohmann::json HealthResult::toJson() const {
    return {
        {"healthy", healthy},
        {"detail", detail},
        {"timestamp", std::chrono::duration_cast<std::chrono::milliseconds>(timestamp.time_since_epoch()).count()},
        {"durationMs", duration.count()},
        {"timedOut", timedOut}
    };
}

nlohmann::json HealthStatus::toJson() const {
    nlohmann::json result = {{"overall", overall}, {"checks", nlohmann::json::object()}};
    for (const auto& [name, isEnabled] : enabled) {
        nlohmann::json check = {{"enabled", isEnabled}};
        auto it = checks.find(name);
        if (it != checks.end()) {
            check["result"] = it->second.toJson();
        } else {
            check["result"] = nullptr;
        }
        result["checks"][name] = check;
    }
    return result;
}

namespace {

struct CheckEntry {
    HealthProbe probe;
    bool enabled = true;
    std::chrono::milliseconds timeout{0};
    std::optional<HealthResult> lastResult;
    std::chrono::system_clock::time_point lastRun{};
    std::shared_future<HealthResult> pending; // Последняя запущенная проба; новая не стартует, пока эта не вернулась
};

} // namespace

struct HealthRegistry::Impl {
    HealthRegistryConfig config;
    std::map<std::string, CheckEntry> checks;
    mutable std::mutex mutex;
    bool stopped = false;
    size_t outstandingProbes = 0; // Потоки проб, ещё не вернувшиеся
    std::condition_variable probesCv;
    std::shared_ptr<spdlog::logger> logger;

    explicit Impl(const HealthRegistryConfig& cfg) : config(cfg), logger(logging::getLogger("health")) {}
};

HealthRegistry::HealthRegistry(const HealthRegistryConfig& config)
    : pImpl(std::make_shared<Impl>(config)) {
    if (!config.validate()) {
        throw ConfigError("invalid health registry configuration");
    }
}

HealthRegistry::~HealthRegistry() {
    shutdown();
}

bool HealthRegistry::registerCheck(const std::string& name, HealthProbe probe, bool enabled,
                                   std::optional<std::chrono::milliseconds> timeout) {
    if (name.empty() || !probe) {
        pImpl->logger->error("HealthRegistry: некорректная проверка '{}'", name);
        return false;
    }
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    if (pImpl->checks.count(name)) {
        pImpl->logger->warn("HealthRegistry: проверка '{}' уже зарегистрирована", name);
        return false;
    }
    CheckEntry entry;
    entry.probe = std::move(probe);
    entry.enabled = enabled;
    entry.timeout = timeout.value_or(pImpl->config.probeTimeout);
    pImpl->checks.emplace(name, std::move(entry));
    pImpl->logger->debug("HealthRegistry: зарегистрирована '{}' (enabled={})", name, enabled);
    return true;
}

bool HealthRegistry::unregisterCheck(const std::string& name) {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->checks.erase(name) > 0;
}

bool HealthRegistry::enable(const std::string& name) {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    auto it = pImpl->checks.find(name);
    if (it == pImpl->checks.end()) return false;
    it->second.enabled = true;
    return true;
}

bool HealthRegistry::disable(const std::string& name) {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    auto it = pImpl->checks.find(name);
    if (it == pImpl->checks.end()) return false;
    it->second.enabled = false;
    pImpl->logger->info("HealthRegistry: проверка '{}' выключена", name);
    return true;
}

HealthResult HealthRegistry::run(const std::string& name) {
    HealthProbe probe;
    std::chrono::milliseconds timeout;
    std::shared_future<HealthResult> future;
    std::shared_ptr<std::promise<HealthResult>> promise;
    auto started = std::chrono::steady_clock::now();
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        if (pImpl->stopped) {
            return HealthResult::failed("health registry is shut down");
        }
        auto it = pImpl->checks.find(name);
        if (it == pImpl->checks.end()) {
            pImpl->logger->warn("HealthRegistry: проверка '{}' не найдена", name);
            return HealthResult::failed("check '" + name + "' is not registered");
        }
        auto& entry = it->second;
        timeout = entry.timeout;
        if (entry.pending.valid() &&
            entry.pending.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
            // Предыдущая проба ещё висит: ждём её же, второй поток не запускаем
            future = entry.pending;
            pImpl->logger->debug("HealthRegistry: '{}' ожидает незавершённую пробу", name);
        } else {
            probe = entry.probe;
            promise = std::make_shared<std::promise<HealthResult>>();
            future = promise->get_future().share();
            entry.pending = future;
            ++pImpl->outstandingProbes;
        }
    }

    if (promise) {
        std::weak_ptr<Impl> weakImpl = pImpl;
        // Поток отсоединяется: зависшая проба не должна держать вызывающего
        std::thread([probe, promise, weakImpl] {
            try {
                promise->set_value(probe());
            } catch (...) {
                promise->set_exception(std::current_exception());
            }
            if (auto impl = weakImpl.lock()) {
                std::lock_guard<std::mutex> lock(impl->mutex);
                --impl->outstandingProbes;
                impl->probesCv.notify_all();
            }
        }).detach();
    }

    HealthResult result;
    if (future.wait_for(timeout) == std::future_status::ready) {
        try {
            result = future.get();
        } catch (const std::exception& e) {
            result = HealthResult::failed(std::string("probe threw: ") + e.what());
        } catch (...) {
            result = HealthResult::failed("probe threw: " + describeException(std::current_exception()));
        }
    } else {
        HealthCheckTimeout timeoutError("check '" + name + "' exceeded " + std::to_string(timeout.count()) + " ms");
        result = HealthResult::failed(timeoutError.what());
        result.timedOut = true;
    }
    result.timestamp = std::chrono::system_clock::now();
    result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);

    if (!result.healthy) {
        pImpl->logger->warn("HealthRegistry: '{}' нездорова: {}", name, result.detail);
    }

    std::lock_guard<std::mutex> lock(pImpl->mutex);
    auto it = pImpl->checks.find(name);
    if (it != pImpl->checks.end()) {
        it->second.lastResult = result;
        it->second.lastRun = result.timestamp;
    }
    return result;
}

std::map<std::string, HealthResult> HealthRegistry::runAll() {
    std::vector<std::string> names;
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        for (const auto& [name, entry] : pImpl->checks) {
            if (entry.enabled) names.push_back(name);
        }
    }
    std::map<std::string, HealthResult> results;
    std::mutex resultsMutex;
    size_t batch = pImpl->config.maxConcurrentProbes;
    for (size_t begin = 0; begin < names.size(); begin += batch) {
        size_t end = std::min(begin + batch, names.size());
        std::vector<std::thread> runners;
        for (size_t i = begin; i < end; ++i) {
            runners.emplace_back([this, &names, &results, &resultsMutex, i] {
                auto result = run(names[i]);
                std::lock_guard<std::mutex> lock(resultsMutex);
                results.emplace(names[i], std::move(result));
            });
        }
        for (auto& runner : runners) {
            runner.join();
        }
    }
    return results;
}

HealthStatus HealthRegistry::status() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    HealthStatus status;
    for (const auto& [name, entry] : pImpl->checks) {
        status.enabled[name] = entry.enabled;
        if (entry.lastResult) {
            status.checks[name] = *entry.lastResult;
        }
        if (!entry.enabled) continue;
        // Включённая, но ни разу не выполненная проверка считается нездоровой
        if (!entry.lastResult || !entry.lastResult->healthy) {
            status.overall = false;
        }
    }
    return status;
}

std::optional<HealthResult> HealthRegistry::lastResult(const std::string& name) const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    auto it = pImpl->checks.find(name);
    if (it == pImpl->checks.end()) return std::nullopt;
    return it->second.lastResult;
}

size_t HealthRegistry::outstandingProbes() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->outstandingProbes;
}

size_t HealthRegistry::checkCount() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->checks.size();
}

void HealthRegistry::shutdown() {
    std::unique_lock<std::mutex> lock(pImpl->mutex);
    if (pImpl->stopped) {
        return;
    }
    pImpl->stopped = true;
    bool drained = pImpl->probesCv.wait_for(lock, pImpl->config.probeTimeout, [this] {
        return pImpl->outstandingProbes == 0;
    });
    if (!drained) {
        pImpl->logger->warn("HealthRegistry: {} проб не завершились к остановке", pImpl->outstandingProbes);
    }
    pImpl->logger->info("HealthRegistry: остановлен");
}

} // namespace health
} // namespace core
} // namespace ttsserve
