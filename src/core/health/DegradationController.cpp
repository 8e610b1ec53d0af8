#include "ttsserve/core/health/DegradationController.hpp"
#include "ttsserve/core/common/Error.hpp"
#include "ttsserve/core/logging/Logging.hpp"
#include <exception>

namespace ttsserve {
namespace core {
namespace health {

nlohmann::json ComponentHealthRecord::toJson() const {
    return {
        {"componentId", componentId},
        {"healthy", healthy},
        {"hasFallback", hasFallback},
        {"lastFailure", lastFailure},
        {"primaryCalls", primaryCalls},
        {"primaryFailures", primaryFailures},
        {"fallbackCalls", fallbackCalls}
    };
}

DegradationController::DegradationController() : logger_(logging::getLogger("degradation")) {}

DegradationController::Component& DegradationController::component(const std::string& componentId) {
    auto& entry = components_[componentId];
    entry.record.componentId = componentId;
    return entry;
}

bool DegradationController::healthyLocked(const Component& component) {
    if (!component.record.healthy) return false;
    return !(component.breaker && component.breaker->isOpen());
}

void DegradationController::registerFallback(const std::string& componentId, SynthesisFn fallback) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& entry = component(componentId);
    entry.fallback = std::move(fallback);
    entry.record.hasFallback = static_cast<bool>(entry.fallback);
    logger_->debug("DegradationController: fallback для '{}' зарегистрирован", componentId);
}

void DegradationController::markFailed(const std::string& componentId, const std::string& reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& entry = component(componentId);
    if (entry.record.healthy) {
        logger_->warn("DegradationController: '{}' помечен отказавшим{}{}", componentId,
                      reason.empty() ? "" : ": ", reason);
        entry.record.lastChange = std::chrono::system_clock::now();
    }
    entry.record.healthy = false;
    if (!reason.empty()) {
        entry.record.lastFailure = reason;
    }
}

void DegradationController::markHealthy(const std::string& componentId) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& entry = component(componentId);
    if (!entry.record.healthy) {
        logger_->info("DegradationController: '{}' снова доступен", componentId);
        entry.record.lastChange = std::chrono::system_clock::now();
    }
    entry.record.healthy = true;
}

void DegradationController::attachBreaker(const std::string& componentId,
                                          std::shared_ptr<resilience::CircuitBreaker> breaker) {
    std::lock_guard<std::mutex> lock(mutex_);
    component(componentId).breaker = std::move(breaker);
}

bool DegradationController::isHealthy(const std::string& componentId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = components_.find(componentId);
    return it == components_.end() || healthyLocked(it->second);
}

ArtifactBlob DegradationController::executeWithFallback(const std::string& componentId, const SynthesisFn& primary) {
    SynthesisFn fallback;
    bool healthy = true;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& entry = component(componentId);
        healthy = healthyLocked(entry);
        fallback = entry.fallback;
        if (healthy) {
            ++entry.record.primaryCalls;
        } else if (fallback) {
            ++entry.record.fallbackCalls;
        }
    }

    if (!healthy) {
        if (!fallback) {
            throw DegradationPassthroughError(componentId);
        }
        logger_->debug("DegradationController: '{}' недоступен, используется fallback", componentId);
        return fallback();
    }

    std::exception_ptr primaryError;
    try {
        return primary();
    } catch (...) {
        primaryError = std::current_exception();
    }

    markFailed(componentId, describeException(primaryError));
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& entry = component(componentId);
        ++entry.record.primaryFailures;
        if (fallback) {
            ++entry.record.fallbackCalls;
        }
    }
    if (!fallback) {
        std::rethrow_exception(primaryError);
    }
    logger_->warn("DegradationController: '{}' основная операция отказала, переключение на fallback", componentId);
    return fallback();
}

std::optional<ComponentHealthRecord> DegradationController::record(const std::string& componentId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = components_.find(componentId);
    if (it == components_.end()) {
        return std::nullopt;
    }
    auto result = it->second.record;
    result.healthy = healthyLocked(it->second);
    return result;
}

nlohmann::json DegradationController::statusJson() const {
    std::lock_guard<std::mutex> lock(mutex_);
    nlohmann::json result = nlohmann::json::object();
    for (const auto& [id, entry] : components_) {
        auto record = entry.record;
        record.healthy = healthyLocked(entry);
        result[id] = record.toJson();
    }
    return result;
}

} // namespace health
} // namespace core
} // namespace ttsserve
