#include "ttsserve/core/resilience/CircuitBreaker.hpp"
#include "ttsserve/core/logging/Logging.hpp"

namespace ttsserve {
namespace core {
namespace resilience {

const char* toString(CircuitState state) {
    switch (state) {
        case CircuitState::Closed: return "closed";
        case CircuitState::Open: return "open";
        case CircuitState::HalfOpen: return "half_open";
    }
    return "unknown";
}

nlohmann::json CircuitBreakerStats::toJson() const {
    return {
        {"name", name},
        {"state", toString(state)},
        {"failureCount", failureCount},
        {"calls", calls},
        {"successes", successes},
        {"failures", failures},
        {"rejections", rejections},
        {"opens", opens}
    };
}

CircuitBreaker::CircuitBreaker(std::string name, const CircuitBreakerConfig& config, TimeSource clock)
    : name_(std::move(name)), config_(config), clock_(std::move(clock)), logger_(logging::getLogger("breaker")) {
    if (!config_.validate()) {
        throw ConfigError("invalid circuit breaker config for '" + name_ + "'");
    }
    if (!clock_) {
        clock_ = [] { return std::chrono::steady_clock::now(); };
    }
}

bool CircuitBreaker::acquire() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == CircuitState::Open) {
        if (clock_() < cooldownUntil_) {
            ++rejections_;
            throw CircuitOpenError(name_);
        }
        state_ = CircuitState::HalfOpen;
        trialInFlight_ = false;
        logger_->info("CircuitBreaker '{}': cooldown истёк, переход в half_open", name_);
    }
    if (state_ == CircuitState::HalfOpen) {
        if (trialInFlight_) {
            ++rejections_;
            throw CircuitOpenError(name_);
        }
        trialInFlight_ = true;
        ++calls_;
        return true;
    }
    ++calls_;
    return false;
}

void CircuitBreaker::onSuccess(bool trial) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++successes_;
    if (trial) {
        trialInFlight_ = false;
        state_ = CircuitState::Closed;
        failureCount_ = 0;
        logger_->info("CircuitBreaker '{}': пробный вызов успешен, closed", name_);
        return;
    }
    if (state_ == CircuitState::Closed) {
        failureCount_ = 0;
    }
}

void CircuitBreaker::onFailure(bool trial) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++failures_;
    ++failureCount_;
    if (trial) {
        trialInFlight_ = false;
        open();
        return;
    }
    if (state_ == CircuitState::Closed && failureCount_ >= config_.failureThreshold) {
        open();
    }
}

void CircuitBreaker::onCancelled(bool trial) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (trial) {
        trialInFlight_ = false;
    }
    logger_->debug("CircuitBreaker '{}': вызов отменён, не учитывается", name_);
}

void CircuitBreaker::open() {
    state_ = CircuitState::Open;
    cooldownUntil_ = clock_() + config_.cooldown;
    ++opens_;
    logger_->warn("CircuitBreaker '{}': разомкнут после {} неудач, cooldown {} мс",
                  name_, failureCount_, config_.cooldown.count());
}

CircuitState CircuitBreaker::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

bool CircuitBreaker::isOpen() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_ == CircuitState::Open && clock_() < cooldownUntil_;
}

size_t CircuitBreaker::failureCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return failureCount_;
}

CircuitBreakerStats CircuitBreaker::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    CircuitBreakerStats stats;
    stats.name = name_;
    stats.state = state_;
    stats.failureCount = failureCount_;
    stats.calls = calls_;
    stats.successes = successes_;
    stats.failures = failures_;
    stats.rejections = rejections_;
    stats.opens = opens_;
    return stats;
}

void CircuitBreaker::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    state_ = CircuitState::Closed;
    failureCount_ = 0;
    trialInFlight_ = false;
    logger_->info("CircuitBreaker '{}': сброшен", name_);
}

CircuitBreakerRegistry::CircuitBreakerRegistry(CircuitBreakerConfig defaults, TimeSource clock)
    : defaults_(defaults), clock_(std::move(clock)) {}

void CircuitBreakerRegistry::configure(const std::string& kind, const CircuitBreakerConfig& config) {
    if (!config.validate()) {
        throw ConfigError("invalid circuit breaker config for '" + kind + "'");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    configs_[kind] = config;
}

std::shared_ptr<CircuitBreaker> CircuitBreakerRegistry::getOrCreate(const std::string& kind) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = breakers_.find(kind);
    if (it != breakers_.end()) {
        return it->second;
    }
    auto configIt = configs_.find(kind);
    const auto& config = configIt != configs_.end() ? configIt->second : defaults_;
    auto breaker = std::make_shared<CircuitBreaker>(kind, config, clock_);
    breakers_.emplace(kind, breaker);
    return breaker;
}

std::shared_ptr<CircuitBreaker> CircuitBreakerRegistry::get(const std::string& kind) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = breakers_.find(kind);
    return it != breakers_.end() ? it->second : nullptr;
}

std::vector<std::string> CircuitBreakerRegistry::names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> result;
    for (const auto& [kind, breaker] : breakers_) {
        result.push_back(kind);
    }
    return result;
}

nlohmann::json CircuitBreakerRegistry::statsJson() const {
    std::vector<std::shared_ptr<CircuitBreaker>> snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [kind, breaker] : breakers_) {
            snapshot.push_back(breaker);
        }
    }
    nlohmann::json result = nlohmann::json::object();
    for (const auto& breaker : snapshot) {
        result[breaker->name()] = breaker->stats().toJson();
    }
    return result;
}

void CircuitBreakerRegistry::resetAll() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [kind, breaker] : breakers_) {
        breaker->reset();
    }
}

} // namespace resilience
} // namespace core
} // namespace ttsserve
