#include "ttsserve/core/resilience/RetryPolicy.hpp"
#include "ttsserve/core/logging/Logging.hpp"
#include <algorithm>
#include <cmath>
#include <random>
#include <thread>

namespace ttsserve {
namespace core {
namespace resilience {

nlohmann::json RetrySpec::toJson() const {
    nlohmann::json kinds = nlohmann::json::array();
    for (auto kind : retryableKinds) {
        kinds.push_back(toString(kind));
    }
    return {
        {"maxAttempts", maxAttempts},
        {"baseDelayMs", baseDelay.count()},
        {"maxDelayMs", maxDelay.count()},
        {"jitterFraction", jitterFraction},
        {"retryableKinds", kinds}
    };
}

RetryPolicy::RetryPolicy(RetrySpec spec, Sleeper sleeper, std::string name)
    : spec_(std::move(spec)), sleeper_(std::move(sleeper)), name_(std::move(name)),
      logger_(logging::getLogger("retry")) {
    if (!spec_.validate()) {
        throw ConfigError("invalid retry spec for '" + name_ + "'");
    }
    if (!sleeper_) {
        sleeper_ = [](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); };
    }
}

std::chrono::milliseconds RetryPolicy::backoffDelay(size_t attempt) const {
    if (attempt == 0) attempt = 1;
    double base = static_cast<double>(spec_.baseDelay.count());
    double cap = static_cast<double>(spec_.maxDelay.count());
    // Степень ограничена, чтобы не переполнить double на больших номерах попыток
    double factor = std::pow(2.0, static_cast<double>(std::min<size_t>(attempt - 1, 62)));
    double delay = std::min(base * factor, cap);
    return std::chrono::milliseconds(static_cast<long long>(delay));
}

std::chrono::milliseconds RetryPolicy::jitteredDelay(size_t attempt) const {
    auto delay = backoffDelay(attempt);
    if (spec_.jitterFraction <= 0.0) {
        return delay;
    }
    thread_local std::mt19937 generator{std::random_device{}()};
    std::uniform_real_distribution<double> distribution(1.0 - spec_.jitterFraction, 1.0 + spec_.jitterFraction);
    double scaled = static_cast<double>(delay.count()) * distribution(generator);
    return std::chrono::milliseconds(static_cast<long long>(std::max(0.0, scaled)));
}

bool RetryPolicy::isRetryable(const std::exception_ptr& error) const {
    if (!error) return false;
    try {
        std::rethrow_exception(error);
    } catch (const LoadError& e) {
        return e.retryable() && spec_.retryableKinds.count(ErrorKind::Load) > 0;
    } catch (const Error& e) {
        return spec_.retryableKinds.count(e.kind()) > 0;
    } catch (const std::exception&) {
        return spec_.retryableKinds.count(ErrorKind::Internal) > 0;
    } catch (...) {
        return false;
    }
}

} // namespace resilience
} // namespace core
} // namespace ttsserve
