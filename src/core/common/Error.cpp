#include "ttsserve/core/common/Error.hpp"

namespace ttsserve {
namespace core {

const char* toString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Load: return "LoadError";
        case ErrorKind::CircuitOpen: return "CircuitOpenError";
        case ErrorKind::RetryExhausted: return "RetryExhaustedError";
        case ErrorKind::Reload: return "ReloadError";
        case ErrorKind::HealthCheckTimeout: return "HealthCheckTimeout";
        case ErrorKind::DegradationPassthrough: return "DegradationPassthroughError";
        case ErrorKind::Cancelled: return "CancelledError";
        case ErrorKind::Config: return "ConfigError";
        case ErrorKind::UnknownCache: return "UnknownCacheError";
        case ErrorKind::Internal: return "InternalError";
    }
    return "InternalError";
}

std::optional<ErrorKind> errorKindFromString(const std::string& name) {
    static const ErrorKind kinds[] = {
        ErrorKind::Load, ErrorKind::CircuitOpen, ErrorKind::RetryExhausted, ErrorKind::Reload,
        ErrorKind::HealthCheckTimeout, ErrorKind::DegradationPassthrough, ErrorKind::Cancelled,
        ErrorKind::Config, ErrorKind::UnknownCache, ErrorKind::Internal
    };
    for (auto kind : kinds) {
        if (name == toString(kind)) return kind;
    }
    return std::nullopt;
}

std::string describeException(const std::exception_ptr& error) {
    if (!error) {
        return "no error";
    }
    try {
        std::rethrow_exception(error);
    } catch (const std::exception& e) {
        return e.what();
    } catch (...) {
        return "unknown exception";
    }
}

} // namespace core
} // namespace ttsserve
