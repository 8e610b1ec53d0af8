#include "ttsserve/core/logging/Logging.hpp"
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <filesystem>
#include <iostream>
#include <mutex>
#include <vector>

namespace ttsserve {
namespace core {
namespace logging {

namespace {

struct SinkState {
    std::mutex mutex;
    std::vector<spdlog::sink_ptr> sinks;
    spdlog::level::level_enum level = spdlog::level::info;
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v";
};

SinkState& sinkState() {
    static SinkState state;
    return state;
}

// Sinks по умолчанию: только консоль
void ensureDefaultSinks(SinkState& state) {
    if (!state.sinks.empty()) return;
    auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console->set_pattern(state.pattern);
    state.sinks.push_back(console);
}

} // namespace

void initializeLogging(const LoggingConfig& config) {
    auto& state = sinkState();
    std::lock_guard<std::mutex> lock(state.mutex);
    try {
        state.sinks.clear();
        state.pattern = config.pattern;
        state.level = spdlog::level::from_str(config.level);

        auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console->set_pattern(config.pattern);
        state.sinks.push_back(console);

        if (!config.filePath.empty()) {
            std::filesystem::path logPath(config.filePath);
            if (logPath.has_parent_path()) {
                std::filesystem::create_directories(logPath.parent_path());
            }
            auto rotating = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                config.filePath, config.maxFileSize, config.maxFiles);
            rotating->set_pattern(config.pattern);
            state.sinks.push_back(rotating);
        }

        // Переназначаем sinks уже созданным логгерам
        spdlog::apply_all([&state](std::shared_ptr<spdlog::logger> logger) {
            logger->sinks() = state.sinks;
            logger->set_level(state.level);
        });

        auto service = std::make_shared<spdlog::logger>("service", state.sinks.begin(), state.sinks.end());
        service->set_level(state.level);
        spdlog::drop("service");
        spdlog::register_logger(service);
        spdlog::set_default_logger(service);
        spdlog::set_level(state.level);
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize logging: " << e.what() << std::endl;
        ensureDefaultSinks(state);
    }
}

std::shared_ptr<spdlog::logger> getLogger(const std::string& name) {
    if (auto existing = spdlog::get(name)) {
        return existing;
    }
    auto& state = sinkState();
    std::lock_guard<std::mutex> lock(state.mutex);
    if (auto existing = spdlog::get(name)) {
        return existing;
    }
    try {
        ensureDefaultSinks(state);
        auto logger = std::make_shared<spdlog::logger>(name, state.sinks.begin(), state.sinks.end());
        logger->set_level(state.level);
        spdlog::register_logger(logger);
        return logger;
    } catch (const spdlog::spdlog_ex& e) {
        std::cerr << "Logger '" << name << "' initialization failed: " << e.what() << std::endl;
        return spdlog::default_logger();
    }
}

} // namespace logging
} // namespace core
} // namespace ttsserve
