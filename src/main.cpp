#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <spdlog/spdlog.h>

#include "ttsserve/core/common/Error.hpp"
#include "ttsserve/core/config/ServiceConfig.hpp"
#include "ttsserve/core/logging/Logging.hpp"
#include "ttsserve/core/service/ServiceContext.hpp"

using namespace ttsserve::core;

// Флаг работы сервиса; меняется только обработчиком сигналов
std::atomic<bool> g_running{true};

void signalHandler(int) {
    g_running = false;
}

// Загрузка конфигурации: путь из argv[1], иначе значения по умолчанию
config::ServiceConfig loadConfiguration(int argc, char* argv[]) {
    if (argc > 1) {
        return config::ServiceConfig::loadFromFile(argv[1]);
    }
    return config::ServiceConfig::defaults();
}

// Основной цикл: периодические проверки здоровья, статус, экспорт метрик
void runServiceLoop(service::ServiceContext& context) {
    auto logger = logging::getLogger("service");
    const auto& config = context.config();
    auto lastHealthRun = std::chrono::steady_clock::now();
    auto lastStatus = lastHealthRun;
    auto lastExport = lastHealthRun;
    logger->info("Starting service loop...");
    while (g_running) {
        try {
            auto now = std::chrono::steady_clock::now();
            if (now - lastHealthRun >= config.health.interval) {
                auto results = context.healthRegistry()->runAll();
                auto status = context.healthRegistry()->status();
                if (!status.overall) {
                    logger->warn("[loop] Health degraded: {}", status.toJson().dump());
                }
                lastHealthRun = now;
            }
            if (now - lastStatus >= config.statusInterval) {
                logger->info("[loop] Status: {}", context.statusJson().dump());
                lastStatus = now;
            }
            if (!config.monitor.exportPath.empty() && now - lastExport >= config.monitor.exportInterval) {
                if (!context.monitor()->exportMetrics(config.monitor.exportPath)) {
                    logger->warn("[loop] Metrics export to {} failed", config.monitor.exportPath);
                }
                lastExport = now;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        } catch (const std::exception& e) {
            logger->error("Error in service loop: {}", e.what());
            std::this_thread::sleep_for(std::chrono::seconds(1));
        }
    }
    logger->info("Service loop stopped");
}

int main(int argc, char* argv[]) {
    try {
        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);

        auto config = loadConfiguration(argc, argv);
        logging::initializeLogging(config.logging);
        spdlog::info("=== ttsserve starting ===");

        auto context = service::ServiceContext::create(config);
        if (!context->start()) {
            spdlog::critical("Failed to start service components");
            return 1;
        }

        runServiceLoop(*context);

        spdlog::info("Initiating graceful shutdown...");
        context->stop(cache::StopMode::Cancel);
        spdlog::info("=== ttsserve shutdown complete ===");
        spdlog::shutdown();
        return 0;
    } catch (const ConfigError& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        spdlog::critical("Fatal error: {}", e.what());
        return 1;
    }
}
