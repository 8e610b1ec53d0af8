#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <spdlog/spdlog.h>

namespace ttsserve {
namespace core {
namespace logging {

// LoggingConfig — параметры логирования (уровень, файл, ротация)
struct LoggingConfig {
    std::string level = "info";                 // trace/debug/info/warn/error/critical/off
    std::string filePath;                        // Пусто = только консоль
    size_t maxFileSize = 1024 * 1024 * 5;        // 5MB
    size_t maxFiles = 2;                         // Кол-во ротируемых файлов
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v";
    bool validate() const {
        if (maxFileSize == 0 || maxFiles == 0) return false;
        return level == "off" || spdlog::level::from_str(level) != spdlog::level::off;
    }
};

// Установить общие sinks и уровень; вызывается один раз при старте
void initializeLogging(const LoggingConfig& config);

// Именованный логгер компонента; создаётся при первом обращении
std::shared_ptr<spdlog::logger> getLogger(const std::string& name);

} // namespace logging
} // namespace core
} // namespace ttsserve
