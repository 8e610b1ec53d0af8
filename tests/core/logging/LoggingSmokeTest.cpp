#include <cassert>
#include <iostream>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <unistd.h>
#include "ttsserve/core/logging/Logging.hpp"
#include "ttsserve/core/common/Error.hpp"
#include "ttsserve/core/common/Result.hpp"

#include <spdlog/spdlog.h>

namespace fs = std::filesystem;
using namespace ttsserve::core;

void testLoggingFileSink() {
    std::cout << "Testing logging file sink...\n";

    auto dir = fs::temp_directory_path() / ("ttsserve-logs-" + std::to_string(::getpid()));
    fs::remove_all(dir);

    auto early = logging::getLogger("cache"); // Создан до initializeLogging

    logging::LoggingConfig config;
    config.level = "debug";
    config.filePath = (dir / "logs" / "ttsserve.log").string();
    assert(config.validate());
    logging::initializeLogging(config);

    auto logger = logging::getLogger("warmup");
    assert(logger == logging::getLogger("warmup"));
    assert(logger->level() == spdlog::level::debug);
    assert(early->level() == spdlog::level::debug);

    logger->info("warm-up marker {}", 42);
    early->debug("cache marker");
    logger->flush();
    early->flush();

    std::ifstream in(config.filePath);
    std::stringstream content;
    content << in.rdbuf();
    assert(content.str().find("warm-up marker 42") != std::string::npos);
    assert(content.str().find("cache marker") != std::string::npos);

    logging::LoggingConfig invalid;
    invalid.level = "loud";
    assert(!invalid.validate());
    invalid.level = "off";
    assert(invalid.validate());

    fs::remove_all(dir);
    std::cout << "[OK] logging file sink test\n";
}

void testErrorKinds() {
    std::cout << "Testing error kinds and results...\n";

    for (auto kind : {ErrorKind::Load, ErrorKind::CircuitOpen, ErrorKind::Cancelled, ErrorKind::Internal}) {
        assert(errorKindFromString(toString(kind)) == kind);
    }
    assert(!errorKindFromString("Bogus").has_value());

    auto info = ErrorInfo::fromException(std::make_exception_ptr(CircuitOpenError("voice_load")));
    assert(info.kind == ErrorKind::CircuitOpen);
    assert(info.message == "circuit breaker 'voice_load' is open");

    auto plain = ErrorInfo::fromException(std::make_exception_ptr(std::runtime_error("boom")));
    assert(plain.kind == ErrorKind::Internal);

    auto failed = Result<int>::failure(ErrorKind::Config, "bad config");
    assert(!failed.ok());
    bool thrown = false;
    try {
        failed.value();
    } catch (const Error& e) {
        thrown = e.kind() == ErrorKind::Config;
    }
    assert(thrown);
    assert(Result<int>::success(5).value() == 5);

    std::cout << "[OK] error kinds test\n";
}

int main() {
    try {
        testLoggingFileSink();
        testErrorKinds();
        std::cout << "All logging tests passed!\n";
    } catch (const std::exception& e) {
        std::cerr << "Logging test failed with exception: " << e.what() << std::endl;
        return 1;
    }
    spdlog::shutdown();
    return 0;
}
