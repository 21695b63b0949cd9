#include "engine/Log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>

#include <vector>

namespace spectral {

std::shared_ptr<spdlog::logger> Log::s_engineLogger;
std::shared_ptr<spdlog::logger> Log::s_diagLogger;

void Log::init(const std::string& logFile, const std::string& level) {
    std::vector<spdlog::sink_ptr> sinks;

    auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    consoleSink->set_pattern("[%H:%M:%S] [%n] [%^%l%$] %v");
    sinks.push_back(consoleSink);

    if (!logFile.empty()) {
        auto fileSink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(logFile, true);
        fileSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v");
        sinks.push_back(fileSink);
    }

    s_engineLogger = std::make_shared<spdlog::logger>("ENGINE", sinks.begin(), sinks.end());
    s_diagLogger = std::make_shared<spdlog::logger>("DIAG", sinks.begin(), sinks.end());

    // Set log level
    auto spdLevel = spdlog::level::debug;
    if (level == "trace")    spdLevel = spdlog::level::trace;
    else if (level == "debug")    spdLevel = spdlog::level::debug;
    else if (level == "info")     spdLevel = spdlog::level::info;
    else if (level == "warn")     spdLevel = spdlog::level::warn;
    else if (level == "error")    spdLevel = spdlog::level::err;
    else if (level == "critical") spdLevel = spdlog::level::critical;
    else if (level == "off")      spdLevel = spdlog::level::off;

    s_engineLogger->set_level(spdLevel);
    s_diagLogger->set_level(spdLevel);

    // Re-initialising replaces any logger registered under the same name
    spdlog::drop("ENGINE");
    spdlog::drop("DIAG");
    spdlog::register_logger(s_engineLogger);
    spdlog::register_logger(s_diagLogger);
}

void Log::shutdown() {
    s_engineLogger.reset();
    s_diagLogger.reset();
    spdlog::shutdown();
}

std::shared_ptr<spdlog::logger>& Log::getEngineLogger() {
    if (!s_engineLogger) {
        init();
    }
    return s_engineLogger;
}

std::shared_ptr<spdlog::logger>& Log::getDiagLogger() {
    if (!s_diagLogger) {
        init();
    }
    return s_diagLogger;
}

} // namespace spectral
