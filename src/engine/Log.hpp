#pragma once

#include <memory>
#include <string>
#include <spdlog/spdlog.h>

namespace spectral {

class Log {
public:
    static void init(const std::string& logFile = "", const std::string& level = "debug");
    static void shutdown();

    /// Loggers are created with console output on first access if init()
    /// has not run yet.
    static std::shared_ptr<spdlog::logger>& getEngineLogger();
    static std::shared_ptr<spdlog::logger>& getDiagLogger();

private:
    static std::shared_ptr<spdlog::logger> s_engineLogger;
    static std::shared_ptr<spdlog::logger> s_diagLogger;
};

} // namespace spectral

// Engine logging macros
#define LOG_TRACE(...)    ::spectral::Log::getEngineLogger()->trace(__VA_ARGS__)
#define LOG_DEBUG(...)    ::spectral::Log::getEngineLogger()->debug(__VA_ARGS__)
#define LOG_INFO(...)     ::spectral::Log::getEngineLogger()->info(__VA_ARGS__)
#define LOG_WARN(...)     ::spectral::Log::getEngineLogger()->warn(__VA_ARGS__)
#define LOG_ERROR(...)    ::spectral::Log::getEngineLogger()->error(__VA_ARGS__)
#define LOG_CRITICAL(...) ::spectral::Log::getEngineLogger()->critical(__VA_ARGS__)

// Diagnostics logging macros (pool/reference repair, spawn watchdog)
#define DIAG_LOG_TRACE(...)    ::spectral::Log::getDiagLogger()->trace(__VA_ARGS__)
#define DIAG_LOG_DEBUG(...)    ::spectral::Log::getDiagLogger()->debug(__VA_ARGS__)
#define DIAG_LOG_INFO(...)     ::spectral::Log::getDiagLogger()->info(__VA_ARGS__)
#define DIAG_LOG_WARN(...)     ::spectral::Log::getDiagLogger()->warn(__VA_ARGS__)
#define DIAG_LOG_ERROR(...)    ::spectral::Log::getDiagLogger()->error(__VA_ARGS__)
#define DIAG_LOG_CRITICAL(...) ::spectral::Log::getDiagLogger()->critical(__VA_ARGS__)
