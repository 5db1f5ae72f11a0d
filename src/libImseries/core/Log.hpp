#pragma once

#include "Platform.hpp"
#include "Types.hpp"

IMS_DISABLE_WARNINGS_PUSH
#include <spdlog/spdlog.h>
IMS_DISABLE_WARNINGS_POP

#include <memory>

// ============================================================================
// Logging System Facade
// spdlog wrapper with multiple severity levels
// ============================================================================

namespace imseries {

/// Centralized logging system using spdlog backend
class IMS_API Log {
public:
    /// Log severity levels
    enum class Level {
        Trace,    // Verbose debugging info
        Debug,    // Per-frame and per-chunk diagnostics
        Info,     // General informational messages
        Warn,     // Warnings (non-critical issues)
        Error,    // Errors (recoverable failures)
        Critical, // Critical errors (program-terminating)
        Off       // Disable logging
    };

    /// Initialize the logging system with console and file output
    /// @param logFilePath Optional path to log file (nullptr = console only)
    /// @param level Minimum severity level to display
    static void Init(const char* logFilePath = "imseries.log", Level level = Level::Info);

    /// Shutdown the logging system (flushes buffers)
    static void Shutdown();

    /// Set the global log level at runtime
    static void SetLevel(Level level);

    /// Retrieve the current log level
    static Level GetLevel();

    /// Parse a level name ("trace", "debug", "info", "warn", "error", "critical", "off")
    static Optional<Level> ParseLevel(StringView name);

    // ========================================================================
    // Templated Logging Interface (supports fmt-style formatting)
    // ========================================================================

    template<typename... Args>
    static void Trace(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (spdlog::logger* logger = Get()) {
            logger->trace(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    static void Debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (spdlog::logger* logger = Get()) {
            logger->debug(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    static void Info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (spdlog::logger* logger = Get()) {
            logger->info(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    static void Warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (spdlog::logger* logger = Get()) {
            logger->warn(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    static void Error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (spdlog::logger* logger = Get()) {
            logger->error(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    static void Critical(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (spdlog::logger* logger = Get()) {
            logger->critical(fmt, std::forward<Args>(args)...);
        }
    }

    /// Flush all log buffers immediately
    static void Flush();

private:
    // spdlog's default logger until Init() has been called; null after Shutdown()
    static spdlog::logger* Get() {
        return s_Logger ? s_Logger.get() : spdlog::default_logger_raw();
    }

    static std::shared_ptr<spdlog::logger> s_Logger;
};

} // namespace imseries

// ============================================================================
// Convenience Macros
// ============================================================================

#define IMS_LOG_TRACE(...)    ::imseries::Log::Trace(__VA_ARGS__)
#define IMS_LOG_DEBUG(...)    ::imseries::Log::Debug(__VA_ARGS__)
#define IMS_LOG_INFO(...)     ::imseries::Log::Info(__VA_ARGS__)
#define IMS_LOG_WARN(...)     ::imseries::Log::Warn(__VA_ARGS__)
#define IMS_LOG_ERROR(...)    ::imseries::Log::Error(__VA_ARGS__)
#define IMS_LOG_CRITICAL(...) ::imseries::Log::Critical(__VA_ARGS__)
