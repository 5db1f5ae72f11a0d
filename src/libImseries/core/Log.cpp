#include "Log.hpp"

IMS_DISABLE_WARNINGS_PUSH
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>
IMS_DISABLE_WARNINGS_POP

#include <vector>

namespace imseries {

// Static member definition
std::shared_ptr<spdlog::logger> Log::s_Logger;

void Log::Init(const char* logFilePath, Level level) {
    // Create multi-sink logger (console + file)
    std::vector<spdlog::sink_ptr> sinks;

    // Console sink (with color support)
    auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    consoleSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    sinks.push_back(consoleSink);

    // File sink (if path provided)
    if (logFilePath && logFilePath[0] != '\0') {
        auto fileSink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(logFilePath, true);
        fileSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
        sinks.push_back(fileSink);
    }

    // Replace any logger left over from a previous Init()
    if (s_Logger) {
        spdlog::drop(s_Logger->name());
    }

    s_Logger = std::make_shared<spdlog::logger>("Imseries", sinks.begin(), sinks.end());
    s_Logger->set_level(spdlog::level::trace); // Capture all levels, filter below
    s_Logger->flush_on(spdlog::level::err);    // Auto-flush on errors

    // Register as default logger
    spdlog::register_logger(s_Logger);
    spdlog::set_default_logger(s_Logger);

    SetLevel(level);

    Debug("Imseries logger initialized");
    constexpr BuildInfo build = GetBuildInfo();
    Debug("Platform: {}, Compiler: {}, Config: {}", build.platform, build.compiler, build.config);
}

void Log::Shutdown() {
    if (s_Logger) {
        s_Logger->flush();
        spdlog::shutdown();
        s_Logger.reset();
    }
}

void Log::SetLevel(Level level) {
    spdlog::logger* logger = Get();
    if (!logger) return;

    switch (level) {
        case Level::Trace:    logger->set_level(spdlog::level::trace); break;
        case Level::Debug:    logger->set_level(spdlog::level::debug); break;
        case Level::Info:     logger->set_level(spdlog::level::info); break;
        case Level::Warn:     logger->set_level(spdlog::level::warn); break;
        case Level::Error:    logger->set_level(spdlog::level::err); break;
        case Level::Critical: logger->set_level(spdlog::level::critical); break;
        case Level::Off:      logger->set_level(spdlog::level::off); break;
    }
}

Log::Level Log::GetLevel() {
    spdlog::logger* logger = Get();
    if (!logger) return Level::Off;

    switch (logger->level()) {
        case spdlog::level::trace:    return Level::Trace;
        case spdlog::level::debug:    return Level::Debug;
        case spdlog::level::info:     return Level::Info;
        case spdlog::level::warn:     return Level::Warn;
        case spdlog::level::err:      return Level::Error;
        case spdlog::level::critical: return Level::Critical;
        default:                      return Level::Off;
    }
}

Optional<Log::Level> Log::ParseLevel(StringView name) {
    if (name == "trace")    return Level::Trace;
    if (name == "debug")    return Level::Debug;
    if (name == "info")     return Level::Info;
    if (name == "warn")     return Level::Warn;
    if (name == "error")    return Level::Error;
    if (name == "critical") return Level::Critical;
    if (name == "off")      return Level::Off;
    return std::nullopt;
}

void Log::Flush() {
    if (spdlog::logger* logger = Get()) {
        logger->flush();
    }
}

} // namespace imseries
