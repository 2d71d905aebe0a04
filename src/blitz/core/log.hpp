#pragma once

// Logging for blitz using spdlog
//
// Log levels (compile-time filtered via SPDLOG_ACTIVE_LEVEL):
//   - TRACE: Very verbose, per-shot logging (every key chord, pointer move)
//   - DEBUG: Detailed debugging info (readiness polls, per-window geometry)
//   - INFO:  Normal operational messages (round boundaries, stage results)
//   - WARN:  Skipped windows, readiness shortfalls, clipboard failures
//   - ERROR: Error conditions
//
// In Release builds: TRACE and DEBUG are compiled out (zero cost)
// In Debug builds: All levels are active
//
// Usage:
//   LOG_DEBUG("Resolving window {:#x}", window_id);
//   LOG_INFO("Round {} complete, {} shots", round, shots);

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <string>

namespace blitz::log {

// Initialize logging - call once at startup
inline void init(std::string const& file_path = "/tmp/blitz.log")
{
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_level(spdlog::level::info);
    console_sink->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");

    std::vector<spdlog::sink_ptr> sinks{ console_sink };
    std::string file_error;
    try
    {
        auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(file_path, false);
        file_sink->set_level(spdlog::level::trace);
        file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%P] [%l] [%s:%#] %v");
        sinks.push_back(file_sink);
    }
    catch (spdlog::spdlog_ex const& e)
    {
        file_error = e.what();
    }

    auto logger = std::make_shared<spdlog::logger>("blitz", sinks.begin(), sinks.end());
    logger->set_level(spdlog::level::trace);
    logger->flush_on(spdlog::level::info);

    spdlog::set_default_logger(logger);

    if (!file_error.empty())
        spdlog::warn("Cannot open log file {}: {}", file_path, file_error);
}

// Shutdown logging - call at exit
inline void shutdown()
{
    spdlog::shutdown();
}

} // namespace blitz::log

#define LOG_TRACE(...) SPDLOG_TRACE(__VA_ARGS__)
#define LOG_DEBUG(...) SPDLOG_DEBUG(__VA_ARGS__)
#define LOG_INFO(...)  SPDLOG_INFO(__VA_ARGS__)
#define LOG_WARN(...)  SPDLOG_WARN(__VA_ARGS__)
#define LOG_ERROR(...) SPDLOG_ERROR(__VA_ARGS__)
#define LOG_CRITICAL(...) SPDLOG_CRITICAL(__VA_ARGS__)

// Injected key chord logging helper (trace level)
#define LOG_CHORD(window, chord) \
    SPDLOG_TRACE("Keys: window={:#x} chord={}", window, chord)
