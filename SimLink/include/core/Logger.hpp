// File: Logger.hpp
#pragma once
#include <memory>
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace SimLink::Logging {

    struct LogSettings {
        spdlog::level::level_enum level{ spdlog::level::info };
        std::string filePath;  // empty: console only
    };

    class Logger {
    public:
        static void Init();
        static void Init(const LogSettings& settings);

        // Creates a console-only logger on first use if Init() was never called. Thread-safe.
        static std::shared_ptr<spdlog::logger> GetCoreLogger();

    private:
        static void InitLocked(const LogSettings& settings);

        static std::shared_ptr<spdlog::logger> coreLogger;
    };

    // Convenience macros
#define SL_NETWORK_TRACE(...)    ::SimLink::Logging::Logger::GetCoreLogger()->trace(__VA_ARGS__)
#define SL_NETWORK_DEBUG(...)    ::SimLink::Logging::Logger::GetCoreLogger()->debug(__VA_ARGS__)
#define SL_NETWORK_INFO(...)     ::SimLink::Logging::Logger::GetCoreLogger()->info(__VA_ARGS__)
#define SL_NETWORK_WARN(...)     ::SimLink::Logging::Logger::GetCoreLogger()->warn(__VA_ARGS__)
#define SL_NETWORK_ERROR(...)    ::SimLink::Logging::Logger::GetCoreLogger()->error(__VA_ARGS__)
#define SL_NETWORK_CRITICAL(...) ::SimLink::Logging::Logger::GetCoreLogger()->critical(__VA_ARGS__)

}
