// File: src/core/Logger.cpp
#include "../../include/core/Logger.hpp"

#include <mutex>
#include <vector>

namespace SimLink::Logging {

    std::shared_ptr<spdlog::logger> Logger::coreLogger;

    namespace {
        // Serializes Init and the lazy first-use creation across threads.
        std::mutex& LoggerMutex() {
            static std::mutex mutex;
            return mutex;
        }
    }

    void Logger::Init() {
        Init(LogSettings{});
    }

    void Logger::Init(const LogSettings& settings) {
        std::lock_guard<std::mutex> lock(LoggerMutex());
        InitLocked(settings);
    }

    void Logger::InitLocked(const LogSettings& settings) {
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_pattern("[%H:%M:%S] [%^%l%$] %n: %v");

        std::vector<spdlog::sink_ptr> sinks{ console_sink };
        if (!settings.filePath.empty()) {
            auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(settings.filePath, true);
            file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
            sinks.push_back(file_sink);
        }

        if (coreLogger) {
            spdlog::drop(coreLogger->name());
        }
        coreLogger = std::make_shared<spdlog::logger>("SimLink", sinks.begin(), sinks.end());
        coreLogger->set_level(settings.level);
        coreLogger->flush_on(spdlog::level::warn);
        spdlog::register_logger(coreLogger);
    }

    std::shared_ptr<spdlog::logger> Logger::GetCoreLogger() {
        std::lock_guard<std::mutex> lock(LoggerMutex());
        if (!coreLogger) {
            InitLocked(LogSettings{});
        }
        return coreLogger;
    }

}
