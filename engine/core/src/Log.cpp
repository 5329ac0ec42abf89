#include "tarmac/core/Log.h"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <mutex>
#include <vector>

namespace tarmac {

std::shared_ptr<spdlog::logger> Log::s_CoreLogger;

static std::mutex s_InitMutex;
static std::once_flag s_LazyInitFlag;

void Log::Init(spdlog::level::level_enum level, const std::string& logFile) {
    std::lock_guard<std::mutex> lock(s_InitMutex);
    spdlog::drop("TARMAC");
    s_CoreLogger.reset();

    std::vector<spdlog::sink_ptr> sinks;

    auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    consoleSink->set_pattern("%^[%T] [%n] %v%$");
    sinks.push_back(consoleSink);

    bool fileFailed = false;
    if (!logFile.empty()) {
        try {
            auto fileSink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(logFile, true);
            fileSink->set_pattern("[%T] [%l] [%n] %v");
            sinks.push_back(fileSink);
        } catch (const spdlog::spdlog_ex&) {
            fileFailed = true;
        }
    }

    s_CoreLogger = std::make_shared<spdlog::logger>("TARMAC", sinks.begin(), sinks.end());
    spdlog::register_logger(s_CoreLogger);
    s_CoreLogger->set_level(level);
    s_CoreLogger->flush_on(spdlog::level::warn);

    // Not through the macros: they re-enter GetCoreLogger while the lock is held
    if (fileFailed) {
        s_CoreLogger->warn("Could not open log file '{}', logging to console only", logFile);
    }
    s_CoreLogger->debug("Logging initialized");
}

void Log::SetLevel(spdlog::level::level_enum level) {
    GetCoreLogger()->set_level(level);
}

std::shared_ptr<spdlog::logger>& Log::GetCoreLogger() {
    // Bake workers may be the first callers
    std::call_once(s_LazyInitFlag, [] {
        bool initialized = false;
        {
            std::lock_guard<std::mutex> lock(s_InitMutex);
            initialized = s_CoreLogger != nullptr;
        }
        if (!initialized) {
            Init();
        }
    });
    return s_CoreLogger;
}

} // namespace tarmac
