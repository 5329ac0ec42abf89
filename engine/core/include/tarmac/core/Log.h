#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/fmt/ostr.h>
#include <memory>
#include <string>

namespace tarmac {

class Log {
public:
    // Console sink always, file sink when logFile is non-empty.
    static void Init(spdlog::level::level_enum level = spdlog::level::info, const std::string& logFile = "");

    static void SetLevel(spdlog::level::level_enum level);

    // Initialises with defaults on first use so library code can log before the host calls Init().
    // Safe to call from several threads; a host Init() must happen before workers start.
    static std::shared_ptr<spdlog::logger>& GetCoreLogger();

private:
    static std::shared_ptr<spdlog::logger> s_CoreLogger;
};

} // namespace tarmac

// Core logging macros
#define TARMAC_CORE_TRACE(...)    ::tarmac::Log::GetCoreLogger()->trace(__VA_ARGS__)
#define TARMAC_CORE_DEBUG(...)    ::tarmac::Log::GetCoreLogger()->debug(__VA_ARGS__)
#define TARMAC_CORE_INFO(...)     ::tarmac::Log::GetCoreLogger()->info(__VA_ARGS__)
#define TARMAC_CORE_WARN(...)     ::tarmac::Log::GetCoreLogger()->warn(__VA_ARGS__)
#define TARMAC_CORE_ERROR(...)    ::tarmac::Log::GetCoreLogger()->error(__VA_ARGS__)
#define TARMAC_CORE_CRITICAL(...) ::tarmac::Log::GetCoreLogger()->critical(__VA_ARGS__)
