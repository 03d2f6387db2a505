#pragma once

#include <cstdarg>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace winusb {

enum class LogLevel : int {
    Debug = 0,
    Info  = 1,
    Warn  = 2,
    Error = 3,
    None  = 4,
};

// Accepts "debug", "info", "warn", "error", "none".
std::optional<LogLevel> ParseLogLevel(std::string_view name);

class Logger {
public:
    static Logger& Instance();

    void SetLevel(LogLevel lvl);
    LogLevel Level() const;

    // printf-style logging
    void Log(LogLevel lvl, const char* fmt, ...) __attribute__((format(printf, 3, 4)));
    void VLog(LogLevel lvl, const char* fmt, va_list ap);
    void LogWithSource(LogLevel lvl,
                       const char* file,
                       int line,
                       const char* fmt,
                       ...) __attribute__((format(printf, 5, 6)));
    void VLogWithSource(LogLevel lvl,
                        const char* file,
                        int line,
                        const char* fmt,
                        va_list ap);

    // Console renderers take this lock so redraws never interleave with log lines.
    std::mutex& OutputMutex();

private:
    Logger() = default;
};

#define LogDebug(...) ::winusb::Logger::Instance().LogWithSource(::winusb::LogLevel::Debug, __FILE__, __LINE__, __VA_ARGS__)
#define LogInfo(...)  ::winusb::Logger::Instance().LogWithSource(::winusb::LogLevel::Info,  __FILE__, __LINE__, __VA_ARGS__)
#define LogWarn(...)  ::winusb::Logger::Instance().LogWithSource(::winusb::LogLevel::Warn,  __FILE__, __LINE__, __VA_ARGS__)
#define LogError(...) ::winusb::Logger::Instance().LogWithSource(::winusb::LogLevel::Error, __FILE__, __LINE__, __VA_ARGS__)

} // namespace winusb
