/**
 * @file Log.cpp
 * @brief Default ILogger writing timestamped lines to stderr.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#include "bpb/core/Log.hpp"

#include <chrono>
#include <cstdio>

namespace bpb::core {

namespace {

constexpr std::string_view kLevelNames[] = {
    "DEBUG", "INFO ", "WARN ", "ERROR", "FATAL"
};

class StderrLogger final : public ILogger {
public:
    StderrLogger() : _start(std::chrono::steady_clock::now()) {}

    void write(LogLevel level, std::string_view tag, std::string_view message) override
    {
        const auto elapsed = std::chrono::duration<double>(
            std::chrono::steady_clock::now() - _start).count();
        const auto name = logLevelName(level);
        std::fprintf(
            stderr,
            "[%9.3f][%.*s][%.*s] %.*s\n",
            elapsed,
            static_cast<int>(name.size()), name.data(),
            static_cast<int>(tag.size()), tag.data(),
            static_cast<int>(message.size()), message.data()
        );
    }

private:
    std::chrono::steady_clock::time_point _start;
};

StderrLogger  gDefaultLogger;
ILogger      *gActiveLogger  = &gDefaultLogger;
LogLevel      gMinLevel      = LogLevel::kInfo;

void dispatch(LogLevel level, std::string_view tag, std::string_view msg)
{
    if (level < gMinLevel)
        return;
    gActiveLogger->write(level, tag, msg);
}

} // anonymous namespace

std::string_view logLevelName(LogLevel level) noexcept
{
    const auto idx = static_cast<unsigned>(level);
    return idx < std::size(kLevelNames) ? kLevelNames[idx] : "?????";
}

std::optional<LogLevel> parseLogLevel(std::string_view text) noexcept
{
    if (text == "debug") return LogLevel::kDebug;
    if (text == "info")  return LogLevel::kInfo;
    if (text == "warn")  return LogLevel::kWarn;
    if (text == "error") return LogLevel::kError;
    if (text == "fatal") return LogLevel::kFatal;
    return std::nullopt;
}

void Log::setLogger(ILogger *logger)  { gActiveLogger = logger ? logger : &gDefaultLogger; }
void Log::setMinLevel(LogLevel level) { gMinLevel = level; }
LogLevel Log::minLevel()              { return gMinLevel; }

void Log::debug(std::string_view tag, std::string_view msg) { dispatch(LogLevel::kDebug, tag, msg); }
void Log::info (std::string_view tag, std::string_view msg) { dispatch(LogLevel::kInfo,  tag, msg); }
void Log::warn (std::string_view tag, std::string_view msg) { dispatch(LogLevel::kWarn,  tag, msg); }
void Log::error(std::string_view tag, std::string_view msg) { dispatch(LogLevel::kError, tag, msg); }
void Log::fatal(std::string_view tag, std::string_view msg) { dispatch(LogLevel::kFatal, tag, msg); }

} // namespace bpb::core
