/**
 * @file Log.cpp
 * @brief Stderr sink and level filtering.
 *
 * @version 0.1.0
 * @copyright MIT License
 */
#include "bounce/core/Log.hpp"

#include <cstdio>

namespace bounce::core {

namespace {

const char *levelName(LogLevel level)
{
    switch (level)
    {
        case LogLevel::kDebug: return "debug";
        case LogLevel::kInfo:  return "info";
        case LogLevel::kWarn:  return "warn";
        case LogLevel::kError: return "error";
    }
    return "?";
}

class StderrLogger final : public ILogger {
public:
    void write(LogLevel level, std::string_view tag, std::string_view message) override
    {
        std::fprintf(stderr, "%-5s %.*s: %.*s\n", levelName(level),
                     static_cast<int>(tag.size()), tag.data(),
                     static_cast<int>(message.size()), message.data());
    }
};

StderrLogger gStderr;
ILogger     *gSink     = &gStderr;
LogLevel     gMinLevel = LogLevel::kInfo;

void emit(LogLevel level, std::string_view tag, std::string_view msg)
{
    if (level >= gMinLevel)
        gSink->write(level, tag, msg);
}

} // namespace

void Log::setLogger(ILogger *logger)  { gSink = logger ? logger : &gStderr; }
void Log::setMinLevel(LogLevel level) { gMinLevel = level; }
LogLevel Log::minLevel()              { return gMinLevel; }
bool Log::isEnabled(LogLevel level)   { return level >= gMinLevel; }

void Log::debug(std::string_view tag, std::string_view msg) { emit(LogLevel::kDebug, tag, msg); }
void Log::info (std::string_view tag, std::string_view msg) { emit(LogLevel::kInfo,  tag, msg); }
void Log::warn (std::string_view tag, std::string_view msg) { emit(LogLevel::kWarn,  tag, msg); }
void Log::error(std::string_view tag, std::string_view msg) { emit(LogLevel::kError, tag, msg); }

} // namespace bounce::core
