/**
 * @file Log.cpp
 * @brief Default ILogger implementation writing to stderr.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-17
 * @copyright MIT License
 */
#include "ltr/core/Log.hpp"

#include <atomic>
#include <chrono>
#include <cstdio>
#include <mutex>

namespace ltr::core {

namespace {

class StderrLogger final : public ILogger {
public:
    void write(LogLevel level, std::string_view tag, std::string_view message) override
    {
        const auto elapsed = std::chrono::duration<double>(Clock::now() - _origin).count();
        const auto name = toString(level);
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
    TimePoint _origin{Clock::now()};
};

StderrLogger           gDefaultLogger;
ILogger               *gActiveLogger  = &gDefaultLogger;
std::atomic<LogLevel>  gMinLevel{LogLevel::kInfo};
std::mutex             gDispatchMutex;

} // anonymous namespace

std::string_view toString(LogLevel level) noexcept
{
    switch (level)
    {
    case LogLevel::kDebug: return "DEBUG";
    case LogLevel::kInfo:  return "INFO ";
    case LogLevel::kWarn:  return "WARN ";
    case LogLevel::kError: return "ERROR";
    case LogLevel::kFatal: return "FATAL";
    }
    return "?????";
}

void Log::setLogger(ILogger *logger)
{
    std::lock_guard<std::mutex> lock{gDispatchMutex};
    gActiveLogger = logger ? logger : &gDefaultLogger;
}

void Log::setMinLevel(LogLevel level) { gMinLevel.store(level, std::memory_order_relaxed); }

LogLevel Log::minLevel() { return gMinLevel.load(std::memory_order_relaxed); }

static void dispatch(LogLevel level, std::string_view tag, std::string_view msg)
{
    if (level < gMinLevel.load(std::memory_order_relaxed))
        return;
    std::lock_guard<std::mutex> lock{gDispatchMutex};
    gActiveLogger->write(level, tag, msg);
}

void Log::debug(std::string_view tag, std::string_view msg) { dispatch(LogLevel::kDebug, tag, msg); }
void Log::info (std::string_view tag, std::string_view msg) { dispatch(LogLevel::kInfo,  tag, msg); }
void Log::warn (std::string_view tag, std::string_view msg) { dispatch(LogLevel::kWarn,  tag, msg); }
void Log::error(std::string_view tag, std::string_view msg) { dispatch(LogLevel::kError, tag, msg); }
void Log::fatal(std::string_view tag, std::string_view msg) { dispatch(LogLevel::kFatal, tag, msg); }

} // namespace ltr::core
