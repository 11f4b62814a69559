#include "core/Logger.h"

namespace klang {

std::atomic<int> Logger::level_{static_cast<int>(LogLevel::warn)};
std::atomic<int> Logger::dropped_{0};
SPSCQueue<LogEntry, Logger::kRingCapacity> Logger::ring_;
juce::SpinLock Logger::pushLock_;
juce::CriticalSection Logger::drainLock_;
std::chrono::steady_clock::time_point Logger::startTime_ = std::chrono::steady_clock::now();
Logger::LogCallback Logger::callback_ = nullptr;
void* Logger::callbackUserData_ = nullptr;

static const char* baseName(const char* path)
{
    const char* last = path;
    for (const char* p = path; *p; ++p)
    {
        if (*p == '/' || *p == '\\')
            last = p + 1;
    }
    return last;
}

static const char* levelTag(LogLevel level)
{
    switch (level)
    {
        case LogLevel::warn:  return "warn";
        case LogLevel::info:  return "info";
        case LogLevel::debug: return "debug";
        case LogLevel::trace: return "trace";
        case LogLevel::off:   break;
    }
    return "???";
}

long Logger::elapsedMs()
{
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - startTime_);
    return static_cast<long>(ms.count());
}

void Logger::setLevel(LogLevel level)
{
    level_.store(static_cast<int>(level), std::memory_order_relaxed);
}

LogLevel Logger::getLevel()
{
    return static_cast<LogLevel>(level_.load(std::memory_order_relaxed));
}

void Logger::emit(int level, const char* message)
{
    if (callback_)
        callback_(level, message, callbackUserData_);
    else
        std::fprintf(stderr, "%s\n", message);
}

void Logger::log(LogLevel level, const char* file, int line, const char* fmt, ...)
{
    char userMsg[200];
    va_list args;
    va_start(args, fmt);
    std::vsnprintf(userMsg, sizeof(userMsg), fmt, args);
    va_end(args);

    char fullMsg[256];
    std::snprintf(fullMsg, sizeof(fullMsg), "[%06ld][CT][%s] %s:%d %s",
                  elapsedMs(), levelTag(level), baseName(file), line, userMsg);
    emit(static_cast<int>(level), fullMsg);
}

void Logger::logRT(LogLevel level, const char* file, int line, const char* fmt, ...)
{
    LogEntry entry;
    char userMsg[200];
    va_list args;
    va_start(args, fmt);
    std::vsnprintf(userMsg, sizeof(userMsg), fmt, args);
    va_end(args);

    std::snprintf(entry.message, sizeof(entry.message), "[%06ld][RT][%s] %s:%d %s",
                  elapsedMs(), levelTag(level), baseName(file), line, userMsg);
    entry.level = static_cast<int>(level);

    const juce::SpinLock::ScopedLockType sl(pushLock_);
    if (!ring_.tryPush(entry))
        dropped_.fetch_add(1, std::memory_order_relaxed);
}

int Logger::drain()
{
    const juce::ScopedLock sl(drainLock_);
    return ring_.drain([](const LogEntry& entry) { emit(entry.level, entry.message); });
}

int Logger::getDropCount()
{
    return dropped_.load(std::memory_order_relaxed);
}

void Logger::resetDropCount()
{
    dropped_.store(0, std::memory_order_relaxed);
}

void Logger::setCallback(LogCallback callback, void* userData)
{
    callback_ = callback;
    callbackUserData_ = userData;
}

} // namespace klang
