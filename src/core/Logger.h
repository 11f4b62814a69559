#pragma once

#include "core/SPSCQueue.h"

#include <juce_core/juce_core.h>

#include <atomic>
#include <chrono>
#include <cstdarg>
#include <cstdio>

namespace klang {

enum class LogLevel : int { off = 0, warn = 1, info = 2, debug = 3, trace = 4 };

struct LogEntry {
    char message[256];
    int level;
};

class Logger {
public:
    static void setLevel(LogLevel level);
    static LogLevel getLevel();
    static bool isEnabled(LogLevel level) { return getLevel() >= level && level != LogLevel::off; }

    // Control side: formats and emits immediately.
    static void log(LogLevel level, const char* file, int line, const char* fmt, ...);

    // Cycle side: formats into a ring, emitted later by drain(). Callers on
    // different cycle threads (one engine each) are serialized by a spin lock
    // held only for the push. Entries are dropped when the ring is full.
    // vsnprintf does not allocate for %d, %s, %x, %p on the platforms we
    // target; keep %f off hot paths.
    static void logRT(LogLevel level, const char* file, int line, const char* fmt, ...);

    // Emits every pending cycle-side entry. Control side only; concurrent
    // drains from several control threads take turns.
    static int drain();

    // Number of cycle-side entries dropped since the last resetDropCount().
    static int getDropCount();
    static void resetDropCount();

    using LogCallback = void(*)(int level, const char* message, void* userData);
    static void setCallback(LogCallback callback, void* userData);

private:
    static void emit(int level, const char* message);
    static long elapsedMs();

    static constexpr int kRingCapacity = 1024;

    static std::atomic<int> level_;
    static std::atomic<int> dropped_;
    static SPSCQueue<LogEntry, kRingCapacity> ring_;
    static juce::SpinLock pushLock_;
    static juce::CriticalSection drainLock_;
    static std::chrono::steady_clock::time_point startTime_;
    static LogCallback callback_;
    static void* callbackUserData_;
};

} // namespace klang

// --- Macros ---

#define KL_LOG_AT(lvl, fn, fmt, ...) \
    do { if (klang::Logger::isEnabled(lvl)) \
        klang::Logger::fn(lvl, __FILE__, __LINE__, fmt, ##__VA_ARGS__); } while(0)

#define KL_WARN(fmt, ...)     KL_LOG_AT(klang::LogLevel::warn,  log,   fmt, ##__VA_ARGS__)
#define KL_WARN_RT(fmt, ...)  KL_LOG_AT(klang::LogLevel::warn,  logRT, fmt, ##__VA_ARGS__)
#define KL_INFO(fmt, ...)     KL_LOG_AT(klang::LogLevel::info,  log,   fmt, ##__VA_ARGS__)
#define KL_INFO_RT(fmt, ...)  KL_LOG_AT(klang::LogLevel::info,  logRT, fmt, ##__VA_ARGS__)
#define KL_DEBUG(fmt, ...)    KL_LOG_AT(klang::LogLevel::debug, log,   fmt, ##__VA_ARGS__)
#define KL_DEBUG_RT(fmt, ...) KL_LOG_AT(klang::LogLevel::debug, logRT, fmt, ##__VA_ARGS__)
#define KL_TRACE(fmt, ...)    KL_LOG_AT(klang::LogLevel::trace, log,   fmt, ##__VA_ARGS__)
#define KL_TRACE_RT(fmt, ...) KL_LOG_AT(klang::LogLevel::trace, logRT, fmt, ##__VA_ARGS__)
