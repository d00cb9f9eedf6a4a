/**
 * @file Log.cpp
 * @brief Formatting and queueing of log entries.
 */
#include "Core/Log.h"
#include <atomic>
#include <stdio.h>
#include <string.h>

namespace {

std::atomic<const LogHubService*> gHub{nullptr};
std::atomic<uint8_t> gMinLevel{(uint8_t)LogLevel::Debug};

}  // namespace

void Log::setHub(const LogHubService* hub) { gHub.store(hub); }

void Log::setMinLevel(LogLevel lvl) { gMinLevel.store((uint8_t)lvl, std::memory_order_relaxed); }

LogLevel Log::minLevel() { return (LogLevel)gMinLevel.load(std::memory_order_relaxed); }

void Log::write(LogLevel lvl, const char* tag, const char* fmt, va_list ap)
{
    const LogHubService* hub = gHub.load();
    if (!hub || !fmt || (uint8_t)lvl < gMinLevel.load(std::memory_order_relaxed)) return;

    LogEntry e;
    e.ts_ms = millis();
    e.lvl = lvl;
    snprintf(e.tag, sizeof(e.tag), "%s", tag ? tag : "-");
    vsnprintf(e.msg, sizeof(e.msg), fmt, ap);
    // A full queue is counted by the hub.
    (void)hub->enqueue(hub->ctx, e);
}

#define THERMIO_LOG_LEVEL_FN(NAME, LEVEL)                   \
    void Log::NAME(const char* tag, const char* fmt, ...)   \
    {                                                       \
        va_list ap;                                         \
        va_start(ap, fmt);                                  \
        write(LEVEL, tag, fmt, ap);                         \
        va_end(ap);                                         \
    }

THERMIO_LOG_LEVEL_FN(debug, LogLevel::Debug)
THERMIO_LOG_LEVEL_FN(info, LogLevel::Info)
THERMIO_LOG_LEVEL_FN(warn, LogLevel::Warn)
THERMIO_LOG_LEVEL_FN(error, LogLevel::Error)

#undef THERMIO_LOG_LEVEL_FN

int Log::formatChecked(const char* tag, const char* file, int line,
                       char* out, size_t len, const char* fmt, ...)
{
    va_list ap;
    va_start(ap, fmt);
    const int n = vsnprintf(out, len, fmt, ap);
    va_end(ap);
    if (n < 0 || (size_t)n >= len) {
        warn(tag, "text cut at %s:%d (%d > %u)", file ? file : "?", line, n, (unsigned)len);
    }
    return n;
}
