#pragma once
/**
 * @file ILogger.h
 * @brief Log records and the `loghub` service.
 */
#include <stdint.h>
#include <stddef.h>
#include <Arduino.h>

enum class LogLevel : uint8_t { Debug, Info, Warn, Error };

constexpr size_t LOG_TAG_MAX = 10;
constexpr size_t LOG_MSG_MAX = 128;

/** @brief One formatted line, copied by value through the hub queue. */
struct LogEntry {
    uint32_t ts_ms;           ///< millis() when produced
    LogLevel lvl;
    char tag[LOG_TAG_MAX];
    char msg[LOG_MSG_MAX];
};

/** @brief An output for log entries. write() runs on the dispatcher task. */
struct LogSinkService {
    void (*write)(void* ctx, const LogEntry& e);
    void* ctx;
    const char* name;
    LogLevel minLevel;
};

/** @brief `loghub` service: producers enqueue, sinks attach. */
struct LogHubService {
    bool (*enqueue)(void* ctx, const LogEntry& e);
    bool (*addSink)(void* ctx, const LogSinkService& sink);
    uint32_t (*dropped)(void* ctx);   ///< Entries lost to a full queue since boot.
    void* ctx;
};

inline const char* logLevelStr(LogLevel lvl)
{
    static const char* const kNames[] = {"debug", "info", "warn", "error"};
    const uint8_t i = (uint8_t)lvl;
    return i < 4 ? kNames[i] : "?";
}

/** @brief Persisted level index to LogLevel; out-of-range values mean Error. */
inline LogLevel logLevelFromIndex(uint8_t idx)
{
    return idx <= (uint8_t)LogLevel::Error ? (LogLevel)idx : LogLevel::Error;
}
