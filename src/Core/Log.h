#pragma once
/**
 * @file Log.h
 * @brief Process-wide logging front end.
 *
 * Entries are formatted on the caller's task and queued to the log hub;
 * nothing is written before Log::setHub(). Modules normally use the LOGx
 * macros of Core/ModuleLog.h.
 */
#include <stdarg.h>
#include "Core/Services/ILogger.h"

namespace Log {

void setHub(const LogHubService* hub);

/** @brief Entries below @p lvl are discarded before formatting. */
void setMinLevel(LogLevel lvl);
LogLevel minLevel();

void write(LogLevel lvl, const char* tag, const char* fmt, va_list ap);

void debug(const char* tag, const char* fmt, ...);
void info(const char* tag, const char* fmt, ...);
void warn(const char* tag, const char* fmt, ...);
void error(const char* tag, const char* fmt, ...);

/**
 * @brief vsnprintf() that logs a warning under @p tag when @p out is too small.
 * @return vsnprintf()'s result.
 */
int formatChecked(const char* tag, const char* file, int line,
                  char* out, size_t len, const char* fmt, ...);

}  // namespace Log
