#pragma once

#include <cstdarg>
#include <cstdio>

// Compile-time ceiling: 0 = errors, 1 = +warnings, 2 = +info, 3 = +debug.
// The runtime level set through logSetLevel() can only lower it.
#ifndef LOG_LEVEL
#define LOG_LEVEL 2
#endif

// Receives one fully formatted line (trailing newline included).
using LogSink = void (*)(const char* line);

void logPrintf(const char* level, const char* origin, const char* format, ...)
#if defined(__GNUC__)
    __attribute__((format(printf, 3, 4)))
#endif
    ;

void logSetLevel(int level);
int logGetLevel();

// nullptr restores the default stderr sink
void logSetSink(LogSink sink);

// Milliseconds since the first log call in this process
unsigned long logMillis();

#define LOG_AT(lvl, tag, origin, format, ...)                                        \
  do {                                                                               \
    if (logGetLevel() >= (lvl)) logPrintf(tag, origin, format "\n", ##__VA_ARGS__); \
  } while (0)

#if LOG_LEVEL >= 0
#define LOG_ERR(origin, format, ...) LOG_AT(0, "[ERR]", origin, format, ##__VA_ARGS__)
#else
#define LOG_ERR(origin, format, ...) ((void)0)
#endif

#if LOG_LEVEL >= 1
#define LOG_WRN(origin, format, ...) LOG_AT(1, "[WRN]", origin, format, ##__VA_ARGS__)
#else
#define LOG_WRN(origin, format, ...) ((void)0)
#endif

#if LOG_LEVEL >= 2
#define LOG_INF(origin, format, ...) LOG_AT(2, "[INF]", origin, format, ##__VA_ARGS__)
#else
#define LOG_INF(origin, format, ...) ((void)0)
#endif

#if LOG_LEVEL >= 3
#define LOG_DBG(origin, format, ...) LOG_AT(3, "[DBG]", origin, format, ##__VA_ARGS__)
#else
#define LOG_DBG(origin, format, ...) ((void)0)
#endif
