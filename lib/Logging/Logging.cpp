#include "Logging.h"

#include <chrono>
#include <cstring>

namespace {
int runtimeLevel = LOG_LEVEL;
LogSink activeSink = nullptr;

void stderrSink(const char* line) { fputs(line, stderr); }

std::chrono::steady_clock::time_point startTime() {
  static const auto start = std::chrono::steady_clock::now();
  return start;
}
}  // namespace

unsigned long logMillis() {
  const auto elapsed = std::chrono::steady_clock::now() - startTime();
  return static_cast<unsigned long>(std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count());
}

void logSetLevel(const int level) {
  if (level < 0) {
    runtimeLevel = 0;
  } else if (level > LOG_LEVEL) {
    runtimeLevel = LOG_LEVEL;
  } else {
    runtimeLevel = level;
  }
}

int logGetLevel() { return runtimeLevel; }

void logSetSink(const LogSink sink) { activeSink = sink; }

void logPrintf(const char* level, const char* origin, const char* format, ...) {
  va_list args;
  va_start(args, format);
  char buf[256];
  char* c = buf;
  const char* const end = buf + sizeof(buf);

  int len = snprintf(c, end - c, "[%lu] ", logMillis());
  if (len > 0) c += (len < end - c) ? len : end - c - 1;

  const char* p = level;
  while (*p && c < end - 1) *c++ = *p++;
  if (c < end - 1) *c++ = ' ';

  len = snprintf(c, end - c, "[%s] ", origin);
  if (len > 0) c += (len < end - c) ? len : end - c - 1;

  vsnprintf(c, end - c, format, args);
  va_end(args);

  // A truncated message still ends the line
  if (strlen(buf) == sizeof(buf) - 1) buf[sizeof(buf) - 2] = '\n';

  (activeSink ? activeSink : stderrSink)(buf);
}
