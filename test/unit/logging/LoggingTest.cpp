#include "test_utils.h"

#include <cstdio>
#include <cstring>
#include <string>

// LOG_LEVEL=3 is set through a compile definition, so every macro is compiled in
// and the runtime level decides what is printed.
#include <Logging.h>

static std::string captured;

static void captureSink(const char* line) { captured += line; }

static void reset() {
  captured.clear();
  logSetSink(captureSink);
  logSetLevel(3);
}

// Drops the "[<millis>] " prefix, which depends on the clock
static std::string withoutMillis(const std::string& line) {
  const size_t close = line.find("] ");
  if (line.empty() || line[0] != '[' || close == std::string::npos) return line;
  return line.substr(close + 2);
}

static bool hasMillisPrefix(const std::string& line) {
  if (line.size() < 4 || line[0] != '[') return false;
  size_t i = 1;
  while (i < line.size() && line[i] >= '0' && line[i] <= '9') i++;
  return i > 1 && i + 1 < line.size() && line[i] == ']' && line[i + 1] == ' ';
}

int main() {
  TestUtils::TestRunner runner("Logging");

  // --- logPrintf basic format ---
  {
    reset();
    logPrintf("[INF]", "TEST", "hello %d\n", 123);
    runner.expectTrue(hasMillisPrefix(captured), "logPrintf: millis prefix");
    runner.expectEqual(std::string("[INF] [TEST] hello 123\n"), withoutMillis(captured), "logPrintf: basic format");
  }

  // --- logPrintf no format args ---
  {
    reset();
    logPrintf("[DBG]", "A", "plain text\n");
    runner.expectEqual(std::string("[DBG] [A] plain text\n"), withoutMillis(captured), "logPrintf: no format args");
  }

  // --- Macros ---
  {
    reset();
    LOG_ERR("MOD", "error %s", "msg");
    runner.expectEqual(std::string("[ERR] [MOD] error msg\n"), withoutMillis(captured), "LOG_ERR macro");

    reset();
    LOG_WRN("PDF", "page %d unreadable", 4);
    runner.expectEqual(std::string("[WRN] [PDF] page 4 unreadable\n"), withoutMillis(captured), "LOG_WRN macro");

    reset();
    LOG_INF("REPO", "opened %s with %d pages", "book.pdf", 12);
    runner.expectEqual(std::string("[INF] [REPO] opened book.pdf with 12 pages\n"), withoutMillis(captured),
                       "LOG_INF macro");

    reset();
    LOG_DBG("READER", "open took %lu ms", 42UL);
    runner.expectEqual(std::string("[DBG] [READER] open took 42 ms\n"), withoutMillis(captured), "LOG_DBG macro");
  }

  // --- Runtime level filters ---
  {
    reset();
    logSetLevel(1);
    LOG_INF("X", "hidden");
    LOG_DBG("X", "hidden");
    runner.expectTrue(captured.empty(), "level 1: info and debug suppressed");
    LOG_WRN("X", "shown");
    runner.expectEqual(std::string("[WRN] [X] shown\n"), withoutMillis(captured), "level 1: warnings pass");

    logSetLevel(-4);
    runner.expectEq(0, logGetLevel(), "negative level clamps to 0");
    logSetLevel(99);
    runner.expectEq(3, logGetLevel(), "level clamps to the compiled ceiling");
  }

  // --- Long origin truncated, no crash ---
  {
    reset();
    char longOrigin[300];
    memset(longOrigin, 'A', 299);
    longOrigin[299] = '\0';
    logPrintf("[INF]", longOrigin, "end\n");
    runner.expectTrue(!captured.empty(), "long origin: produces output");
    runner.expectTrue(captured.size() <= 255, "long origin: output within buffer limit");
    runner.expectEqual(std::string("[INF] ["), withoutMillis(captured).substr(0, 7), "long origin: has prefix");
    runner.expectTrue(captured.back() == '\n', "long origin: line still terminated");
  }

  // --- Long message truncated, no crash ---
  {
    reset();
    char longMsg[500];
    memset(longMsg, 'X', 499);
    longMsg[499] = '\0';
    logPrintf("[ERR]", "T", "%s\n", longMsg);
    runner.expectTrue(captured.size() <= 255, "long message: output within buffer limit");
    runner.expectEqual(std::string("[ERR] [T] XXX"), withoutMillis(captured).substr(0, 13), "long message: prefix");
    runner.expectTrue(captured.back() == '\n', "long message: line still terminated");
  }

  // --- Empty format string ---
  {
    reset();
    logPrintf("[DBG]", "Z", "");
    runner.expectEqual(std::string("[DBG] [Z] "), withoutMillis(captured), "empty format: just prefix");
  }

  // --- Default sink restored ---
  {
    reset();
    logSetSink(nullptr);
    LOG_ERR("T", "goes to stderr");
    runner.expectTrue(captured.empty(), "nullptr sink: capture no longer used");
  }

  runner.expectTrue(logMillis() < 60UL * 60UL * 1000UL, "logMillis counts from process start");

  logSetLevel(2);
  runner.printSummary();
  return runner.allPassed() ? 0 : 1;
}
