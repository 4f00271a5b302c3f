#pragma once
#include <cstdint>
#include <sstream>
#include <string>
#include <spdlog/spdlog.h>   // main spdlog API (info/warn/error, set_pattern, set_level)

namespace logger {
  // Returns ms since program start (steady clock).
  uint64_t ms_since_start();

  // True if VERBOSE env var is set and not "0".
  bool verbose();

  // Per-thread label used in log lines (defaults to "main").
  extern thread_local const char* tlabel;

  // Sets spdlog pattern + level once (debug level when VERBOSE).
  void init();

  void write_line(spdlog::level::level_enum lvl, const std::string& line);
}

// Pretty simple macros. Stream-style so callers can chain values with <<.
#define LOG_AT_LEVEL(lvl, msg) do { \
  std::ostringstream log_oss_; \
  log_oss_ << msg; \
  logger::write_line((lvl), log_oss_.str()); \
} while(0)

#define LOG_ALWAYS(msg) LOG_AT_LEVEL(spdlog::level::info, msg)
#define LOG_WARN(msg)   LOG_AT_LEVEL(spdlog::level::warn, msg)
#define LOG_ERR(msg)    LOG_AT_LEVEL(spdlog::level::err, msg)

#define LOG_DBG(msg) do { if (logger::verbose()) LOG_AT_LEVEL(spdlog::level::debug, msg); } while(0)
