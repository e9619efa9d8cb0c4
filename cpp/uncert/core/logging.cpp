/*
===========================================================
Fragment 1.1: Core Logging (Implementation)
FILE: cpp/uncert/core/logging.cpp
===========================================================
Record layout (stream output):
    [2026-01-31T12:00:00.123Z][WARN] message

Hardening:
  - log() is noexcept. A throwing sink or stream loses that one record.
  - g_state.mu serializes sink replacement and record output.
===========================================================
*/

#include "uncert/core/logging.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdio>
#include <ctime>
#include <iostream>
#include <mutex>
#include <utility>

namespace uncert {

namespace {

struct LogState {
  std::atomic<int> level{static_cast<int>(LogLevel::INFO)};
  std::mutex mu;
  LogSink sink;  // guarded by mu
};

LogState& state() {
  static LogState s;
  return s;
}

// UTC with millisecond resolution.
std::string utc_timestamp() {
  using clock = std::chrono::system_clock;
  const auto now = clock::now();
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                      now.time_since_epoch()).count() % 1000;
  const std::time_t tt = clock::to_time_t(now);
  std::tm tm{};
#if defined(_WIN32)
  gmtime_s(&tm, &tt);
#else
  gmtime_r(&tt, &tm);
#endif
  char buf[32];
  const std::size_t n = std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
  char out[48];
  std::snprintf(out, sizeof(out), "%.*s.%03dZ", static_cast<int>(n), buf, static_cast<int>(ms));
  return out;
}

std::string format_record(LogLevel lvl, const std::string& msg) {
  std::string line;
  line.reserve(msg.size() + 40);
  line += '[';
  line += utc_timestamp();
  line += "][";
  line += level_tag(lvl);
  line += "] ";
  line += msg;
  line += '\n';
  return line;
}

}  // namespace

const char* level_tag(LogLevel lvl) noexcept {
  switch (lvl) {
    case LogLevel::DEBUG: return "DEBUG";
    case LogLevel::INFO:  return "INFO";
    case LogLevel::WARN:  return "WARN";
    case LogLevel::ERROR: return "ERROR";
    default:              return "INFO";
  }
}

void set_log_level(LogLevel lvl) noexcept {
  state().level.store(static_cast<int>(lvl), std::memory_order_relaxed);
}

LogLevel get_log_level() noexcept {
  return static_cast<LogLevel>(state().level.load(std::memory_order_relaxed));
}

void set_log_sink(LogSink sink) noexcept {
  LogState& s = state();
  std::lock_guard<std::mutex> lk(s.mu);
  s.sink = std::move(sink);
}

void log(LogLevel lvl, const std::string& msg) noexcept {
  try {
    LogState& s = state();
    if (static_cast<int>(lvl) < s.level.load(std::memory_order_relaxed)) return;

    // The sink runs unlocked so it may itself log.
    LogSink sink;
    {
      std::lock_guard<std::mutex> lk(s.mu);
      sink = s.sink;
      if (!sink) {
        std::ostream& out = (lvl >= LogLevel::WARN) ? std::cerr : std::cout;
        out << format_record(lvl, msg);
        out.flush();
        return;
      }
    }
    sink(lvl, msg);
  } catch (...) {
    // noexcept contract: the record is dropped.
  }
}

} // namespace uncert
