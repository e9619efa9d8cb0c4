#pragma once
/*
===========================================================
Fragment 1.1: Core Logging
FILE: cpp/uncert/core/logging.hpp
===========================================================
Purpose:
  - Minimal, dependency-free logging used by ALL uncert modules.
  - Centralizes stdout/stderr policy.

Hardening:
  - Logging MUST NOT throw (noexcept API).
  - Thread-safe (coarse mutex in implementation).
  - Caller controls severity; implementation routes WARN/ERROR to stderr.
  - An optional sink replaces the stream output (used by selftests to
    observe advisories).
===========================================================
*/

#include <functional>
#include <string>

namespace uncert {

enum class LogLevel : int { DEBUG = 0, INFO = 1, WARN = 2, ERROR = 3 };

using LogSink = std::function<void(LogLevel, const std::string&)>;

// Set global logging verbosity (default INFO).
void set_log_level(LogLevel lvl) noexcept;

// Get global logging verbosity.
LogLevel get_log_level() noexcept;

// Route records to `sink` instead of stdout/stderr. Empty sink restores streams.
void set_log_sink(LogSink sink) noexcept;

// Core logging call. Never throws.
void log(LogLevel lvl, const std::string& msg) noexcept;

const char* level_tag(LogLevel lvl) noexcept;

} // namespace uncert
