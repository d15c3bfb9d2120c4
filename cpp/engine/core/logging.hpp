#pragma once
/*
===========================================================
Core: Logging
FILE: cpp/engine/core/logging.hpp
===========================================================
Purpose:
  - Minimal, dependency-free logging used by ALL engine modules.
  - Centralizes stdout/stderr policy.

Hardening:
  - Logging MUST NOT throw (noexcept API).
  - Thread-safe (coarse mutex in implementation).
  - Caller controls severity; implementation routes WARN/ERROR to stderr.
  - Tools that print a report on stdout can send every level to stderr.

Line format:
  [2026-01-31T12:00:00Z][INFO][classify] message
===========================================================
*/

#include <string>
#include <string_view>

namespace abcven {

enum class LogLevel : int { DEBUG = 0, INFO = 1, WARN = 2, ERROR = 3 };

// Set global logging verbosity (default INFO).
void set_log_level(LogLevel lvl) noexcept;

// Get global logging verbosity.
LogLevel get_log_level() noexcept;

// Route DEBUG/INFO to stderr as well (default false).
void set_log_stderr_only(bool on) noexcept;

// Parse "debug" / "info" / "warn" / "error" (case-insensitive).
// Returns false and leaves *out untouched on unknown names.
bool parse_log_level(std::string_view name, LogLevel* out) noexcept;

// Core logging call. Never throws.
void log(LogLevel lvl, std::string_view component, const std::string& msg) noexcept;

} // namespace abcven
