/**
 * @file log.hpp
 * @brief Key=value log lines for the engine and the tools.
 *
 * @details
 * Every line looks like the CLI's status lines so the same greps work on both:
 * ```
 *   level=debug action=one_touch_play id=3 event=timer state=1 queries=2
 *   level=error action=standby id=4 event=callback_failed what=peer gone
 * ```
 * Lines go to `std::cerr` unless a different sink is installed. Messages below
 * the current threshold are dropped before they are formatted.
 *
 * Not thread-safe: the engine is single-threaded and so is its logging.
 */
#pragma once
#include <iosfwd>
#include <sstream>
#include <string>

namespace cecflow {

enum class LogLevel : int { Debug = 0, Info = 1, Warn = 2, Error = 3, Off = 4 };

/// Current threshold; lines below it are dropped.
LogLevel log_level();
void set_log_level(LogLevel level);

/**
 * @brief Set the threshold from a name ("debug", "info", "warn", "error", "off").
 * @return false (threshold unchanged) when the name is unknown.
 */
bool set_log_level(const std::string& name);

/// Redirect output; nullptr restores std::cerr. The stream must outlive its use.
void set_log_sink(std::ostream* sink);

/// Write one finished line ("level=<lvl> " is prepended).
void log_line(LogLevel level, const std::string& fields);

namespace detail {
template <typename... Args>
void log_fields(LogLevel level, const Args&... args) {
  if (level < log_level()) return;
  std::ostringstream os;
  (os << ... << args);
  log_line(level, os.str());
}
} // namespace detail

template <typename... Args> void log_debug(const Args&... a) { detail::log_fields(LogLevel::Debug, a...); }
template <typename... Args> void log_info (const Args&... a) { detail::log_fields(LogLevel::Info,  a...); }
template <typename... Args> void log_warn (const Args&... a) { detail::log_fields(LogLevel::Warn,  a...); }
template <typename... Args> void log_error(const Args&... a) { detail::log_fields(LogLevel::Error, a...); }

} // namespace cecflow
