// -----------------------------------------------------------------------------
// log.cpp: threshold, sink and line writer for log.hpp
// -----------------------------------------------------------------------------
#include "cecflow/log.hpp"

#include <iostream>

namespace cecflow {

static LogLevel      g_level = LogLevel::Info;
static std::ostream* g_sink  = nullptr;   // nullptr => std::cerr

static const char* level_name(LogLevel level) {
  switch (level) {
    case LogLevel::Debug: return "debug";
    case LogLevel::Info:  return "info";
    case LogLevel::Warn:  return "warn";
    case LogLevel::Error: return "error";
    default:              return "off";
  }
}

LogLevel log_level() { return g_level; }

void set_log_level(LogLevel level) { g_level = level; }

bool set_log_level(const std::string& name) {
  if      (name == "debug") g_level = LogLevel::Debug;
  else if (name == "info")  g_level = LogLevel::Info;
  else if (name == "warn")  g_level = LogLevel::Warn;
  else if (name == "error") g_level = LogLevel::Error;
  else if (name == "off")   g_level = LogLevel::Off;
  else return false;
  return true;
}

void set_log_sink(std::ostream* sink) { g_sink = sink; }

void log_line(LogLevel level, const std::string& fields) {
  if (level < g_level || level == LogLevel::Off) return;
  std::ostream& out = g_sink ? *g_sink : std::cerr;
  out << "level=" << level_name(level) << ' ' << fields << '\n';
}

} // namespace cecflow
