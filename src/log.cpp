// -----------------------------------------------------------------------------
// log.cpp: stderr status lines
// -----------------------------------------------------------------------------
#include "chunkwire/log.hpp"

#include <iostream>

namespace chunkwire {

namespace {
LogLevel g_level = LogLevel::Info;   // single-threaded core; plain global is enough

const char* level_name(LogLevel level) {
  switch (level) {
    case LogLevel::Debug: return "debug";
    case LogLevel::Info:  return "info";
    case LogLevel::Warn:  return "warn";
    case LogLevel::Error: return "error";
    case LogLevel::Off:   return "off";
  }
  return "info";
}
} // namespace

void set_log_level(LogLevel level) { g_level = level; }

LogLevel log_level() { return g_level; }

bool log_enabled(LogLevel level) {
  return level != LogLevel::Off && static_cast<uint8_t>(level) >= static_cast<uint8_t>(g_level);
}

void log_line(LogLevel level, const char* component, const std::string& fields) {
  if (!log_enabled(level)) return;
  std::cerr << "level=" << level_name(level)
            << " component=" << (component ? component : "-")
            << " " << fields << "\n";
}

} // namespace chunkwire
