#include "driftgrid/util/log.h"

#include <atomic>
#include <iostream>
#include <mutex>

#include "driftgrid/util/strings.h"

namespace driftgrid::log {
namespace {
std::mutex g_mu;
std::atomic<Level> g_level{Level::Info};

const char* label(Level l) {
  switch (l) {
    case Level::Debug: return "DEBUG";
    case Level::Info: return "INFO";
    case Level::Warn: return "WARN";
    case Level::Error: return "ERROR";
    default: return "";
  }
}

void emit(Level l, const std::string& msg) {
  const Level cur = g_level.load(std::memory_order_relaxed);
  if (cur == Level::Off || l < cur) return;
  std::lock_guard<std::mutex> lock(g_mu);
  std::cerr << "[" << label(l) << "] " << msg << "\n";
}

} // namespace

void set_level(Level lvl) { g_level.store(lvl, std::memory_order_relaxed); }
Level level() { return g_level.load(std::memory_order_relaxed); }

bool parse_level(const std::string& name, Level* out) {
  const std::string s = to_lower(trim(name));
  Level l;
  if (s == "debug") {
    l = Level::Debug;
  } else if (s == "info") {
    l = Level::Info;
  } else if (s == "warn" || s == "warning") {
    l = Level::Warn;
  } else if (s == "error") {
    l = Level::Error;
  } else if (s == "off") {
    l = Level::Off;
  } else {
    return false;
  }
  if (out) *out = l;
  return true;
}

void debug(const std::string& msg) { emit(Level::Debug, msg); }
void info(const std::string& msg) { emit(Level::Info, msg); }
void warn(const std::string& msg) { emit(Level::Warn, msg); }
void error(const std::string& msg) { emit(Level::Error, msg); }

} // namespace driftgrid::log
