#include "shipcoord/util/log.h"

#include <atomic>
#include <iostream>
#include <mutex>
#include <utility>

#include "shipcoord/util/strings.h"

namespace shipcoord::log {
namespace {

struct Logger {
  std::atomic<Level> threshold{Level::Info};
  std::mutex mu;
  Sink sink;
};

Logger& logger() {
  static Logger l;
  return l;
}

void write(Level lvl, const std::string& msg) {
  Logger& l = logger();
  const Level threshold = l.threshold.load();
  if (threshold == Level::Off || lvl < threshold) return;

  Sink sink;
  {
    std::lock_guard<std::mutex> lock(l.mu);
    sink = l.sink;
    // Crew hosts log from their worker threads; keep lines whole.
    if (!sink) {
      std::cerr << "shipcoord [" << level_to_string(lvl) << "] " << msg << "\n";
      return;
    }
  }
  // Called unlocked so a sink may log or replace itself.
  sink(lvl, msg);
}

} // namespace

void set_level(Level lvl) { logger().threshold = lvl; }
Level level() { return logger().threshold.load(); }

const char* level_to_string(Level lvl) {
  switch (lvl) {
    case Level::Debug: return "debug";
    case Level::Info: return "info";
    case Level::Warn: return "warn";
    case Level::Error: return "error";
    case Level::Off: return "off";
  }
  return "?";
}

bool level_from_string(const std::string& s, Level* out) {
  const std::string v = to_lower(s);
  if (v == "warning") return level_from_string("warn", out);
  if (v == "none") return level_from_string("off", out);
  for (Level l : {Level::Debug, Level::Info, Level::Warn, Level::Error, Level::Off}) {
    if (v == level_to_string(l)) {
      if (out) *out = l;
      return true;
    }
  }
  return false;
}

void set_sink(Sink sink) {
  Logger& l = logger();
  std::lock_guard<std::mutex> lock(l.mu);
  l.sink = std::move(sink);
}

void debug(const std::string& msg) { write(Level::Debug, msg); }
void info(const std::string& msg) { write(Level::Info, msg); }
void warn(const std::string& msg) { write(Level::Warn, msg); }
void error(const std::string& msg) { write(Level::Error, msg); }

} // namespace shipcoord::log
