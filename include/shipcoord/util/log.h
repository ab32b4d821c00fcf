#pragma once

#include <functional>
#include <string>

namespace shipcoord::log {

enum class Level { Debug = 0, Info = 1, Warn = 2, Error = 3, Off = 4 };

void set_level(Level lvl);
Level level();

const char* level_to_string(Level lvl);

// Accepts debug/info/warn/warning/error/off/none in any case.
bool level_from_string(const std::string& s, Level* out);

// Replaces stderr as the destination. Lines below the current level never
// reach the sink. Pass an empty function to restore stderr.
using Sink = std::function<void(Level, const std::string&)>;
void set_sink(Sink sink);

void debug(const std::string& msg);
void info(const std::string& msg);
void warn(const std::string& msg);
void error(const std::string& msg);

} // namespace shipcoord::log
