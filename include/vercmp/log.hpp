#pragma once

#include <vercmp/result.hpp>
#include <string>

namespace vercmp::log {

enum Level { Trace, Debug, Info, Warn, Error };

void set_level(Level lvl);
Level get_level();
bool enabled(Level lvl);

// Colour defaults to on when stderr is a terminal
void set_color_enabled(bool enabled);
bool is_color_enabled();

void trace(const char* fmt, ...);
void debug(const char* fmt, ...);
void info(const char* fmt, ...);
void warn(const char* fmt, ...);
void error(const char* fmt, ...);

const char* level_name(Level lvl);

// Inverse of level_name(); "warning" is accepted as an alias of "warn"
Result<Level> parse_level(const std::string& name);

} // namespace vercmp::log
