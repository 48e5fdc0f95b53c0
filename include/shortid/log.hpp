#pragma once

#include <shortid/result.hpp>
#include <string>

namespace shortid::log {

enum Level { Trace, Debug, Info, Warn, Error };

void set_level(Level lvl);
Level get_level();

void set_color_enabled(bool enabled);
bool is_color_enabled();

void trace(const char* fmt, ...);
void debug(const char* fmt, ...);
void info(const char* fmt, ...);
void warn(const char* fmt, ...);
void error(const char* fmt, ...);

const char* level_name(Level lvl);

// Inverse of level_name(); case-sensitive, as written in config files
Result<Level> parse_level(const std::string& name);

} // namespace shortid::log
