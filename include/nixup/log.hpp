#pragma once

#include <nixup/result.hpp>
#include <string>
#include <cstdio>

namespace nixup::log {

enum Level { Trace, Debug, Info, Warn, Error };

void set_level(Level lvl);
Level get_level();

// Accepts "trace", "debug", "info", "warn"/"warning", "error" (case-insensitive)
Result<Level> parse_level(const std::string& name);

void set_color_enabled(bool enabled);
bool is_color_enabled();

// Redirect log output (default stderr). Color detection follows the stream.
void set_stream(std::FILE* stream);

void trace(const char* fmt, ...);
void debug(const char* fmt, ...);
void info(const char* fmt, ...);
void warn(const char* fmt, ...);
void error(const char* fmt, ...);

const char* level_name(Level lvl);

} // namespace nixup::log
