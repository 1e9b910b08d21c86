#pragma once

#include <yyid/result.hpp>
#include <cstdio>
#include <string>

namespace yyid::log {

enum Level { Trace, Debug, Info, Warn, Error };

void set_level(Level lvl);
Level get_level();

// Parse "trace", "debug", "info", "warn"/"warning" or "error"
Result<Level> parse_level(const std::string& name);

void set_color_enabled(bool enabled);
bool is_color_enabled();

// Messages go to stderr unless redirected; nullptr restores stderr
void set_stream(std::FILE* stream);

void trace(const char* fmt, ...);
void debug(const char* fmt, ...);
void info(const char* fmt, ...);
void warn(const char* fmt, ...);
void error(const char* fmt, ...);

const char* level_name(Level lvl);

} // namespace yyid::log
