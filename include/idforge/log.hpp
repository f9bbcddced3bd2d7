#pragma once

#include <idforge/result.hpp>
#include <string_view>

namespace idforge::log {

enum Level { Trace, Debug, Info, Warn, Error };

// Level and color are process-wide. Reads are atomic so generators may log
// from any thread; set them once at startup.
void set_level(Level lvl);
Level get_level();
bool enabled(Level lvl);

void set_color_enabled(bool enabled);
bool is_color_enabled();

void trace(const char* fmt, ...);
void debug(const char* fmt, ...);
void info(const char* fmt, ...);
void warn(const char* fmt, ...);
void error(const char* fmt, ...);

// Returns the name string for a level
const char* level_name(Level lvl);

// Accepts the names returned by level_name(), case-insensitive.
Result<Level> parse_level(std::string_view name);

} // namespace idforge::log
