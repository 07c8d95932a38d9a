#pragma once

#include <optional>
#include <string>

// printf-style diagnostics on stderr, one "level: message" line per call.
// Install workers log concurrently; lines never interleave.
namespace pinfold::log {

enum Level { Debug, Info, Warn, Error };

void set_level(Level lvl);
Level get_level();

// Colour defaults to on when stderr is a terminal
void set_color_enabled(bool enabled);
bool is_color_enabled();

const char* level_name(Level lvl);
// Accepts the level names plus "warning"
std::optional<Level> parse_level(const std::string& name);

// Reads PINFOLD_LOG; an unknown value is reported and ignored
void init_from_env();

void debug(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void info(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void warn(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void error(const char* fmt, ...) __attribute__((format(printf, 1, 2)));

} // namespace pinfold::log
