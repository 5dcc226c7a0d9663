#pragma once

#include <functional>
#include <string>

namespace fastinstall::log {

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

// Returns the name string for a level
const char* level_name(Level lvl);

// "trace", "debug", ... -> Level. Returns false for unknown names.
bool parse_level(const std::string& name, Level& out);

// Receiver for leveled messages from library code (the install run).
// An empty Sink drops everything.
using Sink = std::function<void(Level, const std::string&)>;

// Sink that forwards to the global stderr logger above
Sink stderr_sink();

// printf-style formatting into a std::string
std::string format(const char* fmt, ...);

// Format and deliver to sink; no-op when sink is empty
void write(const Sink& sink, Level lvl, const char* fmt, ...);

} // namespace fastinstall::log
