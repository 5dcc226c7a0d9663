#include <fastinstall/log.hpp>
#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <vector>

#include <unistd.h>

namespace fastinstall::log {

static std::atomic<Level> s_level{Info};
static std::atomic<int> s_color{-1};  // -1: not yet probed

void set_level(Level lvl) {
    s_level = lvl;
}

Level get_level() {
    return s_level;
}

void set_color_enabled(bool enabled) {
    s_color = enabled ? 1 : 0;
}

bool is_color_enabled() {
    if (s_color < 0) {
        s_color = isatty(fileno(stderr)) ? 1 : 0;
    }
    return s_color == 1;
}

const char* level_name(Level lvl) {
    switch (lvl) {
        case Trace: return "trace";
        case Debug: return "debug";
        case Info:  return "info";
        case Warn:  return "warn";
        case Error: return "error";
    }
    return "unknown";
}

bool parse_level(const std::string& name, Level& out) {
    for (Level lvl : {Trace, Debug, Info, Warn, Error}) {
        if (name == level_name(lvl)) {
            out = lvl;
            return true;
        }
    }
    return false;
}

static const char* level_color(Level lvl) {
    switch (lvl) {
        case Trace: return "\033[90m";   // gray
        case Debug: return "\033[36m";   // cyan
        case Info:  return "\033[32m";   // green
        case Warn:  return "\033[33m";   // yellow
        case Error: return "\033[31m";   // red
    }
    return "";
}

static std::string vformat(const char* fmt, va_list args) {
    va_list copy;
    va_copy(copy, args);
    int n = std::vsnprintf(nullptr, 0, fmt, copy);
    va_end(copy);
    if (n <= 0) return std::string();

    std::vector<char> buf(static_cast<size_t>(n) + 1);
    std::vsnprintf(buf.data(), buf.size(), fmt, args);
    return std::string(buf.data(), static_cast<size_t>(n));
}

// Whole line goes out in one fputs so worker threads don't interleave
static void emit_line(Level lvl, const std::string& msg) {
    if (lvl < s_level) return;

    std::string line;
    if (is_color_enabled()) {
        line += level_color(lvl);
        line += level_name(lvl);
        line += "\033[0m: ";
    } else {
        line += level_name(lvl);
        line += ": ";
    }
    line += msg;
    line += '\n';
    std::fputs(line.c_str(), stderr);
}

static void log_message(Level lvl, const char* fmt, va_list args) {
    if (lvl < s_level) return;
    emit_line(lvl, vformat(fmt, args));
}

void trace(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log_message(Trace, fmt, args);
    va_end(args);
}

void debug(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log_message(Debug, fmt, args);
    va_end(args);
}

void info(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log_message(Info, fmt, args);
    va_end(args);
}

void warn(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log_message(Warn, fmt, args);
    va_end(args);
}

void error(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log_message(Error, fmt, args);
    va_end(args);
}

Sink stderr_sink() {
    return [](Level lvl, const std::string& msg) { emit_line(lvl, msg); };
}

std::string format(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    std::string out = vformat(fmt, args);
    va_end(args);
    return out;
}

void write(const Sink& sink, Level lvl, const char* fmt, ...) {
    if (!sink) return;
    va_list args;
    va_start(args, fmt);
    std::string msg = vformat(fmt, args);
    va_end(args);
    sink(lvl, msg);
}

} // namespace fastinstall::log
