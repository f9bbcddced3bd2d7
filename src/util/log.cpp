#include <idforge/log.hpp>
#include <atomic>
#include <cctype>
#include <cstdarg>
#include <cstdio>
#include <mutex>
#include <string>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

namespace idforge::log {

static std::atomic<int> s_level{Info};
static std::atomic<bool> s_color_enabled{false};
static std::once_flag s_color_once;

static void init_color() {
    std::call_once(s_color_once, [] {
        s_color_enabled.store(isatty(fileno(stderr)) != 0);
    });
}

void set_level(Level lvl) {
    s_level.store(lvl);
}

Level get_level() {
    return static_cast<Level>(s_level.load());
}

bool enabled(Level lvl) {
    return lvl >= get_level();
}

void set_color_enabled(bool enabled) {
    // An explicit choice wins over TTY detection.
    std::call_once(s_color_once, [] {});
    s_color_enabled.store(enabled);
}

bool is_color_enabled() {
    init_color();
    return s_color_enabled.load();
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

Result<Level> parse_level(std::string_view name) {
    std::string lower;
    lower.reserve(name.size());
    for (char c : name) {
        lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    for (Level lvl : {Trace, Debug, Info, Warn, Error}) {
        if (lower == level_name(lvl)) return Result<Level>::ok(lvl);
    }
    return IdError{IdError::InvalidArg,
        "unknown log level '" + std::string(name) + "'",
        "expected one of: trace, debug, info, warn, error"};
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

static void log_message(Level lvl, const char* fmt, va_list args) {
    if (!enabled(lvl)) return;

    // Format into one buffer so concurrent callers do not interleave lines.
    // Messages longer than the stack buffer are re-formatted on the heap.
    char stack_buf[1024];
    va_list retry;
    va_copy(retry, args);
    int n = std::vsnprintf(stack_buf, sizeof(stack_buf), fmt, args);
    std::string heap_buf;
    const char* body = stack_buf;
    if (n < 0) {
        body = fmt;
    } else if (static_cast<size_t>(n) >= sizeof(stack_buf)) {
        heap_buf.resize(static_cast<size_t>(n) + 1);
        std::vsnprintf(&heap_buf[0], heap_buf.size(), fmt, retry);
        body = heap_buf.c_str();
    }
    va_end(retry);

    if (is_color_enabled()) {
        std::fprintf(stderr, "%s%s\033[0m: %s\n", level_color(lvl), level_name(lvl), body);
    } else {
        std::fprintf(stderr, "%s: %s\n", level_name(lvl), body);
    }
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

} // namespace idforge::log
