#include <vercmp/log.hpp>
#include <atomic>
#include <cstdarg>
#include <cstdio>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

namespace vercmp::log {

// Atomic so that range predicates may log from several threads at once
static std::atomic<Level> s_level{Info};
static std::atomic<bool> s_color_initialized{false};
static std::atomic<bool> s_color_enabled{false};

static void init_color() {
    if (!s_color_initialized.load()) {
        s_color_enabled.store(isatty(fileno(stderr)) != 0);
        s_color_initialized.store(true);
    }
}

static const char* level_color(Level lvl) {
    switch (lvl) {
        case Trace: return "\033[90m";
        case Debug: return "\033[36m";
        case Info:  return "\033[32m";
        case Warn:  return "\033[33m";
        case Error: return "\033[31m";
    }
    return "";
}

static void emit(Level lvl, const char* fmt, va_list args) {
    if (!enabled(lvl)) return;

    if (is_color_enabled()) {
        std::fprintf(stderr, "%s%s\033[0m: ", level_color(lvl), level_name(lvl));
    } else {
        std::fprintf(stderr, "%s: ", level_name(lvl));
    }
    std::vfprintf(stderr, fmt, args);
    std::fputc('\n', stderr);
}

void set_level(Level lvl) { s_level.store(lvl); }
Level get_level() { return s_level.load(); }
bool enabled(Level lvl) { return lvl >= s_level.load(); }

void set_color_enabled(bool on) {
    s_color_enabled.store(on);
    s_color_initialized.store(true);
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

Result<Level> parse_level(const std::string& name) {
    for (Level lvl : {Trace, Debug, Info, Warn, Error}) {
        if (name == level_name(lvl)) return Result<Level>::ok(lvl);
    }
    if (name == "warning") return Result<Level>::ok(Warn);
    return VercmpError{VercmpError::InvalidArg,
        "unknown log level '" + name + "'",
        "expected one of: trace, debug, info, warn, error"};
}

void trace(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    emit(Trace, fmt, args);
    va_end(args);
}

void debug(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    emit(Debug, fmt, args);
    va_end(args);
}

void info(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    emit(Info, fmt, args);
    va_end(args);
}

void warn(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    emit(Warn, fmt, args);
    va_end(args);
}

void error(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    emit(Error, fmt, args);
    va_end(args);
}

} // namespace vercmp::log
