#include <yyid/log.hpp>
#include <cstdarg>
#include <cctype>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

namespace yyid::log {

static Level s_level = Warn;
static std::FILE* s_stream = nullptr;
static bool s_color_initialized = false;
static bool s_color_enabled = false;

static std::FILE* out() {
    return s_stream ? s_stream : stderr;
}

static void init_color() {
    if (!s_color_initialized) {
        s_color_enabled = isatty(fileno(out()));
        s_color_initialized = true;
    }
}

void set_level(Level lvl) {
    s_level = lvl;
}

Level get_level() {
    return s_level;
}

Result<Level> parse_level(const std::string& name) {
    std::string lower;
    for (char c : name) {
        lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    if (lower == "trace") return Result<Level>::ok(Trace);
    if (lower == "debug") return Result<Level>::ok(Debug);
    if (lower == "info") return Result<Level>::ok(Info);
    if (lower == "warn" || lower == "warning") return Result<Level>::ok(Warn);
    if (lower == "error") return Result<Level>::ok(Error);

    return YyidError{YyidError::Config,
        "unknown log level: '" + name + "'",
        "expected one of: trace, debug, info, warn, error"};
}

void set_color_enabled(bool enabled) {
    s_color_enabled = enabled;
    s_color_initialized = true;
}

bool is_color_enabled() {
    init_color();
    return s_color_enabled;
}

void set_stream(std::FILE* stream) {
    s_stream = stream;
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
    if (lvl < s_level) return;
    init_color();

    std::FILE* stream = out();
    if (s_color_enabled) {
        std::fprintf(stream, "%syyid %s\033[0m: ", level_color(lvl), level_name(lvl));
    } else {
        std::fprintf(stream, "yyid %s: ", level_name(lvl));
    }

    std::vfprintf(stream, fmt, args);
    std::fputc('\n', stream);
}

#define YYID_LOG_FN(name, lvl)          \
    void name(const char* fmt, ...) {   \
        va_list args;                   \
        va_start(args, fmt);            \
        log_message(lvl, fmt, args);    \
        va_end(args);                   \
    }

YYID_LOG_FN(trace, Trace)
YYID_LOG_FN(debug, Debug)
YYID_LOG_FN(info, Info)
YYID_LOG_FN(warn, Warn)
YYID_LOG_FN(error, Error)

#undef YYID_LOG_FN

} // namespace yyid::log
