#include <pinfold/log.hpp>

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <mutex>
#include <unistd.h>

namespace pinfold::log {

namespace {

struct LevelStyle {
    const char* name;
    const char* ansi;
};

// Indexed by Level
constexpr LevelStyle kStyles[] = {
    {"debug", "\033[36m"},
    {"info", "\033[32m"},
    {"warn", "\033[33m"},
    {"error", "\033[31m"},
};

// -1 until the first message or set_color_enabled() decides
std::atomic<int> g_color{-1};
std::atomic<Level> g_threshold{Info};
std::mutex g_stderr_mutex;

bool color_on() {
    int state = g_color.load();
    if (state < 0) {
        int detected = ::isatty(::fileno(stderr)) ? 1 : 0;
        g_color.compare_exchange_strong(state, detected);
        state = g_color.load();
    }
    return state == 1;
}

void emit(Level lvl, const char* fmt, va_list args) {
    if (lvl < g_threshold.load()) return;

    char text[2048];
    std::vsnprintf(text, sizeof(text), fmt, args);

    const LevelStyle& style = kStyles[lvl];
    bool color = color_on();
    std::lock_guard<std::mutex> lock(g_stderr_mutex);
    std::fprintf(stderr, "%s%s%s: %s\n", color ? style.ansi : "", style.name,
                 color ? "\033[0m" : "", text);
}

} // namespace

void set_level(Level lvl) { g_threshold = lvl; }
Level get_level() { return g_threshold; }

void set_color_enabled(bool enabled) { g_color = enabled ? 1 : 0; }
bool is_color_enabled() { return color_on(); }

const char* level_name(Level lvl) { return kStyles[lvl].name; }

std::optional<Level> parse_level(const std::string& name) {
    if (name == "warning") return Warn;
    for (Level lvl : {Debug, Info, Warn, Error}) {
        if (name == kStyles[lvl].name) return lvl;
    }
    return std::nullopt;
}

void init_from_env() {
    const char* value = std::getenv("PINFOLD_LOG");
    if (value == nullptr) return;
    if (auto lvl = parse_level(value)) {
        set_level(*lvl);
        return;
    }
    warn("ignoring unknown PINFOLD_LOG level '%s'", value);
}

#define PINFOLD_LOG_ENTRY(fn, lvl)   \
    void fn(const char* fmt, ...) {  \
        va_list args;                \
        va_start(args, fmt);         \
        emit(lvl, fmt, args);        \
        va_end(args);                \
    }

PINFOLD_LOG_ENTRY(debug, Debug)
PINFOLD_LOG_ENTRY(info, Info)
PINFOLD_LOG_ENTRY(warn, Warn)
PINFOLD_LOG_ENTRY(error, Error)

#undef PINFOLD_LOG_ENTRY

} // namespace pinfold::log
