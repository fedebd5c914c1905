#include "prelude.hh"
#include <stdarg.h>
#include <stdio.h>
#include <strings.h>

#define LOG_LINE_MAX 256

static void stderr_sink(logging::level lvl, char const *module, char const *message);

static logging::level m_level = logging::level::warning;
static logging::sink_t m_sink = stderr_sink;

void logging::set_level(level lvl)
{
    m_level = lvl;
}

logging::level logging::get_level()
{
    return m_level;
}

void logging::set_sink(sink_t sink)
{
    m_sink = sink ? sink : stderr_sink;
}

void logging::write(level lvl, char const *module, char const *fmt, ...)
{
    if (lvl == level::off || lvl > m_level)
        return;

    char line[LOG_LINE_MAX];

    va_list args;
    va_start(args, fmt);
    vsnprintf(line, sizeof(line), fmt, args);
    va_end(args);

    m_sink(lvl, module, line);
}

char const *logging::level_name(level lvl)
{
    switch (lvl) {
    case level::off:     return "off";
    case level::error:   return "error";
    case level::warning: return "warning";
    case level::info:    return "info";
    case level::debug:   return "debug";
    }
    return "unknown";
}

bool logging::level_from_str(char const *str, level *lvl)
{
    if (!str || !lvl)
        return false;

    constexpr level all[] = {
        level::off,
        level::error,
        level::warning,
        level::info,
        level::debug,
    };

    for (auto candidate : all) {
        if (strcasecmp(str, level_name(candidate)) == 0) {
            *lvl = candidate;
            return true;
        }
    }

    return false;
}

static void stderr_sink(logging::level lvl, char const *module, char const *message)
{
    char tag = '?';
    switch (lvl) {
    case logging::level::error:   tag = 'E'; break;
    case logging::level::warning: tag = 'W'; break;
    case logging::level::info:    tag = 'I'; break;
    case logging::level::debug:   tag = 'D'; break;
    case logging::level::off:     return;
    }

    fprintf(stderr, "[%c] %s: %s\n", tag, module, message);
}
