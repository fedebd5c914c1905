#pragma once

#include <stdint.h>

namespace logging {
    enum class level: uint8_t {
        off = 0,
        error,
        warning,
        info,
        debug,
    };

    using sink_t = void (*)(level lvl, char const *module, char const *message);

    void set_level(level lvl);

    level get_level();

    /**
     * @brief Replace the function that receives formatted log lines.
     *
     * Passing `nullptr` restores the default stderr sink.
     */
    void set_sink(sink_t sink);

    void write(level lvl, char const *module, char const *fmt, ...)
        __attribute__((format(printf, 3, 4)));

    char const *level_name(level lvl);

    bool level_from_str(char const *str, level *lvl);
}

#ifndef LOG_MODULE_NAME
#define LOG_MODULE_NAME app
#endif

#define LOG_ERROR(...)   logging::write(logging::level::error, stringify(LOG_MODULE_NAME), __VA_ARGS__)
#define LOG_WARNING(...) logging::write(logging::level::warning, stringify(LOG_MODULE_NAME), __VA_ARGS__)
#define LOG_INFO(...)    logging::write(logging::level::info, stringify(LOG_MODULE_NAME), __VA_ARGS__)
#define LOG_DEBUG(...)   logging::write(logging::level::debug, stringify(LOG_MODULE_NAME), __VA_ARGS__)
