#pragma once

#include "prelude.hh"
#include <string>

namespace cfg {
    constexpr uint16_t DEFAULT_LED_COUNT = 60;

    struct tape_config_t {
        /* empty means "ask discovery" */
        std::string port;
        uint16_t n_leds = DEFAULT_LED_COUNT;
        bool buffered = true;
        /* comma-separated candidate ports for discovery::fixed */
        std::string candidates;
        logging::level log_level = logging::level::warning;
    };
}
