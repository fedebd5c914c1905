#pragma once

#include "prelude.hh"
#include "cfg/ids.hh"
#include "cfg/backend.hh"
#include "cfg/types.hh"

namespace cfg {
    /* longest raw parameter value accepted from a backend, including the NUL */
    constexpr size_t VALUE_MAX = 1024;

    /**
     * @brief Overlay every parameter present in `backend` on top of `*config`.
     *
     * `*config` is only modified if every present parameter parses.
     */
    ret_code_t load(ibackend &backend, tape_config_t *config);

    /* load, then apply the configured log level */
    ret_code_t init(ibackend &backend, tape_config_t *config);
}
