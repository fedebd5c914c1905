#pragma once

#include "prelude.hh"
#include "cfg/ids.hh"

namespace cfg {
    struct ibackend {
        virtual ~ibackend() = default;

        /**
         * @brief Copy the raw text of a parameter into `data`, NUL-terminated.
         *
         * @return `TAPE_ERROR_NOT_FOUND` if the parameter is not set,
         *         `TAPE_ERROR_INVALID_LENGTH` if it does not fit in `length` bytes.
         */
        virtual ret_code_t read(id record_id, char *data, size_t length) = 0;
    };

    /**
     * @brief Reads parameters from `BLINKYTAPE_<KEY>` environment variables.
     */
    struct env_backend: ibackend {
        static constexpr char const *prefix = "BLINKYTAPE_";

        ret_code_t read(id record_id, char *data, size_t length) override;
    };
}
