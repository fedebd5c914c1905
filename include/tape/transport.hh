#pragma once

#include "prelude.hh"

namespace tape {
    /**
     * @brief Byte-stream link to a tape.
     *
     * Every call blocks until the underlying I/O has completed. Failures of
     * the link itself are reported as `TAPE_ERROR_IO`.
     */
    struct transport {
        virtual ~transport() = default;

        virtual ret_code_t open(char const *id, uint32_t baud) = 0;

        virtual ret_code_t write(uint8_t const *data, size_t length) = 0;

        /** @brief Block until all queued outbound bytes have been transmitted. */
        virtual ret_code_t flush_output() = 0;

        /** @brief Discard any bytes received from the device. */
        virtual ret_code_t flush_input() = 0;

        virtual ret_code_t set_baud_rate(uint32_t baud) = 0;

        virtual ret_code_t close() = 0;

        virtual bool is_open() = 0;
    };
}
