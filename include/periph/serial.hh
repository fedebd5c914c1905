#pragma once

#include "prelude.hh"
#include "tape/transport.hh"

namespace serial {
    /**
     * @brief termios-backed serial port, raw 8N1.
     */
    struct transport: tape::transport {
        transport():
            fd(-1)
        {}

        transport(transport const &) = delete;
        transport &operator=(transport const &) = delete;

        ~transport() override;

        ret_code_t open(char const *id, uint32_t baud) override;

        ret_code_t write(uint8_t const *data, size_t length) override;

        ret_code_t flush_output() override;

        ret_code_t flush_input() override;

        ret_code_t set_baud_rate(uint32_t baud) override;

        ret_code_t close() override;

        inline bool is_open() override
        {
            return fd >= 0;
        }

        inline int native_handle() const
        {
            return fd;
        }

    protected:
        int fd;
    };
}
