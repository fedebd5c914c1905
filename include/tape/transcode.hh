#pragma once

#include "prelude.hh"
#include "util.hh"
#include "color.hh"

namespace tape {
    constexpr size_t bytes_per_pixel = 3;

    /* any triplet ending in SHOW_BYTE renders the pixels received since the last one */
    constexpr uint8_t SHOW_BYTE = 255;
    constexpr uint8_t MAX_CHANNEL = SHOW_BYTE - 1;

    constexpr uint8_t show_command[bytes_per_pixel] = { 0, 0, SHOW_BYTE };

    constexpr uint32_t BAUD_NORMAL = 115200;
    constexpr uint32_t BAUD_BOOTLOADER = 1200;

    struct pixel {
        uint8_t bytes[bytes_per_pixel];
    };

    constexpr uint8_t clamp_channel(int value)
    {
        return value < 0 ? 0
             : value >= SHOW_BYTE ? MAX_CHANNEL
             : static_cast<uint8_t>(value);
    }

    /**
     * @brief Clamp a requested color into [0, 254] per channel.
     *
     * Never fails; out-of-range channels saturate.
     */
    constexpr pixel encode(int r, int g, int b)
    {
        return pixel { { clamp_channel(r), clamp_channel(g), clamp_channel(b) } };
    }

    constexpr pixel encode(color::rgb const &value)
    {
        return encode(value.red, value.green, value.blue);
    }

    /**
     * @brief Appends encoded pixels and show commands to a fixed buffer.
     */
    struct transcode {
        constexpr transcode():
            output()
        {}

        constexpr transcode(buffer const &buf):
            output(buf)
        {}

        inline void clear()
        {
            output.reset();
        }

        inline void truncate(size_t n)
        {
            output.truncate(n);
        }

        inline uint8_t const *ptr() const
        {
            return output.ptr();
        }

        inline size_t len() const
        {
            return output.len();
        }

        inline size_t pixels() const
        {
            return output.len() / bytes_per_pixel;
        }

        ret_code_t write(pixel const &value);

        ret_code_t write(color::rgb const &value);

        ret_code_t write_show();

    protected:
        buffer output;
    };
}
