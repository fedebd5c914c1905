#pragma once

#include "prelude.hh"

namespace color {
    enum simple {
        BLACK,
        RED,
        GREEN,
        BLUE,
        WHITE,
    };

    packed_struct rgb {
        rgb(uint8_t r, uint8_t g, uint8_t b);

        constexpr rgb(simple color):
            red(  color == RED || color == WHITE ? 255
                  : 0),
            green(color == GREEN || color == WHITE ? 255
                  : 0),
            blue( color == BLUE || color == WHITE ? 255
                  : 0)
        {}

        constexpr rgb(): red(0), green(0), blue(0) {}

        uint8_t red;
        uint8_t green;
        uint8_t blue;
    };

    static_assert(sizeof(rgb) == 3, "rgb must pack to three bytes");
}
