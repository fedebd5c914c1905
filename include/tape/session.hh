#pragma once

#include "prelude.hh"
#include "color.hh"
#include "discovery.hh"
#include "tape/transport.hh"
#include "tape/transcode.hh"
#include "cfg/types.hh"
#include <string>
#include <vector>

namespace tape {
    struct session_init {
        constexpr session_init(char const *port, uint16_t n_leds, bool buffered):
            port(port),
            n_leds(n_leds),
            buffered(buffered)
        {}

        /* `config` must outlive the session_init */
        explicit session_init(cfg::tape_config_t const &config);
        session_init(cfg::tape_config_t &&) = delete;

        /* null or empty: use the first port reported by discovery */
        char const *port;
        uint16_t n_leds;
        bool buffered;
    };

    /**
     * @brief Drives one tape over a transport.
     *
     * Pixels are either written to the transport as they arrive (immediate
     * mode) or collected until `show()` (buffered mode). At most `capacity()`
     * pixels may be sent between two calls to `show()`.
     *
     * Not thread safe. The transport is used by this session alone from
     * `open()` until `close()`, and is closed when the session is destroyed.
     */
    struct session {
        enum class state: uint8_t {
            unopened,
            open,
            closed,
        };

        explicit session(transport *tp):
            tp(tp),
            st(state::unopened),
            n_leds(0),
            buffered(false),
            n_pending(0),
            storage(),
            acc()
        {}

        session(session const &) = delete;
        session &operator=(session const &) = delete;

        ~session();

        /**
         * @brief Resolve the port, open the transport and clear the device.
         *
         * @param init      Port, capacity and buffering mode.
         * @param discovery Consulted once when `init.port` is unset. May be null
         *                  if a port is given.
         */
        ret_code_t open(session_init const &init, discovery::source *discovery);

        /* Clamp to [0, 254] and queue or write one pixel. */
        ret_code_t send_pixel(int r, int g, int b);

        /**
         * @brief Write `count` pixels in a single transport write, then `show()`.
         *
         * Bypasses the accumulator in both modes; pixels already pending in
         * buffered mode are flushed by the trailing `show()`.
         */
        ret_code_t send_many(color::rgb const *colors, size_t count);

        inline ret_code_t send_many(std::vector<color::rgb> const &colors)
        {
            return send_many(colors.data(), colors.size());
        }

        /* Commit: send pending pixel data followed by the show command. */
        ret_code_t show();

        /* Fill every pixel with one color and show it. */
        ret_code_t display_color(int r, int g, int b);

        /* Drop to 1200 baud, which makes the device reboot into its bootloader, and close. */
        ret_code_t reset_to_bootloader();

        ret_code_t close();

        inline uint16_t capacity() const
        {
            return n_leds;
        }

        inline bool is_buffered() const
        {
            return buffered;
        }

        inline bool is_open() const
        {
            return st == state::open;
        }

        /* pixels accepted since the last show() */
        inline size_t pending() const
        {
            return n_pending;
        }

        /* bytes waiting in the accumulator; always 0 in immediate mode */
        inline size_t buffered_bytes() const
        {
            return acc.len();
        }

        inline std::string const &port() const
        {
            return port_id;
        }

    protected:
        ret_code_t check_open() const;
        ret_code_t resolve_port(session_init const &init, discovery::source *discovery);
        ret_code_t commit();

        transport *tp;
        state st;
        uint16_t n_leds;
        bool buffered;
        size_t n_pending;
        std::string port_id;
        /* backing store for `acc`, sized once at open */
        std::vector<uint8_t> storage;
        transcode acc;
    };
}
