#define LOG_MODULE_NAME session
#include "prelude.hh"
#include "tape/session.hh"

using namespace tape;

session_init::session_init(cfg::tape_config_t const &config):
    port(config.port.empty() ? nullptr : config.port.c_str()),
    n_leds(config.n_leds),
    buffered(config.buffered)
{}

session::~session()
{
    if (st != state::open)
        return;

    auto const ret = close();
    if (ret != TAPE_SUCCESS) {
        LOG_WARNING("Close of %s failed: %s", port_id.c_str(), error_str(ret));
    }
}

ret_code_t session::open(session_init const &init, discovery::source *discovery)
{
    if (!tp)
        return TAPE_ERROR_NULL;
    if (st == state::closed)
        return TAPE_ERROR_CLOSED_SESSION;
    if (st != state::unopened)
        return TAPE_ERROR_INVALID_STATE;
    if (init.n_leds == 0)
        return TAPE_ERROR_INVALID_PARAM;

    ret_code_t ret;

    ret = resolve_port(init, discovery);
    TAPE_VERIFY_SUCCESS(ret);

    ret = tp->open(port_id.c_str(), BAUD_NORMAL);
    if (ret != TAPE_SUCCESS) {
        LOG_ERROR("Cannot open %s: %s", port_id.c_str(), error_str(ret));
        return ret;
    }

    n_leds = init.n_leds;
    buffered = init.buffered;
    n_pending = 0;

    if (buffered) {
        /* a full strip plus the show command */
        storage.assign(n_leds * bytes_per_pixel + sizeof(show_command), 0);
        acc = transcode(buffer(storage.data(), storage.size()));
    } else {
        storage.clear();
        acc = transcode();
    }

    st = state::open;

    /* drop whatever an earlier session or a device reset left half-sent */
    ret = commit();
    if (ret != TAPE_SUCCESS) {
        LOG_ERROR("Initial show on %s failed: %s", port_id.c_str(), error_str(ret));
        st = state::unopened;
        auto const close_ret = tp->close();
        if (close_ret != TAPE_SUCCESS) {
            LOG_WARNING("Close of %s failed: %s", port_id.c_str(), error_str(close_ret));
        }
        return ret;
    }

    LOG_INFO("Opened %s: %u LEDs, %s", port_id.c_str(), (unsigned)n_leds, buffered ? "buffered" : "immediate");

    return ret;
}

ret_code_t session::send_pixel(int r, int g, int b)
{
    ret_code_t ret;

    ret = check_open();
    TAPE_VERIFY_SUCCESS(ret);

    if (n_pending >= n_leds) {
        LOG_WARNING("Pixel %zu is outside of the %u LED tape", n_pending, (unsigned)n_leds);
        return TAPE_ERROR_CAPACITY_EXCEEDED;
    }

    auto const value = encode(r, g, b);

    if (buffered) {
        ret = acc.write(value);
        TAPE_VERIFY_SUCCESS(ret);
        ++n_pending;
        return ret;
    }

    ret = tp->write(value.bytes, sizeof(value.bytes));
    if (ret != TAPE_SUCCESS) {
        LOG_ERROR("Pixel write failed: %s", error_str(ret));
        return ret;
    }

    /* on the wire now, so it counts against capacity even if the flush fails */
    ++n_pending;

    ret = tp->flush_output();
    if (ret != TAPE_SUCCESS) {
        LOG_ERROR("Pixel flush failed: %s", error_str(ret));
    }

    return ret;
}

ret_code_t session::send_many(color::rgb const *colors, size_t count)
{
    ret_code_t ret;

    ret = check_open();
    TAPE_VERIFY_SUCCESS(ret);

    if (count > 0 && !colors)
        return TAPE_ERROR_NULL;

    if (count > n_leds - n_pending) {
        LOG_WARNING("%zu pixels (%zu pending) do not fit a %u LED tape", count, n_pending, (unsigned)n_leds);
        return TAPE_ERROR_CAPACITY_EXCEEDED;
    }

    if (count > 0) {
        std::vector<uint8_t> data(count * bytes_per_pixel);
        auto out = transcode(buffer(data.data(), data.size()));

        for (size_t i = 0; i < count; ++i) {
            ret = out.write(colors[i]);
            TAPE_VERIFY_SUCCESS(ret);
        }

        ret = tp->write(out.ptr(), out.len());
        if (ret != TAPE_SUCCESS) {
            LOG_ERROR("Bulk write of %zu pixels failed: %s", count, error_str(ret));
            return ret;
        }
    }

    return commit();
}

ret_code_t session::show()
{
    ret_code_t ret;

    ret = check_open();
    TAPE_VERIFY_SUCCESS(ret);

    return commit();
}

ret_code_t session::display_color(int r, int g, int b)
{
    ret_code_t ret;

    ret = check_open();
    TAPE_VERIFY_SUCCESS(ret);

    if (n_pending != 0) {
        LOG_WARNING("%zu pixels already pending, cannot fill %u more", n_pending, (unsigned)n_leds);
        return TAPE_ERROR_CAPACITY_EXCEEDED;
    }

    for (size_t i = 0; i < n_leds; ++i) {
        ret = send_pixel(r, g, b);
        TAPE_VERIFY_SUCCESS(ret);
    }

    return show();
}

ret_code_t session::close()
{
    ret_code_t ret;

    ret = check_open();
    TAPE_VERIFY_SUCCESS(ret);

    st = state::closed;
    n_pending = 0;
    acc.clear();

    ret = tp->close();
    if (ret != TAPE_SUCCESS) {
        LOG_ERROR("Close of %s failed: %s", port_id.c_str(), error_str(ret));
        return ret;
    }

    LOG_INFO("Closed %s", port_id.c_str());

    return ret;
}

ret_code_t session::check_open() const
{
    switch (st) {
    case state::open:     return TAPE_SUCCESS;
    case state::closed:   return TAPE_ERROR_CLOSED_SESSION;
    case state::unopened: return TAPE_ERROR_INVALID_STATE;
    }
    return TAPE_ERROR_INVALID_STATE;
}

ret_code_t session::resolve_port(session_init const &init, discovery::source *discovery)
{
    if (init.port && init.port[0] != '\0') {
        port_id = init.port;
        return TAPE_SUCCESS;
    }

    if (!discovery) {
        LOG_ERROR("No port given and no discovery source");
        return TAPE_ERROR_NOT_FOUND;
    }

    ret_code_t ret;
    std::vector<std::string> ports;

    ret = discovery->list_ports(ports);
    TAPE_VERIFY_SUCCESS(ret);

    if (ports.empty()) {
        LOG_ERROR("No compatible device detected");
        return TAPE_ERROR_NOT_FOUND;
    }

    port_id = ports.front();
    LOG_INFO("Using %s (first of %zu candidates)", port_id.c_str(), ports.size());

    return TAPE_SUCCESS;
}

ret_code_t session::commit()
{
    ret_code_t ret;

    if (buffered) {
        auto const n = acc.len();

        ret = acc.write_show();
        TAPE_VERIFY_SUCCESS(ret);

        ret = tp->write(acc.ptr(), acc.len());
        if (ret != TAPE_SUCCESS) {
            acc.truncate(n);
            LOG_ERROR("Show write failed: %s", error_str(ret));
            return ret;
        }

        acc.clear();
    } else {
        ret = tp->write(show_command, sizeof(show_command));
        if (ret != TAPE_SUCCESS) {
            LOG_ERROR("Show write failed: %s", error_str(ret));
            return ret;
        }
    }

    LOG_DEBUG("Show after %zu pixels", n_pending);
    n_pending = 0;

    ret = tp->flush_output();
    TAPE_VERIFY_SUCCESS(ret);

    /* the stock firmware sends nothing worth reading */
    ret = tp->flush_input();
    TAPE_VERIFY_SUCCESS(ret);

    return ret;
}
