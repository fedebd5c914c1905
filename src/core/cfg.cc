#define LOG_MODULE_NAME cfg
#include "prelude.hh"
#include "cfg.hh"
#include <errno.h>
#include <stdlib.h>
#include <strings.h>

using namespace cfg;

static ret_code_t parse_u16(char const *str, uint16_t *value);
static ret_code_t parse_bool(char const *str, bool *value);
static ret_code_t apply(id record_id, char const *str, tape_config_t &config);

ret_code_t cfg::load(ibackend &backend, tape_config_t *config)
{
    if (!config)
        return TAPE_ERROR_NULL;

    ret_code_t ret;
    auto staged = *config;

    for (auto record_id : ALL_IDS) {
        char value[VALUE_MAX] = {};

        ret = backend.read(record_id, value, sizeof(value));
        if (ret == TAPE_ERROR_NOT_FOUND)
            continue;
        TAPE_VERIFY_SUCCESS(ret);

        ret = apply(record_id, value, staged);
        if (ret != TAPE_SUCCESS) {
            LOG_ERROR("Bad value for %s: '%s'", id_to_key(record_id), value);
            return ret;
        }
    }

    *config = staged;

    return TAPE_SUCCESS;
}

ret_code_t cfg::init(ibackend &backend, tape_config_t *config)
{
    ret_code_t ret;

    ret = cfg::load(backend, config);
    TAPE_VERIFY_SUCCESS(ret);

    logging::set_level(config->log_level);

    return ret;
}

static ret_code_t apply(id record_id, char const *str, tape_config_t &config)
{
    switch (record_id) {
    case id::port:
        config.port = str;
        return TAPE_SUCCESS;

    case id::n_leds:
        return parse_u16(str, &config.n_leds);

    case id::buffered:
        return parse_bool(str, &config.buffered);

    case id::candidates:
        config.candidates = str;
        return TAPE_SUCCESS;

    case id::log_level:
        return logging::level_from_str(str, &config.log_level)
            ? TAPE_SUCCESS
            : TAPE_ERROR_INVALID_DATA;
    }

    return TAPE_ERROR_INVALID_PARAM;
}

static ret_code_t parse_u16(char const *str, uint16_t *value)
{
    char *end = nullptr;

    errno = 0;
    auto const n = strtoul(str, &end, 10);

    if (end == str || *end != '\0' || errno != 0 || str[0] == '-')
        return TAPE_ERROR_INVALID_DATA;
    if (n == 0 || n > UINT16_MAX)
        return TAPE_ERROR_INVALID_DATA;

    *value = static_cast<uint16_t>(n);

    return TAPE_SUCCESS;
}

static ret_code_t parse_bool(char const *str, bool *value)
{
    static char const *const truthy[] = { "1", "true", "yes", "on" };
    static char const *const falsy[] = { "0", "false", "no", "off" };

    for (auto s : truthy) {
        if (strcasecmp(str, s) == 0) {
            *value = true;
            return TAPE_SUCCESS;
        }
    }

    for (auto s : falsy) {
        if (strcasecmp(str, s) == 0) {
            *value = false;
            return TAPE_SUCCESS;
        }
    }

    return TAPE_ERROR_INVALID_DATA;
}
