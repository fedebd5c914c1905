#define LOG_MODULE_NAME cfg
#include "prelude.hh"
#include "cfg.hh"
#include <stdio.h>
#include <stdlib.h>

using namespace cfg;

ret_code_t env_backend::read(id record_id, char *data, size_t length)
{
    if (!data)
        return TAPE_ERROR_NULL;

    auto const key = id_to_key(record_id);
    if (!key)
        return TAPE_ERROR_INVALID_PARAM;

    char name[64];
    snprintf(name, sizeof(name), "%s%s", prefix, key);

    auto const value = getenv(name);
    if (!value)
        return TAPE_ERROR_NOT_FOUND;

    auto const n = strlen(value);
    if (n >= length) {
        LOG_WARNING("%s is too long (%zu bytes)", name, n);
        return TAPE_ERROR_INVALID_LENGTH;
    }

    memcpy(data, value, n + 1);

    return TAPE_SUCCESS;
}
