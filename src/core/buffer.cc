#include "util.hh"

ret_code_t buffer::write(void const *bytes, size_t nbytes)
{
    if (nbytes == 0)
        return TAPE_SUCCESS;
    if (!bytes)
        return TAPE_ERROR_NULL;
    if (nbytes > length - pos)
        return TAPE_ERROR_INVALID_LENGTH;

    memcpy(&basep[pos], bytes, nbytes);
    pos += nbytes;

    return TAPE_SUCCESS;
}
