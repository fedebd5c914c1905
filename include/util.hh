#pragma once

#include "prelude.hh"

struct buffer {
    constexpr buffer():
        basep(nullptr),
        pos(0),
        length(0)
    {}

    constexpr buffer(void *p, size_t length):
        basep((uint8_t*)p),
        pos(0),
        length(length)
    {};

    inline size_t len() const
    {
        return pos;
    }

    inline size_t remaining() const
    {
        return length - pos;
    }

    inline uint8_t const *ptr() const
    {
        return basep;
    }

    inline void reset()
    {
        pos = 0;
    }

    /* drop everything past the first `n` bytes */
    inline void truncate(size_t n)
    {
        pos = std::min(pos, n);
    }

    ret_code_t write(void const *bytes, size_t nbytes);

protected:
    uint8_t *basep;
    size_t pos;
    size_t length;
};
