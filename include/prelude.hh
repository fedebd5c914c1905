#pragma once

#include <stdint.h>
#include <stddef.h>
#include <string.h>
#include <algorithm>

typedef uint32_t ret_code_t;

enum: ret_code_t {
#define ERROR(name_,val_,desc_) TAPE_ ## name_ = val_,
#include "def/errors.def"
#undef ERROR
};

char const *error_str(ret_code_t code);

#ifndef TAPE_VERIFY_SUCCESS
#define TAPE_VERIFY_SUCCESS(ret) do {\
        ret_code_t const verify_ret_ = (ret);\
        if (verify_ret_ != TAPE_SUCCESS) {\
            return verify_ret_;\
        }\
    } while (0)
#endif

#ifndef stringify
#define stringify_(X) # X
#define stringify(X) stringify_(X)
#endif

#ifdef __GNUC__
#ifndef packed_struct
#define packed_struct struct __attribute__ ((packed))
#endif /* packed_struct */
#else
#error 'packed_struct' attribute not implemented for this compiler.
#endif

#include "log.hh"
