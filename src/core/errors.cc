#include "prelude.hh"

char const *error_str(ret_code_t code)
{
    switch (code) {
#define ERROR(name_,val_,desc_) case TAPE_ ## name_: return desc_;
#include "def/errors.def"
#undef ERROR
    }
    return "unknown error";
}
