#pragma once

#include "prelude.hh"

namespace cfg {
    enum class id: uint16_t {
#define CFG(name_,id_,key_) name_ = id_,
#include "def/cfg.def"
#undef CFG
    };

    enum class __index_helper: uint32_t {
#define CFG(name_,id_,key_) name_,
#include "def/cfg.def"
#undef CFG
        __num_cfg_params
    };

    constexpr size_t N_PARAMS = (size_t)__index_helper::__num_cfg_params;

    constexpr id ALL_IDS[] = {
#define CFG(name_,id_,key_) id::name_,
#include "def/cfg.def"
#undef CFG
    };

    static inline char const *id_to_key(id x)
    {
        switch (x) {
#define CFG(name_,id_,key_) case id::name_: return key_;
#include "def/cfg.def"
#undef CFG
        }
        return nullptr;
    }

    static_assert(sizeof(ALL_IDS) / sizeof(ALL_IDS[0]) == N_PARAMS);
}
