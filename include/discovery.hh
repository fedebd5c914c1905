#pragma once

#include "prelude.hh"
#include <string>
#include <utility>
#include <vector>

namespace discovery {
    struct source {
        virtual ~source() = default;

        /**
         * @brief Replace `ports` with the candidate port identifiers, best first.
         *
         * An empty list is not an error.
         */
        virtual ret_code_t list_ports(std::vector<std::string> &ports) = 0;
    };

    /**
     * @brief Discovery source backed by a list supplied up front,
     *        typically from `cfg::tape_config_t::candidates`.
     */
    struct fixed: source {
        fixed() = default;

        explicit fixed(std::vector<std::string> ports):
            candidates(std::move(ports))
        {}

        /* comma-separated, blanks around each entry are ignored */
        static fixed from_list(char const *list);

        ret_code_t list_ports(std::vector<std::string> &ports) override;

        inline size_t len() const
        {
            return candidates.size();
        }

    protected:
        std::vector<std::string> candidates;
    };
}
