#define LOG_MODULE_NAME discovery
#include "prelude.hh"
#include "discovery.hh"
#include <ctype.h>

using namespace discovery;

fixed fixed::from_list(char const *list)
{
    std::vector<std::string> ports;

    if (!list)
        return fixed(std::move(ports));

    char const *p = list;
    while (*p) {
        char const *end = strchr(p, ',');
        if (!end)
            end = p + strlen(p);

        char const *first = p;
        char const *last = end;
        while (first < last && isspace((unsigned char)*first))
            ++first;
        while (last > first && isspace((unsigned char)last[-1]))
            --last;

        if (last > first)
            ports.emplace_back(first, last);

        p = *end ? end + 1 : end;
    }

    return fixed(std::move(ports));
}

ret_code_t fixed::list_ports(std::vector<std::string> &ports)
{
    ports = candidates;
    LOG_DEBUG("%zu candidate port(s)", ports.size());
    return TAPE_SUCCESS;
}
