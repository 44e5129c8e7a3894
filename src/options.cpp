#include "options.hpp"

#include <string_view>

#ifndef TWICE_FRONTEND
#define TWICE_FRONTEND "frontend/index.html"
#endif

namespace twice
{
    options options::defaults()
    {
        options rtn;
        rtn.frontend = TWICE_FRONTEND;

#ifdef NDEBUG
        rtn.debug = false;
#else
        rtn.debug = true;
#endif

        return rtn;
    }

    bool is_remote(const std::string &frontend)
    {
        const std::string_view value{frontend};
        return value.starts_with("http://") || value.starts_with("https://");
    }
} // namespace twice
