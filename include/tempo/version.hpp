#pragma once

#include <string_view>

namespace tempo
{
    inline constexpr int version_major       = 1;
    inline constexpr int version_minor       = 0;
    inline constexpr int version_patch       = 0;
    inline constexpr const char* version_tag = "";

    inline constexpr std::string_view version()
    {
        if constexpr (version_tag[0] == '\0')
        {
            return "1.0.0";
        }
        else
        {
            return "1.0.0-";
        }
    }

    inline constexpr std::string_view version_full()
    {
        return "tempo v1.0.0 - keyed debounce and throttle";
    }
} // namespace tempo
