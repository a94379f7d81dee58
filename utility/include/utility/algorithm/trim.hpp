#pragma once

#include <cctype>
#include <string_view>

namespace Utility::Algorithm
{
    inline bool isSpace(char c)
    {
        return std::isspace(static_cast<unsigned char>(c)) != 0;
    }

    inline std::string_view trim(std::string_view input)
    {
        while (!input.empty() && isSpace(input.front()))
            input.remove_prefix(1);
        while (!input.empty() && isSpace(input.back()))
            input.remove_suffix(1);
        return input;
    }
}
