#pragma once

#include <algorithm>
#include <cctype>
#include <string>

namespace Utility::Algorithm
{
    /**
     * @brief Converts the passed string to lower case and returns it.
     *
     * @param input The string to convert.
     * @return std::string The string in lower case.
     */
    inline std::string toLowerCase(std::string const& input)
    {
        std::string result(input.size(), '\0');
        std::transform(input.begin(), input.end(), result.begin(), [](unsigned char c) {
            return static_cast<char>(std::tolower(c));
        });
        return result;
    }

    inline std::string trim(std::string const& input)
    {
        auto const isSpace = [](unsigned char c) {
            return std::isspace(c) != 0;
        };
        auto begin = std::find_if_not(input.begin(), input.end(), isSpace);
        auto end = std::find_if_not(input.rbegin(), input.rend(), isSpace).base();
        if (begin >= end)
            return {};
        return std::string{begin, end};
    }
}
