#pragma once

#include <utility/expected.hpp>

#include <compare>
#include <string>
#include <string_view>

namespace Utility
{
    /**
     * @brief A major.minor.patch release version as found in release tags ("v0.5.1", "1.2.0-beta").
     */
    struct Version
    {
        int majorNumber{0};
        int minorNumber{0};
        int patchNumber{0};

        /**
         * @brief Parses a tag. A leading 'v' and anything after the first '-' are ignored, missing components are 0.
         *
         * @return The version or a description of what could not be parsed.
         */
        static Expected<Version, std::string> parse(std::string_view text);

        std::string toString() const;

        auto operator<=>(Version const&) const = default;
    };
}
