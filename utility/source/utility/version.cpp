#include <utility/version.hpp>

#include <fmt/format.h>

#include <charconv>
#include <iterator>

namespace Utility
{
    Expected<Version, std::string> Version::parse(std::string_view text)
    {
        const auto original = text;
        if (!text.empty() && (text.front() == 'v' || text.front() == 'V'))
            text.remove_prefix(1);
        if (const auto dash = text.find('-'); dash != std::string_view::npos)
            text = text.substr(0, dash);
        if (text.empty())
            return Unexpected<std::string>{fmt::format("Empty version string: '{}'", original)};

        Version version{};
        int* components[] = {&version.majorNumber, &version.minorNumber, &version.patchNumber};
        std::size_t index = 0;
        while (!text.empty())
        {
            if (index == std::size(components))
                return Unexpected<std::string>{fmt::format("Too many version components: '{}'", original)};

            const auto dot = text.find('.');
            const auto part = text.substr(0, dot);
            const auto [ptr, ec] = std::from_chars(part.data(), part.data() + part.size(), *components[index]);
            if (ec != std::errc{} || ptr != part.data() + part.size() || part.empty())
                return Unexpected<std::string>{fmt::format("Invalid version component '{}' in '{}'", part, original)};

            ++index;
            if (dot == std::string_view::npos)
                break;
            text.remove_prefix(dot + 1);
            if (text.empty())
                return Unexpected<std::string>{fmt::format("Trailing dot in version: '{}'", original)};
        }
        return version;
    }

    std::string Version::toString() const
    {
        return fmt::format("{}.{}.{}", majorNumber, minorNumber, patchNumber);
    }
}
