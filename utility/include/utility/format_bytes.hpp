#pragma once

#include <fmt/format.h>

#include <cstdint>
#include <string>

namespace Utility
{
    enum class OrderOfMagnitude
    {
        None = 0,
        Kilo,
        Mega,
        Giga
    };

    constexpr std::uint64_t kibi = 1024;
    constexpr std::uint64_t mebi = 1024 * kibi;
    constexpr std::uint64_t gibi = 1024 * mebi;

    /**
     * @brief Picks the binary order of magnitude a byte count is displayed in.
     */
    inline OrderOfMagnitude determineOrderOfMagnitude(std::uint64_t value)
    {
        if (value < kibi)
            return OrderOfMagnitude::None;
        else if (value < mebi)
            return OrderOfMagnitude::Kilo;
        else if (value < gibi)
            return OrderOfMagnitude::Mega;
        else
            return OrderOfMagnitude::Giga;
    }

    /**
     * @brief Transfers are only ever shown in KB or MB, switching at one MiB.
     */
    inline OrderOfMagnitude transferOrderOfMagnitude(std::uint64_t total)
    {
        return total < mebi ? OrderOfMagnitude::Kilo : OrderOfMagnitude::Mega;
    }

    inline double scaleBytes(std::uint64_t value, OrderOfMagnitude magnitude)
    {
        switch (magnitude)
        {
            case OrderOfMagnitude::None:
                return static_cast<double>(value);
            case OrderOfMagnitude::Kilo:
                return static_cast<double>(value) / kibi;
            case OrderOfMagnitude::Mega:
                return static_cast<double>(value) / mebi;
            case OrderOfMagnitude::Giga:
                return static_cast<double>(value) / gibi;
        }
        return static_cast<double>(value);
    }

    inline char const* unitSuffix(OrderOfMagnitude magnitude)
    {
        switch (magnitude)
        {
            case OrderOfMagnitude::None:
                return "B";
            case OrderOfMagnitude::Kilo:
                return "KB";
            case OrderOfMagnitude::Mega:
                return "MB";
            case OrderOfMagnitude::Giga:
                return "GB";
        }
        return "";
    }

    inline std::string formatBytes(std::uint64_t value, OrderOfMagnitude magnitude)
    {
        if (magnitude == OrderOfMagnitude::None)
            return fmt::format("{} B", value);
        return fmt::format("{:.2f} {}", scaleBytes(value, magnitude), unitSuffix(magnitude));
    }

    inline std::string formatBytes(std::uint64_t value)
    {
        return formatBytes(value, determineOrderOfMagnitude(value));
    }
}
