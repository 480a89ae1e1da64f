#pragma once

#include <utility/describe.hpp>
#include <utility/expected.hpp>

#include <string>
#include <stdexcept>

namespace Utility
{
    template <typename EnumType>
    std::string enumToString(EnumType const& enumValue)
    {
        char const* result = nullptr;
        boost::mp11::mp_for_each<boost::describe::describe_enumerators<EnumType>>([&result, &enumValue](auto desc) {
            if (enumValue == desc.value)
                result = desc.name;
        });

        if (result == nullptr)
            throw std::invalid_argument("Invalid enum value");
        return result;
    }

    /**
     * @brief Looks up an enumerator by its described name.
     *
     * @return The enumerator or the unknown name as error.
     */
    template <typename EnumType>
    Expected<EnumType, std::string> tryEnumFromString(std::string const& str)
    {
        EnumType enumValue{};
        bool found = false;
        boost::mp11::mp_for_each<boost::describe::describe_enumerators<EnumType>>(
            [&found, &enumValue, &str](auto desc) {
                if (!found && str == desc.name)
                {
                    enumValue = desc.value;
                    found = true;
                }
            });

        if (!found)
            return Unexpected<std::string>{str};
        return enumValue;
    }

    template <typename EnumType>
    EnumType enumFromString(std::string const& str)
    {
        auto result = tryEnumFromString<EnumType>(str);
        if (!result)
            throw std::invalid_argument("Invalid enum string: " + result.error());
        return *result;
    }
}
