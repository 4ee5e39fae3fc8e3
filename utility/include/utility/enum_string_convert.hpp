#pragma once

#include <boost/describe/enum.hpp>
#include <boost/describe/enumerators.hpp>
#include <boost/mp11/algorithm.hpp>

#include <optional>
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
     * @brief Parses the enumerator name, throws std::invalid_argument on unknown names.
     */
    template <typename EnumType>
    EnumType enumFromString(std::string const& str)
    {
        EnumType enumValue;
        bool found = false;
        boost::mp11::mp_for_each<boost::describe::describe_enumerators<EnumType>>(
            [&found, &enumValue, &str](auto desc) {
                if (str == desc.name)
                {
                    enumValue = desc.value;
                    found = true;
                }
            });

        if (!found)
            throw std::invalid_argument("Invalid enum string: " + str);

        return enumValue;
    }

    template <typename EnumType>
    std::optional<EnumType> tryEnumFromString(std::string const& str)
    {
        std::optional<EnumType> result{};
        boost::mp11::mp_for_each<boost::describe::describe_enumerators<EnumType>>([&result, &str](auto desc) {
            if (str == desc.name)
                result = desc.value;
        });
        return result;
    }
}
