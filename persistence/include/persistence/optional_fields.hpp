#pragma once

#include <nlohmann/json.hpp>

#include <optional>

namespace Persistence::Detail
{
    template <typename T>
    void fillIn(std::optional<T>& target, std::optional<T> const& source)
    {
        if (!target.has_value())
            target = source;
    }

    template <typename T>
    void writeIfSet(nlohmann::json& j, char const* name, std::optional<T> const& value)
    {
        if (value.has_value())
            j[name] = value.value();
    }

    template <typename T>
    void readIfPresent(nlohmann::json const& j, char const* name, std::optional<T>& value)
    {
        if (auto iter = j.find(name); iter != j.end() && !iter->is_null())
            value = iter->get<T>();
    }
}
