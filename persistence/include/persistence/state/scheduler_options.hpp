#pragma once

#include <nlohmann/json.hpp>

#include <optional>

namespace Persistence
{
    struct SchedulerOptions
    {
        std::optional<int> minimumIntervalMinutes{std::nullopt};
        std::optional<int> firstExecutionDelaySeconds{std::nullopt};
        std::optional<int> pastDueDelaySeconds{std::nullopt};
        std::optional<int> executeTimeoutSeconds{std::nullopt};

        void useDefaultsFrom(SchedulerOptions const& other);
        static SchedulerOptions defaults();
    };
    void to_json(nlohmann::json& j, SchedulerOptions const& options);
    void from_json(nlohmann::json const& j, SchedulerOptions& options);
}
