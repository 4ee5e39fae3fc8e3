#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace Persistence
{
    /**
     * @brief How agent runtime processes are launched, probed and shut down.
     */
    struct SidecarOptions
    {
        std::optional<std::string> command{std::nullopt};
        std::optional<std::vector<std::string>> arguments{std::nullopt};
        std::optional<std::unordered_map<std::string, std::string>> environment{std::nullopt};
        std::optional<std::string> pathExtension{std::nullopt};
        std::optional<std::string> marker{std::nullopt};

        std::optional<int> basePort{std::nullopt};
        std::optional<int> portRange{std::nullopt};
        std::optional<int> maxPortAttempts{std::nullopt};

        std::optional<int> healthCheckAttempts{std::nullopt};
        std::optional<int> healthCheckDelayMs{std::nullopt};
        std::optional<int> healthCheckTimeoutMs{std::nullopt};

        std::optional<int> gracefulShutdownSeconds{std::nullopt};
        std::optional<int> killPollIntervalMs{std::nullopt};
        std::optional<int> idleGracePeriodMs{std::nullopt};
        std::optional<int> healthMonitorIntervalMs{std::nullopt};

        void useDefaultsFrom(SidecarOptions const& other);
        static SidecarOptions defaults();
    };
    void to_json(nlohmann::json& j, SidecarOptions const& options);
    void from_json(nlohmann::json const& j, SidecarOptions& options);
}
