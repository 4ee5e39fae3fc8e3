#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace Persistence
{
    /**
     * @brief The runtime the host keeps for work that is not bound to a workspace.
     */
    struct SharedRuntimeOptions
    {
        std::optional<bool> enabled{std::nullopt};
        /// Empty means a per-host directory below the temp directory.
        std::optional<std::string> workspacePath{std::nullopt};
        std::optional<int> retryAttempts{std::nullopt};
        std::optional<int> retryBaseDelayMs{std::nullopt};
        std::optional<int> retryMaxDelayMs{std::nullopt};

        void useDefaultsFrom(SharedRuntimeOptions const& other);
        static SharedRuntimeOptions defaults();
    };
    void to_json(nlohmann::json& j, SharedRuntimeOptions const& options);
    void from_json(nlohmann::json const& j, SharedRuntimeOptions& options);
}
