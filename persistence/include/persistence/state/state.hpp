#pragma once

#include <log/level.hpp>
#include <persistence/state/shared_runtime_options.hpp>
#include <persistence/state/sidecar_options.hpp>
#include <persistence/state/stream_options.hpp>
#include <persistence/state/scheduler_options.hpp>

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace Persistence
{
    struct State
    {
        SidecarOptions sidecar{};
        StreamOptions stream{};
        SchedulerOptions scheduler{};
        SharedRuntimeOptions sharedRuntime{};
        std::optional<int> spawnAttempts{std::nullopt};
        std::optional<int> guardianMaxHoldSeconds{std::nullopt};
        std::optional<std::string> logDirectory{std::nullopt};
        std::optional<std::string> taskStorePath{std::nullopt};
        Log::Level logLevel{Log::Level::Info};

        void useDefaultsFrom(State const& other);
        static State defaults();
    };

    void to_json(nlohmann::json& j, State const& state);
    void from_json(nlohmann::json const& j, State& state);
}
