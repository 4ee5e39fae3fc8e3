#include <persistence/state/state.hpp>
#include <persistence/optional_fields.hpp>
#include <constants/persistence.hpp>

namespace Persistence
{
    using namespace Detail;

    void State::useDefaultsFrom(State const& other)
    {
        sidecar.useDefaultsFrom(other.sidecar);
        stream.useDefaultsFrom(other.stream);
        scheduler.useDefaultsFrom(other.scheduler);
        sharedRuntime.useDefaultsFrom(other.sharedRuntime);
        fillIn(spawnAttempts, other.spawnAttempts);
        fillIn(guardianMaxHoldSeconds, other.guardianMaxHoldSeconds);
        fillIn(logDirectory, other.logDirectory);
        fillIn(taskStorePath, other.taskStorePath);
    }

    State State::defaults()
    {
        return State{
            .sidecar = SidecarOptions::defaults(),
            .stream = StreamOptions::defaults(),
            .scheduler = SchedulerOptions::defaults(),
            .sharedRuntime = SharedRuntimeOptions::defaults(),
            .spawnAttempts = 2,
            .guardianMaxHoldSeconds = 1800,
            .logDirectory = Constants::logDirectory,
            .taskStorePath = Constants::taskStorePath,
            .logLevel = Log::Level::Info,
        };
    }

    void to_json(nlohmann::json& j, State const& state)
    {
        j = nlohmann::json::object();

        j["sidecar"] = state.sidecar;
        j["stream"] = state.stream;
        j["scheduler"] = state.scheduler;
        j["sharedRuntime"] = state.sharedRuntime;
        writeIfSet(j, "spawnAttempts", state.spawnAttempts);
        writeIfSet(j, "guardianMaxHoldSeconds", state.guardianMaxHoldSeconds);
        writeIfSet(j, "logDirectory", state.logDirectory);
        writeIfSet(j, "taskStorePath", state.taskStorePath);
        j["logLevel"] = Log::levelToString(state.logLevel);
    }

    void from_json(nlohmann::json const& j, State& state)
    {
        if (j.contains("sidecar"))
            j.at("sidecar").get_to(state.sidecar);

        if (j.contains("stream"))
            j.at("stream").get_to(state.stream);

        if (j.contains("scheduler"))
            j.at("scheduler").get_to(state.scheduler);

        if (j.contains("sharedRuntime"))
            j.at("sharedRuntime").get_to(state.sharedRuntime);

        readIfPresent(j, "spawnAttempts", state.spawnAttempts);
        readIfPresent(j, "guardianMaxHoldSeconds", state.guardianMaxHoldSeconds);
        readIfPresent(j, "logDirectory", state.logDirectory);
        readIfPresent(j, "taskStorePath", state.taskStorePath);

        if (j.contains("logLevel"))
        {
            const auto name = j.at("logLevel").get<std::string>();
            state.logLevel = Log::parseLevel(name).value_or(Log::Level::Info);
        }
    }
}
