#pragma once

#include <ids/ids.hpp>

#include <boost/describe/enum.hpp>
#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace Persistence
{
    enum class TaskStatus
    {
        Idle,
        Running,
        Paused,
        Stopped
    };
    BOOST_DESCRIBE_ENUM(TaskStatus, Idle, Running, Paused, Stopped)

    enum class RunMode
    {
        SingleSession,
        NewSession
    };
    BOOST_DESCRIBE_ENUM(RunMode, SingleSession, NewSession)

    std::string toWireString(TaskStatus status);
    std::string toWireString(RunMode mode);

    struct EndConditions
    {
        /// Milliseconds since the unix epoch.
        std::optional<std::int64_t> deadline{std::nullopt};
        std::optional<int> maxExecutions{std::nullopt};
        bool aiCanExit{true};
    };
    void to_json(nlohmann::json& j, EndConditions const& conditions);
    void from_json(nlohmann::json const& j, EndConditions& conditions);

    /**
     * @brief A recurring prompt executed against the agent runtime of one session.
     * Timestamps are milliseconds since the unix epoch.
     */
    struct ScheduledTask
    {
        Ids::TaskId id{};
        std::string workspacePath{};
        Ids::SessionId sessionId{};
        std::string prompt{};
        int intervalMinutes{15};
        EndConditions endConditions{};
        RunMode runMode{RunMode::SingleSession};
        TaskStatus status{TaskStatus::Idle};
        int executionCount{0};
        std::int64_t createdAt{0};
        std::optional<std::int64_t> lastExecutedAt{std::nullopt};
        bool notifyEnabled{true};
        std::optional<Ids::TabId> tabId{std::nullopt};
        std::optional<std::string> exitReason{std::nullopt};
        std::optional<std::string> permissionMode{std::nullopt};
        std::optional<std::string> model{std::nullopt};
        std::optional<std::string> lastError{std::nullopt};
    };
    void to_json(nlohmann::json& j, ScheduledTask const& task);
    void from_json(nlohmann::json const& j, ScheduledTask& task);
}
