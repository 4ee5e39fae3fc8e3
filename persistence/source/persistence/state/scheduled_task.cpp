#include <persistence/state/scheduled_task.hpp>
#include <persistence/optional_fields.hpp>

#include <stdexcept>

namespace Persistence
{
    using namespace Detail;

    std::string toWireString(TaskStatus status)
    {
        switch (status)
        {
            case TaskStatus::Idle:
                return "idle";
            case TaskStatus::Running:
                return "running";
            case TaskStatus::Paused:
                return "paused";
            case TaskStatus::Stopped:
                return "stopped";
        }
        return "idle";
    }

    std::string toWireString(RunMode mode)
    {
        switch (mode)
        {
            case RunMode::SingleSession:
                return "single_session";
            case RunMode::NewSession:
                return "new_session";
        }
        return "single_session";
    }

    namespace
    {
        TaskStatus taskStatusFromWire(std::string const& str)
        {
            if (str == "idle")
                return TaskStatus::Idle;
            if (str == "running")
                return TaskStatus::Running;
            if (str == "paused")
                return TaskStatus::Paused;
            if (str == "stopped")
                return TaskStatus::Stopped;
            throw std::invalid_argument("Unknown task status: " + str);
        }

        RunMode runModeFromWire(std::string const& str)
        {
            if (str == "single_session")
                return RunMode::SingleSession;
            if (str == "new_session")
                return RunMode::NewSession;
            throw std::invalid_argument("Unknown run mode: " + str);
        }
    }

    void to_json(nlohmann::json& j, EndConditions const& conditions)
    {
        j = nlohmann::json::object();
        writeIfSet(j, "deadline", conditions.deadline);
        writeIfSet(j, "maxExecutions", conditions.maxExecutions);
        j["aiCanExit"] = conditions.aiCanExit;
    }
    void from_json(nlohmann::json const& j, EndConditions& conditions)
    {
        readIfPresent(j, "deadline", conditions.deadline);
        readIfPresent(j, "maxExecutions", conditions.maxExecutions);
        if (j.contains("aiCanExit"))
            conditions.aiCanExit = j["aiCanExit"].get<bool>();
    }

    void to_json(nlohmann::json& j, ScheduledTask const& task)
    {
        j = nlohmann::json{
            {"id", task.id},
            {"workspacePath", task.workspacePath},
            {"sessionId", task.sessionId},
            {"prompt", task.prompt},
            {"intervalMinutes", task.intervalMinutes},
            {"endConditions", task.endConditions},
            {"runMode", toWireString(task.runMode)},
            {"status", toWireString(task.status)},
            {"executionCount", task.executionCount},
            {"createdAt", task.createdAt},
            {"notifyEnabled", task.notifyEnabled},
        };
        writeIfSet(j, "lastExecutedAt", task.lastExecutedAt);
        writeIfSet(j, "tabId", task.tabId);
        writeIfSet(j, "exitReason", task.exitReason);
        writeIfSet(j, "permissionMode", task.permissionMode);
        writeIfSet(j, "model", task.model);
        writeIfSet(j, "lastError", task.lastError);
    }

    void from_json(nlohmann::json const& j, ScheduledTask& task)
    {
        j.at("id").get_to(task.id);
        j.at("workspacePath").get_to(task.workspacePath);
        j.at("sessionId").get_to(task.sessionId);
        j.at("prompt").get_to(task.prompt);
        j.at("intervalMinutes").get_to(task.intervalMinutes);
        if (j.contains("endConditions"))
            j.at("endConditions").get_to(task.endConditions);
        if (j.contains("runMode"))
            task.runMode = runModeFromWire(j.at("runMode").get<std::string>());
        if (j.contains("status"))
            task.status = taskStatusFromWire(j.at("status").get<std::string>());
        if (j.contains("executionCount"))
            j.at("executionCount").get_to(task.executionCount);
        if (j.contains("createdAt"))
            j.at("createdAt").get_to(task.createdAt);
        if (j.contains("notifyEnabled"))
            j.at("notifyEnabled").get_to(task.notifyEnabled);
        readIfPresent(j, "lastExecutedAt", task.lastExecutedAt);
        readIfPresent(j, "tabId", task.tabId);
        readIfPresent(j, "exitReason", task.exitReason);
        readIfPresent(j, "permissionMode", task.permissionMode);
        readIfPresent(j, "model", task.model);
        readIfPresent(j, "lastError", task.lastError);
    }
}
