#pragma once

#include <harbor/host_error.hpp>
#include <persistence/state/scheduled_task.hpp>

#include <expected>
#include <functional>
#include <optional>
#include <string>

namespace Harbor
{
    struct TaskExecutionRequest
    {
        std::string taskId{};
        std::string prompt{};
        std::string sessionId{};
        bool isFirstExecution{false};
        bool aiCanExit{true};
        std::optional<std::string> permissionMode{std::nullopt};
        std::optional<std::string> model{std::nullopt};
        Persistence::RunMode runMode{Persistence::RunMode::SingleSession};
    };

    struct TaskExecutionResult
    {
        bool success{false};
        std::optional<std::string> error{std::nullopt};
        bool aiRequestedExit{false};
        std::optional<std::string> exitReason{std::nullopt};
    };

    /**
     * @brief Control calls against a running agent runtime. Completions run on the host's executor.
     */
    class IProcessControl
    {
      public:
        virtual ~IProcessControl() = default;

        /// POST /chat/stop
        virtual void stopGeneration(
            unsigned short port,
            std::function<void(std::expected<void, HostError> const&)> onComplete) = 0;

        /// POST /cron/execute
        virtual void executeTask(
            unsigned short port,
            TaskExecutionRequest const& request,
            std::function<void(std::expected<TaskExecutionResult, HostError> const&)> onComplete) = 0;
    };
}
