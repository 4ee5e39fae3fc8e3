#pragma once

#include <harbor/control/process_control.hpp>
#include <harbor/host_error.hpp>
#include <harbor/ownership_ledger.hpp>
#include <harbor/session_activation_table.hpp>
#include <harbor/session_locks.hpp>
#include <persistence/task_store.hpp>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/steady_timer.hpp>

#include <chrono>
#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace Harbor
{
    struct TaskSchedulerOptions
    {
        std::chrono::minutes minimumInterval{15};
        std::chrono::milliseconds firstExecutionDelay{2000};
        std::chrono::milliseconds pastDueDelay{5000};
    };

    struct TaskConfig
    {
        std::string workspacePath{};
        Ids::SessionId sessionId{};
        std::string prompt{};
        int intervalMinutes{15};
        Persistence::EndConditions endConditions{};
        Persistence::RunMode runMode{Persistence::RunMode::SingleSession};
        bool notifyEnabled{true};
        std::optional<Ids::TabId> tabId{std::nullopt};
        std::optional<std::string> permissionMode{std::nullopt};
        std::optional<std::string> model{std::nullopt};
    };

    /**
     * @brief Runs scheduled tasks. A started task holds a ScheduledTask claim on its session, so its runtime
     * outlives any tab showing the session.
     */
    class TaskScheduler : public std::enable_shared_from_this<TaskScheduler>
    {
      public:
        using PortResolver = std::function<std::optional<unsigned short>(Ids::SessionId const&)>;
        using Completion = std::function<void(std::expected<void, HostError> const&)>;

        TaskScheduler(
            boost::asio::any_io_executor executor,
            std::shared_ptr<Persistence::TaskStore> store,
            std::shared_ptr<OwnershipLedger> ledger,
            std::shared_ptr<SessionActivationTable> activations,
            std::shared_ptr<IProcessControl> control,
            std::shared_ptr<SessionLocks> sessionLocks,
            TaskSchedulerOptions options);
        ~TaskScheduler();
        TaskScheduler(TaskScheduler const&) = delete;
        TaskScheduler& operator=(TaskScheduler const&) = delete;
        TaskScheduler(TaskScheduler&&) = delete;
        TaskScheduler& operator=(TaskScheduler&&) = delete;

        void setPortResolver(PortResolver resolver);

        std::expected<Persistence::ScheduledTask, HostError> createTask(TaskConfig const& config);

        /**
         * @brief Claims the task's session and arms the timer once the runtime is ready.
         *
         * @param onStarted Called once the runtime is ready or failed to start.
         */
        std::expected<void, HostError> startTask(Ids::TaskId const& id, Completion onStarted = {});

        /**
         * @brief Disarms the timer. The claim and the runtime stay.
         */
        std::expected<void, HostError> pauseTask(Ids::TaskId const& id);
        std::expected<void, HostError> resumeTask(Ids::TaskId const& id);

        /**
         * @brief Disarms the timer and releases the task's claim.
         */
        std::expected<void, HostError> stopTask(Ids::TaskId const& id, std::optional<std::string> exitReason = std::nullopt);
        std::expected<void, HostError> deleteTask(Ids::TaskId const& id);
        std::expected<void, HostError> updateTaskTab(Ids::TaskId const& id, std::optional<Ids::TabId> tabId);

        /**
         * @brief Re-establishes a task found running or paused at startup. Paused tasks are not armed.
         */
        void restoreTask(Ids::TaskId const& id, Completion onRestored);

        /**
         * @brief Marks a task that could not be restored as stopped.
         */
        void failRecovery(Ids::TaskId const& id, HostError const& error);

        std::optional<Persistence::ScheduledTask> task(Ids::TaskId const& id) const;
        std::vector<Persistence::ScheduledTask> tasks() const;
        std::vector<Persistence::ScheduledTask> tasksForWorkspace(std::string const& workspacePath) const;
        std::optional<Persistence::ScheduledTask> activeTaskForSession(Ids::SessionId const& sessionId) const;
        std::optional<Persistence::ScheduledTask> activeTaskForTab(Ids::TabId const& tabId) const;
        std::vector<Persistence::ScheduledTask> tasksToRecover() const;

        bool isArmed(Ids::TaskId const& id) const;
        bool isExecuting(Ids::TaskId const& id) const;

        /**
         * @brief Follows a session that was moved to another id.
         */
        void onSessionRekeyed(Ids::SessionId const& from, Ids::SessionId const& to);

        /**
         * @brief Disarms all timers. Task records keep their status so they are recovered on the next start.
         */
        void shutdown();

      private:
        struct TaskRuntime
        {
            std::optional<Claim> claim{std::nullopt};
            std::shared_ptr<boost::asio::steady_timer> timer{};
            bool executing{false};
        };

        void bringUp(
            Ids::TaskId const& id,
            ProcessResult const& result,
            Persistence::TaskStatus status,
            Completion const& done);
        void arm(Ids::TaskId const& id);
        void armAfter(Ids::TaskId const& id, std::chrono::milliseconds delay);
        void onTimer(Ids::TaskId const& id, std::shared_ptr<boost::asio::steady_timer> const& timer);
        void onExecuted(
            Ids::TaskId const& id,
            std::expected<TaskExecutionResult, HostError> const& result);
        std::optional<std::string> endReached(Persistence::ScheduledTask const& task) const;
        std::chrono::milliseconds delayUntilNext(Persistence::ScheduledTask const& task) const;
        void persist(Persistence::ScheduledTask const& task);

      private:
        boost::asio::any_io_executor executor_;
        std::shared_ptr<Persistence::TaskStore> store_;
        std::shared_ptr<OwnershipLedger> ledger_;
        std::shared_ptr<SessionActivationTable> activations_;
        std::shared_ptr<IProcessControl> control_;
        std::shared_ptr<SessionLocks> sessionLocks_;
        TaskSchedulerOptions options_;

        mutable std::mutex guard_;
        PortResolver portResolver_;
        std::unordered_map<std::string, TaskRuntime> runtimes_;
        bool shuttingDown_;
    };

    /// Milliseconds since the unix epoch.
    std::int64_t currentTimeMs();
}
