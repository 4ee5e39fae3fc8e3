#pragma once

#include <harbor/background_completion_guardian.hpp>
#include <harbor/control/process_control.hpp>
#include <harbor/ownership_ledger.hpp>
#include <harbor/process/process_launcher.hpp>
#include <harbor/process/process_registry.hpp>
#include <harbor/process/process_table.hpp>
#include <harbor/process/readiness_probe.hpp>
#include <harbor/process/stale_runtime_sweeper.hpp>
#include <harbor/recovery_coordinator.hpp>
#include <harbor/scheduler/task_scheduler.hpp>
#include <harbor/session_activation_table.hpp>
#include <harbor/session_identity_migrator.hpp>
#include <harbor/session_locks.hpp>
#include <harbor/session_service.hpp>
#include <harbor/shared_runtime_supervisor.hpp>
#include <harbor/stream/event_source.hpp>
#include <harbor/stream/event_stream_router.hpp>
#include <persistence/state/state.hpp>
#include <persistence/task_store.hpp>

#include <boost/asio/any_io_executor.hpp>

#include <expected>
#include <filesystem>
#include <functional>
#include <memory>

namespace Harbor
{
    /**
     * @brief The outside world the host talks to. Tests replace these with mocks and fakes.
     */
    struct HostDependencies
    {
        std::shared_ptr<IProcessLauncher> launcher{};
        std::shared_ptr<IReadinessProbe> probe{};
        std::shared_ptr<IProcessControl> control{};
        std::shared_ptr<IEventSourceFactory> eventSources{};
        /// Optional. Without it no stale runtimes are swept.
        std::shared_ptr<IProcessTable> processTable{};
        std::function<bool(unsigned short)> isPortAvailable{&PortAllocator::canBindLocally};
    };

    /**
     * @brief Builds the host components from the configuration and wires them together.
     */
    class Host
    {
      public:
        /**
         * @throws std::invalid_argument if validateConfiguration rejects the state.
         */
        Host(
            boost::asio::any_io_executor executor,
            Persistence::State state,
            std::shared_ptr<Persistence::TaskStore> taskStore,
            HostDependencies dependencies);
        ~Host();
        Host(Host const&) = delete;
        Host& operator=(Host const&) = delete;
        Host(Host&&) = delete;
        Host& operator=(Host&&) = delete;

        /**
         * @brief Checks the parts of the configuration that cannot be corrected by defaults.
         */
        static std::expected<void, HostError> validateConfiguration(Persistence::State const& state);

        /**
         * @brief Real processes, TCP probing and HTTP control for production use.
         */
        static HostDependencies
        systemDependencies(boost::asio::any_io_executor executor, Persistence::State const& state);

        /**
         * @brief Stops runtimes carrying this host's marker that an earlier run left behind. Must run before
         * anything is spawned.
         */
        SweepReport sweepStaleRuntimes();

        /**
         * @brief Starts the shared runtime unless it is disabled in the configuration.
         *
         * @return false if it is disabled.
         */
        bool startSharedRuntime(SharedRuntimeCallback onSettled = {});

        /**
         * @brief Restores the scheduled tasks of the previous run. Blocks until all of them resolved.
         */
        RecoveryReport recoverTasks();

        /**
         * @brief Stops all work and waits up to the timeout for the processes to be gone.
         */
        bool shutdown(std::chrono::milliseconds timeout);

        std::shared_ptr<SessionService> const& sessions() const;
        std::shared_ptr<TaskScheduler> const& scheduler() const;
        std::shared_ptr<ProcessRegistry> const& registry() const;
        std::shared_ptr<OwnershipLedger> const& ledger() const;
        std::shared_ptr<SessionActivationTable> const& activations() const;
        std::shared_ptr<EventStreamRouter> const& router() const;
        std::shared_ptr<BackgroundCompletionGuardian> const& guardian() const;
        std::shared_ptr<SessionIdentityMigrator> const& migrator() const;
        std::shared_ptr<SharedRuntimeSupervisor> const& sharedRuntime() const;
        Persistence::State const& state() const;

      private:
        Persistence::State state_;
        std::shared_ptr<SessionLocks> sessionLocks_;
        std::shared_ptr<ProcessRegistry> registry_;
        std::shared_ptr<OwnershipLedger> ledger_;
        std::shared_ptr<SessionActivationTable> activations_;
        std::shared_ptr<EventStreamRouter> router_;
        std::shared_ptr<SessionIdentityMigrator> migrator_;
        std::shared_ptr<BackgroundCompletionGuardian> guardian_;
        std::shared_ptr<TaskScheduler> scheduler_;
        std::shared_ptr<SessionService> sessions_;
        RecoveryCoordinator recovery_;
        std::shared_ptr<IProcessTable> processTable_;
        std::filesystem::path sharedWorkspace_;
        bool ownsSharedWorkspace_;
        std::shared_ptr<SharedRuntimeSupervisor> sharedRuntime_;
    };
}
