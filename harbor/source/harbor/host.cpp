#include <harbor/host.hpp>
#include <harbor/control/http_process_control.hpp>
#include <harbor/process/boost_process_launcher.hpp>
#include <harbor/process/system_process_table.hpp>
#include <harbor/process/tcp_readiness_probe.hpp>
#include <harbor/stream/beast_event_source.hpp>
#include <constants/sidecar.hpp>
#include <log/log.hpp>

#include <boost/process/v2/pid.hpp>

#include <stdexcept>
#include <string>
#include <system_error>

namespace Harbor
{
    namespace
    {
        Persistence::State withDefaults(Persistence::State state)
        {
            state.useDefaultsFrom(Persistence::State::defaults());
            return state;
        }

        std::expected<PortAllocator::Options, HostError> checkedPortOptions(Persistence::SidecarOptions const& sidecar)
        {
            return PortAllocator::makeOptions(*sidecar.basePort, *sidecar.portRange, *sidecar.maxPortAttempts);
        }

        PortAllocator::Options portOptionsFrom(Persistence::SidecarOptions const& sidecar)
        {
            auto options = checkedPortOptions(sidecar);
            if (!options)
                throw std::invalid_argument{options.error().toString()};
            return *options;
        }

        ProcessRegistryOptions registryOptionsFrom(Persistence::SidecarOptions const& sidecar)
        {
            using std::chrono::milliseconds;
            using std::chrono::seconds;

            return ProcessRegistryOptions{
                .command = *sidecar.command,
                .arguments = *sidecar.arguments,
                .environment = *sidecar.environment,
                .pathExtension = *sidecar.pathExtension,
                .marker = *sidecar.marker,
                .healthCheckAttempts = *sidecar.healthCheckAttempts,
                .healthCheckDelay = milliseconds{*sidecar.healthCheckDelayMs},
                .healthCheckTimeout = milliseconds{*sidecar.healthCheckTimeoutMs},
                .gracefulShutdown = seconds{*sidecar.gracefulShutdownSeconds},
                .killPollInterval = milliseconds{*sidecar.killPollIntervalMs},
                .idleGracePeriod = milliseconds{*sidecar.idleGracePeriodMs},
                .healthMonitorInterval = milliseconds{*sidecar.healthMonitorIntervalMs},
            };
        }

        RetryOptions retryOptionsFrom(Persistence::StreamOptions const& stream)
        {
            return RetryOptions{
                .maxAttempts = *stream.reconnectMaxAttempts,
                .baseDelay = std::chrono::milliseconds{*stream.reconnectBaseDelayMs},
                .maxDelay = std::chrono::milliseconds{*stream.reconnectMaxDelayMs},
            };
        }

        std::filesystem::path sharedWorkspaceFrom(Persistence::SharedRuntimeOptions const& shared)
        {
            if (!shared.workspacePath->empty())
                return *shared.workspacePath;

            std::error_code ec;
            auto base = std::filesystem::temp_directory_path(ec);
            if (ec)
                base = ".";
            return base /
                (std::string{Constants::sharedRuntimeDirectoryPrefix} +
                 std::to_string(boost::process::v2::current_pid()));
        }

        RetryOptions retryOptionsFrom(Persistence::SharedRuntimeOptions const& shared)
        {
            return RetryOptions{
                .maxAttempts = *shared.retryAttempts,
                .baseDelay = std::chrono::milliseconds{*shared.retryBaseDelayMs},
                .maxDelay = std::chrono::milliseconds{*shared.retryMaxDelayMs},
            };
        }

        TaskSchedulerOptions schedulerOptionsFrom(Persistence::SchedulerOptions const& scheduler)
        {
            return TaskSchedulerOptions{
                .minimumInterval = std::chrono::minutes{*scheduler.minimumIntervalMinutes},
                .firstExecutionDelay = std::chrono::seconds{*scheduler.firstExecutionDelaySeconds},
                .pastDueDelay = std::chrono::seconds{*scheduler.pastDueDelaySeconds},
            };
        }
    }

    Host::Host(
        boost::asio::any_io_executor executor,
        Persistence::State state,
        std::shared_ptr<Persistence::TaskStore> taskStore,
        HostDependencies dependencies)
        : state_{withDefaults(std::move(state))}
        , sessionLocks_{std::make_shared<SessionLocks>()}
        , registry_{std::make_shared<ProcessRegistry>(
              executor,
              dependencies.launcher,
              dependencies.probe,
              std::make_shared<PortAllocator>(portOptionsFrom(state_.sidecar), dependencies.isPortAvailable),
              registryOptionsFrom(state_.sidecar))}
        , ledger_{std::make_shared<OwnershipLedger>(registry_)}
        , activations_{std::make_shared<SessionActivationTable>()}
        , router_{std::make_shared<EventStreamRouter>(
              executor,
              dependencies.eventSources,
              retryOptionsFrom(state_.stream),
              static_cast<std::size_t>(*state_.stream.seenIdCapacity))}
        , migrator_{std::make_shared<SessionIdentityMigrator>(registry_, ledger_, activations_, router_, sessionLocks_)}
        , guardian_{std::make_shared<BackgroundCompletionGuardian>(
              executor,
              ledger_,
              router_,
              sessionLocks_,
              std::chrono::seconds{*state_.guardianMaxHoldSeconds})}
        , scheduler_{std::make_shared<TaskScheduler>(
              executor,
              std::move(taskStore),
              ledger_,
              activations_,
              dependencies.control,
              sessionLocks_,
              schedulerOptionsFrom(state_.scheduler))}
        , sessions_{std::make_shared<SessionService>(
              executor,
              registry_,
              ledger_,
              activations_,
              router_,
              migrator_,
              guardian_,
              scheduler_,
              dependencies.control,
              sessionLocks_,
              SessionServiceOptions{.spawnAttempts = *state_.spawnAttempts})}
        , recovery_{scheduler_}
        , processTable_{std::move(dependencies.processTable)}
        , sharedWorkspace_{sharedWorkspaceFrom(state_.sharedRuntime)}
        , ownsSharedWorkspace_{state_.sharedRuntime.workspacePath->empty()}
        , sharedRuntime_{std::make_shared<SharedRuntimeSupervisor>(
              executor,
              ledger_,
              sessionLocks_,
              SharedRuntimeSupervisorOptions{
                  .workspacePath = sharedWorkspace_.string(),
                  .retry = retryOptionsFrom(state_.sharedRuntime),
              })}
    {
        // Streams of an owner are closed before its claim goes away, so no stream outlives its process.
        ledger_->setReleaseBarrier([router = std::weak_ptr<EventStreamRouter>{router_}](Claim const& claim) {
            if (auto strong = router.lock(); strong)
                strong->detachOwner(claim.owner, claim.sessionId);
        });

        const auto resolvePort = [sessions = std::weak_ptr<SessionService>{sessions_}](Ids::SessionId const& sessionId) {
            if (auto strong = sessions.lock(); strong)
                return strong->resolvePort(sessionId);
            return std::optional<unsigned short>{};
        };
        router_->setPortResolver(resolvePort);
        scheduler_->setPortResolver(resolvePort);

        migrator_->addListener([scheduler = std::weak_ptr<TaskScheduler>{scheduler_}](auto const& from, auto const& to) {
            if (auto strong = scheduler.lock(); strong)
                strong->onSessionRekeyed(from, to);
        });
        migrator_->addListener([guardian = std::weak_ptr<BackgroundCompletionGuardian>{guardian_}](
                                   auto const& from, auto const& to) {
            if (auto strong = guardian.lock(); strong)
                strong->onSessionRekeyed(from, to);
        });
    }

    std::expected<void, HostError> Host::validateConfiguration(Persistence::State const& state)
    {
        const auto filled = withDefaults(state);
        if (auto ports = checkedPortOptions(filled.sidecar); !ports)
            return std::unexpected(ports.error());
        return {};
    }

    Host::~Host()
    {
        sharedRuntime_->shutdown();
        sessions_->shutdown();
    }

    HostDependencies Host::systemDependencies(boost::asio::any_io_executor executor, Persistence::State const& state)
    {
        const auto filled = withDefaults(state);
        return HostDependencies{
            .launcher = std::make_shared<BoostProcessLauncher>(executor),
            .probe = std::make_shared<TcpReadinessProbe>(executor),
            .control = std::make_shared<HttpProcessControl>(
                executor,
                std::chrono::seconds{10},
                std::chrono::seconds{*filled.scheduler.executeTimeoutSeconds}),
            .eventSources = std::make_shared<BeastEventSourceFactory>(executor),
            .processTable = std::make_shared<SystemProcessTable>(),
        };
    }

    SweepReport Host::sweepStaleRuntimes()
    {
        if (!processTable_)
            return {};

        StaleRuntimeSweeper sweeper{
            processTable_,
            StaleRuntimeSweepOptions{
                .marker = *state_.sidecar.marker,
                .gracePeriod = std::chrono::seconds{*state_.sidecar.gracefulShutdownSeconds},
                .pollInterval = std::chrono::milliseconds{*state_.sidecar.killPollIntervalMs},
            }};
        return sweeper.sweep();
    }

    bool Host::startSharedRuntime(SharedRuntimeCallback onSettled)
    {
        if (!*state_.sharedRuntime.enabled)
        {
            Log::info("Shared runtime is disabled.");
            return false;
        }

        std::error_code ec;
        std::filesystem::create_directories(sharedWorkspace_, ec);
        if (ec)
            Log::warn("Cannot create shared runtime directory {}: {}", sharedWorkspace_.string(), ec.message());

        sharedRuntime_->start(std::move(onSettled));
        return true;
    }

    RecoveryReport Host::recoverTasks()
    {
        return recovery_.recover();
    }

    bool Host::shutdown(std::chrono::milliseconds timeout)
    {
        sharedRuntime_->shutdown();
        sessions_->shutdown();
        const bool retired = registry_->awaitRetired(timeout);
        if (!retired)
            Log::warn("Not all agent runtimes exited within {} ms.", timeout.count());

        if (ownsSharedWorkspace_)
        {
            std::error_code ec;
            std::filesystem::remove_all(sharedWorkspace_, ec);
            if (ec)
                Log::warn("Cannot remove shared runtime directory {}: {}", sharedWorkspace_.string(), ec.message());
        }
        return retired;
    }

    std::shared_ptr<SessionService> const& Host::sessions() const
    {
        return sessions_;
    }
    std::shared_ptr<TaskScheduler> const& Host::scheduler() const
    {
        return scheduler_;
    }
    std::shared_ptr<ProcessRegistry> const& Host::registry() const
    {
        return registry_;
    }
    std::shared_ptr<OwnershipLedger> const& Host::ledger() const
    {
        return ledger_;
    }
    std::shared_ptr<SessionActivationTable> const& Host::activations() const
    {
        return activations_;
    }
    std::shared_ptr<EventStreamRouter> const& Host::router() const
    {
        return router_;
    }
    std::shared_ptr<BackgroundCompletionGuardian> const& Host::guardian() const
    {
        return guardian_;
    }
    std::shared_ptr<SessionIdentityMigrator> const& Host::migrator() const
    {
        return migrator_;
    }
    std::shared_ptr<SharedRuntimeSupervisor> const& Host::sharedRuntime() const
    {
        return sharedRuntime_;
    }
    Persistence::State const& Host::state() const
    {
        return state_;
    }
}
