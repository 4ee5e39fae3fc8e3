#include <harbor/process/process_registry.hpp>
#include <log/log.hpp>

#include <boost/asio/post.hpp>

#include <csignal>

namespace Harbor
{
    struct ProcessRegistry::Slot
    {
        Ids::ProcessId id{Ids::generateProcessId()};
        ProcessKey key{};
        ProcessState state{ProcessState::Spawning};
        std::optional<unsigned short> port{std::nullopt};
        long long pid{0};
        std::promise<ProcessResult> promise{};
        ProcessFuture future{};
        std::vector<std::function<void(ProcessResult const&)>> waiters{};
        // released while the spawn was still in progress
        bool abandoned{false};
        std::shared_ptr<boost::asio::steady_timer> idleTimer{};

        ProcessSnapshot snapshot() const
        {
            return ProcessSnapshot{.id = id, .key = key, .port = port, .pid = pid, .state = state};
        }
    };

    ProcessRegistry::ProcessRegistry(
        boost::asio::any_io_executor executor,
        std::shared_ptr<IProcessLauncher> launcher,
        std::shared_ptr<IReadinessProbe> probe,
        std::shared_ptr<PortAllocator> ports,
        ProcessRegistryOptions options)
        : executor_{std::move(executor)}
        , launcher_{std::move(launcher)}
        , probe_{std::move(probe)}
        , ports_{std::move(ports)}
        , options_{std::move(options)}
        , guard_{}
        , retiredCondition_{}
        , active_{}
        , retiring_{}
        , spawnCount_{0}
        , shuttingDown_{false}
        , healthTimer_{executor_}
    {}

    ProcessRegistry::~ProcessRegistry()
    {
        healthTimer_.cancel();
        std::scoped_lock lock{guard_};
        if (!active_.empty() || !retiring_.empty())
        {
            Log::warn(
                "Process registry destroyed with {} active and {} retiring processes.",
                active_.size(),
                retiring_.size());
        }
    }

    ProcessFuture ProcessRegistry::acquire(ProcessKey const& key, std::function<void(ProcessResult const&)> onReady)
    {
        std::scoped_lock lock{guard_};

        if (shuttingDown_)
        {
            std::promise<ProcessResult> promise;
            const ProcessResult result = std::unexpected(makeError(HostErrorType::ShuttingDown, "Host is shutting down"));
            promise.set_value(result);
            if (onReady)
            {
                boost::asio::post(executor_, [onReady = std::move(onReady), result]() {
                    onReady(result);
                });
            }
            return promise.get_future().share();
        }

        if (auto iter = active_.find(key); iter != active_.end())
        {
            auto slot = iter->second;
            if (slot->idleTimer)
            {
                Log::debug("Reusing {} within its idle grace period.", toString(key));
                slot->idleTimer->cancel();
                slot->idleTimer.reset();
            }

            if (slot->state == ProcessState::Unhealthy)
            {
                Log::info("Replacing unhealthy runtime for {}.", toString(key));
                slot->state = ProcessState::Terminated;
                active_.erase(iter);
            }
            else
            {
                if (onReady)
                {
                    if (slot->state == ProcessState::Spawning)
                        slot->waiters.push_back(std::move(onReady));
                    else
                    {
                        boost::asio::post(executor_, [onReady = std::move(onReady), future = slot->future]() {
                            onReady(future.get());
                        });
                    }
                }
                return slot->future;
            }
        }

        auto slot = std::make_shared<Slot>();
        slot->key = key;
        slot->future = slot->promise.get_future().share();
        if (onReady)
            slot->waiters.push_back(std::move(onReady));
        active_[key] = slot;
        ++spawnCount_;

        Log::info("Spawning runtime for {}.", toString(key));
        boost::asio::post(executor_, [weak = weak_from_this(), slot]() {
            if (auto self = weak.lock(); self)
                self->spawn(slot);
        });
        return slot->future;
    }

    std::vector<std::string> ProcessRegistry::buildArguments(ProcessKey const& key, unsigned short port) const
    {
        auto arguments = options_.arguments;
        arguments.push_back("--port");
        arguments.push_back(std::to_string(port));
        arguments.push_back("--agent-dir");
        arguments.push_back(key.workspacePath);
        if (!options_.marker.empty())
            arguments.push_back(options_.marker);
        return arguments;
    }

    void ProcessRegistry::spawn(std::shared_ptr<Slot> const& slot)
    {
        ProcessKey key;
        {
            std::scoped_lock lock{guard_};
            key = slot->key;
        }

        const auto port = ports_->reserve();
        if (!port)
        {
            return completeSpawn(
                slot,
                std::unexpected(makeError(HostErrorType::SpawnFailed, "No free port for the agent runtime")));
        }

        const auto pid = launcher_->spawnProcess(
            options_.command,
            buildArguments(key, *port),
            Environment{false, options_.environment, options_.pathExtension},
            key.purpose);
        if (!pid)
        {
            ports_->release(*port);
            return completeSpawn(slot, std::unexpected(makeError(HostErrorType::SpawnFailed, pid.error())));
        }

        {
            std::scoped_lock lock{guard_};
            slot->port = *port;
            slot->pid = *pid;
        }

        awaitReadiness(slot, 0);
    }

    void ProcessRegistry::awaitReadiness(std::shared_ptr<Slot> const& slot, int attempt)
    {
        ProcessKey key;
        unsigned short port = 0;
        long long pid = 0;
        bool shuttingDown = false;
        {
            std::scoped_lock lock{guard_};
            key = slot->key;
            port = slot->port.value_or(0);
            pid = slot->pid;
            shuttingDown = shuttingDown_;
        }
        if (shuttingDown || attempt >= options_.healthCheckAttempts)
            return failReadiness(slot);

        if (!launcher_->isAlive(pid))
        {
            const auto exitCode = launcher_->waitExit(pid);
            ports_->release(port);
            {
                std::scoped_lock lock{guard_};
                slot->port.reset();
            }
            auto error = makeError(HostErrorType::SpawnFailed, "Agent runtime exited before becoming ready");
            error.exitCode = exitCode;
            return completeSpawn(slot, std::unexpected(std::move(error)));
        }

        probe_->probe(
            port,
            options_.healthCheckTimeout,
            [weak = weak_from_this(), slot, attempt, key, port, pid](bool ready) {
                auto self = weak.lock();
                if (!self)
                    return;

                if (ready)
                {
                    Log::info("Runtime for {} is ready on port {} (pid {}).", toString(key), port, pid);
                    return self->completeSpawn(slot, ProcessHandle{.id = slot->id, .key = key, .port = port, .pid = pid});
                }

                auto timer = std::make_shared<boost::asio::steady_timer>(self->executor_, self->options_.healthCheckDelay);
                timer->async_wait([weak, slot, attempt, timer](boost::system::error_code ec) {
                    if (ec)
                        return;
                    if (auto self = weak.lock(); self)
                        self->awaitReadiness(slot, attempt + 1);
                });
            });
    }

    void ProcessRegistry::failReadiness(std::shared_ptr<Slot> const& slot)
    {
        {
            std::scoped_lock lock{guard_};
            if (auto iter = active_.find(slot->key); iter != active_.end() && iter->second == slot)
                active_.erase(iter);
            retiring_.insert(slot);
        }
        beginTermination(slot);

        bool shuttingDown = false;
        {
            std::scoped_lock lock{guard_};
            shuttingDown = shuttingDown_;
        }
        if (shuttingDown)
            return completeSpawn(slot, std::unexpected(makeError(HostErrorType::ShuttingDown, "Host is shutting down")));

        completeSpawn(
            slot,
            std::unexpected(makeError(
                HostErrorType::SpawnFailed,
                "Agent runtime did not become ready after " + std::to_string(options_.healthCheckAttempts) +
                    " health checks")));
    }

    void ProcessRegistry::completeSpawn(std::shared_ptr<Slot> const& slot, ProcessResult const& result)
    {
        std::vector<std::function<void(ProcessResult const&)>> waiters;
        bool tearDown = false;
        {
            std::scoped_lock lock{guard_};
            waiters = std::move(slot->waiters);
            slot->waiters.clear();

            if (result)
            {
                tearDown = slot->abandoned || shuttingDown_;
                if (tearDown && !slot->abandoned)
                {
                    if (auto iter = active_.find(slot->key); iter != active_.end() && iter->second == slot)
                        active_.erase(iter);
                    retiring_.insert(slot);
                }
                slot->state = ProcessState::Healthy;
            }
            else
            {
                Log::error("Spawning runtime for {} failed: {}", toString(slot->key), result.error().toString());
                if (auto iter = active_.find(slot->key); iter != active_.end() && iter->second == slot)
                    active_.erase(iter);
                if (slot->state == ProcessState::Spawning)
                {
                    slot->state = ProcessState::Terminated;
                    retiring_.erase(slot);
                }
            }
        }
        retiredCondition_.notify_all();

        slot->promise.set_value(result);
        for (auto const& waiter : waiters)
            waiter(result);

        if (tearDown)
        {
            Log::info("Runtime for {} was released while starting, tearing it down.", toString(slot->key));
            beginTermination(slot);
        }
    }

    void ProcessRegistry::release(ProcessKey const& key)
    {
        std::scoped_lock lock{guard_};
        auto iter = active_.find(key);
        if (iter == active_.end())
            return;

        auto slot = iter->second;
        if (options_.idleGracePeriod.count() > 0 && slot->state == ProcessState::Healthy && !shuttingDown_)
        {
            auto timer = std::make_shared<boost::asio::steady_timer>(executor_, options_.idleGracePeriod);
            slot->idleTimer = timer;
            timer->async_wait([weak = weak_from_this(), slot, timer](boost::system::error_code ec) {
                if (ec)
                    return;
                if (auto self = weak.lock(); self)
                    self->retireIdle(slot, timer);
            });
            return;
        }

        active_.erase(iter);
        switch (slot->state)
        {
            case ProcessState::Spawning:
            {
                retiring_.insert(slot);
                slot->abandoned = true;
                Log::info("Runtime for {} released while starting, will stop once started.", toString(key));
                return;
            }
            case ProcessState::Healthy:
            {
                retiring_.insert(slot);
                boost::asio::post(executor_, [weak = weak_from_this(), slot]() {
                    if (auto self = weak.lock(); self)
                        self->beginTermination(slot);
                });
                return;
            }
            default:
            {
                // Unhealthy processes are already dead and reaped.
                slot->state = ProcessState::Terminated;
                return;
            }
        }
    }

    void ProcessRegistry::retireIdle(
        std::shared_ptr<Slot> const& slot,
        std::shared_ptr<boost::asio::steady_timer> const& timer)
    {
        {
            std::scoped_lock lock{guard_};
            if (slot->idleTimer != timer)
                return;
            slot->idleTimer.reset();

            auto iter = active_.find(slot->key);
            if (iter == active_.end() || iter->second != slot)
                return;

            active_.erase(iter);
            if (slot->state != ProcessState::Healthy)
            {
                slot->state = ProcessState::Terminated;
                return;
            }
            retiring_.insert(slot);
        }
        Log::debug("Idle grace period of {} elapsed.", toString(slot->key));
        beginTermination(slot);
    }

    void ProcessRegistry::beginTermination(std::shared_ptr<Slot> const& slot)
    {
        long long pid = 0;
        {
            std::scoped_lock lock{guard_};
            if (slot->state != ProcessState::Healthy && slot->state != ProcessState::Spawning)
                return;
            slot->state = ProcessState::Terminating;
            pid = slot->pid;
        }

        Log::info("Stopping runtime for {} (pid {}).", toString(slot->key), pid);
        if (!launcher_->isAlive(pid))
            return finishTermination(slot);

        launcher_->sendSignal(pid, SIGTERM);
        pollTermination(
            slot,
            std::make_shared<boost::asio::steady_timer>(executor_),
            std::chrono::steady_clock::now() + options_.gracefulShutdown,
            false);
    }

    void ProcessRegistry::pollTermination(
        std::shared_ptr<Slot> const& slot,
        std::shared_ptr<boost::asio::steady_timer> const& timer,
        std::chrono::steady_clock::time_point deadline,
        bool killed)
    {
        timer->expires_after(options_.killPollInterval);
        timer->async_wait([weak = weak_from_this(), slot, timer, deadline, killed](boost::system::error_code ec) {
            if (ec)
                return;
            auto self = weak.lock();
            if (!self)
                return;

            if (!self->launcher_->isAlive(slot->pid))
                return self->finishTermination(slot);

            bool nowKilled = killed;
            if (!killed && std::chrono::steady_clock::now() >= deadline)
            {
                Log::warn("Runtime pid {} ignored SIGTERM, sending SIGKILL.", slot->pid);
                self->launcher_->sendSignal(slot->pid, SIGKILL);
                nowKilled = true;
            }
            self->pollTermination(slot, timer, deadline, nowKilled);
        });
    }

    void ProcessRegistry::finishTermination(std::shared_ptr<Slot> const& slot)
    {
        const auto exitCode = launcher_->waitExit(slot->pid);

        std::optional<unsigned short> port;
        {
            std::scoped_lock lock{guard_};
            port = slot->port;
            slot->port.reset();
            slot->state = ProcessState::Terminated;
            retiring_.erase(slot);
        }
        if (port)
            ports_->release(*port);
        retiredCondition_.notify_all();

        Log::info(
            "Runtime for {} terminated with exit code {}.",
            toString(slot->key),
            exitCode ? std::to_string(*exitCode) : std::string{"unknown"});
    }

    std::optional<ProcessSnapshot> ProcessRegistry::lookup(ProcessKey const& key) const
    {
        std::scoped_lock lock{guard_};
        auto iter = active_.find(key);
        if (iter == active_.end())
            return std::nullopt;
        return iter->second->snapshot();
    }

    bool ProcessRegistry::contains(ProcessKey const& key) const
    {
        std::scoped_lock lock{guard_};
        return active_.contains(key);
    }

    bool ProcessRegistry::rekey(ProcessKey const& from, ProcessKey const& to)
    {
        std::scoped_lock lock{guard_};
        if (from == to)
            return active_.contains(from);
        if (active_.contains(to))
            return false;

        auto node = active_.extract(from);
        if (node.empty())
            return false;

        node.key() = to;
        node.mapped()->key = to;
        active_.insert(std::move(node));
        Log::debug("Runtime {} now serves {}.", toString(from), toString(to));
        return true;
    }

    std::size_t ProcessRegistry::activeCount() const
    {
        std::scoped_lock lock{guard_};
        return active_.size();
    }

    std::size_t ProcessRegistry::retiringCount() const
    {
        std::scoped_lock lock{guard_};
        return retiring_.size();
    }

    std::size_t ProcessRegistry::spawnCount() const
    {
        std::scoped_lock lock{guard_};
        return spawnCount_;
    }

    void ProcessRegistry::checkHealth()
    {
        std::vector<std::shared_ptr<Slot>> healthy;
        {
            std::scoped_lock lock{guard_};
            for (auto const& [key, slot] : active_)
            {
                if (slot->state == ProcessState::Healthy)
                    healthy.push_back(slot);
            }
        }

        for (auto const& slot : healthy)
        {
            if (launcher_->isAlive(slot->pid))
                continue;

            std::optional<unsigned short> port;
            {
                std::scoped_lock lock{guard_};
                auto iter = active_.find(slot->key);
                if (iter == active_.end() || iter->second != slot || slot->state != ProcessState::Healthy)
                    continue;
                slot->state = ProcessState::Unhealthy;
                port = slot->port;
                slot->port.reset();
            }

            const auto exitCode = launcher_->waitExit(slot->pid);
            if (port)
                ports_->release(*port);
            Log::warn(
                "Runtime for {} died unexpectedly (exit code {}).",
                toString(slot->key),
                exitCode ? std::to_string(*exitCode) : std::string{"unknown"});
        }
    }

    void ProcessRegistry::startHealthMonitor()
    {
        if (options_.healthMonitorInterval.count() <= 0)
            return;
        scheduleHealthCheck();
    }

    void ProcessRegistry::scheduleHealthCheck()
    {
        healthTimer_.expires_after(options_.healthMonitorInterval);
        healthTimer_.async_wait([weak = weak_from_this()](boost::system::error_code ec) {
            if (ec)
                return;
            auto self = weak.lock();
            if (!self)
                return;

            self->checkHealth();
            {
                std::scoped_lock lock{self->guard_};
                if (self->shuttingDown_)
                    return;
            }
            self->scheduleHealthCheck();
        });
    }

    void ProcessRegistry::shutdown()
    {
        std::vector<std::shared_ptr<Slot>> toTerminate;
        {
            std::scoped_lock lock{guard_};
            shuttingDown_ = true;
            for (auto& [key, slot] : active_)
            {
                if (slot->idleTimer)
                {
                    slot->idleTimer->cancel();
                    slot->idleTimer.reset();
                }

                switch (slot->state)
                {
                    case ProcessState::Spawning:
                        slot->abandoned = true;
                        retiring_.insert(slot);
                        break;
                    case ProcessState::Healthy:
                        retiring_.insert(slot);
                        toTerminate.push_back(slot);
                        break;
                    default:
                        slot->state = ProcessState::Terminated;
                        break;
                }
            }
            active_.clear();
        }
        healthTimer_.cancel();

        Log::info("Shutting down {} agent runtimes.", toTerminate.size());
        for (auto const& slot : toTerminate)
            beginTermination(slot);
    }

    bool ProcessRegistry::awaitRetired(std::chrono::milliseconds timeout)
    {
        std::unique_lock lock{guard_};
        return retiredCondition_.wait_for(lock, timeout, [this]() {
            return retiring_.empty();
        });
    }
}
