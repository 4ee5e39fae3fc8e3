#include <harbor/scheduler/task_scheduler.hpp>
#include <harbor/process_key.hpp>
#include <log/log.hpp>

#include <algorithm>

namespace Harbor
{
    using Persistence::ScheduledTask;
    using Persistence::TaskStatus;

    namespace
    {
        Owner taskOwner(Ids::TaskId const& id)
        {
            return Owner{.kind = OwnerKind::ScheduledTask, .id = id.value()};
        }

        bool isActive(ScheduledTask const& task)
        {
            return task.status == TaskStatus::Running || task.status == TaskStatus::Paused;
        }

        Ids::TaskId generateTaskId()
        {
            auto uuid = Ids::generateUuid();
            std::erase(uuid, '-');
            return Ids::makeTaskId("cron_" + uuid.substr(0, 12));
        }
    }

    std::int64_t currentTimeMs()
    {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
                   std::chrono::system_clock::now().time_since_epoch())
            .count();
    }

    TaskScheduler::TaskScheduler(
        boost::asio::any_io_executor executor,
        std::shared_ptr<Persistence::TaskStore> store,
        std::shared_ptr<OwnershipLedger> ledger,
        std::shared_ptr<SessionActivationTable> activations,
        std::shared_ptr<IProcessControl> control,
        std::shared_ptr<SessionLocks> sessionLocks,
        TaskSchedulerOptions options)
        : executor_{std::move(executor)}
        , store_{std::move(store)}
        , ledger_{std::move(ledger)}
        , activations_{std::move(activations)}
        , control_{std::move(control)}
        , sessionLocks_{std::move(sessionLocks)}
        , options_{options}
        , guard_{}
        , portResolver_{}
        , runtimes_{}
        , shuttingDown_{false}
    {}

    TaskScheduler::~TaskScheduler()
    {
        std::scoped_lock lock{guard_};
        for (auto& [id, runtime] : runtimes_)
        {
            if (runtime.timer)
                runtime.timer->cancel();
        }
    }

    void TaskScheduler::setPortResolver(PortResolver resolver)
    {
        std::scoped_lock lock{guard_};
        portResolver_ = std::move(resolver);
    }

    void TaskScheduler::persist(ScheduledTask const& task)
    {
        if (auto result = store_->upsert(task); !result)
            Log::error("Failed to persist scheduled task {}: {}", task.id.value(), result.error());
    }

    std::expected<ScheduledTask, HostError> TaskScheduler::createTask(TaskConfig const& config)
    {
        if (config.workspacePath.empty())
            return std::unexpected(makeError(HostErrorType::InvalidArgument, "A task needs a workspace"));
        if (!config.sessionId.isValid())
            return std::unexpected(makeError(HostErrorType::InvalidArgument, "A task needs a session"));
        if (config.intervalMinutes < options_.minimumInterval.count())
        {
            return std::unexpected(makeError(
                HostErrorType::InvalidArgument,
                "The interval must be at least " + std::to_string(options_.minimumInterval.count()) + " minutes"));
        }

        ScheduledTask task{};
        task.id = generateTaskId();
        task.workspacePath = config.workspacePath;
        task.sessionId = config.sessionId;
        task.prompt = config.prompt;
        task.intervalMinutes = config.intervalMinutes;
        task.endConditions = config.endConditions;
        task.runMode = config.runMode;
        task.status = TaskStatus::Idle;
        task.createdAt = currentTimeMs();
        task.notifyEnabled = config.notifyEnabled;
        task.tabId = config.tabId;
        task.permissionMode = config.permissionMode;
        task.model = config.model;

        if (auto result = store_->upsert(task); !result)
            return std::unexpected(makeError(HostErrorType::InvalidArgument, "Cannot save task: " + result.error()));

        Log::info(
            "Created task {} for session {} every {} minutes.",
            task.id.value(),
            task.sessionId.value(),
            task.intervalMinutes);
        return task;
    }

    std::expected<void, HostError> TaskScheduler::startTask(Ids::TaskId const& id, Completion onStarted)
    {
        auto task = store_->find(id);
        if (!task)
            return std::unexpected(makeError(HostErrorType::NotFound, "No task " + id.value()));

        {
            std::scoped_lock lock{guard_};
            if (shuttingDown_)
                return std::unexpected(makeError(HostErrorType::ShuttingDown, "Host is shutting down"));
            if (runtimes_.contains(id.value()))
                return std::unexpected(makeError(HostErrorType::InvalidArgument, "Task " + id.value() + " is already started"));
        }

        auto lock = sessionLocks_->lock(task->sessionId.value());
        auto claim = ledger_->claim(
            task->sessionId,
            makeProcessKey(task->workspacePath, task->sessionId),
            taskOwner(id),
            ClaimPolicy::Reject,
            [weak = weak_from_this(), id, onStarted = std::move(onStarted)](ProcessResult const& result) {
                auto self = weak.lock();
                if (!self)
                    return;
                self->bringUp(id, result, TaskStatus::Running, onStarted);
            });
        if (!claim)
            return std::unexpected(claim.error());

        std::scoped_lock guard{guard_};
        runtimes_[id.value()].claim = *claim;
        return {};
    }

    void TaskScheduler::restoreTask(Ids::TaskId const& id, Completion onRestored)
    {
        auto task = store_->find(id);
        if (!task)
            return onRestored(std::unexpected(makeError(HostErrorType::NotFound, "No task " + id.value())));

        const auto status = task->status;
        auto lock = sessionLocks_->lock(task->sessionId.value());
        auto claim = ledger_->claim(
            task->sessionId,
            makeProcessKey(task->workspacePath, task->sessionId),
            taskOwner(id),
            ClaimPolicy::Reject,
            [weak = weak_from_this(), id, status, onRestored](ProcessResult const& result) {
                auto self = weak.lock();
                if (!self)
                    return;
                self->bringUp(id, result, status, onRestored);
            });
        if (!claim)
            return onRestored(std::unexpected(claim.error()));

        std::scoped_lock guard{guard_};
        runtimes_[id.value()].claim = *claim;
    }

    void TaskScheduler::bringUp(
        Ids::TaskId const& id,
        ProcessResult const& result,
        TaskStatus status,
        Completion const& done)
    {
        auto task = store_->find(id);
        if (!task)
        {
            if (done)
                done(std::unexpected(makeError(HostErrorType::NotFound, "Task " + id.value() + " was deleted")));
            return;
        }

        auto lock = sessionLocks_->lock(task->sessionId.value());
        std::optional<Claim> claim;
        {
            std::scoped_lock guard{guard_};
            auto iter = runtimes_.find(id.value());
            if (iter != runtimes_.end())
            {
                claim = iter->second.claim;
                if (!result)
                    runtimes_.erase(iter);
            }
        }

        if (!claim)
        {
            if (done)
                done(std::unexpected(makeError(HostErrorType::NotFound, "Task " + id.value() + " was stopped while starting")));
            return;
        }

        if (!result)
        {
            Log::error("Runtime for task {} failed to start: {}", id.value(), result.error().toString());
            ledger_->release(*claim);
            store_->update(id, [&result](ScheduledTask& task) {
                task.lastError = result.error().toString();
            });
            if (done)
                done(std::unexpected(result.error()));
            return;
        }

        activations_->activate(task->sessionId, task->workspacePath, result->port);
        activations_->setTask(task->sessionId, id);
        store_->update(id, [status](ScheduledTask& task) {
            task.status = status;
            task.exitReason.reset();
        });

        Log::info(
            "Task {} is {} on port {}.",
            id.value(),
            Persistence::toWireString(status),
            static_cast<int>(result->port));
        if (status == TaskStatus::Running)
            arm(id);
        if (done)
            done({});
    }

    std::chrono::milliseconds TaskScheduler::delayUntilNext(ScheduledTask const& task) const
    {
        if (!task.lastExecutedAt)
            return options_.firstExecutionDelay;

        const auto next = *task.lastExecutedAt + std::int64_t{task.intervalMinutes} * 60 * 1000;
        const auto now = currentTimeMs();
        if (next <= now)
            return options_.pastDueDelay;
        return std::chrono::milliseconds{next - now};
    }

    void TaskScheduler::arm(Ids::TaskId const& id)
    {
        auto task = store_->find(id);
        if (!task)
            return;
        armAfter(id, delayUntilNext(*task));
    }

    void TaskScheduler::armAfter(Ids::TaskId const& id, std::chrono::milliseconds delay)
    {
        std::scoped_lock lock{guard_};
        if (shuttingDown_)
            return;
        auto iter = runtimes_.find(id.value());
        if (iter == runtimes_.end())
            return;

        auto& runtime = iter->second;
        if (runtime.timer)
            runtime.timer->cancel();
        auto timer = std::make_shared<boost::asio::steady_timer>(executor_, delay);
        runtime.timer = timer;
        timer->async_wait([weak = weak_from_this(), id, timer](boost::system::error_code ec) {
            if (ec)
                return;
            if (auto self = weak.lock(); self)
                self->onTimer(id, timer);
        });
        Log::debug("Task {} fires in {} ms.", id.value(), delay.count());
    }

    std::optional<std::string> TaskScheduler::endReached(ScheduledTask const& task) const
    {
        if (task.endConditions.deadline && currentTimeMs() >= *task.endConditions.deadline)
            return std::string{"deadline_reached"};
        if (task.endConditions.maxExecutions && task.executionCount >= *task.endConditions.maxExecutions)
            return std::string{"max_executions_reached"};
        return std::nullopt;
    }

    void TaskScheduler::onTimer(Ids::TaskId const& id, std::shared_ptr<boost::asio::steady_timer> const& timer)
    {
        PortResolver resolver;
        {
            std::scoped_lock lock{guard_};
            auto iter = runtimes_.find(id.value());
            if (iter == runtimes_.end() || iter->second.timer != timer)
                return;
            iter->second.timer.reset();
            if (iter->second.executing)
            {
                Log::info("Task {} is still executing, skipping this run.", id.value());
                return;
            }
            resolver = portResolver_;
        }

        auto task = store_->find(id);
        if (!task || task->status != TaskStatus::Running)
            return;

        if (auto reason = endReached(*task); reason)
        {
            if (auto stopped = stopTask(id, reason); !stopped)
                Log::error("Failed to stop task {}: {}", id.value(), stopped.error().toString());
            return;
        }

        const auto port = resolver ? resolver(task->sessionId) : std::nullopt;
        if (!port)
        {
            Log::warn("Runtime of task {} is not available, trying again next interval.", id.value());
            store_->update(id, [](ScheduledTask& task) {
                task.lastError = "Agent runtime is not available";
            });
            armAfter(id, std::chrono::minutes{task->intervalMinutes});
            return;
        }

        {
            std::scoped_lock lock{guard_};
            auto iter = runtimes_.find(id.value());
            if (iter == runtimes_.end())
                return;
            iter->second.executing = true;
        }

        TaskExecutionRequest request{
            .taskId = task->id.value(),
            .prompt = task->prompt,
            .sessionId = task->sessionId.value(),
            .isFirstExecution = task->executionCount == 0,
            .aiCanExit = task->endConditions.aiCanExit,
            .permissionMode = task->permissionMode,
            .model = task->model,
            .runMode = task->runMode,
        };
        Log::info("Running task {} (execution {}).", id.value(), task->executionCount + 1);
        control_->executeTask(
            *port,
            request,
            [weak = weak_from_this(), id](std::expected<TaskExecutionResult, HostError> const& result) {
                if (auto self = weak.lock(); self)
                    self->onExecuted(id, result);
            });
    }

    void TaskScheduler::onExecuted(Ids::TaskId const& id, std::expected<TaskExecutionResult, HostError> const& result)
    {
        bool stillStarted = false;
        {
            std::scoped_lock lock{guard_};
            auto iter = runtimes_.find(id.value());
            if (iter != runtimes_.end())
            {
                iter->second.executing = false;
                stillStarted = true;
            }
        }

        const bool success = result && result->success;
        auto updated = store_->update(id, [&result, success](ScheduledTask& task) {
            task.lastExecutedAt = currentTimeMs();
            if (success)
            {
                ++task.executionCount;
                task.lastError.reset();
            }
            else if (!result)
                task.lastError = result.error().toString();
            else
                task.lastError = result->error.value_or("Execution failed");
        });

        if (!updated || !stillStarted)
            return;

        if (success)
            Log::info("Task {} finished execution {}.", id.value(), updated->executionCount);
        else
            Log::warn("Task {} failed: {}", id.value(), updated->lastError.value_or(""));

        std::optional<std::string> stopReason;
        if (result && result->aiRequestedExit && updated->endConditions.aiCanExit)
            stopReason = result->exitReason.value_or("ai_requested_exit");
        else
            stopReason = endReached(*updated);

        if (stopReason)
        {
            if (auto stopped = stopTask(id, stopReason); !stopped)
                Log::error("Failed to stop task {}: {}", id.value(), stopped.error().toString());
            return;
        }

        if (updated->status == TaskStatus::Running)
            arm(id);
    }

    std::expected<void, HostError> TaskScheduler::pauseTask(Ids::TaskId const& id)
    {
        auto task = store_->find(id);
        if (!task)
            return std::unexpected(makeError(HostErrorType::NotFound, "No task " + id.value()));
        if (task->status != TaskStatus::Running)
            return std::unexpected(makeError(HostErrorType::InvalidArgument, "Task " + id.value() + " is not running"));

        {
            std::scoped_lock lock{guard_};
            if (auto iter = runtimes_.find(id.value()); iter != runtimes_.end() && iter->second.timer)
            {
                iter->second.timer->cancel();
                iter->second.timer.reset();
            }
        }
        store_->update(id, [](ScheduledTask& task) {
            task.status = TaskStatus::Paused;
        });
        Log::info("Paused task {}.", id.value());
        return {};
    }

    std::expected<void, HostError> TaskScheduler::resumeTask(Ids::TaskId const& id)
    {
        auto task = store_->find(id);
        if (!task)
            return std::unexpected(makeError(HostErrorType::NotFound, "No task " + id.value()));
        if (task->status != TaskStatus::Paused)
            return std::unexpected(makeError(HostErrorType::InvalidArgument, "Task " + id.value() + " is not paused"));

        bool started = false;
        {
            std::scoped_lock lock{guard_};
            started = runtimes_.contains(id.value());
        }
        if (!started)
            return startTask(id);

        store_->update(id, [](ScheduledTask& task) {
            task.status = TaskStatus::Running;
        });
        Log::info("Resumed task {}.", id.value());
        arm(id);
        return {};
    }

    std::expected<void, HostError> TaskScheduler::stopTask(Ids::TaskId const& id, std::optional<std::string> exitReason)
    {
        auto task = store_->find(id);
        if (!task)
            return std::unexpected(makeError(HostErrorType::NotFound, "No task " + id.value()));

        auto lock = sessionLocks_->lock(task->sessionId.value());
        std::optional<Claim> claim;
        {
            std::scoped_lock guard{guard_};
            if (auto iter = runtimes_.find(id.value()); iter != runtimes_.end())
            {
                if (iter->second.timer)
                    iter->second.timer->cancel();
                claim = iter->second.claim;
                runtimes_.erase(iter);
            }
        }
        if (!claim)
            claim = ledger_->find(task->sessionId, taskOwner(id));

        store_->update(id, [&exitReason](ScheduledTask& task) {
            task.status = TaskStatus::Stopped;
            task.exitReason = exitReason;
        });
        activations_->clearTask(task->sessionId, id);
        if (claim)
            ledger_->release(*claim);

        Log::info("Stopped task {}{}.", id.value(), exitReason ? " (" + *exitReason + ")" : std::string{});
        return {};
    }

    std::expected<void, HostError> TaskScheduler::deleteTask(Ids::TaskId const& id)
    {
        auto task = store_->find(id);
        if (!task)
            return std::unexpected(makeError(HostErrorType::NotFound, "No task " + id.value()));

        bool started = false;
        {
            std::scoped_lock lock{guard_};
            started = runtimes_.contains(id.value());
        }
        if (started || isActive(*task))
        {
            if (auto stopped = stopTask(id); !stopped)
                return stopped;
        }

        store_->remove(id);
        Log::info("Deleted task {}.", id.value());
        return {};
    }

    std::expected<void, HostError> TaskScheduler::updateTaskTab(Ids::TaskId const& id, std::optional<Ids::TabId> tabId)
    {
        auto updated = store_->update(id, [&tabId](ScheduledTask& task) {
            task.tabId = tabId;
        });
        if (!updated)
            return std::unexpected(makeError(HostErrorType::NotFound, "No task " + id.value()));
        return {};
    }

    void TaskScheduler::failRecovery(Ids::TaskId const& id, HostError const& error)
    {
        auto task = store_->find(id);
        if (!task)
            return;

        auto lock = sessionLocks_->lock(task->sessionId.value());
        std::optional<Claim> claim;
        {
            std::scoped_lock guard{guard_};
            if (auto iter = runtimes_.find(id.value()); iter != runtimes_.end())
            {
                if (iter->second.timer)
                    iter->second.timer->cancel();
                claim = iter->second.claim;
                runtimes_.erase(iter);
            }
        }
        activations_->clearTask(task->sessionId, id);
        if (claim)
            ledger_->release(*claim);

        Log::warn("Task {} could not be recovered: {}", id.value(), error.toString());
        store_->update(id, [&error](ScheduledTask& task) {
            task.status = TaskStatus::Stopped;
            task.exitReason = "recovery_failed";
            task.lastError = error.toString();
        });
    }

    std::optional<ScheduledTask> TaskScheduler::task(Ids::TaskId const& id) const
    {
        return store_->find(id);
    }

    std::vector<ScheduledTask> TaskScheduler::tasks() const
    {
        return store_->all();
    }

    std::vector<ScheduledTask> TaskScheduler::tasksForWorkspace(std::string const& workspacePath) const
    {
        const auto normalized = normalizeWorkspacePath(workspacePath);
        auto all = store_->all();
        std::erase_if(all, [&normalized](auto const& task) {
            return normalizeWorkspacePath(task.workspacePath) != normalized;
        });
        return all;
    }

    std::optional<ScheduledTask> TaskScheduler::activeTaskForSession(Ids::SessionId const& sessionId) const
    {
        for (auto const& task : store_->all())
        {
            if (task.sessionId == sessionId && isActive(task))
                return task;
        }
        return std::nullopt;
    }

    std::optional<ScheduledTask> TaskScheduler::activeTaskForTab(Ids::TabId const& tabId) const
    {
        for (auto const& task : store_->all())
        {
            if (task.tabId == tabId && isActive(task))
                return task;
        }
        return std::nullopt;
    }

    std::vector<ScheduledTask> TaskScheduler::tasksToRecover() const
    {
        auto all = store_->all();
        std::erase_if(all, [](auto const& task) {
            return !isActive(task);
        });
        return all;
    }

    bool TaskScheduler::isArmed(Ids::TaskId const& id) const
    {
        std::scoped_lock lock{guard_};
        auto iter = runtimes_.find(id.value());
        return iter != runtimes_.end() && iter->second.timer != nullptr;
    }

    bool TaskScheduler::isExecuting(Ids::TaskId const& id) const
    {
        std::scoped_lock lock{guard_};
        auto iter = runtimes_.find(id.value());
        return iter != runtimes_.end() && iter->second.executing;
    }

    void TaskScheduler::onSessionRekeyed(Ids::SessionId const& from, Ids::SessionId const& to)
    {
        for (auto const& task : store_->all())
        {
            if (task.sessionId != from)
                continue;

            store_->update(task.id, [&to](ScheduledTask& task) {
                task.sessionId = to;
            });

            std::scoped_lock lock{guard_};
            if (auto iter = runtimes_.find(task.id.value()); iter != runtimes_.end())
                iter->second.claim = ledger_->find(to, taskOwner(task.id));
            Log::info("Task {} follows its session to {}.", task.id.value(), to.value());
        }
    }

    void TaskScheduler::shutdown()
    {
        std::scoped_lock lock{guard_};
        shuttingDown_ = true;
        for (auto& [id, runtime] : runtimes_)
        {
            if (runtime.timer)
            {
                runtime.timer->cancel();
                runtime.timer.reset();
            }
        }
    }
}
