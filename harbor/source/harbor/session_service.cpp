#include <harbor/session_service.hpp>
#include <harbor/placeholder_session.hpp>
#include <log/log.hpp>
#include <utility/enum_string_convert.hpp>

#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>

#include <algorithm>

namespace Harbor
{
    namespace
    {
        Owner tabOwner(Ids::TabId const& tabId)
        {
            return Owner{.kind = OwnerKind::Tab, .id = tabId.value()};
        }
    }

    struct SessionService::OpenAttempt
    {
        OpenSessionRequest request{};
        Ids::SessionId sessionId{};
        bool isNew{false};
        ProcessKey key{};
        OpenOutcome outcome{OpenOutcome::Opened};
        std::shared_ptr<RetryPolicy> retry{};
        std::optional<Claim> claim{std::nullopt};
        OpenSessionCallback onComplete{};
    };

    SessionService::SessionService(
        boost::asio::any_io_executor executor,
        std::shared_ptr<ProcessRegistry> registry,
        std::shared_ptr<OwnershipLedger> ledger,
        std::shared_ptr<SessionActivationTable> activations,
        std::shared_ptr<EventStreamRouter> router,
        std::shared_ptr<SessionIdentityMigrator> migrator,
        std::shared_ptr<BackgroundCompletionGuardian> guardian,
        std::shared_ptr<TaskScheduler> scheduler,
        std::shared_ptr<IProcessControl> control,
        std::shared_ptr<SessionLocks> sessionLocks,
        SessionServiceOptions options)
        : executor_{std::move(executor)}
        , registry_{std::move(registry)}
        , ledger_{std::move(ledger)}
        , activations_{std::move(activations)}
        , router_{std::move(router)}
        , migrator_{std::move(migrator)}
        , guardian_{std::move(guardian)}
        , scheduler_{std::move(scheduler)}
        , control_{std::move(control)}
        , sessionLocks_{std::move(sessionLocks)}
        , options_{options}
        , guard_{}
        , retryPolicies_{}
        , shuttingDown_{false}
    {}

    bool SessionService::isShuttingDown() const
    {
        std::scoped_lock lock{guard_};
        return shuttingDown_;
    }

    void SessionService::post(OpenSessionCallback const& callback, std::expected<OpenSessionResult, HostError> result)
    {
        if (!callback)
            return;
        boost::asio::post(executor_, [callback, result = std::move(result)]() {
            callback(result);
        });
    }

    void SessionService::complete(
        std::shared_ptr<OpenAttempt> const& attempt,
        std::expected<OpenSessionResult, HostError> result)
    {
        if (result)
        {
            Log::info(
                "Tab {} opened session {}: {}.",
                attempt->request.tabId.value(),
                result->sessionId.value(),
                Utility::enumToString(result->outcome));
        }
        else
        {
            Log::warn(
                "Tab {} could not open session {}: {}",
                attempt->request.tabId.value(),
                attempt->sessionId.value(),
                result.error().toString());
        }
        post(attempt->onComplete, std::move(result));
    }

    std::future<std::expected<OpenSessionResult, HostError>> SessionService::openSession(OpenSessionRequest const& request)
    {
        auto promise = std::make_shared<std::promise<std::expected<OpenSessionResult, HostError>>>();
        auto future = promise->get_future();
        openSession(request, [promise](std::expected<OpenSessionResult, HostError> const& result) {
            promise->set_value(result);
        });
        return future;
    }

    void SessionService::openSession(OpenSessionRequest const& request, OpenSessionCallback onComplete)
    {
        if (isShuttingDown())
            return post(onComplete, std::unexpected(makeError(HostErrorType::ShuttingDown, "Host is shutting down")));
        if (request.workspacePath.empty())
            return post(onComplete, std::unexpected(makeError(HostErrorType::InvalidArgument, "No workspace given")));
        if (!request.tabId.isValid())
            return post(onComplete, std::unexpected(makeError(HostErrorType::InvalidArgument, "No tab given")));

        auto attempt = std::make_shared<OpenAttempt>();
        attempt->request = request;
        attempt->sessionId = request.sessionId.value_or(makePlaceholderSessionId(request.tabId));
        attempt->isNew = !request.sessionId.has_value();
        attempt->onComplete = std::move(onComplete);

        auto lock = sessionLocks_->lock(attempt->sessionId.value());
        const auto decision = activations_->decide(
            LaunchRequest{
                .targetSession = attempt->sessionId,
                .callerTab = request.tabId,
                .callerCurrentSession = request.currentSessionId,
            },
            [this](SessionActivation const& row) {
                return row.homeOwner && ledger_->find(row.sessionId, tabOwner(*row.homeOwner)).has_value();
            });

        switch (decision.outcome)
        {
            case LaunchOutcome::FocusExisting:
            {
                return complete(
                    attempt,
                    OpenSessionResult{
                        .sessionId = attempt->sessionId,
                        .outcome = OpenOutcome::FocusExisting,
                        .port = decision.port,
                        .isNew = attempt->isNew,
                        .focusTab = decision.focusTab,
                    });
            }
            case LaunchOutcome::OpenUnderFreshClaim:
            {
                return complete(
                    attempt,
                    OpenSessionResult{
                        .sessionId = attempt->sessionId,
                        .outcome = OpenOutcome::FreshOwnerRequired,
                        .isNew = attempt->isNew,
                    });
            }
            case LaunchOutcome::AttachToTask:
            {
                if (decision.requiresFreshOwner)
                {
                    return complete(
                        attempt,
                        OpenSessionResult{
                            .sessionId = attempt->sessionId,
                            .outcome = OpenOutcome::FreshOwnerRequired,
                            .port = decision.port,
                            .isNew = attempt->isNew,
                        });
                }
                attempt->outcome = OpenOutcome::AttachedToTask;
                attempt->key = ledger_->keyOf(attempt->sessionId)
                                   .value_or(makeProcessKey(request.workspacePath, attempt->sessionId));
                break;
            }
            case LaunchOutcome::NormalLaunch:
            {
                attempt->outcome = OpenOutcome::Opened;
                attempt->key = makeProcessKey(request.workspacePath, attempt->sessionId);
                break;
            }
        }

        attempt->retry = std::make_shared<RetryPolicy>(RetryOptions{
            .maxAttempts = std::max(0, options_.spawnAttempts - 1),
            .baseDelay = options_.spawnRetryDelay,
            .maxDelay = options_.spawnRetryDelay * 4,
        });
        {
            std::scoped_lock guard{guard_};
            std::erase_if(retryPolicies_, [](auto const& policy) {
                return policy.expired();
            });
            retryPolicies_.push_back(attempt->retry);
        }

        claimAndWait(attempt);
    }

    void SessionService::claimAndWait(std::shared_ptr<OpenAttempt> const& attempt)
    {
        auto lock = sessionLocks_->lock(attempt->sessionId.value());
        auto claim = ledger_->claim(
            attempt->sessionId,
            attempt->key,
            tabOwner(attempt->request.tabId),
            ClaimPolicy::Reject,
            [weak = weak_from_this(), attempt](ProcessResult const& result) {
                if (auto self = weak.lock(); self)
                    self->onProcessReady(attempt, result);
            });

        if (!claim)
        {
            if (claim.error().type == HostErrorType::SingletonConflict && claim.error().conflictingOwner)
            {
                return complete(
                    attempt,
                    OpenSessionResult{
                        .sessionId = attempt->sessionId,
                        .outcome = OpenOutcome::FocusExisting,
                        .isNew = attempt->isNew,
                        .focusTab = Ids::makeTabId(claim.error().conflictingOwner->id),
                    });
            }
            return complete(attempt, std::unexpected(claim.error()));
        }
        attempt->claim = *claim;
    }

    void SessionService::onProcessReady(std::shared_ptr<OpenAttempt> const& attempt, ProcessResult const& result)
    {
        if (!result)
            return retryOrFail(attempt, result.error());

        const auto tabId = attempt->request.tabId;
        {
            auto lock = sessionLocks_->lock(attempt->sessionId.value());
            if (!ledger_->find(attempt->sessionId, tabOwner(tabId)))
            {
                return complete(
                    attempt,
                    std::unexpected(makeError(
                        HostErrorType::NotFound, "The tab released the session while its runtime was starting")));
            }
            activations_->activate(attempt->sessionId, attempt->key.workspacePath, result->port);
            activations_->setHome(attempt->sessionId, tabId);
        }

        // The previous session is released outside of the new session's lock.
        if (attempt->request.currentSessionId && *attempt->request.currentSessionId != attempt->sessionId)
            releaseSession(*attempt->request.currentSessionId, OwnerKind::Tab, tabId.value());

        complete(
            attempt,
            OpenSessionResult{
                .sessionId = attempt->sessionId,
                .outcome = attempt->outcome,
                .port = result->port,
                .isNew = attempt->isNew,
            });
    }

    void SessionService::retryOrFail(std::shared_ptr<OpenAttempt> const& attempt, HostError const& error)
    {
        {
            auto lock = sessionLocks_->lock(attempt->sessionId.value());
            if (attempt->claim)
            {
                ledger_->release(*attempt->claim);
                attempt->claim.reset();
            }
        }

        if (error.type != HostErrorType::SpawnFailed || isShuttingDown())
            return complete(attempt, std::unexpected(error));

        const auto delay = attempt->retry->nextDelay();
        if (!delay)
        {
            auto exhausted = error;
            exhausted.message += " (after " + std::to_string(options_.spawnAttempts) + " attempts)";
            return complete(attempt, std::unexpected(std::move(exhausted)));
        }

        Log::warn(
            "Runtime for session {} failed to start, retrying in {} ms: {}",
            attempt->sessionId.value(),
            delay->count(),
            error.message);
        auto timer = std::make_shared<boost::asio::steady_timer>(executor_, *delay);
        timer->async_wait([weak = weak_from_this(), attempt, timer](boost::system::error_code ec) {
            auto self = weak.lock();
            if (!self)
                return;
            if (ec || self->isShuttingDown() || attempt->retry->cancelled())
            {
                return self->complete(
                    attempt, std::unexpected(makeError(HostErrorType::ShuttingDown, "Host is shutting down")));
            }
            self->claimAndWait(attempt);
        });
    }

    bool SessionService::releaseSession(
        Ids::SessionId const& sessionId,
        OwnerKind ownerKind,
        std::string const& ownerId,
        ReleaseMode mode)
    {
        const Owner owner{.kind = ownerKind, .id = ownerId};
        if (ownerKind == OwnerKind::ScheduledTask)
        {
            const auto task = scheduler_->task(Ids::makeTaskId(ownerId));
            if (!task || task->sessionId != sessionId)
            {
                Log::debug("{} is not bound to session {}.", toString(owner), sessionId.value());
                return false;
            }
            if (auto stopped = scheduler_->stopTask(task->id); !stopped)
            {
                Log::warn("Cannot release task {}: {}", ownerId, stopped.error().toString());
                return false;
            }
            return !ledger_->hasState(sessionId);
        }

        auto lock = sessionLocks_->lock(sessionId.value());
        const auto claim = ledger_->find(sessionId, owner);
        if (!claim)
        {
            Log::debug("{} holds no claim on session {}.", toString(owner), sessionId.value());
            return false;
        }

        if (ownerKind == OwnerKind::BackgroundGuardian)
            return guardian_->release(ownerId);
        if (ownerKind == OwnerKind::SharedRuntime)
        {
            Log::warn("The shared runtime is released by its supervisor, not through session {}.", sessionId.value());
            return false;
        }

        if (ownerKind == OwnerKind::Tab)
            activations_->clearHome(sessionId, Ids::makeTabId(ownerId));

        if (ownerKind == OwnerKind::Tab && mode == ReleaseMode::CompleteInBackground)
        {
            auto takenOver = guardian_->takeOver(*claim);
            if (!takenOver)
                Log::error("Background completion of session {} failed: {}", sessionId.value(), takenOver.error().toString());
            else if (*takenOver)
                return false;
        }

        if (mode == ReleaseMode::StopGeneration)
        {
            if (auto snapshot = registry_->lookup(claim->key);
                snapshot && snapshot->port && snapshot->state == ProcessState::Healthy)
            {
                control_->stopGeneration(*snapshot->port, [sessionId](std::expected<void, HostError> const& result) {
                    if (!result)
                        Log::warn("Stopping generation of session {} failed: {}", sessionId.value(), result.error().toString());
                });
            }
        }

        const bool stopped = ledger_->release(*claim);
        Log::info(
            "{} released session {}{}.", toString(owner), sessionId.value(), stopped ? ", stopping its runtime" : "");
        return stopped;
    }

    std::optional<SessionActivation> SessionService::getSessionActivation(Ids::SessionId const& sessionId) const
    {
        return activations_->lookup(sessionId);
    }

    std::expected<StreamHandle, HostError>
    SessionService::subscribeEvents(Ids::SessionId const& sessionId, Owner const& owner, StreamHandlers handlers)
    {
        auto lock = sessionLocks_->lock(sessionId.value());
        if (!ledger_->find(sessionId, owner))
        {
            return std::unexpected(makeError(
                HostErrorType::NotFound, toString(owner) + " holds no claim on session " + sessionId.value()));
        }
        return router_->attach(owner, sessionId, std::move(handlers));
    }

    bool SessionService::rekeySession(Ids::SessionId const& from, Ids::SessionId const& to)
    {
        auto result = migrator_->rekey(from, to);
        if (result)
            return true;

        if (result.error().type != HostErrorType::MigrationConflict)
        {
            Log::warn("Cannot move session {} to {}: {}", from.value(), to.value(), result.error().toString());
            return false;
        }

        Log::info("Session {} already exists, abandoning placeholder {}.", to.value(), from.value());
        auto lock = sessionLocks_->lock(from.value());
        for (auto const& claim : ledger_->claims(from))
        {
            if (claim.owner.kind == OwnerKind::ScheduledTask)
            {
                Log::warn("Placeholder session {} is still used by task {}.", from.value(), claim.owner.id);
                continue;
            }
            if (claim.owner.kind == OwnerKind::Tab)
                activations_->clearHome(from, Ids::makeTabId(claim.owner.id));
            ledger_->release(claim);
        }
        return false;
    }

    void SessionService::closeTab(Ids::TabId const& tabId)
    {
        for (auto const& claim : ledger_->claimsOf(tabOwner(tabId)))
            releaseSession(claim.sessionId, OwnerKind::Tab, tabId.value());

        for (auto const& task : scheduler_->tasks())
        {
            if (task.tabId == tabId)
            {
                if (auto updated = scheduler_->updateTaskTab(task.id, std::nullopt); !updated)
                    Log::warn("Cannot detach task {} from tab: {}", task.id.value(), updated.error().toString());
            }
        }
    }

    std::optional<unsigned short> SessionService::resolvePort(Ids::SessionId const& sessionId)
    {
        const auto key = ledger_->keyOf(sessionId);
        if (!key)
            return std::nullopt;

        const auto snapshot = registry_->lookup(*key);
        if (snapshot && snapshot->state == ProcessState::Healthy && snapshot->port)
            return snapshot->port;
        if (snapshot && snapshot->state == ProcessState::Spawning)
            return std::nullopt;

        Log::info("Runtime of session {} is gone, starting a new one.", sessionId.value());
        ledger_->refresh(sessionId);
        return std::nullopt;
    }

    void SessionService::shutdown()
    {
        {
            std::scoped_lock lock{guard_};
            if (shuttingDown_)
                return;
            shuttingDown_ = true;
            for (auto const& weak : retryPolicies_)
            {
                if (auto policy = weak.lock(); policy)
                    policy->cancel();
            }
            retryPolicies_.clear();
        }

        Log::info("Shutting down sessions.");
        scheduler_->shutdown();
        guardian_->shutdown();
        router_->shutdown();
        registry_->shutdown();
    }
}
