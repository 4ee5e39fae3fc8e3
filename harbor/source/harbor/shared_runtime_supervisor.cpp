#include <harbor/shared_runtime_supervisor.hpp>
#include <constants/sidecar.hpp>
#include <log/log.hpp>

#include <boost/asio/post.hpp>

namespace Harbor
{
    SharedRuntimeSupervisor::SharedRuntimeSupervisor(
        boost::asio::any_io_executor executor,
        std::shared_ptr<OwnershipLedger> ledger,
        std::shared_ptr<SessionLocks> sessionLocks,
        SharedRuntimeSupervisorOptions options)
        : executor_{std::move(executor)}
        , ledger_{std::move(ledger)}
        , sessionLocks_{std::move(sessionLocks)}
        , sessionId_{Ids::makeSessionId(Constants::sharedRuntimeSessionId)}
        , key_{makeProcessKey(options.workspacePath, sessionId_)}
        , owner_{.kind = OwnerKind::SharedRuntime, .id = Constants::sharedRuntimeSessionId}
        , retry_{options.retry}
        , guard_{}
        , state_{SharedRuntimeState::Stopped}
        , claim_{std::nullopt}
        , port_{std::nullopt}
        , failedAttempts_{0}
        , shuttingDown_{false}
        , retryTimer_{executor_}
        , onSettled_{}
    {}

    SharedRuntimeSupervisor::~SharedRuntimeSupervisor()
    {
        std::scoped_lock lock{guard_};
        retryTimer_.cancel();
    }

    void SharedRuntimeSupervisor::start(SharedRuntimeCallback onSettled)
    {
        {
            std::scoped_lock lock{guard_};
            if (shuttingDown_)
            {
                if (onSettled)
                {
                    boost::asio::post(executor_, [onSettled = std::move(onSettled)]() {
                        onSettled(std::unexpected(makeError(HostErrorType::ShuttingDown, "Host is shutting down")));
                    });
                }
                return;
            }
            if (state_ == SharedRuntimeState::Starting || state_ == SharedRuntimeState::Running)
            {
                Log::debug("Shared runtime is already {}.", state_ == SharedRuntimeState::Running ? "running" : "starting");
                return;
            }
            state_ = SharedRuntimeState::Starting;
            failedAttempts_ = 0;
            onSettled_ = std::move(onSettled);
        }
        retry_.reset();

        Log::info("Starting the shared runtime in {}.", key_.workspacePath);
        attempt();
    }

    void SharedRuntimeSupervisor::attempt()
    {
        auto lock = sessionLocks_->lock(sessionId_.value());
        {
            std::scoped_lock guard{guard_};
            if (shuttingDown_)
                return;
        }

        auto claim = ledger_->claim(
            sessionId_, key_, owner_, ClaimPolicy::Reject, [weak = weak_from_this()](ProcessResult const& result) {
                if (auto self = weak.lock(); self)
                    self->onReady(result);
            });
        if (!claim)
            return onFailure(claim.error());

        std::scoped_lock guard{guard_};
        claim_ = *claim;
    }

    void SharedRuntimeSupervisor::onReady(ProcessResult const& result)
    {
        auto lock = sessionLocks_->lock(sessionId_.value());
        if (!result)
            return onFailure(result.error());

        {
            std::scoped_lock guard{guard_};
            if (shuttingDown_ || !claim_)
                return;
            state_ = SharedRuntimeState::Running;
            port_ = result->port;
            failedAttempts_ = 0;
        }
        retry_.reset();

        Log::info("Shared runtime is ready on port {}.", result->port);
        settle(result->port);
    }

    // Called with the session lock held.
    void SharedRuntimeSupervisor::onFailure(HostError const& error)
    {
        std::optional<Claim> claim;
        int failed = 0;
        {
            std::scoped_lock guard{guard_};
            claim.swap(claim_);
            port_.reset();
            failed = ++failedAttempts_;
        }
        if (claim)
            ledger_->release(*claim);

        const auto delay = retry_.nextDelay();
        if (!delay)
        {
            {
                std::scoped_lock guard{guard_};
                if (shuttingDown_)
                    return;
                state_ = SharedRuntimeState::Failed;
            }
            Log::error("Shared runtime failed to start after {} attempts: {}", failed, error.toString());
            return settle(std::unexpected(error));
        }

        Log::warn(
            "Shared runtime failed to start, retry {}/{} in {} ms: {}",
            retry_.attempts(),
            retry_.options().maxAttempts,
            delay->count(),
            error.message);

        std::scoped_lock guard{guard_};
        if (shuttingDown_)
            return;
        retryTimer_.expires_after(*delay);
        retryTimer_.async_wait([weak = weak_from_this()](boost::system::error_code ec) {
            if (ec)
                return;
            if (auto self = weak.lock(); self)
                self->attempt();
        });
    }

    void SharedRuntimeSupervisor::settle(std::expected<unsigned short, HostError> const& result)
    {
        SharedRuntimeCallback onSettled;
        {
            std::scoped_lock guard{guard_};
            onSettled = std::move(onSettled_);
            onSettled_ = {};
        }
        if (onSettled)
            onSettled(result);
    }

    void SharedRuntimeSupervisor::shutdown()
    {
        std::optional<Claim> claim;
        SharedRuntimeCallback onSettled;
        {
            std::scoped_lock guard{guard_};
            if (shuttingDown_)
                return;
            shuttingDown_ = true;
            retry_.cancel();
            retryTimer_.cancel();
            claim.swap(claim_);
            port_.reset();
            onSettled = std::move(onSettled_);
            onSettled_ = {};
            state_ = SharedRuntimeState::Stopped;
        }

        if (claim)
        {
            auto lock = sessionLocks_->lock(sessionId_.value());
            ledger_->release(*claim);
            Log::info("Shared runtime released.");
        }
        if (onSettled)
            onSettled(std::unexpected(makeError(HostErrorType::ShuttingDown, "Host is shutting down")));
    }

    SharedRuntimeState SharedRuntimeSupervisor::state() const
    {
        std::scoped_lock guard{guard_};
        return state_;
    }

    std::optional<unsigned short> SharedRuntimeSupervisor::port() const
    {
        std::scoped_lock guard{guard_};
        return port_;
    }

    int SharedRuntimeSupervisor::failedAttempts() const
    {
        std::scoped_lock guard{guard_};
        return failedAttempts_;
    }

    Ids::SessionId const& SharedRuntimeSupervisor::sessionId() const
    {
        return sessionId_;
    }

    Owner const& SharedRuntimeSupervisor::owner() const
    {
        return owner_;
    }
}
