#include <harbor/background_completion_guardian.hpp>
#include <log/log.hpp>

#include <boost/asio/post.hpp>

#include <algorithm>

namespace Harbor
{
    BackgroundCompletionGuardian::BackgroundCompletionGuardian(
        boost::asio::any_io_executor executor,
        std::shared_ptr<OwnershipLedger> ledger,
        std::shared_ptr<EventStreamRouter> router,
        std::shared_ptr<SessionLocks> sessionLocks,
        std::chrono::seconds maxHold)
        : executor_{std::move(executor)}
        , ledger_{std::move(ledger)}
        , router_{std::move(router)}
        , sessionLocks_{std::move(sessionLocks)}
        , maxHold_{maxHold}
        , guard_{}
        , guards_{}
    {}

    BackgroundCompletionGuardian::~BackgroundCompletionGuardian()
    {
        std::scoped_lock lock{guard_};
        for (auto& [id, guard] : guards_)
        {
            if (guard->maxHoldTimer)
                guard->maxHoldTimer->cancel();
        }
    }

    std::expected<bool, HostError> BackgroundCompletionGuardian::takeOver(Claim const& tabClaim)
    {
        if (!router_->isGenerating(tabClaim.sessionId))
            return false;

        if (isGuarding(tabClaim.sessionId))
        {
            Log::debug("Session {} is already guarded.", tabClaim.sessionId.value());
            return false;
        }

        auto guard = std::make_shared<Guard>();
        guard->id = Ids::generateGuardianId();
        const Owner owner{.kind = OwnerKind::BackgroundGuardian, .id = guard->id.value()};

        auto claim = ledger_->handover(tabClaim, owner);
        if (!claim)
            return std::unexpected(claim.error());
        guard->claim = *claim;

        const auto guardianId = guard->id.value();
        guard->maxHoldTimer = std::make_shared<boost::asio::steady_timer>(executor_, maxHold_);
        {
            std::scoped_lock lock{guard_};
            guards_[guardianId] = guard;
        }
        guard->maxHoldTimer->async_wait([weak = weak_from_this(), guardianId](boost::system::error_code ec) {
            if (ec)
                return;
            if (auto self = weak.lock(); self)
                self->complete(guardianId, "maximum hold time elapsed");
        });

        Log::info(
            "{} left session {} while it was generating, finishing the reply in the background.",
            toString(tabClaim.owner),
            tabClaim.sessionId.value());

        auto stream = router_->attach(
            owner,
            tabClaim.sessionId,
            StreamHandlers{
                .onEvent =
                    [weak = weak_from_this(), guardianId](StreamEvent const& event) {
                        auto self = weak.lock();
                        if (!self)
                            return;
                        if (const auto generating = generationStateOf(event); generating && !*generating)
                            self->scheduleCompletion(guardianId, event.name);
                    },
                .onStateChange =
                    [weak = weak_from_this(), guardianId](StreamState state, std::optional<HostError> const& error) {
                        auto self = weak.lock();
                        if (!self)
                            return;
                        if (state == StreamState::Closed)
                        {
                            self->scheduleCompletion(
                                guardianId, error ? "stream closed: " + error->message : std::string{"stream closed"});
                        }
                    },
            });

        if (!stream)
        {
            Log::warn(
                "Cannot watch session {}: {}", tabClaim.sessionId.value(), stream.error().toString());
            scheduleCompletion(guardianId, "no event stream");
            return true;
        }

        std::scoped_lock lock{guard_};
        if (auto iter = guards_.find(guardianId); iter != guards_.end())
            iter->second->stream = std::move(*stream);
        return true;
    }

    void BackgroundCompletionGuardian::scheduleCompletion(std::string const& guardianId, std::string const& reason)
    {
        boost::asio::post(executor_, [weak = weak_from_this(), guardianId, reason]() {
            if (auto self = weak.lock(); self)
                self->complete(guardianId, reason);
        });
    }

    bool BackgroundCompletionGuardian::release(std::string const& guardianId)
    {
        return complete(guardianId, "released");
    }

    bool BackgroundCompletionGuardian::complete(std::string const& guardianId, std::string const& reason)
    {
        std::shared_ptr<Guard> guard;
        Ids::SessionId sessionId;
        {
            std::scoped_lock lock{guard_};
            auto iter = guards_.find(guardianId);
            if (iter == guards_.end())
                return false;
            sessionId = iter->second->claim.sessionId;
        }

        auto sessionLock = sessionLocks_->lock(sessionId.value());
        {
            std::scoped_lock lock{guard_};
            auto iter = guards_.find(guardianId);
            if (iter == guards_.end())
                return false;
            guard = iter->second;
            guards_.erase(iter);
        }
        return finish(guard, reason);
    }

    bool BackgroundCompletionGuardian::finish(std::shared_ptr<Guard> const& guard, std::string const& reason)
    {
        if (guard->maxHoldTimer)
            guard->maxHoldTimer->cancel();
        guard->stream.close();

        const bool last = ledger_->release(guard->claim);
        Log::info(
            "Background completion of session {} ended ({}){}.",
            guard->claim.sessionId.value(),
            reason,
            last ? ", runtime released" : "");
        return last;
    }

    bool BackgroundCompletionGuardian::isGuarding(Ids::SessionId const& sessionId) const
    {
        std::scoped_lock lock{guard_};
        return std::any_of(guards_.begin(), guards_.end(), [&sessionId](auto const& entry) {
            return entry.second->claim.sessionId == sessionId;
        });
    }

    std::size_t BackgroundCompletionGuardian::guardedCount() const
    {
        std::scoped_lock lock{guard_};
        return guards_.size();
    }

    void BackgroundCompletionGuardian::onSessionRekeyed(Ids::SessionId const& from, Ids::SessionId const& to)
    {
        std::scoped_lock lock{guard_};
        for (auto& [id, guard] : guards_)
        {
            if (guard->claim.sessionId != from)
                continue;
            const Owner owner{.kind = OwnerKind::BackgroundGuardian, .id = id};
            if (auto claim = ledger_->find(to, owner); claim)
                guard->claim = *claim;
        }
    }

    void BackgroundCompletionGuardian::shutdown()
    {
        std::unordered_map<std::string, std::shared_ptr<Guard>> guards;
        {
            std::scoped_lock lock{guard_};
            guards.swap(guards_);
        }
        for (auto const& [id, guard] : guards)
        {
            auto sessionLock = sessionLocks_->lock(guard->claim.sessionId.value());
            finish(guard, "shutdown");
        }
    }
}
