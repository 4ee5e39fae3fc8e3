#include <harbor/session_identity_migrator.hpp>
#include <log/log.hpp>

namespace Harbor
{
    SessionIdentityMigrator::SessionIdentityMigrator(
        std::shared_ptr<ProcessRegistry> registry,
        std::shared_ptr<OwnershipLedger> ledger,
        std::shared_ptr<SessionActivationTable> activations,
        std::shared_ptr<EventStreamRouter> router,
        std::shared_ptr<SessionLocks> sessionLocks)
        : registry_{std::move(registry)}
        , ledger_{std::move(ledger)}
        , activations_{std::move(activations)}
        , router_{std::move(router)}
        , sessionLocks_{std::move(sessionLocks)}
        , listenerGuard_{}
        , listeners_{}
    {}

    void SessionIdentityMigrator::addListener(Listener listener)
    {
        std::scoped_lock lock{listenerGuard_};
        listeners_.push_back(std::move(listener));
    }

    std::expected<void, HostError> SessionIdentityMigrator::rekey(Ids::SessionId const& from, Ids::SessionId const& to)
    {
        if (!from.isValid() || !to.isValid())
            return std::unexpected(makeError(HostErrorType::InvalidArgument, "Cannot migrate an invalid session id"));
        if (from == to)
            return {};

        auto locks = sessionLocks_->lock(from.value(), to.value());

        if (ledger_->hasState(to) || activations_->contains(to) || router_->hasSubscriptions(to))
        {
            Log::info("Session {} is already active, not migrating {} onto it.", to.value(), from.value());
            return std::unexpected(
                makeError(HostErrorType::MigrationConflict, "Session " + to.value() + " is already active"));
        }

        const auto oldKey = ledger_->keyOf(from);
        const auto activation = activations_->lookup(from);
        if (!oldKey && !activation && !router_->hasSubscriptions(from))
            return std::unexpected(makeError(HostErrorType::NotFound, "Nothing references session " + from.value()));

        std::optional<ProcessKey> newKey;
        if (oldKey)
        {
            newKey = makeProcessKey(oldKey->workspacePath, to);
            if (registry_->contains(*newKey))
            {
                return std::unexpected(makeError(
                    HostErrorType::MigrationConflict, "A runtime for " + toString(*newKey) + " already exists"));
            }
        }

        // Every target was checked above while both sessions are locked, so the moves below succeed.
        std::optional<unsigned short> port = activation ? activation->port : std::nullopt;
        if (oldKey)
        {
            if (registry_->contains(*oldKey))
            {
                if (!registry_->rekey(*oldKey, *newKey))
                    Log::error("Runtime of {} did not move to {}.", toString(*oldKey), toString(*newKey));
                if (auto snapshot = registry_->lookup(*newKey); snapshot && snapshot->port)
                    port = snapshot->port;
            }
            if (!ledger_->rekey(from, to, *newKey))
                Log::error("Claims of session {} did not move to {}.", from.value(), to.value());
        }
        if (activation && !activations_->rekey(from, to))
            Log::error("Activation of session {} did not move to {}.", from.value(), to.value());
        if (!router_->rekey(from, to, port))
            Log::error("Streams of session {} did not move to {}.", from.value(), to.value());

        Log::info("Session {} is now known as {}.", from.value(), to.value());

        std::vector<Listener> listeners;
        {
            std::scoped_lock lock{listenerGuard_};
            listeners = listeners_;
        }
        for (auto const& listener : listeners)
            listener(from, to);
        return {};
    }
}
