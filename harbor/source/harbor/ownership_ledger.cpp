#include <harbor/ownership_ledger.hpp>
#include <log/log.hpp>

#include <algorithm>

namespace Harbor
{
    OwnershipLedger::OwnershipLedger(std::shared_ptr<ProcessRegistry> registry)
        : registry_{std::move(registry)}
        , guard_{}
        , sessions_{}
        , releaseBarrier_{}
    {}

    void OwnershipLedger::setReleaseBarrier(std::function<void(Claim const&)> barrier)
    {
        std::scoped_lock lock{guard_};
        releaseBarrier_ = std::move(barrier);
    }

    void OwnershipLedger::runBarrier(Claim const& claim) const
    {
        if (releaseBarrier_)
            releaseBarrier_(claim);
    }

    std::expected<Claim, HostError> OwnershipLedger::claim(
        Ids::SessionId const& sessionId,
        ProcessKey const& key,
        Owner const& owner,
        ClaimPolicy policy,
        std::function<void(ProcessResult const&)> onReady)
    {
        std::scoped_lock lock{guard_};

        auto iter = sessions_.find(sessionId.value());
        if (iter != sessions_.end())
        {
            auto& entry = iter->second;
            if (entry.key != key)
            {
                return std::unexpected(makeError(
                    HostErrorType::InvalidArgument,
                    "Session " + sessionId.value() + " already runs in " + toString(entry.key)));
            }

            if (auto existing = std::find_if(
                    entry.claims.begin(),
                    entry.claims.end(),
                    [&owner](auto const& claim) {
                        return claim.owner == owner;
                    });
                existing != entry.claims.end())
            {
                if (onReady)
                    registry_->acquire(key, std::move(onReady));
                return *existing;
            }

            if (owner.kind == OwnerKind::Tab)
            {
                auto tab = std::find_if(entry.claims.begin(), entry.claims.end(), [](auto const& claim) {
                    return claim.owner.kind == OwnerKind::Tab;
                });
                if (tab != entry.claims.end())
                {
                    if (policy == ClaimPolicy::Reject)
                    {
                        auto error = makeError(
                            HostErrorType::SingletonConflict,
                            "Session " + sessionId.value() + " is already open in another tab");
                        error.conflictingOwner = tab->owner;
                        return std::unexpected(std::move(error));
                    }

                    Log::info("Tab {} supersedes {} on session {}.", owner.id, tab->owner.id, sessionId.value());
                    // The new claim is added before the old one is dropped, the count never reaches zero.
                    Claim superseded = *tab;
                    Claim added{
                        .sessionId = sessionId,
                        .owner = owner,
                        .key = key,
                        .process = registry_->acquire(key, std::move(onReady)),
                    };
                    entry.claims.push_back(added);
                    runBarrier(superseded);
                    std::erase_if(entry.claims, [&superseded](auto const& claim) {
                        return claim.owner == superseded.owner;
                    });
                    return added;
                }
            }
        }

        auto& entry = sessions_[sessionId.value()];
        entry.key = key;
        Claim added{
            .sessionId = sessionId,
            .owner = owner,
            .key = key,
            .process = {},
        };
        // claim before spawn
        entry.claims.push_back(added);
        added.process = registry_->acquire(key, std::move(onReady));
        entry.claims.back().process = added.process;

        Log::debug(
            "{} claimed session {} ({} claims).", toString(owner), sessionId.value(), entry.claims.size());
        return added;
    }

    bool OwnershipLedger::release(Claim const& claim)
    {
        std::scoped_lock lock{guard_};

        auto iter = sessions_.find(claim.sessionId.value());
        if (iter == sessions_.end())
            return false;

        auto& entry = iter->second;
        auto existing = std::find_if(entry.claims.begin(), entry.claims.end(), [&claim](auto const& held) {
            return held.owner == claim.owner;
        });
        if (existing == entry.claims.end())
            return false;

        // stream detach before release
        runBarrier(*existing);
        entry.claims.erase(existing);

        Log::debug(
            "{} released session {} ({} claims left).",
            toString(claim.owner),
            claim.sessionId.value(),
            entry.claims.size());

        if (!entry.claims.empty())
            return false;

        const auto key = entry.key;
        sessions_.erase(iter);
        // release before teardown
        registry_->release(key);
        return true;
    }

    std::expected<Claim, HostError> OwnershipLedger::handover(Claim const& from, Owner const& to)
    {
        std::scoped_lock lock{guard_};

        auto iter = sessions_.find(from.sessionId.value());
        if (iter == sessions_.end())
            return std::unexpected(makeError(HostErrorType::NotFound, "No claims on " + from.sessionId.value()));

        auto& entry = iter->second;
        auto existing = std::find_if(entry.claims.begin(), entry.claims.end(), [&from](auto const& held) {
            return held.owner == from.owner;
        });
        if (existing == entry.claims.end())
        {
            return std::unexpected(
                makeError(HostErrorType::NotFound, toString(from.owner) + " holds no claim on " + from.sessionId.value()));
        }

        if (to.kind == OwnerKind::Tab && from.owner.kind != OwnerKind::Tab)
        {
            if (std::any_of(entry.claims.begin(), entry.claims.end(), [](auto const& held) {
                    return held.owner.kind == OwnerKind::Tab;
                }))
            {
                return std::unexpected(makeError(HostErrorType::SingletonConflict, "Session already has a tab"));
            }
        }

        Claim added{
            .sessionId = existing->sessionId,
            .owner = to,
            .key = existing->key,
            .process = existing->process,
        };
        const Claim dropped = *existing;
        entry.claims.push_back(added);

        runBarrier(dropped);
        std::erase_if(entry.claims, [&dropped](auto const& held) {
            return held.owner == dropped.owner;
        });

        Log::debug("Handed session {} over from {} to {}.", from.sessionId.value(), toString(from.owner), toString(to));
        return added;
    }

    bool OwnershipLedger::rekey(Ids::SessionId const& from, Ids::SessionId const& to, ProcessKey const& newKey)
    {
        std::scoped_lock lock{guard_};
        if (sessions_.contains(to.value()))
            return false;

        auto node = sessions_.extract(from.value());
        if (node.empty())
            return false;

        node.key() = to.value();
        node.mapped().key = newKey;
        for (auto& claim : node.mapped().claims)
        {
            claim.sessionId = to;
            claim.key = newKey;
        }
        sessions_.insert(std::move(node));
        return true;
    }

    std::optional<ProcessFuture> OwnershipLedger::refresh(Ids::SessionId const& sessionId)
    {
        std::scoped_lock lock{guard_};
        auto iter = sessions_.find(sessionId.value());
        if (iter == sessions_.end() || iter->second.claims.empty())
            return std::nullopt;
        return registry_->acquire(iter->second.key);
    }

    std::optional<Claim> OwnershipLedger::find(Ids::SessionId const& sessionId, Owner const& owner) const
    {
        std::scoped_lock lock{guard_};
        auto iter = sessions_.find(sessionId.value());
        if (iter == sessions_.end())
            return std::nullopt;

        for (auto const& claim : iter->second.claims)
        {
            if (claim.owner == owner)
                return claim;
        }
        return std::nullopt;
    }

    std::vector<Claim> OwnershipLedger::claims(Ids::SessionId const& sessionId) const
    {
        std::scoped_lock lock{guard_};
        auto iter = sessions_.find(sessionId.value());
        if (iter == sessions_.end())
            return {};
        return iter->second.claims;
    }

    std::vector<Claim> OwnershipLedger::claimsOf(Owner const& owner) const
    {
        std::scoped_lock lock{guard_};
        std::vector<Claim> result;
        for (auto const& [sessionId, entry] : sessions_)
        {
            for (auto const& claim : entry.claims)
            {
                if (claim.owner == owner)
                    result.push_back(claim);
            }
        }
        return result;
    }

    std::size_t OwnershipLedger::count(Ids::SessionId const& sessionId) const
    {
        std::scoped_lock lock{guard_};
        auto iter = sessions_.find(sessionId.value());
        if (iter == sessions_.end())
            return 0;
        return iter->second.claims.size();
    }

    std::optional<Owner> OwnershipLedger::tabOwner(Ids::SessionId const& sessionId) const
    {
        std::scoped_lock lock{guard_};
        auto iter = sessions_.find(sessionId.value());
        if (iter == sessions_.end())
            return std::nullopt;

        for (auto const& claim : iter->second.claims)
        {
            if (claim.owner.kind == OwnerKind::Tab)
                return claim.owner;
        }
        return std::nullopt;
    }

    std::optional<ProcessKey> OwnershipLedger::keyOf(Ids::SessionId const& sessionId) const
    {
        std::scoped_lock lock{guard_};
        auto iter = sessions_.find(sessionId.value());
        if (iter == sessions_.end())
            return std::nullopt;
        return iter->second.key;
    }

    bool OwnershipLedger::hasState(Ids::SessionId const& sessionId) const
    {
        std::scoped_lock lock{guard_};
        return sessions_.contains(sessionId.value());
    }

    std::vector<Ids::SessionId> OwnershipLedger::sessions() const
    {
        std::scoped_lock lock{guard_};
        std::vector<Ids::SessionId> result;
        result.reserve(sessions_.size());
        for (auto const& [sessionId, entry] : sessions_)
            result.push_back(Ids::makeSessionId(sessionId));
        return result;
    }
}
