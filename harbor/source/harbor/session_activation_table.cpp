#include <harbor/session_activation_table.hpp>
#include <log/log.hpp>

namespace Harbor
{
    std::optional<SessionActivation> SessionActivationTable::lookup(Ids::SessionId const& sessionId) const
    {
        std::scoped_lock lock{guard_};
        auto iter = rows_.find(sessionId.value());
        if (iter == rows_.end())
            return std::nullopt;
        return iter->second;
    }

    bool SessionActivationTable::contains(Ids::SessionId const& sessionId) const
    {
        std::scoped_lock lock{guard_};
        return rows_.contains(sessionId.value());
    }

    std::vector<SessionActivation> SessionActivationTable::rows() const
    {
        std::scoped_lock lock{guard_};
        std::vector<SessionActivation> result;
        result.reserve(rows_.size());
        for (auto const& [id, row] : rows_)
            result.push_back(row);
        return result;
    }

    void SessionActivationTable::activate(
        Ids::SessionId const& sessionId,
        std::string const& workspacePath,
        std::optional<unsigned short> port)
    {
        std::scoped_lock lock{guard_};
        auto& row = rows_[sessionId.value()];
        row.sessionId = sessionId;
        row.workspacePath = workspacePath;
        if (port)
            row.port = port;
    }

    void SessionActivationTable::setHome(Ids::SessionId const& sessionId, Ids::TabId const& tabId)
    {
        std::scoped_lock lock{guard_};
        auto& row = rows_[sessionId.value()];
        row.sessionId = sessionId;
        row.homeOwner = tabId;
    }

    void SessionActivationTable::setTask(Ids::SessionId const& sessionId, Ids::TaskId const& taskId)
    {
        std::scoped_lock lock{guard_};
        auto& row = rows_[sessionId.value()];
        row.sessionId = sessionId;
        row.taskOwner = taskId;
    }

    void SessionActivationTable::eraseIfUnowned(std::unordered_map<std::string, SessionActivation>::iterator iter)
    {
        if (!iter->second.homeOwner && !iter->second.taskOwner)
        {
            Log::debug("Session {} is no longer active.", iter->first);
            rows_.erase(iter);
        }
    }

    bool SessionActivationTable::clearHome(Ids::SessionId const& sessionId, Ids::TabId const& tabId)
    {
        std::scoped_lock lock{guard_};
        auto iter = rows_.find(sessionId.value());
        if (iter == rows_.end() || iter->second.homeOwner != tabId)
            return false;
        iter->second.homeOwner.reset();
        eraseIfUnowned(iter);
        return true;
    }

    bool SessionActivationTable::clearTask(Ids::SessionId const& sessionId, Ids::TaskId const& taskId)
    {
        std::scoped_lock lock{guard_};
        auto iter = rows_.find(sessionId.value());
        if (iter == rows_.end() || iter->second.taskOwner != taskId)
            return false;
        iter->second.taskOwner.reset();
        eraseIfUnowned(iter);
        return true;
    }

    std::optional<Ids::SessionId> SessionActivationTable::sessionForTab(Ids::TabId const& tabId) const
    {
        std::scoped_lock lock{guard_};
        for (auto const& [id, row] : rows_)
        {
            if (row.homeOwner == tabId)
                return row.sessionId;
        }
        return std::nullopt;
    }

    std::optional<Ids::SessionId> SessionActivationTable::sessionForTask(Ids::TaskId const& taskId) const
    {
        std::scoped_lock lock{guard_};
        for (auto const& [id, row] : rows_)
        {
            if (row.taskOwner == taskId)
                return row.sessionId;
        }
        return std::nullopt;
    }

    bool SessionActivationTable::rekey(Ids::SessionId const& from, Ids::SessionId const& to)
    {
        std::scoped_lock lock{guard_};
        if (rows_.contains(to.value()))
            return false;

        auto node = rows_.extract(from.value());
        if (node.empty())
            return false;

        node.key() = to.value();
        node.mapped().sessionId = to;
        rows_.insert(std::move(node));
        return true;
    }

    LaunchDecision SessionActivationTable::decide(
        LaunchRequest const& request,
        std::function<bool(SessionActivation const&)> const& isReachable) const
    {
        const auto target = lookup(request.targetSession);

        std::optional<SessionActivation> current;
        if (request.callerCurrentSession && *request.callerCurrentSession != request.targetSession)
            current = lookup(*request.callerCurrentSession);
        const bool callerBusy = current && current->taskOwner.has_value();

        if (target && target->homeOwner && isReachable(*target))
        {
            Log::debug(
                "Session {} is already open in tab {}.", request.targetSession.value(), target->homeOwner->value());
            return LaunchDecision{
                .outcome = LaunchOutcome::FocusExisting,
                .focusTab = target->homeOwner,
                .taskOwner = target->taskOwner,
                .port = target->port,
            };
        }

        if (target && target->taskOwner)
        {
            Log::debug(
                "Session {} is run by task {}, attaching to it.",
                request.targetSession.value(),
                target->taskOwner->value());
            return LaunchDecision{
                .outcome = LaunchOutcome::AttachToTask,
                .taskOwner = target->taskOwner,
                .port = target->port,
                .requiresFreshOwner = callerBusy,
            };
        }

        if (callerBusy)
        {
            Log::debug(
                "Tab {} is busy with task {}, session {} needs a fresh tab.",
                request.callerTab.value(),
                current->taskOwner->value(),
                request.targetSession.value());
            return LaunchDecision{.outcome = LaunchOutcome::OpenUnderFreshClaim};
        }

        return LaunchDecision{.outcome = LaunchOutcome::NormalLaunch};
    }
}
