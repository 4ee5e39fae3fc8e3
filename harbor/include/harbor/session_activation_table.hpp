#pragma once

#include <ids/ids.hpp>

#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace Harbor
{
    struct SessionActivation
    {
        Ids::SessionId sessionId{};
        std::optional<Ids::TabId> homeOwner{std::nullopt};
        std::optional<Ids::TaskId> taskOwner{std::nullopt};
        std::optional<unsigned short> port{std::nullopt};
        std::string workspacePath{};
    };

    struct LaunchRequest
    {
        Ids::SessionId targetSession{};
        Ids::TabId callerTab{};
        /// The session the calling tab shows right now, if any.
        std::optional<Ids::SessionId> callerCurrentSession{std::nullopt};
    };

    enum class LaunchOutcome
    {
        /// The session is open in a reachable tab, switch focus there.
        FocusExisting,
        /// A scheduled task runs the session without a tab, attach to its process.
        AttachToTask,
        /// The caller's current session is busy with a task and must not be repurposed.
        OpenUnderFreshClaim,
        NormalLaunch
    };

    struct LaunchDecision
    {
        LaunchOutcome outcome{LaunchOutcome::NormalLaunch};
        std::optional<Ids::TabId> focusTab{std::nullopt};
        std::optional<Ids::TaskId> taskOwner{std::nullopt};
        std::optional<unsigned short> port{std::nullopt};
        /// Only for AttachToTask: the attach has to happen from a fresh tab.
        bool requiresFreshOwner{false};
    };

    /**
     * @brief Which tab and which task currently own a session. A row exists as long as either owner is set.
     */
    class SessionActivationTable
    {
      public:
        std::optional<SessionActivation> lookup(Ids::SessionId const& sessionId) const;
        bool contains(Ids::SessionId const& sessionId) const;
        std::vector<SessionActivation> rows() const;

        /**
         * @brief Creates the row if needed and updates the port and workspace.
         */
        void activate(Ids::SessionId const& sessionId, std::string const& workspacePath, std::optional<unsigned short> port);

        void setHome(Ids::SessionId const& sessionId, Ids::TabId const& tabId);
        void setTask(Ids::SessionId const& sessionId, Ids::TaskId const& taskId);

        /**
         * @brief Clears the home owner if it is the given tab. Removes the row when no owner is left.
         */
        bool clearHome(Ids::SessionId const& sessionId, Ids::TabId const& tabId);
        bool clearTask(Ids::SessionId const& sessionId, Ids::TaskId const& taskId);

        std::optional<Ids::SessionId> sessionForTab(Ids::TabId const& tabId) const;
        std::optional<Ids::SessionId> sessionForTask(Ids::TaskId const& taskId) const;

        bool rekey(Ids::SessionId const& from, Ids::SessionId const& to);

        /**
         * @brief Decides how an "open this session" request is served. The checks run in a fixed order:
         * already open in a tab, owned by a task, caller busy with a task, normal launch.
         *
         * @param isReachable Whether a recorded home tab still holds its claim. Unreachable homes are ignored.
         */
        LaunchDecision
        decide(LaunchRequest const& request, std::function<bool(SessionActivation const&)> const& isReachable) const;

      private:
        void eraseIfUnowned(std::unordered_map<std::string, SessionActivation>::iterator iter);

      private:
        mutable std::mutex guard_{};
        std::unordered_map<std::string, SessionActivation> rows_{};
    };
}
