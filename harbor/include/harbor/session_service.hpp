#pragma once

#include <harbor/background_completion_guardian.hpp>
#include <harbor/control/process_control.hpp>
#include <harbor/host_error.hpp>
#include <harbor/ownership_ledger.hpp>
#include <harbor/process/process_registry.hpp>
#include <harbor/retry_policy.hpp>
#include <harbor/scheduler/task_scheduler.hpp>
#include <harbor/session_activation_table.hpp>
#include <harbor/session_identity_migrator.hpp>
#include <harbor/session_locks.hpp>
#include <harbor/stream/event_stream_router.hpp>
#include <ids/ids.hpp>

#include <boost/asio/any_io_executor.hpp>
#include <boost/describe/enum.hpp>

#include <expected>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace Harbor
{
    enum class ReleaseMode
    {
        /// Hand the session to a guardian if a reply is still being generated.
        CompleteInBackground,
        /// Ask the runtime to stop generating and release right away.
        StopGeneration
    };
    BOOST_DESCRIBE_ENUM(ReleaseMode, CompleteInBackground, StopGeneration)

    enum class OpenOutcome
    {
        Opened,
        AttachedToTask,
        /// The session is open in focusTab already.
        FocusExisting,
        /// The calling tab must not be repurposed, open the session from a new tab instead.
        FreshOwnerRequired
    };
    BOOST_DESCRIBE_ENUM(OpenOutcome, Opened, AttachedToTask, FocusExisting, FreshOwnerRequired)

    struct OpenSessionRequest
    {
        std::string workspacePath{};
        /// Unset for a new conversation, which is then opened under a placeholder id.
        std::optional<Ids::SessionId> sessionId{std::nullopt};
        Ids::TabId tabId{};
        /// The session the tab currently shows. Its claim is released once the new session is open.
        std::optional<Ids::SessionId> currentSessionId{std::nullopt};
    };

    struct OpenSessionResult
    {
        Ids::SessionId sessionId{};
        OpenOutcome outcome{OpenOutcome::Opened};
        std::optional<unsigned short> port{std::nullopt};
        bool isNew{false};
        std::optional<Ids::TabId> focusTab{std::nullopt};
    };

    using OpenSessionCallback = std::function<void(std::expected<OpenSessionResult, HostError> const&)>;

    struct SessionServiceOptions
    {
        /// Spawn attempts per open request.
        int spawnAttempts{2};
        std::chrono::milliseconds spawnRetryDelay{500};
    };

    /**
     * @brief Entry point for the presentation layer: opening, releasing, subscribing to and renaming sessions.
     */
    class SessionService : public std::enable_shared_from_this<SessionService>
    {
      public:
        SessionService(
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
            SessionServiceOptions options);
        SessionService(SessionService const&) = delete;
        SessionService& operator=(SessionService const&) = delete;
        SessionService(SessionService&&) = delete;
        SessionService& operator=(SessionService&&) = delete;

        /**
         * @brief Opens a session for a tab. The callback runs on the executor.
         */
        void openSession(OpenSessionRequest const& request, OpenSessionCallback onComplete);
        std::future<std::expected<OpenSessionResult, HostError>> openSession(OpenSessionRequest const& request);

        /**
         * @brief Drops the owner's claim on the session.
         *
         * @return true if this stopped the session's runtime.
         */
        bool releaseSession(
            Ids::SessionId const& sessionId,
            OwnerKind ownerKind,
            std::string const& ownerId,
            ReleaseMode mode = ReleaseMode::CompleteInBackground);

        std::optional<SessionActivation> getSessionActivation(Ids::SessionId const& sessionId) const;

        /**
         * @brief Streams the session's events to the owner, which must hold a claim on it.
         */
        std::expected<StreamHandle, HostError>
        subscribeEvents(Ids::SessionId const& sessionId, Owner const& owner, StreamHandlers handlers);

        /**
         * @brief Moves a session from its placeholder id to the real one. If the real id is already in use the
         * placeholder's claims are released and false is returned, the caller then opens the real id instead.
         */
        bool rekeySession(Ids::SessionId const& from, Ids::SessionId const& to);

        /**
         * @brief Releases every claim the tab holds.
         */
        void closeTab(Ids::TabId const& tabId);

        /**
         * @brief The port of the session's runtime if it is healthy. Starts a replacement if it died.
         */
        std::optional<unsigned short> resolvePort(Ids::SessionId const& sessionId);

        void shutdown();

      private:
        struct OpenAttempt;

        void claimAndWait(std::shared_ptr<OpenAttempt> const& attempt);
        void onProcessReady(std::shared_ptr<OpenAttempt> const& attempt, ProcessResult const& result);
        void retryOrFail(std::shared_ptr<OpenAttempt> const& attempt, HostError const& error);
        void complete(std::shared_ptr<OpenAttempt> const& attempt, std::expected<OpenSessionResult, HostError> result);
        void post(OpenSessionCallback const& callback, std::expected<OpenSessionResult, HostError> result);
        bool isShuttingDown() const;

      private:
        boost::asio::any_io_executor executor_;
        std::shared_ptr<ProcessRegistry> registry_;
        std::shared_ptr<OwnershipLedger> ledger_;
        std::shared_ptr<SessionActivationTable> activations_;
        std::shared_ptr<EventStreamRouter> router_;
        std::shared_ptr<SessionIdentityMigrator> migrator_;
        std::shared_ptr<BackgroundCompletionGuardian> guardian_;
        std::shared_ptr<TaskScheduler> scheduler_;
        std::shared_ptr<IProcessControl> control_;
        std::shared_ptr<SessionLocks> sessionLocks_;
        SessionServiceOptions options_;

        mutable std::mutex guard_;
        std::vector<std::weak_ptr<RetryPolicy>> retryPolicies_;
        bool shuttingDown_;
    };
}
