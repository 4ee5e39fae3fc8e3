#pragma once

#include <harbor/host_error.hpp>
#include <harbor/ownership_ledger.hpp>
#include <harbor/session_locks.hpp>
#include <harbor/stream/event_stream_router.hpp>
#include <ids/ids.hpp>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/steady_timer.hpp>

#include <chrono>
#include <expected>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace Harbor
{
    /**
     * @brief Keeps a runtime alive after its last tab left while a reply is still being generated.
     *
     * The tab's claim is handed over to a guardian claim, which is released once the runtime reports the reply
     * as complete, stopped or failed, or after the maximum hold time.
     */
    class BackgroundCompletionGuardian : public std::enable_shared_from_this<BackgroundCompletionGuardian>
    {
      public:
        BackgroundCompletionGuardian(
            boost::asio::any_io_executor executor,
            std::shared_ptr<OwnershipLedger> ledger,
            std::shared_ptr<EventStreamRouter> router,
            std::shared_ptr<SessionLocks> sessionLocks,
            std::chrono::seconds maxHold = std::chrono::seconds{1800});
        ~BackgroundCompletionGuardian();
        BackgroundCompletionGuardian(BackgroundCompletionGuardian const&) = delete;
        BackgroundCompletionGuardian& operator=(BackgroundCompletionGuardian const&) = delete;
        BackgroundCompletionGuardian(BackgroundCompletionGuardian&&) = delete;
        BackgroundCompletionGuardian& operator=(BackgroundCompletionGuardian&&) = delete;

        /**
         * @brief Takes over the tab's claim if the session is generating. The caller must hold the session lock.
         *
         * @return true if the guardian took over and the tab claim is gone, false if the caller should release it.
         */
        std::expected<bool, HostError> takeOver(Claim const& tabClaim);

        /**
         * @brief Ends the guard before the reply completed.
         *
         * @return true if this stopped the session's runtime.
         */
        bool release(std::string const& guardianId);

        bool isGuarding(Ids::SessionId const& sessionId) const;
        std::size_t guardedCount() const;

        void onSessionRekeyed(Ids::SessionId const& from, Ids::SessionId const& to);

        /**
         * @brief Releases all guardian claims right away.
         */
        void shutdown();

      private:
        struct Guard
        {
            Ids::GuardianId id{};
            Claim claim{};
            StreamHandle stream{};
            std::shared_ptr<boost::asio::steady_timer> maxHoldTimer{};
        };

        void scheduleCompletion(std::string const& guardianId, std::string const& reason);
        bool complete(std::string const& guardianId, std::string const& reason);
        bool finish(std::shared_ptr<Guard> const& guard, std::string const& reason);

      private:
        boost::asio::any_io_executor executor_;
        std::shared_ptr<OwnershipLedger> ledger_;
        std::shared_ptr<EventStreamRouter> router_;
        std::shared_ptr<SessionLocks> sessionLocks_;
        std::chrono::seconds maxHold_;

        mutable std::mutex guard_;
        std::unordered_map<std::string, std::shared_ptr<Guard>> guards_;
    };
}
