#pragma once

#include <harbor/host_error.hpp>
#include <harbor/ownership_ledger.hpp>
#include <harbor/retry_policy.hpp>
#include <harbor/session_locks.hpp>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/describe/enum.hpp>

#include <expected>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace Harbor
{
    enum class SharedRuntimeState
    {
        Stopped,
        Starting,
        Running,
        /// Every start attempt failed.
        Failed
    };
    BOOST_DESCRIBE_ENUM(SharedRuntimeState, Stopped, Starting, Running, Failed)

    struct SharedRuntimeSupervisorOptions
    {
        std::string workspacePath{};
        RetryOptions retry{
            .maxAttempts = 5,
            .baseDelay = std::chrono::milliseconds{2000},
            .maxDelay = std::chrono::milliseconds{32000},
        };
    };

    using SharedRuntimeCallback = std::function<void(std::expected<unsigned short, HostError> const&)>;

    /**
     * @brief Keeps the runtime that serves work not bound to any workspace. It holds its own claim, and failed
     * starts are retried with backoff until the retries are used up or the host shuts down.
     */
    class SharedRuntimeSupervisor : public std::enable_shared_from_this<SharedRuntimeSupervisor>
    {
      public:
        SharedRuntimeSupervisor(
            boost::asio::any_io_executor executor,
            std::shared_ptr<OwnershipLedger> ledger,
            std::shared_ptr<SessionLocks> sessionLocks,
            SharedRuntimeSupervisorOptions options);
        ~SharedRuntimeSupervisor();
        SharedRuntimeSupervisor(SharedRuntimeSupervisor const&) = delete;
        SharedRuntimeSupervisor& operator=(SharedRuntimeSupervisor const&) = delete;
        SharedRuntimeSupervisor(SharedRuntimeSupervisor&&) = delete;
        SharedRuntimeSupervisor& operator=(SharedRuntimeSupervisor&&) = delete;

        /**
         * @brief Starts the runtime in the background. Does nothing while it is starting or running.
         *
         * @param onSettled Called once with the port, or with the last error when all attempts failed.
         */
        void start(SharedRuntimeCallback onSettled = {});

        /**
         * @brief Cancels pending retries and releases the runtime. The supervisor cannot be started again.
         */
        void shutdown();

        SharedRuntimeState state() const;
        std::optional<unsigned short> port() const;
        /// Failed attempts since the last start.
        int failedAttempts() const;
        Ids::SessionId const& sessionId() const;
        Owner const& owner() const;

      private:
        void attempt();
        void onReady(ProcessResult const& result);
        void onFailure(HostError const& error);
        void settle(std::expected<unsigned short, HostError> const& result);

      private:
        boost::asio::any_io_executor executor_;
        std::shared_ptr<OwnershipLedger> ledger_;
        std::shared_ptr<SessionLocks> sessionLocks_;
        Ids::SessionId sessionId_;
        ProcessKey key_;
        Owner owner_;
        RetryPolicy retry_;

        mutable std::mutex guard_;
        SharedRuntimeState state_;
        std::optional<Claim> claim_;
        std::optional<unsigned short> port_;
        int failedAttempts_;
        bool shuttingDown_;
        boost::asio::steady_timer retryTimer_;
        SharedRuntimeCallback onSettled_;
    };
}
