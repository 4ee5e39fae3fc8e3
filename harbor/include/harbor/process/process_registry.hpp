#pragma once

#include <harbor/host_error.hpp>
#include <harbor/process_key.hpp>
#include <harbor/process/port_allocator.hpp>
#include <harbor/process/process_launcher.hpp>
#include <harbor/process/readiness_probe.hpp>
#include <ids/ids.hpp>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/describe/enum.hpp>

#include <chrono>
#include <condition_variable>
#include <expected>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace Harbor
{
    enum class ProcessState
    {
        Spawning,
        Healthy,
        Unhealthy,
        Terminating,
        Terminated
    };
    BOOST_DESCRIBE_ENUM(ProcessState, Spawning, Healthy, Unhealthy, Terminating, Terminated)

    struct ProcessHandle
    {
        Ids::ProcessId id{};
        ProcessKey key{};
        unsigned short port{0};
        long long pid{0};
    };

    using ProcessResult = std::expected<ProcessHandle, HostError>;
    using ProcessFuture = std::shared_future<ProcessResult>;

    struct ProcessSnapshot
    {
        Ids::ProcessId id{};
        ProcessKey key{};
        std::optional<unsigned short> port{std::nullopt};
        long long pid{0};
        ProcessState state{ProcessState::Spawning};
    };

    struct ProcessRegistryOptions
    {
        std::string command{};
        std::vector<std::string> arguments{};
        std::unordered_map<std::string, std::string> environment{};
        std::string pathExtension{};
        std::string marker{"--harbor-sidecar"};
        int healthCheckAttempts{60};
        std::chrono::milliseconds healthCheckDelay{100};
        std::chrono::milliseconds healthCheckTimeout{100};
        std::chrono::milliseconds gracefulShutdown{5000};
        std::chrono::milliseconds killPollInterval{100};
        std::chrono::milliseconds idleGracePeriod{0};
        std::chrono::milliseconds healthMonitorInterval{5000};
    };

    class OwnershipLedger;

    /**
     * @brief Owns the agent runtime processes, at most one per key.
     *
     * Concurrent acquires of a key share one spawn attempt. A failed attempt is purged, so the next acquire
     * retries from scratch. Processes are only released through the OwnershipLedger once nobody claims them.
     */
    class ProcessRegistry : public std::enable_shared_from_this<ProcessRegistry>
    {
      public:
        ProcessRegistry(
            boost::asio::any_io_executor executor,
            std::shared_ptr<IProcessLauncher> launcher,
            std::shared_ptr<IReadinessProbe> probe,
            std::shared_ptr<PortAllocator> ports,
            ProcessRegistryOptions options);
        ~ProcessRegistry();

        ProcessRegistry(ProcessRegistry const&) = delete;
        ProcessRegistry& operator=(ProcessRegistry const&) = delete;
        ProcessRegistry(ProcessRegistry&&) = delete;
        ProcessRegistry& operator=(ProcessRegistry&&) = delete;

        /**
         * @brief Returns the process for the key, spawning it if necessary.
         *
         * @param onReady Called once the spawn attempt resolved. Never called synchronously from within acquire.
         */
        ProcessFuture acquire(ProcessKey const& key, std::function<void(ProcessResult const&)> onReady = {});

        std::optional<ProcessSnapshot> lookup(ProcessKey const& key) const;
        bool contains(ProcessKey const& key) const;

        /**
         * @brief Moves the process to another key. Fails if the target key is taken or the source is unknown.
         */
        bool rekey(ProcessKey const& from, ProcessKey const& to);

        /// Number of processes that are assigned to a key.
        std::size_t activeCount() const;
        /// Number of processes that are shutting down but not confirmed dead yet.
        std::size_t retiringCount() const;
        /// Number of spawn attempts since construction.
        std::size_t spawnCount() const;

        /**
         * @brief Marks processes that died on their own as unhealthy. The next acquire replaces them.
         */
        void checkHealth();
        void startHealthMonitor();

        /**
         * @brief Terminates all processes and refuses further acquires.
         */
        void shutdown();
        bool awaitRetired(std::chrono::milliseconds timeout);

      private:
        friend class OwnershipLedger;

        /**
         * @brief Begins teardown of the key's process, possibly after the idle grace period.
         */
        void release(ProcessKey const& key);

      private:
        struct Slot;

        void spawn(std::shared_ptr<Slot> const& slot);
        /// Probes the started process until it is ready, without blocking a thread between attempts.
        void awaitReadiness(std::shared_ptr<Slot> const& slot, int attempt);
        void failReadiness(std::shared_ptr<Slot> const& slot);
        void completeSpawn(std::shared_ptr<Slot> const& slot, ProcessResult const& result);
        void retireIdle(std::shared_ptr<Slot> const& slot, std::shared_ptr<boost::asio::steady_timer> const& timer);
        void beginTermination(std::shared_ptr<Slot> const& slot);
        void pollTermination(
            std::shared_ptr<Slot> const& slot,
            std::shared_ptr<boost::asio::steady_timer> const& timer,
            std::chrono::steady_clock::time_point deadline,
            bool killed);
        void finishTermination(std::shared_ptr<Slot> const& slot);
        void scheduleHealthCheck();
        std::vector<std::string> buildArguments(ProcessKey const& key, unsigned short port) const;

      private:
        boost::asio::any_io_executor executor_;
        std::shared_ptr<IProcessLauncher> launcher_;
        std::shared_ptr<IReadinessProbe> probe_;
        std::shared_ptr<PortAllocator> ports_;
        ProcessRegistryOptions options_;

        mutable std::mutex guard_;
        std::condition_variable retiredCondition_;
        std::unordered_map<ProcessKey, std::shared_ptr<Slot>, ProcessKeyHash> active_;
        std::unordered_set<std::shared_ptr<Slot>> retiring_;
        std::size_t spawnCount_;
        bool shuttingDown_;
        boost::asio::steady_timer healthTimer_;
    };
}
