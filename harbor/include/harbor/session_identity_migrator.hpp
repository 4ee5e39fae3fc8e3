#pragma once

#include <harbor/host_error.hpp>
#include <harbor/ownership_ledger.hpp>
#include <harbor/process/process_registry.hpp>
#include <harbor/session_activation_table.hpp>
#include <harbor/session_locks.hpp>
#include <harbor/stream/event_stream_router.hpp>
#include <ids/ids.hpp>

#include <expected>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

namespace Harbor
{
    /**
     * @brief Moves a session from a placeholder id to the id confirmed by the runtime.
     *
     * Either the claims, the activation row, the streams and the process all move, or nothing does.
     */
    class SessionIdentityMigrator
    {
      public:
        using Listener = std::function<void(Ids::SessionId const& from, Ids::SessionId const& to)>;

        SessionIdentityMigrator(
            std::shared_ptr<ProcessRegistry> registry,
            std::shared_ptr<OwnershipLedger> ledger,
            std::shared_ptr<SessionActivationTable> activations,
            std::shared_ptr<EventStreamRouter> router,
            std::shared_ptr<SessionLocks> sessionLocks);

        /**
         * @brief Called after each successful migration, while both sessions are still locked.
         */
        void addListener(Listener listener);

        /**
         * @return NotFound if nothing references the old id, MigrationConflict if the new id is already in use.
         */
        std::expected<void, HostError> rekey(Ids::SessionId const& from, Ids::SessionId const& to);

      private:
        std::shared_ptr<ProcessRegistry> registry_;
        std::shared_ptr<OwnershipLedger> ledger_;
        std::shared_ptr<SessionActivationTable> activations_;
        std::shared_ptr<EventStreamRouter> router_;
        std::shared_ptr<SessionLocks> sessionLocks_;

        std::mutex listenerGuard_;
        std::vector<Listener> listeners_;
    };
}
