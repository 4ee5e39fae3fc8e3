#pragma once

#include <harbor/host_error.hpp>
#include <harbor/owner.hpp>
#include <harbor/process_key.hpp>
#include <harbor/process/process_registry.hpp>
#include <ids/ids.hpp>

#include <expected>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace Harbor
{
    struct Claim
    {
        Ids::SessionId sessionId{};
        Owner owner{};
        ProcessKey key{};
        ProcessFuture process{};
    };

    enum class ClaimPolicy
    {
        /// A second tab claim fails with SingletonConflict.
        Reject,
        /// A second tab claim replaces the first.
        Supersede
    };

    /**
     * @brief Reference counts the consumers of each session's runtime process.
     *
     * The first claim of a session acquires the process from the registry, dropping the last claim releases it.
     * Nothing else starts or stops processes. At most one claim per session is held by a tab.
     */
    class OwnershipLedger
    {
      public:
        explicit OwnershipLedger(std::shared_ptr<ProcessRegistry> registry);

        /**
         * @brief Claims the session's process for the owner. Claiming twice as the same owner returns the
         * existing claim.
         *
         * @param onReady Forwarded to ProcessRegistry::acquire.
         */
        std::expected<Claim, HostError> claim(
            Ids::SessionId const& sessionId,
            ProcessKey const& key,
            Owner const& owner,
            ClaimPolicy policy = ClaimPolicy::Reject,
            std::function<void(ProcessResult const&)> onReady = {});

        /**
         * @brief Drops the claim. The release barrier runs first.
         *
         * @return true if this was the last claim and the process is being released.
         */
        bool release(Claim const& claim);

        /**
         * @brief Atomically replaces a claim by one held by another owner. The session never drops to zero claims.
         */
        std::expected<Claim, HostError> handover(Claim const& from, Owner const& to);

        /**
         * @brief Moves all claims of a session to another session id and process key.
         */
        bool rekey(Ids::SessionId const& from, Ids::SessionId const& to, ProcessKey const& newKey);

        /**
         * @brief Acquires the process of a claimed session again, which replaces it if it died.
         *
         * @return nullopt if the session has no claims.
         */
        std::optional<ProcessFuture> refresh(Ids::SessionId const& sessionId);

        /**
         * @brief Called with each claim right before it is dropped, used to detach the owner's event stream.
         */
        void setReleaseBarrier(std::function<void(Claim const&)> barrier);

        std::optional<Claim> find(Ids::SessionId const& sessionId, Owner const& owner) const;
        std::vector<Claim> claims(Ids::SessionId const& sessionId) const;
        std::vector<Claim> claimsOf(Owner const& owner) const;
        std::size_t count(Ids::SessionId const& sessionId) const;
        std::optional<Owner> tabOwner(Ids::SessionId const& sessionId) const;
        std::optional<ProcessKey> keyOf(Ids::SessionId const& sessionId) const;
        bool hasState(Ids::SessionId const& sessionId) const;
        std::vector<Ids::SessionId> sessions() const;

      private:
        struct SessionClaims
        {
            ProcessKey key{};
            std::vector<Claim> claims{};
        };

        void runBarrier(Claim const& claim) const;

      private:
        std::shared_ptr<ProcessRegistry> registry_;
        mutable std::mutex guard_;
        std::unordered_map<std::string, SessionClaims> sessions_;
        std::function<void(Claim const&)> releaseBarrier_;
    };
}
